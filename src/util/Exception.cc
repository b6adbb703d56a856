/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Exception.hh"

#include <boost/exception/diagnostic_information.hpp>

namespace icdn {

const char* Exception::what() const noexcept
{
	return boost::diagnostic_information_what(*this, true);
}

} // end of namespace
