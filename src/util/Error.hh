/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <boost/beast/http/status.hpp>

#include <ostream>
#include <system_error>

namespace icdn {

enum class Error
{
	ok,
	object_not_exist,
	invalid_size,
	unsupported_format,
	validation_failed,
	payload_too_large,
	unauthorized,
	backend_error,
	decode_error,
	encode_error,
	disk_not_configured,
	invalid_path,
	move_incomplete,

	unknown_error
};

const std::error_category& icdn_error_category();
std::error_code make_error_code(Error err);

/// Status code of the HTTP response that reports \a ec to the client.
boost::beast::http::status http_status(std::error_code ec);

} // end of namespace icdn

namespace std
{
	template <> struct is_error_code_enum<icdn::Error> : true_type {};
}
