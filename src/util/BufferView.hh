/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <boost/asio/buffer.hpp>

#include <string_view>
#include <vector>

namespace icdn {

using BufferView = boost::asio::const_buffer;

/// Owned bytes of an image or a stored object.
using Blob = std::vector<unsigned char>;

inline BufferView buffer_view(const Blob& blob)
{
	return {blob.data(), blob.size()};
}

inline BufferView buffer_view(std::string_view str)
{
	return {str.data(), str.size()};
}

inline std::string_view as_string(BufferView buf)
{
	return {static_cast<const char*>(buf.data()), buf.size()};
}

} // end of namespace
