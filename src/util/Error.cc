/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Error.hh"

#include <string>

namespace icdn {

const std::error_category& icdn_error_category()
{
	struct Cat : std::error_category
	{
		Cat() = default;
		const char *name() const noexcept override { return "icdn"; }

		std::string message(int ev) const override
		{
			switch (static_cast<Error>(ev))
			{
				case Error::ok: return "no error";
				case Error::object_not_exist: return "image not found";
				case Error::invalid_size: return "invalid size";
				case Error::unsupported_format: return "unsupported format";
				case Error::validation_failed: return "validation failed";
				case Error::payload_too_large: return "file too large";
				case Error::unauthorized: return "unauthorized";
				case Error::backend_error: return "storage backend error";
				case Error::decode_error: return "cannot decode image";
				case Error::encode_error: return "cannot encode image";
				case Error::disk_not_configured: return "disk not configured";
				case Error::invalid_path: return "invalid path";
				case Error::move_incomplete: return "source not removed after copy";
				default: return "unknown error " + std::to_string(ev);
			}
		}
	};
	static const Cat cat;
	return cat;
}

std::error_code make_error_code(Error err)
{
	return std::error_code(static_cast<int>(err), icdn_error_category());
}

boost::beast::http::status http_status(std::error_code ec)
{
	using boost::beast::http::status;
	if (!ec)
		return status::ok;

	if (ec.category() != icdn_error_category())
		return ec == std::errc::no_such_file_or_directory ? status::not_found : status::internal_server_error;

	switch (static_cast<Error>(ec.value()))
	{
		case Error::object_not_exist:       return status::not_found;
		case Error::invalid_size:
		case Error::unsupported_format:
		case Error::validation_failed:
		case Error::disk_not_configured:
		case Error::invalid_path:           return status::bad_request;
		case Error::payload_too_large:      return status::payload_too_large;
		case Error::unauthorized:           return status::unauthorized;
		default:                            return status::internal_server_error;
	}
}

} // end of namespace
