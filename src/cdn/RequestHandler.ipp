/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "RequestHandler.hh"
#include "ImageService.hh"

#include "crypto/Blake2.hh"
#include "image/VariantSpec.hh"
#include "net/MMapResponseBody.hh"
#include "util/Error.hh"
#include "util/Log.hh"
#include "util/Magic.hh"

#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/vector_body.hpp>

#include <type_traits>

namespace icdn {

template <class Request, class Send>
void RequestHandler::on_request_body(Request&& req, Send&& send)
{
	std::string_view target{req.target().data(), req.target().size()};
	std::string_view query;
	auto path = split_path(target, query);

	auto method = req.method();
	auto version = req.version();

	if (method == http::verb::get)
	{
		if (path.size() == 1 && path[0] == "health")
			return send(on_health(version));

		if (path.size() == 1 && path[0] == "info")
			return send(on_stats(version));

		if (path.size() == 2 && path[0] == "api" && path[1] == "images")
			return send(on_list(version));

		if (path.size() == 3 && path[0] == "api" && path[1] == "info")
			return send(on_info(path[2], version));

		if (path.size() == 3 && path[0] == "api" && path[1] == "image")
			return get_original(path[2], req, std::forward<Send>(send));

		if (path.size() == 5 && path[0] == "api" && path[1] == "image")
			return get_variant(path[2], path[3], path[4], req, std::forward<Send>(send));
	}

	else if (method == http::verb::delete_)
	{
		if (path.size() == 3 && path[0] == "api" && path[1] == "image")
			return send(on_delete(path[2], query, req));
	}

	else if (method == http::verb::post)
	{
		if (path.size() == 2 && path[0] == "api" && path[1] == "upload")
		{
			// Only uploads are read with a string body. See on_request_header().
			if constexpr (std::is_same<std::decay_t<Request>, StringRequest>::value)
				return send(on_upload(req));
			else
				return send(bad_request("missing request body", version));
		}
	}

	return send(not_found(req));
}

template <class Send>
void RequestHandler::get_original(std::string_view id, const RequestHeader& req, Send&& send)
{
	std::error_code ec;
	auto file = m_service.original(id, ec);
	if (ec)
		return send(error_response(ec, "Image not found", req.version()));

	auto tag = etag(file.buffer());
	if (req[http::field::if_none_match] == tag)
	{
		EmptyResponse res{http::status::not_modified, req.version()};
		res.set(http::field::etag, tag);
		return send(std::move(res));
	}

	auto mime = Magic::instance().mime(file.buffer());

	http::response<MMapResponseBody> res{
		std::piecewise_construct,
		std::make_tuple(std::move(file)),
		std::make_tuple(http::status::ok, req.version())
	};
	res.set(http::field::content_type, mime);
	res.set(http::field::etag, tag);
	return send(std::move(res));
}

template <class Send>
void RequestHandler::get_variant(
	std::string_view id,
	std::string_view size,
	std::string_view format,
	const RequestHeader& req,
	Send&& send
)
{
	std::error_code ec;
	auto spec = VariantSpec::parse(size, format, ec);
	if (ec)
		return send(error_response(
			ec,
			ec == Error::invalid_size ? "Invalid size parameter" : "Unsupported format",
			req.version()
		));

	auto blob = m_service.variant(id, spec, ec);
	if (ec)
		return send(error_response(
			ec,
			ec == Error::object_not_exist ? "Image not found" : "Failed to process image",
			req.version()
		));

	auto tag = etag(buffer_view(blob));
	if (req[http::field::if_none_match] == tag)
	{
		EmptyResponse res{http::status::not_modified, req.version()};
		res.set(http::field::etag, tag);
		res.set(http::field::cache_control, "public, max-age=31536000");
		return send(std::move(res));
	}

	BlobResponse res{
		std::piecewise_construct,
		std::make_tuple(std::move(blob)),
		std::make_tuple(http::status::ok, req.version())
	};
	res.set(http::field::content_type, mime(spec.format));
	res.set(http::field::cache_control, "public, max-age=31536000");
	res.set(http::field::etag, tag);
	return send(std::move(res));
}

} // end of namespace
