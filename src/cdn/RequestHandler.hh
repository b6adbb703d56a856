/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "net/Request.hh"

#include <nlohmann/json.hpp>

#include <string_view>
#include <system_error>
#include <vector>

namespace icdn {

class Authentication;
class ImageService;

/// \brief  Routes one HTTP request to the image service and produces the response.
///
/// A RequestHandler is cheap to construct. The Session creates one for each request.
class RequestHandler
{
public:
	enum class RequestBodyType {string, empty};

public:
	RequestHandler(ImageService& service, const Authentication& auth, bool production);

	/// Only uploads need their bodies.
	RequestBodyType on_request_header(const RequestHeader& header) const;

	// This function produces an HTTP response for the given
	// request. The type of the response object depends on the
	// contents of the request, so the interface requires the
	// caller to pass a generic lambda for receiving the response.
	template <class Request, class Send>
	void on_request_body(Request&& req, Send&& send);

	static StringResponse bad_request(std::string_view why, unsigned version);
	StringResponse error_response(std::error_code ec, std::string_view message, unsigned version) const;
	static StringResponse json_response(const nlohmann::json& json, http::status status, unsigned version);
	static StringResponse not_found(const RequestHeader& header);
	static StringResponse internal_error(unsigned version);

private:
	/// Path segments of the request target, without the query string.
	static std::vector<std::string_view> split_path(std::string_view target, std::string_view& query);

	StringResponse on_upload(const StringRequest& req);
	StringResponse on_delete(std::string_view id, std::string_view query, const RequestHeader& req);
	StringResponse on_info(std::string_view id, unsigned version) const;
	StringResponse on_list(unsigned version) const;
	StringResponse on_health(unsigned version) const;
	StringResponse on_stats(unsigned version) const;

	template <class Send>
	void get_original(std::string_view id, const RequestHeader& req, Send&& send);

	template <class Send>
	void get_variant(std::string_view id, std::string_view size, std::string_view format, const RequestHeader& req, Send&& send);

	/// Subject of the bearer token. Sets \a ec to Error::unauthorized if there is no valid token.
	std::string authenticate(const RequestHeader& req, std::error_code& ec) const;

private:
	ImageService&           m_service;
	const Authentication&   m_auth;
	bool                    m_production;
};

} // end of namespace
