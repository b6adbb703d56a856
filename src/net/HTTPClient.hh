/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "Request.hh"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace icdn {

/// Components of an absolute http or https URL.
struct URL
{
	std::string scheme;
	std::string host;
	std::string port;
	std::string target;     //!< path and query, always starts with '/'

	static std::optional<URL> parse(std::string_view url);

	bool secure() const {return scheme == "https";}

	/// The "Host" header: the host name, and the port if it is not the default one.
	std::string host_header() const;
};

/// Synchronous HTTP/1.1 client for object store REST APIs.
/// Every call runs on its own io_context, so one instance can be shared by many threads.
/// The whole exchange (resolve, connect, handshake, write and read) is bounded by the timeout.
class HTTPClient
{
public:
	explicit HTTPClient(std::chrono::seconds timeout);

	/// Sends \a req to \a url. The target, "Host", "User-Agent" and "Content-Length"
	/// fields of \a req are filled in by this function.
	/// Transport failures and timeouts set \a ec to Error::backend_error.
	/// HTTP error statuses are not failures: check the status of the response.
	StringResponse send(const URL& url, StringRequest&& req, std::error_code& ec) const;

	std::chrono::seconds timeout() const {return m_timeout;}

private:
	std::chrono::seconds m_timeout;
	std::shared_ptr<boost::asio::ssl::context> m_ssl;
};

} // end of namespace
