/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "HTTPClient.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <limits>

namespace icdn {

namespace ssl = boost::asio::ssl;       // from <boost/asio/ssl.hpp>

namespace {

tcp::socket& lowest_layer(tcp::socket& socket) {return socket;}
tcp::socket& lowest_layer(ssl::stream<tcp::socket>& stream) {return stream.next_layer();}

// One request/response exchange. The callbacks chain the steps the same way as
// an asynchronous client, but the caller drives the io_context until it is done.
template <typename Stream>
class Exchange
{
public:
	Exchange(
		boost::asio::io_context& ioc, Stream& stream,
		const URL& url, StringRequest& req,
		boost::asio::steady_timer& deadline, std::string_view& step
	) :
		m_resolver{ioc}, m_stream{stream}, m_url{url}, m_req{req}, m_deadline{deadline}, m_step{step}
	{
		// Object bodies can be as large as the uploads, so the default limit is too small.
		m_parser.body_limit(std::numeric_limits<std::uint64_t>::max());

		// A response to HEAD has a Content-Length but no body.
		m_parser.skip(req.method() == http::verb::head);
	}

	void run()
	{
		m_step = "resolve";
		m_resolver.async_resolve(m_url.host, m_url.port, [this](auto ec, auto results)
		{
			on_resolve(ec, std::move(results));
		});
	}

	void cancel()
	{
		m_resolver.cancel();

		boost::system::error_code ec;
		lowest_layer(m_stream).close(ec);
	}

	boost::system::error_code result() const {return m_result;}
	StringResponse release() {return m_parser.release();}

private:
	void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results)
	{
		if (ec)
			return done(ec);

		m_step = "connect";
		boost::asio::async_connect(lowest_layer(m_stream), results, [this](auto ec, auto&&)
		{
			on_connect(ec);
		});
	}

	void on_connect(boost::system::error_code ec)
	{
		if (ec)
			return done(ec);

		if constexpr (std::is_same<Stream, ssl::stream<tcp::socket>>::value)
		{
			m_step = "handshake";
			m_stream.async_handshake(ssl::stream_base::client, [this](auto ec){on_handshake(ec);});
		}
		else
			on_handshake(ec);
	}

	void on_handshake(boost::system::error_code ec)
	{
		if (ec)
			return done(ec);

		m_step = "write";
		http::async_write(m_stream, m_req, [this](auto ec, auto){on_write(ec);});
	}

	void on_write(boost::system::error_code ec)
	{
		if (ec)
			return done(ec);

		m_step = "read";
		http::async_read(m_stream, m_buffer, m_parser, [this](auto ec, auto){done(ec);});
	}

	void done(boost::system::error_code ec)
	{
		m_result = ec;

		// let io_context::run() return
		m_deadline.cancel();
	}

private:
	tcp::resolver   m_resolver;
	Stream&         m_stream;
	const URL&      m_url;
	StringRequest&  m_req;
	boost::asio::steady_timer& m_deadline;
	std::string_view& m_step;

	boost::beast::flat_buffer m_buffer;
	http::response_parser<http::string_body> m_parser;

	boost::system::error_code m_result;
};

template <typename Stream>
StringResponse exchange(
	boost::asio::io_context& ioc, Stream& stream,
	const URL& url, StringRequest& req,
	std::chrono::seconds timeout, std::error_code& ec
)
{
	std::string_view step;
	boost::asio::steady_timer deadline{ioc, timeout};
	Exchange<Stream> ex{ioc, stream, url, req, deadline, step};

	bool timed_out = false;
	deadline.async_wait([&ex, &timed_out](auto ec)
	{
		if (!ec)
		{
			timed_out = true;
			ex.cancel();
		}
	});

	ex.run();
	ioc.run();

	if (timed_out)
	{
		Log(LOG_WARNING, "%1% %2%%3% timed out after %4%s during %5%", req.method_string(), url.host, url.target, timeout.count(), step);
		ec = Error::backend_error;
		return {};
	}
	if (ex.result())
	{
		Log(LOG_WARNING, "%1% %2%%3% failed during %4%: %5%", req.method_string(), url.host, url.target, step, ex.result().message());
		ec = Error::backend_error;
		return {};
	}

	ec.clear();
	return ex.release();
}

} // end of local namespace

std::optional<URL> URL::parse(std::string_view url)
{
	URL result;

	auto scheme_end = url.find("://");
	if (scheme_end == url.npos)
		return std::nullopt;

	result.scheme = to_lower(url.substr(0, scheme_end));
	if (result.scheme != "http" && result.scheme != "https")
		return std::nullopt;

	url.remove_prefix(scheme_end + 3);

	auto path_start = url.find_first_of("/?");
	auto authority  = url.substr(0, path_start);
	result.target   = path_start == url.npos ? std::string{"/"} : std::string{url.substr(path_start)};
	if (result.target.front() == '?')
		result.target.insert(result.target.begin(), '/');

	auto colon = authority.rfind(':');
	if (colon != authority.npos && authority.find(']', colon) == authority.npos)
	{
		result.host = std::string{authority.substr(0, colon)};
		result.port = std::string{authority.substr(colon+1)};
	}
	else
	{
		result.host = std::string{authority};
		result.port = result.secure() ? "443" : "80";
	}

	if (result.host.empty() || result.port.empty())
		return std::nullopt;

	return result;
}

std::string URL::host_header() const
{
	return (secure() && port == "443") || (!secure() && port == "80") ? host : host + ':' + port;
}

HTTPClient::HTTPClient(std::chrono::seconds timeout) :
	m_timeout{timeout},
	m_ssl{std::make_shared<ssl::context>(ssl::context::tls_client)}
{
	m_ssl->set_default_verify_paths();
	m_ssl->set_verify_mode(ssl::verify_peer);
}

StringResponse HTTPClient::send(const URL& url, StringRequest&& req, std::error_code& ec) const
{
	req.version(11);
	req.target(url.target);
	req.set(http::field::host, url.host_header());
	req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
	req.prepare_payload();

	boost::asio::io_context ioc;
	if (url.secure())
	{
		ssl::stream<tcp::socket> stream{ioc, *m_ssl};

		// Set SNI Hostname (many hosts need this to handshake successfully)
		if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()))
		{
			Log(LOG_WARNING, "SSL_set_tlsext_host_name() failed for %1%", url.host);
			ec = Error::backend_error;
			return {};
		}
		stream.set_verify_callback(ssl::host_name_verification{url.host});
		return exchange(ioc, stream, url, req, m_timeout, ec);
	}
	else
	{
		tcp::socket stream{ioc};
		return exchange(ioc, stream, url, req, m_timeout, ec);
	}
}

} // end of namespace
