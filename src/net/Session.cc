/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Session.hh"

#include "cdn/Server.hh"
#include "cdn/RequestHandler.ipp"

#include "util/Error.hh"
#include "util/Log.hh"

#include <boost/asio/bind_executor.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/version.hpp>

#include <exception>

namespace icdn {

Session::Session(
	boost::asio::ip::tcp::socket socket,
	Server& server,
	std::size_t nth
) :
	m_socket{std::move(socket)},
	m_strand{m_socket.get_executor()},
	m_server{server},
	m_nth_session{nth}
{
}

// Start the asynchronous operation
void Session::run()
{
	do_read();
}

void Session::do_read()
{
	// Destroy and re-construct the parser for a new HTTP transaction
	m_parser.emplace();
	m_method.clear();
	m_target.clear();
	m_start = std::chrono::steady_clock::now();

	// Read the header of a request
	async_read_header(m_socket, m_buffer, *m_parser, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this()](auto ec, auto bytes) {self->on_read_header(ec, bytes);}
	));
}

void Session::on_read_header(boost::system::error_code ec, std::size_t)
{
	if (ec)
		return handle_read_error(__PRETTY_FUNCTION__, ec);

	m_start = std::chrono::steady_clock::now();

	// Get the HTTP header from the partially parsed request message from the parser.
	// The body of the request message has not parsed yet.
	auto&& header = m_parser->get();
	m_keep_alive = header.keep_alive();
	m_method     = std::string{header.method_string()};
	m_target     = std::string{header.target()};

	// Only uploads have a body worth reading. Everything else uses EmptyRequestParser.
	if (m_server.start_request().on_request_header(header) == RequestHandler::RequestBodyType::string)
		m_body.emplace<StringRequestParser>(std::move(*m_parser)).body_limit(m_server.upload_limit());
	else
		m_body.emplace<EmptyRequestParser>(std::move(*m_parser));

	// Call async_read() using the chosen parser to read and parse the request body.
	std::visit([self=shared_from_this(), this](auto&& parser)
	{
		async_read(m_socket, m_buffer, parser, boost::asio::bind_executor(
			m_strand,
			[self](auto ec, auto bytes){self->on_read(ec, bytes);}
		));
	}, m_body);
}

void Session::on_read(boost::system::error_code ec, std::size_t)
{
	if (ec)
		return handle_read_error(__PRETTY_FUNCTION__, ec);

	std::visit([self=shared_from_this(), this](auto&& parser)
	{
		auto req = parser.release();
		if (!validate_request(req))
			return;

		auto version = req.version();
		bool sent = false;
		try
		{
			m_server.start_request().on_request_body(std::move(req), [this, self, &sent](auto&& response)
			{
				sent = true;
				send_response(std::forward<decltype(response)>(response));
			});
		}
		catch (std::exception& e)
		{
			Log(LOG_ERR, "%1%:%2% %3% %4% failed: %5%", m_nth_session, m_nth_transaction, m_method, m_target, e.what());
			if (!sent)
				send_response(RequestHandler::internal_error(version));
		}
	}, m_body);

	m_nth_transaction++;
}

template <class Request>
bool Session::validate_request(const Request& req)
{
	// Make sure we can handle the method
	if (req.method() != http::verb::get  &&
	    req.method() != http::verb::post &&
		req.method() != http::verb::delete_)
	{
		send_response(RequestHandler::bad_request("Unknown HTTP-method", req.version()));
		return false;
	}

	// Request path must be absolute
	if (req.target().empty() || req.target()[0] != '/')
	{
		send_response(RequestHandler::bad_request("Illegal request-target", req.version()));
		return false;
	}

	return true;
}

template <class Response>
void Session::send_response(Response&& response)
{
	Log(
		LOG_INFO,
		"%1%:%2% %3% %4% %5% %6%ms",
		m_nth_session,
		m_nth_transaction,
		m_method,
		m_target,
		static_cast<unsigned>(response.result()),
		std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - m_start).count()
	);

	// The lifetime of the message has to extend
	// for the duration of the async operation so
	// we use a shared_ptr to manage it.
	auto sp = std::make_shared<std::remove_reference_t<Response>>(std::forward<Response>(response));
	sp->set(http::field::server, BOOST_BEAST_VERSION_STRING);
	sp->keep_alive(m_keep_alive);
	sp->prepare_payload();

	async_write(m_socket, *sp, boost::asio::bind_executor(
		m_strand,
		[self=shared_from_this(), sp](auto&& ec, auto bytes)
		{ self->on_write(ec, bytes, sp->need_eof()); }
	));
}

void Session::handle_read_error(std::string_view where, boost::system::error_code ec)
{
	// This means they closed the connection
	if (ec == http::error::end_of_stream)
		return do_close();

	m_keep_alive = false;
	if (ec == http::error::body_limit)
		return send_response(m_server.start_request().error_response(Error::payload_too_large, "upload too large", 11));

	Log(LOG_DEBUG, "read error @ %3%: %1% (%2%)", ec, ec.message(), where);
	if (ec != boost::asio::error::operation_aborted && ec != boost::asio::error::connection_reset)
		send_response(RequestHandler::bad_request(ec.message(), 11));
}

void Session::on_write(boost::system::error_code ec, std::size_t, bool close)
{
	if (ec)
		Log(LOG_DEBUG, "write error: %1% (%2%)", ec, ec.message());

	// This means we should close the connection, usually because
	// the response indicated the "Connection: close" semantic.
	if (close || ec)
		return do_close();

	// Read another request
	do_read();
}

void Session::do_close()
{
	// Send a TCP shutdown
	boost::system::error_code ec;
	m_socket.shutdown(tcp::socket::shutdown_send, ec);

	// At this point the connection is closed gracefully
}

} // end of namespace
