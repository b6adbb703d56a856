/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "Request.hh"

#include <boost/beast/core/flat_buffer.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <optional>
#include <string_view>
#include <variant>

namespace icdn {

class Server;

// Handles an HTTP server connection
class Session : public std::enable_shared_from_this<Session>
{
public:
	// Take ownership of the socket
	Session(
		boost::asio::ip::tcp::socket socket,
		Server& server,
		std::size_t nth
	);

	// Start the asynchronous operation
	void run();

private:
	void do_read();
	void on_read_header(boost::system::error_code ec, std::size_t bytes_transferred);
	void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
	void on_write(boost::system::error_code ec, std::size_t bytes_transferred, bool close);
	void do_close();

	template <class Request>
	bool validate_request(const Request& req);

	template <class Response>
	void send_response(Response&& response);

	void handle_read_error(std::string_view where, boost::system::error_code ec);

private:
	tcp::socket                                                 m_socket;
	boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
	boost::beast::flat_buffer                                   m_buffer;

	// The parsed message are stored inside the parsers.
	// Use parser::get() or release() to get the message.
	std::optional<EmptyRequestParser> m_parser;
	std::variant<EmptyRequestParser, StringRequestParser> m_body;

	Server& m_server;

	bool m_keep_alive{false};
	std::string m_method, m_target;
	std::chrono::steady_clock::time_point m_start;

	// stats
	std::size_t m_nth_session;
	std::size_t m_nth_transaction{};
};

} // end of namespace
