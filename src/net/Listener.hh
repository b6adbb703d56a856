/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "util/Exception.hh"

#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <functional>
#include <memory>

namespace icdn {

class Session;

/// Accepts TCP connections on one endpoint and hands each socket to a new Session.
/// The acceptor is bound in the constructor, so a port that is already in use is
/// reported before any thread starts running the io_context.
class Listener : public std::enable_shared_from_this<Listener>
{
public:
	using SessionFactory = std::function<std::shared_ptr<Session>(
		boost::asio::ip::tcp::socket&&,
		std::size_t
	)>;

	struct BindError : virtual SystemError {};
	using ListenEndpoint = boost::error_info<struct tag_listen_endpoint, boost::asio::ip::tcp::endpoint>;

	Listener(
		boost::asio::io_context &ioc,
		const boost::asio::ip::tcp::endpoint& endpoint,
		SessionFactory session_factory
	);

	void run();

	/// Closes the acceptor. Connections already accepted run to completion.
	void stop();

	boost::asio::ip::tcp::endpoint local_endpoint() const;
	std::size_t accepted() const {return m_accepted;}

private:
	void do_accept();
	void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);

private:
	boost::asio::ip::tcp::acceptor  m_acceptor;
	boost::asio::ip::tcp::endpoint  m_endpoint;
	SessionFactory                  m_session_factory;

	std::atomic<std::size_t> m_accepted{};
};

} // end of icdn namespace
