/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Listener.hh"
#include "Session.hh"

#include "util/Log.hh"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/exception/info.hpp>

namespace icdn {
namespace {

[[noreturn]] void throw_bind_error(boost::system::error_code ec, const boost::asio::ip::tcp::endpoint& ep)
{
	BOOST_THROW_EXCEPTION(Listener::BindError()
		<< ErrorCode(std::error_code{ec.value(), std::system_category()})
		<< Listener::ListenEndpoint(ep)
	);
}

}

Listener::Listener(
	boost::asio::io_context &ioc,
	const boost::asio::ip::tcp::endpoint& endpoint,
	SessionFactory session_factory
) :
	m_acceptor{ioc},
	m_endpoint{endpoint},
	m_session_factory{std::move(session_factory)}
{
	boost::system::error_code ec;
	m_acceptor.open(endpoint.protocol(), ec);
	if (ec)
		throw_bind_error(ec, endpoint);

	m_acceptor.set_option(boost::asio::socket_base::reuse_address{true}, ec);
	if (!ec)
		m_acceptor.bind(endpoint, ec);
	if (!ec)
		m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
	if (ec)
		throw_bind_error(ec, endpoint);
}

void Listener::run()
{
	if (m_acceptor.is_open())
		do_accept();
}

void Listener::stop()
{
	// close on the acceptor's executor: async_accept may be pending on another thread
	boost::asio::post(m_acceptor.get_executor(), [self = shared_from_this()]
	{
		boost::system::error_code ec;
		self->m_acceptor.close(ec);
		Log(LOG_NOTICE, "stopped listening on %1% after %2% connections", self->m_endpoint, self->m_accepted.load());
	});
}

boost::asio::ip::tcp::endpoint Listener::local_endpoint() const
{
	boost::system::error_code ec;
	auto ep = m_acceptor.local_endpoint(ec);
	return ec ? m_endpoint : ep;
}

void Listener::do_accept()
{
	m_acceptor.async_accept(
		[self = shared_from_this()](auto ec, auto socket)
		{
			self->on_accept(ec, std::move(socket));
		}
	);
}

void Listener::on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket)
{
	if (ec == boost::asio::error::operation_aborted || !m_acceptor.is_open())
		return;

	if (ec)
		Log(LOG_WARNING, "accept error on %1%: %2% (%3%)", m_endpoint, ec, ec.message());
	else
		m_session_factory(std::move(socket), m_accepted++)->run();

	do_accept();
}

} // end of namespace
