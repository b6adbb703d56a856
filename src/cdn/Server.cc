/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Server.hh"

#include "net/Listener.hh"
#include "net/Session.hh"
#include "util/Configuration.hh"
#include "util/Log.hh"

#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <csignal>
#include <thread>
#include <vector>

namespace icdn {
namespace {

// headers of the multipart body and the other form fields
const std::size_t multipart_overhead = 64 * 1024;

}

Server::Server(const Configuration& cfg) :
	m_cfg{cfg},
	m_ioc{static_cast<int>(std::max<std::size_t>(1, cfg.thread_count()))},
	m_auth{cfg.auth_secret()},
	m_service{cfg}
{
	if (!m_auth.enabled())
		Log(LOG_WARNING, "no authentication secret configured: uploads and deletions will be rejected");
}

boost::asio::io_context& Server::get_io_context()
{
	return m_ioc;
}

RequestHandler Server::start_request()
{
	return {m_service, m_auth, m_cfg.production()};
}

std::size_t Server::upload_limit() const
{
	return m_cfg.upload_limit() + multipart_overhead;
}

void Server::run()
{
	auto listener = std::make_shared<Listener>(
		m_ioc,
		m_cfg.listen(),
		[this](auto&& sock, auto nth)
		{
			return std::make_shared<Session>(std::move(sock), *this, nth);
		}
	);
	listener->run();
	Log(LOG_NOTICE, "listening on %1%", listener->local_endpoint());

	// SIGINT and SIGTERM stop accepting, then stop the io_context
	boost::asio::signal_set signals{m_ioc, SIGINT, SIGTERM};
	signals.async_wait([this, listener](auto ec, int sig)
	{
		if (ec)
			return;

		Log(LOG_NOTICE, "received signal %1%, shutting down", sig);
		listener->stop();
		boost::asio::post(m_ioc, [this]{m_ioc.stop();});
	});

	// Run the I/O service on the requested number of threads
	auto const threads = std::max<std::size_t>(1, m_cfg.thread_count());
	std::vector<std::thread> v;
	v.reserve(threads - 1);
	for (auto i = threads - 1; i > 0; --i)
		v.emplace_back([this]{m_ioc.run();});

	m_ioc.run();

	for (auto&& t : v)
		t.join();
}

} // end of namespace
