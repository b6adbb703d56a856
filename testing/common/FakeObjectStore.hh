/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace icdn {

/// \brief  In-memory object store listening on localhost for the unit tests.
///
/// It speaks just enough of the S3 XML API and the Azure Blob API for the backends:
/// object GET/PUT/HEAD/DELETE, server-side copies and paginated listings of two
/// keys per page. Signatures are not verified. Objects are keyed by their decoded
/// request paths, e.g. "/bucket/images/abc.png".
class FakeObjectStore
{
public:
	struct Object
	{
		std::string body;
		std::string content_type;
	};

public:
	FakeObjectStore();
	~FakeObjectStore();

	/// "http://127.0.0.1:<port>"
	std::string endpoint() const;

	bool has(const std::string& key) const;
	std::string body(const std::string& key) const;
	std::size_t request_count() const {return m_requests;}

	/// Every request received after this call gets \a status as its response.
	void fail_with(unsigned status) {m_fail = status;}

private:
	void serve();

private:
	boost::asio::io_context         m_ioc;
	boost::asio::ip::tcp::acceptor  m_acceptor;

	mutable std::mutex              m_mutex;
	std::map<std::string, Object>   m_objects;

	std::atomic<bool>               m_stop{false};
	std::atomic<unsigned>           m_fail{0};
	std::atomic<std::size_t>        m_requests{0};
	std::thread                     m_thread;
};

} // end of namespace
