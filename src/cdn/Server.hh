/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "ImageService.hh"
#include "RequestHandler.hh"

#include "crypto/Authentication.hh"

#include <boost/asio/io_context.hpp>

namespace icdn {

class Configuration;

/// The main application logic of imagecdn.
/// It owns the io_context, the image service and the credentials. Sessions call
/// start_request() to get a handler for each request they receive.
class Server
{
public:
	explicit Server(const Configuration& cfg);

	boost::asio::io_context& get_io_context();

	RequestHandler start_request();

	/// Largest request body accepted: the upload limit plus room for the multipart framing.
	std::size_t upload_limit() const;

	/// Listens and runs the io_context on the configured number of threads. Blocks until it stops.
	void run();

	ImageService& service() {return m_service;}
	const Authentication& auth() const {return m_auth;}

private:
	const Configuration&    m_cfg;
	boost::asio::io_context m_ioc;

	Authentication  m_auth;
	ImageService    m_service;
};

} // end of namespace
