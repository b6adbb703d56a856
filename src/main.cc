/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "config.hh"

#include "cdn/Server.hh"
#include "crypto/Authentication.hh"
#include "util/Configuration.hh"
#include "util/Exception.hh"
#include "util/Log.hh"

#include <boost/exception/diagnostic_information.hpp>

#include <cstdlib>
#include <iostream>

namespace icdn {

int StartServer(const Configuration& cfg)
{
	if (cfg.issue_token([&cfg](auto&& subject)
	{
		Authentication auth{cfg.auth_secret()};
		if (auth.enabled())
			std::cout << auth.issue(subject, cfg.token_lifetime()) << std::endl;
		else
			std::cerr << "no authentication secret in configuration" << std::endl;
	})) {return EXIT_SUCCESS;}

	SetLogThreshold(cfg.log_level());
	Log(LOG_NOTICE, "imagecdn (version %1%) starting", constants::version);

	Server server{cfg};
	server.run();
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char *argv[])
{
	using namespace icdn;
	try
	{
		Configuration cfg{argc, argv, ::getenv("IMAGECDN_CONFIG")};
		if (cfg.help())
		{
			cfg.usage(std::cout);
			std::cout << "\n";
			return EXIT_SUCCESS;
		}

		return StartServer(cfg);
	}
	catch (Exception& e)
	{
		Log(LOG_CRIT, "Uncaught boost::exception: %1%", boost::diagnostic_information(e));
		return EXIT_FAILURE;
	}
	catch (std::exception& e)
	{
		Log(LOG_CRIT, "Uncaught std::exception: %1%", e.what());
		return EXIT_FAILURE;
	}
}
