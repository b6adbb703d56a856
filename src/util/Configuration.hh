/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "Exception.hh"
#include "FS.hh"

#include <syslog.h>

#include <boost/program_options/variables_map.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/exception/error_info.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace icdn {

/// Parsed description of one configured storage disk.
/// The parameters are driver specific, e.g. "bucket" and "region" for s3.
class DiskConfig
{
public:
	DiskConfig(std::string name, std::string driver, std::map<std::string, std::string> params = {});

	const std::string& name() const {return m_name;}
	const std::string& driver() const {return m_driver;}

	/// Returns an empty string if the parameter is absent.
	std::string param(const std::string& key) const;
	std::optional<std::string> optional_param(const std::string& key) const;

	/// Throws Configuration::MissingParameter if the parameter is absent or empty.
	std::string required(const std::string& key) const;

private:
	std::string m_name;
	std::string m_driver;
	std::map<std::string, std::string> m_params;
};

/// \brief  Parsing command line options and configuration file
class Configuration
{
public:
	struct Error : virtual Exception {};
	struct FileError : virtual Error {};
	struct MissingParameter : virtual Error {};
	using Path      = boost::error_info<struct tag_path,    fs::path>;
	using Message   = boost::error_info<struct tag_message, std::string>;
	using Disk      = boost::error_info<struct tag_disk,    std::string>;
	using Parameter = boost::error_info<struct tag_param,   std::string>;

public:
	Configuration(int argc, const char *const *argv, const char *env);

	/// Configuration from an in-memory JSON document.
	/// Relative paths in \a json are resolved against \a base.
	Configuration(const nlohmann::json& json, const fs::path& base);

	boost::asio::ip::tcp::endpoint listen() const {return m_listen;}

	fs::path working_path() const {return m_working_path;}
	fs::path cache_path() const {return m_cache_path;}
	std::size_t thread_count() const {return m_thread_count;}
	std::size_t upload_limit() const {return m_upload_limit;}
	bool production() const {return m_production;}
	int log_level() const {return m_log_level;}
	std::chrono::seconds backend_timeout() const {return m_backend_timeout;}

	const std::string& auth_secret() const {return m_auth_secret;}
	std::chrono::seconds token_lifetime() const {return m_token_lifetime;}

	const std::string& default_disk() const {return m_default_disk;}

	/// The implicit "local" disk, used when no disk named "local" is configured.
	const DiskConfig& local_disk() const {return m_local_disk;}
	const std::vector<DiskConfig>& disks() const {return m_disks;}

	bool help() const {return m_args.count("help") > 0;}

	template <typename IssueToken>
	bool issue_token(IssueToken&& func) const
	{
		return m_args.count("issue-token") > 0 ?
			(func(m_args["issue-token"].as<std::string>()), true) :
			false;
	}

	void usage(std::ostream& out) const;

private:
	void load_config(const fs::path& path);
	void load_json(const nlohmann::json& json, const fs::path& base);

private:
	boost::program_options::options_description m_desc{"Allowed options"};
	boost::program_options::variables_map       m_args;

	boost::asio::ip::tcp::endpoint m_listen{boost::asio::ip::make_address("0.0.0.0"), 3012};

	fs::path    m_working_path, m_cache_path;
	std::size_t m_thread_count{1};
	std::size_t m_upload_limit{50 * 1024 * 1024};
	bool        m_production{false};
	int         m_log_level{LOG_INFO};
	std::chrono::seconds m_backend_timeout{30};

	std::string m_auth_secret;
	std::chrono::seconds m_token_lifetime{24 * 3600};

	std::string m_default_disk{"local"};
	DiskConfig  m_local_disk{"local", "local"};
	std::vector<DiskConfig> m_disks;
};

} // end of namespace
