/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Configuration.hh"

#include "Log.hh"

#include "config.hh"

#include <boost/program_options.hpp>
#include <boost/exception/info.hpp>

#include <algorithm>
#include <fstream>

namespace po = boost::program_options;
namespace ip = boost::asio::ip;

namespace icdn {
namespace {

ip::tcp::endpoint parse_endpoint(const nlohmann::json& json)
{
	return {
		ip::make_address(json.value("address", std::string{"0.0.0.0"})),
		json.value("port", static_cast<unsigned short>(3012))
	};
}

fs::path resolve(const std::string& path, const fs::path& base)
{
	return fs::weakly_canonical(fs::absolute(base / path));
}

// Every driver parameter is a string, except relative paths which are resolved
// against the directory of the configuration file.
DiskConfig parse_disk(const std::string& name, const nlohmann::json& json, const fs::path& base)
{
	auto driver = json.value("driver", std::string{});
	if (driver.empty())
		BOOST_THROW_EXCEPTION(Configuration::MissingParameter()
			<< Configuration::Disk{name}
			<< Configuration::Parameter{"driver"}
		);

	std::map<std::string, std::string> params;
	for (auto&& item : json.items())
	{
		if (item.key() == "driver" || !item.value().is_string())
			continue;

		auto value = item.value().get<std::string>();
		if ((item.key() == "root" || item.key() == "key_file") && !value.empty())
			value = resolve(value, base).string();

		params.emplace(item.key(), std::move(value));
	}
	return DiskConfig{name, std::move(driver), std::move(params)};
}

} // end of local namespace

DiskConfig::DiskConfig(std::string name, std::string driver, std::map<std::string, std::string> params) :
	m_name{std::move(name)}, m_driver{std::move(driver)}, m_params{std::move(params)}
{
}

std::string DiskConfig::param(const std::string& key) const
{
	return optional_param(key).value_or(std::string{});
}

std::optional<std::string> DiskConfig::optional_param(const std::string& key) const
{
	auto it = m_params.find(key);
	return it != m_params.end() ? std::optional<std::string>{it->second} : std::nullopt;
}

std::string DiskConfig::required(const std::string& key) const
{
	auto value = param(key);
	if (value.empty())
		BOOST_THROW_EXCEPTION(Configuration::MissingParameter()
			<< Configuration::Disk{m_name}
			<< Configuration::Parameter{key}
		);
	return value;
}

Configuration::Configuration(int argc, const char *const *argv, const char *env)
{
	m_desc.add_options()
		("help",        "produce help message")
		("issue-token", po::value<std::string>()->value_name("subject"), "print a bearer token for the given subject and exit")
		("cfg",         po::value<std::string>()->default_value(
			env ? std::string{env} : std::string{icdn::constants::config_filename}
		)->value_name("path"), "Configuration file. Use environment variable IMAGECDN_CONFIG to set default path.")
	;

	if (argc > 0)
	{
		store(po::parse_command_line(argc, argv, m_desc), m_args);
		po::notify(m_args);
	}

	// no need for other options when --help is specified
	if (!help())
		load_config(
			m_args.count("cfg") > 0 ? m_args["cfg"].as<std::string>() :
			std::string{env ? env : icdn::constants::config_filename}
		);
}

Configuration::Configuration(const nlohmann::json& json, const fs::path& base)
{
	load_json(json, base);
}

void Configuration::usage(std::ostream &out) const
{
	out << m_desc;
}

void Configuration::load_config(const fs::path& path)
{
	try
	{
		std::ifstream config_file;
		config_file.open(path.string(), std::ios::in);
		if (!config_file)
		{
			BOOST_THROW_EXCEPTION(FileError()
				<< ErrorCode({errno, std::system_category()})
			);
		}

		auto json = nlohmann::json::parse(config_file, nullptr, false);
		if (json.is_discarded())
			BOOST_THROW_EXCEPTION(Error() << Message{"malformed JSON"});

		load_json(json, fs::absolute(path).parent_path());
	}
	catch (Exception& e)
	{
		e << Path{path};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Path{path};
	}
}

void Configuration::load_json(const nlohmann::json& json, const fs::path& base)
{
	using jptr = nlohmann::json::json_pointer;

	if (auto listen = json.value(jptr{"/listen"}, nlohmann::json::object()); !listen.empty())
		m_listen = parse_endpoint(listen);

	// Paths are relative to the configuration file
	m_working_path  = resolve(json.value(jptr{"/working_path"}, std::string{"uploads"}), base);
	m_cache_path    = resolve(json.value(jptr{"/cache_path"},   std::string{"cache"}),   base);
	m_thread_count  = std::max<std::size_t>(json.value(jptr{"/thread_count"}, m_thread_count), 1);
	m_upload_limit  = static_cast<std::size_t>(
		json.value(jptr{"/upload_limit_mb"}, m_upload_limit/1024.0/1024.0) * 1024 * 1024
	);
	m_production      = json.value(jptr{"/production"}, m_production);
	if (auto level = json.value(jptr{"/log_level"}, std::string{"info"}); LogPriority(level))
		m_log_level = *LogPriority(level);
	else
		BOOST_THROW_EXCEPTION(Error() << Message{"unknown log_level \"" + level + "\""});
	m_backend_timeout = std::chrono::seconds{json.value(jptr{"/backend_timeout_sec"}, 30L)};

	m_auth_secret    = json.value(jptr{"/auth/secret"}, std::string{});
	m_token_lifetime = std::chrono::seconds{json.value(jptr{"/auth/token_lifetime_sec"}, 24L * 3600)};

	m_default_disk = json.value(jptr{"/storage/default"}, m_default_disk);

	// The implicit local disk defaults to a directory beside the configuration file.
	auto local = json.value(jptr{"/storage/local"}, nlohmann::json::object());
	local.emplace("driver", "local");
	local.emplace("root", "storage");
	m_local_disk = parse_disk("local", local, base);

	if (auto disks = json.value(jptr{"/storage/disks"}, nlohmann::json::object()); disks.is_object())
	{
		for (auto&& disk : disks.items())
			m_disks.push_back(parse_disk(disk.key(), disk.value(), base));
	}
}

} // end of namespace
