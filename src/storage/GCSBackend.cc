/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "GCSBackend.hh"

#include "util/Configuration.hh"

#include <boost/exception/info.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <fstream>

namespace icdn {
namespace {

URL gcs_endpoint(const DiskConfig& cfg)
{
	auto bucket   = cfg.required("bucket");
	auto endpoint = cfg.optional_param("endpoint").value_or("https://storage.googleapis.com");

	auto url = URL::parse(endpoint);
	if (!url)
		BOOST_THROW_EXCEPTION(Configuration::Error()
			<< Configuration::Disk{cfg.name()}
			<< Configuration::Parameter{"endpoint"}
			<< Configuration::Message{"invalid URL: " + endpoint}
		);

	while (!url->target.empty() && url->target.back() == '/')
		url->target.pop_back();
	url->target += '/' + bucket + '/';
	return *url;
}

// Signs with the service account in the JSON key file downloaded from the cloud console.
SignatureV4 gcs_signer(const DiskConfig& cfg)
{
	auto key_file = cfg.required("key_file");
	try
	{
		std::ifstream file{key_file};
		if (!file)
			BOOST_THROW_EXCEPTION(Configuration::FileError()
				<< ErrorCode({errno, std::system_category()})
			);

		auto json = nlohmann::json::parse(file);

		// the key of a service account in another project cannot reach the bucket
		auto project = cfg.param("project_id");
		if (!project.empty() && json.value("project_id", project) != project)
			BOOST_THROW_EXCEPTION(Configuration::Error()
				<< Configuration::Parameter{"project_id"}
				<< Configuration::Message{"key file belongs to project " + json.value("project_id", std::string{})}
			);

		std::error_code ec;
		auto signer = SignatureV4::goog(
			json.at("client_email").get<std::string>(),
			json.at("private_key").get<std::string>(),
			ec
		);
		if (ec)
			BOOST_THROW_EXCEPTION(Configuration::Error()
				<< Configuration::Message{"invalid private key"}
			);

		return signer;
	}
	catch (Exception& e)
	{
		e << Configuration::Disk{cfg.name()} << Configuration::Path{key_file};
		throw;
	}
	catch (std::exception& e)
	{
		throw boost::enable_error_info(e) << Configuration::Disk{cfg.name()} << Configuration::Path{key_file};
	}
}

}

GCSBackend::GCSBackend(const DiskConfig& cfg, std::chrono::seconds timeout) :
	ObjectStore{
		cfg.required("bucket"),
		gcs_endpoint(cfg),
		cfg.param("url"),
		"x-goog",
		gcs_signer(cfg),
		timeout
	}
{
}

std::string_view GCSBackend::driver() const
{
	return "gcs";
}

} // end of namespace
