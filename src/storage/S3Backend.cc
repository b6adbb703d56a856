/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "S3Backend.hh"

#include "util/Configuration.hh"

#include <boost/exception/info.hpp>

namespace icdn {
namespace {

// Virtual-hosted style by default. Path style for custom endpoints, because
// S3-compatible services often do not have wildcard DNS for buckets.
URL s3_endpoint(const DiskConfig& cfg)
{
	auto bucket = cfg.required("bucket");
	auto region = cfg.optional_param("region").value_or("us-east-1");

	if (auto endpoint = cfg.param("endpoint"); !endpoint.empty())
	{
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

	return {"https", bucket + ".s3." + region + ".amazonaws.com", "443", "/"};
}

}

S3Backend::S3Backend(const DiskConfig& cfg, std::chrono::seconds timeout) :
	ObjectStore{
		cfg.required("bucket"),
		s3_endpoint(cfg),
		cfg.param("url"),
		"x-amz",
		SignatureV4::aws(
			cfg.required("key"),
			cfg.required("secret"),
			cfg.optional_param("region").value_or("us-east-1")
		),
		timeout
	}
{
}

std::string_view S3Backend::driver() const
{
	return "s3";
}

} // end of namespace
