/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "ObjectStore.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <cstdlib>
#include <sstream>

namespace icdn {
namespace {

// Presigned URLs used internally only need to live as long as one request.
const std::chrono::seconds request_expiry{900};

bool is_success(http::status status)
{
	return http::to_status_class(status) == http::status_class::successful;
}

}

ObjectStore::ObjectStore(
	std::string bucket,
	URL api,
	std::string public_url,
	std::string vendor,
	SignatureV4 signer,
	std::chrono::seconds timeout
) :
	m_bucket{std::move(bucket)},
	m_api{std::move(api)},
	m_public_url{std::move(public_url)},
	m_vendor{std::move(vendor)},
	m_signer{std::move(signer)},
	m_client{timeout}
{
	if (m_api.target.empty() || m_api.target.back() != '/')
		m_api.target.push_back('/');

	while (!m_public_url.empty() && m_public_url.back() == '/')
		m_public_url.pop_back();
}

std::string ObjectStore::object_uri(std::string_view path) const
{
	return m_api.target + url_encode(path, true);
}

std::string ObjectStore::api_url(std::string_view path) const
{
	return m_api.scheme + "://" + m_api.host_header() + object_uri(path);
}

StringResponse ObjectStore::send(
	http::verb method,
	std::string_view path,
	SignatureV4::Query query,
	SignatureV4::Headers headers,
	std::string body,
	std::error_code& ec
) const
{
	auto uri = object_uri(path);

	URL url{m_api};
	auto verb = http::to_string(method);
	url.target = uri + '?' + m_signer.presign(
		{verb.data(), verb.size()}, m_api.host_header(), uri, std::move(query), headers, request_expiry
	);

	StringRequest req;
	req.method(method);
	for (auto&& [name, value] : headers)
		req.set(name, value);
	req.body() = std::move(body);

	return m_client.send(url, std::move(req), ec);
}

bool ObjectStore::exists(std::string_view path) const
{
	if (!is_valid_path(path))
		return false;

	std::error_code ec;
	auto res = send(http::verb::head, path, {}, {}, {}, ec);
	return !ec && res.result() == http::status::ok;
}

Blob ObjectStore::read(std::string_view path, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	auto res = send(http::verb::get, path, {}, {}, {}, ec);
	if (ec)
		return {};

	if (res.result() == http::status::not_found)
	{
		ec = Error::object_not_exist;
		return {};
	}
	if (res.result() != http::status::ok)
	{
		Log(LOG_WARNING, "%1% read %2%: HTTP %3%", driver(), path, res.result_int());
		ec = Error::backend_error;
		return {};
	}

	auto&& body = res.body();
	return Blob(body.begin(), body.end());
}

void ObjectStore::write(std::string_view path, BufferView data, const WriteOptions& opts, std::error_code& ec)
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return;
	}

	SignatureV4::Headers headers;
	if (!opts.content_type.empty())
		headers.emplace("content-type", opts.content_type);

	auto res = send(http::verb::put, path, {}, std::move(headers), std::string{as_string(data)}, ec);
	if (!ec && !is_success(res.result()))
	{
		Log(LOG_WARNING, "%1% write %2%: HTTP %3% %4%", driver(), path, res.result_int(), res.body());
		ec = Error::backend_error;
	}
}

bool ObjectStore::remove(std::string_view path)
{
	// DELETE succeeds even if the object does not exist, so probe it first
	if (!exists(path))
		return false;

	std::error_code ec;
	auto res = send(http::verb::delete_, path, {}, {}, {}, ec);
	if (!ec && !is_success(res.result()))
		Log(LOG_WARNING, "%1% remove %2%: HTTP %3%", driver(), path, res.result_int());

	return !ec && is_success(res.result());
}

void ObjectStore::copy(std::string_view from, std::string_view to, std::error_code& ec)
{
	if (!is_valid_path(from) || !is_valid_path(to))
	{
		ec = Error::invalid_path;
		return;
	}

	SignatureV4::Headers headers{
		{m_vendor + "-copy-source", '/' + m_bucket + '/' + url_encode(from, true)}
	};

	auto res = send(http::verb::put, to, {}, std::move(headers), {}, ec);
	if (ec)
		return;

	if (res.result() == http::status::not_found)
		ec = Error::object_not_exist;

	// A copy may fail after the 200 status is sent, with an <Error> in the body.
	else if (!is_success(res.result()) || res.body().find("<Error>") != std::string::npos)
	{
		Log(LOG_WARNING, "%1% copy %2% to %3%: HTTP %4% %5%", driver(), from, to, res.result_int(), res.body());
		ec = Error::backend_error;
	}
}

ObjectMeta ObjectStore::stat(std::string_view path, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	auto res = send(http::verb::head, path, {}, {}, {}, ec);
	if (ec)
		return {};

	if (res.result() == http::status::not_found)
	{
		ec = Error::object_not_exist;
		return {};
	}
	if (res.result() != http::status::ok)
	{
		ec = Error::backend_error;
		return {};
	}

	auto length   = res[http::field::content_length];
	auto type     = res[http::field::content_type];
	auto modified = res[http::field::last_modified];

	ObjectMeta meta;
	meta.size = std::strtoull(std::string{length.data(), length.size()}.c_str(), nullptr, 10);
	meta.mime = std::string{type.data(), type.size()};
	if (auto time = Timestamp::parse_http({modified.data(), modified.size()}))
		meta.last_modified = *time;

	return meta;
}

std::vector<std::string> ObjectStore::parse_listing(std::string_view xml, std::string& next_token, std::error_code& ec)
{
	namespace pt = boost::property_tree;

	std::vector<std::string> result;
	try
	{
		std::istringstream ss{std::string{xml}};
		pt::ptree tree;
		pt::read_xml(ss, tree);

		auto&& root = tree.get_child("ListBucketResult");
		for (auto&& [name, child] : root)
		{
			if (name == "Contents")
				result.push_back(child.get<std::string>("Key"));
		}

		next_token = root.get("IsTruncated", false) ? root.get("NextContinuationToken", std::string{}) : std::string{};
		ec.clear();
	}
	catch (pt::ptree_error& e)
	{
		Log(LOG_WARNING, "cannot parse bucket listing: %1%", e.what());
		ec = Error::backend_error;
		result.clear();
	}
	return result;
}

std::vector<std::string> ObjectStore::list(std::string_view prefix, std::error_code& ec) const
{
	std::vector<std::string> result;
	std::string token;
	do
	{
		SignatureV4::Query query{{"list-type", "2"}, {"prefix", std::string{prefix}}};
		if (!token.empty())
			query.emplace("continuation-token", token);

		// the bucket itself, i.e. the API target with an empty key
		auto uri = m_api.target;
		URL url{m_api};
		url.target = uri + '?' + m_signer.presign("GET", m_api.host_header(), uri, std::move(query), {}, request_expiry);

		StringRequest req;
		req.method(http::verb::get);
		auto res = m_client.send(url, std::move(req), ec);
		if (ec)
			return {};

		if (res.result() != http::status::ok)
		{
			Log(LOG_WARNING, "%1% list %2%: HTTP %3%", driver(), prefix, res.result_int());
			ec = Error::backend_error;
			return {};
		}

		auto page = parse_listing(res.body(), token, ec);
		if (ec)
			return {};

		result.insert(result.end(), page.begin(), page.end());
	} while (!token.empty());

	return result;
}

std::string ObjectStore::url(std::string_view path) const
{
	return m_public_url.empty() ?
		api_url(path) :
		m_public_url + '/' + url_encode(path, true);
}

std::string ObjectStore::temporary_url(std::string_view path, std::chrono::seconds ttl, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	ec.clear();
	auto uri = object_uri(path);
	return m_api.scheme + "://" + m_api.host_header() + uri + '?' +
		m_signer.presign("GET", m_api.host_header(), uri, {}, {}, ttl);
}

} // end of namespace
