/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "AzureBackend.hh"

#include "crypto/EVPWrapper.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"
#include "util/StringFields.hh"

#include <boost/exception/info.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include <cstdlib>
#include <sstream>
#include <thread>

namespace icdn {
namespace {

const std::string api_version{"2020-10-02"};
const std::string sas_version{"2018-11-09"};
const std::chrono::milliseconds copy_poll_interval{500};

bool is_success(http::status status)
{
	return http::to_status_class(status) == http::status_class::successful;
}

std::string field(const http::fields& fields, boost::beast::string_view name)
{
	auto value = fields[name];
	return {value.data(), value.size()};
}

std::string encode_query(const AzureBackend::Query& query)
{
	std::string result;
	for (auto&& [key, value] : query)
	{
		result.push_back(result.empty() ? '?' : '&');
		result += url_encode(key) + '=' + url_encode(value);
	}
	return result;
}

AzureBackend::Account parse_account(const DiskConfig& cfg)
{
	auto account = AzureBackend::Account::parse(cfg.required("connection_string"));
	if (!account)
		BOOST_THROW_EXCEPTION(Configuration::Error()
			<< Configuration::Disk{cfg.name()}
			<< Configuration::Parameter{"connection_string"}
			<< Configuration::Message{"invalid Azure storage connection string"}
		);
	return *account;
}

}

std::optional<AzureBackend::Account> AzureBackend::Account::parse(std::string_view connection_string)
{
	auto [name, key, blob_endpoint, protocol, suffix] = icdn::connection_string.find_optional(
		connection_string,
		"AccountName", "AccountKey", "BlobEndpoint", "DefaultEndpointsProtocol", "EndpointSuffix"
	);
	if (!name || !key || name->empty())
		return std::nullopt;

	auto decoded = base64_decode(*key);
	if (!decoded || decoded->empty())
		return std::nullopt;

	auto endpoint = blob_endpoint ?
		URL::parse(*blob_endpoint) :
		URL::parse(
			std::string{protocol.value_or("https")} + "://" + std::string{*name} + ".blob." +
			std::string{suffix.value_or("core.windows.net")}
		);
	if (!endpoint)
		return std::nullopt;

	if (endpoint->target.empty() || endpoint->target.back() != '/')
		endpoint->target.push_back('/');

	return Account{std::string{*name}, std::move(*decoded), std::move(*endpoint)};
}

AzureBackend::AzureBackend(const DiskConfig& cfg, std::chrono::seconds timeout) :
	AzureBackend{parse_account(cfg), cfg.required("container"), cfg.param("url"), timeout}
{
}

AzureBackend::AzureBackend(Account account, std::string container, std::string public_url, std::chrono::seconds timeout) :
	m_account{std::move(account)},
	m_container{std::move(container)},
	m_public_url{std::move(public_url)},
	m_client{timeout}
{
	while (!m_public_url.empty() && m_public_url.back() == '/')
		m_public_url.pop_back();
}

std::string_view AzureBackend::driver() const
{
	return "azure";
}

std::string AzureBackend::container_uri() const
{
	return m_account.endpoint.target + url_encode(m_container);
}

std::string AzureBackend::blob_uri(std::string_view path) const
{
	return container_uri() + '/' + url_encode(path, true);
}

std::string AzureBackend::string_to_sign(const StringRequest& req, std::string_view uri, const Query& query) const
{
	auto length = req.body().size();

	std::ostringstream ss;
	ss  << req.method_string() << '\n'
		<< field(req, "Content-Encoding") << '\n'
		<< field(req, "Content-Language") << '\n'
		<< (length > 0 ? std::to_string(length) : std::string{}) << '\n'
		<< field(req, "Content-MD5") << '\n'
		<< field(req, "Content-Type") << '\n'
		<< field(req, "Date") << '\n'
		<< field(req, "If-Modified-Since") << '\n'
		<< field(req, "If-Match") << '\n'
		<< field(req, "If-None-Match") << '\n'
		<< field(req, "If-Unmodified-Since") << '\n'
		<< field(req, "Range") << '\n';

	// Canonicalized headers: the x-ms-* headers sorted by their lower case names
	std::map<std::string, std::string> ms_headers;
	for (auto&& f : req)
	{
		auto name = to_lower({f.name_string().data(), f.name_string().size()});
		if (name.compare(0, 5, "x-ms-") == 0)
			ms_headers.emplace(name, trim({f.value().data(), f.value().size()}));
	}
	for (auto&& [name, value] : ms_headers)
		ss << name << ':' << value << '\n';

	// Canonicalized resource
	ss << '/' << m_account.name << uri;
	for (auto&& [key, value] : query)
		ss << '\n' << key << ':' << value;

	return ss.str();
}

StringResponse AzureBackend::send(
	http::verb method,
	std::string_view uri,
	const Query& query,
	StringRequest&& req,
	std::error_code& ec
) const
{
	req.method(method);
	req.set("x-ms-date", Timestamp::now().http_format());
	req.set("x-ms-version", api_version);

	auto mac = hmac_sha256(m_account.key, string_to_sign(req, uri, query));
	req.set(
		http::field::authorization,
		"SharedKey " + m_account.name + ':' + base64_encode({reinterpret_cast<const char*>(mac.data()), mac.size()})
	);

	URL url{m_account.endpoint};
	url.target = std::string{uri} + encode_query(query);
	return m_client.send(url, std::move(req), ec);
}

bool AzureBackend::exists(std::string_view path) const
{
	if (!is_valid_path(path))
		return false;

	std::error_code ec;
	auto res = send(http::verb::head, blob_uri(path), {}, {}, ec);
	return !ec && res.result() == http::status::ok;
}

Blob AzureBackend::read(std::string_view path, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	auto res = send(http::verb::get, blob_uri(path), {}, {}, ec);
	if (ec)
		return {};

	if (res.result() == http::status::not_found)
	{
		ec = Error::object_not_exist;
		return {};
	}
	if (res.result() != http::status::ok)
	{
		Log(LOG_WARNING, "azure read %1%: HTTP %2%", path, res.result_int());
		ec = Error::backend_error;
		return {};
	}

	auto&& body = res.body();
	return Blob(body.begin(), body.end());
}

void AzureBackend::write(std::string_view path, BufferView data, const WriteOptions& opts, std::error_code& ec)
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return;
	}

	StringRequest req;
	req.set("x-ms-blob-type", "BlockBlob");
	if (!opts.content_type.empty())
		req.set(http::field::content_type, opts.content_type);
	req.body() = std::string{as_string(data)};

	auto res = send(http::verb::put, blob_uri(path), {}, std::move(req), ec);
	if (!ec && !is_success(res.result()))
	{
		Log(LOG_WARNING, "azure write %1%: HTTP %2% %3%", path, res.result_int(), res.body());
		ec = Error::backend_error;
	}
}

bool AzureBackend::remove(std::string_view path)
{
	if (!is_valid_path(path))
		return false;

	std::error_code ec;
	auto res = send(http::verb::delete_, blob_uri(path), {}, {}, ec);
	if (!ec && !is_success(res.result()) && res.result() != http::status::not_found)
		Log(LOG_WARNING, "azure remove %1%: HTTP %2%", path, res.result_int());

	return !ec && is_success(res.result());
}

void AzureBackend::copy(std::string_view from, std::string_view to, std::error_code& ec)
{
	if (!is_valid_path(from) || !is_valid_path(to))
	{
		ec = Error::invalid_path;
		return;
	}

	StringRequest req;
	req.set("x-ms-copy-source", m_account.endpoint.scheme + "://" + m_account.endpoint.host_header() + blob_uri(from));

	auto res = send(http::verb::put, blob_uri(to), {}, std::move(req), ec);
	if (ec)
		return;

	if (res.result() == http::status::not_found)
	{
		ec = Error::object_not_exist;
		return;
	}
	if (!is_success(res.result()))
	{
		Log(LOG_WARNING, "azure copy %1% to %2%: HTTP %3% %4%", from, to, res.result_int(), res.body());
		ec = Error::backend_error;
		return;
	}

	// The copy runs in the background of the service. Wait until it finishes.
	auto deadline = std::chrono::steady_clock::now() + m_client.timeout();
	auto status = field(res, "x-ms-copy-status");
	while (status == "pending" && std::chrono::steady_clock::now() < deadline)
	{
		std::this_thread::sleep_for(copy_poll_interval);

		auto probe = send(http::verb::head, blob_uri(to), {}, {}, ec);
		if (ec)
			return;

		status = field(probe, "x-ms-copy-status");
	}

	if (status != "success")
	{
		Log(LOG_WARNING, "azure copy %1% to %2%: copy status is \"%3%\"", from, to, status);
		ec = Error::backend_error;
	}
}

ObjectMeta AzureBackend::stat(std::string_view path, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	auto res = send(http::verb::head, blob_uri(path), {}, {}, ec);
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

	ObjectMeta meta;
	meta.size = std::strtoull(field(res, "Content-Length").c_str(), nullptr, 10);
	meta.mime = field(res, "Content-Type");
	if (auto modified = Timestamp::parse_http(field(res, "Last-Modified")))
		meta.last_modified = *modified;

	return meta;
}

std::vector<std::string> AzureBackend::parse_listing(std::string_view xml, std::string& next_marker, std::error_code& ec)
{
	namespace pt = boost::property_tree;

	std::vector<std::string> result;
	try
	{
		std::istringstream ss{std::string{xml}};
		pt::ptree tree;
		pt::read_xml(ss, tree);

		auto&& root = tree.get_child("EnumerationResults");
		if (auto blobs = root.get_child_optional("Blobs"))
		{
			for (auto&& [name, child] : *blobs)
			{
				if (name == "Blob")
					result.push_back(child.get<std::string>("Name"));
			}
		}

		next_marker = root.get("NextMarker", std::string{});
		ec.clear();
	}
	catch (pt::ptree_error& e)
	{
		Log(LOG_WARNING, "cannot parse container listing: %1%", e.what());
		ec = Error::backend_error;
		result.clear();
	}
	return result;
}

std::vector<std::string> AzureBackend::list(std::string_view prefix, std::error_code& ec) const
{
	std::vector<std::string> result;
	std::string marker;
	do
	{
		Query query{{"restype", "container"}, {"comp", "list"}};
		if (!prefix.empty())
			query.emplace("prefix", std::string{prefix});
		if (!marker.empty())
			query.emplace("marker", marker);

		auto res = send(http::verb::get, container_uri(), query, {}, ec);
		if (ec)
			return {};

		if (res.result() != http::status::ok)
		{
			Log(LOG_WARNING, "azure list %1%: HTTP %2%", prefix, res.result_int());
			ec = Error::backend_error;
			return {};
		}

		auto page = parse_listing(res.body(), marker, ec);
		if (ec)
			return {};

		result.insert(result.end(), page.begin(), page.end());
	} while (!marker.empty());

	return result;
}

std::string AzureBackend::url(std::string_view path) const
{
	return m_public_url.empty() ?
		m_account.endpoint.scheme + "://" + m_account.endpoint.host_header() + blob_uri(path) :
		m_public_url + '/' + url_encode(path, true);
}

std::string AzureBackend::temporary_url(std::string_view path, std::chrono::seconds ttl, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	// read-only service SAS of a single blob
	auto expiry = Timestamp{Timestamp::now() + ttl}.iso8601().substr(0, 19) + 'Z';
	auto resource = "/blob/" + m_account.name + '/' + m_container + '/' + std::string{path};

	auto sts =
		"r\n"               // signedPermissions
		"\n" +              // signedStart
		expiry + '\n' +
		resource + '\n' +
		"\n"                // signedIdentifier
		"\n"                // signedIP
		"\n" +              // signedProtocol
		sas_version + '\n' +
		"b\n"               // signedResource
		"\n"                // signedSnapshotTime
		"\n\n\n\n";         // rscc, rscd, rsce, rscl and rsct

	auto mac = hmac_sha256(m_account.key, sts);
	auto sig = base64_encode({reinterpret_cast<const char*>(mac.data()), mac.size()});

	ec.clear();
	return m_account.endpoint.scheme + "://" + m_account.endpoint.host_header() + blob_uri(path) +
		"?sv=" + sas_version + "&sr=b&sp=r&se=" + url_encode(expiry) + "&sig=" + url_encode(sig);
}

} // end of namespace
