/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "StorageBackend.hh"

#include "net/HTTPClient.hh"

#include <map>

namespace icdn {

class DiskConfig;

/// Container of Azure Blob Storage, authorized by Shared Key.
class AzureBackend : public StorageBackend
{
public:
	/// Lower-case query parameter names and their decoded values.
	using Query = std::map<std::string, std::string>;

	/// Account credential and endpoint parsed from a connection string, e.g.
	/// "DefaultEndpointsProtocol=https;AccountName=abc;AccountKey=...;EndpointSuffix=core.windows.net"
	struct Account
	{
		std::string name;
		std::string key;        //!< decoded from base64
		URL         endpoint;   //!< blob service endpoint

		static std::optional<Account> parse(std::string_view connection_string);
	};

public:
	AzureBackend(const DiskConfig& cfg, std::chrono::seconds timeout);
	AzureBackend(Account account, std::string container, std::string public_url, std::chrono::seconds timeout);

	std::string_view driver() const override;

	bool exists(std::string_view path) const override;
	Blob read(std::string_view path, std::error_code& ec) const override;
	void write(std::string_view path, BufferView data, const WriteOptions& opts, std::error_code& ec) override;
	bool remove(std::string_view path) override;
	void copy(std::string_view from, std::string_view to, std::error_code& ec) override;
	ObjectMeta stat(std::string_view path, std::error_code& ec) const override;
	std::vector<std::string> list(std::string_view prefix, std::error_code& ec) const override;
	std::string url(std::string_view path) const override;
	std::string temporary_url(std::string_view path, std::chrono::seconds ttl, std::error_code& ec) const override;

	/// Shared Key string-to-sign of a request to \a uri (the encoded path).
	std::string string_to_sign(const StringRequest& req, std::string_view uri, const Query& query) const;

	/// Names of the blobs and the marker of the next page in a List Blobs response.
	static std::vector<std::string> parse_listing(std::string_view xml, std::string& next_marker, std::error_code& ec);

private:
	StringResponse send(
		http::verb method,
		std::string_view uri,
		const Query& query,
		StringRequest&& req,
		std::error_code& ec
	) const;

	std::string blob_uri(std::string_view path) const;
	std::string container_uri() const;

private:
	Account     m_account;
	std::string m_container;
	std::string m_public_url;
	HTTPClient  m_client;
};

} // end of namespace
