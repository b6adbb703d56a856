/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "StorageBackend.hh"
#include "SignatureV4.hh"

#include "net/HTTPClient.hh"

namespace icdn {

/// \brief  Bucket of an object store with an S3-compatible XML API.
///
/// Every request is sent as a presigned URL. S3Backend and GCSBackend only differ
/// in the endpoint, the signer and the names of the vendor specific headers.
class ObjectStore : public StorageBackend
{
public:
	bool exists(std::string_view path) const override;
	Blob read(std::string_view path, std::error_code& ec) const override;
	void write(std::string_view path, BufferView data, const WriteOptions& opts, std::error_code& ec) override;
	bool remove(std::string_view path) override;
	void copy(std::string_view from, std::string_view to, std::error_code& ec) override;
	ObjectMeta stat(std::string_view path, std::error_code& ec) const override;
	std::vector<std::string> list(std::string_view prefix, std::error_code& ec) const override;
	std::string url(std::string_view path) const override;
	std::string temporary_url(std::string_view path, std::chrono::seconds ttl, std::error_code& ec) const override;

	/// URL of \a path as it is sent to the API, before signing.
	std::string api_url(std::string_view path) const;

	/// Keys and continuation token of one page of a ListObjectsV2 response.
	static std::vector<std::string> parse_listing(std::string_view xml, std::string& next_token, std::error_code& ec);

protected:
	/// \param  api         Endpoint of the bucket. Its target is the path of the bucket,
	///                     "/" for virtual-hosted style or "/<bucket>/" for path style.
	/// \param  public_url  Base of the URLs returned by url(), without a trailing slash.
	/// \param  vendor      Prefix of the vendor specific headers, "x-amz" or "x-goog".
	ObjectStore(
		std::string bucket,
		URL api,
		std::string public_url,
		std::string vendor,
		SignatureV4 signer,
		std::chrono::seconds timeout
	);

private:
	StringResponse send(
		http::verb method,
		std::string_view path,
		SignatureV4::Query query,
		SignatureV4::Headers headers,
		std::string body,
		std::error_code& ec
	) const;

	std::string object_uri(std::string_view path) const;

private:
	std::string m_bucket;
	URL         m_api;
	std::string m_public_url;
	std::string m_vendor;
	SignatureV4 m_signer;
	HTTPClient  m_client;
};

} // end of namespace
