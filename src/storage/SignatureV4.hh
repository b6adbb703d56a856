/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "crypto/EVPWrapper.hh"
#include "util/Timestamp.hh"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace icdn {

/// \brief  Query string authentication (presigned URLs) of signature version 4.
///
/// The same scheme is used by S3 ("AWS4-HMAC-SHA256", signed by a key derived from the
/// secret access key) and by the XML API of Google Cloud Storage ("GOOG4-RSA-SHA256",
/// signed by the RSA key of a service account).
class SignatureV4
{
public:
	/// Lower-case header names and their values.
	using Headers = std::map<std::string, std::string>;
	using Query   = std::map<std::string, std::string>;

	/// AWS4-HMAC-SHA256 signer of \a service in \a region.
	static SignatureV4 aws(std::string access_key, std::string secret_key, std::string region, std::string service = "s3");

	/// GOOG4-RSA-SHA256 signer of a service account.
	/// \a private_key_pem is the "private_key" field in the JSON key file.
	static SignatureV4 goog(std::string client_email, std::string_view private_key_pem, std::error_code& ec);

	/// Returns the query string of a presigned URL, without the '?'.
	/// \a canonical_uri is the URI-encoded path of the request, starting with '/'.
	/// \a headers must include every header that is sent with the request, except "host".
	std::string presign(
		std::string_view method,
		std::string_view host,
		std::string_view canonical_uri,
		Query query,
		const Headers& headers,
		std::chrono::seconds expires,
		Timestamp now = Timestamp::now()
	) const;

	static std::string canonical_query(const Query& query);

private:
	SignatureV4() = default;

	std::string sign(std::string_view date, std::string_view string_to_sign) const;

private:
	std::string m_prefix;       //!< "X-Amz" or "X-Goog"
	std::string m_algorithm;    //!< "AWS4-HMAC-SHA256" or "GOOG4-RSA-SHA256"
	std::string m_terminator;   //!< "aws4_request" or "goog4_request"
	std::string m_access_key;
	std::string m_secret_key;
	std::string m_region;
	std::string m_service;
	std::shared_ptr<EVP_PKEY> m_rsa;
};

} // end of namespace
