/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "SignatureV4.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

namespace icdn {

SignatureV4 SignatureV4::aws(std::string access_key, std::string secret_key, std::string region, std::string service)
{
	SignatureV4 result;
	result.m_prefix     = "X-Amz";
	result.m_algorithm  = "AWS4-HMAC-SHA256";
	result.m_terminator = "aws4_request";
	result.m_access_key = std::move(access_key);
	result.m_secret_key = std::move(secret_key);
	result.m_region     = std::move(region);
	result.m_service    = std::move(service);
	return result;
}

SignatureV4 SignatureV4::goog(std::string client_email, std::string_view private_key_pem, std::error_code& ec)
{
	SignatureV4 result;
	result.m_prefix     = "X-Goog";
	result.m_algorithm  = "GOOG4-RSA-SHA256";
	result.m_terminator = "goog4_request";
	result.m_access_key = std::move(client_email);
	result.m_region     = "auto";
	result.m_service    = "storage";
	result.m_rsa        = load_private_key(private_key_pem);

	if (!result.m_rsa)
		ec = Error::validation_failed;
	else
		ec.clear();

	return result;
}

std::string SignatureV4::canonical_query(const Query& query)
{
	// Keys are already sorted by std::map. Encoding does not change the order
	// because only characters outside [A-Za-z0-9-._~] are encoded.
	std::string result;
	for (auto&& [key, value] : query)
	{
		if (!result.empty())
			result.push_back('&');
		result += url_encode(key);
		result.push_back('=');
		result += url_encode(value);
	}
	return result;
}

std::string SignatureV4::presign(
	std::string_view method,
	std::string_view host,
	std::string_view canonical_uri,
	Query query,
	const Headers& headers,
	std::chrono::seconds expires,
	Timestamp now
) const
{
	auto datetime = now.compact();
	auto date     = datetime.substr(0, 8);
	auto scope    = date + '/' + m_region + '/' + m_service + '/' + m_terminator;

	// "host" is always signed
	Headers signed_headers{headers};
	signed_headers.insert_or_assign("host", std::string{host});

	std::string header_names, canonical_headers;
	for (auto&& [name, value] : signed_headers)
	{
		if (!header_names.empty())
			header_names.push_back(';');
		header_names += name;
		canonical_headers += name + ':' + std::string{trim(value)} + '\n';
	}

	query.insert_or_assign(m_prefix + "-Algorithm",     m_algorithm);
	query.insert_or_assign(m_prefix + "-Credential",    m_access_key + '/' + scope);
	query.insert_or_assign(m_prefix + "-Date",          datetime);
	query.insert_or_assign(m_prefix + "-Expires",       std::to_string(expires.count()));
	query.insert_or_assign(m_prefix + "-SignedHeaders", header_names);

	auto canonical_qs = canonical_query(query);

	auto canonical_request =
		std::string{method} + '\n' +
		std::string{canonical_uri} + '\n' +
		canonical_qs + '\n' +
		canonical_headers + '\n' +
		header_names + '\n' +
		"UNSIGNED-PAYLOAD";

	auto string_to_sign =
		m_algorithm + '\n' +
		datetime + '\n' +
		scope + '\n' +
		sha256_hex(buffer_view(canonical_request));

	return canonical_qs + '&' + m_prefix + "-Signature=" + sign(date, string_to_sign);
}

std::string SignatureV4::sign(std::string_view date, std::string_view string_to_sign) const
{
	if (m_rsa)
	{
		auto signature = rsa_sha256_sign(m_rsa.get(), string_to_sign);
		if (!signature)
		{
			Log(LOG_WARNING, "cannot sign request with the RSA key of %1%", m_access_key);
			return {};
		}
		return to_hex(*signature);
	}

	auto as_view = [](const SHA256Digest& digest)
	{
		return std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()};
	};

	auto k_date    = hmac_sha256("AWS4" + m_secret_key, date);
	auto k_region  = hmac_sha256(as_view(k_date),    m_region);
	auto k_service = hmac_sha256(as_view(k_region),  m_service);
	auto k_signing = hmac_sha256(as_view(k_service), m_terminator);

	return to_hex(hmac_sha256(as_view(k_signing), string_to_sign));
}

} // end of namespace
