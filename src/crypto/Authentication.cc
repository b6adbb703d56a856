/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Authentication.hh"
#include "EVPWrapper.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Timestamp.hh"

#include <nlohmann/json.hpp>

namespace icdn {
namespace {

const std::string jws_header{R"({"alg":"HS256","typ":"JWT"})"};

std::string claim_as_string(const nlohmann::json& claim)
{
	if (claim.is_string())
		return claim.get<std::string>();
	if (claim.is_number())
		return claim.dump();
	return {};
}

}

Authentication::Authentication(std::string secret) : m_secret{std::move(secret)}
{
}

std::string Authentication::sign(std::string_view header_payload) const
{
	auto mac = hmac_sha256(m_secret, header_payload);
	return base64url_encode({reinterpret_cast<const char*>(mac.data()), mac.size()});
}

std::string Authentication::issue(std::string_view subject, std::chrono::seconds lifetime) const
{
	auto now = Timestamp::now().unix_seconds();
	nlohmann::json payload{
		{"sub", std::string{subject}},
		{"iat", now},
		{"exp", now + lifetime.count()}
	};

	auto signing_input = base64url_encode(jws_header) + '.' + base64url_encode(payload.dump());
	return signing_input + '.' + sign(signing_input);
}

std::string Authentication::verify(std::string_view token, std::error_code& ec) const
{
	ec = Error::unauthorized;

	// Without a secret no token can be trusted.
	if (!enabled())
		return {};

	auto dot = token.rfind('.');
	if (dot == token.npos)
		return {};

	auto signing_input = token.substr(0, dot);
	if (!secure_equal(sign(signing_input), token.substr(dot+1)))
		return {};

	auto [header_b64, payload_b64] = tokenize<2>(signing_input, ".");
	auto header  = base64url_decode(header_b64);
	auto payload = base64url_decode(payload_b64);
	if (!header || !payload)
		return {};

	auto header_json  = nlohmann::json::parse(*header, nullptr, false);
	auto payload_json = nlohmann::json::parse(*payload, nullptr, false);
	if (!header_json.is_object() || !payload_json.is_object())
		return {};

	if (auto alg = header_json.find("alg"); alg == header_json.end() || !alg->is_string() || *alg != "HS256")
		return {};

	if (auto exp = payload_json.find("exp"); exp != payload_json.end())
	{
		if (!exp->is_number() || exp->get<std::int64_t>() <= Timestamp::now().unix_seconds())
			return {};
	}

	for (auto&& field : {"sub", "id", "userId"})
	{
		if (auto claim = payload_json.find(field); claim != payload_json.end())
		{
			if (auto subject = claim_as_string(*claim); !subject.empty())
			{
				ec.clear();
				return subject;
			}
		}
	}
	return {};
}

std::string Authentication::verify_header(std::string_view authorization, std::error_code& ec) const
{
	static const std::string_view bearer{"Bearer "};

	authorization = trim(authorization);
	if (authorization.size() <= bearer.size() ||
		to_lower(authorization.substr(0, bearer.size())) != "bearer ")
	{
		ec = Error::unauthorized;
		return {};
	}

	return verify(trim(authorization.substr(bearer.size())), ec);
}

} // end of namespace
