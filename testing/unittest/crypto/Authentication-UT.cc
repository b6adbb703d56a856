/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "crypto/Authentication.hh"
#include "crypto/EVPWrapper.hh"
#include "util/Error.hh"
#include "util/Escape.hh"

using namespace icdn;
using namespace std::literals;

namespace {

// Signs an arbitrary payload the way a third party issuer does.
std::string make_token(std::string_view secret, std::string_view header, std::string_view payload)
{
	auto input = base64url_encode(header) + '.' + base64url_encode(payload);
	auto mac = hmac_sha256(secret, input);
	return input + '.' + base64url_encode({reinterpret_cast<const char*>(mac.data()), mac.size()});
}

}

TEST_CASE("issued token round-trip", "[normal]")
{
	Authentication subject{"secret"};
	REQUIRE(subject.enabled());

	auto token = subject.issue("alice", 600s);
	INFO("token is " << token);

	std::error_code ec;
	REQUIRE(subject.verify(token, ec) == "alice");
	REQUIRE(!ec);

	REQUIRE(subject.verify_header("Bearer " + token, ec) == "alice");
	REQUIRE(!ec);
	REQUIRE(subject.verify_header("  bearer   " + token + " ", ec) == "alice");
	REQUIRE(!ec);
}

TEST_CASE("rejected tokens", "[error]")
{
	Authentication subject{"secret"};
	std::error_code ec;

	SECTION("signed by another secret")
	{
		auto token = Authentication{"other"}.issue("alice", 600s);
		REQUIRE(subject.verify(token, ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
	SECTION("expired")
	{
		auto token = subject.issue("alice", -10s);
		REQUIRE(subject.verify(token, ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
	SECTION("tampered payload")
	{
		auto token = subject.issue("alice", 600s);
		auto [header, payload, signature] = tokenize<3>(std::string_view{token}, ".");
		auto forged = std::string{header} + '.' + base64url_encode(R"({"sub":"mallory"})") + '.' + std::string{signature};
		REQUIRE(subject.verify(forged, ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
	SECTION("wrong algorithm")
	{
		auto token = make_token("secret", R"({"alg":"none"})", R"({"sub":"alice"})");
		REQUIRE(subject.verify(token, ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
	SECTION("algorithm is not a string")
	{
		auto token = make_token("secret", R"({"alg":5,"typ":"JWT"})", R"({"sub":"alice"})");
		REQUIRE_NOTHROW(subject.verify(token, ec));
		REQUIRE(subject.verify(token, ec).empty());
		REQUIRE(ec == Error::unauthorized);

		ec.clear();
		token = make_token("secret", R"({"typ":"JWT"})", R"({"sub":"alice"})");
		REQUIRE(subject.verify(token, ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
	SECTION("no subject")
	{
		auto token = make_token("secret", R"({"alg":"HS256"})", R"({"name":"alice"})");
		REQUIRE(subject.verify(token, ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
	SECTION("malformed")
	{
		for (auto token : {"", "abc", "a.b.c", "Bearer"})
		{
			INFO("token = " << token);
			ec.clear();
			REQUIRE(subject.verify(token, ec).empty());
			REQUIRE(ec == Error::unauthorized);
		}
	}
	SECTION("not a bearer token")
	{
		REQUIRE(subject.verify_header("Basic YWxpY2U6c2VjcmV0", ec).empty());
		REQUIRE(ec == Error::unauthorized);

		ec.clear();
		REQUIRE(subject.verify_header("", ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
	SECTION("no secret configured")
	{
		Authentication disabled{""};
		REQUIRE_FALSE(disabled.enabled());
		REQUIRE(disabled.verify(make_token("", R"({"alg":"HS256"})", R"({"sub":"alice"})"), ec).empty());
		REQUIRE(ec == Error::unauthorized);
	}
}

TEST_CASE("tokens of other issuers", "[normal]")
{
	Authentication subject{"secret"};
	std::error_code ec;

	SECTION("numeric user id")
	{
		auto token = make_token("secret", R"({"alg":"HS256","typ":"JWT"})", R"({"userId":42})");
		REQUIRE(subject.verify(token, ec) == "42");
		REQUIRE(!ec);
	}
	SECTION("id claim without expiry")
	{
		auto token = make_token("secret", R"({"alg":"HS256"})", R"({"id":"bob"})");
		REQUIRE(subject.verify(token, ec) == "bob");
		REQUIRE(!ec);
	}
}
