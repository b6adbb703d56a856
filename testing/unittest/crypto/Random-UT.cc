/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "crypto/Blake2.hh"
#include "crypto/EVPWrapper.hh"
#include "crypto/Random.hh"
#include "util/Escape.hh"

#include <future>
#include <set>

using namespace icdn;

TEST_CASE("Test random number", "[normal]")
{
	auto rand = secure_random_array<std::uint64_t, 2>();
	REQUIRE(rand != secure_random_array<std::uint64_t, 2>());
}

TEST_CASE("random UUIDs", "[normal]")
{
	std::set<std::string> ids;
	for (int i = 0; i < 100; i++)
	{
		auto id = uuid_v4();
		INFO("UUID = " << id);
		REQUIRE(is_uuid(id));
		REQUIRE(id[14] == '4');
		REQUIRE(std::string_view{"89ab"}.find(id[19]) != std::string_view::npos);
		ids.insert(id);
	}
	REQUIRE(ids.size() == 100);

	// from different threads
	auto fut1 = std::async(std::launch::async, []{return uuid_v4();});
	auto fut2 = std::async(std::launch::async, []{return uuid_v4();});
	REQUIRE(fut1.get() != fut2.get());
}

TEST_CASE("recognize UUIDs", "[normal]")
{
	REQUIRE(is_uuid("3b241101-e2bb-4255-8caf-4136c566a962"));
	REQUIRE(is_uuid("3B241101-E2BB-4255-8CAF-4136C566A962"));
	REQUIRE_FALSE(is_uuid("3b241101e2bb42558caf4136c566a962"));
	REQUIRE_FALSE(is_uuid("3b241101-e2bb-4255-8caf-4136c566a96"));
	REQUIRE_FALSE(is_uuid("3b241101-e2bb-4255-8caf-4136c566a96g"));
	REQUIRE_FALSE(is_uuid("../../../../etc/passwd-aaaa-aaaaaaaa"));
	REQUIRE_FALSE(is_uuid(""));
}

TEST_CASE("HMAC-SHA256 of RFC 4231", "[normal]")
{
	// test case 2
	auto mac = hmac_sha256("Jefe", "what do ya want for nothing?");
	REQUIRE(to_hex(mac) == "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

	REQUIRE(sha256_hex(buffer_view("")) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("constant time comparison", "[normal]")
{
	REQUIRE(secure_equal("abc", "abc"));
	REQUIRE_FALSE(secure_equal("abc", "abd"));
	REQUIRE_FALSE(secure_equal("abc", "abcd"));
	REQUIRE(secure_equal("", ""));
}

TEST_CASE("entity tags", "[normal]")
{
	auto tag = etag(buffer_view("image content"));
	INFO("etag = " << tag);
	REQUIRE(tag.size() == Blake2::size * 2 + 2);
	REQUIRE(tag.front() == '"');
	REQUIRE(tag.back() == '"');
	REQUIRE(tag == etag(buffer_view("image content")));
	REQUIRE(tag != etag(buffer_view("image content!")));
}
