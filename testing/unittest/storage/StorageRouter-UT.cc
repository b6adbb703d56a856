/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "common/TestImages.hh"

#include "storage/LocalBackend.hh"
#include "storage/StorageRouter.hh"
#include "util/Configuration.hh"

using namespace icdn;

TEST_CASE("disks from configuration", "[normal]")
{
	auto base = clean_test_dir("router");

	SECTION("implicit local disk")
	{
		StorageRouter subject{Configuration{nlohmann::json::object(), base}};
		REQUIRE(subject.default_disk() == "local");
		REQUIRE(subject.names() == std::vector<std::string>{"local"});
		REQUIRE(subject.disk().driver() == "local");
		REQUIRE(&subject.disk() == &subject.disk("local"));
	}
	SECTION("named disks")
	{
		auto json = nlohmann::json::parse(R"({
			"storage": {
				"default": "archive",
				"disks": {
					"archive": {"driver": "local", "root": "archive", "url": "/archive"},
					"s3": {"driver": "s3", "bucket": "b", "key": "k", "secret": "s", "region": "ap-east-1"}
				}
			}
		})");
		StorageRouter subject{Configuration{json, base}};
		REQUIRE(subject.default_disk() == "archive");
		REQUIRE(subject.names() == std::vector<std::string>{"archive", "local", "s3"});
		REQUIRE(subject.disk().url("images/a.png") == "/archive/images/a.png");
		REQUIRE(subject.disk("s3").driver() == "s3");
		REQUIRE(subject.find("azure") == nullptr);
		REQUIRE_THROWS_AS(subject.disk("azure"), StorageRouter::DiskNotConfigured);
	}
	SECTION("default disk must exist")
	{
		auto json = nlohmann::json::parse(R"({"storage": {"default": "nowhere"}})");
		REQUIRE_THROWS_AS(StorageRouter{Configuration(json, base)}, StorageRouter::DiskNotConfigured);
	}
	SECTION("unknown driver")
	{
		auto json = nlohmann::json::parse(R"({"storage": {"disks": {"ftp": {"driver": "ftp"}}}})");
		REQUIRE_THROWS_AS(StorageRouter{Configuration(json, base)}, StorageRouter::UnknownDriver);
	}
	SECTION("incomplete driver parameters")
	{
		auto json = nlohmann::json::parse(R"({"storage": {"disks": {"s3": {"driver": "s3", "bucket": "b"}}}})");
		REQUIRE_THROWS_AS(StorageRouter{Configuration(json, base)}, Configuration::MissingParameter);
	}
}

TEST_CASE("disks added after construction", "[normal]")
{
	auto base = clean_test_dir("router_add");
	StorageRouter subject{std::make_unique<LocalBackend>(base / "local", "/storage")};

	REQUIRE(subject.find() == subject.find("local"));
	REQUIRE(subject.find("cold") == nullptr);

	subject.add("cold", std::make_unique<LocalBackend>(base / "cold", "/cold"));
	REQUIRE(subject.disk("cold").url("a.png") == "/cold/a.png");
	REQUIRE(subject.disk().url("a.png") == "/storage/a.png");
}
