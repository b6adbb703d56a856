/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <catch2/catch.hpp>

#include "storage/StorageBackend.hh"
#include "util/Error.hh"

#include <algorithm>

namespace icdn {

/// Behaviour shared by every StorageBackend, checked against an empty disk.
/// Catch runs the caller again for each SECTION, so it must pass a new disk every time.
inline void check_backend_contract(StorageBackend& disk)
{
	using namespace std::chrono_literals;

	std::string content{"not really an image"};
	std::error_code ec;

	REQUIRE_FALSE(disk.exists("images/a.png"));

	disk.write("images/a.png", buffer_view(content), WriteOptions{"image/png"}, ec);
	REQUIRE(!ec);
	REQUIRE(disk.exists("images/a.png"));

	auto blob = disk.read("images/a.png", ec);
	REQUIRE(!ec);
	REQUIRE(std::string(blob.begin(), blob.end()) == content);

	auto meta = disk.stat("images/a.png", ec);
	REQUIRE(!ec);
	REQUIRE(meta.size == content.size());
	REQUIRE(disk.size("images/a.png", ec) == content.size());
	REQUIRE(!ec);

	// overwrite
	disk.write("images/a.png", buffer_view("shorter"), {}, ec);
	REQUIRE(!ec);
	REQUIRE(disk.size("images/a.png", ec) == 7);

	disk.copy("images/a.png", "images/b.png", ec);
	REQUIRE(!ec);
	REQUIRE(disk.exists("images/a.png"));
	REQUIRE(disk.exists("images/b.png"));

	disk.move("images/b.png", "other/c.png", ec);
	REQUIRE(!ec);
	REQUIRE_FALSE(disk.exists("images/b.png"));
	REQUIRE(disk.exists("other/c.png"));

	disk.write("images/d.png", buffer_view("d"), {}, ec);
	disk.write("images/e.png", buffer_view("e"), {}, ec);
	REQUIRE(!ec);

	auto listing = disk.list("images/", ec);
	REQUIRE(!ec);
	std::sort(listing.begin(), listing.end());
	REQUIRE(listing == std::vector<std::string>{"images/a.png", "images/d.png", "images/e.png"});

	REQUIRE(disk.list("nothing/", ec).empty());
	REQUIRE(!ec);

	REQUIRE_FALSE(disk.url("images/a.png").empty());
	REQUIRE_FALSE(disk.temporary_url("images/a.png", 60s, ec).empty());
	REQUIRE(!ec);

	SECTION("missing objects")
	{
		disk.read("images/none.png", ec);
		REQUIRE(ec == Error::object_not_exist);

		disk.stat("images/none.png", ec);
		REQUIRE(ec == Error::object_not_exist);

		ec.clear();
		disk.copy("images/none.png", "images/f.png", ec);
		REQUIRE(ec);
		REQUIRE_FALSE(disk.exists("images/f.png"));

		REQUIRE_FALSE(disk.remove("images/none.png"));
	}
	SECTION("remove")
	{
		REQUIRE(disk.remove("images/a.png"));
		REQUIRE_FALSE(disk.exists("images/a.png"));
		REQUIRE_FALSE(disk.remove("images/a.png"));
	}
	SECTION("paths escaping the disk are rejected")
	{
		for (auto path : {"../a.png", "/etc/passwd", "images/../../a.png", "images\\a.png", ""})
		{
			INFO("path = \"" << path << "\"");
			disk.read(path, ec);
			REQUIRE(ec == Error::invalid_path);

			ec.clear();
			disk.write(path, buffer_view(content), {}, ec);
			REQUIRE(ec == Error::invalid_path);

			REQUIRE_FALSE(disk.exists(path));
			REQUIRE_FALSE(disk.remove(path));
		}
	}
}

} // end of namespace
