/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "common/TestImages.hh"

#include "util/FS.hh"
#include "util/MMap.hh"

#include <algorithm>
#include <atomic>
#include <thread>

using namespace icdn;

TEST_CASE("atomic write", "[normal]")
{
	auto dir = clean_test_dir("atomic_write");
	auto dest = dir / "sub/dir/file.txt";

	std::error_code ec;
	atomic_write(dest, buffer_view("first"), ec);
	REQUIRE(!ec);

	auto mmap = MMap::open(dest, ec);
	REQUIRE(!ec);
	REQUIRE(mmap.string() == "first");

	SECTION("overwrite")
	{
		atomic_write(dest, buffer_view("second version"), ec);
		REQUIRE(!ec);
		REQUIRE(MMap::open(dest, ec).string() == "second version");

		// the old mapping still sees the old content
		REQUIRE(mmap.string() == "first");
	}
	SECTION("concurrent writers leave one complete file")
	{
		std::atomic<int> failures{0};
		std::vector<std::thread> writers;
		for (int i = 0; i < 8; i++)
			writers.emplace_back([&dest, &failures, i]
			{
				std::string content(4096, static_cast<char>('a' + i));
				std::error_code wec;
				atomic_write(dest, buffer_view(content), wec);
				if (wec)
					failures++;
			});
		for (auto&& t : writers)
			t.join();
		REQUIRE(failures == 0);

		auto mapped = MMap::open(dest, ec);
		REQUIRE(!ec);

		auto content = mapped.string();
		REQUIRE(content.size() == 4096);
		REQUIRE(std::count(content.begin(), content.end(), content.front()) == 4096);

		std::size_t files = 0;
		for (auto&& entry : fs::directory_iterator{dest.parent_path()})
		{
			INFO("file = " << entry.path());
			files++;
		}
		REQUIRE(files == 1);
	}
	SECTION("cannot create the parent directory")
	{
		atomic_write(dest / "under/a/file", buffer_view("x"), ec);
		REQUIRE(ec);
	}
}

TEST_CASE("open missing file", "[error]")
{
	std::error_code ec;
	auto mmap = MMap::open(clean_test_dir("mmap") / "none", ec);
	REQUIRE(ec == std::errc::no_such_file_or_directory);
	REQUIRE_FALSE(mmap.is_opened());
}
