/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "common/TestImages.hh"

#include "cdn/DerivativeCache.hh"
#include "image/VariantSpec.hh"
#include "util/Error.hh"

#include <atomic>
#include <thread>

using namespace icdn;

TEST_CASE("cached variants", "[normal]")
{
	auto root = clean_test_dir("derivative_cache");
	DerivativeCache subject{root / "cache"};

	auto key = cache_key("3b241101-e2bb-4255-8caf-4136c566a962", VariantSpec{150, 150, ImageFormat::webp});
	REQUIRE(subject.path(key) == root / "cache/3b241101-e2bb-4255-8caf-4136c566a962_150x150_webp.webp");
	REQUIRE_FALSE(subject.has(key));
	REQUIRE(subject.count() == 0);

	std::error_code ec;
	subject.get(key, ec);
	REQUIRE(ec == Error::object_not_exist);

	subject.put(key, buffer_view("rendered"), ec);
	REQUIRE(!ec);
	REQUIRE(subject.has(key));
	REQUIRE(subject.count() == 1);

	auto blob = subject.get(key, ec);
	REQUIRE(!ec);
	REQUIRE(std::string(blob.begin(), blob.end()) == "rendered");

	SECTION("purge all variants of one image")
	{
		auto other = cache_key("3b241101-e2bb-4255-8caf-4136c566a962", VariantSpec{300, 300, ImageFormat::jpeg});
		auto unrelated = cache_key("11111111-e2bb-4255-8caf-4136c566a962", VariantSpec{300, 300, ImageFormat::jpeg});
		subject.put(other, buffer_view("other"), ec);
		subject.put(unrelated, buffer_view("unrelated"), ec);
		REQUIRE(subject.count() == 3);

		REQUIRE(subject.purge("3b241101-e2bb-4255-8caf-4136c566a962") == 2);
		REQUIRE_FALSE(subject.has(key));
		REQUIRE_FALSE(subject.has(other));
		REQUIRE(subject.has(unrelated));

		REQUIRE(subject.purge("3b241101-e2bb-4255-8caf-4136c566a962") == 0);
	}
	SECTION("purge without a cache directory")
	{
		DerivativeCache none{root / "none"};
		REQUIRE(none.purge("3b241101-e2bb-4255-8caf-4136c566a962") == 0);
		REQUIRE(none.count() == 0);
	}
}

TEST_CASE("concurrent puts of the same variant", "[normal]")
{
	auto root = clean_test_dir("derivative_cache_concurrent");
	DerivativeCache subject{root};

	auto key = cache_key("3b241101-e2bb-4255-8caf-4136c566a962", VariantSpec{800, 800, ImageFormat::png});
	auto content = random_image_bytes(64, 64, ".png");

	std::atomic<int> failures{0};
	std::vector<std::thread> threads;
	for (int i = 0; i < 10; i++)
		threads.emplace_back([&]
		{
			std::error_code ec;
			subject.put(key, buffer_view(content), ec);
			if (ec)
				failures++;
		});
	for (auto&& t : threads)
		t.join();

	REQUIRE(failures == 0);
	REQUIRE(subject.count() == 1);

	std::size_t files = 0;
	for (auto&& entry : fs::directory_iterator{root})
	{
		INFO("file = " << entry.path());
		files++;
	}
	REQUIRE(files == 1);

	std::error_code ec;
	REQUIRE(subject.get(key, ec) == content);
}
