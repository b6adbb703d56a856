/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "image/VariantSpec.hh"
#include "util/Error.hh"

using namespace icdn;

TEST_CASE("presets are the same as their dimensions", "[normal]")
{
	std::error_code ec;
	for (auto&& preset : presets)
	{
		INFO("preset = " << preset.name);
		auto named = VariantSpec::parse(preset.name, "webp", ec);
		REQUIRE(!ec);

		auto explicit_size = VariantSpec::parse(
			std::to_string(preset.width) + "x" + std::to_string(preset.height), "webp", ec
		);
		REQUIRE(!ec);
		REQUIRE(named == explicit_size);
		REQUIRE(cache_key("id", named) == cache_key("id", explicit_size));
	}

	auto thumbnail = VariantSpec::parse("thumbnail", "jpeg", ec);
	REQUIRE(thumbnail == VariantSpec{150, 150, ImageFormat::jpeg});
	REQUIRE(VariantSpec::parse("large", "png", ec) == VariantSpec{1920, 1080, ImageFormat::png});
}

TEST_CASE("format tokens", "[normal]")
{
	REQUIRE(parse_format("jpg") == ImageFormat::jpeg);
	REQUIRE(parse_format("JPEG") == ImageFormat::jpeg);
	REQUIRE(parse_format("WebP") == ImageFormat::webp);
	REQUIRE(parse_format("gif") == ImageFormat::gif);
	REQUIRE(parse_format("png") == ImageFormat::png);
	REQUIRE_FALSE(parse_format("bmp").has_value());
	REQUIRE_FALSE(parse_format("").has_value());

	REQUIRE(mime(ImageFormat::jpeg) == "image/jpeg");
	REQUIRE(mime(ImageFormat::webp) == "image/webp");

	// jpg and jpeg share the same cached rendition
	std::error_code ec;
	REQUIRE(cache_key("abc", VariantSpec::parse("small", "jpg", ec)) == "abc_300x300_jpeg");
	REQUIRE(cache_key("abc", VariantSpec::parse("small", "jpeg", ec)) == "abc_300x300_jpeg");
}

TEST_CASE("custom sizes", "[normal]")
{
	REQUIRE(VariantSpec::parse_size("640x480") == std::make_pair(640, 480));
	REQUIRE(VariantSpec::parse_size("1x1") == std::make_pair(1, 1));
	REQUIRE(VariantSpec::parse_size("007x10") == std::make_pair(7, 10));

	for (auto bad : {"", "x", "640", "640x", "x480", "0x480", "640x0", "-1x10", "+1x10", "10x10x10",
		"64.0x480", "640X480", "huge", "Thumbnail", "99999999999x1", " 640x480"})
	{
		INFO("size = \"" << bad << "\"");
		REQUIRE_FALSE(VariantSpec::parse_size(bad).has_value());
	}
}

TEST_CASE("invalid variant tokens", "[error]")
{
	std::error_code ec;

	VariantSpec::parse("640x", "png", ec);
	REQUIRE(ec == Error::invalid_size);

	VariantSpec::parse("small", "bmp", ec);
	REQUIRE(ec == Error::unsupported_format);

	// size is checked first
	VariantSpec::parse("huge", "bmp", ec);
	REQUIRE(ec == Error::invalid_size);
}
