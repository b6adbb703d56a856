/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "common/TestImages.hh"

#include "image/ImageTransform.hh"
#include "util/Error.hh"

#include <opencv2/imgcodecs.hpp>

using namespace icdn;

TEST_CASE("contain within a bounding box", "[normal]")
{
	REQUIRE(ImageTransform::contain({1000, 500}, 300, 300) == cv::Size{300, 150});
	REQUIRE(ImageTransform::contain({500, 1000}, 300, 300) == cv::Size{150, 300});
	REQUIRE(ImageTransform::contain({4000, 3000}, 1920, 1080) == cv::Size{1440, 1080});

	// never upscale
	REQUIRE(ImageTransform::contain({100, 50}, 300, 300) == cv::Size{100, 50});
	REQUIRE(ImageTransform::contain({300, 300}, 300, 300) == cv::Size{300, 300});

	// at least one pixel
	REQUIRE(ImageTransform::contain({10000, 1}, 100, 100) == cv::Size{100, 1});
}

TEST_CASE("render renditions", "[normal]")
{
	ImageTransform subject;
	auto original = random_image_bytes(800, 600, ".png");
	REQUIRE_FALSE(original.empty());

	std::error_code ec;

	SECTION("downscale to every format")
	{
		for (auto format : {ImageFormat::jpeg, ImageFormat::png, ImageFormat::webp})
		{
			auto ext = "." + std::string{to_string(format)};
			if (!cv::haveImageWriter(ext))
				continue;

			INFO("format = " << to_string(format));
			auto out = subject.render(buffer_view(original), VariantSpec{300, 300, format}, ec);
			REQUIRE(!ec);
			REQUIRE(decoded_size(out) == cv::Size{300, 225});
		}
	}
	SECTION("small images are not enlarged")
	{
		auto small = random_image_bytes(120, 80, ".jpg");
		auto out = subject.render(buffer_view(small), VariantSpec{1920, 1080, ImageFormat::png}, ec);
		REQUIRE(!ec);
		REQUIRE(decoded_size(out) == cv::Size{120, 80});
	}
	SECTION("alpha channel")
	{
		auto rgba = random_image_bytes(400, 400, ".png", CV_8UC4);
		auto info = ImageTransform::probe(buffer_view(rgba));
		REQUIRE(info.has_value());
		REQUIRE(info->has_alpha);
		REQUIRE(info->channels == 4);

		auto png = subject.render(buffer_view(rgba), VariantSpec{150, 150, ImageFormat::png}, ec);
		REQUIRE(!ec);
		REQUIRE(cv::imdecode(png, cv::IMREAD_UNCHANGED).channels() == 4);

		// dropped for JPEG
		auto jpeg = subject.render(buffer_view(rgba), VariantSpec{150, 150, ImageFormat::jpeg}, ec);
		REQUIRE(!ec);
		REQUIRE(cv::imdecode(jpeg, cv::IMREAD_UNCHANGED).channels() == 3);
	}
	SECTION("16-bit originals")
	{
		auto deep = random_image_bytes(200, 100, ".png", CV_16UC3);
		auto out = subject.render(buffer_view(deep), VariantSpec{100, 100, ImageFormat::jpeg}, ec);
		REQUIRE(!ec);
		REQUIRE(decoded_size(out) == cv::Size{100, 50});
	}
	SECTION("count renders")
	{
		auto before = subject.render_count();
		subject.render(buffer_view(original), VariantSpec{150, 150, ImageFormat::png}, ec);
		subject.render(buffer_view(original), VariantSpec{150, 150, ImageFormat::png}, ec);
		REQUIRE(subject.render_count() == before + 2);
	}
}

TEST_CASE("probe originals", "[normal]")
{
	auto jpeg = random_image_bytes(640, 480, ".jpg");
	auto info = ImageTransform::probe(buffer_view(jpeg));
	REQUIRE(info.has_value());
	REQUIRE(info->width == 640);
	REQUIRE(info->height == 480);
	REQUIRE(info->channels == 3);
	REQUIRE_FALSE(info->has_alpha);

	std::string svg{R"(<svg xmlns="http://www.w3.org/2000/svg" width="10" height="10"/>)"};
	REQUIRE_FALSE(ImageTransform::probe(buffer_view(svg)).has_value());
	REQUIRE_FALSE(ImageTransform::probe(buffer_view("")).has_value());
}

TEST_CASE("undecodable originals", "[error]")
{
	ImageTransform subject;
	std::error_code ec;

	subject.render(buffer_view("not an image"), VariantSpec{150, 150, ImageFormat::png}, ec);
	REQUIRE(ec == Error::decode_error);

	// truncated
	auto png = random_image_bytes(100, 100, ".png");
	png.resize(40);
	subject.render(buffer_view(png), VariantSpec{150, 150, ImageFormat::png}, ec);
	REQUIRE(ec == Error::decode_error);

	REQUIRE(subject.render_count() == 2);
}
