/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "net/Multipart.hh"
#include "util/Error.hh"

using namespace icdn;

namespace {

const std::string content_type{"multipart/form-data; boundary=----WebKitFormBoundary7MA4YWxkTrZu0gW"};

const std::string body{
	"preamble is ignored\r\n"
	"------WebKitFormBoundary7MA4YWxkTrZu0gW\r\n"
	"Content-Disposition: form-data; name=\"disk\"\r\n"
	"\r\n"
	"s3\r\n"
	"------WebKitFormBoundary7MA4YWxkTrZu0gW\r\n"
	"Content-Disposition: form-data; name=\"image\"; filename=\"cat photo.png\"\r\n"
	"Content-Type: image/png\r\n"
	"\r\n"
	"\x89PNG\r\n\x1a\n\r\n--not the boundary\r\n"
	"------WebKitFormBoundary7MA4YWxkTrZu0gW--\r\n"
};

}

TEST_CASE("parse multipart form", "[normal]")
{
	std::error_code ec;
	Multipart subject{content_type, body, ec};
	REQUIRE(!ec);
	REQUIRE(subject.parts().size() == 2);

	auto disk = subject.find("disk");
	REQUIRE(disk.has_value());
	REQUIRE(disk->data == "s3");
	REQUIRE(disk->filename.empty());

	auto image = subject.find("image");
	REQUIRE(image.has_value());
	REQUIRE(image->filename == "cat photo.png");
	REQUIRE(image->content_type == "image/png");
	REQUIRE(image->data == "\x89PNG\r\n\x1a\n\r\n--not the boundary");

	REQUIRE_FALSE(subject.find("other").has_value());
}

TEST_CASE("multipart boundary", "[normal]")
{
	REQUIRE(Multipart::boundary("multipart/form-data; boundary=abc") == std::optional<std::string_view>{"abc"});
	REQUIRE(Multipart::boundary("Multipart/Form-Data;boundary=\"a b\"") == std::optional<std::string_view>{"a b"});
	REQUIRE_FALSE(Multipart::boundary("multipart/form-data").has_value());
	REQUIRE_FALSE(Multipart::boundary("application/json; boundary=abc").has_value());
	REQUIRE_FALSE(Multipart::boundary("multipart/form-data; boundary=" + std::string(71, 'x')).has_value());
}

TEST_CASE("malformed multipart form", "[error]")
{
	std::error_code ec;

	SECTION("not multipart")
	{
		Multipart subject{"application/octet-stream", body, ec};
		REQUIRE(ec == Error::validation_failed);
		REQUIRE(subject.parts().empty());
	}
	SECTION("truncated")
	{
		Multipart subject{content_type, body.substr(0, body.size() - 50), ec};
		REQUIRE(ec == Error::validation_failed);
		REQUIRE(subject.parts().empty());
	}
	SECTION("part without disposition")
	{
		Multipart subject{
			"multipart/form-data; boundary=xyz",
			"--xyz\r\nContent-Type: text/plain\r\n\r\nhello\r\n--xyz--",
			ec
		};
		REQUIRE(ec == Error::validation_failed);
	}
	SECTION("no parts")
	{
		Multipart subject{"multipart/form-data; boundary=xyz", "--xyz--", ec};
		REQUIRE(!ec);
		REQUIRE(subject.parts().empty());
	}
}
