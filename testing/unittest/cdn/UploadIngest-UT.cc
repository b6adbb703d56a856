/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include <catch2/catch.hpp>

#include "common/TestImages.hh"

#include "cdn/OriginalIndex.hh"
#include "cdn/UploadIngest.hh"
#include "crypto/Random.hh"
#include "storage/LocalBackend.hh"
#include "storage/StorageRouter.hh"
#include "util/Error.hh"

using namespace icdn;

class UploadIngestFixture
{
protected:
	UploadIngestFixture()
	{
		m_router.add("archive", std::make_unique<LocalBackend>(m_root / "archive", "/archive"));
	}

protected:
	fs::path        m_root{clean_test_dir("upload_ingest")};
	StorageRouter   m_router{std::make_unique<LocalBackend>(m_root / "storage", "/storage")};
	OriginalIndex   m_index{m_root / "uploads"};
	UploadIngest    m_subject{m_router, m_index, 64 * 1024};
};

TEST_CASE_METHOD(UploadIngestFixture, "ingest an upload", "[normal]")
{
	auto png = random_image_bytes(32, 32, ".png");

	std::error_code ec;
	auto image = m_subject.ingest(buffer_view(png), "cat.png", "image/png", "", "alice", ec);
	REQUIRE(!ec);

	REQUIRE(is_uuid(image.id));
	REQUIRE(image.original_name == "cat.png");
	REQUIRE(image.filename == image.id + ".png");
	REQUIRE(image.path == "images/" + image.id + ".png");
	REQUIRE(image.size == png.size());
	REQUIRE(image.mime == "image/png");
	REQUIRE(image.disk == "local");
	REQUIRE(image.uploaded_by == "alice");
	REQUIRE(image.url == "/storage/images/" + image.id + ".png");
	REQUIRE(image.uploaded_at.time_since_epoch().count() > 0);

	// both the disk and the working directory have the original
	REQUIRE(m_router.disk().read(image.path, ec) == png);
	REQUIRE(fs::file_size(m_root / "uploads" / image.filename) == png.size());
	REQUIRE(m_index.find(image.id) == std::optional<std::string>{image.filename});

	SECTION("each upload has its own ID")
	{
		auto again = m_subject.ingest(buffer_view(png), "cat.png", "image/png", "", "alice", ec);
		REQUIRE(!ec);
		REQUIRE(again.id != image.id);
		REQUIRE(m_index.size() == 2);
	}
}

TEST_CASE_METHOD(UploadIngestFixture, "ingest to a named disk", "[normal]")
{
	auto jpeg = random_image_bytes(32, 32, ".jpg");

	std::error_code ec;
	auto image = m_subject.ingest(buffer_view(jpeg), "Photo.JPG", "image/jpeg", "archive", "bob", ec);
	REQUIRE(!ec);
	REQUIRE(image.disk == "archive");
	REQUIRE(image.filename == image.id + ".JPG");
	REQUIRE(image.url == "/archive/images/" + image.id + ".JPG");
	REQUIRE(m_router.disk("archive").exists(image.path));
	REQUIRE_FALSE(m_router.disk("local").exists(image.path));
}

TEST_CASE_METHOD(UploadIngestFixture, "sniff the type of generic uploads", "[normal]")
{
	auto png = random_image_bytes(16, 16, ".png");

	std::error_code ec;
	auto image = m_subject.ingest(buffer_view(png), "icon.png", "application/octet-stream", "", "alice", ec);
	REQUIRE(!ec);
	REQUIRE(image.mime == "image/png");

	// a text file in disguise
	m_subject.ingest(buffer_view("just some text"), "fake.png", "", "", "alice", ec);
	REQUIRE(ec == Error::validation_failed);
}

TEST_CASE_METHOD(UploadIngestFixture, "rejected uploads", "[error]")
{
	auto png = random_image_bytes(16, 16, ".png");
	std::error_code ec;

	SECTION("empty")
	{
		m_subject.ingest(buffer_view(""), "cat.png", "image/png", "", "alice", ec);
		REQUIRE(ec == Error::validation_failed);
	}
	SECTION("too large")
	{
		std::vector<unsigned char> large(m_subject.limit() + 1, 0xff);
		m_subject.ingest(buffer_view(large), "cat.png", "image/png", "", "alice", ec);
		REQUIRE(ec == Error::validation_failed);
	}
	SECTION("not an image extension")
	{
		m_subject.ingest(buffer_view(png), "cat.exe", "image/png", "", "alice", ec);
		REQUIRE(ec == Error::validation_failed);

		m_subject.ingest(buffer_view(png), "cat", "image/png", "", "alice", ec);
		REQUIRE(ec == Error::validation_failed);
	}
	SECTION("not an image type")
	{
		m_subject.ingest(buffer_view(png), "cat.png", "text/html", "", "alice", ec);
		REQUIRE(ec == Error::validation_failed);
	}
	SECTION("unknown disk")
	{
		m_subject.ingest(buffer_view(png), "cat.png", "image/png", "nowhere", "alice", ec);
		REQUIRE(ec == Error::disk_not_configured);
	}

	// nothing is written
	REQUIRE(m_index.size() == 0);
	REQUIRE(m_router.disk().list("images/", ec).empty());
}

TEST_CASE("allowed image types", "[normal]")
{
	REQUIRE(UploadIngest::is_allowed("png", "image/png"));
	REQUIRE(UploadIngest::is_allowed("JPG", "image/jpeg"));
	REQUIRE(UploadIngest::is_allowed("svg", "image/svg+xml"));
	REQUIRE(UploadIngest::is_allowed("bmp", "image/x-ms-bmp"));
	REQUIRE(UploadIngest::is_allowed("tiff", "image/tiff"));
	REQUIRE_FALSE(UploadIngest::is_allowed("pdf", "application/pdf"));
	REQUIRE_FALSE(UploadIngest::is_allowed("png", "text/plain"));
	REQUIRE_FALSE(UploadIngest::is_allowed("", "image/png"));
}
