/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "ImageService.hh"

#include "crypto/Random.hh"
#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Log.hh"

namespace icdn {

ImageService::ImageService(const Configuration& cfg) :
	ImageService{StorageRouter{cfg}, cfg.working_path(), cfg.cache_path(), cfg.upload_limit()}
{
}

ImageService::ImageService(StorageRouter&& router, const fs::path& working_path, const fs::path& cache_path, std::size_t upload_limit) :
	m_router{std::move(router)},
	m_working{working_path, ""},
	m_index{working_path},
	m_cache{cache_path},
	m_ingest{m_router, m_index, upload_limit}
{
}

UploadedImage ImageService::upload(
	BufferView data,
	std::string_view original_name,
	std::string_view mime,
	std::string_view disk,
	std::string_view subject,
	std::error_code& ec
)
{
	return m_ingest.ingest(data, original_name, mime, disk, subject, ec);
}

MMap ImageService::original(std::string_view id, std::error_code& ec) const
{
	auto path = m_index.path(id);
	if (!path)
	{
		ec = Error::object_not_exist;
		return {};
	}

	auto file = MMap::open(*path, ec);
	if (ec == std::errc::no_such_file_or_directory)
		ec = Error::object_not_exist;
	return file;
}

Blob ImageService::variant(std::string_view id, const VariantSpec& spec, std::error_code& ec)
{
	auto original_file = original(id, ec);
	if (ec)
		return {};

	auto key = cache_key(id, spec);
	if (m_cache.has(key))
	{
		auto cached = m_cache.get(key, ec);
		if (!ec)
		{
			Log(LOG_DEBUG, "serving %1% from cache", key);
			return cached;
		}

		// e.g. purged after has() returned true
		Log(LOG_DEBUG, "cannot read cached %1%: %2% (%3%)", key, ec, ec.message());
		ec.clear();
	}

	Log(LOG_INFO, "rendering %1%", key);
	auto result = m_transform.render(original_file.buffer(), spec, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot render %1%: %2% (%3%)", key, ec, ec.message());
		return {};
	}

	store_variant(key, buffer_view(result));
	return result;
}

void ImageService::store_variant(std::string_view key, BufferView data)
{
	// The rendition is served even if it cannot be cached. We will render it again next time.
	std::error_code ec;
	m_cache.put(key, data, ec);
	if (ec)
		Log(LOG_WARNING, "cannot store %1% in cache: %2% (%3%)", key, ec, ec.message());
}

OriginalImage ImageService::info(std::string_view id, std::error_code& ec) const
{
	auto filename = m_index.find(id);
	if (!filename)
	{
		ec = Error::object_not_exist;
		return {};
	}

	OriginalImage result;
	result.id       = id;
	result.filename = *filename;
	result.meta     = m_working.stat(*filename, ec);
	if (ec)
		return {};

	auto file = MMap::open(m_index.directory() / *filename, ec);
	if (ec)
		return {};

	result.info = ImageTransform::probe(file.buffer());

	// "image/png" -> "png"
	auto slash = result.meta.mime.find('/');
	result.format = slash != std::string::npos ? result.meta.mime.substr(slash+1) : result.meta.mime;
	return result;
}

std::vector<OriginalImage> ImageService::list() const
{
	std::vector<OriginalImage> result;
	for (auto&& entry : m_index.entries())
	{
		std::error_code ec;
		auto meta = m_working.stat(entry.filename, ec);
		if (ec)
		{
			Log(LOG_WARNING, "cannot stat working copy %1%: %2% (%3%)", entry.filename, ec, ec.message());
			continue;
		}
		result.push_back({entry.id, entry.filename, std::move(meta), std::nullopt, {}});
	}
	return result;
}

void ImageService::remove(std::string_view id, std::string_view disk, std::error_code& ec)
{
	auto backend = m_router.find(disk);
	if (!backend)
	{
		ec = Error::disk_not_configured;
		return;
	}

	// The original has the same filename in the disk and the working directory.
	// Without the working copy we have to look for it in the disk.
	std::vector<std::string> paths;
	if (auto filename = m_index.find(id))
		paths.push_back("images/" + *filename);
	else if (is_uuid(id))
	{
		std::error_code list_ec;
		for (auto&& path : backend->list("images/" + std::string{id}, list_ec))
		{
			if (fs::path{path}.stem().string() == id)
				paths.push_back(path);
		}
		if (list_ec)
			Log(LOG_WARNING, "cannot list disk for %1%: %2% (%3%)", id, list_ec, list_ec.message());
	}

	for (auto&& path : paths)
	{
		if (backend->remove(path))
			Log(LOG_INFO, "removed %1% from disk", path);
	}

	if (auto filename = m_index.find(id))
	{
		m_index.erase(id);
		m_working.remove(*filename);
	}

	auto purged = m_cache.purge(id);
	Log(LOG_INFO, "deleted image %1%: %2% renditions purged", id, purged);
	ec.clear();
}

nlohmann::json ImageService::preset_urls(std::string_view id)
{
	auto base = "/api/image/" + std::string{id};
	return {
		{"original",  base},
		{"thumbnail", base + "/thumbnail/jpeg"},
		{"small",     base + "/300x300/webp"},
		{"medium",    base + "/800x800/webp"},
		{"large",     base + "/1920x1080/webp"}
	};
}

} // end of namespace
