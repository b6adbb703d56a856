/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "DerivativeCache.hh"
#include "OriginalIndex.hh"
#include "UploadIngest.hh"

#include "image/ImageTransform.hh"
#include "image/VariantSpec.hh"
#include "storage/LocalBackend.hh"
#include "storage/StorageRouter.hh"
#include "util/MMap.hh"

#include <nlohmann/json.hpp>

#include <optional>

namespace icdn {

class Configuration;

/// Working copy of an original and its properties.
struct OriginalImage
{
	std::string     id;
	std::string     filename;
	ObjectMeta      meta;
	std::optional<ImageInfo> info;  //!< std::nullopt if it cannot be decoded, e.g. SVG
	std::string     format;         //!< from the MIME type, e.g. "png" or "svg+xml"
};

/// \brief  The image pipeline and everything it needs.
///
/// It is created once at start-up and shared by all requests.
class ImageService
{
public:
	explicit ImageService(const Configuration& cfg);
	ImageService(StorageRouter&& router, const fs::path& working_path, const fs::path& cache_path, std::size_t upload_limit);

	ImageService(const ImageService&) = delete;
	ImageService& operator=(const ImageService&) = delete;

	UploadedImage upload(
		BufferView data,
		std::string_view original_name,
		std::string_view mime,
		std::string_view disk,
		std::string_view subject,
		std::error_code& ec
	);

	/// Memory map of the working copy. Fails with Error::object_not_exist.
	MMap original(std::string_view id, std::error_code& ec) const;

	/// Serves a rendition from the cache, or renders and caches it.
	/// Failing to store it in the cache is not an error.
	Blob variant(std::string_view id, const VariantSpec& spec, std::error_code& ec);

	OriginalImage info(std::string_view id, std::error_code& ec) const;

	/// Properties of all working copies, sorted by ID. The images are not decoded.
	std::vector<OriginalImage> list() const;

	/// Removes the original from \a disk and the working directory, and purges its renditions.
	/// Nothing to remove is not an error. Fails with Error::disk_not_configured if \a disk is unknown.
	void remove(std::string_view id, std::string_view disk, std::error_code& ec);

	/// Relative URLs of the original and the preset renditions.
	static nlohmann::json preset_urls(std::string_view id);

	StorageRouter& router() {return m_router;}
	const DerivativeCache& cache() const {return m_cache;}
	const ImageTransform& transform() const {return m_transform;}
	const OriginalIndex& index() const {return m_index;}

	std::size_t upload_limit() const {return m_ingest.limit();}
	Timestamp started() const {return m_started;}

private:
	void store_variant(std::string_view key, BufferView data);

private:
	StorageRouter   m_router;
	LocalBackend    m_working;
	OriginalIndex   m_index;
	DerivativeCache m_cache;
	ImageTransform  m_transform;
	UploadIngest    m_ingest;

	Timestamp m_started{Timestamp::now()};
};

} // end of namespace
