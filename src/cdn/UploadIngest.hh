/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "util/BufferView.hh"
#include "util/Timestamp.hh"

#include <string>
#include <string_view>
#include <system_error>

namespace icdn {

class OriginalIndex;
class StorageRouter;

/// Record of an uploaded original, as reported to the uploader.
struct UploadedImage
{
	std::string     id;
	std::string     original_name;
	std::string     filename;       //!< "<id><ext>", the name of the working copy
	std::string     path;           //!< "images/<id><ext>" in the disk
	std::size_t     size{};
	std::string     mime;
	std::string     disk;
	std::string     uploaded_by;
	Timestamp       uploaded_at;
	std::string     url;            //!< URL of the original in the disk
};

/// \brief  Stores uploaded originals.
///
/// Every original is written to the selected disk and to the working directory
/// of the original index, which is where the renditions are made from.
class UploadIngest
{
public:
	UploadIngest(StorageRouter& router, OriginalIndex& index, std::size_t limit);

	/// Fails with Error::validation_failed before writing anything if \a data is empty or larger
	/// than the limit, or if the extension or the MIME type is not an image type.
	/// Fails with Error::disk_not_configured if \a disk is unknown. An empty \a disk means the default one.
	UploadedImage ingest(
		BufferView data,
		std::string_view original_name,
		std::string_view mime,
		std::string_view disk,
		std::string_view subject,
		std::error_code& ec
	);

	/// Both the extension (without the dot) and the MIME type must name one of the allowed types.
	static bool is_allowed(std::string_view extension, std::string_view mime);

	std::size_t limit() const {return m_limit;}

private:
	StorageRouter&  m_router;
	OriginalIndex&  m_index;
	std::size_t     m_limit;
};

} // end of namespace
