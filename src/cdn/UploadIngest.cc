/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "UploadIngest.hh"

#include "OriginalIndex.hh"

#include "crypto/Random.hh"
#include "storage/StorageRouter.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/FS.hh"
#include "util/Log.hh"
#include "util/Magic.hh"

#include <algorithm>
#include <array>

namespace icdn {
namespace {

const std::array<std::string_view, 8> allowed_types{
	"jpeg", "jpg", "png", "gif", "webp", "svg", "bmp", "tiff"
};

}

UploadIngest::UploadIngest(StorageRouter& router, OriginalIndex& index, std::size_t limit) :
	m_router{router}, m_index{index}, m_limit{limit}
{
}

bool UploadIngest::is_allowed(std::string_view extension, std::string_view mime)
{
	auto ext = to_lower(extension);
	auto type = to_lower(mime);

	// The MIME type only needs to mention the type, e.g. "image/svg+xml" or "image/x-ms-bmp".
	return std::find(allowed_types.begin(), allowed_types.end(), ext) != allowed_types.end() &&
		std::any_of(allowed_types.begin(), allowed_types.end(), [&type](auto t){return type.find(t) != type.npos;});
}

UploadedImage UploadIngest::ingest(
	BufferView data,
	std::string_view original_name,
	std::string_view mime,
	std::string_view disk,
	std::string_view subject,
	std::error_code& ec
)
{
	if (data.size() == 0 || data.size() > m_limit)
	{
		Log(LOG_INFO, "rejected upload \"%1%\" of %2% bytes", original_name, data.size());
		ec = Error::validation_failed;
		return {};
	}

	// Browsers send application/octet-stream for types they don't know.
	std::string content_type{mime};
	if (content_type.empty() || content_type == "application/octet-stream")
		content_type = Magic::instance().mime(data);

	auto ext = fs::path{std::string{original_name}}.extension().string();
	if (ext.size() < 2 || !is_allowed(ext.substr(1), content_type))
	{
		Log(LOG_INFO, "rejected upload \"%1%\" of type %2%", original_name, content_type);
		ec = Error::validation_failed;
		return {};
	}

	auto backend = m_router.find(disk);
	if (!backend)
	{
		ec = Error::disk_not_configured;
		return {};
	}

	UploadedImage result;
	result.id               = uuid_v4();
	result.original_name    = original_name;
	result.filename         = result.id + ext;
	result.path             = "images/" + result.filename;
	result.size             = data.size();
	result.mime             = content_type;
	result.disk             = disk.empty() ? m_router.default_disk() : std::string{disk};
	result.uploaded_by      = subject;

	backend->write(result.path, data, WriteOptions{content_type}, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot write %1% to disk %2%: %3% (%4%)", result.path, result.disk, ec, ec.message());
		return {};
	}

	atomic_write(m_index.directory() / result.filename, data, ec);
	if (ec)
	{
		// The working copy is the one we render from. Without it the upload is useless.
		Log(LOG_WARNING, "cannot write working copy of %1%: %2% (%3%)", result.id, ec, ec.message());
		backend->remove(result.path);
		return {};
	}

	m_index.insert(result.id, result.filename);

	result.uploaded_at  = Timestamp::now();
	result.url          = backend->url(result.path);

	Log(LOG_INFO, "%1% uploaded \"%2%\" (%3% bytes) as %4% to disk %5%", subject, original_name, result.size, result.id, result.disk);
	return result;
}

} // end of namespace
