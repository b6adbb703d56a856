/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "util/BufferView.hh"
#include "util/Timestamp.hh"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace icdn {

struct WriteOptions
{
	std::string content_type;
};

/// Metadata of a stored object, probed from the backend in one request.
struct ObjectMeta
{
	std::uint64_t   size{};
	Timestamp       last_modified{};
	std::string     mime;
};

/// \brief  Uniform interface of a storage "disk".
///
/// Paths are logical, slash separated and relative to the root of the disk, e.g. "images/abc.png".
/// Empty or absolute paths, paths with a backslash, and paths with a "." or ".." segment are
/// rejected with Error::invalid_path.
///
/// All functions may be called concurrently. Failures are reported via \a ec, except exists()
/// and remove() which collapse every failure into `false`.
class StorageBackend
{
public:
	virtual ~StorageBackend() = default;

	/// The driver name, e.g. "local", "s3", "azure" or "gcs".
	virtual std::string_view driver() const = 0;

	virtual bool exists(std::string_view path) const = 0;
	virtual Blob read(std::string_view path, std::error_code& ec) const = 0;

	/// Creates or overwrites the object at \a path.
	virtual void write(std::string_view path, BufferView data, const WriteOptions& opts, std::error_code& ec) = 0;

	/// Returns false if there is nothing to remove, or if the removal failed.
	virtual bool remove(std::string_view path) = 0;
	virtual void copy(std::string_view from, std::string_view to, std::error_code& ec) = 0;

	virtual ObjectMeta stat(std::string_view path, std::error_code& ec) const = 0;

	/// Paths of the objects whose path starts with \a prefix.
	virtual std::vector<std::string> list(std::string_view prefix, std::error_code& ec) const = 0;

	/// Public URL of \a path. It does not check whether the object exists.
	virtual std::string url(std::string_view path) const = 0;

	/// URL granting read access to \a path for \a ttl.
	/// Backends without signed URLs return url().
	virtual std::string temporary_url(std::string_view path, std::chrono::seconds ttl, std::error_code& ec) const = 0;

	/// Copy followed by remove. It is not atomic: if the copy succeeded but the source
	/// could not be removed, \a ec is Error::move_incomplete and both objects exist.
	void move(std::string_view from, std::string_view to, std::error_code& ec);

	// Each of these probes the backend independently.
	std::uint64_t size(std::string_view path, std::error_code& ec) const;
	Timestamp last_modified(std::string_view path, std::error_code& ec) const;
	std::string mime_type(std::string_view path, std::error_code& ec) const;

	static bool is_valid_path(std::string_view path);
};

} // end of namespace
