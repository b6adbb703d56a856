/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "util/BufferView.hh"
#include "util/FS.hh"

#include <string_view>
#include <system_error>

namespace icdn {

/// \brief  Directory of rendered variants.
///
/// The file of a key is "<key>.<format>", where the format is the part of the key after
/// the last underscore (see cache_key()). Entries are never evicted.
class DerivativeCache
{
public:
	explicit DerivativeCache(fs::path root);

	bool has(std::string_view key) const;
	Blob get(std::string_view key, std::error_code& ec) const;

	/// Creates the cache directory if necessary. Concurrent puts of the same key are safe.
	void put(std::string_view key, BufferView data, std::error_code& ec);

	/// Removes all variants of the image \a id. Returns the number of files removed.
	std::size_t purge(std::string_view id);

	std::size_t count() const;

	fs::path path(std::string_view key) const;
	const fs::path& root() const {return m_root;}

private:
	fs::path m_root;
};

} // end of namespace
