/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "util/FS.hh"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace icdn {

/// \brief  Maps image IDs to the filenames of their working copies.
///
/// The ID of a working copy is its filename without the extension. Only well-formed
/// IDs are indexed.
class OriginalIndex
{
public:
	struct Entry
	{
		std::string id;
		std::string filename;
	};

public:
	explicit OriginalIndex(fs::path dir);

	/// Replaces the index with the content of the working directory. If two files have
	/// the same ID, the one whose filename sorts first wins.
	void rebuild();

	std::optional<std::string> find(std::string_view id) const;
	std::optional<fs::path> path(std::string_view id) const;

	void insert(std::string id, std::string filename);
	bool erase(std::string_view id);

	/// All entries sorted by ID.
	std::vector<Entry> entries() const;
	std::size_t size() const;

	const fs::path& directory() const {return m_dir;}

private:
	fs::path m_dir;

	mutable std::shared_mutex m_mutex;
	std::map<std::string, std::string, std::less<>> m_index;
};

} // end of namespace
