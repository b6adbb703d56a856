/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "OriginalIndex.hh"

#include "crypto/Random.hh"
#include "util/Log.hh"

#include <algorithm>
#include <mutex>

namespace icdn {

OriginalIndex::OriginalIndex(fs::path dir) : m_dir{std::move(dir)}
{
	rebuild();
}

void OriginalIndex::rebuild()
{
	std::vector<std::string> filenames;

	std::error_code ec;
	for (auto it = fs::directory_iterator{m_dir, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec))
	{
		std::error_code type_ec;
		if (it->is_regular_file(type_ec))
			filenames.push_back(it->path().filename().string());
	}
	if (ec && ec != std::errc::no_such_file_or_directory)
		Log(LOG_WARNING, "cannot scan working directory %1%: %2% (%3%)", m_dir, ec, ec.message());

	std::sort(filenames.begin(), filenames.end());

	std::map<std::string, std::string, std::less<>> index;
	for (auto&& filename : filenames)
	{
		auto id = fs::path{filename}.stem().string();
		if (!is_uuid(id))
			continue;

		auto [it, inserted] = index.try_emplace(id, filename);
		if (!inserted)
			Log(LOG_WARNING, "image %1% has more than one working copy: using %2% and ignoring %3%", id, it->second, filename);
	}

	Log(LOG_INFO, "indexed %1% images in %2%", index.size(), m_dir);

	std::unique_lock lock{m_mutex};
	m_index.swap(index);
}

std::optional<std::string> OriginalIndex::find(std::string_view id) const
{
	std::shared_lock lock{m_mutex};
	auto it = m_index.find(id);
	return it != m_index.end() ? std::optional<std::string>{it->second} : std::nullopt;
}

std::optional<fs::path> OriginalIndex::path(std::string_view id) const
{
	auto filename = find(id);
	return filename ? std::optional<fs::path>{m_dir / *filename} : std::nullopt;
}

void OriginalIndex::insert(std::string id, std::string filename)
{
	std::unique_lock lock{m_mutex};
	m_index.insert_or_assign(std::move(id), std::move(filename));
}

bool OriginalIndex::erase(std::string_view id)
{
	std::unique_lock lock{m_mutex};
	auto it = m_index.find(id);
	if (it == m_index.end())
		return false;

	m_index.erase(it);
	return true;
}

std::vector<OriginalIndex::Entry> OriginalIndex::entries() const
{
	std::shared_lock lock{m_mutex};

	std::vector<Entry> result;
	result.reserve(m_index.size());
	for (auto&& [id, filename] : m_index)
		result.push_back({id, filename});
	return result;
}

std::size_t OriginalIndex::size() const
{
	std::shared_lock lock{m_mutex};
	return m_index.size();
}

} // end of namespace
