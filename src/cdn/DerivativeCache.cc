/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "DerivativeCache.hh"

#include "util/Error.hh"
#include "util/Log.hh"
#include "util/MMap.hh"

namespace icdn {
namespace {

bool is_temporary(const fs::path& file)
{
	return file.filename().string().find(".tmp-") != std::string::npos;
}

}

DerivativeCache::DerivativeCache(fs::path root) : m_root{std::move(root)}
{
}

fs::path DerivativeCache::path(std::string_view key) const
{
	auto ext = key.substr(key.rfind('_') + 1);

	std::string filename{key};
	filename += '.';
	filename += ext;
	return m_root / filename;
}

bool DerivativeCache::has(std::string_view key) const
{
	std::error_code ec;
	return fs::is_regular_file(path(key), ec);
}

Blob DerivativeCache::get(std::string_view key, std::error_code& ec) const
{
	auto file = MMap::open(path(key), ec);
	if (ec == std::errc::no_such_file_or_directory)
		ec = Error::object_not_exist;
	if (ec)
		return {};

	auto data = static_cast<const unsigned char*>(file.data());
	return Blob(data, data + file.size());
}

void DerivativeCache::put(std::string_view key, BufferView data, std::error_code& ec)
{
	atomic_write(path(key), data, ec);
}

std::size_t DerivativeCache::purge(std::string_view id)
{
	std::string prefix{id};
	prefix.push_back('_');

	std::size_t count = 0;
	std::error_code ec;
	for (auto it = fs::directory_iterator{m_root, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec))
	{
		auto filename = it->path().filename().string();
		if (filename.compare(0, prefix.size(), prefix) != 0)
			continue;

		std::error_code rm_ec;
		if (fs::remove(it->path(), rm_ec))
			count++;
		else if (rm_ec)
			Log(LOG_WARNING, "cannot remove cached variant %1%: %2% (%3%)", it->path(), rm_ec, rm_ec.message());
	}

	if (ec && ec != std::errc::no_such_file_or_directory)
		Log(LOG_WARNING, "cannot scan cache directory %1%: %2% (%3%)", m_root, ec, ec.message());

	return count;
}

std::size_t DerivativeCache::count() const
{
	std::size_t count = 0;
	std::error_code ec;
	for (auto it = fs::directory_iterator{m_root, ec}; !ec && it != fs::directory_iterator{}; it.increment(ec))
	{
		std::error_code type_ec;
		if (it->is_regular_file(type_ec) && !is_temporary(it->path()))
			count++;
	}
	return count;
}

} // end of namespace
