/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "LocalBackend.hh"

#include "util/Configuration.hh"
#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"
#include "util/MMap.hh"
#include "util/Magic.hh"

#include <sys/stat.h>

#include <cerrno>

namespace icdn {

LocalBackend::LocalBackend(fs::path root, std::string url_prefix) :
	m_root{std::move(root)}, m_url{std::move(url_prefix)}
{
	while (!m_url.empty() && m_url.back() == '/')
		m_url.pop_back();
}

LocalBackend::LocalBackend(const DiskConfig& cfg) :
	LocalBackend{cfg.required("root"), cfg.optional_param("url").value_or("/storage")}
{
}

std::string_view LocalBackend::driver() const
{
	return "local";
}

fs::path LocalBackend::full_path(std::string_view path) const
{
	return m_root / fs::path{std::string{path}};
}

bool LocalBackend::exists(std::string_view path) const
{
	std::error_code ec;
	return is_valid_path(path) && fs::is_regular_file(full_path(path), ec);
}

Blob LocalBackend::read(std::string_view path, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	auto file = MMap::open(full_path(path), ec);
	if (ec == std::errc::no_such_file_or_directory || ec == std::errc::is_a_directory)
		ec = Error::object_not_exist;
	if (ec)
		return {};

	auto data = static_cast<const unsigned char*>(file.data());
	return Blob(data, data + file.size());
}

void LocalBackend::write(std::string_view path, BufferView data, const WriteOptions&, std::error_code& ec)
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return;
	}

	atomic_write(full_path(path), data, ec);
}

bool LocalBackend::remove(std::string_view path)
{
	if (!is_valid_path(path))
		return false;

	std::error_code ec;
	auto removed = fs::remove(full_path(path), ec);
	if (ec)
		Log(LOG_WARNING, "local remove %1%: %2% (%3%)", path, ec, ec.message());

	return removed && !ec;
}

void LocalBackend::copy(std::string_view from, std::string_view to, std::error_code& ec)
{
	if (!is_valid_path(from) || !is_valid_path(to))
	{
		ec = Error::invalid_path;
		return;
	}

	auto src = full_path(from);
	if (!fs::is_regular_file(src, ec))
	{
		ec = Error::object_not_exist;
		return;
	}

	auto dest = full_path(to);
	fs::create_directories(dest.parent_path(), ec);
	if (!ec)
		fs::copy_file(src, dest, fs::copy_options::overwrite_existing, ec);
}

ObjectMeta LocalBackend::stat(std::string_view path, std::error_code& ec) const
{
	if (!is_valid_path(path))
	{
		ec = Error::invalid_path;
		return {};
	}

	auto file = full_path(path);

	struct ::stat s{};
	if (::stat(file.string().c_str(), &s) != 0)
	{
		ec = (errno == ENOENT || errno == ENOTDIR) ?
			std::error_code{Error::object_not_exist} :
			std::error_code{errno, std::generic_category()};
		return {};
	}
	if (!S_ISREG(s.st_mode))
	{
		ec = Error::object_not_exist;
		return {};
	}

	ec.clear();
	return {
		static_cast<std::uint64_t>(s.st_size),
		Timestamp{std::chrono::seconds{s.st_mtim.tv_sec} + std::chrono::milliseconds{s.st_mtim.tv_nsec / 1000000}},
		Magic::instance().mime(file)
	};
}

std::vector<std::string> LocalBackend::list(std::string_view prefix, std::error_code& ec) const
{
	std::vector<std::string> result;

	ec.clear();
	if (!fs::exists(m_root, ec))
		return result;

	for (auto it = fs::recursive_directory_iterator{m_root, ec}; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec))
	{
		std::error_code type_ec;
		// skip the temporary files of atomic_write()
		if (!it->is_regular_file(type_ec) || it->path().filename().string().find(".tmp-") != std::string::npos)
			continue;

		auto rel = fs::relative(it->path(), m_root, ec).generic_string();
		if (rel.compare(0, prefix.size(), prefix) == 0)
			result.push_back(std::move(rel));
	}
	return result;
}

std::string LocalBackend::url(std::string_view path) const
{
	return m_url + '/' + url_encode(path, true);
}

std::string LocalBackend::temporary_url(std::string_view path, std::chrono::seconds, std::error_code& ec) const
{
	// local files have no expiring URLs
	ec.clear();
	return url(path);
}

} // end of namespace
