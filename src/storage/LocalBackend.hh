/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "StorageBackend.hh"

#include "util/FS.hh"

namespace icdn {

class DiskConfig;

/// Disk backed by a directory. URLs are formed from a public URL prefix.
class LocalBackend : public StorageBackend
{
public:
	LocalBackend(fs::path root, std::string url_prefix);
	explicit LocalBackend(const DiskConfig& cfg);

	std::string_view driver() const override;

	bool exists(std::string_view path) const override;
	Blob read(std::string_view path, std::error_code& ec) const override;
	void write(std::string_view path, BufferView data, const WriteOptions& opts, std::error_code& ec) override;
	bool remove(std::string_view path) override;
	void copy(std::string_view from, std::string_view to, std::error_code& ec) override;
	ObjectMeta stat(std::string_view path, std::error_code& ec) const override;
	std::vector<std::string> list(std::string_view prefix, std::error_code& ec) const override;
	std::string url(std::string_view path) const override;
	std::string temporary_url(std::string_view path, std::chrono::seconds ttl, std::error_code& ec) const override;

	const fs::path& root() const {return m_root;}

private:
	fs::path full_path(std::string_view path) const;

private:
	fs::path    m_root;
	std::string m_url;
};

} // end of namespace
