/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "BufferView.hh"
#include "FS.hh"

#include <magic.h>

#include <mutex>
#include <string>

namespace icdn {

/// MIME type detection by libmagic.
/// A magic cookie is not thread-safe, so every call holds a lock.
class Magic
{
public:
	Magic();
	Magic(const Magic&) = delete;
	Magic(Magic&&) = delete;
	~Magic();

	Magic& operator=(const Magic&) = delete;
	Magic& operator=(Magic&&) = delete;

	std::string mime(const void *buffer, std::size_t size) const;
	std::string mime(BufferView buf) const;
	std::string mime(const fs::path& path) const;

	static const Magic& instance();

private:
	::magic_t m_cookie;
	mutable std::mutex m_mutex;
};

} // end of namespace
