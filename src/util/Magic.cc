/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Magic.hh"

namespace icdn {
namespace {
const std::string unknown_mime{"application/octet-stream"};

std::string to_mime(const char *result)
{
	return result ? std::string{result} : unknown_mime;
}
}

Magic::Magic() : m_cookie{::magic_open(MAGIC_MIME_TYPE)}
{
	::magic_load(m_cookie, nullptr);
}

Magic::~Magic()
{
	::magic_close(m_cookie);
}

const Magic& Magic::instance()
{
	static const Magic inst;
	return inst;
}

std::string Magic::mime(BufferView buf) const
{
	return mime(buf.data(), buf.size());
}

std::string Magic::mime(const void *buffer, std::size_t size) const
{
	std::unique_lock lock{m_mutex};
	return to_mime(::magic_buffer(m_cookie, buffer, size));
}

std::string Magic::mime(const fs::path& path) const
{
	std::unique_lock lock{m_mutex};
	return to_mime(::magic_file(m_cookie, path.string().c_str()));
}

} // end of namespace
