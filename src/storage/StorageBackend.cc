/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "StorageBackend.hh"

#include "util/Error.hh"
#include "util/Escape.hh"
#include "util/Log.hh"

namespace icdn {

bool StorageBackend::is_valid_path(std::string_view path)
{
	if (path.empty() || path.front() == '/' || path.find('\\') != path.npos)
		return false;

	while (!path.empty())
	{
		auto [segment, sep] = split_left(path, "/");
		if (segment.empty() || segment == "." || segment == "..")
			return false;

		// trailing slash, i.e. a directory
		if (sep == '/' && path.empty())
			return false;
	}
	return true;
}

void StorageBackend::move(std::string_view from, std::string_view to, std::error_code& ec)
{
	copy(from, to, ec);
	if (ec)
		return;

	if (!remove(from))
	{
		Log(LOG_WARNING, "%1% move: copied %2% to %3% but cannot remove the source", driver(), from, to);
		ec = Error::move_incomplete;
	}
}

std::uint64_t StorageBackend::size(std::string_view path, std::error_code& ec) const
{
	return stat(path, ec).size;
}

Timestamp StorageBackend::last_modified(std::string_view path, std::error_code& ec) const
{
	return stat(path, ec).last_modified;
}

std::string StorageBackend::mime_type(std::string_view path, std::error_code& ec) const
{
	return stat(path, ec).mime;
}

} // end of namespace
