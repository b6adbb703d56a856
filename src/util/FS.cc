/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "FS.hh"

#include "Escape.hh"
#include "Log.hh"

#include "crypto/Random.hh"

#include <boost/beast/core/file.hpp>

namespace icdn {

void atomic_write(const fs::path& dest, BufferView data, std::error_code& ec)
{
	fs::create_directories(dest.parent_path(), ec);
	if (ec)
	{
		Log(LOG_WARNING, "atomic_write(): cannot create directory %1% (%2% %3%)", dest.parent_path(), ec, ec.message());
		return;
	}

	// unique per writer, so that concurrent writers never share a temporary file
	auto tmp = dest;
	tmp += ".tmp-" + to_hex(secure_random_array<unsigned char, 8>());

	boost::system::error_code bec;
	boost::beast::file file;
	file.open(tmp.string().c_str(), boost::beast::file_mode::write, bec);
	if (!bec && data.size() > 0)
		file.write(data.data(), data.size(), bec);
	if (!bec)
		file.close(bec);

	if (bec)
	{
		Log(LOG_WARNING, "atomic_write(): cannot write to file %1% (%2% %3%)", tmp, bec, bec.message());
		ec.assign(bec.value(), std::system_category());

		std::error_code ignore;
		fs::remove(tmp, ignore);
		return;
	}

	fs::rename(tmp, dest, ec);
	if (ec)
	{
		Log(LOG_WARNING, "atomic_write(): cannot rename %1% to %2% (%3% %4%)", tmp, dest, ec, ec.message());

		std::error_code ignore;
		fs::remove(tmp, ignore);
	}
}

} // end of namespace
