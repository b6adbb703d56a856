/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "BufferView.hh"

#include <filesystem>
#include <system_error>

namespace icdn {
namespace fs = std::filesystem;

/// Writes \a data to a temporary file beside \a dest and renames it to \a dest.
/// Readers see either the old content or the new content, never a partial file.
/// Concurrent writers of the same \a dest do not corrupt it: the last rename wins.
void atomic_write(const fs::path& dest, BufferView data, std::error_code& ec);

}
