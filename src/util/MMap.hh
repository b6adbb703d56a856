/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "BufferView.hh"
#include "FS.hh"

#include <cstddef>
#include <string_view>
#include <system_error>

namespace icdn {

/// Read-only memory mapping of a whole file.
class MMap
{
public:
	MMap() = default;
	MMap(MMap&&) noexcept ;
	MMap(const MMap&) = delete;
	MMap& operator=(MMap&&) noexcept ;
	MMap& operator=(const MMap&) = delete;
	~MMap();

	static MMap open(int fd, std::error_code& ec);
	static MMap open(const fs::path& path, std::error_code& ec);

	const void* data() const {return m_mmap;}
	std::size_t size() const {return m_size;}

	BufferView buffer() const noexcept {return {m_mmap, m_size};}
	std::string_view string() const {return {static_cast<const char*>(m_mmap), m_size};}

	bool is_opened() const {return m_mmap != nullptr;}
	void clear();
	void swap(MMap& target);

private:
	void mmap(int fd, std::size_t size, std::error_code& ec);

private:
	void *m_mmap{};         //!< Pointer to memory mapped file
	std::size_t m_size{};   //!< File size in bytes.
};

} // end of namespace
