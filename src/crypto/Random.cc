/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Random.hh"

#include "util/Escape.hh"

#include <cerrno>
#include <cctype>
#include <system_error>

// C++17 is doing cmake's job
#if __has_include(<sys/random.h>)
#include <sys/random.h>
#else
#include <unistd.h>
#include <sys/syscall.h>
#include <linux/random.h>

namespace {

// The glibc in CentOS 7 does not have the getrandom() wrapper yet, but its kernel does
// support the getrandom() system call.
ssize_t getrandom(void *buf, size_t size, unsigned int flags)
{
	return syscall(SYS_getrandom, buf, size, flags);
}

} // end of local namespace
#endif

namespace icdn {

void secure_random(void *buf, std::size_t size)
{
	if (::getrandom(buf, size, 0) != static_cast<ssize_t>(size))
		throw std::system_error(errno, std::generic_category());
}

std::string uuid_v4()
{
	auto bytes = secure_random_array<unsigned char, 16>();

	// RFC 4122 section 4.4: version 4, variant 10xx
	bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
	bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

	auto hex = to_hex(bytes);
	return hex.substr(0, 8) + '-' + hex.substr(8, 4) + '-' + hex.substr(12, 4) + '-' +
		hex.substr(16, 4) + '-' + hex.substr(20);
}

bool is_uuid(std::string_view str)
{
	if (str.size() != 36)
		return false;

	for (std::size_t i = 0; i < str.size(); ++i)
	{
		if (i == 8 || i == 13 || i == 18 || i == 23)
		{
			if (str[i] != '-')
				return false;
		}
		else if (!std::isxdigit(static_cast<unsigned char>(str[i])))
			return false;
	}
	return true;
}

} // end of namespace icdn
