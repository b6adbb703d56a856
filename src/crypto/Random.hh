/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>

namespace icdn {

void secure_random(void *buf, std::size_t size);

template <typename T>
std::enable_if_t<std::is_standard_layout<T>::value, T> secure_random()
{
	T val;
	secure_random(&val, sizeof(val));
	return val;
}

template <typename T, std::size_t size>
std::enable_if_t<std::is_standard_layout<T>::value, std::array<T, size>> secure_random_array()
{
	return secure_random<std::array<T, size>>();
}

/// Random (version 4) UUID in its canonical lower case form, e.g.
/// "3b241101-e2bb-4255-8caf-4136c566a962".
std::string uuid_v4();

/// Checks if \a str is a UUID in the canonical form produced by uuid_v4().
bool is_uuid(std::string_view str);

} // end of namespace icdn
