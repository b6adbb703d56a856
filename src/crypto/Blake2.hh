/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "util/BufferView.hh"

#include <blake2.h>

#include <array>
#include <string>

namespace icdn {

class Blake2
{
public:
	Blake2();
	Blake2(Blake2&&) = default;
	Blake2(const Blake2&) = default;
	~Blake2() = default;

	Blake2& operator=(Blake2&&) = default;
	Blake2& operator=(const Blake2&) = default;

	// 16 bytes is plenty for telling two renditions apart.
	static const std::size_t size = 16;
	using Hash = std::array<unsigned char, size>;

	void update(const void *data, std::size_t len);
	Hash finalize();

private:
	::blake2b_state m_ctx{};
};

/// Strong entity tag of a response body: the quoted hex Blake2 hash of its content.
std::string etag(BufferView content);

} // end of namespace icdn
