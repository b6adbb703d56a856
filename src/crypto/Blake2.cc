/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "Blake2.hh"

#include "util/Escape.hh"

namespace icdn {

Blake2::Blake2()
{
	::blake2b_init(&m_ctx, size);
}

void Blake2::update(const void *data, std::size_t len)
{
	::blake2b_update(&m_ctx, static_cast<const std::uint8_t*>(data), len);
}

Blake2::Hash Blake2::finalize()
{
	Hash result{};
	::blake2b_final(&m_ctx, result.data(), result.size());
	return result;
}

std::string etag(BufferView content)
{
	Blake2 hash;
	hash.update(content.data(), content.size());
	return '\"' + to_hex(hash.finalize()) + '\"';
}

} // end of namespace icdn
