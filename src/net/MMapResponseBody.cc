/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagecdn
	distribution for more details.
*/

#include "MMapResponseBody.hh"

#include <algorithm>

namespace icdn {

std::uint64_t MMapResponseBody::size(const value_type& body)
{
	return body.size();
}

void MMapResponseBody::writer::init(boost::system::error_code& ec)
{
	m_offset = 0;
	ec.assign(0, ec.category());
}

boost::optional<std::pair<MMapResponseBody::writer::const_buffers_type, bool>>
MMapResponseBody::writer::get(boost::system::error_code& ec)
{
	ec.assign(0, ec.category());

	auto total = m_body.size();
	if (m_offset >= total)
		return boost::none;

	auto len = std::min(chunk_size, total - m_offset);
	auto data = static_cast<const char*>(m_body.data()) + m_offset;
	m_offset += len;

	return {
		{const_buffers_type{data, len}, m_offset < total} // pair
	}; // optional
}

} // end of namespace icdn
