/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagecdn
	distribution for more details.
*/

#pragma once

#include "util/MMap.hh"

#include <boost/beast/http/message.hpp>

namespace icdn {

/// Response body that serves a memory mapped file without copying it.
/// The writer hands the mapping to Beast in chunks of at most chunk_size bytes so
/// that a large original does not become one huge gather-write.
class MMapResponseBody
{
public:
	using value_type = MMap;

	static constexpr std::size_t chunk_size = 256 * 1024;

	static std::uint64_t size(const value_type& body);

	class writer
	{
	public:
		using const_buffers_type = boost::asio::const_buffer;

		template<bool isRequest, class Fields>
		explicit
		writer(boost::beast::http::header<isRequest, Fields> const&, value_type const& body)
			: m_body(body)
		{
		}

		void init(boost::system::error_code& ec);

		boost::optional<std::pair<const_buffers_type, bool>>
		get(boost::system::error_code& ec);

	private:
		const value_type& m_body;
		std::size_t       m_offset{};
	};
};

} // end of namespace icdn
