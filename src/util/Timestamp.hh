/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagecdn
	distribution for more details.
*/

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace icdn {

using TimePointBase = std::chrono::time_point<
	std::chrono::system_clock,
	std::chrono::milliseconds
>;

/// \brief  Milliseconds since the unix epoch
struct Timestamp : TimePointBase
{
	using time_point::time_point;
	Timestamp() = default;
	Timestamp(TimePointBase tp) : Timestamp{tp.time_since_epoch()} {}

	static Timestamp now();
	static Timestamp from_unix(std::int64_t seconds);

	/// "2024-05-02T10:11:12.345Z"
	std::string iso8601() const;

	/// "Thu, 02 May 2024 10:11:12 GMT"
	std::string http_format() const;

	/// "20240502T101112Z", the date format of signature V4
	std::string compact() const;

	std::int64_t unix_seconds() const;

	/// Parses the RFC 7231 date format, i.e. the one produced by http_format().
	static std::optional<Timestamp> parse_http(std::string_view date);
};

void to_json(nlohmann::json& json, const Timestamp& input);

std::ostream& operator<<(std::ostream& os, Timestamp tp);

} // end of namespace icdn
