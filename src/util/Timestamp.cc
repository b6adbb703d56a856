/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagecdn
	distribution for more details.
*/

#include "Timestamp.hh"

#include <ctime>
#include <iomanip>
#include <locale>
#include <ostream>
#include <sstream>

namespace icdn {

using namespace std::chrono;

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.iso8601();
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.iso8601();
}

Timestamp Timestamp::now()
{
	return time_point_cast<Timestamp::duration>(Timestamp::clock::now());
}

Timestamp Timestamp::from_unix(std::int64_t seconds)
{
	return Timestamp{duration_cast<Timestamp::duration>(std::chrono::seconds{seconds})};
}

std::int64_t Timestamp::unix_seconds() const
{
	return duration_cast<seconds>(time_since_epoch()).count();
}

std::string Timestamp::iso8601() const
{
	auto tt = system_clock::to_time_t(*this);
	auto ms = time_since_epoch().count() % 1000;

	std::ostringstream ss;
	ss.imbue(std::locale::classic());

	std::tm tm_{};
	if (auto tm = ::gmtime_r(&tt, &tm_); tm)
		ss << std::put_time(tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms < 0 ? 0 : ms) << 'Z';

	return ss.str();
}

std::string Timestamp::http_format() const
{
	auto tt = system_clock::to_time_t(*this);

	// put_time() is locale dependent, so choose the classic locale to avoid surprises.
	std::ostringstream ss;
	ss.imbue(std::locale::classic());

	std::tm tm_{};
	if (auto tm = ::gmtime_r(&tt, &tm_); tm)
		ss << std::put_time(tm, "%a, %d %b %Y %H:%M:%S GMT");

	return ss.str();
}

std::string Timestamp::compact() const
{
	auto tt = system_clock::to_time_t(*this);

	std::ostringstream ss;
	ss.imbue(std::locale::classic());

	std::tm tm_{};
	if (auto tm = ::gmtime_r(&tt, &tm_); tm)
		ss << std::put_time(tm, "%Y%m%dT%H%M%SZ");

	return ss.str();
}

std::optional<Timestamp> Timestamp::parse_http(std::string_view date)
{
	std::istringstream ss{std::string{date}};
	ss.imbue(std::locale::classic());

	std::tm tm{};
	ss >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
	if (ss.fail())
		return std::nullopt;

	return from_unix(::timegm(&tm));
}

} // end of namespace icdn
