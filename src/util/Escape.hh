/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "RepeatingTuple.hh"

#include <boost/algorithm/hex.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace icdn {

template <typename Container>
std::string to_hex(const Container& bytes)
{
	std::string result(bytes.size()*2, '\0');
	boost::algorithm::hex_lower(bytes.begin(), bytes.end(), result.begin());
	return result;
}

/// Percent-encode everything except the RFC 3986 unreserved characters.
/// Slashes are kept as-is when \a keep_slash is true, for encoding object keys in URL paths.
std::string url_encode(std::string_view in, bool keep_slash = false);
std::string url_decode(std::string_view in);

std::string base64_encode(std::string_view in);
std::optional<std::string> base64_decode(std::string_view in);

// RFC 4648 section 5, without padding
std::string base64url_encode(std::string_view in);
std::optional<std::string> base64url_decode(std::string_view in);

std::tuple<std::string_view, char> split_left(std::string_view& in, std::string_view value);
std::string_view split_front_substring(std::string_view& in, std::string_view substring);

std::string to_lower(std::string_view in);
std::string_view trim(std::string_view in);

template <std::size_t index, typename ResultTuple>
void parse_token(std::string_view& remain, std::string_view value, ResultTuple& tuple)
{
	static_assert(index < std::tuple_size<ResultTuple>::value);
	static_assert(std::is_same<std::tuple_element_t<index, ResultTuple>, std::string_view>::value);
	std::get<index>(tuple) = std::get<0>(split_left(remain, value));

	if constexpr (index + 1 < std::tuple_size<ResultTuple>::value)
		parse_token<index+1>(remain, value, tuple);
}

template <std::size_t count>
auto tokenize(std::string_view remain, std::string_view value)
{
	static_assert(count > 0);

	typename RepeatingTuple<std::string_view, count>::type result;
	parse_token<0>(remain, value, result);
	return result;
}

} // end of namespace
