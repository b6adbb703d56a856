/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "VariantSpec.hh"

#include "util/Error.hh"
#include "util/Escape.hh"

#include <algorithm>
#include <charconv>
#include <sstream>

namespace icdn {
namespace {

std::optional<int> parse_dimension(std::string_view digits)
{
	if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c){return c >= '0' && c <= '9';}))
		return std::nullopt;

	int value{};
	auto [end, err] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
	if (err != std::errc{} || end != digits.data() + digits.size() || value <= 0)
		return std::nullopt;

	return value;
}

} // end of local namespace

std::optional<ImageFormat> parse_format(std::string_view token)
{
	auto lower = to_lower(token);
	if (lower == "jpeg" || lower == "jpg")  return ImageFormat::jpeg;
	else if (lower == "png")                return ImageFormat::png;
	else if (lower == "webp")               return ImageFormat::webp;
	else if (lower == "gif")                return ImageFormat::gif;
	else                                    return std::nullopt;
}

std::string_view to_string(ImageFormat format)
{
	switch (format)
	{
		case ImageFormat::jpeg: return "jpeg";
		case ImageFormat::png:  return "png";
		case ImageFormat::webp: return "webp";
		case ImageFormat::gif:  return "gif";
	}
	return "jpeg";
}

std::string mime(ImageFormat format)
{
	return "image/" + std::string{to_string(format)};
}

std::optional<std::pair<int, int>> VariantSpec::parse_size(std::string_view size)
{
	auto preset = std::find_if(presets.begin(), presets.end(), [size](auto&& p){return p.name == size;});
	if (preset != presets.end())
		return std::make_pair(preset->width, preset->height);

	auto x = size.find('x');
	if (x == size.npos)
		return std::nullopt;

	auto width  = parse_dimension(size.substr(0, x));
	auto height = parse_dimension(size.substr(x+1));
	if (!width || !height)
		return std::nullopt;

	return std::make_pair(*width, *height);
}

VariantSpec VariantSpec::parse(std::string_view size, std::string_view format, std::error_code& ec)
{
	auto dim = parse_size(size);
	if (!dim)
	{
		ec = Error::invalid_size;
		return {};
	}

	auto fmt = parse_format(format);
	if (!fmt)
	{
		ec = Error::unsupported_format;
		return {};
	}

	ec.clear();
	return {dim->first, dim->second, *fmt};
}

std::string cache_key(std::string_view id, const VariantSpec& spec)
{
	std::ostringstream ss;
	ss << id << '_' << spec.width << 'x' << spec.height << '_' << to_string(spec.format);
	return ss.str();
}

} // end of namespace
