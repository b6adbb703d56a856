/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace icdn {

/// Output formats of the renditions.
enum class ImageFormat {jpeg, png, webp, gif};

/// Case-insensitive. "jpg" is an alias of "jpeg".
std::optional<ImageFormat> parse_format(std::string_view token);

/// Canonical name of the format, which is also the file extension of cached renditions.
std::string_view to_string(ImageFormat format);
std::string mime(ImageFormat format);

struct Preset
{
	std::string_view name;
	int width, height;
};

constexpr std::array<Preset, 4> presets{{
	{"thumbnail", 150,  150},
	{"small",     300,  300},
	{"medium",    800,  800},
	{"large",     1920, 1080}
}};

/// \brief  Normalized description of a rendition: the bounding box and the output format.
struct VariantSpec
{
	int         width{};
	int         height{};
	ImageFormat format{ImageFormat::jpeg};

	/// Parses a size token (a preset name or "<width>x<height>") and a format token.
	/// Fails with Error::invalid_size or Error::unsupported_format.
	static VariantSpec parse(std::string_view size, std::string_view format, std::error_code& ec);

	/// Preset names take precedence. Otherwise both dimensions must be positive integers.
	static std::optional<std::pair<int, int>> parse_size(std::string_view size);

	bool operator==(const VariantSpec& rhs) const
	{
		return width == rhs.width && height == rhs.height && format == rhs.format;
	}
	bool operator!=(const VariantSpec& rhs) const {return !operator==(rhs);}
};

/// "{id}_{width}x{height}_{format}", using the canonical format name.
std::string cache_key(std::string_view id, const VariantSpec& spec);

} // end of namespace
