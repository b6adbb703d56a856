/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include "VariantSpec.hh"

#include "util/BufferView.hh"

#include <opencv2/core.hpp>

#include <atomic>
#include <optional>
#include <system_error>

namespace icdn {

/// Properties of a decoded image.
struct ImageInfo
{
	int  width{};
	int  height{};
	int  channels{};
	bool has_alpha{};
};

/// Decode, "contain" resize and re-encode by OpenCV.
/// The same instance can be used by many threads at the same time.
class ImageTransform
{
public:
	static constexpr int jpeg_quality = 85;
	static constexpr int png_compression = 8;
	static constexpr int webp_quality = 85;

public:
	ImageTransform() = default;

	/// Fails with Error::decode_error or Error::encode_error.
	Blob render(BufferView original, const VariantSpec& spec, std::error_code& ec) const;

	/// std::nullopt if OpenCV cannot decode \a original, e.g. SVG.
	static std::optional<ImageInfo> probe(BufferView original);

	/// Number of times render() has been called.
	std::size_t render_count() const {return m_renders.load();}

	static cv::Mat decode(BufferView raw);
	static cv::Size contain(cv::Size original, int width, int height);

private:
	mutable std::atomic<std::size_t> m_renders{0};
};

} // end of namespace
