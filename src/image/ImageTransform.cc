/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#include "ImageTransform.hh"

#include "util/Error.hh"
#include "util/Log.hh"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace icdn {
namespace {

// The encoders only take 8-bit images.
cv::Mat to_8bit(cv::Mat image)
{
	switch (image.depth())
	{
		case CV_8U: return image;
		case CV_16U: image.convertTo(image, CV_8U, 1.0/257); break;
		case CV_32F:
		case CV_64F: image.convertTo(image, CV_8U, 255.0); break;
		default: image.convertTo(image, CV_8U); break;
	}
	return image;
}

std::vector<int> encode_params(ImageFormat format)
{
	switch (format)
	{
		case ImageFormat::jpeg: return {cv::IMWRITE_JPEG_QUALITY, ImageTransform::jpeg_quality};
		case ImageFormat::png:  return {cv::IMWRITE_PNG_COMPRESSION, ImageTransform::png_compression};
		case ImageFormat::webp: return {cv::IMWRITE_WEBP_QUALITY, ImageTransform::webp_quality};
		default:                return {};
	}
}

} // end of local namespace

cv::Mat ImageTransform::decode(BufferView raw)
{
	if (raw.size() == 0)
		return {};

	try
	{
		return cv::imdecode(
			cv::Mat{1, static_cast<int>(raw.size()), CV_8U, const_cast<void*>(raw.data())},
			cv::IMREAD_UNCHANGED
		);
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cannot decode image: %1%", e.what());
		return {};
	}
}

cv::Size ImageTransform::contain(cv::Size original, int width, int height)
{
	auto ratio = std::min({
		width  / static_cast<double>(original.width),
		height / static_cast<double>(original.height),
		1.0
	});
	if (ratio >= 1.0)
		return original;

	return {
		std::clamp(static_cast<int>(std::lround(original.width  * ratio)), 1, width),
		std::clamp(static_cast<int>(std::lround(original.height * ratio)), 1, height)
	};
}

Blob ImageTransform::render(BufferView original, const VariantSpec& spec, std::error_code& ec) const
{
	++m_renders;

	auto image = decode(original);
	if (image.empty())
	{
		ec = Error::decode_error;
		return {};
	}

	image = to_8bit(std::move(image));

	auto size = contain(image.size(), spec.width, spec.height);
	if (size != image.size())
	{
		cv::Mat out;
		cv::resize(image, out, size, 0, 0, cv::INTER_AREA);
		image = out;
	}

	// JPEG has no alpha channel
	if (spec.format == ImageFormat::jpeg && image.channels() == 4)
		cv::cvtColor(image, image, cv::COLOR_BGRA2BGR);

	auto ext = "." + std::string{to_string(spec.format)};
	Blob result;
	try
	{
		if (!cv::haveImageWriter(ext) || !cv::imencode(ext, image, result, encode_params(spec.format)))
		{
			Log(LOG_WARNING, "no %1% encoder available", to_string(spec.format));
			ec = Error::encode_error;
			return {};
		}
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cannot encode image to %1%: %2%", to_string(spec.format), e.what());
		ec = Error::encode_error;
		return {};
	}

	ec.clear();
	return result;
}

std::optional<ImageInfo> ImageTransform::probe(BufferView original)
{
	auto image = decode(original);
	if (image.empty())
		return std::nullopt;

	return ImageInfo{image.cols, image.rows, image.channels(), image.channels() == 4};
}

} // end of namespace
