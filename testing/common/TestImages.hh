/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagecdn
    distribution for more details.
*/

#pragma once

#include <opencv2/core/mat.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace icdn {

/// Colourful noise, so that the encoders have something to compress.
cv::Mat random_image(int width, int height, int type = CV_8UC3);

/// random_image() encoded by OpenCV, e.g. ext = ".png" or ".jpg"
std::vector<unsigned char> random_image_bytes(int width, int height, const std::string& ext = ".png", int type = CV_8UC3);

/// Dimension of an encoded image, or {0,0} if it cannot be decoded.
cv::Size decoded_size(const std::vector<unsigned char>& encoded);

/// Empty directory for a test case under the system temporary directory.
std::filesystem::path clean_test_dir(const std::string& name);

} // end of namespace
