// Copyright (C) 2018-2024 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

/**
 * @brief Conversions between RGB, HSV and hexadecimal color notations
 * @file color_space.hpp
 *
 * RGB channels, saturation and value are in [0, 1]; hue is in degrees, [0, 360).
 */

#pragma once

#include <opencv2/core.hpp>
#include <string>

cv::Vec3d rgb2hsv(const cv::Vec3d& rgb);

cv::Vec3d hsv2rgb(const cv::Vec3d& hsv);

/// Encodes an RGB color as "#RRGGBB", rounding every channel to 8 bits
std::string encodeHex(const cv::Vec3d& rgb);

static inline std::string encodeHexHsv(const cv::Vec3d& hsv) {
    return encodeHex(hsv2rgb(hsv));
}

/// Accepts "#RRGGBB", "RRGGBB" or "#RRGGBBAA" (alpha is dropped)
/// @throws std::invalid_argument on anything else
cv::Vec3d decodeHex(const std::string& hex);

/// Euclidean distance between two colors in the same space
static inline double colorDistance(const cv::Vec3d& c1, const cv::Vec3d& c2) {
    return cv::norm(c1 - c2);
}
