// Copyright (C) 2018-2024 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "utils/color_space.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

#include "utils/common.hpp"

cv::Vec3d rgb2hsv(const cv::Vec3d& rgb) {
    const double r = rgb[0], g = rgb[1], b = rgb[2];
    const double v = std::max({r, g, b});
    const double diff = v - std::min({r, g, b});

    const double s = v > 0.0 ? diff / v : 0.0;
    double h = 0.0;
    if (diff > 0.0) {
        if (v == r) {
            h = 60.0 * (g - b) / diff;
        } else if (v == g) {
            h = 60.0 * (b - r) / diff + 120.0;
        } else {
            h = 60.0 * (r - g) / diff + 240.0;
        }
        if (h < 0.0) {
            h += 360.0;
        }
    }
    return {h, s, v};
}

cv::Vec3d hsv2rgb(const cv::Vec3d& hsv) {
    const double s = clamp(hsv[1], 0.0, 1.0);
    const double v = clamp(hsv[2], 0.0, 1.0);
    if (s == 0.0) {
        return {v, v, v};
    }

    double h = std::fmod(hsv[0], 360.0);
    if (h < 0.0) {
        h += 360.0;
    }
    h /= 60.0;
    const int sector = std::min(static_cast<int>(std::floor(h)), 5);
    const double f = h - sector;
    const double p = v * (1.0 - s);
    const double q = v * (1.0 - s * f);
    const double t = v * (1.0 - s * (1.0 - f));

    switch (sector) {
    case 0:
        return {v, t, p};
    case 1:
        return {q, v, p};
    case 2:
        return {p, v, t};
    case 3:
        return {p, q, v};
    case 4:
        return {t, p, v};
    default:
        return {v, p, q};
    }
}

namespace {
// Halves round up
int toByte(double c) {
    return static_cast<int>(clamp(c, 0.0, 1.0) * 255.0 + 0.5);
}
}  // namespace

std::string encodeHex(const cv::Vec3d& rgb) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", toByte(rgb[0]), toByte(rgb[1]), toByte(rgb[2]));
    return std::string(buf);
}

cv::Vec3d decodeHex(const std::string& hex) {
    std::string digits = !hex.empty() && hex[0] == '#' ? hex.substr(1) : hex;
    if (digits.size() != 6 && digits.size() != 8) {
        throw std::invalid_argument("Hex color should look like #RRGGBB, but got \"" + hex + "\"");
    }
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) {
            return std::isxdigit(c);
        })) {
        throw std::invalid_argument("Hex color contains non-hexadecimal characters: \"" + hex + "\"");
    }

    cv::Vec3d rgb;
    for (int c = 0; c < 3; ++c) {
        rgb[c] = std::stoi(digits.substr(2 * c, 2), nullptr, 16) / 255.0;
    }
    return rgb;
}
