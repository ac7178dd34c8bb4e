/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include "processing/color_ramp.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "utils/color_space.hpp"

ColorRamp::ColorRamp(const std::vector<std::string>& controlColors) : controlColors(controlColors) {
    if (controlColors.empty()) {
        throw std::invalid_argument("ColorRamp requires at least one control color");
    }
    controls.reserve(controlColors.size());
    for (const auto& hex : controlColors) {
        controls.push_back(decodeHex(hex));
    }
}

cv::Vec3d ColorRamp::at(double t) const {
    if (controls.size() == 1 || t <= 0.0) {
        return controls.front();
    }
    if (t >= 1.0) {
        return controls.back();
    }

    const double position = t * (controls.size() - 1);
    const size_t segment = std::min(static_cast<size_t>(std::floor(position)), controls.size() - 2);
    const double u = position - segment;
    return controls[segment] + (controls[segment + 1] - controls[segment]) * u;
}

std::vector<std::string> ColorRamp::sample(size_t n) const {
    if (n == 0) {
        throw std::invalid_argument("Number of colors to sample should be positive");
    }

    std::vector<std::string> colors;
    colors.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const double t = n == 1 ? 0.0 : static_cast<double>(i) / (n - 1);
        colors.push_back(encodeHex(at(t)));
    }
    return colors;
}
