/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <stddef.h>

#include <opencv2/core.hpp>
#include <string>
#include <vector>

/// Piecewise-linear RGB gradient through hex control colors placed at equal parametric steps
class ColorRamp {
public:
    explicit ColorRamp(const std::vector<std::string>& controlColors);

    /// Samples n evenly spaced colors. The first and the last samples are the first and the last control colors.
    std::vector<std::string> sample(size_t n) const;

    /// Color at t in [0, 1]
    cv::Vec3d at(double t) const;

    const std::vector<std::string>& getControlColors() const {
        return controlColors;
    }

protected:
    std::vector<std::string> controlColors;
    std::vector<cv::Vec3d> controls;
};
