/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <stddef.h>

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>
#include <vector>

/// Thrown when trimming leaves no pixel to build a palette from
class EmptyDistributionError : public std::runtime_error {
public:
    EmptyDistributionError(const std::string& stage, const std::string& message)
        : std::runtime_error(message),
          stage(stage) {}

    /// "bw" for the near-black/near-white trim, "quantile" for the brightness/saturation trim
    const std::string stage;
};

struct DistributionTrim {
    float bwLow = 0.0f;
    float bwHigh = 1.0f;
    float brightnessLow = 0.0f;
    float brightnessHigh = 1.0f;
    float saturationLow = 0.0f;
    float saturationHigh = 1.0f;
};

/// Pixel samples that survived trimming, stored as N x 1 CV_32FC3 matrices.
/// rgb holds r, g, b in [0, 1]; hsv holds h in [0, 360) and s, v in [0, 1].
class ColorDistribution {
public:
    ColorDistribution() = default;
    ColorDistribution(const cv::Mat& rgb, const cv::Mat& hsv);

    /// Trims an RGB image (CV_32FC3, values in [0, 1])
    static ColorDistribution fromImage(const cv::Mat& rgbImage, const DistributionTrim& trim);

    /// Applies the same trimming rules to already collected samples
    ColorDistribution filter(const DistributionTrim& trim) const;

    size_t size() const {
        return static_cast<size_t>(hsv.rows);
    }
    bool empty() const {
        return hsv.empty();
    }

    /// Distinct (h, s, v) tuples in lexicographic order
    std::vector<cv::Vec3f> distinctColors() const;

    size_t countDistinct() const {
        return distinctColors().size();
    }

    /// hsv reshaped to N x 3 CV_32FC1, as expected by cv::kmeans
    cv::Mat hsvSamples() const;

    const cv::Mat& getRgb() const {
        return rgb;
    }
    const cv::Mat& getHsv() const {
        return hsv;
    }

protected:
    cv::Mat rgb;
    cv::Mat hsv;
};

/// Quantile with linear interpolation between order statistics, p in [0, 1]
double computeQuantile(const cv::Mat& values, double p);
