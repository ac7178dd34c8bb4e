/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include "processing/color_distribution.h"

#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>
#include <sstream>
#include <vector>

namespace {
bool lessHsv(const cv::Vec3f& a, const cv::Vec3f& b) {
    return std::lexicographical_compare(a.val, a.val + 3, b.val, b.val + 3);
}

cv::Mat selectRows(const cv::Mat& samples, const std::vector<uchar>& keep, int count) {
    cv::Mat selected(count, 1, CV_32FC3);
    int dst = 0;
    for (int i = 0; i < samples.rows; ++i) {
        if (keep[i]) {
            selected.at<cv::Vec3f>(dst++) = samples.at<cv::Vec3f>(i);
        }
    }
    return selected;
}

ColorDistribution trimSamples(const cv::Mat& rgb, const DistributionTrim& trim) {
    // Near-black pixels have every channel below bwLow, near-white ones every channel above bwHigh
    std::vector<uchar> keep(rgb.rows, 0);
    int count = 0;
    for (int i = 0; i < rgb.rows; ++i) {
        const cv::Vec3f& px = rgb.at<cv::Vec3f>(i);
        const float mx = std::max({px[0], px[1], px[2]});
        const float mn = std::min({px[0], px[1], px[2]});
        if (mx >= trim.bwLow && mn <= trim.bwHigh) {
            keep[i] = 1;
            ++count;
        }
    }
    if (count == 0) {
        std::ostringstream ss;
        ss << "All " << rgb.rows << " pixels were removed by the near-black/near-white trim, bw = [" << trim.bwLow
           << ", " << trim.bwHigh << "]";
        throw EmptyDistributionError("bw", ss.str());
    }
    cv::Mat kept = count == rgb.rows ? rgb : selectRows(rgb, keep, count);

    cv::Mat hsv;
    cv::cvtColor(kept, hsv, cv::COLOR_RGB2HSV);
    // Reds with a tiny negative hue step come out as 360 in float
    for (int i = 0; i < hsv.rows; ++i) {
        float& h = hsv.at<cv::Vec3f>(i)[0];
        if (h >= 360.0f) {
            h -= 360.0f;
        }
    }

    cv::Mat saturation, value;
    cv::extractChannel(hsv, saturation, 1);
    cv::extractChannel(hsv, value, 2);
    const double vLow = computeQuantile(value, trim.brightnessLow);
    const double vHigh = computeQuantile(value, trim.brightnessHigh);
    const double sLow = computeQuantile(saturation, trim.saturationLow);
    const double sHigh = computeQuantile(saturation, trim.saturationHigh);

    keep.assign(hsv.rows, 0);
    count = 0;
    for (int i = 0; i < hsv.rows; ++i) {
        const double s = saturation.at<float>(i);
        const double v = value.at<float>(i);
        if (v >= vLow && v <= vHigh && s >= sLow && s <= sHigh) {
            keep[i] = 1;
            ++count;
        }
    }
    if (count == 0) {
        std::ostringstream ss;
        ss << "All " << hsv.rows << " remaining pixels were removed by the quantile trim, brightness = ["
           << trim.brightnessLow << ", " << trim.brightnessHigh << "] (v in [" << vLow << ", " << vHigh
           << "]), saturation = [" << trim.saturationLow << ", " << trim.saturationHigh << "] (s in [" << sLow
           << ", " << sHigh << "])";
        throw EmptyDistributionError("quantile", ss.str());
    }
    if (count == hsv.rows) {
        return ColorDistribution(kept, hsv);
    }
    return ColorDistribution(selectRows(kept, keep, count), selectRows(hsv, keep, count));
}
}  // namespace

ColorDistribution::ColorDistribution(const cv::Mat& rgb, const cv::Mat& hsv) : rgb(rgb), hsv(hsv) {
    if (rgb.type() != CV_32FC3 || hsv.type() != CV_32FC3 || rgb.cols != 1 || hsv.cols != 1 ||
        rgb.rows != hsv.rows) {
        throw std::invalid_argument("ColorDistribution expects two N x 1 CV_32FC3 matrices of the same size");
    }
}

ColorDistribution ColorDistribution::fromImage(const cv::Mat& rgbImage, const DistributionTrim& trim) {
    if (rgbImage.empty()) {
        throw std::invalid_argument("Can't build a color distribution from an empty image");
    }
    if (rgbImage.type() != CV_32FC3) {
        throw std::invalid_argument("ColorDistribution expects a CV_32FC3 RGB image");
    }

    cv::Mat samples = rgbImage.isContinuous() ? rgbImage : rgbImage.clone();
    return trimSamples(samples.reshape(3, static_cast<int>(samples.total())), trim);
}

ColorDistribution ColorDistribution::filter(const DistributionTrim& trim) const {
    if (empty()) {
        throw EmptyDistributionError("bw", "Can't filter an empty color distribution");
    }
    return trimSamples(rgb, trim);
}

std::vector<cv::Vec3f> ColorDistribution::distinctColors() const {
    if (empty()) {
        return {};
    }
    std::vector<cv::Vec3f> tuples(hsv.begin<cv::Vec3f>(), hsv.end<cv::Vec3f>());
    std::sort(tuples.begin(), tuples.end(), lessHsv);
    tuples.erase(std::unique(tuples.begin(), tuples.end()), tuples.end());
    return tuples;
}

cv::Mat ColorDistribution::hsvSamples() const {
    return hsv.reshape(1, hsv.rows);
}

double computeQuantile(const cv::Mat& values, double p) {
    if (values.channels() != 1 || values.depth() != CV_32F) {
        throw std::invalid_argument("Quantiles are computed over single channel CV_32F samples");
    }
    if (values.empty()) {
        throw std::invalid_argument("Can't compute a quantile of an empty sample");
    }

    std::vector<float> sorted(values.begin<float>(), values.end<float>());
    std::sort(sorted.begin(), sorted.end());

    const double index = (sorted.size() - 1) * p;
    const size_t lo = static_cast<size_t>(std::floor(index));
    const size_t hi = std::min(static_cast<size_t>(std::ceil(index)), sorted.size() - 1);
    const double h = index - lo;
    if (h <= 0.0 || sorted[hi] == sorted[lo]) {
        return sorted[lo];
    }
    return (1.0 - h) * sorted[lo] + h * sorted[hi];
}
