/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include "processing/color_quantizer.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

#include "processing/color_distribution.h"

std::vector<size_t> drawSample(size_t population, size_t count, cv::RNG& rng) {
    if (count > population) {
        throw std::invalid_argument("Can't draw " + std::to_string(count) + " distinct items out of " +
                                    std::to_string(population));
    }
    std::vector<size_t> indices(population);
    std::iota(indices.begin(), indices.end(), 0);
    // Partial Fisher-Yates shuffle
    for (size_t i = 0; i < count; ++i) {
        size_t j = static_cast<size_t>(rng.uniform(static_cast<int>(i), static_cast<int>(population)));
        std::swap(indices[i], indices[j]);
    }
    indices.resize(count);
    return indices;
}

ColorQuantizer::ColorQuantizer(int maxIterations) : maxIterations(maxIterations) {
    if (maxIterations < 1) {
        throw std::invalid_argument("max_iterations should be positive, but got " + std::to_string(maxIterations));
    }
}

std::vector<ColorCluster> ColorQuantizer::quantize(const ColorDistribution& distribution,
                                                   size_t k,
                                                   cv::RNG& rng) const {
    if (distribution.empty()) {
        throw std::invalid_argument("Can't quantize an empty color distribution");
    }
    if (k == 0) {
        throw std::invalid_argument("Number of clusters should be positive");
    }

    const std::vector<cv::Vec3f> distinct = distribution.distinctColors();
    const size_t clusters = std::min(k, distinct.size());

    std::vector<cv::Vec3f> seeds;
    seeds.reserve(clusters);
    for (size_t idx : drawSample(distinct.size(), clusters, rng)) {
        seeds.push_back(distinct[idx]);
    }
    return refine(distribution, seeds);
}

std::vector<ColorCluster> ColorQuantizer::refine(const ColorDistribution& distribution,
                                                 const std::vector<cv::Vec3f>& seeds) const {
    if (distribution.empty()) {
        throw std::invalid_argument("Can't quantize an empty color distribution");
    }
    if (seeds.empty() || seeds.size() > distribution.size()) {
        throw std::invalid_argument("Can't start k-means from " + std::to_string(seeds.size()) + " centers over " +
                                    std::to_string(distribution.size()) + " samples");
    }
    const size_t clusters = seeds.size();

    // Label every sample with its nearest seed, which makes cv::kmeans start from the given seeds
    cv::Mat data = distribution.hsvSamples();
    cv::Mat labels(data.rows, 1, CV_32S);
    for (int i = 0; i < data.rows; ++i) {
        const cv::Vec3f sample = distribution.getHsv().at<cv::Vec3f>(i);
        double best = std::numeric_limits<double>::max();
        int bestLabel = 0;
        for (size_t j = 0; j < seeds.size(); ++j) {
            const double d = cv::norm(sample - seeds[j], cv::NORM_L2SQR);
            if (d < best) {
                best = d;
                bestLabel = static_cast<int>(j);
            }
        }
        labels.at<int>(i) = bestLabel;
    }

    cv::Mat centers;
    cv::kmeans(data,
               static_cast<int>(clusters),
               labels,
               cv::TermCriteria(cv::TermCriteria::COUNT + cv::TermCriteria::EPS, maxIterations, 1e-6),
               1,
               cv::KMEANS_USE_INITIAL_LABELS,
               centers);

    std::vector<ColorCluster> result(clusters);
    for (size_t j = 0; j < clusters; ++j) {
        const int row = static_cast<int>(j);
        result[j].hsv = cv::Vec3d(centers.at<float>(row, 0), centers.at<float>(row, 1), centers.at<float>(row, 2));
    }
    for (int i = 0; i < labels.rows; ++i) {
        result[labels.at<int>(i)].size++;
    }
    return result;
}
