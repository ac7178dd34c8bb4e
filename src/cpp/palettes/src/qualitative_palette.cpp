/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include "palettes/qualitative_palette.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include "processing/color_distribution.h"
#include "processing/color_quantizer.h"
#include "utils/args_helper.hpp"
#include "utils/color_space.hpp"
#include "utils/slog.hpp"

std::string QualitativePalette::ModelType = "qual";

QualitativePalette::QualitativePalette(const ov::AnyMap& configuration, const ov::AnyMap& extra_config)
    : PaletteModel(configuration, extra_config) {
    init_from_config(configuration, extra_config);
}

void QualitativePalette::init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority) {
    trials = get_from_any_maps("trials", top_priority, mid_priority, trials);
    if (trials < 1) {
        throw std::invalid_argument("Number of search trials should be positive");
    }
}

ov::AnyMap QualitativePalette::getConfiguration() const {
    ov::AnyMap configuration = PaletteModel::getConfiguration();
    configuration["trials"] = trials;
    return configuration;
}

std::unique_ptr<PaletteResult> QualitativePalette::assemble(const ColorDistribution& distribution, cv::RNG& rng) {
    const std::vector<ColorCluster> clusters = quantizer.quantize(distribution, k, rng);
    std::vector<cv::Vec3d> colors;
    colors.reserve(clusters.size());
    for (const auto& cluster : clusters) {
        colors.push_back(cluster.hsv);
    }

    size_t count = n;
    if (count > colors.size()) {
        slog::warn << "Only " << colors.size() << " distinct colors are available, the qualitative palette is capped to "
                   << colors.size() << " colors instead of " << n << slog::endl;
        count = colors.size();
    }

    const std::vector<size_t> subset = selectDispersedSubset(colors, count, trials, rng);
    std::vector<double> hues;
    hues.reserve(subset.size());
    for (size_t idx : subset) {
        hues.push_back(colors[idx][0]);
    }
    const std::vector<size_t> order = selectContrastOrder(hues, trials, rng);
    slog::debug << "Qualitative search over " << colors.size() << " clusters: min pairwise distance "
                << minPairwiseDistance(colors, subset) << ", mean squared hue step "
                << meanSquaredHueStep(hues, order) << slog::endl;

    std::unique_ptr<PaletteResult> result(new PaletteResult());
    result->colors.reserve(order.size());
    for (size_t pos : order) {
        result->colors.push_back(encodeHexHsv(colors[subset[pos]]));
    }
    return result;
}

double minPairwiseDistance(const std::vector<cv::Vec3d>& colors, const std::vector<size_t>& subset) {
    double result = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < subset.size(); ++i) {
        for (size_t j = i + 1; j < subset.size(); ++j) {
            result = std::min(result, colorDistance(colors[subset[i]], colors[subset[j]]));
        }
    }
    return result;
}

double meanSquaredHueStep(const std::vector<double>& hues, const std::vector<size_t>& order) {
    if (order.size() < 2) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = 1; i < order.size(); ++i) {
        const double step = hues[order[i]] - hues[order[i - 1]];
        sum += step * step;
    }
    return sum / (order.size() - 1);
}

std::vector<size_t> selectDispersedSubset(const std::vector<cv::Vec3d>& colors,
                                          size_t n,
                                          size_t trials,
                                          cv::RNG& rng) {
    if (trials < 1) {
        throw std::invalid_argument("Number of search trials should be positive");
    }
    std::vector<size_t> best;
    double bestScore = -std::numeric_limits<double>::infinity();
    for (size_t trial = 0; trial < trials; ++trial) {
        std::vector<size_t> subset = drawSample(colors.size(), n, rng);
        const double score = minPairwiseDistance(colors, subset);
        if (score > bestScore) {
            bestScore = score;
            best = std::move(subset);
        }
    }
    return best;
}

std::vector<size_t> selectContrastOrder(const std::vector<double>& hues, size_t trials, cv::RNG& rng) {
    if (trials < 1) {
        throw std::invalid_argument("Number of search trials should be positive");
    }
    std::vector<size_t> best;
    double bestScore = -std::numeric_limits<double>::infinity();
    for (size_t trial = 0; trial < trials; ++trial) {
        std::vector<size_t> order = drawSample(hues.size(), hues.size(), rng);
        const double score = meanSquaredHueStep(hues, order);
        if (score > bestScore) {
            bestScore = score;
            best = std::move(order);
        }
    }
    return best;
}
