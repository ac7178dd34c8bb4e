/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include "palettes/sequential_palette.h"

#include <algorithm>
#include <stdexcept>

#include "processing/color_distribution.h"
#include "processing/color_quantizer.h"
#include "processing/color_ramp.h"
#include "utils/args_helper.hpp"
#include "utils/color_space.hpp"
#include "utils/common.hpp"
#include "utils/slog.hpp"

std::string SequentialPalette::ModelType = "seq";

SequentialPalette::SequentialPalette(const ov::AnyMap& configuration, const ov::AnyMap& extra_config)
    : PaletteModel(configuration, extra_config) {
    init_from_config(configuration, extra_config);
}

void SequentialPalette::init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority) {
    seq_by = get_from_any_maps("seq_by", top_priority, mid_priority, seq_by);
    sortOrder = parseSortOrder(seq_by);
}

ov::AnyMap SequentialPalette::getConfiguration() const {
    ov::AnyMap configuration = PaletteModel::getConfiguration();
    configuration["seq_by"] = seq_by;
    return configuration;
}

std::unique_ptr<PaletteResult> SequentialPalette::assemble(const ColorDistribution& distribution, cv::RNG& rng) {
    const std::vector<ColorCluster> clusters = quantizer.quantize(distribution, k, rng);
    std::vector<cv::Vec3d> colors;
    colors.reserve(clusters.size());
    for (const auto& cluster : clusters) {
        colors.push_back(cluster.hsv);
    }
    sortColors(colors, sortOrder);

    // Average contiguous runs of the sorted colors down to a handful of ramp anchors
    const size_t groups = std::min(maxControlColors, colors.size());
    const std::vector<size_t> groupOf = assignEqualWidthGroups(colors.size(), groups);
    std::vector<cv::Vec3d> sums(groups, cv::Vec3d(0, 0, 0));
    std::vector<size_t> counts(groups, 0);
    for (size_t i = 0; i < colors.size(); ++i) {
        sums[groupOf[i]] += colors[i];
        counts[groupOf[i]]++;
    }
    std::vector<cv::Vec3d> anchors;
    for (size_t g = 0; g < groups; ++g) {
        if (counts[g]) {
            anchors.push_back(sums[g] * (1.0 / counts[g]));
        }
    }
    sortColors(anchors, sortOrder);

    std::unique_ptr<PaletteResult> result(new PaletteResult());
    for (const auto& anchor : anchors) {
        result->controlColors.push_back(encodeHexHsv(anchor));
    }
    slog::debug << "Sequential ramp through " << join(result->controlColors, ", ") << slog::endl;
    result->colors = ColorRamp(result->controlColors).sample(n);
    return result;
}

std::array<int, 3> parseSortOrder(const std::string& seq_by) {
    static const std::string channels = "hsv";
    if (seq_by.size() != 3) {
        throw std::invalid_argument("seq_by should be a permutation of \"hsv\", but got \"" + seq_by + "\"");
    }
    std::array<int, 3> order;
    for (size_t i = 0; i < 3; ++i) {
        const size_t channel = channels.find(seq_by[i]);
        if (channel == std::string::npos || seq_by.find(seq_by[i]) != i) {
            throw std::invalid_argument("seq_by should be a permutation of \"hsv\", but got \"" + seq_by + "\"");
        }
        order[i] = static_cast<int>(channel);
    }
    return order;
}

void sortColors(std::vector<cv::Vec3d>& colors, const std::array<int, 3>& sortOrder) {
    std::stable_sort(colors.begin(), colors.end(), [&sortOrder](const cv::Vec3d& a, const cv::Vec3d& b) {
        for (int channel : sortOrder) {
            if (a[channel] != b[channel]) {
                return a[channel] < b[channel];
            }
        }
        return false;
    });
}

std::vector<size_t> assignEqualWidthGroups(size_t count, size_t groups) {
    if (groups < 1 || groups > count) {
        throw std::invalid_argument("Can't split " + std::to_string(count) + " items into " + std::to_string(groups) +
                                    " groups");
    }
    std::vector<size_t> groupOf(count, 0);
    if (count == 1) {
        return groupOf;
    }

    // Breaks span the 1-based positions [1, count], the outer ones widened by 0.1% of the range
    const double range = static_cast<double>(count - 1);
    const double width = range / groups;
    std::vector<double> breaks(groups + 1);
    for (size_t j = 0; j <= groups; ++j) {
        breaks[j] = 1.0 + j * width;
    }
    breaks.front() -= range / 1000;
    breaks.back() += range / 1000;

    size_t group = 0;
    for (size_t i = 0; i < count; ++i) {
        const double position = static_cast<double>(i + 1);
        while (group + 1 < groups && position > breaks[group + 1]) {
            ++group;
        }
        groupOf[i] = group;
    }
    return groupOf;
}
