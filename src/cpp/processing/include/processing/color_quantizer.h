/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <stddef.h>

#include <opencv2/core.hpp>
#include <vector>

class ColorDistribution;

struct ColorCluster {
    cv::Vec3d hsv;
    size_t size = 0;
};

/// Reduces a color distribution to at most k representative HSV colors with k-means.
/// The effective number of clusters is min(k, distinct colors of the distribution).
/// Seeds are drawn from rng, so a fixed stream reproduces the same clusters.
class ColorQuantizer {
public:
    explicit ColorQuantizer(int maxIterations = 30);

    std::vector<ColorCluster> quantize(const ColorDistribution& distribution, size_t k, cv::RNG& rng) const;
    /// Runs at most maxIterations k-means steps starting from the given centers
    std::vector<ColorCluster> refine(const ColorDistribution& distribution, const std::vector<cv::Vec3f>& seeds) const;

protected:
    int maxIterations;
};

/// Draws count distinct indices out of [0, population) in random order
std::vector<size_t> drawSample(size_t population, size_t count, cv::RNG& rng);
