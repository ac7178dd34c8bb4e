/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <stddef.h>

#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "palettes/palette_model.h"

/// Picks n well separated cluster colors and orders them for maximal hue contrast between neighbours.
/// Extra configuration: trials (size_t, default 10000) random draws per search stage.
class QualitativePalette : public PaletteModel {
public:
    QualitativePalette(const ov::AnyMap& configuration, const ov::AnyMap& extra_config = {});

    ov::AnyMap getConfiguration() const override;
    std::string getPaletteType() const override {
        return ModelType;
    }

    static std::string ModelType;

protected:
    std::unique_ptr<PaletteResult> assemble(const ColorDistribution& distribution, cv::RNG& rng) override;

    size_t trials = 10000;

private:
    void init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority);
};

/// Smallest pairwise Euclidean distance among the selected colors, +inf for fewer than two
double minPairwiseDistance(const std::vector<cv::Vec3d>& colors, const std::vector<size_t>& subset);

/// Mean of squared differences between consecutive hues taken in the given order, 0 for fewer than two
double meanSquaredHueStep(const std::vector<double>& hues, const std::vector<size_t>& order);

/// Best of trials random n-subsets by minPairwiseDistance; the first draw wins ties
std::vector<size_t> selectDispersedSubset(const std::vector<cv::Vec3d>& colors,
                                          size_t n,
                                          size_t trials,
                                          cv::RNG& rng);

/// Best of trials random permutations by meanSquaredHueStep; the first draw wins ties
std::vector<size_t> selectContrastOrder(const std::vector<double>& hues, size_t trials, cv::RNG& rng);
