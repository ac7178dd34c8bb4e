/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <stddef.h>

#include <array>
#include <memory>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "palettes/palette_model.h"

/// Sorts cluster colors by seq_by, averages them down to at most 10 anchors and ramps through them.
/// Extra configuration: seq_by (string, permutation of "hsv", default "hsv").
class SequentialPalette : public PaletteModel {
public:
    SequentialPalette(const ov::AnyMap& configuration, const ov::AnyMap& extra_config = {});

    ov::AnyMap getConfiguration() const override;
    std::string getPaletteType() const override {
        return ModelType;
    }

    static std::string ModelType;
    static constexpr size_t maxControlColors = 10;

protected:
    std::unique_ptr<PaletteResult> assemble(const ColorDistribution& distribution, cv::RNG& rng) override;

    std::string seq_by = "hsv";
    std::array<int, 3> sortOrder = {{0, 1, 2}};

private:
    void init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority);
};

/// Maps "hsv", "svh", ... to channel indices
/// @throws std::invalid_argument unless seq_by is a permutation of h, s and v
std::array<int, 3> parseSortOrder(const std::string& seq_by);

/// Stable lexicographic sort of HSV colors by the given channel precedence
void sortColors(std::vector<cv::Vec3d>& colors, const std::array<int, 3>& sortOrder);

/// Splits positions 0..count-1 into equal-width, right-closed intervals and returns the group of each position
std::vector<size_t> assignEqualWidthGroups(size_t count, size_t groups);
