/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include "palettes/divergent_palette.h"

#include <stdexcept>
#include <vector>

#include "processing/color_distribution.h"
#include "processing/color_quantizer.h"
#include "processing/color_ramp.h"
#include "utils/args_helper.hpp"
#include "utils/color_space.hpp"
#include "utils/slog.hpp"

std::string DivergentPalette::ModelType = "div";

DivergentPalette::DivergentPalette(const ov::AnyMap& configuration, const ov::AnyMap& extra_config)
    : PaletteModel(configuration, extra_config) {
    init_from_config(configuration, extra_config);
}

void DivergentPalette::init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority) {
    div_center = get_from_any_maps("div_center", top_priority, mid_priority, div_center);
    // Normalized so that the ramp reproduces it exactly
    div_center = encodeHex(decodeHex(div_center));
}

ov::AnyMap DivergentPalette::getConfiguration() const {
    ov::AnyMap configuration = PaletteModel::getConfiguration();
    configuration.erase("k");
    configuration["div_center"] = div_center;
    return configuration;
}

std::unique_ptr<PaletteResult> DivergentPalette::assemble(const ColorDistribution& distribution, cv::RNG& rng) {
    std::unique_ptr<PaletteResult> result(new PaletteResult());
    const std::vector<cv::Vec3f> distinct = distribution.distinctColors();
    if (distinct.size() < 2) {
        slog::warn << "The trimmed image holds a single color, the divergent palette degenerates to one color"
                   << slog::endl;
        result->controlColors = {encodeHexHsv(distinct.front())};
    } else {
        const std::vector<ColorCluster> poles = quantizer.quantize(distribution, 2, rng);
        const std::string colorA = encodeHexHsv(poles[0].hsv);
        const std::string colorB = encodeHexHsv(poles[1].hsv);
        result->controlColors = {colorB, div_center, colorA};
        slog::debug << "Divergent poles " << colorA << " (" << poles[0].size << " samples) and " << colorB << " ("
                    << poles[1].size << " samples)" << slog::endl;
    }
    result->colors = ColorRamp(result->controlColors).sample(n);
    return result;
}
