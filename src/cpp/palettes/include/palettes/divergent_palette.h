/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <memory>
#include <opencv2/core.hpp>
#include <string>

#include "palettes/palette_model.h"

/// Splits the trimmed pixels into two color poles and ramps from the second pole through div_center to the first.
/// Extra configuration: div_center (hex string, default "#FFFFFF"). The k parameter is not used.
class DivergentPalette : public PaletteModel {
public:
    DivergentPalette(const ov::AnyMap& configuration, const ov::AnyMap& extra_config = {});

    ov::AnyMap getConfiguration() const override;
    std::string getPaletteType() const override {
        return ModelType;
    }

    static std::string ModelType;

protected:
    std::unique_ptr<PaletteResult> assemble(const ColorDistribution& distribution, cv::RNG& rng) override;

    std::string div_center = "#FFFFFF";

private:
    void init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority);
};
