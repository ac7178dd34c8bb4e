/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <stddef.h>

#include <ostream>
#include <sstream>
#include <string>
#include <vector>

struct PaletteResult {
    /// Hex colors "#RRGGBB" in swatch order
    std::vector<std::string> colors;
    /// Anchors of the ramp the colors were sampled from, empty for qualitative palettes
    std::vector<std::string> controlColors;
    /// Number of pixel samples left after trimming
    size_t distributionSize = 0;

    friend std::ostream& operator<<(std::ostream& os, const PaletteResult& prediction) {
        os << "colors:";
        for (const std::string& color : prediction.colors) {
            os << color << ",";
        }
        os << ";";
        if (!prediction.controlColors.empty()) {
            os << "controls:";
            for (const std::string& color : prediction.controlColors) {
                os << color << ",";
            }
            os << ";";
        }
        os << "samples:" << prediction.distributionSize << ";";
        return os;
    }
    explicit operator std::string() {
        std::stringstream ss;
        ss << *this;
        return ss.str();
    }
};
