// Copyright (C) 2018-2024 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

/**
 * @brief a header file with common samples functionality
 * @file common.hpp
 */

#pragma once

#include <iostream>
#include <openvino/openvino.hpp>
#include <string>
#include <utility>
#include <vector>

#include "utils/slog.hpp"

template <typename T>
T clamp(T value, T low, T high) {
    return value < low ? low : (value > high ? high : value);
}

static inline std::string join(const std::vector<std::string>& items, const std::string& delim) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) {
            result += delim;
        }
        result += items[i];
    }
    return result;
}

static inline void logPaletteConfig(const std::string& palette_type, const ov::AnyMap& configuration) {
    slog::info << "Palette type: " << palette_type << slog::endl;
    if (configuration.empty()) {
        return;
    }

    slog::info << "\tConfiguration: " << slog::endl;
    for (const auto& item : configuration) {
        slog::info << "\t\t" << item.first << ": " << item.second.as<std::string>() << slog::endl;
    }
}
