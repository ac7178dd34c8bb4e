// Copyright (C) 2018-2024 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

/**
 * @brief a header file with common samples functionality
 * @file args_helper.hpp
 */

#pragma once

#include <openvino/openvino.hpp>
#include <string>
#include <utility>
#include <vector>

std::vector<std::string> split(const std::string& s, char delim);

/**
 * @brief Parses a "lo hi" pair such as "0.25 1" into two floats
 * @param range_string whitespace separated pair
 * @return values in the order they appear
 */
std::vector<float> parseRangeString(const std::string& range_string);

/**
 * @brief Checks a {lo, hi} probability range
 * @throws std::invalid_argument unless it has two values with 0 <= lo <= hi <= 1
 */
std::pair<float, float> checkProbabilityRange(const std::string& name, const std::vector<float>& range);

std::string formatRange(const std::vector<float>& range);

template <typename Type>
Type get_from_any_maps(const std::string& key,
                       const ov::AnyMap& top_priority,
                       const ov::AnyMap& mid_priority,
                       Type low_priority) {
    auto topk_iter = top_priority.find(key);
    if (topk_iter != top_priority.end()) {
        return topk_iter->second.as<Type>();
    }
    topk_iter = mid_priority.find(key);
    if (topk_iter != mid_priority.end()) {
        return topk_iter->second.as<Type>();
    }
    return low_priority;
}
