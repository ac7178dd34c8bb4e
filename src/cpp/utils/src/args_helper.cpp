// Copyright (C) 2018-2024 Intel Corporation
// SPDX-License-Identifier: Apache-2.0
//

#include "utils/args_helper.hpp"

#include <sstream>
#include <stdexcept>

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> result;
    std::stringstream ss(s);
    std::string item;

    while (getline(ss, item, delim)) {
        result.push_back(item);
    }
    return result;
}

std::vector<float> parseRangeString(const std::string& range_string) {
    // Accepts "lo hi" or "lo,hi"
    std::string normalized = range_string;
    for (auto& c : normalized) {
        if (c == ',') {
            c = ' ';
        }
    }

    std::vector<float> values;
    for (const auto& item : split(normalized, ' ')) {
        if (item.empty()) {
            continue;
        }
        try {
            values.push_back(std::stof(item));
        } catch (const std::logic_error&) {
            throw std::invalid_argument("Can't parse range string: " + range_string);
        }
    }
    return values;
}

std::pair<float, float> checkProbabilityRange(const std::string& name, const std::vector<float>& range) {
    if (range.size() != 2) {
        throw std::invalid_argument(name + " expects 2 values {lo, hi}, but got " + std::to_string(range.size()));
    }
    const float lo = range[0];
    const float hi = range[1];
    if (!(lo >= 0.0f && hi <= 1.0f && lo <= hi)) {
        throw std::invalid_argument(name + " must satisfy 0 <= lo <= hi <= 1, but got " + formatRange(range));
    }
    return {lo, hi};
}

std::string formatRange(const std::vector<float>& range) {
    std::ostringstream ss;
    ss << "[";
    for (size_t i = 0; i < range.size(); ++i) {
        ss << (i ? ", " : "") << range[i];
    }
    ss << "]";
    return ss.str();
}
