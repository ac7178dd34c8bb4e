/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gflags/gflags.h>
#include <palettes/palette_model.h>
#include <palettes/results.h>
#include <stddef.h>

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <openvino/openvino.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "utils/args_helper.hpp"
#include "utils/slog.hpp"

static const char help_message[] = "Print a usage message.";
static const char input_message[] = "Required. Path to an image file.";
static const char config_message[] = "Optional. Path to a JSON file with palette configuration. "
                                     "Flags given on the command line take priority over it.";
static const char n_message[] = "Optional. Number of colors in the palette.";
static const char type_message[] = "Optional. Palette type: qual, seq or div.";
static const char k_message[] = "Optional. Number of k-means centers for qual and seq palettes.";
static const char bw_message[] = "Optional. Near-black/near-white trim in RGB space, \"lo hi\".";
static const char brightness_message[] = "Optional. Quantile trim of HSV value, \"lo hi\".";
static const char saturation_message[] = "Optional. Quantile trim of HSV saturation, \"lo hi\".";
static const char seq_by_message[] = "Optional. Sort precedence of a sequential palette, a permutation of hsv.";
static const char div_center_message[] = "Optional. Center color of a divergent palette.";
static const char seed_message[] = "Optional. Seed of the random search.";
static const char json_message[] = "Optional. Print the palette as a JSON document.";
static const char log_level_message[] = "Optional. Logging threshold: debug, info, warning, error or silent. "
                                        "Defaults to warning when -json is set.";

DEFINE_bool(h, false, help_message);
DEFINE_string(i, "", input_message);
DEFINE_string(c, "", config_message);
DEFINE_uint32(n, 9, n_message);
DEFINE_string(t, "qual", type_message);
DEFINE_uint32(k, 100, k_message);
DEFINE_string(bw, "0 1", bw_message);
DEFINE_string(brightness, "0 1", brightness_message);
DEFINE_string(saturation, "0 1", saturation_message);
DEFINE_string(seq_by, "hsv", seq_by_message);
DEFINE_string(div_center, "#FFFFFF", div_center_message);
DEFINE_uint64(seed, 0xffffffff, seed_message);
DEFINE_bool(json, false, json_message);
DEFINE_string(log_level, "info", log_level_message);

static void showUsage() {
    std::cout << std::endl;
    std::cout << "image_palette [OPTION]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << std::endl;
    std::cout << "    -h                        " << help_message << std::endl;
    std::cout << "    -i \"<path>\"               " << input_message << std::endl;
    std::cout << "    -c \"<path>\"               " << config_message << std::endl;
    std::cout << "    -n \"<integer>\"            " << n_message << std::endl;
    std::cout << "    -t \"<type>\"               " << type_message << std::endl;
    std::cout << "    -k \"<integer>\"            " << k_message << std::endl;
    std::cout << "    -bw \"<lo hi>\"             " << bw_message << std::endl;
    std::cout << "    -brightness \"<lo hi>\"     " << brightness_message << std::endl;
    std::cout << "    -saturation \"<lo hi>\"     " << saturation_message << std::endl;
    std::cout << "    -seq_by \"<order>\"         " << seq_by_message << std::endl;
    std::cout << "    -div_center \"<hex>\"       " << div_center_message << std::endl;
    std::cout << "    -seed \"<integer>\"         " << seed_message << std::endl;
    std::cout << "    -json                     " << json_message << std::endl;
    std::cout << "    -log_level \"<level>\"      " << log_level_message << std::endl;
}

bool ParseAndCheckCommandLine(int argc, char* argv[]) {
    gflags::ParseCommandLineNonHelpFlags(&argc, &argv, true);
    if (FLAGS_h) {
        showUsage();
        return false;
    }

    if (FLAGS_i.empty()) {
        throw std::logic_error("Parameter -i is not set");
    }
    return true;
}

static bool isFlagSet(const char* name) {
    return !gflags::GetCommandLineFlagInfoOrDie(name).is_default;
}

// Values are kept as strings, ov::Any parses them into the type each key is read as
ov::AnyMap loadConfig(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Can't open the configuration file: " + path);
    }
    nlohmann::json j;
    input >> j;
    if (!j.is_object()) {
        throw std::runtime_error("Configuration file should hold a JSON object: " + path);
    }

    ov::AnyMap configuration;
    for (auto& item : j.items()) {
        const nlohmann::json& value = item.value();
        if (value.is_array()) {
            configuration[item.key()] = value.get<std::vector<float>>();
        } else if (value.is_string()) {
            configuration[item.key()] = value.get<std::string>();
        } else {
            configuration[item.key()] = value.dump();
        }
    }
    return configuration;
}

ov::AnyMap commandLineConfig() {
    ov::AnyMap configuration;
    if (isFlagSet("t")) {
        configuration["palette_type"] = FLAGS_t;
    }
    if (isFlagSet("n")) {
        configuration["n"] = static_cast<size_t>(FLAGS_n);
    }
    if (isFlagSet("k")) {
        configuration["k"] = static_cast<size_t>(FLAGS_k);
    }
    if (isFlagSet("bw")) {
        configuration["bw"] = parseRangeString(FLAGS_bw);
    }
    if (isFlagSet("brightness")) {
        configuration["brightness"] = parseRangeString(FLAGS_brightness);
    }
    if (isFlagSet("saturation")) {
        configuration["saturation"] = parseRangeString(FLAGS_saturation);
    }
    if (isFlagSet("seq_by")) {
        configuration["seq_by"] = FLAGS_seq_by;
    }
    if (isFlagSet("div_center")) {
        configuration["div_center"] = FLAGS_div_center;
    }
    if (isFlagSet("seed")) {
        configuration["seed"] = static_cast<uint64_t>(FLAGS_seed);
    }
    return configuration;
}

int main(int argc, char* argv[]) try {
    if (!ParseAndCheckCommandLine(argc, argv)) {
        return 0;
    }

    slog::setLevel(FLAGS_json && !isFlagSet("log_level") ? slog::LogLevel::Warning
                                                         : slog::parseLevel(FLAGS_log_level));

    cv::Mat image = cv::imread(FLAGS_i, cv::IMREAD_UNCHANGED);
    if (!image.data) {
        throw std::runtime_error{"Failed to read the image: " + FLAGS_i};
    }

    ov::AnyMap file_config = FLAGS_c.empty() ? ov::AnyMap{} : loadConfig(FLAGS_c);
    // Flag defaults apply when neither the command line nor the file names the palette
    file_config.emplace("palette_type", FLAGS_t);
    file_config.emplace("n", static_cast<size_t>(FLAGS_n));
    auto model = PaletteModel::create_model(commandLineConfig(), file_config);
    auto result = model->infer(image);

    if (FLAGS_json) {
        nlohmann::json j;
        j["palette_type"] = model->getPaletteType();
        j["colors"] = result->colors;
        j["controls"] = result->controlColors;
        j["samples"] = result->distributionSize;
        std::cout << j.dump(2) << std::endl;
    } else {
        for (const auto& color : result->colors) {
            std::cout << color << "\n";
        }
    }
} catch (const std::exception& error) {
    std::cerr << error.what() << '\n';
    return 1;
} catch (...) {
    std::cerr << "Non-exception object thrown\n";
    return 1;
}
