/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#include "palettes/palette_model.h"

#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <tuple>
#include <utility>

#include "palettes/divergent_palette.h"
#include "palettes/qualitative_palette.h"
#include "palettes/sequential_palette.h"
#include "utils/args_helper.hpp"
#include "utils/common.hpp"
#include "utils/slog.hpp"

PaletteModel::PaletteModel(const ov::AnyMap& configuration, const ov::AnyMap& extra_config) {
    init_from_config(configuration, extra_config);
}

void PaletteModel::init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority) {
    n = get_from_any_maps("n", top_priority, mid_priority, n);
    k = get_from_any_maps("k", top_priority, mid_priority, k);
    bw = get_from_any_maps("bw", top_priority, mid_priority, bw);
    brightness = get_from_any_maps("brightness", top_priority, mid_priority, brightness);
    saturation = get_from_any_maps("saturation", top_priority, mid_priority, saturation);
    seed = get_from_any_maps("seed", top_priority, mid_priority, seed);
    max_iterations = get_from_any_maps("max_iterations", top_priority, mid_priority, max_iterations);
    color_format = get_from_any_maps("color_format", top_priority, mid_priority, color_format);

    if (n < 1) {
        throw std::invalid_argument("Number of palette colors n should be positive");
    }
    if (k < 1) {
        throw std::invalid_argument("Number of k-means centers k should be positive");
    }
    if (color_format != "BGR" && color_format != "RGB") {
        throw std::invalid_argument("Unknown value for color_format: " + color_format);
    }

    std::tie(trim.bwLow, trim.bwHigh) = checkProbabilityRange("bw", bw);
    std::tie(trim.brightnessLow, trim.brightnessHigh) = checkProbabilityRange("brightness", brightness);
    std::tie(trim.saturationLow, trim.saturationHigh) = checkProbabilityRange("saturation", saturation);
    quantizer = ColorQuantizer(max_iterations);
}

ov::AnyMap PaletteModel::getConfiguration() const {
    return {{"palette_type", getPaletteType()},
            {"n", n},
            {"k", k},
            {"bw", bw},
            {"brightness", brightness},
            {"saturation", saturation},
            {"seed", seed},
            {"max_iterations", max_iterations},
            {"color_format", color_format}};
}

std::unique_ptr<PaletteModel> PaletteModel::create_model(const ov::AnyMap& configuration,
                                                         const ov::AnyMap& extra_config) {
    std::string palette_type = get_from_any_maps("palette_type", configuration, extra_config, std::string());

    std::unique_ptr<PaletteModel> paletteModel;
    if (palette_type == QualitativePalette::ModelType || palette_type == "qualitative") {
        paletteModel = std::unique_ptr<PaletteModel>(new QualitativePalette(configuration, extra_config));
    } else if (palette_type == SequentialPalette::ModelType || palette_type == "sequential") {
        paletteModel = std::unique_ptr<PaletteModel>(new SequentialPalette(configuration, extra_config));
    } else if (palette_type == DivergentPalette::ModelType || palette_type == "divergent") {
        paletteModel = std::unique_ptr<PaletteModel>(new DivergentPalette(configuration, extra_config));
    } else {
        throw std::invalid_argument("Incorrect or unsupported palette_type is provided: \"" + palette_type +
                                    "\", expected one of qual, seq, div");
    }

    logPaletteConfig(paletteModel->getPaletteType(), paletteModel->getConfiguration());
    return paletteModel;
}

cv::Mat PaletteModel::toRgbImage(const cv::Mat& image) const {
    if (image.empty()) {
        throw std::invalid_argument("Can't derive a palette from an empty image");
    }
    const int channels = image.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        throw std::invalid_argument("Unsupported number of channels: " + std::to_string(channels));
    }

    cv::Mat img;
    switch (image.depth()) {
    case CV_8U:
        image.convertTo(img, CV_32F, 1.0 / 255);
        break;
    case CV_16U:
        image.convertTo(img, CV_32F, 1.0 / 65535);
        break;
    case CV_32F:
    case CV_64F: {
        if (!cv::checkRange(image)) {
            throw std::invalid_argument("Image contains NaN or infinite values");
        }
        double minVal = 0.0, maxVal = 0.0;
        cv::minMaxIdx(image.reshape(1), &minVal, &maxVal);
        if (minVal < 0.0 || maxVal > 1.0) {
            throw std::invalid_argument("Floating point images should be normalized to [0, 1], but values span [" +
                                        std::to_string(minVal) + ", " + std::to_string(maxVal) + "]");
        }
        image.convertTo(img, CV_32F);
        break;
    }
    default:
        throw std::invalid_argument("Unsupported image depth, expected 8U, 16U, 32F or 64F");
    }

    const bool bgr = color_format == "BGR";
    if (channels == 1) {
        cv::cvtColor(img, img, cv::COLOR_GRAY2RGB);
    } else if (channels == 3 && bgr) {
        cv::cvtColor(img, img, cv::COLOR_BGR2RGB);
    } else if (channels == 4) {
        cv::cvtColor(img, img, bgr ? cv::COLOR_BGRA2RGB : cv::COLOR_RGBA2RGB);
    }
    return img;
}

ColorDistribution PaletteModel::preprocess(const ImageInputData& inputData) const {
    return ColorDistribution::fromImage(toRgbImage(inputData.inputImage), trim);
}

std::unique_ptr<PaletteResult> PaletteModel::infer(const ImageInputData& inputData) {
    cv::RNG rng(seed);
    return infer(inputData, rng);
}

std::unique_ptr<PaletteResult> PaletteModel::infer(const ImageInputData& inputData, cv::RNG& rng) {
    ColorDistribution distribution = preprocess(inputData);
    auto result = assemble(distribution, rng);
    result->distributionSize = distribution.size();
    return result;
}

std::vector<std::unique_ptr<PaletteResult>> PaletteModel::inferBatch(const std::vector<ImageInputData>& inputImgs) {
    std::vector<std::unique_ptr<PaletteResult>> results;
    results.reserve(inputImgs.size());
    for (const auto& inputData : inputImgs) {
        results.emplace_back(infer(inputData));
    }
    return results;
}

std::vector<std::string> derive_palette(const cv::Mat& rgb,
                                        size_t n,
                                        const std::string& type,
                                        const ov::AnyMap& configuration) {
    const ov::AnyMap explicit_config = {{"palette_type", type}, {"n", n}, {"color_format", std::string("RGB")}};
    auto model = PaletteModel::create_model(explicit_config, configuration);
    return model->infer(rgb)->colors;
}
