/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <opencv2/core.hpp>
#include <openvino/openvino.hpp>
#include <string>
#include <vector>

#include "palettes/input_data.h"
#include "palettes/results.h"
#include "processing/color_distribution.h"
#include "processing/color_quantizer.h"

/// Derives a palette of hex colors from the pixels of an image.
///
/// Configuration keys shared by every palette type (values may also be given as strings):
///   n (size_t), k (size_t), bw / brightness / saturation (std::vector<float> {lo, hi}),
///   seed (uint64_t), max_iterations (int), color_format ("BGR" or "RGB").
/// The configuration argument takes priority over extra_config, which takes priority over the defaults.
class PaletteModel {
public:
    PaletteModel(const ov::AnyMap& configuration, const ov::AnyMap& extra_config = {});
    virtual ~PaletteModel() = default;

    static std::unique_ptr<PaletteModel> create_model(const ov::AnyMap& configuration,
                                                      const ov::AnyMap& extra_config = {});

    /// Runs the pipeline with a fresh cv::RNG seeded from the configured seed
    std::unique_ptr<PaletteResult> infer(const ImageInputData& inputData);
    /// Runs the pipeline consuming draws from a caller-owned stream
    std::unique_ptr<PaletteResult> infer(const ImageInputData& inputData, cv::RNG& rng);
    std::vector<std::unique_ptr<PaletteResult>> inferBatch(const std::vector<ImageInputData>& inputImgs);

    /// Converts the input image to RGB CV_32FC3 in [0, 1] and trims it
    ColorDistribution preprocess(const ImageInputData& inputData) const;

    /// Effective configuration, including defaults
    virtual ov::AnyMap getConfiguration() const;
    virtual std::string getPaletteType() const = 0;

protected:
    virtual std::unique_ptr<PaletteResult> assemble(const ColorDistribution& distribution, cv::RNG& rng) = 0;
    cv::Mat toRgbImage(const cv::Mat& image) const;

    size_t n = 9;
    size_t k = 100;
    std::vector<float> bw = {0.0f, 1.0f};
    std::vector<float> brightness = {0.0f, 1.0f};
    std::vector<float> saturation = {0.0f, 1.0f};
    uint64_t seed = 0xffffffff;
    int max_iterations = 30;
    std::string color_format = "BGR";

    DistributionTrim trim;
    ColorQuantizer quantizer;

private:
    void init_from_config(const ov::AnyMap& top_priority, const ov::AnyMap& mid_priority);
};

/// Builds a palette of n colors from a normalized RGB image (CV_32FC3 or CV_64FC3 in [0, 1], or 8-bit).
/// type is "qual", "seq" or "div"; the remaining parameters are read from configuration.
std::vector<std::string> derive_palette(const cv::Mat& rgb,
                                        size_t n,
                                        const std::string& type,
                                        const ov::AnyMap& configuration = {});
