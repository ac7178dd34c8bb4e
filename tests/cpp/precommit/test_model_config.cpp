/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */
#include <gtest/gtest.h>
#include <palettes/input_data.h>
#include <palettes/palette_model.h>
#include <palettes/results.h>
#include <processing/color_distribution.h>
#include <stddef.h>
#include <utils/args_helper.hpp>
#include <utils/slog.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <opencv2/core.hpp>
#include <openvino/openvino.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

struct PaletteTypeData {
    std::string name;
    std::string type;
    PaletteTypeData(const std::string& name, const std::string& type) : name(name), type(type) {}
};

class PaletteTypeParameterizedTest : public testing::TestWithParam<PaletteTypeData> {};

TEST_P(PaletteTypeParameterizedTest, TestCreateModelByName) {
    auto model = PaletteModel::create_model({{"palette_type", GetParam().name}});
    EXPECT_EQ(model->getPaletteType(), GetParam().type);
    EXPECT_EQ(model->getConfiguration().at("palette_type").as<std::string>(), GetParam().type);
}

INSTANTIATE_TEST_SUITE_P(TestPaletteTypes,
                         PaletteTypeParameterizedTest,
                         testing::Values(PaletteTypeData("qual", "qual"),
                                         PaletteTypeData("qualitative", "qual"),
                                         PaletteTypeData("seq", "seq"),
                                         PaletteTypeData("sequential", "seq"),
                                         PaletteTypeData("div", "div"),
                                         PaletteTypeData("divergent", "div")));

TEST(PaletteModelConfigTest, UnknownPaletteType) {
    EXPECT_THROW(PaletteModel::create_model({}), std::invalid_argument);
    EXPECT_THROW(PaletteModel::create_model({{"palette_type", std::string("rainbow")}}), std::invalid_argument);
}

TEST(PaletteModelConfigTest, DefaultConfiguration) {
    auto model = PaletteModel::create_model({{"palette_type", std::string("seq")}});
    ov::AnyMap config = model->getConfiguration();
    EXPECT_EQ(config.at("n").as<size_t>(), 9);
    EXPECT_EQ(config.at("k").as<size_t>(), 100);
    EXPECT_EQ(config.at("bw").as<std::vector<float>>(), (std::vector<float>{0.0f, 1.0f}));
    EXPECT_EQ(config.at("brightness").as<std::vector<float>>(), (std::vector<float>{0.0f, 1.0f}));
    EXPECT_EQ(config.at("saturation").as<std::vector<float>>(), (std::vector<float>{0.0f, 1.0f}));
    EXPECT_EQ(config.at("seed").as<uint64_t>(), 0xffffffff);
    EXPECT_EQ(config.at("max_iterations").as<int>(), 30);
    EXPECT_EQ(config.at("color_format").as<std::string>(), "BGR");
    EXPECT_EQ(config.at("seq_by").as<std::string>(), "hsv");
}

TEST(PaletteModelConfigTest, TopPriorityWins) {
    ov::AnyMap configuration = {{"palette_type", std::string("qual")}, {"n", size_t{5}}};
    ov::AnyMap extra_config = {{"palette_type", std::string("seq")}, {"n", size_t{3}}, {"k", size_t{7}}};
    auto model = PaletteModel::create_model(configuration, extra_config);
    EXPECT_EQ(model->getPaletteType(), "qual");
    ov::AnyMap config = model->getConfiguration();
    EXPECT_EQ(config.at("n").as<size_t>(), 5);
    EXPECT_EQ(config.at("k").as<size_t>(), 7);
}

TEST(PaletteModelConfigTest, InvalidParameters) {
    auto create = [](const std::string& key, const ov::Any& value) {
        return PaletteModel::create_model({{"palette_type", std::string("qual")}, {key, value}});
    };
    EXPECT_THROW(create("n", size_t{0}), std::invalid_argument);
    EXPECT_THROW(create("k", size_t{0}), std::invalid_argument);
    EXPECT_THROW(create("bw", std::vector<float>{0.6f, 0.4f}), std::invalid_argument);
    EXPECT_THROW(create("bw", std::vector<float>{0.0f, 1.5f}), std::invalid_argument);
    EXPECT_THROW(create("brightness", std::vector<float>{-0.1f, 1.0f}), std::invalid_argument);
    EXPECT_THROW(create("saturation", std::vector<float>{0.5f}), std::invalid_argument);
    EXPECT_THROW(create("max_iterations", 0), std::invalid_argument);
    EXPECT_THROW(create("color_format", std::string("HSV")), std::invalid_argument);
}

TEST(PaletteModelConfigTest, ColorFormat) {
    cv::Mat image(2, 2, CV_8UC3, cv::Scalar(255, 0, 0));
    auto bgr = PaletteModel::create_model({{"palette_type", std::string("qual")}, {"n", size_t{1}}});
    EXPECT_EQ(bgr->infer(image)->colors, (std::vector<std::string>{"#0000FF"}));

    auto rgb = PaletteModel::create_model(
        {{"palette_type", std::string("qual")}, {"n", size_t{1}}, {"color_format", std::string("RGB")}});
    EXPECT_EQ(rgb->infer(image)->colors, (std::vector<std::string>{"#FF0000"}));
}

TEST(PaletteModelConfigTest, ImageDepthsAndChannels) {
    auto model = PaletteModel::create_model({{"palette_type", std::string("qual")}, {"n", size_t{1}}});

    cv::Mat gray(3, 3, CV_8UC1, cv::Scalar(128));
    EXPECT_EQ(model->infer(gray)->colors, (std::vector<std::string>{"#808080"}));

    cv::Mat bgra(3, 3, CV_8UC4, cv::Scalar(0, 0, 255, 10));
    EXPECT_EQ(model->infer(bgra)->colors, (std::vector<std::string>{"#FF0000"}));

    cv::Mat deep(3, 3, CV_16UC3, cv::Scalar(0, 65535, 0));
    EXPECT_EQ(model->infer(deep)->colors, (std::vector<std::string>{"#00FF00"}));

    cv::Mat precise(3, 3, CV_64FC3, cv::Scalar(0.0, 0.0, 1.0));
    EXPECT_EQ(model->infer(precise)->colors, (std::vector<std::string>{"#FF0000"}));
}

TEST(PaletteModelConfigTest, RejectsInvalidImages) {
    auto model = PaletteModel::create_model({{"palette_type", std::string("qual")}});
    EXPECT_THROW(model->infer(cv::Mat()), std::invalid_argument);
    EXPECT_THROW(model->infer(cv::Mat(2, 2, CV_8UC2, cv::Scalar::all(0))), std::invalid_argument);
    EXPECT_THROW(model->infer(cv::Mat(2, 2, CV_32FC3, cv::Scalar(0.5, 1.5, 0.5))), std::invalid_argument);
    EXPECT_THROW(model->infer(cv::Mat(2, 2, CV_32FC3, cv::Scalar(0.5, -0.1, 0.5))), std::invalid_argument);

    cv::Mat nan(2, 2, CV_32FC3, cv::Scalar(0.5, 0.5, 0.5));
    nan.at<cv::Vec3f>(1, 1)[0] = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(model->infer(nan), std::invalid_argument);

    EXPECT_THROW(model->infer(cv::Mat(2, 2, CV_8SC3, cv::Scalar::all(0))), std::invalid_argument);
}

TEST(PaletteModelConfigTest, EmptyDistributionPropagates) {
    cv::Mat black(4, 4, CV_32FC3, cv::Scalar(0, 0, 0));
    try {
        derive_palette(black, 3, "seq", {{"bw", std::vector<float>{0.5f, 1.0f}}});
        FAIL() << "EmptyDistributionError expected";
    } catch (const EmptyDistributionError& error) {
        EXPECT_EQ(error.stage, "bw");
    }
}

TEST(PaletteModelConfigTest, DerivePaletteExplicitArgumentsWin) {
    cv::Mat image(2, 2, CV_32FC3, cv::Scalar(1, 0, 0));
    ov::AnyMap configuration = {{"n", size_t{7}}, {"palette_type", std::string("qual")}, {"color_format", std::string("BGR")}};
    EXPECT_EQ(derive_palette(image, 2, "div", configuration), (std::vector<std::string>(2, "#FF0000")));
}

TEST(PaletteModelConfigTest, InferBatch) {
    auto model = PaletteModel::create_model({{"palette_type", std::string("qual")}, {"n", size_t{1}}});
    std::vector<ImageInputData> images = {cv::Mat(2, 2, CV_8UC3, cv::Scalar(255, 0, 0)),
                                          cv::Mat(2, 2, CV_8UC3, cv::Scalar(0, 255, 0))};
    auto results = model->inferBatch(images);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0]->colors.front(), "#0000FF");
    EXPECT_EQ(results[1]->colors.front(), "#00FF00");
    EXPECT_EQ(results[0]->distributionSize, 4);
}

TEST(PaletteModelConfigTest, PreprocessTrims) {
    cv::Mat image(1, 4, CV_8UC3, cv::Scalar(0, 0, 0));
    image.at<cv::Vec3b>(0, 3) = cv::Vec3b(0, 0, 255);
    auto model = PaletteModel::create_model({{"palette_type", std::string("qual")}, {"bw", std::vector<float>{0.1f, 1.0f}}});
    EXPECT_EQ(model->preprocess(image).size(), 1);
}

TEST(PaletteResultTest, StringRepresentation) {
    PaletteResult result;
    result.colors = {"#FF0000", "#FFFFFF"};
    result.controlColors = {"#FF0000", "#FFFFFF"};
    result.distributionSize = 4;
    EXPECT_EQ(std::string(result), "colors:#FF0000,#FFFFFF,;controls:#FF0000,#FFFFFF,;samples:4;");

    PaletteResult qualitative;
    qualitative.colors = {"#00FF00"};
    qualitative.distributionSize = 1;
    EXPECT_EQ(std::string(qualitative), "colors:#00FF00,;samples:1;");
}

TEST(LoggingTest, ParseLevel) {
    EXPECT_EQ(slog::parseLevel("debug"), slog::LogLevel::Debug);
    EXPECT_EQ(slog::parseLevel("warning"), slog::LogLevel::Warning);
    EXPECT_EQ(slog::parseLevel("silent"), slog::LogLevel::Silent);
    EXPECT_THROW(slog::parseLevel("verbose"), std::invalid_argument);
}

TEST(LoggingTest, ThresholdDropsMessages) {
    slog::setLevel(slog::LogLevel::Silent);
    testing::internal::CaptureStderr();
    slog::warn << "dropped" << slog::endl;
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");

    slog::setLevel(slog::LogLevel::Info);
    testing::internal::CaptureStderr();
    slog::warn << "kept" << slog::endl;
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "[ WARNING ] kept\n");
}

TEST(ArgsHelperTest, ParseRangeString) {
    EXPECT_EQ(parseRangeString("0.1 0.9"), (std::vector<float>{0.1f, 0.9f}));
    EXPECT_EQ(parseRangeString("0.1,0.9"), (std::vector<float>{0.1f, 0.9f}));
    EXPECT_EQ(parseRangeString("  0  1 "), (std::vector<float>{0.0f, 1.0f}));
    EXPECT_THROW(parseRangeString("low high"), std::invalid_argument);
}

TEST(ArgsHelperTest, CheckProbabilityRange) {
    EXPECT_EQ(checkProbabilityRange("bw", {0.2f, 0.8f}), std::make_pair(0.2f, 0.8f));
    EXPECT_EQ(checkProbabilityRange("bw", {0.5f, 0.5f}), std::make_pair(0.5f, 0.5f));
    EXPECT_THROW(checkProbabilityRange("bw", {0.8f, 0.2f}), std::invalid_argument);
    EXPECT_THROW(checkProbabilityRange("bw", {0.2f, 0.5f, 0.8f}), std::invalid_argument);
    EXPECT_EQ(formatRange({0.25f, 1.0f}), "[0.25, 1]");
}
