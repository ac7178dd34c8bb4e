/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */
#include <gtest/gtest.h>
#include <utils/color_space.hpp>

#include <opencv2/core.hpp>
#include <stdexcept>
#include <string>

TEST(ColorSpaceTest, PrimariesToHsv) {
    cv::Vec3d red = rgb2hsv({1.0, 0.0, 0.0});
    EXPECT_DOUBLE_EQ(red[0], 0.0);
    EXPECT_DOUBLE_EQ(red[1], 1.0);
    EXPECT_DOUBLE_EQ(red[2], 1.0);

    EXPECT_DOUBLE_EQ(rgb2hsv({0.0, 1.0, 0.0})[0], 120.0);
    EXPECT_DOUBLE_EQ(rgb2hsv({0.0, 0.0, 1.0})[0], 240.0);
}

TEST(ColorSpaceTest, AchromaticColorsHaveZeroHueAndSaturation) {
    cv::Vec3d white = rgb2hsv({1.0, 1.0, 1.0});
    EXPECT_DOUBLE_EQ(white[0], 0.0);
    EXPECT_DOUBLE_EQ(white[1], 0.0);
    EXPECT_DOUBLE_EQ(white[2], 1.0);

    cv::Vec3d black = rgb2hsv({0.0, 0.0, 0.0});
    EXPECT_DOUBLE_EQ(black[1], 0.0);
    EXPECT_DOUBLE_EQ(black[2], 0.0);
}

TEST(ColorSpaceTest, HsvRoundTrip) {
    const cv::Vec3d rgb(0.2, 0.4, 0.6);
    cv::Vec3d hsv = rgb2hsv(rgb);
    EXPECT_NEAR(hsv[0], 210.0, 1e-9);
    cv::Vec3d back = hsv2rgb(hsv);
    for (int c = 0; c < 3; ++c) {
        EXPECT_NEAR(back[c], rgb[c], 1e-9);
    }
}

TEST(ColorSpaceTest, HueWrapsAround) {
    cv::Vec3d rgb = hsv2rgb({360.0, 1.0, 1.0});
    EXPECT_NEAR(rgb[0], 1.0, 1e-12);
    EXPECT_NEAR(rgb[1], 0.0, 1e-12);
    EXPECT_NEAR(rgb[2], 0.0, 1e-12);
}

TEST(ColorSpaceTest, EncodeHex) {
    EXPECT_EQ(encodeHex({1.0, 0.0, 0.0}), "#FF0000");
    EXPECT_EQ(encodeHex({0.2, 0.4, 0.6}), "#336699");
    EXPECT_EQ(encodeHexHsv({240.0, 1.0, 1.0}), "#0000FF");
    EXPECT_EQ(encodeHexHsv({0.0, 0.0, 1.0}), "#FFFFFF");
}

TEST(ColorSpaceTest, EncodeHexClampsChannels) {
    EXPECT_EQ(encodeHex({1.5, -0.2, 0.0}), "#FF0000");
}

TEST(ColorSpaceTest, DecodeHex) {
    cv::Vec3d rgb = decodeHex("#336699");
    EXPECT_NEAR(rgb[0], 0.2, 1e-12);
    EXPECT_NEAR(rgb[1], 0.4, 1e-12);
    EXPECT_NEAR(rgb[2], 0.6, 1e-12);

    EXPECT_EQ(decodeHex("336699"), rgb);
    EXPECT_EQ(decodeHex("#33669980"), rgb);
    EXPECT_EQ(encodeHex(decodeHex("#ff00aa")), "#FF00AA");
}

TEST(ColorSpaceTest, DecodeHexRejectsMalformedInput) {
    EXPECT_THROW(decodeHex(""), std::invalid_argument);
    EXPECT_THROW(decodeHex("#12345"), std::invalid_argument);
    EXPECT_THROW(decodeHex("#GG0000"), std::invalid_argument);
    EXPECT_THROW(decodeHex("white"), std::invalid_argument);
}

TEST(ColorSpaceTest, ColorDistance) {
    EXPECT_DOUBLE_EQ(colorDistance({0.0, 0.0, 0.0}, {3.0, 4.0, 0.0}), 5.0);
    EXPECT_DOUBLE_EQ(colorDistance({120.0, 1.0, 1.0}, {120.0, 1.0, 1.0}), 0.0);
}
