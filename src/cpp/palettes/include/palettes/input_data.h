/*
 * Copyright (C) 2020-2024 Intel Corporation
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once
#include <opencv2/core.hpp>

struct ImageInputData {
    cv::Mat inputImage;

    ImageInputData() {}
    ImageInputData(const cv::Mat& img) {
        inputImage = img;
    }
};
