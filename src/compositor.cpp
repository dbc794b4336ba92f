/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/compositor.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/logger.hpp"
#include <string>

namespace inkwash {

namespace {

Image matchSize(const Image& source, int width, int height) {
    Image rgb = toRgb(source);
    if (rgb.width == width && rgb.height == height) {
        return rgb;
    }
    return resize(rgb, width, height);
}

}

Image preserveInk(const Image& original, const Image& colorized, int inkThreshold) {
    if (colorized.empty()) {
        throw ImageError("Cannot preserve ink on an empty image");
    }
    Image out = toRgb(colorized);
    const Image base = matchSize(original, out.width, out.height);

    cv::Mat gray;
    cv::Mat ink;
    cv::cvtColor(matView(base), gray, cv::COLOR_RGB2GRAY);
    cv::compare(gray, inkThreshold, ink, cv::CMP_LT);

    cv::Mat dst = matView(out);
    matView(base).copyTo(dst, ink);
    LOG_TRACE("Preserved " + std::to_string(cv::countNonZero(ink)) + " ink pixels");
    return out;
}

Image applyMask(const Image& original, const Image& colorized, const ProtectionMask& mask) {
    if (colorized.empty()) {
        throw ImageError("Cannot apply mask to an empty image");
    }
    const Image out = toRgb(colorized);
    const Image base = matchSize(original, out.width, out.height);
    const Image weights = resize(mask.image(), out.width, out.height, cv::INTER_LINEAR);

    cv::Mat keep;
    matView(weights).convertTo(keep, CV_32F, 1.0 / 255.0);
    cv::Mat recolor = 1.0 - keep;
    cv::Mat blended;
    cv::blendLinear(matView(base), matView(out), keep, recolor, blended);
    return fromMat(blended);
}

}
