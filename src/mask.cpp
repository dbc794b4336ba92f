/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/mask.hpp"
#include "inkwash/logger.hpp"
#include <cstdio>
#include <string>

namespace inkwash {

namespace {
std::string percent(double fraction) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%", fraction * 100.0);
    return buf;
}
}

std::optional<ProtectionMask> ProtectionMask::fromImage(Image gray, double maxCoverage) {
    if (gray.channels != 1 || gray.empty()) {
        return std::nullopt;
    }
    const double coverage = measureCoverage(gray);
    if (coverage <= 0.0) {
        return std::nullopt;
    }
    if (coverage > maxCoverage) {
        LOG_WARN("Text mask too large (" + percent(coverage) + "), skipping text protection");
        return std::nullopt;
    }
    return ProtectionMask(std::move(gray), coverage);
}

double ProtectionMask::measureCoverage(const Image& gray) {
    if (gray.empty() || gray.channels != 1) {
        return 0.0;
    }
    return static_cast<double>(cv::countNonZero(matView(gray))) / static_cast<double>(gray.pixelCount());
}

Image EnclosedRegionMask::enclosedLight(const Image& gray) const {
    cv::Mat light;
    cv::compare(matView(gray), params_.whiteThreshold, light, cv::CMP_GE);

    // A light ring around the page joins every light border pixel into one
    // 4-connected region; filling it from the corner leaves enclosed paper at 255.
    cv::Mat padded;
    cv::copyMakeBorder(light, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(255));
    cv::floodFill(padded, cv::Point(0, 0), cv::Scalar(128), nullptr, cv::Scalar(), cv::Scalar(), 4);

    cv::Mat enclosed;
    cv::compare(padded(cv::Rect(1, 1, gray.width, gray.height)), 255, enclosed, cv::CMP_EQ);
    return fromMat(enclosed);
}

std::optional<ProtectionMask> EnclosedRegionMask::generate(const Image& page) const {
    Image gray = luminance(page);
    Image enclosed = enclosedLight(gray);

    const double coverage = ProtectionMask::measureCoverage(enclosed);
    LOG_DEBUG("Text mask coverage: " + percent(coverage));
    if (coverage > params_.maxCoverage) {
        LOG_WARN("Text mask too large (" + percent(coverage) + "), skipping text protection");
        return std::nullopt;
    }
    if (coverage <= 0.0) {
        return std::nullopt;
    }

    // Grow over bubble outlines and soften the edge before compositing.
    Image grown = maxFilter(enclosed, params_.dilateSize);
    return ProtectionMask::fromImage(gaussianBlur(grown, params_.blurSigma), params_.maxCoverage);
}

std::optional<ProtectionMask> InkProximityMask::generate(const Image& page) const {
    Image gray = luminance(page);
    const cv::Mat grayMat = matView(gray);

    cv::Mat dark;
    cv::compare(grayMat, params_.darkThreshold, dark, cv::CMP_LE);
    Image nearInk = maxFilter(fromMat(dark), params_.textDilate);

    cv::Mat white;
    cv::Mat candidate;
    cv::compare(grayMat, params_.whiteThreshold, white, cv::CMP_GE);
    cv::bitwise_and(white, matView(nearInk), candidate);

    Image mask = gaussianBlur(maxFilter(fromMat(candidate), params_.bubbleDilate), params_.blurSigma);
    LOG_DEBUG("Text mask coverage: " + percent(ProtectionMask::measureCoverage(mask)));
    return ProtectionMask::fromImage(std::move(mask), params_.maxCoverage);
}

std::unique_ptr<MaskGenerator> makeMaskGenerator(const Settings& settings) {
    switch (settings.maskStrategy) {
        case MaskStrategy::Enclosed: {
            EnclosedRegionMask::Params params;
            params.whiteThreshold = settings.whiteThreshold;
            params.maxCoverage = settings.maxCoverage;
            return std::make_unique<EnclosedRegionMask>(params);
        }
        case MaskStrategy::Proximity:
            // Keeps its own thresholds; they were tuned separately.
            return std::make_unique<InkProximityMask>();
        case MaskStrategy::None:
            return nullptr;
    }
    return nullptr;
}

}
