/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace inkwash {

// 8-bit interleaved raster, 1 (gray) or 3 (RGB) channels.
struct Image {
    int width = 0;
    int height = 0;
    int channels = 0;
    std::vector<std::uint8_t> pixels;

    Image() = default;
    Image(int w, int h, int c, std::uint8_t fill = 0);

    [[nodiscard]] bool empty() const noexcept { return pixels.empty(); }
    [[nodiscard]] std::size_t pixelCount() const noexcept {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
    [[nodiscard]] std::uint8_t* at(int x, int y) noexcept {
        return pixels.data() + (static_cast<std::size_t>(y) * width + x) * channels;
    }
    [[nodiscard]] const std::uint8_t* at(int x, int y) const noexcept {
        return pixels.data() + (static_cast<std::size_t>(y) * width + x) * channels;
    }
};

struct Size {
    int width = 0;
    int height = 0;
};

// Decodes PNG or JPEG into RGB. Throws ImageError.
[[nodiscard]] Image loadImage(const std::filesystem::path& path);

// Writes gray or RGB as PNG, creating parent directories. Throws ImageError.
void savePng(const std::filesystem::path& path, const Image& image);

[[nodiscard]] bool isSupportedImage(const std::filesystem::path& path);

// cv::Mat header over the image's pixels (no copy), valid while the image lives.
// Only write through it when the image itself is mutable.
[[nodiscard]] cv::Mat matView(const Image& image);
// Deep copy of an 8-bit gray or RGB matrix.
[[nodiscard]] Image fromMat(const cv::Mat& mat);

[[nodiscard]] Image luminance(const Image& image);
[[nodiscard]] Image toRgb(const Image& image);
[[nodiscard]] Image resize(const Image& image, int width, int height, int interpolation = cv::INTER_LANCZOS4);

// Dilation with a size x size rectangle.
[[nodiscard]] Image maxFilter(const Image& gray, int size);
[[nodiscard]] Image gaussianBlur(const Image& gray, double sigma);

// Longest side capped at maxSide, each dimension rounded down to a multiple of 8.
// Sides below 8 (or maxSide below 8) give an empty size.
[[nodiscard]] Size processingSize(int width, int height, int maxSide) noexcept;

}
