/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <optional>
#include <utility>

#include "inkwash/config.hpp"
#include "inkwash/image.hpp"

namespace inkwash {

// Single-channel map, 255 = keep original, 0 = recolor. Coverage never exceeds
// the ceiling it was built against.
class ProtectionMask final {
public:
    // nullopt when coverage exceeds maxCoverage or nothing is protected.
    [[nodiscard]] static std::optional<ProtectionMask> fromImage(Image gray, double maxCoverage);

    [[nodiscard]] const Image& image() const noexcept { return image_; }
    [[nodiscard]] double coverage() const noexcept { return coverage_; }
    [[nodiscard]] int width() const noexcept { return image_.width; }
    [[nodiscard]] int height() const noexcept { return image_.height; }

    // Fraction of non-zero pixels.
    [[nodiscard]] static double measureCoverage(const Image& gray);

private:
    ProtectionMask(Image image, double coverage) : image_(std::move(image)), coverage_(coverage) {}

    Image image_;
    double coverage_ = 0.0;
};

class MaskGenerator {
public:
    virtual ~MaskGenerator() = default;
    [[nodiscard]] virtual std::optional<ProtectionMask> generate(const Image& page) const = 0;
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// Light regions enclosed by ink: light pixels not reachable from the page border.
class EnclosedRegionMask final : public MaskGenerator {
public:
    struct Params {
        int whiteThreshold = 245;
        double maxCoverage = 0.30;
        int dilateSize = 5;
        double blurSigma = 1.0;
    };

    EnclosedRegionMask() = default;
    explicit EnclosedRegionMask(Params params) noexcept : params_(params) {}

    [[nodiscard]] std::optional<ProtectionMask> generate(const Image& page) const override;
    [[nodiscard]] const char* name() const noexcept override { return "enclosed"; }

    // Binary 0/255 map of enclosed light pixels, before coverage check and smoothing.
    [[nodiscard]] Image enclosedLight(const Image& gray) const;

private:
    Params params_;
};

// Light pixels near dark strokes, for engines run without text prompts.
class InkProximityMask final : public MaskGenerator {
public:
    struct Params {
        int whiteThreshold = 245;
        int darkThreshold = 180;
        int textDilate = 31;
        int bubbleDilate = 9;
        double blurSigma = 1.0;
        double maxCoverage = 0.35;
    };

    InkProximityMask() = default;
    explicit InkProximityMask(Params params) noexcept : params_(params) {}

    [[nodiscard]] std::optional<ProtectionMask> generate(const Image& page) const override;
    [[nodiscard]] const char* name() const noexcept override { return "proximity"; }

private:
    Params params_;
};

// nullptr for MaskStrategy::None.
[[nodiscard]] std::unique_ptr<MaskGenerator> makeMaskGenerator(const Settings& settings);

}
