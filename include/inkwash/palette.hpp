/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "inkwash/image.hpp"

namespace inkwash {

enum class Palette : std::uint8_t { WarmRed, CoolBlue, WarmYellow, Purple, Balanced };

[[nodiscard]] const char* describe(Palette palette) noexcept;

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

// Dominant colors of recently colorized pages, used to keep a chapter's
// palette steady. Not thread-safe; one tracker per job loop.
class ColorTracker {
public:
    static constexpr std::size_t kDefaultHistory = 5;
    static constexpr std::size_t kMinSamples = 100;

    explicit ColorTracker(std::size_t historySize = kDefaultHistory) noexcept
        : historySize_(historySize == 0 ? 1 : historySize) {}

    // Returns false when the page has too few mid-tone pixels to sample.
    bool update(const Image& page);

    [[nodiscard]] std::optional<Palette> palette() const;
    [[nodiscard]] std::optional<std::string> guidance() const;

    void reset() noexcept { history_.clear(); }
    [[nodiscard]] std::size_t size() const noexcept { return history_.size(); }

private:
    using Sample = std::array<Rgb, 3>;

    std::size_t historySize_;
    std::deque<Sample> history_;
};

}
