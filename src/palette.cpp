/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/palette.hpp"
#include "inkwash/logger.hpp"
#include <algorithm>
#include <vector>

namespace inkwash {

const char* describe(Palette palette) noexcept {
    switch (palette) {
        case Palette::WarmRed: return "warm red and orange tones";
        case Palette::CoolBlue: return "cool blue tones";
        case Palette::WarmYellow: return "warm yellow and beige tones";
        case Palette::Purple: return "purple and magenta tones";
        case Palette::Balanced: return "consistent balanced colors";
    }
    return "consistent balanced colors";
}

bool ColorTracker::update(const Image& page) {
    if (page.empty() || page.channels < 3) {
        return false;
    }

    // Skip near-black ink and near-white paper.
    std::vector<Rgb> colors;
    colors.reserve(page.pixelCount() / 4);
    for (std::size_t i = 0; i < page.pixelCount(); ++i) {
        const std::uint8_t* p = page.pixels.data() + i * page.channels;
        const auto lo = std::min({p[0], p[1], p[2]});
        const auto hi = std::max({p[0], p[1], p[2]});
        if (lo > 20 && hi < 235) {
            colors.push_back(Rgb{p[0], p[1], p[2]});
        }
    }
    if (colors.size() < kMinSamples) {
        LOG_DEBUG("Color tracker: " + std::to_string(colors.size()) + " usable pixels, page skipped");
        return false;
    }

    // Percentile positions in scan order.
    const std::size_t n = colors.size();
    history_.push_back(Sample{colors[n * 25 / 100], colors[n * 50 / 100], colors[n * 75 / 100]});
    while (history_.size() > historySize_) {
        history_.pop_front();
    }
    return true;
}

std::optional<Palette> ColorTracker::palette() const {
    if (history_.empty()) {
        return std::nullopt;
    }
    unsigned long r = 0, g = 0, b = 0, count = 0;
    for (const auto& sample : history_) {
        for (const auto& c : sample) {
            r += c.r;
            g += c.g;
            b += c.b;
            ++count;
        }
    }
    r /= count;
    g /= count;
    b /= count;

    if (r > 140 && g < 100 && b < 100) return Palette::WarmRed;
    if (b > 140 && r < 100 && g < 100) return Palette::CoolBlue;
    if (r > 120 && g > 120 && b < 80) return Palette::WarmYellow;
    if (r > 100 && g < 80 && b > 100) return Palette::Purple;
    return Palette::Balanced;
}

std::optional<std::string> ColorTracker::guidance() const {
    auto p = palette();
    if (!p) {
        return std::nullopt;
    }
    return std::string("maintaining ") + describe(*p) + " from previous pages";
}

}
