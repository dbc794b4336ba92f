/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include "inkwash/image.hpp"
#include "inkwash/mask.hpp"

namespace inkwash {

// Colorized RGB where the original is light, original RGB where its luminance is
// below inkThreshold. Original is resized to the colorized size first.
[[nodiscard]] Image preserveInk(const Image& original, const Image& colorized, int inkThreshold);

// out = orig * m/255 + col * (1 - m/255) per channel; the mask is scaled to the colorized size.
[[nodiscard]] Image applyMask(const Image& original, const Image& colorized, const ProtectionMask& mask);

}
