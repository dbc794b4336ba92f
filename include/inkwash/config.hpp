/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>

#include "inkwash/types.hpp"

namespace inkwash {

// Per-job processing settings.
struct Settings {
    int inkThreshold = 80;          // luminance below this is original ink
    int maxSide = 1024;             // longest processing side, before rounding to 8
    OutputFormat outputFormat = OutputFormat::Auto;

    MaskStrategy maskStrategy = MaskStrategy::Enclosed;
    int whiteThreshold = 245;
    double maxCoverage = 0.30;
    bool enforceMask = true;        // blend original back under the mask after the engine
    bool restoreOriginalSize = true;

    std::size_t historySize = 5;

    // Defaults overlaid with INKWASH_* environment variables.
    [[nodiscard]] static Settings fromEnv();
};

struct OrchestratorConfig {
    std::filesystem::path outputRoot = "output";
    std::filesystem::path libraryRoot = "library";
    std::filesystem::path scratchRoot = std::filesystem::temp_directory_path();  // archive extraction
    int workers = 1;

    [[nodiscard]] static OrchestratorConfig fromEnv();
};

}
