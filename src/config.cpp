/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/config.hpp"
#include "inkwash/logger.hpp"
#include <cstdlib>
#include <string>

namespace inkwash {

namespace {
int env_int(const char* name, int defv, int lo, int hi) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        int parsed = std::stoi(val);
        if (parsed < lo || parsed > hi) {
            LOG_WARN(std::string(name) + " out of range, using " + std::to_string(defv));
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

double env_double(const char* name, double defv, double lo, double hi) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        double parsed = std::stod(val);
        if (parsed < lo || parsed > hi) {
            LOG_WARN(std::string(name) + " out of range, using " + std::to_string(defv));
            return defv;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

Settings Settings::fromEnv() {
    Settings s;
    s.inkThreshold = env_int("INKWASH_INK_THRESHOLD", s.inkThreshold, 0, 255);
    s.maxSide = env_int("INKWASH_MAX_SIDE", s.maxSide, 8, 16384);
    s.maxCoverage = env_double("INKWASH_COVERAGE", s.maxCoverage, 0.0, 1.0);

    if (const char* fmt = std::getenv("INKWASH_OUTPUT_FORMAT")) {
        if (auto parsed = parseOutputFormat(fmt)) {
            s.outputFormat = *parsed;
        } else {
            LOG_WARN(std::string("Ignoring invalid INKWASH_OUTPUT_FORMAT=") + fmt);
        }
    }
    if (const char* mask = std::getenv("INKWASH_MASK")) {
        if (auto parsed = parseMaskStrategy(mask)) {
            s.maskStrategy = *parsed;
        } else {
            LOG_WARN(std::string("Ignoring invalid INKWASH_MASK=") + mask);
        }
    }
    return s;
}

OrchestratorConfig OrchestratorConfig::fromEnv() {
    OrchestratorConfig c;
    if (const char* out = std::getenv("INKWASH_OUTPUT_DIR"); out && *out) {
        c.outputRoot = out;
    }
    if (const char* lib = std::getenv("INKWASH_LIBRARY_DIR"); lib && *lib) {
        c.libraryRoot = lib;
    }
    if (const char* tmp = std::getenv("INKWASH_SCRATCH_DIR"); tmp && *tmp) {
        c.scratchRoot = tmp;
    }
    c.workers = env_int("INKWASH_WORKERS", c.workers, 1, 64);
    return c;
}

}
