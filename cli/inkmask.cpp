/*
 * inkwash - Protection mask inspector (inkmask)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/config.hpp"
#include "inkwash/image.hpp"
#include "inkwash/logger.hpp"
#include "inkwash/mask.hpp"
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace inkwash;

constexpr const char* VERSION = "0.1.0";

void printUsage(const char* progName) {
    std::cout << "inkwash Mask Inspector v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <page> <mask.png> [options]\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Writes the text protection mask the batch runner would use for a page.\n";
    std::cout << "Exit status 3 means the page gets no protection.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --mask <strategy>   enclosed or proximity (default enclosed)\n";
    std::cout << "  --max-side <n>      Longest processing side (default 1024)\n";
    std::cout << "  --coverage <f>      Coverage ceiling (default 0.30)\n";
    std::cout << "  --full-size         Mask the page at its original size\n";
    std::cout << "  -h, --help          Show this help message\n";
    std::cout << "  -v, --version       Show version\n";
}

int main(int argc, char* argv[]) {
    if (!std::getenv("INKWASH_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    const std::filesystem::path pagePath = argv[1];
    const std::filesystem::path maskPath = argv[2];
    Settings settings = Settings::fromEnv();
    bool fullSize = false;
    if (settings.maskStrategy == MaskStrategy::None) {
        settings.maskStrategy = MaskStrategy::Enclosed;
    }

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--mask" && i + 1 < argc) {
            auto strategy = parseMaskStrategy(argv[++i]);
            if (!strategy || *strategy == MaskStrategy::None) {
                std::cerr << "Error: --mask must be enclosed or proximity\n";
                return 1;
            }
            settings.maskStrategy = *strategy;
        } else if (arg == "--max-side" && i + 1 < argc) {
            settings.maxSide = std::atoi(argv[++i]);
            if (settings.maxSide < 8) {
                std::cerr << "Error: --max-side must be at least 8\n";
                return 1;
            }
        } else if (arg == "--coverage" && i + 1 < argc) {
            settings.maxCoverage = std::atof(argv[++i]);
            if (settings.maxCoverage <= 0.0 || settings.maxCoverage > 1.0) {
                std::cerr << "Error: --coverage must be in (0, 1]\n";
                return 1;
            }
        } else if (arg == "--full-size") {
            fullSize = true;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return 1;
        }
    }

    try {
        Image page = loadImage(pagePath);
        if (!fullSize) {
            const Size size = processingSize(page.width, page.height, settings.maxSide);
            page = resize(page, size.width, size.height);
        }

        auto generator = makeMaskGenerator(settings);
        auto mask = generator->generate(page);
        if (!mask) {
            std::cout << pagePath.filename().string() << ": no protection\n";
            return 3;
        }

        savePng(maskPath, mask->image());
        std::cout << pagePath.filename().string() << ": " << generator->name() << " mask "
                  << mask->width() << "x" << mask->height() << ", coverage "
                  << std::fixed << std::setprecision(2) << mask->coverage() * 100.0 << "%\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
