/*
 * inkwash - Batch colorization runner (inkwash)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/orchestrator.hpp"
#include "inkwash/logger.hpp"
#include "inkwash/resolver.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

using namespace inkwash;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "inkwash Batch Colorizer v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [options] <input...>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  input         Image file, folder of pages, or comic archive (zip/cbz/rar/cbr/7z/cb7/tar)\n\n";
    std::cout << "Options:\n";
    std::cout << "  --engine <cmd>          Colorizer command; placeholders {input} {output} {mask}\n";
    std::cout << "                          {guidance} {ink} {size}\n";
    std::cout << "  --ink-threshold <n>     Luminance below which original ink is kept (default 80)\n";
    std::cout << "  --max-side <n>          Longest processing side (default 1024)\n";
    std::cout << "  --format <fmt>          auto, folder or archive (default auto)\n";
    std::cout << "  --mask <strategy>       enclosed, proximity or none (default enclosed)\n";
    std::cout << "  --coverage <f>          Mask coverage ceiling (default 0.30)\n";
    std::cout << "  --no-enforce-mask       Trust the engine to respect the mask\n";
    std::cout << "  --output <dir>          Output root for ad-hoc batches (default ./output)\n";
    std::cout << "  --library <dir>         Library root (default ./library)\n";
    std::cout << "  --collection <title>    Write into <library>/<title>/<chapter>/\n";
    std::cout << "  --chapter <id>          Chapter id, used with --collection\n";
    std::cout << "  --workers <n>           Worker threads (default 1)\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  INKWASH_ENGINE_CMD      Colorizer command when --engine is absent\n";
    std::cout << "  INKWASH_LOG_LEVEL       Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  INKWASH_INK_THRESHOLD, INKWASH_MAX_SIDE, INKWASH_OUTPUT_FORMAT,\n";
    std::cout << "  INKWASH_MASK, INKWASH_COVERAGE, INKWASH_OUTPUT_DIR, INKWASH_LIBRARY_DIR,\n";
    std::cout << "  INKWASH_WORKERS         Defaults for the options above\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " --engine 'colorize {input} {output} --mask {mask}' ./chapter_01.cbz\n";
    std::cout << "  " << progName << " --collection Berserk --chapter 12 ./scans/ch12\n";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%H:%M:%S");
    return ss.str();
}

std::optional<int> parseInt(const std::string& value) {
    char* end = nullptr;
    long parsed = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || parsed < 0 || parsed > 1'000'000) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

class ConsoleProgress final : public ProgressObserver {
public:
    void onProgress(const JobId& id, std::size_t current, std::size_t total, const std::string& filename) override {
        std::cout << "    \033[90m" << timestamp() << "\033[0m  " << id
                  << "  \033[33m" << current << "/" << total << "\033[0m  " << filename << std::endl;
    }
};

int main(int argc, char* argv[]) {
    Logger::initFromEnv();
    if (!std::getenv("INKWASH_LOG_LEVEL"))
        Logger::setLevel(LogLevel::WARN);

    // Handle --help and --version before anything else
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

    Settings settings = Settings::fromEnv();
    OrchestratorConfig config = OrchestratorConfig::fromEnv();
    std::string engineCmd = std::getenv("INKWASH_ENGINE_CMD") ? std::getenv("INKWASH_ENGINE_CMD") : "";
    std::string collection;
    std::string chapter;
    std::vector<std::filesystem::path> inputs;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](const char* what) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires " << what << "\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--engine") {
            auto v = next("a command");
            if (!v) return 1;
            engineCmd = *v;
        } else if (arg == "--ink-threshold" || arg == "--max-side" || arg == "--workers") {
            auto v = next("a number");
            if (!v) return 1;
            auto n = parseInt(*v);
            if (!n) {
                std::cerr << "Error: invalid value for " << arg << ": " << *v << "\n";
                return 1;
            }
            if (arg == "--ink-threshold") settings.inkThreshold = *n;
            else if (arg == "--max-side") settings.maxSide = *n;
            else config.workers = *n;
        } else if (arg == "--format") {
            auto v = next("a format");
            if (!v) return 1;
            auto format = parseOutputFormat(*v);
            if (!format) {
                std::cerr << "Error: unknown output format: " << *v << "\n";
                return 1;
            }
            settings.outputFormat = *format;
        } else if (arg == "--mask") {
            auto v = next("a strategy");
            if (!v) return 1;
            auto strategy = parseMaskStrategy(*v);
            if (!strategy) {
                std::cerr << "Error: unknown mask strategy: " << *v << "\n";
                return 1;
            }
            settings.maskStrategy = *strategy;
        } else if (arg == "--coverage") {
            auto v = next("a fraction");
            if (!v) return 1;
            char* end = nullptr;
            double c = std::strtod(v->c_str(), &end);
            if (*end != '\0' || c <= 0.0 || c > 1.0) {
                std::cerr << "Error: invalid coverage: " << *v << "\n";
                return 1;
            }
            settings.maxCoverage = c;
        } else if (arg == "--no-enforce-mask") {
            settings.enforceMask = false;
        } else if (arg == "--output") {
            auto v = next("a directory");
            if (!v) return 1;
            config.outputRoot = *v;
        } else if (arg == "--library") {
            auto v = next("a directory");
            if (!v) return 1;
            config.libraryRoot = *v;
        } else if (arg == "--collection") {
            auto v = next("a title");
            if (!v) return 1;
            collection = *v;
        } else if (arg == "--chapter") {
            auto v = next("a chapter id");
            if (!v) return 1;
            chapter = *v;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return 1;
        } else {
            inputs.emplace_back(arg);
        }
    }

    if (inputs.empty()) {
        printUsage(argv[0]);
        return 1;
    }
    if (engineCmd.empty()) {
        std::cerr << "Error: no engine command (use --engine or INKWASH_ENGINE_CMD)\n";
        return 1;
    }
    if (collection.empty() != chapter.empty()) {
        std::cerr << "Error: --collection and --chapter must be given together\n";
        return 1;
    }

    std::vector<BatchItem> items;
    for (const auto& input : inputs) {
        BatchItem item;
        item.kind = inferItemKind(input);
        item.path = input;
        item.collection = collection;
        item.chapter = chapter;
        items.push_back(std::move(item));
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        CommandEngine engine(engineCmd);
        engine.prepare();

        Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
        orchestrator.addObserver(std::make_shared<ConsoleProgress>());

        auto submitted = orchestrator.submit(items, settings);
        if (!submitted) {
            std::cerr << "Error: " << submitted.message << std::endl;
            return 1;
        }
        std::cout << "  \033[1minkwash\033[0m " << VERSION << "  \033[90m" << submitted.id
                  << "  " << submitted.total << " pages\033[0m\n";

        if (!orchestrator.start(submitted.id)) {
            std::cerr << "Error: failed to start batch " << submitted.id << std::endl;
            return 1;
        }

        bool cancelRequested = false;
        while (true) {
            auto status = orchestrator.status(submitted.id);
            if (!status || isTerminal(status->state)) {
                break;
            }
            if (g_shutdown_requested && !cancelRequested) {
                std::cout << "    \033[90m" << timestamp() << "\033[0m  \033[33mcancelling after current page\033[0m" << std::endl;
                orchestrator.cancel(submitted.id);
                cancelRequested = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        auto final = orchestrator.wait(submitted.id);
        auto results = orchestrator.results(submitted.id);
        if (!final || !results) {
            std::cerr << "Error: batch disappeared\n";
            return 1;
        }

        const char* color = final->state == JobState::Completed ? "\033[32m"
                          : final->state == JobState::Cancelled ? "\033[33m" : "\033[31m";
        std::cout << "    \033[90m" << timestamp() << "\033[0m  " << final->id << "  "
                  << color << toString(final->state) << "\033[0m  " << final->message << "\n";
        for (const auto& error : results->errors) {
            std::cout << "      \033[31m" << error << "\033[0m\n";
        }
        if (!final->outputPath.empty() && results->succeeded > 0) {
            std::cout << "    output  \033[36m" << final->outputPath.string() << "\033[0m\n";
        }

        switch (final->state) {
            case JobState::Completed: return results->failed == 0 ? 0 : 2;
            case JobState::Cancelled: return 130;
            default: return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
