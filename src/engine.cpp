/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/engine.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/logger.hpp"
#include "inkwash/resolver.hpp"
#include <array>
#include <cstdio>
#include <sys/wait.h>
#include <utility>

namespace inkwash {

namespace {

constexpr std::size_t kOutputTail = 400;

void replaceAll(std::string& text, const std::string& token, const std::string& value) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

struct RunResult {
    int status = -1;
    std::string output;
};

RunResult run(const std::string& cmd) {
    RunResult result;
    FILE* pipe = ::popen((cmd + " 2>&1").c_str(), "r");
    if (!pipe) {
        throw EngineError("Failed to launch engine command");
    }
    std::array<char, 256> buf{};
    while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        result.output += buf.data();
    }
    result.status = ::pclose(pipe);
    return result;
}

std::string tail(const std::string& text) {
    if (text.size() <= kOutputTail) {
        return text;
    }
    return "..." + text.substr(text.size() - kOutputTail);
}

}

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

CommandEngine::CommandEngine(std::string command, std::filesystem::path scratchRoot)
    : command_(std::move(command)), scratchRoot_(std::move(scratchRoot)) {
}

void CommandEngine::prepare() {
    if (command_.find("{input}") == std::string::npos || command_.find("{output}") == std::string::npos) {
        throw EngineError("Engine command must reference {input} and {output}: " + command_);
    }
    LOG_INFO("Engine command: " + command_);
}

std::string CommandEngine::expand(const std::filesystem::path& input,
                                  const std::filesystem::path& output,
                                  const std::filesystem::path& mask,
                                  const std::string& guidance,
                                  const ColorizeParams& params) const {
    std::string cmd = command_;
    replaceAll(cmd, "{input}", shellQuote(input.string()));
    replaceAll(cmd, "{output}", shellQuote(output.string()));
    replaceAll(cmd, "{mask}", shellQuote(mask.string()));
    replaceAll(cmd, "{guidance}", shellQuote(guidance));
    replaceAll(cmd, "{ink}", std::to_string(params.inkThreshold));
    replaceAll(cmd, "{size}", std::to_string(params.size.width) + "x" + std::to_string(params.size.height));
    return cmd;
}

Image CommandEngine::colorize(const Image& page,
                              const ProtectionMask* mask,
                              const std::optional<std::string>& guidance,
                              const ColorizeParams& params) {
    ScratchDir dir = ScratchDir::create(scratchRoot_, "inkwash_engine_");
    const auto input = dir.path() / "input.png";
    const auto output = dir.path() / "output.png";
    const auto maskPath = dir.path() / "mask.png";

    savePng(input, page);
    if (mask) {
        savePng(maskPath, mask->image());
    } else {
        savePng(maskPath, Image(page.width, page.height, 1, 0));
    }

    const std::string hint = guidance.value_or("");
    const std::string cmd = "INKWASH_GUIDANCE=" + shellQuote(hint) + "; export INKWASH_GUIDANCE; " +
                            expand(input, output, maskPath, hint, params);
    LOG_DEBUG("Running engine: " + cmd);

    const RunResult result = run(cmd);
    if (!result.output.empty()) {
        LOG_TRACE("Engine output: " + result.output);
    }
    if (result.status == -1 || !WIFEXITED(result.status)) {
        throw EngineError("Engine terminated abnormally: " + tail(result.output));
    }
    if (WEXITSTATUS(result.status) != 0) {
        throw EngineError("Engine exited with status " + std::to_string(WEXITSTATUS(result.status)) +
                          ": " + tail(result.output));
    }
    if (!std::filesystem::exists(output)) {
        throw EngineError("Engine produced no output image");
    }
    return toRgb(loadImage(output));
}

}
