/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "inkwash/image.hpp"
#include "inkwash/mask.hpp"

namespace inkwash {

struct ColorizeParams {
    int inkThreshold = 80;
    Size size;              // processing canvas the page was resized to
};

// Colorization backend. colorize may be called from several pool workers at
// once when more than one worker is configured.
class Engine {
public:
    virtual ~Engine() = default;

    // Called once before the first colorize. Throws EngineError.
    virtual void prepare() {}

    // mask is null when the page has nothing to protect. Throws EngineError.
    [[nodiscard]] virtual Image colorize(const Image& page,
                                         const ProtectionMask* mask,
                                         const std::optional<std::string>& guidance,
                                         const ColorizeParams& params) = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// Runs an external colorizer through the shell once per page.
// Placeholders in the command: {input} {output} {mask} {guidance} {ink} {size}.
// Guidance is also exported as INKWASH_GUIDANCE.
class CommandEngine final : public Engine {
public:
    explicit CommandEngine(std::string command,
                           std::filesystem::path scratchRoot = std::filesystem::temp_directory_path());

    void prepare() override;
    [[nodiscard]] Image colorize(const Image& page,
                                 const ProtectionMask* mask,
                                 const std::optional<std::string>& guidance,
                                 const ColorizeParams& params) override;
    [[nodiscard]] const char* name() const noexcept override { return "command"; }

    [[nodiscard]] const std::string& command() const noexcept { return command_; }

    // Command with placeholders replaced by shell-quoted values.
    [[nodiscard]] std::string expand(const std::filesystem::path& input,
                                     const std::filesystem::path& output,
                                     const std::filesystem::path& mask,
                                     const std::string& guidance,
                                     const ColorizeParams& params) const;

private:
    std::string command_;
    std::filesystem::path scratchRoot_;
};

[[nodiscard]] std::string shellQuote(const std::string& value);

}
