/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/types.hpp"
#include <algorithm>
#include <cctype>

namespace inkwash {

namespace {
std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}
}

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Created:    return "created";
        case JobState::Processing: return "processing";
        case JobState::Completed:  return "completed";
        case JobState::Cancelled:  return "cancelled";
        case JobState::Failed:     return "failed";
    }
    return "unknown";
}

const char* toString(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::File:    return "file";
        case ItemKind::Folder:  return "folder";
        case ItemKind::Archive: return "archive";
    }
    return "unknown";
}

const char* toString(OutputFormat format) noexcept {
    switch (format) {
        case OutputFormat::Auto:    return "auto";
        case OutputFormat::Folder:  return "folder";
        case OutputFormat::Archive: return "archive";
    }
    return "unknown";
}

const char* toString(MaskStrategy strategy) noexcept {
    switch (strategy) {
        case MaskStrategy::Enclosed:  return "enclosed";
        case MaskStrategy::Proximity: return "proximity";
        case MaskStrategy::None:      return "none";
    }
    return "unknown";
}

std::optional<ItemKind> parseItemKind(const std::string& value) {
    std::string v = toLowerCopy(value);
    if (v == "file") return ItemKind::File;
    if (v == "folder" || v == "dir" || v == "directory") return ItemKind::Folder;
    if (v == "archive" || v == "zip") return ItemKind::Archive;
    return std::nullopt;
}

std::optional<OutputFormat> parseOutputFormat(const std::string& value) {
    std::string v = toLowerCopy(value);
    if (v == "auto") return OutputFormat::Auto;
    if (v == "folder" || v == "dir") return OutputFormat::Folder;
    if (v == "archive" || v == "zip") return OutputFormat::Archive;
    return std::nullopt;
}

std::optional<MaskStrategy> parseMaskStrategy(const std::string& value) {
    std::string v = toLowerCopy(value);
    if (v == "enclosed" || v == "bubble") return MaskStrategy::Enclosed;
    if (v == "proximity" || v == "ink") return MaskStrategy::Proximity;
    if (v == "none" || v == "off") return MaskStrategy::None;
    return std::nullopt;
}

}
