/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "inkwash/types.hpp"

namespace inkwash {

// Temporary directory removed with everything in it when the owner goes away.
class ScratchDir final {
public:
    // mkdtemp under parent. Throws Error.
    static ScratchDir create(const std::filesystem::path& parent, const std::string& prefix);

    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;
    ScratchDir(ScratchDir&& other) noexcept;
    ScratchDir& operator=(ScratchDir&& other) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit ScratchDir(std::filesystem::path path) noexcept : path_(std::move(path)) {}
    void removeNow() noexcept;

    std::filesystem::path path_;
};

struct PageRef {
    std::filesystem::path file;
    std::size_t itemIndex = 0;
};

class Resolver {
public:
    explicit Resolver(std::filesystem::path scratchRoot = std::filesystem::temp_directory_path());

    // Pages of one item. Archives are extracted into a new ScratchDir appended to scratch.
    // Throws NotFoundError, UnsupportedInputError or ArchiveError.
    [[nodiscard]] std::vector<std::filesystem::path> resolve(const BatchItem& item,
                                                             std::vector<ScratchDir>& scratch) const;

    // Items in submission order, natural order inside each item.
    [[nodiscard]] std::vector<PageRef> resolveAll(const std::vector<BatchItem>& items,
                                                  std::vector<ScratchDir>& scratch) const;

    // Page count without extracting anything; unreadable inputs count zero.
    [[nodiscard]] std::size_t countPages(const BatchItem& item) const;

    [[nodiscard]] static std::vector<std::filesystem::path> scanFolder(const std::filesystem::path& dir);

private:
    std::filesystem::path scratchRoot_;
};

// "page2" < "page10"; digit runs compare by value, letters case-insensitively.
[[nodiscard]] bool naturalLess(const std::string& a, const std::string& b);

[[nodiscard]] ItemKind inferItemKind(const std::filesystem::path& path);

// Auto becomes Archive when any item is an archive, Folder otherwise.
[[nodiscard]] OutputFormat resolveOutputFormat(OutputFormat requested, const std::vector<BatchItem>& items) noexcept;

}
