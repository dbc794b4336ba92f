/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace inkwash {

struct ArchiveEntry {
    std::filesystem::path source;
    std::string name;   // path inside the archive
};

[[nodiscard]] bool isArchivePath(const std::filesystem::path& path);

// Extracts every regular file under destDir; entries with absolute paths or ".."
// components are skipped. Throws ArchiveError.
std::size_t extractArchive(const std::filesystem::path& archive, const std::filesystem::path& destDir);

// Names of the regular file entries, read from headers only. Throws ArchiveError.
[[nodiscard]] std::vector<std::string> listArchiveEntries(const std::filesystem::path& archive);

// Writes a deflate-compressed zip. Throws ArchiveError; a partial file is removed.
void writeZip(const std::filesystem::path& zipPath, const std::vector<ArchiveEntry>& entries);

}
