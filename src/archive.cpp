/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/archive.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>

#include <archive.h>
#include <archive_entry.h>

namespace inkwash {

namespace {

struct ReadDeleter {
    void operator()(archive* a) const noexcept { archive_read_free(a); }
};
struct WriteDeleter {
    void operator()(archive* a) const noexcept { archive_write_free(a); }
};
using ReadArchive = std::unique_ptr<archive, ReadDeleter>;
using WriteArchive = std::unique_ptr<archive, WriteDeleter>;

std::string archiveMessage(archive* a, const std::string& what) {
    const char* msg = archive_error_string(a);
    return what + (msg ? std::string(": ") + msg : std::string());
}

ReadArchive openForReading(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw ArchiveError("Archive not found: " + path.string());
    }
    ReadArchive a(archive_read_new());
    if (!a) {
        throw ArchiveError("Failed to create archive reader");
    }
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());

    if (archive_read_open_filename(a.get(), path.c_str(), 10240) != ARCHIVE_OK) {
        throw ArchiveError(archiveMessage(a.get(), "Failed to open archive " + path.filename().string()));
    }
    return a;
}

// Relative, no "..", no empty names.
bool isSafeEntryName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    std::filesystem::path p(name);
    if (p.is_absolute() || p.has_root_name()) {
        return false;
    }
    for (const auto& part : p) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

void copyData(archive* in, archive* out) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        int r = archive_read_data_block(in, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) {
            return;
        }
        if (r < ARCHIVE_WARN) {
            throw ArchiveError(archiveMessage(in, "Failed to read archive data"));
        }
        if (archive_write_data_block(out, buff, size, offset) < ARCHIVE_WARN) {
            throw ArchiveError(archiveMessage(out, "Failed to write extracted data"));
        }
    }
}

}

bool isArchivePath(const std::filesystem::path& path) {
    static const std::array<const char*, 7> kExtensions = {".zip", ".cbz", ".rar", ".cbr", ".7z", ".cb7", ".tar"};
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

std::size_t extractArchive(const std::filesystem::path& archivePath, const std::filesystem::path& destDir) {
    ReadArchive in = openForReading(archivePath);

    WriteArchive out(archive_write_disk_new());
    if (!out) {
        throw ArchiveError("Failed to create disk writer");
    }
    archive_write_disk_set_options(out.get(),
        ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(out.get());

    LOG_INFO("Extracting " + archivePath.filename().string() + " to " + destDir.string());

    std::size_t extracted = 0;
    archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(in.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            throw ArchiveError(archiveMessage(in.get(), "Corrupt archive " + archivePath.filename().string()));
        }

        const char* rawName = archive_entry_pathname(entry);
        const std::string name = rawName ? rawName : "";
        const auto type = archive_entry_filetype(entry);
        if (type != AE_IFREG && type != AE_IFDIR) {
            LOG_DEBUG("Skipping non-regular entry: " + name);
            continue;
        }
        if (!isSafeEntryName(name)) {
            LOG_WARN("Skipping unsafe archive entry: " + name);
            continue;
        }

        const std::string target = (destDir / name).string();
        archive_entry_set_pathname(entry, target.c_str());
        archive_entry_set_perm(entry, type == AE_IFDIR ? 0755 : 0644);

        if (archive_write_header(out.get(), entry) < ARCHIVE_WARN) {
            throw ArchiveError(archiveMessage(out.get(), "Failed to create " + target));
        }
        if (type == AE_IFREG && archive_entry_size(entry) > 0) {
            copyData(in.get(), out.get());
        }
        if (archive_write_finish_entry(out.get()) < ARCHIVE_WARN) {
            throw ArchiveError(archiveMessage(out.get(), "Failed to finish " + target));
        }
        if (type == AE_IFREG) {
            ++extracted;
        }
    }

    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        throw ArchiveError(archiveMessage(out.get(), "Failed to close extraction"));
    }
    LOG_DEBUG("Extracted " + std::to_string(extracted) + " files from " + archivePath.filename().string());
    return extracted;
}

std::vector<std::string> listArchiveEntries(const std::filesystem::path& archivePath) {
    ReadArchive in = openForReading(archivePath);

    std::vector<std::string> names;
    archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(in.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            throw ArchiveError(archiveMessage(in.get(), "Corrupt archive " + archivePath.filename().string()));
        }
        if (archive_entry_filetype(entry) == AE_IFREG) {
            const char* name = archive_entry_pathname(entry);
            if (name) {
                names.emplace_back(name);
            }
        }
        if (archive_read_data_skip(in.get()) < ARCHIVE_WARN) {
            throw ArchiveError(archiveMessage(in.get(), "Corrupt archive " + archivePath.filename().string()));
        }
    }
    return names;
}

void writeZip(const std::filesystem::path& zipPath, const std::vector<ArchiveEntry>& entries) {
    std::error_code ec;
    if (zipPath.has_parent_path()) {
        std::filesystem::create_directories(zipPath.parent_path(), ec);
    }

    auto fail = [&zipPath](const std::string& message) {
        std::error_code rmEc;
        std::filesystem::remove(zipPath, rmEc);
        throw ArchiveError(message);
    };

    {
        WriteArchive out(archive_write_new());
        if (!out) {
            throw ArchiveError("Failed to create archive writer");
        }
        archive_write_set_format_zip(out.get());
        archive_write_zip_set_compression_deflate(out.get());
        if (archive_write_open_filename(out.get(), zipPath.c_str()) != ARCHIVE_OK) {
            fail(archiveMessage(out.get(), "Failed to create " + zipPath.string()));
        }

        std::vector<char> buffer(64 * 1024);
        for (const auto& item : entries) {
            std::uintmax_t size = std::filesystem::file_size(item.source, ec);
            if (ec) {
                fail("Cannot read " + item.source.string() + ": " + ec.message());
            }
            std::ifstream file(item.source, std::ios::binary);
            if (!file) {
                fail("Cannot open " + item.source.string());
            }

            std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), &archive_entry_free);
            archive_entry_set_pathname(entry.get(), item.name.c_str());
            archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            if (archive_write_header(out.get(), entry.get()) != ARCHIVE_OK) {
                fail(archiveMessage(out.get(), "Failed to add " + item.name));
            }

            while (file) {
                file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                std::streamsize got = file.gcount();
                if (got > 0 && archive_write_data(out.get(), buffer.data(), static_cast<size_t>(got)) < 0) {
                    fail(archiveMessage(out.get(), "Failed to write " + item.name));
                }
            }
        }

        if (archive_write_close(out.get()) != ARCHIVE_OK) {
            fail(archiveMessage(out.get(), "Failed to finalize " + zipPath.string()));
        }
    }
    LOG_INFO("Packaged " + std::to_string(entries.size()) + " pages into " + zipPath.string());
}

}
