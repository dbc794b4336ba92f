/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/resolver.hpp"
#include "inkwash/archive.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/image.hpp"
#include "inkwash/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <set>

namespace inkwash {

namespace {

// Hidden files and macOS resource forks that ride along in zipped chapters.
bool isJunkComponent(const std::filesystem::path& part) {
    const std::string name = part.string();
    return name.empty() || name[0] == '.' || name == "__MACOSX";
}

bool isPageCandidate(const std::filesystem::path& relative) {
    for (const auto& part : relative) {
        if (isJunkComponent(part)) {
            return false;
        }
    }
    return isSupportedImage(relative);
}

void sortPages(std::vector<std::filesystem::path>& pages) {
    std::sort(pages.begin(), pages.end(), [](const auto& a, const auto& b) {
        const std::string an = a.filename().string();
        const std::string bn = b.filename().string();
        if (naturalLess(an, bn)) return true;
        if (naturalLess(bn, an)) return false;
        return naturalLess(a.string(), b.string());
    });
}

int compareDigits(const std::string& a, std::size_t& i, const std::string& b, std::size_t& j) {
    std::size_t ai = i;
    std::size_t bj = j;
    while (i < a.size() && std::isdigit(static_cast<unsigned char>(a[i]))) ++i;
    while (j < b.size() && std::isdigit(static_cast<unsigned char>(b[j]))) ++j;

    std::size_t as = ai;
    std::size_t bs = bj;
    while (as + 1 < i && a[as] == '0') ++as;
    while (bs + 1 < j && b[bs] == '0') ++bs;

    const std::size_t alen = i - as;
    const std::size_t blen = j - bs;
    if (alen != blen) {
        return alen < blen ? -1 : 1;
    }
    int c = a.compare(as, alen, b, bs, blen);
    if (c != 0) {
        return c;
    }
    // Same value: fewer leading zeros first so "2" < "02".
    const std::size_t aw = i - ai;
    const std::size_t bw = j - bj;
    return aw == bw ? 0 : (aw < bw ? -1 : 1);
}

}

ScratchDir ScratchDir::create(const std::filesystem::path& parent, const std::string& prefix) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw Error("Cannot create scratch root " + parent.string() + ": " + ec.message());
    }

    std::string templ = (parent / (prefix + "XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw Error("mkdtemp failed under " + parent.string() + ": " + std::strerror(errno));
    }
    LOG_DEBUG("Created scratch directory: " + std::string(buf.data()));
    return ScratchDir(std::filesystem::path(buf.data()));
}

ScratchDir::~ScratchDir() {
    removeNow();
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
    if (this != &other) {
        removeNow();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScratchDir::removeNow() noexcept {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        LOG_WARN("Failed to remove scratch directory " + path_.string() + ": " + ec.message());
    } else {
        LOG_DEBUG("Removed scratch directory: " + path_.string());
    }
    path_.clear();
}

Resolver::Resolver(std::filesystem::path scratchRoot) : scratchRoot_(std::move(scratchRoot)) {
}

std::vector<std::filesystem::path> Resolver::resolve(const BatchItem& item,
                                                     std::vector<ScratchDir>& scratch) const {
    const auto& path = item.path;
    if (!std::filesystem::exists(path)) {
        throw NotFoundError("Input path not found: " + path.string());
    }

    switch (item.kind) {
        case ItemKind::File: {
            if (!std::filesystem::is_regular_file(path) || !isSupportedImage(path)) {
                throw UnsupportedInputError("Unsupported input type: " + path.string());
            }
            return {std::filesystem::absolute(path).lexically_normal()};
        }
        case ItemKind::Folder: {
            if (!std::filesystem::is_directory(path)) {
                throw UnsupportedInputError("Not a folder: " + path.string());
            }
            return scanFolder(path);
        }
        case ItemKind::Archive: {
            if (!std::filesystem::is_regular_file(path)) {
                throw UnsupportedInputError("Not an archive file: " + path.string());
            }
            // Partial extractions vanish with dir if extractArchive throws.
            ScratchDir dir = ScratchDir::create(scratchRoot_, "inkwash_");
            extractArchive(path, dir.path());
            auto pages = scanFolder(dir.path());
            scratch.push_back(std::move(dir));
            return pages;
        }
    }
    throw UnsupportedInputError("Unsupported input type: " + path.string());
}

std::vector<PageRef> Resolver::resolveAll(const std::vector<BatchItem>& items,
                                          std::vector<ScratchDir>& scratch) const {
    std::vector<PageRef> all;
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto pages = resolve(items[i], scratch);
        LOG_INFO("Found " + std::to_string(pages.size()) + " images in " + items[i].path.filename().string());
        for (auto& page : pages) {
            all.push_back(PageRef{std::move(page), i});
        }
    }
    return all;
}

std::size_t Resolver::countPages(const BatchItem& item) const {
    try {
        if (!std::filesystem::exists(item.path)) {
            return 0;
        }
        switch (item.kind) {
            case ItemKind::File:
                return std::filesystem::is_regular_file(item.path) && isSupportedImage(item.path) ? 1 : 0;
            case ItemKind::Folder:
                return std::filesystem::is_directory(item.path) ? scanFolder(item.path).size() : 0;
            case ItemKind::Archive: {
                std::size_t count = 0;
                for (const auto& name : listArchiveEntries(item.path)) {
                    if (isPageCandidate(std::filesystem::path(name))) {
                        ++count;
                    }
                }
                return count;
            }
        }
    } catch (const Error& e) {
        LOG_DEBUG("Cannot count pages in " + item.path.string() + ": " + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_DEBUG("Cannot count pages in " + item.path.string() + ": " + e.what());
    }
    return 0;
}

std::vector<std::filesystem::path> Resolver::scanFolder(const std::filesystem::path& dir) {
    std::set<std::filesystem::path> unique;
    const auto root = std::filesystem::absolute(dir).lexically_normal();
    for (auto it = std::filesystem::recursive_directory_iterator(root); it != std::filesystem::recursive_directory_iterator(); ++it) {
        const auto relative = it->path().lexically_relative(root);
        if (it->is_directory() && isJunkComponent(it->path().filename())) {
            it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file() || !isPageCandidate(relative)) {
            continue;
        }
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(it->path(), ec);
        unique.insert(ec ? it->path() : canonical);
    }

    std::vector<std::filesystem::path> pages(unique.begin(), unique.end());
    sortPages(pages);
    LOG_DEBUG("Scanned " + dir.string() + ": " + std::to_string(pages.size()) + " pages");
    return pages;
}

bool naturalLess(const std::string& a, const std::string& b) {
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[j]);
        if (std::isdigit(ca) && std::isdigit(cb)) {
            int c = compareDigits(a, i, b, j);
            if (c != 0) {
                return c < 0;
            }
            continue;
        }
        const int la = std::tolower(ca);
        const int lb = std::tolower(cb);
        if (la != lb) {
            return la < lb;
        }
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j)) {
        return (a.size() - i) < (b.size() - j);
    }
    return a < b;
}

ItemKind inferItemKind(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return ItemKind::Folder;
    }
    return isArchivePath(path) ? ItemKind::Archive : ItemKind::File;
}

OutputFormat resolveOutputFormat(OutputFormat requested, const std::vector<BatchItem>& items) noexcept {
    if (requested != OutputFormat::Auto) {
        return requested;
    }
    bool hasArchive = std::any_of(items.begin(), items.end(),
                                  [](const BatchItem& item) { return item.kind == ItemKind::Archive; });
    return hasArchive ? OutputFormat::Archive : OutputFormat::Folder;
}

}
