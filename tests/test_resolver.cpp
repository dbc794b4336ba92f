/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <algorithm>

#include "inkwash/archive.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/resolver.hpp"
#include "test_support.hpp"

using namespace inkwash;

namespace {

std::vector<std::string> names(const std::vector<std::filesystem::path>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths) {
        out.push_back(p.filename().string());
    }
    return out;
}

BatchItem item(ItemKind kind, const std::filesystem::path& path) {
    BatchItem b;
    b.kind = kind;
    b.path = path;
    return b;
}

}

TEST(NaturalOrder, NumbersCompareByValue) {
    EXPECT_TRUE(naturalLess("page1", "page2"));
    EXPECT_TRUE(naturalLess("page2", "page10"));
    EXPECT_FALSE(naturalLess("page10", "page2"));
    EXPECT_TRUE(naturalLess("Page1", "page2"));
    EXPECT_TRUE(naturalLess("page002", "page10"));
    EXPECT_TRUE(naturalLess("a", "b"));
    EXPECT_FALSE(naturalLess("same", "same"));
}

TEST(Resolver, FolderPagesInNaturalOrder) {
    test::TempDir dir;
    for (const char* name : {"page10.png", "page2.png", "page1.png"}) {
        savePng(dir / name, test::solid(8, 8, 255, 255, 255));
    }

    Resolver resolver;
    std::vector<ScratchDir> scratch;
    auto pages = resolver.resolve(item(ItemKind::Folder, dir.path()), scratch);
    EXPECT_EQ(names(pages), (std::vector<std::string>{"page1.png", "page2.png", "page10.png"}));
    EXPECT_TRUE(scratch.empty());
    for (const auto& p : pages) {
        EXPECT_TRUE(p.is_absolute());
    }
}

TEST(Resolver, FolderScanIsRecursiveAndSkipsJunk) {
    test::TempDir dir;
    test::touch(dir / "a" / "001.jpg");
    test::touch(dir / "b" / "002.PNG");
    test::touch(dir / "notes.txt");
    test::touch(dir / ".hidden.png");
    test::touch(dir / "__MACOSX" / "003.png");
    test::touch(dir / ".cache" / "004.png");

    auto pages = Resolver::scanFolder(dir.path());
    EXPECT_EQ(names(pages), (std::vector<std::string>{"001.jpg", "002.PNG"}));
}

TEST(Resolver, SingleFile) {
    test::TempDir dir;
    test::touch(dir / "cover.jpeg");
    Resolver resolver;
    std::vector<ScratchDir> scratch;
    auto pages = resolver.resolve(item(ItemKind::File, dir / "cover.jpeg"), scratch);
    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0].filename(), "cover.jpeg");
}

TEST(Resolver, RejectsBadInputs) {
    test::TempDir dir;
    test::touch(dir / "notes.txt");
    Resolver resolver;
    std::vector<ScratchDir> scratch;

    EXPECT_THROW(resolver.resolve(item(ItemKind::File, dir / "missing.png"), scratch), NotFoundError);
    EXPECT_THROW(resolver.resolve(item(ItemKind::File, dir / "notes.txt"), scratch), UnsupportedInputError);
    EXPECT_THROW(resolver.resolve(item(ItemKind::File, dir.path()), scratch), UnsupportedInputError);
    EXPECT_THROW(resolver.resolve(item(ItemKind::Folder, dir / "notes.txt"), scratch), UnsupportedInputError);
}

TEST(Resolver, ArchiveIsExtractedIntoScratchDir) {
    test::TempDir dir;
    test::TempDir scratchRoot;
    test::touch(dir / "src" / "p10.png");
    test::touch(dir / "src" / "p9.png");
    test::touch(dir / "src" / "readme.txt");
    writeZip(dir / "chapter.cbz", {
        {dir / "src" / "p10.png", "ch1/p10.png"},
        {dir / "src" / "p9.png", "ch1/p9.png"},
        {dir / "src" / "readme.txt", "readme.txt"},
    });

    Resolver resolver(scratchRoot.path());
    {
        std::vector<ScratchDir> scratch;
        auto pages = resolver.resolve(item(ItemKind::Archive, dir / "chapter.cbz"), scratch);
        EXPECT_EQ(names(pages), (std::vector<std::string>{"p9.png", "p10.png"}));
        ASSERT_EQ(scratch.size(), 1u);
        EXPECT_TRUE(std::filesystem::exists(pages[0]));
        EXPECT_FALSE(test::isEmptyDir(scratchRoot.path()));
    }
    EXPECT_TRUE(test::isEmptyDir(scratchRoot.path()));
}

TEST(Resolver, CorruptArchiveLeavesNothingBehind) {
    test::TempDir dir;
    test::TempDir scratchRoot;
    test::writeGarbage(dir / "broken.zip");

    Resolver resolver(scratchRoot.path());
    std::vector<ScratchDir> scratch;
    EXPECT_THROW(resolver.resolve(item(ItemKind::Archive, dir / "broken.zip"), scratch), ArchiveError);
    EXPECT_TRUE(scratch.empty());
    EXPECT_TRUE(test::isEmptyDir(scratchRoot.path()));
}

TEST(Resolver, CountPagesWithoutExtracting) {
    test::TempDir dir;
    test::touch(dir / "src" / "1.png");
    test::touch(dir / "src" / "2.jpg");
    test::touch(dir / "src" / "info.txt");
    writeZip(dir / "vol.zip", {
        {dir / "src" / "1.png", "1.png"},
        {dir / "src" / "2.jpg", "2.jpg"},
        {dir / "src" / "info.txt", "info.txt"},
        {dir / "src" / "1.png", "__MACOSX/._1.png"},
    });

    Resolver resolver;
    EXPECT_EQ(resolver.countPages(item(ItemKind::Archive, dir / "vol.zip")), 2u);
    EXPECT_EQ(resolver.countPages(item(ItemKind::Folder, dir / "src")), 2u);
    EXPECT_EQ(resolver.countPages(item(ItemKind::File, dir / "src" / "1.png")), 1u);
    EXPECT_EQ(resolver.countPages(item(ItemKind::File, dir / "nope.png")), 0u);
}

TEST(Resolver, ResolveAllKeepsSubmissionOrder) {
    test::TempDir dir;
    test::touch(dir / "b" / "1.png");
    test::touch(dir / "b" / "2.png");
    test::touch(dir / "a.png");

    Resolver resolver;
    std::vector<ScratchDir> scratch;
    auto pages = resolver.resolveAll({item(ItemKind::Folder, dir / "b"), item(ItemKind::File, dir / "a.png")}, scratch);
    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].file.filename(), "1.png");
    EXPECT_EQ(pages[1].file.filename(), "2.png");
    EXPECT_EQ(pages[2].file.filename(), "a.png");
    EXPECT_EQ(pages[2].itemIndex, 1u);
}

TEST(OutputFormatPolicy, AutoFollowsItems) {
    std::vector<BatchItem> folders{item(ItemKind::Folder, "x")};
    std::vector<BatchItem> mixed{item(ItemKind::Folder, "x"), item(ItemKind::Archive, "y.cbz")};
    EXPECT_EQ(resolveOutputFormat(OutputFormat::Auto, folders), OutputFormat::Folder);
    EXPECT_EQ(resolveOutputFormat(OutputFormat::Auto, mixed), OutputFormat::Archive);
    EXPECT_EQ(resolveOutputFormat(OutputFormat::Folder, mixed), OutputFormat::Folder);
    EXPECT_EQ(resolveOutputFormat(OutputFormat::Archive, folders), OutputFormat::Archive);
}

TEST(ItemKindInference, ByTypeAndExtension) {
    test::TempDir dir;
    EXPECT_EQ(inferItemKind(dir.path()), ItemKind::Folder);
    EXPECT_EQ(inferItemKind(dir / "vol1.CBZ"), ItemKind::Archive);
    EXPECT_EQ(inferItemKind(dir / "vol1.7z"), ItemKind::Archive);
    EXPECT_EQ(inferItemKind(dir / "page.png"), ItemKind::File);
}

TEST(ScratchDir, RemovedWithOwner) {
    test::TempDir root;
    std::filesystem::path path;
    {
        ScratchDir dir = ScratchDir::create(root.path(), "x_");
        path = dir.path();
        test::touch(path / "deep" / "file.png");
        ScratchDir moved = std::move(dir);
        EXPECT_TRUE(dir.path().empty());
        EXPECT_TRUE(std::filesystem::exists(path));
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(Parsing, AcceptsAliasesCaseInsensitively) {
    EXPECT_EQ(parseItemKind("ZIP"), ItemKind::Archive);
    EXPECT_EQ(parseItemKind("directory"), ItemKind::Folder);
    EXPECT_FALSE(parseItemKind("url").has_value());

    EXPECT_EQ(parseOutputFormat("Auto"), OutputFormat::Auto);
    EXPECT_EQ(parseOutputFormat("dir"), OutputFormat::Folder);
    EXPECT_FALSE(parseOutputFormat("tar").has_value());

    EXPECT_EQ(parseMaskStrategy("bubble"), MaskStrategy::Enclosed);
    EXPECT_EQ(parseMaskStrategy("ink"), MaskStrategy::Proximity);
    EXPECT_EQ(parseMaskStrategy("OFF"), MaskStrategy::None);
    EXPECT_FALSE(parseMaskStrategy("auto").has_value());
}
