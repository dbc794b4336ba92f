/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <mutex>

#include "inkwash/archive.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/orchestrator.hpp"
#include "test_support.hpp"

using namespace inkwash;

namespace {

struct EngineCall {
    Size input;
    bool masked = false;
    std::optional<std::string> guidance;
};

// Paints every page warm red and remembers what it was asked to do.
class FakeEngine final : public Engine {
public:
    Image colorize(const Image& page, const ProtectionMask* mask,
                   const std::optional<std::string>& guidance, const ColorizeParams& params) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(EngineCall{params.size, mask != nullptr, guidance});
        if (failOn_ != 0 && calls_.size() == failOn_) {
            throw EngineError("engine exploded");
        }
        return test::solid(page.width, page.height, 200, 50, 50);
    }
    const char* name() const noexcept override { return "fake"; }

    void failOnCall(std::size_t n) { failOn_ = n; }
    std::vector<EngineCall> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::mutex mutex_;
    std::vector<EngineCall> calls_;
    std::size_t failOn_ = 0;
};

class CancelAt final : public ProgressObserver {
public:
    CancelAt(Orchestrator*& orchestrator, std::size_t at) : orchestrator_(orchestrator), at_(at) {}
    void onProgress(const JobId& id, std::size_t current, std::size_t, const std::string&) override {
        if (current == at_) {
            orchestrator_->cancel(id);
        }
    }

private:
    Orchestrator*& orchestrator_;
    std::size_t at_;
};

class Recorder final : public ProgressObserver {
public:
    void onProgress(const JobId&, std::size_t current, std::size_t total, const std::string& filename) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(std::to_string(current) + "/" + std::to_string(total) + " " + filename);
    }
    void onFinished(const JobStatus& status) override {
        std::lock_guard<std::mutex> lock(mutex_);
        finished.push_back(status.state);
    }

    std::mutex mutex_;
    std::vector<std::string> events;
    std::vector<JobState> finished;
};

class RemoveAt final : public ProgressObserver {
public:
    RemoveAt(Orchestrator*& orchestrator, std::size_t at) : orchestrator_(orchestrator), at_(at) {}
    void onProgress(const JobId& id, std::size_t current, std::size_t, const std::string&) override {
        if (current == at_) {
            removed = orchestrator_->remove(id);
            attempted = true;
        }
    }

    bool attempted = false;
    bool removed = false;

private:
    Orchestrator*& orchestrator_;
    std::size_t at_;
};

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.outputRoot = work / "output";
        config.libraryRoot = work / "library";
        config.scratchRoot = work / "scratch";
        std::filesystem::create_directories(config.scratchRoot);
    }

    std::filesystem::path writePages(const std::string& folder, int count) {
        const auto dir = work / folder;
        for (int i = 1; i <= count; ++i) {
            savePng(dir / ("page" + std::to_string(i) + ".png"), test::solid(40, 30, 200, 200, 200));
        }
        return dir;
    }

    static BatchItem folderItem(const std::filesystem::path& path) {
        BatchItem item;
        item.kind = ItemKind::Folder;
        item.path = path;
        return item;
    }

    JobStatus runToEnd(Orchestrator& orchestrator, std::vector<BatchItem> items, Settings settings = {}) {
        auto submitted = orchestrator.submit(std::move(items), settings);
        EXPECT_TRUE(submitted.ok) << submitted.message;
        EXPECT_TRUE(orchestrator.start(submitted.id));
        auto status = orchestrator.wait(submitted.id);
        EXPECT_TRUE(status.has_value());
        return status.value_or(JobStatus{});
    }

    test::TempDir work;
    OrchestratorConfig config;
    FakeEngine engine;
};

}

TEST_F(OrchestratorTest, FolderJobCompletes) {
    auto dir = writePages("chapter", 5);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto submitted = orchestrator.submit({folderItem(dir)});
    ASSERT_TRUE(submitted);
    EXPECT_EQ(submitted.total, 5u);
    EXPECT_EQ(orchestrator.status(submitted.id)->state, JobState::Created);

    ASSERT_TRUE(orchestrator.start(submitted.id));
    auto status = orchestrator.wait(submitted.id);
    ASSERT_TRUE(status);
    EXPECT_EQ(status->state, JobState::Completed);
    EXPECT_EQ(status->current, 5u);
    EXPECT_EQ(status->total, 5u);
    EXPECT_EQ(status->message, "Completed 5/5 images");
    EXPECT_FALSE(status->etaSeconds.has_value());

    auto results = orchestrator.results(submitted.id);
    ASSERT_TRUE(results);
    EXPECT_EQ(results->succeeded, 5u);
    EXPECT_EQ(results->failed, 0u);
    const auto jobDir = config.outputRoot / ("batch_" + submitted.id);
    for (int i = 1; i <= 5; ++i) {
        const auto out = jobDir / ("page" + std::to_string(i) + "_colored.png");
        ASSERT_TRUE(std::filesystem::exists(out)) << out;
    }
    Image first = loadImage(jobDir / "page1_colored.png");
    EXPECT_EQ(first.width, 40);
    EXPECT_EQ(first.height, 30);
    EXPECT_EQ(first.at(0, 0)[0], 200);
    EXPECT_EQ(first.at(0, 0)[1], 50);
}

TEST_F(OrchestratorTest, EngineSeesProcessingSize) {
    auto dir = writePages("chapter", 1);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    Settings settings;
    settings.maxSide = 20;

    auto status = runToEnd(orchestrator, {folderItem(dir)}, settings);
    EXPECT_EQ(status.state, JobState::Completed);
    auto calls = engine.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].input.width, 16);
    EXPECT_EQ(calls[0].input.height, 8);
}

TEST_F(OrchestratorTest, CorruptPageIsRecordedAndSkipped) {
    auto dir = writePages("chapter", 4);
    test::writeGarbage(dir / "page3b.png");
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto status = runToEnd(orchestrator, {folderItem(dir)});
    EXPECT_EQ(status.state, JobState::Completed);
    EXPECT_EQ(status.message, "Completed 4/5 images");

    auto results = orchestrator.results(status.id);
    ASSERT_TRUE(results);
    ASSERT_EQ(results->results.size(), 5u);
    EXPECT_EQ(results->succeeded, 4u);
    EXPECT_EQ(results->failed, 1u);
    const auto* failure = std::get_if<PageFailure>(&results->results[3]);
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->input.filename(), "page3b.png");
    ASSERT_EQ(results->errors.size(), 1u);
    EXPECT_EQ(results->errors[0].rfind("Failed to process page3b.png: ", 0), 0u);
    EXPECT_EQ(status.errors, results->errors);
    EXPECT_EQ(orchestrator.status(status.id)->errors, results->errors);
}

TEST_F(OrchestratorTest, EngineErrorIsPerPage) {
    auto dir = writePages("chapter", 3);
    engine.failOnCall(2);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto status = runToEnd(orchestrator, {folderItem(dir)});
    EXPECT_EQ(status.state, JobState::Completed);
    auto results = orchestrator.results(status.id);
    EXPECT_EQ(results->succeeded, 2u);
    EXPECT_EQ(results->errors.at(0), "Failed to process page2.png: engine exploded");
}

TEST_F(OrchestratorTest, CancelAfterSecondPage) {
    auto dir = writePages("chapter", 5);
    Orchestrator* self = nullptr;
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    self = &orchestrator;
    orchestrator.addObserver(std::make_shared<CancelAt>(self, 2));

    auto status = runToEnd(orchestrator, {folderItem(dir)});
    EXPECT_EQ(status.state, JobState::Cancelled);
    EXPECT_EQ(status.current, 2u);
    auto results = orchestrator.results(status.id);
    EXPECT_EQ(results->results.size(), 2u);
    EXPECT_EQ(engine.calls().size(), 2u);
    EXPECT_FALSE(orchestrator.cancel(status.id));
}

TEST_F(OrchestratorTest, ProgressIsReportedPerPage) {
    auto dir = writePages("chapter", 3);
    auto recorder = std::make_shared<Recorder>();
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    orchestrator.addObserver(recorder);

    runToEnd(orchestrator, {folderItem(dir)});
    std::lock_guard<std::mutex> lock(recorder->mutex_);
    EXPECT_EQ(recorder->events, (std::vector<std::string>{"1/3 page1.png", "2/3 page2.png", "3/3 page3.png"}));
    EXPECT_EQ(recorder->finished, (std::vector<JobState>{JobState::Completed}));
}

TEST_F(OrchestratorTest, GuidanceFollowsPreviousPages) {
    auto dir = writePages("chapter", 3);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    runToEnd(orchestrator, {folderItem(dir)});

    auto calls = engine.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_FALSE(calls[0].guidance.has_value());
    EXPECT_EQ(calls[1].guidance.value_or(""), "maintaining warm red and orange tones from previous pages");
    EXPECT_TRUE(calls[2].guidance.has_value());
}

TEST_F(OrchestratorTest, ChapterChangeResetsGuidance) {
    auto one = writePages("one", 1);
    auto two = writePages("two", 1);
    BatchItem first = folderItem(one);
    first.collection = "Title";
    first.chapter = "1";
    BatchItem second = folderItem(two);
    second.collection = "Title";
    second.chapter = "2";

    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    runToEnd(orchestrator, {first, second});
    auto calls = engine.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_FALSE(calls[1].guidance.has_value());
}

TEST_F(OrchestratorTest, LibraryLayoutKeepsStem) {
    auto dir = writePages("raw", 2);
    BatchItem item = folderItem(dir);
    item.collection = "Some Title";
    item.chapter = "ch-12";

    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    auto status = runToEnd(orchestrator, {item});
    EXPECT_EQ(status.state, JobState::Completed);
    const auto chapterDir = config.libraryRoot / "Some Title" / "ch-12";
    EXPECT_TRUE(std::filesystem::exists(chapterDir / "page1.png"));
    EXPECT_TRUE(std::filesystem::exists(chapterDir / "page2.png"));
    EXPECT_FALSE(std::filesystem::exists(config.outputRoot / ("batch_" + status.id)));
    EXPECT_EQ(status.outputPath, chapterDir);
}

TEST_F(OrchestratorTest, ArchiveJobPackagesSuccessesOnly) {
    auto src = writePages("src", 3);
    test::writeGarbage(src / "page2.png");
    writeZip(work / "chapter.cbz", {
        {src / "page1.png", "page1.png"},
        {src / "page2.png", "page2.png"},
        {src / "page3.png", "page3.png"},
    });
    BatchItem item;
    item.kind = ItemKind::Archive;
    item.path = work / "chapter.cbz";

    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    auto submitted = orchestrator.submit({item});
    ASSERT_TRUE(submitted);
    EXPECT_EQ(submitted.total, 3u);
    ASSERT_TRUE(orchestrator.start(submitted.id));
    auto status = orchestrator.wait(submitted.id);
    ASSERT_TRUE(status);

    EXPECT_EQ(status->state, JobState::Completed);
    const auto zip = config.outputRoot / ("batch_" + submitted.id + ".zip");
    EXPECT_EQ(status->outputPath, zip);
    auto entries = listArchiveEntries(zip);
    std::sort(entries.begin(), entries.end());
    const std::string prefix = "batch_" + submitted.id + "/";
    EXPECT_EQ(entries, (std::vector<std::string>{prefix + "page1_colored.png", prefix + "page3_colored.png"}));
    EXPECT_TRUE(test::isEmptyDir(config.scratchRoot));
}

TEST_F(OrchestratorTest, CancelledArchiveJobCleansScratch) {
    auto src = writePages("src", 4);
    writeZip(work / "vol.zip", {
        {src / "page1.png", "page1.png"},
        {src / "page2.png", "page2.png"},
        {src / "page3.png", "page3.png"},
        {src / "page4.png", "page4.png"},
    });
    BatchItem item;
    item.kind = ItemKind::Archive;
    item.path = work / "vol.zip";

    Orchestrator* self = nullptr;
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    self = &orchestrator;
    orchestrator.addObserver(std::make_shared<CancelAt>(self, 1));

    auto status = runToEnd(orchestrator, {item});
    EXPECT_EQ(status.state, JobState::Cancelled);
    EXPECT_TRUE(test::isEmptyDir(config.scratchRoot));
    // Cancelled jobs still package what they finished.
    auto entries = listArchiveEntries(config.outputRoot / ("batch_" + status.id + ".zip"));
    EXPECT_EQ(entries.size(), 1u);
}

TEST_F(OrchestratorTest, ExplicitFolderFormatSkipsPackaging) {
    auto src = writePages("src", 1);
    writeZip(work / "vol.zip", {{src / "page1.png", "page1.png"}});
    BatchItem item;
    item.kind = ItemKind::Archive;
    item.path = work / "vol.zip";
    Settings settings;
    settings.outputFormat = OutputFormat::Folder;

    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    auto status = runToEnd(orchestrator, {item}, settings);
    EXPECT_EQ(status.state, JobState::Completed);
    EXPECT_FALSE(std::filesystem::exists(config.outputRoot / ("batch_" + status.id + ".zip")));
    EXPECT_TRUE(std::filesystem::exists(config.outputRoot / ("batch_" + status.id) / "page1_colored.png"));
}

TEST_F(OrchestratorTest, EmptyInputFails) {
    std::filesystem::create_directories(work / "empty");
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto status = runToEnd(orchestrator, {folderItem(work / "empty")});
    EXPECT_EQ(status.state, JobState::Failed);
    EXPECT_EQ(status.message, "No valid images found");
}

TEST_F(OrchestratorTest, MissingInputFailsWholeJob) {
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto status = runToEnd(orchestrator, {folderItem(work / "nowhere")});
    EXPECT_EQ(status.state, JobState::Failed);
    auto results = orchestrator.results(status.id);
    ASSERT_EQ(results->errors.size(), 1u);
    EXPECT_EQ(results->errors[0].rfind("Batch processing failed: Input path not found", 0), 0u);
    EXPECT_TRUE(results->results.empty());
    EXPECT_TRUE(engine.calls().empty());
}

TEST_F(OrchestratorTest, StartOnlyFromCreated) {
    auto dir = writePages("chapter", 1);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    EXPECT_FALSE(orchestrator.start("no-such-job"));
    auto submitted = orchestrator.submit({folderItem(dir)});
    ASSERT_TRUE(orchestrator.start(submitted.id));
    EXPECT_FALSE(orchestrator.start(submitted.id));
    orchestrator.wait(submitted.id);
    EXPECT_FALSE(orchestrator.start(submitted.id));
    EXPECT_EQ(engine.calls().size(), 1u);
}

TEST_F(OrchestratorTest, SubmitRejectsEmptyBatch) {
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    auto submitted = orchestrator.submit({});
    EXPECT_FALSE(submitted);
    EXPECT_EQ(submitted.error, SubmitError::InvalidContent);
    EXPECT_TRUE(orchestrator.list().empty());
}

TEST_F(OrchestratorTest, CreatedJobsCanBeListedAndRemoved) {
    auto dir = writePages("chapter", 2);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    auto a = orchestrator.submit({folderItem(dir)});
    auto b = orchestrator.submit({folderItem(dir)});

    auto jobs = orchestrator.list();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].id, a.id);
    EXPECT_EQ(jobs[1].id, b.id);
    EXPECT_FALSE(orchestrator.cancel(a.id));

    EXPECT_TRUE(orchestrator.remove(a.id));
    EXPECT_FALSE(orchestrator.status(a.id).has_value());
    EXPECT_FALSE(orchestrator.remove(a.id));
    EXPECT_EQ(orchestrator.list().size(), 1u);
}

TEST_F(OrchestratorTest, MaskIsPassedForBubblePages) {
    savePng(work / "bubbles" / "p1.png", test::bubblePage(64, 64, 16, 16, 48, 40));
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    runToEnd(orchestrator, {folderItem(work / "bubbles")});
    auto calls = engine.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_TRUE(calls[0].masked);

    Settings off;
    off.maskStrategy = MaskStrategy::None;
    runToEnd(orchestrator, {folderItem(work / "bubbles")}, off);
    calls = engine.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_FALSE(calls[1].masked);
}

TEST_F(OrchestratorTest, ProtectedRegionsAndInkSurviveColorization) {
    Image page = test::bubblePage(64, 64, 16, 16, 48, 40);
    savePng(work / "bubbles" / "p1.png", page);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto status = runToEnd(orchestrator, {folderItem(work / "bubbles")});
    ASSERT_EQ(status.state, JobState::Completed);
    Image out = loadImage(config.outputRoot / ("batch_" + status.id) / "p1_colored.png");
    // bubble interior keeps white paper, outline keeps ink, margin is recolored
    EXPECT_EQ(out.at(32, 28)[1], 255);
    EXPECT_EQ(out.at(16, 16)[0], 0);
    EXPECT_EQ(out.at(2, 2)[1], 50);
}

TEST_F(OrchestratorTest, SameNamedPagesFromDifferentItemsKeepTheirOwnOutput) {
    savePng(work / "a" / "001.png", test::solid(16, 16, 200, 200, 200));
    savePng(work / "b" / "001.png", test::solid(24, 16, 200, 200, 200));
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto status = runToEnd(orchestrator, {folderItem(work / "a"), folderItem(work / "b")});
    EXPECT_EQ(status.state, JobState::Completed);
    auto results = orchestrator.results(status.id);
    ASSERT_EQ(results->succeeded, 2u);
    const auto* first = std::get_if<PageSuccess>(&results->results[0]);
    const auto* second = std::get_if<PageSuccess>(&results->results[1]);
    ASSERT_NE(first, nullptr);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(first->output, second->output);

    const auto jobDir = config.outputRoot / ("batch_" + status.id);
    EXPECT_EQ(first->output, jobDir / "001_colored.png");
    EXPECT_EQ(second->output, jobDir / "001_colored_2.png");
    EXPECT_EQ(loadImage(first->output).width, 16);
    EXPECT_EQ(loadImage(second->output).width, 24);
}

TEST_F(OrchestratorTest, SameNamedArchivePagesGetDistinctEntries) {
    auto src = writePages("src", 1);
    writeZip(work / "ch1.cbz", {{src / "page1.png", "page1.png"}});
    writeZip(work / "ch2.cbz", {{src / "page1.png", "page1.png"}});
    BatchItem first;
    first.kind = ItemKind::Archive;
    first.path = work / "ch1.cbz";
    BatchItem second = first;
    second.path = work / "ch2.cbz";

    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    auto status = runToEnd(orchestrator, {first, second});
    EXPECT_EQ(status.state, JobState::Completed);

    auto entries = listArchiveEntries(config.outputRoot / ("batch_" + status.id + ".zip"));
    std::sort(entries.begin(), entries.end());
    const std::string prefix = "batch_" + status.id + "/";
    EXPECT_EQ(entries, (std::vector<std::string>{prefix + "page1_colored.png", prefix + "page1_colored_2.png"}));
}

TEST_F(OrchestratorTest, SubmitRejectsOutOfRangeSettings) {
    auto dir = writePages("chapter", 1);
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    Settings noSide;
    noSide.maxSide = 0;
    Settings darkInk;
    darkInk.inkThreshold = 300;
    Settings negativeInk;
    negativeInk.inkThreshold = -1;
    Settings noCeiling;
    noCeiling.maxCoverage = 0.0;
    Settings noHistory;
    noHistory.historySize = 0;

    for (const Settings& settings : {noSide, darkInk, negativeInk, noCeiling, noHistory}) {
        auto submitted = orchestrator.submit({folderItem(dir)}, settings);
        EXPECT_FALSE(submitted);
        EXPECT_EQ(submitted.error, SubmitError::InvalidContent);
        EXPECT_FALSE(submitted.message.empty());
    }
    EXPECT_TRUE(orchestrator.list().empty());

    Settings smallest;
    smallest.maxSide = 8;
    EXPECT_TRUE(orchestrator.submit({folderItem(dir)}, smallest));
}

TEST_F(OrchestratorTest, TinyPageFailsOnItsOwn) {
    auto dir = writePages("chapter", 2);
    savePng(dir / "page1a.png", test::solid(5, 40, 200, 200, 200));
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);

    auto status = runToEnd(orchestrator, {folderItem(dir)});
    EXPECT_EQ(status.state, JobState::Completed);
    EXPECT_EQ(status.message, "Completed 2/3 images");
    ASSERT_EQ(status.errors.size(), 1u);
    EXPECT_NE(status.errors[0].find("Page too small to process: 5x40"), std::string::npos);
    EXPECT_EQ(engine.calls().size(), 2u);
}

TEST_F(OrchestratorTest, RemoveRefusesRunningJob) {
    auto dir = writePages("chapter", 3);
    Orchestrator* self = nullptr;
    Orchestrator orchestrator(std::make_shared<MemoryJobStore>(), engine, config);
    self = &orchestrator;
    auto remover = std::make_shared<RemoveAt>(self, 1);
    orchestrator.addObserver(remover);

    auto status = runToEnd(orchestrator, {folderItem(dir)});
    EXPECT_TRUE(remover->attempted);
    EXPECT_FALSE(remover->removed);
    EXPECT_EQ(status.state, JobState::Completed);

    EXPECT_TRUE(orchestrator.remove(status.id));
    EXPECT_FALSE(orchestrator.status(status.id).has_value());
}
