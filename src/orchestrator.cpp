/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/orchestrator.hpp"
#include "inkwash/archive.hpp"
#include "inkwash/compositor.hpp"
#include "inkwash/errors.hpp"
#include "inkwash/logger.hpp"
#include "inkwash/mask.hpp"
#include "inkwash/palette.hpp"
#include <chrono>
#include <set>
#include <sstream>
#include <unistd.h>

namespace inkwash {

namespace {

bool sameChapter(const BatchItem& a, const BatchItem& b) {
    return a.collection == b.collection && a.chapter == b.chapter;
}

// Empty when the settings are usable.
std::string validateSettings(const Settings& s) {
    if (s.inkThreshold < 0 || s.inkThreshold > 255) {
        return "Ink threshold must be between 0 and 255";
    }
    if (s.maxSide < 8) {
        return "Maximum side must be at least 8 pixels";
    }
    if (s.whiteThreshold < 0 || s.whiteThreshold > 255) {
        return "White threshold must be between 0 and 255";
    }
    if (!(s.maxCoverage > 0.0 && s.maxCoverage <= 1.0)) {
        return "Mask coverage ceiling must be in (0, 1]";
    }
    if (s.historySize == 0) {
        return "Color history must hold at least one page";
    }
    return "";
}

// Pages with the same stem from different items or archive folders get
// "_2", "_3", ... so no page of a job overwrites another.
std::filesystem::path claimOutput(const std::filesystem::path& dir,
                                  const std::string& stem,
                                  const std::string& suffix,
                                  std::set<std::filesystem::path>& claimed) {
    auto candidate = dir / (stem + suffix + ".png");
    for (int n = 2; !claimed.insert(candidate).second; ++n) {
        candidate = dir / (stem + suffix + "_" + std::to_string(n) + ".png");
    }
    return candidate;
}

}

Orchestrator::Orchestrator(std::shared_ptr<JobStore> store, Engine& engine, OrchestratorConfig config)
    : store_(std::move(store)),
      engine_(engine),
      config_(std::move(config)),
      resolver_(config_.scratchRoot),
      pool_(config_.workers) {
    if (!store_) {
        throw Error("Orchestrator requires a job store");
    }
    if (!pool_.start([this](const JobId& id, int) { runJob(id); })) {
        throw Error("Failed to start worker pool");
    }
    LOG_INFO("Orchestrator ready: engine=" + std::string(engine_.name()) +
             " workers=" + std::to_string(pool_.workerCount()) +
             " output=" + config_.outputRoot.string());
}

Orchestrator::~Orchestrator() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : tokens_) {
            entry.second->store(true);
        }
    }
    pool_.stop();
}

SubmitResult Orchestrator::submit(std::vector<BatchItem> items, Settings settings) {
    if (items.empty()) {
        LOG_WARN("Rejected batch with no items");
        return {false, "", 0, SubmitError::InvalidContent, "No items to process"};
    }
    for (const auto& item : items) {
        if (item.path.empty()) {
            LOG_WARN("Rejected batch item with empty path");
            return {false, "", 0, SubmitError::InvalidContent, "Batch item has no path"};
        }
    }
    if (const std::string problem = validateSettings(settings); !problem.empty()) {
        LOG_WARN("Rejected batch: " + problem);
        return {false, "", 0, SubmitError::InvalidContent, problem};
    }

    BatchJob job;
    job.id = generateId();
    for (const auto& item : items) {
        job.total += resolver_.countPages(item);
    }
    job.items = std::move(items);
    job.settings = settings;
    job.message = "Batch created with " + std::to_string(job.total) + " images";

    const JobId id = job.id;
    const std::size_t total = job.total;
    if (!store_->create(std::move(job))) {
        LOG_ERROR("Failed to store batch job: " + id);
        return {false, "", 0, SubmitError::StoreError, "Failed to store batch job"};
    }

    LOG_INFO("Created batch job " + id + " with " + std::to_string(total) + " images");
    return {true, id, total, SubmitError::None, ""};
}

bool Orchestrator::start(const JobId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool flipped = store_->update(id, [](BatchJob& job) {
            if (job.state != JobState::Created) {
                return false;
            }
            job.state = JobState::Processing;
            job.message = "Starting batch processing...";
            return true;
        });
        if (!flipped) {
            LOG_WARN("Cannot start batch " + id);
            return false;
        }
        tokens_[id] = std::make_shared<std::atomic<bool>>(false);
    }

    if (!pool_.submit(id)) {
        store_->update(id, [](BatchJob& job) {
            job.state = JobState::Failed;
            job.message = "Worker pool is not running";
            job.errors.push_back(job.message);
            return true;
        });
        finish(id);
        return false;
    }
    LOG_INFO("Started batch job " + id);
    return true;
}

std::optional<JobStatus> Orchestrator::status(const JobId& id) const {
    auto job = store_->get(id);
    if (!job) {
        return std::nullopt;
    }
    return statusOf(*job);
}

std::optional<JobResults> Orchestrator::results(const JobId& id) const {
    auto job = store_->get(id);
    if (!job) {
        return std::nullopt;
    }
    return resultsOf(*job);
}

bool Orchestrator::cancel(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool accepted = store_->update(id, [](BatchJob& job) {
        if (job.state != JobState::Processing) {
            return false;
        }
        job.message = "Batch processing cancelled by user";
        return true;
    });
    if (!accepted) {
        LOG_DEBUG("Cannot cancel batch " + id);
        return false;
    }
    auto it = tokens_.find(id);
    if (it != tokens_.end()) {
        it->second->store(true);
    }
    LOG_INFO("Cancelled batch " + id);
    return true;
}

bool Orchestrator::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto job = store_->get(id);
    if (!job || job->state == JobState::Processing) {
        return false;
    }
    if (!store_->remove(id)) {
        return false;
    }
    tokens_.erase(id);
    LOG_INFO("Deleted batch " + id);
    return true;
}

std::vector<JobStatus> Orchestrator::list() const {
    std::vector<JobStatus> out;
    for (const auto& job : store_->list()) {
        out.push_back(statusOf(job));
    }
    return out;
}

std::optional<JobStatus> Orchestrator::wait(const JobId& id) {
    std::optional<JobStatus> current;
    std::unique_lock<std::mutex> lock(mutex_);
    finished_.wait(lock, [&] {
        current = status(id);
        return !current || current->state != JobState::Processing;
    });
    return current;
}

void Orchestrator::addObserver(std::shared_ptr<ProgressObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(std::move(observer));
}

void Orchestrator::runJob(const JobId& id) {
    CancelToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tokens_.find(id);
        token = it != tokens_.end() ? it->second : std::make_shared<std::atomic<bool>>(false);
    }

    auto snapshot = store_->get(id);
    if (!snapshot) {
        LOG_WARN("Batch job vanished before it ran: " + id);
        finish(id);
        return;
    }
    const auto& items = snapshot->items;
    const Settings& settings = snapshot->settings;

    // Published in one update once outputs are written and scratch is gone,
    // so a terminal state always means the job is fully settled.
    JobState finalState = JobState::Failed;
    std::string finalMessage;
    std::optional<std::string> finalError;
    std::filesystem::path finalOutput = config_.outputRoot / ("batch_" + id);

    // Extraction directories live exactly as long as this loop.
    std::vector<ScratchDir> scratch;
    try {
        const auto pages = resolver_.resolveAll(items, scratch);
        const std::size_t total = pages.size();
        store_->update(id, [&](BatchJob& job) {
            job.total = total;
            job.current = 0;
            return true;
        });

        if (pages.empty()) {
            finalMessage = "No valid images found";
            finalError = finalMessage;
            LOG_WARN("Batch " + id + ": no valid images found");
        } else {
            const OutputFormat format = resolveOutputFormat(settings.outputFormat, items);
            LOG_INFO("Batch " + id + ": " + std::to_string(total) + " pages, output " + toString(format));

            const auto masks = makeMaskGenerator(settings);
            ColorTracker tracker(settings.historySize);
            std::vector<ArchiveEntry> packaged;
            std::set<std::filesystem::path> claimed;
            std::size_t succeeded = 0;
            bool cancelled = false;
            const auto started = std::chrono::steady_clock::now();

            for (std::size_t i = 0; i < total; ++i) {
                if (token->load()) {
                    cancelled = true;
                    break;
                }

                const auto& page = pages[i];
                const auto& item = items[page.itemIndex];
                const std::string name = page.file.filename().string();
                if (i > 0 && !sameChapter(item, items[pages[i - 1].itemIndex])) {
                    LOG_DEBUG("Chapter changed, resetting color history");
                    tracker.reset();
                }

                store_->update(id, [&](BatchJob& job) {
                    job.message = "Processing " + name + "...";
                    return true;
                });

                PageResult result;
                try {
                    const auto target = claimOutput(outputDirFor(id, item), page.file.stem().string(),
                                                    item.hasLibraryTarget() ? "" : "_colored", claimed);
                    auto output = processPage(page, settings, masks.get(), tracker, target);
                    packaged.push_back(ArchiveEntry{output, output.lexically_relative(outputRootFor(item)).generic_string()});
                    result = PageSuccess{page.file, std::move(output)};
                    ++succeeded;
                    LOG_INFO("Processed " + std::to_string(i + 1) + "/" + std::to_string(total) + ": " + name);
                } catch (const std::exception& e) {
                    result = PageFailure{page.file, e.what()};
                    LOG_ERROR("Failed to process " + name + ": " + e.what());
                }

                const std::size_t done = i + 1;
                const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
                const double eta = elapsed / static_cast<double>(done) * static_cast<double>(total - done);
                store_->update(id, [&](BatchJob& job) {
                    if (const auto* failure = std::get_if<PageFailure>(&result)) {
                        job.errors.push_back("Failed to process " + name + ": " + failure->error);
                    }
                    job.results.push_back(result);
                    job.current = done;
                    job.etaSeconds = eta;
                    return true;
                });
                notifyProgress(id, done, total, name);
            }

            const std::string summary = std::to_string(succeeded) + "/" + std::to_string(total) + " images";
            finalState = cancelled ? JobState::Cancelled : JobState::Completed;
            finalMessage = (cancelled ? "Cancelled after " : "Completed ") + summary;
            if (format == OutputFormat::Folder && items.front().hasLibraryTarget()) {
                finalOutput = outputDirFor(id, items.front());
            }

            if (format == OutputFormat::Archive && succeeded > 0) {
                const auto zipPath = config_.outputRoot / ("batch_" + id + ".zip");
                try {
                    writeZip(zipPath, packaged);
                    finalOutput = zipPath;
                    LOG_INFO("Packaged " + std::to_string(packaged.size()) + " pages into " + zipPath.string());
                } catch (const Error& e) {
                    finalState = JobState::Failed;
                    finalMessage = "Failed to package output";
                    finalError = "Failed to package output: " + std::string(e.what());
                    LOG_ERROR("Batch " + id + " packaging failed: " + e.what());
                }
            }
            LOG_INFO("Batch " + id + " " + toString(finalState) + ": " + summary);
        }
    } catch (const std::exception& e) {
        finalState = JobState::Failed;
        finalMessage = e.what();
        finalError = "Batch processing failed: " + std::string(e.what());
        LOG_ERROR("Batch " + id + " failed: " + e.what());
    }

    scratch.clear();
    store_->update(id, [&](BatchJob& job) {
        job.state = finalState;
        job.message = finalMessage;
        job.etaSeconds.reset();
        job.outputPath = finalOutput;
        if (finalError) {
            job.errors.push_back(*finalError);
        }
        return true;
    });
    finish(id);
}

std::filesystem::path Orchestrator::processPage(const PageRef& page,
                                                const Settings& settings,
                                                const MaskGenerator* masks,
                                                ColorTracker& tracker,
                                                const std::filesystem::path& output) {
    const Image original = loadImage(page.file);
    const Size size = processingSize(original.width, original.height, settings.maxSide);
    if (size.width == 0 || size.height == 0) {
        throw ImageError("Page too small to process: " + std::to_string(original.width) + "x" +
                         std::to_string(original.height));
    }
    const Image canvas = resize(original, size.width, size.height);

    std::optional<ProtectionMask> mask;
    if (masks) {
        mask = masks->generate(canvas);
    }

    ColorizeParams params;
    params.inkThreshold = settings.inkThreshold;
    params.size = size;
    Image colored = engine_.colorize(canvas, mask ? &*mask : nullptr, tracker.guidance(), params);
    if (colored.empty()) {
        throw EngineError("Engine returned an empty image");
    }
    colored = toRgb(colored);

    if (settings.restoreOriginalSize) {
        colored = resize(colored, original.width, original.height);
    }
    if (mask && settings.enforceMask) {
        colored = applyMask(original, colored, *mask);
    }
    Image composed = preserveInk(original, colored, settings.inkThreshold);
    tracker.update(composed);

    savePng(output, composed);
    return output;
}

std::filesystem::path Orchestrator::outputRootFor(const BatchItem& item) const {
    return item.hasLibraryTarget() ? config_.libraryRoot : config_.outputRoot;
}

std::filesystem::path Orchestrator::outputDirFor(const JobId& id, const BatchItem& item) const {
    if (item.hasLibraryTarget()) {
        return config_.libraryRoot / item.collection / item.chapter;
    }
    return config_.outputRoot / ("batch_" + id);
}

void Orchestrator::finish(const JobId& id) {
    if (auto job = store_->get(id)) {
        const JobStatus final = statusOf(*job);
        std::vector<std::shared_ptr<ProgressObserver>> observers;
        {
            std::lock_guard<std::mutex> lock(observersMutex_);
            observers = observers_;
        }
        for (const auto& observer : observers) {
            try {
                observer->onFinished(final);
            } catch (const std::exception& e) {
                LOG_WARN("Progress observer failed: " + std::string(e.what()));
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens_.erase(id);
    }
    finished_.notify_all();
}

void Orchestrator::notifyProgress(const JobId& id, std::size_t current, std::size_t total, const std::string& filename) {
    std::vector<std::shared_ptr<ProgressObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        try {
            observer->onProgress(id, current, total, filename);
        } catch (const std::exception& e) {
            LOG_WARN("Progress observer failed: " + std::string(e.what()));
        }
    }
}

JobId Orchestrator::generateId() {
    static std::atomic<std::uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
    std::uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

}
