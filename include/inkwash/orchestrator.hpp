/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "inkwash/config.hpp"
#include "inkwash/engine.hpp"
#include "inkwash/job.hpp"
#include "inkwash/pool.hpp"
#include "inkwash/resolver.hpp"

namespace inkwash {

class ColorTracker;

// Called from pool workers, never under an orchestrator lock.
class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;
    virtual void onProgress(const JobId& id, std::size_t current, std::size_t total, const std::string& filename) = 0;
    virtual void onFinished(const JobStatus& /*status*/) {}
};

enum class SubmitError : std::uint8_t {
    None = 0,
    InvalidContent,
    StoreError
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    std::size_t total = 0;
    SubmitError error = SubmitError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class Orchestrator final {
public:
    // engine must outlive the orchestrator. Throws Error when the pool cannot start.
    Orchestrator(std::shared_ptr<JobStore> store, Engine& engine, OrchestratorConfig config = {});
    // Cancels running jobs and waits for every started job to finish.
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Rejects empty batches and out-of-range settings with InvalidContent.
    [[nodiscard]] SubmitResult submit(std::vector<BatchItem> items, Settings settings = {});
    // Only a created job starts; returns false otherwise.
    [[nodiscard]] bool start(const JobId& id);
    [[nodiscard]] std::optional<JobStatus> status(const JobId& id) const;
    [[nodiscard]] std::optional<JobResults> results(const JobId& id) const;
    // Processing jobs only. Takes effect before the next page.
    bool cancel(const JobId& id);
    // Drops a job record in any state except processing; a running loop still
    // owns its record, so cancel and wait first. Written pages stay on disk.
    bool remove(const JobId& id);
    [[nodiscard]] std::vector<JobStatus> list() const;
    // Blocks until the job is terminal. Returns at once for unknown or never-started jobs.
    std::optional<JobStatus> wait(const JobId& id);

    void addObserver(std::shared_ptr<ProgressObserver> observer);

    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

private:
    using CancelToken = std::shared_ptr<std::atomic<bool>>;

    void runJob(const JobId& id);
    std::filesystem::path processPage(const PageRef& page,
                                      const Settings& settings,
                                      const MaskGenerator* masks,
                                      ColorTracker& tracker,
                                      const std::filesystem::path& output);
    [[nodiscard]] std::filesystem::path outputDirFor(const JobId& id, const BatchItem& item) const;
    [[nodiscard]] std::filesystem::path outputRootFor(const BatchItem& item) const;
    void finish(const JobId& id);
    void notifyProgress(const JobId& id, std::size_t current, std::size_t total, const std::string& filename);
    [[nodiscard]] static JobId generateId();

    std::shared_ptr<JobStore> store_;
    Engine& engine_;
    OrchestratorConfig config_;
    Resolver resolver_;

    mutable std::mutex mutex_;
    std::condition_variable finished_;
    std::unordered_map<JobId, CancelToken> tokens_;

    std::mutex observersMutex_;
    std::vector<std::shared_ptr<ProgressObserver>> observers_;

    // Last member: destroyed first so workers never outlive the state above.
    Pool pool_;
};

}
