/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "inkwash/config.hpp"
#include "inkwash/types.hpp"

namespace inkwash {

struct PageSuccess {
    std::filesystem::path input;
    std::filesystem::path output;
};

struct PageFailure {
    std::filesystem::path input;
    std::string error;
};

using PageResult = std::variant<PageSuccess, PageFailure>;

[[nodiscard]] inline bool isSuccess(const PageResult& result) noexcept {
    return std::holds_alternative<PageSuccess>(result);
}

struct BatchJob {
    JobId id;
    JobState state = JobState::Created;
    std::vector<BatchItem> items;
    Settings settings;

    std::size_t current = 0;
    std::size_t total = 0;
    std::string message;
    std::optional<double> etaSeconds;

    std::vector<std::string> errors;
    std::vector<PageResult> results;
    std::filesystem::path outputPath;

    std::chrono::system_clock::time_point createdAt = std::chrono::system_clock::now();
};

struct JobStatus {
    JobId id;
    JobState state = JobState::Created;
    std::size_t current = 0;
    std::size_t total = 0;
    std::string message;
    std::optional<double> etaSeconds;
    std::vector<std::string> errors;
    std::filesystem::path outputPath;
};

struct JobResults {
    JobId id;
    JobState state = JobState::Created;
    std::vector<PageResult> results;
    std::vector<std::string> errors;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::filesystem::path outputPath;
};

[[nodiscard]] JobStatus statusOf(const BatchJob& job);
[[nodiscard]] JobResults resultsOf(const BatchJob& job);

// Job records. Readers get copies; writers go through update so every
// mutation happens under the store's lock.
class JobStore {
public:
    // Returns false from the mutator to leave the job untouched.
    using Mutator = std::function<bool(BatchJob&)>;

    virtual ~JobStore() = default;

    [[nodiscard]] virtual bool create(BatchJob job) = 0;
    [[nodiscard]] virtual std::optional<BatchJob> get(const JobId& id) const = 0;
    // false when the job is missing or the mutator declined.
    virtual bool update(const JobId& id, const Mutator& mutate) = 0;
    virtual bool remove(const JobId& id) = 0;
    // Creation order.
    [[nodiscard]] virtual std::vector<BatchJob> list() const = 0;
};

class MemoryJobStore final : public JobStore {
public:
    MemoryJobStore() = default;

    MemoryJobStore(const MemoryJobStore&) = delete;
    MemoryJobStore& operator=(const MemoryJobStore&) = delete;

    [[nodiscard]] bool create(BatchJob job) override;
    [[nodiscard]] std::optional<BatchJob> get(const JobId& id) const override;
    bool update(const JobId& id, const Mutator& mutate) override;
    bool remove(const JobId& id) override;
    [[nodiscard]] std::vector<BatchJob> list() const override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<JobId, BatchJob> jobs_;
    std::vector<JobId> order_;
};

}
