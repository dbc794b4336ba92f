/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/job.hpp"
#include "inkwash/logger.hpp"
#include <algorithm>

namespace inkwash {

JobStatus statusOf(const BatchJob& job) {
    JobStatus status;
    status.id = job.id;
    status.state = job.state;
    status.current = job.current;
    status.total = job.total;
    status.message = job.message;
    status.etaSeconds = job.etaSeconds;
    status.errors = job.errors;
    status.outputPath = job.outputPath;
    return status;
}

JobResults resultsOf(const BatchJob& job) {
    JobResults out;
    out.id = job.id;
    out.state = job.state;
    out.results = job.results;
    out.errors = job.errors;
    out.succeeded = static_cast<std::size_t>(std::count_if(job.results.begin(), job.results.end(), isSuccess));
    out.failed = job.results.size() - out.succeeded;
    out.outputPath = job.outputPath;
    return out;
}

bool MemoryJobStore::create(BatchJob job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (job.id.empty() || jobs_.count(job.id) != 0) {
        LOG_WARN("Job already exists or has no id: " + job.id);
        return false;
    }
    order_.push_back(job.id);
    jobs_.emplace(job.id, std::move(job));
    return true;
}

std::optional<BatchJob> MemoryJobStore::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryJobStore::update(const JobId& id, const Mutator& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }
    return mutate(it->second);
}

bool MemoryJobStore::remove(const JobId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.erase(id) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

std::vector<BatchJob> MemoryJobStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BatchJob> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(jobs_.at(id));
    }
    return out;
}

}
