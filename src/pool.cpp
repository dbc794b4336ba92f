/*
 * inkwash - Batch Manga Colorization Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "inkwash/pool.hpp"
#include "inkwash/logger.hpp"

namespace inkwash {

Pool::Pool(int workers) noexcept : workers_(workers < 1 ? 1 : workers) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    jobAvailable_.notify_all();

    // Workers leave once the queue is empty.
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    LOG_DEBUG("Pool stopped");
}

bool Pool::submit(const JobId& jobId) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load() || shutdown_.load()) {
            LOG_WARN("Cannot submit job to stopped pool: " + jobId);
            return false;
        }
        jobQueue_.push(jobId);
    }
    jobAvailable_.notify_one();
    LOG_DEBUG("Job queued: " + jobId);
    return true;
}

std::size_t Pool::queueSize() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");

    while (true) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });

            if (jobQueue_.empty()) {
                break;
            }
            jobId = jobQueue_.front();
            jobQueue_.pop();
        }

        LOG_DEBUG("Worker-" + std::to_string(workerId) + " claimed job: " + jobId);
        try {
            processor_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " job processing error: " +
                      std::string(e.what()) + " (job: " + jobId + ")");
        }
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
