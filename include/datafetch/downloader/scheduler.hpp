#pragma once

/*
 * datafetch Multi-File Scheduler
 *
 * Runs independent DownloadTasks on a bounded worker pool. Every task yields exactly
 * one DownloadOutcome; a task's failure (or exception) never reaches its siblings.
 * The completion callback runs in completion order, never concurrently with itself.
 */

#include <datafetch/downloader/downloader.hpp>
#include <datafetch/downloader/progress_store.hpp>
#include <datafetch/downloader/resumable_downloader.hpp>

#include <spdlog/logger.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace datafetch::downloader {

/// Executes one task with the given attempt budget.
using TaskRunner = std::function<DownloadOutcome(const DownloadTask&, int maxAttempts)>;

/**
 * Default runner: single-stream download, digest check (skip sentinel honored),
 * progress-record removal on success, file deletion on digest mismatch.
 */
TaskRunner makeDownloadAndValidateRunner(std::shared_ptr<IHttpAdapter> http,
                                         std::shared_ptr<IProgressStore> store,
                                         std::shared_ptr<spdlog::logger> logger = nullptr,
                                         DownloadOptions baseOptions = {}, Sleeper sleeper = {});

class MultiFileScheduler {
public:
    explicit MultiFileScheduler(TaskRunner runner, std::shared_ptr<spdlog::logger> logger = nullptr);

    std::vector<DownloadOutcome> runAll(const std::vector<DownloadTask>& tasks,
                                        std::size_t concurrencyLimit, int maxAttempts,
                                        const TaskCompleteCallback& onTaskComplete = {});

    /// Tasks currently executing (not queued, not finished).
    std::size_t activeCount() const noexcept { return active_.load(std::memory_order_relaxed); }

private:
    TaskRunner runner_;
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<std::size_t> active_{0};
};

} // namespace datafetch::downloader
