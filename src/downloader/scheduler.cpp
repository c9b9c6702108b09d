/*
 * datafetch/src/downloader/scheduler.cpp
 *
 * Bounded multi-file scheduler on boost::asio::thread_pool.
 *
 * - The pool size is the concurrency limit; excess tasks wait in the pool queue
 * - Each posted job converts any failure or exception into a DownloadOutcome
 * - Outcomes and the completion callback share one mutex, so the callback is serialized
 */

#include <datafetch/downloader/checksum.hpp>
#include <datafetch/downloader/scheduler.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <exception>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>

namespace datafetch::downloader {

namespace fs = std::filesystem;

DownloadTask makeTask(std::string url, fs::path destination,
                      std::optional<std::uint64_t> expectedSize,
                      std::optional<std::string> expectedDigest, HashAlgo algo,
                      std::string taskId) {
    DownloadTask t;
    t.sourceUrl = std::move(url);
    t.destinationPath = std::move(destination);
    t.expectedSizeBytes = expectedSize;
    t.expectedDigest = std::move(expectedDigest);
    t.digestAlgorithm = algo;
    t.taskId = taskId.empty() ? t.destinationPath.filename().string() : std::move(taskId);
    return t;
}

TaskRunner makeDownloadAndValidateRunner(std::shared_ptr<IHttpAdapter> http,
                                         std::shared_ptr<IProgressStore> store,
                                         std::shared_ptr<spdlog::logger> logger,
                                         DownloadOptions baseOptions, Sleeper sleeper) {
    if (!logger)
        logger = spdlog::default_logger();
    return [http = std::move(http), store = std::move(store), logger = std::move(logger),
            baseOptions = std::move(baseOptions),
            sleeper = std::move(sleeper)](const DownloadTask& task, int maxAttempts) {
        DownloadOutcome outcome;
        outcome.task = task;

        DownloadOptions options = baseOptions;
        options.expectedSize = task.expectedSizeBytes;
        options.expectedDigest = task.expectedDigest;
        options.digestAlgorithm = task.digestAlgorithm;
        options.retry.maxAttempts = maxAttempts;

        ResumableDownloader downloader(http, store, logger, sleeper);
        auto result = downloader.download(task.sourceUrl, task.destinationPath, options);
        if (!result.ok()) {
            outcome.failureReason = result.error();
            return outcome;
        }

        if (task.expectedDigest) {
            auto verified = verifyFile(task.destinationPath, *task.expectedDigest,
                                       task.digestAlgorithm);
            if (!verified.ok()) {
                logger->error("[{}] {}", task.taskId, verified.error().message);
                if (verified.error().code == ErrorCode::ChecksumMismatch) {
                    std::error_code ec;
                    fs::remove(task.destinationPath, ec);
                    store->remove(task.destinationPath);
                }
                outcome.failureReason = verified.error();
                return outcome;
            }
        }
        store->remove(task.destinationPath);
        outcome.succeeded = true;
        outcome.finalPath = task.destinationPath;
        return outcome;
    };
}

MultiFileScheduler::MultiFileScheduler(TaskRunner runner, std::shared_ptr<spdlog::logger> logger)
    : runner_(std::move(runner)), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::vector<DownloadOutcome> MultiFileScheduler::runAll(const std::vector<DownloadTask>& tasks,
                                                        std::size_t concurrencyLimit,
                                                        int maxAttempts,
                                                        const TaskCompleteCallback& onTaskComplete) {
    std::vector<DownloadOutcome> outcomes;
    if (tasks.empty())
        return outcomes;
    outcomes.reserve(tasks.size());

    if (concurrencyLimit == 0) {
        logger_->warn("Concurrency limit 0 requested; using 1");
        concurrencyLimit = 1;
    }
    const std::size_t total = tasks.size();
    logger_->info("Starting {} downloads with {} workers", total, concurrencyLimit);

    std::mutex mutex;
    std::size_t completed = 0;

    auto finish = [&](DownloadOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex);
        ++completed;
        if (outcome.succeeded) {
            logger_->info("[{}] Completed ({}/{})", outcome.task.taskId, completed, total);
        } else {
            logger_->error("[{}] Failed ({}/{}): {}", outcome.task.taskId, completed, total,
                           outcome.failureReason ? outcome.failureReason->message
                                                 : std::string("unknown error"));
        }
        outcomes.push_back(std::move(outcome));
        if (onTaskComplete) {
            try {
                onTaskComplete(completed, total, outcomes.back());
            } catch (const std::exception& e) {
                logger_->warn("Task completion callback threw: {}", e.what());
            }
        }
    };

    {
        boost::asio::thread_pool pool(concurrencyLimit);
        for (const auto& task : tasks) {
            boost::asio::post(pool, [this, &task, &finish, maxAttempts] {
                active_.fetch_add(1, std::memory_order_relaxed);
                DownloadOutcome outcome;
                try {
                    outcome = runner_(task, maxAttempts);
                } catch (const std::exception& e) {
                    outcome = DownloadOutcome{};
                    outcome.failureReason = Error{ErrorCode::Unknown, e.what()};
                } catch (...) {
                    outcome = DownloadOutcome{};
                    outcome.failureReason = Error{ErrorCode::Unknown, "non-standard exception"};
                }
                // The outcome always describes the submitted task.
                outcome.task = task;
                if (outcome.succeeded && !outcome.finalPath)
                    outcome.finalPath = task.destinationPath;
                active_.fetch_sub(1, std::memory_order_relaxed);
                finish(std::move(outcome));
            });
        }
        pool.join();
    }

    std::size_t failed = 0;
    for (const auto& o : outcomes)
        failed += o.succeeded ? 0 : 1;
    logger_->info("Batch finished: {} succeeded, {} failed", total - failed, failed);
    return outcomes;
}

} // namespace datafetch::downloader
