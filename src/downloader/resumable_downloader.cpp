/*
 * datafetch/src/downloader/resumable_downloader.cpp
 *
 * Single-stream resumable download with persisted checkpoints.
 *
 * - ProbeResume validates the prior record against the request and the disk
 * - The response handler classifies the status and fixes the OpenMode before any
 *   body byte is written (a 200 answer to a range request forces a fresh write)
 * - Bytes are written in blocks; a checkpoint is saved every checkpointBytes and
 *   whenever an attempt ends, so a retry resumes from what is actually on disk
 */

#include <datafetch/downloader/resumable_downloader.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace datafetch::downloader {

namespace fs = std::filesystem;

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int failedAttempts) {
    const int exponent = std::clamp(failedAttempts, 0, 30);
    const auto maxMs = policy.maxDelay.count();
    const auto baseMs = policy.baseDelay.count();
    if (baseMs <= 0)
        return std::chrono::milliseconds{0};
    // Saturate before multiplying so large exponents cannot overflow.
    if (baseMs > (maxMs >> std::min(exponent, 62)))
        return policy.maxDelay;
    return std::chrono::milliseconds{std::min<std::int64_t>(baseMs << exponent, maxMs)};
}

namespace {

Error statusError(int status, std::string_view url) {
    if (status == 404)
        return Error{ErrorCode::NotFound, "URL not found (404): " + std::string(url)};
    if (status == 403)
        return Error{ErrorCode::Forbidden, "Access forbidden (403): " + std::string(url)};
    if (status >= 500 && status < 600)
        return Error{ErrorCode::ServerError,
                     "Server error " + std::to_string(status) + ": " + std::string(url)};
    return Error{ErrorCode::HttpError,
                 "Unexpected HTTP status " + std::to_string(status) + ": " + std::string(url)};
}

Error sizeMismatch(std::uint64_t expected, std::uint64_t actual) {
    return Error{ErrorCode::SizeMismatch, "Size mismatch: expected " + std::to_string(expected) +
                                              ", got " + std::to_string(actual)};
}

std::optional<std::uint64_t> fileSize(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec))
        return std::nullopt;
    auto n = fs::file_size(p, ec);
    if (ec)
        return std::nullopt;
    return static_cast<std::uint64_t>(n);
}

} // namespace

ResumableDownloader::ResumableDownloader(std::shared_ptr<IHttpAdapter> http,
                                         std::shared_ptr<IProgressStore> store,
                                         std::shared_ptr<spdlog::logger> logger, Sleeper sleeper)
    : http_(std::move(http)),
      store_(std::move(store)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void ResumableDownloader::checkpoint(const fs::path& destination, const TransferState& state) {
    auto r = store_->save(destination, state);
    if (!r.ok()) {
        logger_->warn("Checkpoint for {} not persisted ({}); resume will use the last saved record",
                      destination.string(), r.error().message);
    }
}

OpenMode ResumableDownloader::probeResume(std::string_view url, const fs::path& destination,
                                          const DownloadOptions& options, TransferState& state) {
    state = TransferState{};
    state.sourceUrl = std::string(url);
    state.destinationPath = destination.string();
    state.digestExpected = options.expectedDigest;
    state.digestAlgorithm = options.digestAlgorithm;

    auto loaded = store_->load(destination);
    if (loaded.warning) {
        logger_->warn("Ignoring progress record for {}: {}", destination.string(),
                      *loaded.warning);
    }
    if (!loaded.state) {
        return OpenMode::fresh();
    }

    const auto& prior = *loaded.state;
    std::string reason;
    if (prior.sourceUrl != url) {
        reason = "source URL changed from " + prior.sourceUrl;
    } else if (prior.totalSizeBytes && options.expectedSize &&
               *prior.totalSizeBytes != *options.expectedSize) {
        reason = "recorded total " + std::to_string(*prior.totalSizeBytes) +
                 " differs from expected " + std::to_string(*options.expectedSize);
    } else if (!store_->validatePartial(destination, prior.downloadedBytes)) {
        const auto onDisk = fileSize(destination);
        reason = "partial file is " + (onDisk ? std::to_string(*onDisk) + " bytes" : "missing") +
                 ", record claims " + std::to_string(prior.downloadedBytes);
    }

    if (!reason.empty()) {
        logger_->warn("Discarding progress for {}: {}; restarting from byte 0",
                      destination.string(), reason);
        store_->remove(destination);
        std::error_code ec;
        fs::remove(destination, ec);
        if (ec) {
            logger_->warn("Could not delete stale partial {}: {}", destination.string(),
                          ec.message());
        }
        return OpenMode::fresh();
    }

    state.totalSizeBytes = prior.totalSizeBytes;
    state.downloadedBytes = prior.downloadedBytes;
    if (prior.downloadedBytes == 0) {
        return OpenMode::fresh();
    }
    logger_->info("Resuming {} from byte {}", destination.string(), prior.downloadedBytes);
    return OpenMode::resume(prior.downloadedBytes);
}

ResumableDownloader::AttemptOutcome
ResumableDownloader::completeFromRangeNotSatisfiable(const fs::path& destination,
                                                     const DownloadOptions& options,
                                                     TransferState state) {
    const auto onDisk = fileSize(destination);
    const auto expectedTotal = options.expectedSize ? options.expectedSize : state.totalSizeBytes;
    if (onDisk && expectedTotal && *onDisk == *expectedTotal) {
        logger_->info("Server reports range not satisfiable; {} is already complete ({} bytes)",
                      destination.string(), *onDisk);
        state.totalSizeBytes = *onDisk;
        state.downloadedBytes = *onDisk;
        state.status = TransferStatus::Complete;
        checkpoint(destination, state);
        return AttemptOutcome{Disposition::Success, std::nullopt, std::move(state)};
    }
    Error err{ErrorCode::RangeNotSatisfiable,
              "Range not satisfiable for " + destination.string() + ": on-disk size " +
                  (onDisk ? std::to_string(*onDisk) : std::string("missing")) +
                  (expectedTotal ? ", expected " + std::to_string(*expectedTotal)
                                 : std::string(", expected size unknown"))};
    // The partial file is not trusted; the next run starts from byte 0.
    logger_->warn("Discarding partial {} and its progress record", destination.string());
    store_->remove(destination);
    std::error_code ec;
    fs::remove(destination, ec);
    if (ec) {
        logger_->warn("Could not delete untrusted partial {}: {}", destination.string(),
                      ec.message());
    }
    return AttemptOutcome{Disposition::Fatal, std::move(err), std::move(state)};
}

ResumableDownloader::AttemptOutcome ResumableDownloader::runAttempt(std::string_view url,
                                                                    const fs::path& destination,
                                                                    const DownloadOptions& options) {
    TransferState state;
    OpenMode mode = probeResume(url, destination, options, state);

    std::optional<ByteRange> range;
    if (mode.isResume()) {
        range = ByteRange{mode.atByte, std::nullopt};
    }

    std::ofstream out;
    bool opened = false;
    bool rangeNotSatisfiable = false;
    std::uint64_t sinceCheckpoint = 0;

    auto onResponse = [&](const ResponseHead& head) -> Expected<void> {
        std::optional<std::uint64_t> total;
        if (head.status == 206 && mode.isResume()) {
            if (head.contentLength)
                total = mode.atByte + *head.contentLength;
            else
                total = state.totalSizeBytes;
        } else if (head.status == 200 || head.status == 206) {
            if (head.status == 206) {
                return Error{ErrorCode::HttpError,
                             "Partial content returned for a full request: " + std::string(url)};
            }
            if (mode.isResume()) {
                logger_->warn("Server ignored range request for {}; restarting from byte 0",
                              url);
                mode = OpenMode::fresh();
                state.totalSizeBytes.reset();
            }
            total = head.contentLength;
        } else if (head.status == 416) {
            rangeNotSatisfiable = true;
            return Error{ErrorCode::RangeNotSatisfiable, "Range not satisfiable"};
        } else {
            return statusError(head.status, url);
        }

        if (total && options.expectedSize && *total != *options.expectedSize) {
            return sizeMismatch(*options.expectedSize, *total);
        }
        if (total && state.totalSizeBytes && *total != *state.totalSizeBytes) {
            return sizeMismatch(*state.totalSizeBytes, *total);
        }
        if (!total) {
            logger_->warn("No Content-Length for {}", url);
        }
        state.totalSizeBytes = total;

        const auto flags = std::ios::binary | (mode.isResume() ? std::ios::app : std::ios::trunc);
        out.open(destination, flags);
        if (!out) {
            return Error{ErrorCode::IoError, "Cannot open " + destination.string() + " for write"};
        }
        opened = true;
        state.downloadedBytes = mode.atByte;
        checkpoint(destination, state);
        logger_->debug("{} {} (status {}, total {})",
                       mode.isResume() ? "Appending to" : "Writing", destination.string(),
                       head.status, total ? std::to_string(*total) : "unknown");
        return {};
    };

    auto sink = [&](std::span<const std::byte> bytes) -> Expected<void> {
        const std::size_t block = std::max<std::size_t>(1, options.blockSize);
        for (std::size_t off = 0; off < bytes.size(); off += block) {
            const auto piece = bytes.subspan(off, std::min(block, bytes.size() - off));
            if (state.totalSizeBytes && state.downloadedBytes + piece.size() > *state.totalSizeBytes) {
                return Error{ErrorCode::SizeMismatch,
                             "Server sent more than the declared " +
                                 std::to_string(*state.totalSizeBytes) + " bytes for " +
                                 std::string(url)};
            }
            out.write(reinterpret_cast<const char*>(piece.data()),
                      static_cast<std::streamsize>(piece.size()));
            if (!out) {
                return Error{ErrorCode::IoError, "Write failed for " + destination.string()};
            }
            state.downloadedBytes += piece.size();
            sinceCheckpoint += piece.size();
            if (options.onBytes)
                options.onBytes(piece.size());
            if (sinceCheckpoint >= options.checkpointBytes) {
                out.flush();
                if (!out) {
                    return Error{ErrorCode::IoError, "Flush failed for " + destination.string()};
                }
                checkpoint(destination, state);
                sinceCheckpoint = 0;
            }
        }
        return {};
    };

    auto result = http_->get(url, range, options.timeout, onResponse, sink);

    if (opened) {
        out.flush();
        const bool flushed = static_cast<bool>(out);
        out.close();
        if (!flushed && result.ok()) {
            return AttemptOutcome{Disposition::Fatal,
                                  Error{ErrorCode::IoError,
                                        "Flush failed for " + destination.string()},
                                  std::move(state)};
        }
    }

    if (!result.ok()) {
        if (rangeNotSatisfiable) {
            return completeFromRangeNotSatisfiable(destination, options, std::move(state));
        }
        if (opened) {
            // Persist exactly what reached the disk so the next attempt resumes there.
            if (auto onDisk = fileSize(destination))
                state.downloadedBytes = *onDisk;
            checkpoint(destination, state);
        }
        const auto tag = classify(result.error().code);
        return AttemptOutcome{tag == Disposition::Success ? Disposition::Fatal : tag,
                              result.error(), std::move(state)};
    }

    // Verifying
    const auto onDisk = fileSize(destination);
    if (!onDisk) {
        return AttemptOutcome{Disposition::Fatal,
                              Error{ErrorCode::IoError, "Downloaded file missing: " +
                                                            destination.string()},
                              std::move(state)};
    }
    if (options.expectedSize && *onDisk != *options.expectedSize) {
        return AttemptOutcome{Disposition::Fatal,
                              Error{ErrorCode::SizeMismatch,
                                    "Downloaded file size mismatch: expected " +
                                        std::to_string(*options.expectedSize) + ", got " +
                                        std::to_string(*onDisk)},
                              std::move(state)};
    }
    if (state.totalSizeBytes && *onDisk != *state.totalSizeBytes) {
        // Short body without a transport error; keep the bytes and retry from here.
        state.downloadedBytes = *onDisk;
        checkpoint(destination, state);
        return AttemptOutcome{Disposition::Retryable,
                              Error{ErrorCode::NetworkError,
                                    "Stream ended at " + std::to_string(*onDisk) + " of " +
                                        std::to_string(*state.totalSizeBytes) + " bytes"},
                              std::move(state)};
    }

    state.totalSizeBytes = *onDisk;
    state.downloadedBytes = *onDisk;
    state.status = TransferStatus::Complete;
    checkpoint(destination, state);
    return AttemptOutcome{Disposition::Success, std::nullopt, std::move(state)};
}

Expected<TransferState> ResumableDownloader::download(std::string_view url,
                                                      const fs::path& destination,
                                                      const DownloadOptions& options) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }
    if (options.retry.maxAttempts < 1) {
        return Error{ErrorCode::InvalidArgument, "maxAttempts must be at least 1"};
    }

    // Init
    if (destination.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot create directory " +
                                                 destination.parent_path().string() + ": " +
                                                 ec.message()};
        }
    }

    const int maxAttempts = options.retry.maxAttempts;
    Error lastError{ErrorCode::Unknown, "no attempt made"};
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        logger_->info("Downloading {} (attempt {}/{})", url, attempt, maxAttempts);
        auto outcome = runAttempt(url, destination, options);

        switch (outcome.tag) {
            case Disposition::Success:
                logger_->info("Download complete: {} ({} bytes)", destination.string(),
                              outcome.state.downloadedBytes);
                return std::move(outcome.state);
            case Disposition::Fatal:
                logger_->error("Download of {} failed: {}", url, outcome.error->message);
                return *outcome.error;
            case Disposition::Retryable:
                lastError = *outcome.error;
                logger_->warn("Attempt {}/{} for {} failed: {}", attempt, maxAttempts, url,
                              lastError.message);
                break;
        }

        if (attempt < maxAttempts) {
            const auto delay = backoffDelay(options.retry, attempt);
            logger_->info("Retrying {} in {} ms", url, delay.count());
            sleeper_(delay);
        }
    }

    logger_->error("Failed to download {} after {} attempts", url, maxAttempts);
    return Error{ErrorCode::RetriesExhausted, "Failed to download " + std::string(url) +
                                                  " after " + std::to_string(maxAttempts) +
                                                  " attempts: " + lastError.message};
}

} // namespace datafetch::downloader
