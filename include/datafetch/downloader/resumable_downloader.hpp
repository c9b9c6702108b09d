#pragma once

/*
 * datafetch Single-Stream Resumable Downloader
 *
 * Fetches one URL into one file. Per invocation:
 *
 *   Init -> ProbeResume -> Fetching -> Verifying -> Complete
 *                              |            |
 *                              +--> Failed <+
 *
 * Prior TransferState from the Progress Store decides the resume point. Each
 * attempt yields a tagged outcome (Success / Retryable / Fatal); retryable
 * attempts are repeated with exponential backoff, re-deriving the resume point
 * from the persisted record. The progress record is left in place on success;
 * removing it is the caller's decision once the digest has been checked.
 */

#include <datafetch/downloader/downloader.hpp>
#include <datafetch/downloader/progress_store.hpp>

#include <spdlog/logger.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace datafetch::downloader {

struct DownloadOptions {
    std::optional<std::uint64_t> expectedSize{};
    std::optional<std::string> expectedDigest{};
    HashAlgo digestAlgorithm{HashAlgo::Md5};
    RetryPolicy retry{};
    std::chrono::milliseconds timeout{30000};
    std::size_t blockSize{8192};
    std::uint64_t checkpointBytes{1024ull * 1024ull}; // 1 MiB
    BytesTransferredCallback onBytes{};
};

/**
 * How the destination is opened for one attempt: truncated, or appended to at atByte.
 */
struct OpenMode {
    enum class Kind { Fresh, Resume };
    Kind kind{Kind::Fresh};
    std::uint64_t atByte{0};

    static OpenMode fresh() { return OpenMode{Kind::Fresh, 0}; }
    static OpenMode resume(std::uint64_t at) { return OpenMode{Kind::Resume, at}; }
    [[nodiscard]] bool isResume() const noexcept { return kind == Kind::Resume; }
};

class ResumableDownloader {
public:
    ResumableDownloader(std::shared_ptr<IHttpAdapter> http, std::shared_ptr<IProgressStore> store,
                        std::shared_ptr<spdlog::logger> logger = nullptr, Sleeper sleeper = {});

    /**
     * Download url to destination. Returns the final (Complete) TransferState, or the
     * fatal error. Exhausted retries yield RetriesExhausted naming the URL and attempts.
     */
    Expected<TransferState> download(std::string_view url,
                                     const std::filesystem::path& destination,
                                     const DownloadOptions& options);

private:
    struct AttemptOutcome {
        Disposition tag{Disposition::Fatal};
        std::optional<Error> error{};
        TransferState state{};
    };

    OpenMode probeResume(std::string_view url, const std::filesystem::path& destination,
                         const DownloadOptions& options, TransferState& state);

    AttemptOutcome runAttempt(std::string_view url, const std::filesystem::path& destination,
                              const DownloadOptions& options);

    AttemptOutcome completeFromRangeNotSatisfiable(const std::filesystem::path& destination,
                                                   const DownloadOptions& options,
                                                   TransferState state);

    void checkpoint(const std::filesystem::path& destination, const TransferState& state);

    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IProgressStore> store_;
    std::shared_ptr<spdlog::logger> logger_;
    Sleeper sleeper_;
};

} // namespace datafetch::downloader
