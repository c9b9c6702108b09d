#pragma once

/*
 * datafetch Downloader - Public Types and Collaborator Interfaces (C++20)
 *
 * This header defines the data model shared by the download core (single-stream
 * resumable downloader, chunk engine, multi-file scheduler) and the abstract
 * interfaces it calls into. It intentionally contains no implementation details.
 *
 * Design principles:
 * - Errors are values: every fallible call returns Expected<T>
 * - Retry-vs-abort is decided from an ErrorCode alone (see classify())
 * - Collaborators (HTTP transport, progress persistence) are injected
 * - Progress is reported through callbacks; the core never formats output
 */

#include <spdlog/logger.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace datafetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Digest algorithms supported for integrity verification.
 */
enum class HashAlgo { Md5, Sha256 };

/**
 * Lifecycle of a persisted transfer record.
 */
enum class TransferStatus { InProgress, Complete };

/**
 * Canonical error codes for download operations.
 * Note: Not a std::error_code category to keep this header implementation-free.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    UnsupportedAlgorithm,
    InvalidDescriptor,
    NotFound,
    Forbidden,
    HttpError,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    IoError,
    SizeMismatch,
    ChecksumMismatch,
    RangeNotSatisfiable,
    RangeUnsupported,
    ChunkFailed,
    MergeFailed,
    RetriesExhausted,
    InsufficientSpace,
    ExtractionFailed,
    Unknown
};

constexpr std::string_view errorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::UnsupportedAlgorithm:
            return "UnsupportedAlgorithm";
        case ErrorCode::InvalidDescriptor:
            return "InvalidDescriptor";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::Forbidden:
            return "Forbidden";
        case ErrorCode::HttpError:
            return "HttpError";
        case ErrorCode::NetworkError:
            return "NetworkError";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TlsVerificationFailed";
        case ErrorCode::ServerError:
            return "ServerError";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::SizeMismatch:
            return "SizeMismatch";
        case ErrorCode::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorCode::RangeNotSatisfiable:
            return "RangeNotSatisfiable";
        case ErrorCode::RangeUnsupported:
            return "RangeUnsupported";
        case ErrorCode::ChunkFailed:
            return "ChunkFailed";
        case ErrorCode::MergeFailed:
            return "MergeFailed";
        case ErrorCode::RetriesExhausted:
            return "RetriesExhausted";
        case ErrorCode::InsufficientSpace:
            return "InsufficientSpace";
        case ErrorCode::ExtractionFailed:
            return "ExtractionFailed";
        case ErrorCode::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * Outcome tag of a single attempt. The retry loops branch on this tag only.
 */
enum class Disposition { Success, Retryable, Fatal };

/**
 * Transient transport conditions are retryable; everything else is fatal.
 */
constexpr Disposition classify(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return Disposition::Success;
        case ErrorCode::Timeout:
        case ErrorCode::NetworkError:
        case ErrorCode::ServerError:
            return Disposition::Retryable;
        default:
            return Disposition::Fatal;
    }
}

// ===================
// Small data objects
// ===================

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Retry/backoff policy. Delay before retry n (1-based count of failed attempts)
 * is min(baseDelay * 2^n, maxDelay).
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
};

std::chrono::milliseconds backoffDelay(const RetryPolicy& policy, int failedAttempts);

/**
 * Persisted per-destination transfer record.
 * While status == InProgress, downloadedBytes equals the partial file's length.
 */
struct TransferState {
    std::string sourceUrl;
    std::string destinationPath;
    std::optional<std::uint64_t> totalSizeBytes{};
    std::uint64_t downloadedBytes{0};
    std::optional<std::string> digestExpected{};
    HashAlgo digestAlgorithm{HashAlgo::Md5};
    TransferStatus status{TransferStatus::InProgress};
    std::string lastUpdated; // ISO-8601 UTC, stamped on save
};

/**
 * One contiguous span of a chunked transfer. size may be zero.
 */
struct RangeSpec {
    std::uint32_t index{0};
    std::uint64_t startByte{0};
    std::uint64_t size{0};

    [[nodiscard]] std::uint64_t endByteInclusive() const noexcept {
        return size == 0 ? startByte : startByte + size - 1;
    }
};

/**
 * A single file transfer submitted to the scheduler.
 * taskId is for correlation only; duplicates are legal.
 */
struct DownloadTask {
    std::string sourceUrl;
    std::filesystem::path destinationPath;
    std::optional<std::uint64_t> expectedSizeBytes{};
    std::optional<std::string> expectedDigest{};
    HashAlgo digestAlgorithm{HashAlgo::Md5};
    std::string taskId; // defaults to destinationPath.filename()
};

DownloadTask makeTask(std::string url, std::filesystem::path destination,
                      std::optional<std::uint64_t> expectedSize = std::nullopt,
                      std::optional<std::string> expectedDigest = std::nullopt,
                      HashAlgo algo = HashAlgo::Md5, std::string taskId = {});

/**
 * Result of one task; exactly one is produced per submitted DownloadTask.
 */
struct DownloadOutcome {
    DownloadTask task;
    bool succeeded{false};
    std::optional<Error> failureReason{};
    std::optional<std::filesystem::path> finalPath{};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// HTTP transport types
// ===================

/**
 * Byte range for a "Range: bytes=first-[last]" request header.
 */
struct ByteRange {
    std::uint64_t first{0};
    std::optional<std::uint64_t> last{}; // inclusive; absent = open-ended
};

/**
 * Status line and the headers the core consumes.
 * contentLength is the absolute length for 200 and the remaining length for 206.
 */
struct ResponseHead {
    int status{0};
    std::optional<std::uint64_t> contentLength{};
    bool acceptRangesBytes{false};
};

// ===================
// Callback signatures
// ===================

using ResponseHandler = std::function<Expected<void>(const ResponseHead&)>;
using BodySink = std::function<Expected<void>(std::span<const std::byte>)>;
using BytesTransferredCallback = std::function<void(std::uint64_t)>;
using TaskCompleteCallback =
    std::function<void(std::size_t completed, std::size_t total, const DownloadOutcome&)>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Metadata probe (HEAD). Non-2xx statuses are returned in the head, not as errors.
     */
    virtual Expected<ResponseHead> head(std::string_view url, std::chrono::milliseconds timeout) = 0;

    /**
     * GET with an optional range. onResponse sees the final status before any body
     * byte reaches sink and may veto the body by returning an error. An error from
     * either callback aborts the transfer and is returned unchanged.
     */
    virtual Expected<ResponseHead> get(std::string_view url, const std::optional<ByteRange>& range,
                                       std::chrono::milliseconds timeout,
                                       const ResponseHandler& onResponse,
                                       const BodySink& sink) = 0;
};

/// libcurl-backed adapter. A null logger means the default spdlog logger.
std::unique_ptr<IHttpAdapter>
makeCurlHttpAdapter(std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace datafetch::downloader
