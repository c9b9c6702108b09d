/*
 * datafetch/src/downloader/chunk_engine.cpp
 *
 * Parallel ranged download with ordered reassembly.
 *
 * - Chunks run on a thread pool of min(numChunks, maxParallel) threads; each
 *   chunk owns its chunk file exclusively
 * - A chunk retry refetches the whole chunk range
 * - All-or-nothing join: any failed chunk removes the chunk directory
 * - Merge appends chunks strictly by index and deletes each one once appended
 */

#include <datafetch/downloader/chunk_engine.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <exception>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace datafetch::downloader {

namespace fs = std::filesystem;

std::vector<RangeSpec> partitionRanges(std::uint64_t totalSize, std::uint32_t numChunks) {
    std::vector<RangeSpec> ranges;
    if (numChunks == 0)
        return ranges;
    ranges.reserve(numChunks);
    const std::uint64_t chunkSize = totalSize / numChunks;
    for (std::uint32_t i = 0; i < numChunks; ++i) {
        RangeSpec r;
        r.index = i;
        r.startByte = static_cast<std::uint64_t>(i) * chunkSize;
        r.size = (i == numChunks - 1) ? totalSize - r.startByte : chunkSize;
        ranges.push_back(r);
    }
    return ranges;
}

fs::path chunkDirFor(const fs::path& destination) {
    fs::path dir = destination;
    dir += ".chunks";
    return dir;
}

fs::path chunkFilePath(const fs::path& chunkDir, std::uint32_t index) {
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%04u.tmp", static_cast<unsigned>(index));
    return chunkDir / name;
}

namespace {

void removeChunkDir(const fs::path& dir, spdlog::logger& logger) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        logger.warn("Failed to remove chunk directory {}: {}", dir.string(), ec.message());
    }
}

} // namespace

ChunkEngine::ChunkEngine(std::shared_ptr<IHttpAdapter> http, std::shared_ptr<spdlog::logger> logger,
                         Sleeper sleeper)
    : http_(std::move(http)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::uint64_t ChunkEngine::bytesTransferred() const {
    std::lock_guard<std::mutex> lock(progressMutex_);
    return transferred_;
}

void ChunkEngine::addProgress(std::uint64_t n, const ChunkOptions& options) {
    std::lock_guard<std::mutex> lock(progressMutex_);
    transferred_ += n;
    if (options.onBytes)
        options.onBytes(n);
}

Expected<void> ChunkEngine::fetchChunkOnce(std::string_view url, const RangeSpec& spec,
                                           const fs::path& chunkFile,
                                           const ChunkOptions& options) {
    std::ofstream out(chunkFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Cannot open chunk file " + chunkFile.string()};
    }
    if (spec.size == 0) {
        return {};
    }

    std::uint64_t received = 0;
    auto onResponse = [&](const ResponseHead& head) -> Expected<void> {
        if (head.status == 206)
            return {};
        if (head.status >= 500 && head.status < 600) {
            return Error{ErrorCode::ServerError,
                         "Server error " + std::to_string(head.status) + " for chunk"};
        }
        return Error{ErrorCode::ChunkFailed,
                     "Expected 206 Partial Content, got " + std::to_string(head.status)};
    };
    auto sink = [&](std::span<const std::byte> bytes) -> Expected<void> {
        if (received + bytes.size() > spec.size) {
            return Error{ErrorCode::SizeMismatch, "Chunk received more than its range"};
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Error{ErrorCode::IoError, "Write failed for " + chunkFile.string()};
        }
        received += bytes.size();
        addProgress(bytes.size(), options);
        return {};
    };

    auto r = http_->get(url, ByteRange{spec.startByte, spec.endByteInclusive()}, options.timeout,
                        onResponse, sink);
    out.flush();
    if (!r.ok())
        return r.error();
    if (!out) {
        return Error{ErrorCode::IoError, "Flush failed for " + chunkFile.string()};
    }
    if (received != spec.size) {
        return Error{ErrorCode::NetworkError, "Chunk ended after " + std::to_string(received) +
                                                  " of " + std::to_string(spec.size) + " bytes"};
    }
    return {};
}

Expected<void> ChunkEngine::fetchChunk(std::string_view url, const RangeSpec& spec,
                                       const fs::path& chunkFile, const ChunkOptions& options) {
    const int maxAttempts = std::max(1, options.retry.maxAttempts);
    Error last{ErrorCode::Unknown, "no attempt made"};
    for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
        logger_->debug("Chunk {}: bytes {}-{} (attempt {}/{})", spec.index, spec.startByte,
                       spec.endByteInclusive(), attempt, maxAttempts);
        auto r = fetchChunkOnce(url, spec, chunkFile, options);
        if (r.ok()) {
            logger_->debug("Chunk {}: complete", spec.index);
            return {};
        }
        last = r.error();
        if (classify(last.code) != Disposition::Retryable) {
            logger_->warn("Chunk {} failed: {}", spec.index, last.message);
            return last;
        }
        logger_->warn("Chunk {} failed (attempt {}/{}): {}", spec.index, attempt, maxAttempts,
                      last.message);
        if (attempt < maxAttempts)
            sleeper_(backoffDelay(options.retry, attempt));
    }
    return Error{ErrorCode::RetriesExhausted, "Chunk " + std::to_string(spec.index) + " failed after " +
                                                  std::to_string(maxAttempts) +
                                                  " attempts: " + last.message};
}

Expected<void> ChunkEngine::merge(const std::vector<RangeSpec>& ranges, const fs::path& chunkDir,
                                  const fs::path& destination, std::size_t blockSize) {
    logger_->info("Merging {} chunks into {}", ranges.size(), destination.string());
    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::MergeFailed, "Cannot open " + destination.string() + " for merge"};
    }

    std::vector<char> buffer(std::max<std::size_t>(1, blockSize));
    for (const auto& spec : ranges) {
        const auto chunkFile = chunkFilePath(chunkDir, spec.index);
        std::error_code ec;
        if (!fs::exists(chunkFile, ec)) {
            return Error{ErrorCode::MergeFailed, "Chunk file missing: " + chunkFile.string()};
        }
        {
            std::ifstream in(chunkFile, std::ios::binary);
            if (!in) {
                return Error{ErrorCode::MergeFailed, "Cannot read chunk " + chunkFile.string()};
            }
            while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
                   in.gcount() > 0) {
                out.write(buffer.data(), in.gcount());
                if (!out) {
                    return Error{ErrorCode::MergeFailed,
                                 "Write failed while merging into " + destination.string()};
                }
            }
            if (in.bad()) {
                return Error{ErrorCode::MergeFailed, "Read failed for " + chunkFile.string()};
            }
        }
        fs::remove(chunkFile, ec);
        if (ec) {
            logger_->warn("Could not delete merged chunk {}: {}", chunkFile.string(),
                          ec.message());
        }
    }
    out.flush();
    if (!out) {
        return Error{ErrorCode::MergeFailed, "Flush failed for " + destination.string()};
    }
    return {};
}

Expected<std::uint64_t> ChunkEngine::download(std::string_view url, const fs::path& destination,
                                              const ChunkOptions& options) {
    if (options.numChunks == 0) {
        return Error{ErrorCode::InvalidArgument, "numChunks must be at least 1"};
    }
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        transferred_ = 0;
    }

    auto probe = http_->head(url, options.probeTimeout);
    if (!probe.ok()) {
        logger_->warn("Range probe failed for {}: {}", url, probe.error().message);
        return Error{ErrorCode::RangeUnsupported, "Range probe failed: " + probe.error().message};
    }
    const auto& head = probe.value();
    if (head.status < 200 || head.status >= 300) {
        logger_->warn("Range probe for {} returned status {}", url, head.status);
        return Error{ErrorCode::RangeUnsupported,
                     "Range probe returned status " + std::to_string(head.status)};
    }
    if (!head.acceptRangesBytes) {
        logger_->warn("Server does not support Range requests: {}", url);
        return Error{ErrorCode::RangeUnsupported, "Server does not support Range requests"};
    }
    if (!head.contentLength || *head.contentLength == 0) {
        logger_->warn("Could not determine file size: {}", url);
        return Error{ErrorCode::RangeUnsupported, "Could not determine file size"};
    }
    const std::uint64_t total = *head.contentLength;
    if (options.expectedSize && *options.expectedSize != total) {
        logger_->error("File size mismatch for {}: expected {}, got {}", url,
                       *options.expectedSize, total);
        return Error{ErrorCode::SizeMismatch, "File size mismatch: expected " +
                                                  std::to_string(*options.expectedSize) +
                                                  ", got " + std::to_string(total)};
    }

    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "Cannot create directory " +
                                                 destination.parent_path().string() + ": " +
                                                 ec.message()};
        }
    }
    const auto chunkDir = chunkDirFor(destination);
    fs::remove_all(chunkDir, ec);
    fs::create_directories(chunkDir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot create chunk directory " + chunkDir.string() +
                                             ": " + ec.message()};
    }

    const auto ranges = partitionRanges(total, options.numChunks);
    const std::size_t threads =
        std::min<std::size_t>(ranges.size(), std::max<std::size_t>(1, options.maxParallel));
    logger_->info("Starting chunked download of {} ({} bytes) in {} chunks on {} threads", url,
                  total, ranges.size(), threads);

    std::vector<std::optional<Error>> failures(ranges.size());
    try {
        boost::asio::thread_pool pool(threads);
        for (std::size_t i = 0; i < ranges.size(); ++i) {
            boost::asio::post(pool, [&, i] {
                const auto& spec = ranges[i];
                try {
                    auto r = fetchChunk(url, spec, chunkFilePath(chunkDir, spec.index), options);
                    if (!r.ok())
                        failures[i] = r.error();
                } catch (const std::exception& e) {
                    failures[i] = Error{ErrorCode::Unknown, e.what()};
                }
            });
        }
        pool.join();
    } catch (const std::exception& e) {
        // Thread creation failure surfaces here as boost::system::system_error.
        logger_->error("Could not start chunk workers for {}: {}", url, e.what());
        removeChunkDir(chunkDir, *logger_);
        return Error{ErrorCode::ChunkFailed,
                     std::string("Could not start chunk workers: ") + e.what()};
    }

    std::string summary;
    std::size_t failed = 0;
    for (std::size_t i = 0; i < failures.size(); ++i) {
        if (!failures[i])
            continue;
        ++failed;
        if (!summary.empty())
            summary += "; ";
        summary += "Chunk " + std::to_string(ranges[i].index) + ": " + failures[i]->message;
    }
    if (failed > 0) {
        logger_->error("Chunked download of {} failed with {} errors: {}", url, failed, summary);
        removeChunkDir(chunkDir, *logger_);
        return Error{ErrorCode::ChunkFailed, summary};
    }

    auto merged = merge(ranges, chunkDir, destination, options.mergeBlockSize);
    removeChunkDir(chunkDir, *logger_);
    if (!merged.ok()) {
        logger_->error("Failed to merge chunks: {}", merged.error().message);
        return merged.error();
    }

    const auto actual = fs::file_size(destination, ec);
    if (ec || actual != total) {
        const auto got = ec ? std::string("unknown") : std::to_string(actual);
        logger_->error("Final file size mismatch for {}: expected {}, got {}",
                       destination.string(), total, got);
        return Error{ErrorCode::SizeMismatch,
                     "Final file size mismatch: expected " + std::to_string(total) + ", got " + got};
    }
    logger_->info("Chunked download successful: {}", destination.string());
    return total;
}

} // namespace datafetch::downloader
