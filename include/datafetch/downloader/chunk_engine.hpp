#pragma once

/*
 * datafetch Range-Partitioned Chunk Engine
 *
 * Splits one transfer into N byte ranges fetched concurrently into
 * <destination>.chunks/chunk_NNNN.tmp, then concatenates them in index order.
 *
 * Outcomes:
 * - RangeUnsupported: the probe did not advertise ranges or a size; fall back to
 *   the single-stream downloader
 * - SizeMismatch: probed size disagrees with the expected size (fatal)
 * - ChunkFailed: some chunk exhausted its retries, or workers could not be
 *   started; nothing is left on disk
 * - MergeFailed / SizeMismatch: reassembly problem
 */

#include <datafetch/downloader/downloader.hpp>

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace datafetch::downloader {

struct ChunkOptions {
    std::uint32_t numChunks{4};
    // Upper bound on concurrent chunk fetches; extra chunks queue.
    std::size_t maxParallel{16};
    std::optional<std::uint64_t> expectedSize{};
    RetryPolicy retry{};
    std::chrono::milliseconds probeTimeout{10000};
    std::chrono::milliseconds timeout{30000};
    std::size_t mergeBlockSize{8192};
    BytesTransferredCallback onBytes{};
};

/**
 * numChunks contiguous spans covering [0, totalSize) exactly once. Every span is
 * totalSize / numChunks long except the last, which also takes the remainder.
 * Returns an empty vector when numChunks is zero.
 */
std::vector<RangeSpec> partitionRanges(std::uint64_t totalSize, std::uint32_t numChunks);

std::filesystem::path chunkDirFor(const std::filesystem::path& destination);
std::filesystem::path chunkFilePath(const std::filesystem::path& chunkDir, std::uint32_t index);

class ChunkEngine {
public:
    ChunkEngine(std::shared_ptr<IHttpAdapter> http, std::shared_ptr<spdlog::logger> logger = nullptr,
                Sleeper sleeper = {});

    /// Returns the total byte count written to destination.
    Expected<std::uint64_t> download(std::string_view url,
                                     const std::filesystem::path& destination,
                                     const ChunkOptions& options);

    /// Bytes received across all chunks of the current or last run. Reporting only.
    std::uint64_t bytesTransferred() const;

private:
    Expected<void> fetchChunk(std::string_view url, const RangeSpec& spec,
                              const std::filesystem::path& chunkFile,
                              const ChunkOptions& options);
    Expected<void> fetchChunkOnce(std::string_view url, const RangeSpec& spec,
                                  const std::filesystem::path& chunkFile,
                                  const ChunkOptions& options);
    Expected<void> merge(const std::vector<RangeSpec>& ranges,
                         const std::filesystem::path& chunkDir,
                         const std::filesystem::path& destination, std::size_t blockSize);
    void addProgress(std::uint64_t n, const ChunkOptions& options);

    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<spdlog::logger> logger_;
    Sleeper sleeper_;

    mutable std::mutex progressMutex_;
    std::uint64_t transferred_{0};
};

} // namespace datafetch::downloader
