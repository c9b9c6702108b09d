#pragma once

/*
 * datafetch Dataset Orchestrator
 *
 * Drives one DatasetSpec end to end: free-space check, download (chunked with
 * single-stream fallback, single-stream, or multi-file), digest verification,
 * progress-record cleanup and optional extraction.
 */

#include <datafetch/dataset/dataset_spec.hpp>
#include <datafetch/downloader/downloader.hpp>
#include <datafetch/downloader/progress_store.hpp>
#include <datafetch/extraction/archive_extractor.hpp>
#include <datafetch/storage/disk_space.hpp>

#include <spdlog/logger.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace datafetch::dataset {

struct OrchestratorOptions {
    bool forceChunked{false};
    std::uint32_t numChunks{4};
    int maxRetries{3};
    std::size_t workers{4};
    std::chrono::milliseconds baseDelay{1000};
    std::chrono::milliseconds maxDelay{60000};
    downloader::BytesTransferredCallback onBytes{};
    downloader::TaskCompleteCallback onTaskComplete{};
};

struct DatasetResult {
    std::string name;
    bool succeeded{false};
    std::optional<Error> error{};
    std::optional<std::filesystem::path> location{};
};

struct RunSummary {
    std::size_t total{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::vector<DatasetResult> results;

    [[nodiscard]] bool allSucceeded() const noexcept { return failed == 0; }
};

class DatasetOrchestrator {
public:
    DatasetOrchestrator(std::shared_ptr<downloader::IHttpAdapter> http,
                        std::shared_ptr<downloader::IProgressStore> store,
                        std::shared_ptr<extraction::IArchiveExtractor> extractor,
                        std::shared_ptr<storage::IDiskSpaceProbe> spaceProbe,
                        OrchestratorOptions options = {},
                        std::shared_ptr<spdlog::logger> logger = nullptr,
                        downloader::Sleeper sleeper = {});

    /// Returns the dataset directory (destinationFolder / name) on success.
    Expected<std::filesystem::path> downloadDataset(const DatasetSpec& spec);

    /// Sequential, in descriptor order. Names absent from a non-empty filter are skipped.
    RunSummary runAll(const std::vector<DatasetSpec>& specs,
                      const std::vector<std::string>& filter = {});

private:
    Expected<std::filesystem::path> downloadSingle(const DatasetSpec& spec, const SingleFile& file);
    Expected<std::filesystem::path> downloadMulti(const DatasetSpec& spec, const MultiFile& files);

    Expected<void> fetchChunked(const std::string& url, const std::filesystem::path& dest,
                                std::uint64_t size);
    Expected<void> fetchSingleStream(const std::string& url, const std::filesystem::path& dest,
                                     std::uint64_t size, const DatasetSpec& spec,
                                     const std::string& checksum);
    Expected<void> verifyDigest(const std::filesystem::path& dest, const std::string& checksum,
                                downloader::HashAlgo algo);
    Expected<void> extractArchive(const DatasetSpec& spec, const std::filesystem::path& archive,
                                  const std::filesystem::path& destDir);

    downloader::RetryPolicy retryPolicy() const;

    std::shared_ptr<downloader::IHttpAdapter> http_;
    std::shared_ptr<downloader::IProgressStore> store_;
    std::shared_ptr<extraction::IArchiveExtractor> extractor_;
    std::shared_ptr<storage::IDiskSpaceProbe> space_;
    OrchestratorOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    downloader::Sleeper sleeper_;
};

} // namespace datafetch::dataset
