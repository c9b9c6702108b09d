/*
 * datafetch/src/dataset/orchestrator.cpp
 *
 * Per-dataset workflow. Single files go through the chunk engine when chunking
 * is requested, falling back to the resumable single-stream downloader when the
 * server declines ranges or a chunk fails. Multi-file datasets fan out through
 * the MultiFileScheduler.
 */

#include <datafetch/dataset/orchestrator.hpp>
#include <datafetch/downloader/checksum.hpp>
#include <datafetch/downloader/chunk_engine.hpp>
#include <datafetch/downloader/resumable_downloader.hpp>
#include <datafetch/downloader/scheduler.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

namespace datafetch::dataset {

namespace fs = std::filesystem;
using downloader::ChunkEngine;
using downloader::ChunkOptions;
using downloader::DownloadOptions;
using downloader::DownloadTask;
using downloader::MultiFileScheduler;
using downloader::ResumableDownloader;

namespace {

constexpr std::uint64_t kExtractionSpaceFactor = 3;

} // namespace

DatasetOrchestrator::DatasetOrchestrator(std::shared_ptr<downloader::IHttpAdapter> http,
                                         std::shared_ptr<downloader::IProgressStore> store,
                                         std::shared_ptr<extraction::IArchiveExtractor> extractor,
                                         std::shared_ptr<storage::IDiskSpaceProbe> spaceProbe,
                                         OrchestratorOptions options,
                                         std::shared_ptr<spdlog::logger> logger,
                                         downloader::Sleeper sleeper)
    : http_(std::move(http)), store_(std::move(store)), extractor_(std::move(extractor)),
      space_(std::move(spaceProbe)), options_(std::move(options)),
      logger_(logger ? std::move(logger) : spdlog::default_logger()), sleeper_(std::move(sleeper)) {
}

downloader::RetryPolicy DatasetOrchestrator::retryPolicy() const {
    downloader::RetryPolicy policy;
    policy.maxAttempts = options_.maxRetries;
    policy.baseDelay = options_.baseDelay;
    policy.maxDelay = options_.maxDelay;
    return policy;
}

Expected<fs::path> DatasetOrchestrator::downloadDataset(const DatasetSpec& spec) {
    logger_->info("Processing dataset: {} (strategy: {})", spec.name, strategyName(spec.strategy));

    std::error_code ec;
    fs::create_directories(spec.datasetDir(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot create dataset directory " +
                                             spec.datasetDir().string() + ": " + ec.message()};
    }

    if (const auto* single = std::get_if<SingleFile>(&spec.source))
        return downloadSingle(spec, *single);
    return downloadMulti(spec, std::get<MultiFile>(spec.source));
}

Expected<fs::path> DatasetOrchestrator::downloadSingle(const DatasetSpec& spec,
                                                       const SingleFile& file) {
    const fs::path dest = spec.datasetDir() / urlBasename(file.url);

    const std::uint64_t required =
        file.fileSize * (spec.extractAfterDownload ? kExtractionSpaceFactor : 1);
    if (space_) {
        if (auto r = space_->ensureFreeSpace(required, spec.destinationFolder); !r.ok()) {
            logger_->error("[{}] {}", spec.name, r.error().message);
            return r.error();
        }
    }

    bool fetched = false;
    if (options_.forceChunked || spec.strategy == Strategy::Chunked) {
        auto chunked = fetchChunked(file.url, dest, file.fileSize);
        if (chunked.ok()) {
            fetched = true;
        } else if (chunked.error().code == ErrorCode::RangeUnsupported ||
                   chunked.error().code == ErrorCode::ChunkFailed) {
            logger_->warn("[{}] Chunked download unavailable ({}); falling back to single stream",
                          spec.name, chunked.error().message);
        } else {
            logger_->error("[{}] {}", spec.name, chunked.error().message);
            return chunked.error();
        }
    }

    if (!fetched) {
        if (auto r = fetchSingleStream(file.url, dest, file.fileSize, spec, file.checksum);
            !r.ok()) {
            logger_->error("[{}] {}", spec.name, r.error().message);
            return r.error();
        }
    }

    if (auto r = verifyDigest(dest, file.checksum, spec.checksumAlgo); !r.ok()) {
        logger_->error("[{}] {}", spec.name, r.error().message);
        return r.error();
    }
    store_->remove(dest);
    logger_->info("[{}] Downloaded {}", spec.name, dest.string());

    if (spec.extractAfterDownload) {
        if (auto r = extractArchive(spec, dest, spec.datasetDir()); !r.ok())
            return r.error();
    }
    return spec.datasetDir();
}

Expected<void> DatasetOrchestrator::fetchChunked(const std::string& url, const fs::path& dest,
                                                 std::uint64_t size) {
    ChunkOptions opts;
    opts.numChunks = options_.numChunks;
    opts.expectedSize = size;
    opts.retry = retryPolicy();
    opts.onBytes = options_.onBytes;

    ChunkEngine engine(http_, logger_, sleeper_);
    auto r = engine.download(url, dest, opts);
    if (!r.ok())
        return r.error();
    return {};
}

Expected<void> DatasetOrchestrator::fetchSingleStream(const std::string& url, const fs::path& dest,
                                                      std::uint64_t size, const DatasetSpec& spec,
                                                      const std::string& checksum) {
    DownloadOptions opts;
    opts.expectedSize = size;
    opts.expectedDigest = checksum;
    opts.digestAlgorithm = spec.checksumAlgo;
    opts.retry = retryPolicy();
    opts.onBytes = options_.onBytes;

    ResumableDownloader downloader(http_, store_, logger_, sleeper_);
    auto r = downloader.download(url, dest, opts);
    if (!r.ok())
        return r.error();
    return {};
}

Expected<void> DatasetOrchestrator::verifyDigest(const fs::path& dest, const std::string& checksum,
                                                 downloader::HashAlgo algo) {
    if (downloader::isSkipDigest(checksum)) {
        logger_->debug("Checksum verification skipped for {}", dest.string());
        return {};
    }
    auto r = downloader::verifyFile(dest, checksum, algo);
    if (!r.ok() && r.error().code == ErrorCode::ChecksumMismatch) {
        std::error_code ec;
        fs::remove(dest, ec);
        store_->remove(dest);
    }
    return r;
}

Expected<void> DatasetOrchestrator::extractArchive(const DatasetSpec& spec, const fs::path& archive,
                                                   const fs::path& destDir) {
    if (!extractor_)
        return Error{ErrorCode::ExtractionFailed, "No archive extractor configured"};

    logger_->info("[{}] Extracting {} to {}", spec.name, archive.filename().string(),
                  destDir.string());
    auto r = extractor_->extract(archive, destDir, spec.extractFormat);
    if (!r.ok()) {
        logger_->error("[{}] Extraction failed for {}: {}", spec.name, archive.string(),
                       r.error().message);
        return r.error();
    }
    std::error_code ec;
    fs::remove(archive, ec);
    if (ec)
        logger_->warn("[{}] Could not remove archive {}: {}", spec.name, archive.string(),
                      ec.message());
    return {};
}

Expected<fs::path> DatasetOrchestrator::downloadMulti(const DatasetSpec& spec,
                                                      const MultiFile& files) {
    // Two tasks must never share a destination.
    std::set<std::string> basenames;
    for (const auto& f : files.files) {
        if (!basenames.insert(urlBasename(f.url)).second) {
            std::string msg = "Dataset '" + spec.name + "': more than one url ends in '" +
                              urlBasename(f.url) + "'";
            logger_->error(msg);
            return Error{ErrorCode::InvalidDescriptor, std::move(msg)};
        }
    }

    std::uint64_t total = 0;
    for (const auto& f : files.files)
        total += f.fileSize;
    const std::uint64_t required =
        total * (spec.extractAfterDownload ? kExtractionSpaceFactor : 1);
    if (space_) {
        if (auto r = space_->ensureFreeSpace(required, spec.destinationFolder); !r.ok()) {
            logger_->error("[{}] {}", spec.name, r.error().message);
            return r.error();
        }
    }

    std::vector<DownloadTask> tasks;
    tasks.reserve(files.files.size());
    for (const auto& f : files.files) {
        const auto base = urlBasename(f.url);
        tasks.push_back(downloader::makeTask(f.url, spec.datasetDir() / base, f.fileSize,
                                             f.checksum, spec.checksumAlgo,
                                             spec.name + "/" + base));
    }

    DownloadOptions base;
    base.retry = retryPolicy();
    base.onBytes = options_.onBytes;
    MultiFileScheduler scheduler(
        downloader::makeDownloadAndValidateRunner(http_, store_, logger_, base, sleeper_),
        logger_);
    auto outcomes = scheduler.runAll(tasks, std::max<std::size_t>(options_.workers, 1),
                                     std::max(options_.maxRetries, 1), options_.onTaskComplete);

    std::size_t failed = 0;
    std::optional<ErrorCode> firstCode;
    std::string detail;
    for (const auto& o : outcomes) {
        if (o.succeeded)
            continue;
        ++failed;
        const auto code = o.failureReason ? o.failureReason->code : ErrorCode::Unknown;
        if (!firstCode)
            firstCode = code;
        if (!detail.empty())
            detail += "; ";
        detail += o.task.taskId + ": " +
                  (o.failureReason ? o.failureReason->message : std::string("unknown error"));
    }
    if (failed > 0) {
        std::string msg = "Dataset '" + spec.name + "': " + std::to_string(failed) + " of " +
                          std::to_string(outcomes.size()) + " files failed (" + detail + ")";
        logger_->error(msg);
        return Error{*firstCode, std::move(msg)};
    }

    if (spec.extractAfterDownload) {
        std::size_t extractFailures = 0;
        for (const auto& o : outcomes) {
            const fs::path archive = o.finalPath.value_or(o.task.destinationPath);
            if (!extractArchive(spec, archive, spec.datasetDir()).ok())
                ++extractFailures;
        }
        if (extractFailures > 0) {
            return Error{ErrorCode::ExtractionFailed,
                         "Dataset '" + spec.name + "': " + std::to_string(extractFailures) +
                             " archive(s) failed to extract"};
        }
    }

    logger_->info("[{}] All {} files downloaded", spec.name, outcomes.size());
    return spec.datasetDir();
}

RunSummary DatasetOrchestrator::runAll(const std::vector<DatasetSpec>& specs,
                                       const std::vector<std::string>& filter) {
    RunSummary summary;
    for (const auto& spec : specs) {
        if (!filter.empty() && std::find(filter.begin(), filter.end(), spec.name) == filter.end()) {
            logger_->debug("Skipping dataset {} (not selected)", spec.name);
            continue;
        }

        DatasetResult result;
        result.name = spec.name;
        auto r = downloadDataset(spec);
        if (r.ok()) {
            result.succeeded = true;
            result.location = r.value();
            ++summary.succeeded;
        } else {
            result.error = r.error();
            ++summary.failed;
        }
        ++summary.total;
        summary.results.push_back(std::move(result));
    }

    logger_->info("Download summary: {} total, {} succeeded, {} failed", summary.total,
                  summary.succeeded, summary.failed);
    for (const auto& r : summary.results) {
        if (!r.succeeded && r.error)
            logger_->error("  {}: [{}] {}", r.name, downloader::errorCodeName(r.error->code),
                           r.error->message);
        else if (!r.succeeded)
            logger_->error("  {}: unknown error", r.name);
    }
    return summary;
}

} // namespace datafetch::dataset
