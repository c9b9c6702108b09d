/*
 * datafetch/src/cli/main.cpp
 *
 * Command-line entry point.
 *
 *   datafetch <datasets.json> [--chunked] [--chunks N] [--retries N] [--workers N]
 *             [--datasets a b ...] [--progress-dir DIR] [--log-level L] [--log-file F]
 *   datafetch --status
 *   datafetch --clean-stale DAYS
 *
 * Exit status is non-zero when the descriptor is invalid or any dataset fails.
 */

#include <datafetch/dataset/dataset_spec.hpp>
#include <datafetch/dataset/orchestrator.hpp>
#include <datafetch/downloader/checksum.hpp>
#include <datafetch/downloader/progress_store.hpp>
#include <datafetch/extraction/archive_extractor.hpp>
#include <datafetch/storage/disk_space.hpp>
#include <datafetch/version.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace datafetch::cli {

namespace {

struct FetchOpts {
    std::optional<fs::path> config_path;
    bool chunked{false};
    std::uint32_t chunks{4};
    int retries{3};
    std::size_t workers{4};
    std::vector<std::string> datasets;
    fs::path progress_dir{downloader::kDefaultProgressRoot};
    std::string log_level{"info"};
    fs::path log_file{"logs/datafetch.log"};
    bool status{false};
    std::optional<int> clean_stale_days;
};

constexpr const char* kLogPattern = "%Y-%m-%d %H:%M:%S - [%l] - [Thread-%t] - %v";

spdlog::level::level_enum parse_level(const std::string& s) {
    if (s == "trace")
        return spdlog::level::trace;
    if (s == "debug")
        return spdlog::level::debug;
    if (s == "warn")
        return spdlog::level::warn;
    if (s == "error")
        return spdlog::level::err;
    return spdlog::level::info;
}

// Colored stderr at the requested level, rotating file at debug.
std::shared_ptr<spdlog::logger> configure_logging(const FetchOpts& opts) {
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(parse_level(opts.log_level));
    std::vector<spdlog::sink_ptr> sinks{console};

    std::string file_error;
    try {
        if (opts.log_file.has_parent_path())
            fs::create_directories(opts.log_file.parent_path());
        const size_t max_size = 10 * 1024 * 1024; // 10MB per file
        const size_t max_files = 5;
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            opts.log_file.string(), max_size, max_files);
        rotating->set_level(spdlog::level::debug);
        sinks.push_back(rotating);
    } catch (const std::exception& e) {
        file_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>("datafetch", sinks.begin(), sinks.end());
    logger->set_pattern(kLogPattern);
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);

    if (!file_error.empty())
        logger->warn("File logging disabled ({}): {}", opts.log_file.string(), file_error);
    return logger;
}

// Throttled byte counter fed by the downloaders' onBytes callbacks.
class ProgressLog {
public:
    explicit ProgressLog(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

    void add(std::uint64_t n) {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes_ += n;
        if (bytes_ - lastLogged_ >= kStep) {
            lastLogged_ = bytes_;
            logger_->debug("Transferred {:.1f} MB", static_cast<double>(bytes_) / (1024.0 * 1024.0));
        }
    }

private:
    static constexpr std::uint64_t kStep = 16ull * 1024ull * 1024ull;
    std::shared_ptr<spdlog::logger> logger_;
    std::mutex mutex_;
    std::uint64_t bytes_{0};
    std::uint64_t lastLogged_{0};
};

int print_status(const FetchOpts& opts) {
    downloader::JsonProgressStore store(opts.progress_dir);
    auto active = store.listActive();
    if (active.empty()) {
        fmt::print("No active downloads\n");
        return 0;
    }
    fmt::print("Active downloads under {} ({}):\n", store.root().string(), active.size());
    for (const auto& [dest, state] : active) {
        if (state.totalSizeBytes && *state.totalSizeBytes > 0) {
            const double pct = 100.0 * static_cast<double>(state.downloadedBytes) /
                               static_cast<double>(*state.totalSizeBytes);
            fmt::print("  {}: {}/{} bytes ({:.1f}%), {}, updated {}\n", dest,
                       state.downloadedBytes, *state.totalSizeBytes, pct,
                       downloader::hashAlgoName(state.digestAlgorithm), state.lastUpdated);
        } else {
            fmt::print("  {}: {} bytes, {}, updated {}\n", dest, state.downloadedBytes,
                       downloader::hashAlgoName(state.digestAlgorithm), state.lastUpdated);
        }
    }
    return 0;
}

int clean_stale(const FetchOpts& opts, const std::shared_ptr<spdlog::logger>& logger) {
    downloader::JsonProgressStore store(opts.progress_dir, logger);
    const auto removed = store.cleanupStale(std::chrono::days(*opts.clean_stale_days));
    logger->info("Removed {} stale progress record(s) older than {} day(s)", removed,
                 *opts.clean_stale_days);
    return 0;
}

int run_fetch(const FetchOpts& opts, const std::shared_ptr<spdlog::logger>& logger) {
    auto specs = dataset::loadDatasetList(*opts.config_path);
    if (!specs.ok()) {
        logger->error("Configuration error: {}", specs.error().message);
        return 1;
    }
    logger->info("Loaded {} dataset(s) from {}", specs.value().size(), opts.config_path->string());

    auto progress = std::make_shared<ProgressLog>(logger);

    dataset::OrchestratorOptions orch;
    orch.forceChunked = opts.chunked;
    orch.numChunks = opts.chunks;
    orch.maxRetries = opts.retries;
    orch.workers = opts.workers;
    orch.onBytes = [progress](std::uint64_t n) { progress->add(n); };
    orch.onTaskComplete = [logger](std::size_t completed, std::size_t total,
                                   const downloader::DownloadOutcome& outcome) {
        logger->info("Progress: {}/{} files ({})", completed, total, outcome.task.taskId);
    };

    std::shared_ptr<downloader::IHttpAdapter> http = downloader::makeCurlHttpAdapter(logger);
    auto store = std::make_shared<downloader::JsonProgressStore>(opts.progress_dir, logger);
    std::shared_ptr<extraction::IArchiveExtractor> extractor =
        extraction::makeArchiveExtractor(logger);
    std::shared_ptr<storage::IDiskSpaceProbe> space = storage::makeFilesystemSpaceProbe();

    dataset::DatasetOrchestrator orchestrator(http, store, extractor, space, orch, logger);
    auto summary = orchestrator.runAll(specs.value(), opts.datasets);
    if (summary.total == 0 && !opts.datasets.empty())
        logger->warn("No datasets matched the requested names");
    return summary.allSucceeded() ? 0 : 1;
}

} // namespace

int run(int argc, char** argv) {
    CLI::App app{"datafetch - resumable, integrity-checked dataset downloader"};
    app.set_version_flag("--version", std::string(DATAFETCH_VERSION_LONG_STRING));

    FetchOpts opts;
    app.add_option("config", opts.config_path, "Dataset descriptor (JSON)");
    app.add_flag("--chunked", opts.chunked, "Use range-partitioned chunked downloads");
    app.add_option("--chunks", opts.chunks, "Chunks per file in chunked mode (default 4)")
        ->check(CLI::Range(1, 64));
    app.add_option("--retries", opts.retries, "Attempts per file (default 3)")
        ->check(CLI::Range(1, 20));
    app.add_option("--workers", opts.workers, "Concurrent files for multi-file datasets (default 4)")
        ->check(CLI::Range(1, 64));
    app.add_option("--datasets", opts.datasets, "Only process the named datasets");
    app.add_option("--progress-dir", opts.progress_dir,
                   "Directory for resume records (default .progress)");
    app.add_option("--log-level", opts.log_level, "Console log level (default info)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option("--log-file", opts.log_file, "Rotating log file (default logs/datafetch.log)");
    auto* status = app.add_flag("--status", opts.status, "List in-flight downloads and exit");
    auto* clean = app.add_option("--clean-stale", opts.clean_stale_days,
                                 "Remove progress records older than DAYS and exit")
                      ->check(CLI::Range(0, 36500));
    status->excludes(clean);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    if (opts.status)
        return print_status(opts);

    auto logger = configure_logging(opts);
    if (opts.clean_stale_days)
        return clean_stale(opts, logger);

    if (!opts.config_path) {
        logger->error("A dataset descriptor path is required");
        fmt::print(stderr, "{}", app.help());
        return 2;
    }
    return run_fetch(opts, logger);
}

} // namespace datafetch::cli

int main(int argc, char** argv) {
    try {
        return datafetch::cli::run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
}
