#pragma once

/*
 * datafetch Progress Store
 *
 * Durable per-destination TransferState records. Each record is a JSON file
 * under a dedicated root that mirrors the destination's directory structure:
 *
 *   <root>/<destination relative path>.progress
 *
 * Records are replaced with a write-to-temp + rename so a reader never sees a
 * partially written record. Records are independent; there is no cross-record lock.
 */

#include <datafetch/downloader/downloader.hpp>

#include <spdlog/logger.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace datafetch::downloader {

inline constexpr std::string_view kProgressSuffix = ".progress";
inline constexpr std::string_view kDefaultProgressRoot = ".progress";

/**
 * Result of load(): a missing record and an unreadable record both yield no state;
 * the latter also carries a warning for the caller.
 */
struct ProgressLoad {
    std::optional<TransferState> state;
    std::optional<std::string> warning;
};

class IProgressStore {
public:
    virtual ~IProgressStore() = default;

    virtual ProgressLoad load(const std::filesystem::path& destination) = 0;

    /**
     * Persist state with a fresh lastUpdated stamp. Failures are logged, the temp
     * artifact is removed, and the error is returned for the caller to report.
     */
    virtual Expected<void> save(const std::filesystem::path& destination,
                                const TransferState& state) = 0;

    virtual std::filesystem::path pathFor(const std::filesystem::path& destination) const = 0;
    virtual void remove(const std::filesystem::path& destination) noexcept = 0;

    /// True iff destination exists and is exactly expectedBytes long.
    virtual bool validatePartial(const std::filesystem::path& destination,
                                 std::uint64_t expectedBytes) const = 0;
};

class JsonProgressStore final : public IProgressStore {
public:
    explicit JsonProgressStore(std::filesystem::path root = std::filesystem::path(kDefaultProgressRoot),
                               std::shared_ptr<spdlog::logger> logger = nullptr);

    ProgressLoad load(const std::filesystem::path& destination) override;
    Expected<void> save(const std::filesystem::path& destination,
                        const TransferState& state) override;
    std::filesystem::path pathFor(const std::filesystem::path& destination) const override;
    void remove(const std::filesystem::path& destination) noexcept override;
    bool validatePartial(const std::filesystem::path& destination,
                         std::uint64_t expectedBytes) const override;

    /// Every parsable record under the root, keyed by destination path.
    std::map<std::string, TransferState> listActive() const;

    /// Delete records whose modification time is older than maxAge. Returns the count removed.
    std::size_t cleanupStale(std::chrono::hours maxAge);

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
    std::shared_ptr<spdlog::logger> logger_;
};

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utcTimestamp();

} // namespace datafetch::downloader
