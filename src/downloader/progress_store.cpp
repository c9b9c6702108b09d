/*
 * datafetch/src/downloader/progress_store.cpp
 *
 * JSON-backed Progress Store.
 *
 * - Implements datafetch::downloader::IProgressStore
 * - One JSON document per destination; no shared index file, no global lock
 * - save(): serialize, write <record>.tmp.<n>, rename over <record>
 * - load(): missing -> absent; unparsable, malformed or owned by another
 *   destination -> absent + warning
 */

#include <datafetch/downloader/checksum.hpp>
#include <datafetch/downloader/progress_store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <ctime>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace datafetch::downloader {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::atomic<std::uint64_t> g_tmpCounter{0};

std::string statusName(TransferStatus s) {
    return s == TransferStatus::Complete ? "complete" : "in_progress";
}

json toJson(const TransferState& st) {
    json j;
    j["url"] = st.sourceUrl;
    j["destination"] = st.destinationPath;
    j["downloaded_bytes"] = st.downloadedBytes;
    j["total_size"] = st.totalSizeBytes ? json(*st.totalSizeBytes) : json(nullptr);
    j["checksum"] = st.digestExpected ? json(*st.digestExpected) : json(nullptr);
    j["checksum_type"] = std::string(hashAlgoName(st.digestAlgorithm));
    j["status"] = statusName(st.status);
    j["last_updated"] = st.lastUpdated;
    return j;
}

// Returns nullopt when a required field is missing or has the wrong type.
std::optional<TransferState> fromJson(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    if (!j.contains("url") || !j["url"].is_string())
        return std::nullopt;
    if (!j.contains("destination") || !j["destination"].is_string())
        return std::nullopt;
    if (!j.contains("downloaded_bytes") || !j["downloaded_bytes"].is_number_unsigned())
        return std::nullopt;

    TransferState st;
    st.sourceUrl = j["url"].get<std::string>();
    st.destinationPath = j["destination"].get<std::string>();
    st.downloadedBytes = j["downloaded_bytes"].get<std::uint64_t>();
    if (j.contains("total_size") && j["total_size"].is_number_unsigned()) {
        st.totalSizeBytes = j["total_size"].get<std::uint64_t>();
    }
    if (j.contains("checksum") && j["checksum"].is_string()) {
        st.digestExpected = j["checksum"].get<std::string>();
    }
    if (j.contains("checksum_type") && j["checksum_type"].is_string()) {
        st.digestAlgorithm =
            j["checksum_type"].get<std::string>() == "sha256" ? HashAlgo::Sha256 : HashAlgo::Md5;
    }
    if (j.contains("status") && j["status"].is_string()) {
        const auto s = j["status"].get<std::string>();
        if (s == "complete")
            st.status = TransferStatus::Complete;
        else if (s == "in_progress")
            st.status = TransferStatus::InProgress;
        else
            return std::nullopt;
    }
    if (j.contains("last_updated") && j["last_updated"].is_string()) {
        st.lastUpdated = j["last_updated"].get<std::string>();
    }
    return st;
}

std::optional<json> readJsonFile(const fs::path& p, std::string& why) {
    std::ifstream in(p);
    if (!in) {
        why = "cannot open for read";
        return std::nullopt;
    }
    try {
        json root;
        in >> root;
        return root;
    } catch (const json::exception& e) {
        why = e.what();
        return std::nullopt;
    }
}

bool endsWith(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf, n);
}

JsonProgressStore::JsonProgressStore(fs::path root, std::shared_ptr<spdlog::logger> logger)
    : root_(std::move(root)), logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

fs::path JsonProgressStore::pathFor(const fs::path& destination) const {
    // Mirror the destination below root; ".." and root components never escape it.
    fs::path rel;
    for (const auto& part : destination.lexically_normal().relative_path()) {
        if (part == ".." || part == "." || part.empty())
            continue;
        rel /= part;
    }
    fs::path record = root_ / rel;
    record += std::string(kProgressSuffix);
    return record;
}

ProgressLoad JsonProgressStore::load(const fs::path& destination) {
    ProgressLoad out;
    const auto record = pathFor(destination);
    std::error_code ec;
    if (!fs::exists(record, ec))
        return out;

    std::string why;
    auto root = readJsonFile(record, why);
    if (!root) {
        out.warning = "Unreadable progress record " + record.string() + ": " + why;
        logger_->warn("{}", *out.warning);
        return out;
    }
    auto st = fromJson(*root);
    if (!st) {
        out.warning = "Malformed progress record " + record.string();
        logger_->warn("{}", *out.warning);
        return out;
    }
    // Distinct destinations can share a record path; the stored destination decides.
    if (fs::path(st->destinationPath).lexically_normal() != destination.lexically_normal()) {
        out.warning = "Progress record " + record.string() + " belongs to " +
                      st->destinationPath + ", not " + destination.string();
        logger_->warn("{}", *out.warning);
        return out;
    }
    logger_->debug("Loaded progress for {}: {} bytes", destination.string(), st->downloadedBytes);
    out.state = std::move(st);
    return out;
}

Expected<void> JsonProgressStore::save(const fs::path& destination, const TransferState& state) {
    const auto record = pathFor(destination);
    fs::path tmp = record;
    tmp += ".tmp." + std::to_string(g_tmpCounter.fetch_add(1, std::memory_order_relaxed));

    TransferState stamped = state;
    stamped.lastUpdated = utcTimestamp();

    std::error_code ec;
    fs::create_directories(record.parent_path(), ec);
    if (ec) {
        logger_->error("Failed to create progress directory {}: {}",
                       record.parent_path().string(), ec.message());
        return Error{ErrorCode::IoError, "create_directories failed: " + ec.message()};
    }

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            logger_->error("Failed to open progress temp file {}", tmp.string());
            return Error{ErrorCode::IoError, "Failed to open progress temp file"};
        }
        out << toJson(stamped).dump(2);
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            logger_->error("Failed to write progress temp file {}", tmp.string());
            return Error{ErrorCode::IoError, "Failed to write progress temp file"};
        }
    }

    fs::rename(tmp, record, ec);
    if (ec) {
        const auto msg = ec.message();
        fs::remove(tmp, ec);
        logger_->error("Failed to publish progress record {}: {}", record.string(), msg);
        return Error{ErrorCode::IoError, "rename failed: " + msg};
    }
    logger_->debug("Saved progress for {}: {} bytes ({})", destination.string(),
                   stamped.downloadedBytes, statusName(stamped.status));
    return {};
}

void JsonProgressStore::remove(const fs::path& destination) noexcept {
    std::error_code ec;
    const auto record = pathFor(destination);
    if (fs::remove(record, ec)) {
        logger_->debug("Removed progress record {}", record.string());
    }
}

bool JsonProgressStore::validatePartial(const fs::path& destination,
                                        std::uint64_t expectedBytes) const {
    std::error_code ec;
    if (!fs::is_regular_file(destination, ec))
        return false;
    const auto size = fs::file_size(destination, ec);
    return !ec && size == expectedBytes;
}

std::map<std::string, TransferState> JsonProgressStore::listActive() const {
    std::map<std::string, TransferState> out;
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
        return out;

    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        const auto name = it->path().filename().string();
        if (!endsWith(name, kProgressSuffix))
            continue;
        std::string why;
        auto root = readJsonFile(it->path(), why);
        if (!root) {
            logger_->warn("Skipping unreadable progress record {}: {}", it->path().string(), why);
            continue;
        }
        if (auto st = fromJson(*root)) {
            out.emplace(st->destinationPath, std::move(*st));
        }
    }
    return out;
}

std::size_t JsonProgressStore::cleanupStale(std::chrono::hours maxAge) {
    std::size_t removed = 0;
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
        return removed;

    const auto cutoff = fs::file_time_type::clock::now() - maxAge;
    std::vector<fs::path> stale;
    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec))
            continue;
        if (!endsWith(it->path().filename().string(), kProgressSuffix))
            continue;
        const auto mtime = fs::last_write_time(it->path(), ec);
        if (!ec && mtime < cutoff)
            stale.push_back(it->path());
    }
    for (const auto& p : stale) {
        std::error_code rec;
        if (fs::remove(p, rec)) {
            ++removed;
            logger_->info("Removed stale progress record {}", p.string());
        } else if (rec) {
            logger_->warn("Failed to remove stale progress record {}: {}", p.string(),
                          rec.message());
        }
    }
    return removed;
}

} // namespace datafetch::downloader
