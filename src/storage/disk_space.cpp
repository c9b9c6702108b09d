#include <datafetch/storage/disk_space.hpp>

#include <cstdio>
#include <string>
#include <system_error>

namespace datafetch::storage {

namespace fs = std::filesystem;
using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

fs::path nearestExistingAncestor(const fs::path& p) {
    std::error_code ec;
    fs::path cur = p.empty() ? fs::path(".") : p;
    while (!fs::exists(cur, ec)) {
        if (!cur.has_parent_path() || cur.parent_path() == cur)
            return fs::path(".");
        cur = cur.parent_path();
    }
    return cur;
}

namespace {

std::string toMiB(std::uint64_t bytes) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1fMB", static_cast<double>(bytes) / (1024.0 * 1024.0));
    return buf;
}

class FilesystemSpaceProbe final : public IDiskSpaceProbe {
public:
    Expected<void> ensureFreeSpace(std::uint64_t requiredBytes, const fs::path& atPath) override {
        const auto probePath = nearestExistingAncestor(atPath);
        std::error_code ec;
        const auto info = fs::space(probePath, ec);
        if (ec) {
            return Error{ErrorCode::IoError,
                         "Cannot query free space at " + probePath.string() + ": " + ec.message()};
        }
        if (info.available < requiredBytes) {
            return Error{ErrorCode::InsufficientSpace,
                         "Insufficient disk space: need " + toMiB(requiredBytes) + ", have " +
                             toMiB(info.available) + " available"};
        }
        return {};
    }
};

} // namespace

std::unique_ptr<IDiskSpaceProbe> makeFilesystemSpaceProbe() {
    return std::make_unique<FilesystemSpaceProbe>();
}

} // namespace datafetch::storage
