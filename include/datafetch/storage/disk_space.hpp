#pragma once

#include <datafetch/downloader/downloader.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>

namespace datafetch::storage {

/**
 * Free-space precondition checked before a transfer of known size starts.
 */
class IDiskSpaceProbe {
public:
    virtual ~IDiskSpaceProbe() = default;

    /// InsufficientSpace when fewer than requiredBytes are available at atPath.
    virtual downloader::Expected<void> ensureFreeSpace(std::uint64_t requiredBytes,
                                                       const std::filesystem::path& atPath) = 0;
};

std::unique_ptr<IDiskSpaceProbe> makeFilesystemSpaceProbe();

/// Nearest existing ancestor of p (p itself if it exists); "." for an empty relative path.
std::filesystem::path nearestExistingAncestor(const std::filesystem::path& p);

} // namespace datafetch::storage
