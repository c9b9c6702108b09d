#pragma once

/*
 * datafetch Archive Extractor
 *
 * libarchive-backed extraction of tar, tar.gz/tgz, zip and single-member gz files.
 * Entries are vetted before anything is written: absolute names and device/fifo
 * entries are skipped, and any entry resolving outside destDir aborts the extraction.
 */

#include <datafetch/downloader/downloader.hpp>

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace datafetch::extraction {

using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;

enum class ArchiveFormat { Tar, TarGz, Zip, Gz };

/// "tar", "tar.gz", "tgz", "zip", "gz"; anything else is ExtractionFailed.
Expected<ArchiveFormat> parseArchiveFormat(std::string_view hint);

/// Derive the format from the file name suffix.
Expected<ArchiveFormat> detectArchiveFormat(const std::filesystem::path& archivePath);

class IArchiveExtractor {
public:
    virtual ~IArchiveExtractor() = default;

    /**
     * Extract archivePath into destDir (created if missing) and return destDir.
     * The archive itself is left in place.
     */
    virtual Expected<std::filesystem::path>
    extract(const std::filesystem::path& archivePath, const std::filesystem::path& destDir,
            const std::optional<std::string>& formatHint) = 0;
};

std::unique_ptr<IArchiveExtractor>
makeArchiveExtractor(std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace datafetch::extraction
