/*
 * datafetch/src/extraction/archive_extractor.cpp
 *
 * Archive extraction via libarchive.
 *
 * - tar / tar.gz / zip: a vetting pass over all headers, then an extraction pass
 * - gz: raw format + gzip filter, written to <name without .gz> inside destDir
 * - archive_write_disk also refuses ".." components and writes through symlinks
 */

#include <datafetch/extraction/archive_extractor.hpp>

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

namespace datafetch::extraction {

namespace fs = std::filesystem;

namespace {

struct ReadArchiveDeleter {
    void operator()(struct archive* a) const noexcept { archive_read_free(a); }
};
struct WriteArchiveDeleter {
    void operator()(struct archive* a) const noexcept { archive_write_free(a); }
};
using ReadArchive = std::unique_ptr<struct archive, ReadArchiveDeleter>;
using WriteArchive = std::unique_ptr<struct archive, WriteArchiveDeleter>;

constexpr std::size_t kReadBlockSize = 10240;

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string archiveError(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

Error extractionError(std::string msg) {
    return Error{ErrorCode::ExtractionFailed, std::move(msg)};
}

Expected<ReadArchive> openReader(const fs::path& archivePath, ArchiveFormat format) {
    ReadArchive a(archive_read_new());
    if (!a)
        return extractionError("archive_read_new failed");

    switch (format) {
        case ArchiveFormat::Tar:
            archive_read_support_format_tar(a.get());
            break;
        case ArchiveFormat::TarGz:
            archive_read_support_format_tar(a.get());
            archive_read_support_filter_gzip(a.get());
            break;
        case ArchiveFormat::Zip:
            archive_read_support_format_zip(a.get());
            break;
        case ArchiveFormat::Gz:
            archive_read_support_format_raw(a.get());
            archive_read_support_filter_gzip(a.get());
            break;
    }

    if (archive_read_open_filename(a.get(), archivePath.string().c_str(), kReadBlockSize) !=
        ARCHIVE_OK) {
        return extractionError("Failed to open archive " + archivePath.string() + ": " +
                               archiveError(a.get()));
    }
    return a;
}

bool isDeviceEntry(struct archive_entry* entry) {
    const auto type = archive_entry_filetype(entry);
    return type == AE_IFCHR || type == AE_IFBLK || type == AE_IFIFO || type == AE_IFSOCK;
}

// True when destDir/name stays inside destDir after normalization.
bool staysInside(const fs::path& root, std::string_view name) {
    const auto target = (root / fs::path(name)).lexically_normal();
    const auto rel = target.lexically_relative(root);
    if (rel.empty())
        return false;
    const auto first = *rel.begin();
    return first != ".." && rel != fs::path("..");
}

enum class EntryVerdict { Extract, Skip };

Expected<EntryVerdict> vetEntry(struct archive_entry* entry, const fs::path& root,
                                spdlog::logger& logger) {
    const char* raw = archive_entry_pathname(entry);
    const std::string name = raw ? raw : "";
    if (name.empty()) {
        logger.warn("Skipping entry without a name");
        return EntryVerdict::Skip;
    }
    if (name.front() == '/') {
        logger.warn("Skipping absolute path: {}", name);
        return EntryVerdict::Skip;
    }
    if (isDeviceEntry(entry)) {
        logger.warn("Skipping device file: {}", name);
        return EntryVerdict::Skip;
    }
    if (!staysInside(root, name)) {
        return extractionError("Path traversal attempt detected: " + name);
    }
    if (const char* link = archive_entry_hardlink(entry)) {
        if (link[0] == '/' || !staysInside(root, link)) {
            return extractionError("Path traversal attempt detected in link: " + name);
        }
    }
    return EntryVerdict::Extract;
}

class LibArchiveExtractor final : public IArchiveExtractor {
public:
    explicit LibArchiveExtractor(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

    Expected<fs::path> extract(const fs::path& archivePath, const fs::path& destDir,
                               const std::optional<std::string>& formatHint) override {
        auto format = formatHint ? parseArchiveFormat(*formatHint) : detectArchiveFormat(archivePath);
        if (!format.ok())
            return format.error();

        std::error_code ec;
        if (!fs::is_regular_file(archivePath, ec)) {
            return extractionError("Archive not found: " + archivePath.string());
        }
        fs::create_directories(destDir, ec);
        if (ec) {
            return extractionError("Failed to create destination directory " + destDir.string() +
                                   ": " + ec.message());
        }
        const auto root = fs::absolute(destDir, ec).lexically_normal();
        if (ec) {
            return extractionError("Cannot resolve " + destDir.string() + ": " + ec.message());
        }

        logger_->info("Extracting {} into {}", archivePath.string(), root.string());
        auto r = format.value() == ArchiveFormat::Gz ? extractGzip(archivePath, root)
                                                     : extractArchive(archivePath, root,
                                                                      format.value());
        if (!r.ok()) {
            logger_->error("Extraction failed: {}", r.error().message);
            return r.error();
        }
        logger_->info("Extraction complete: {}", root.string());
        return destDir;
    }

private:
    Expected<void> vetAll(const fs::path& archivePath, const fs::path& root, ArchiveFormat format,
                          std::size_t& accepted) {
        auto reader = openReader(archivePath, format);
        if (!reader.ok())
            return reader.error();
        auto* a = reader.value().get();

        struct archive_entry* entry = nullptr;
        int rc = ARCHIVE_OK;
        while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
            auto verdict = vetEntry(entry, root, *logger_);
            if (!verdict.ok())
                return verdict.error();
            if (verdict.value() == EntryVerdict::Extract)
                ++accepted;
            archive_read_data_skip(a);
        }
        if (rc != ARCHIVE_EOF) {
            return extractionError("Corrupt archive " + archivePath.string() + ": " +
                                   archiveError(a));
        }
        return {};
    }

    Expected<void> extractArchive(const fs::path& archivePath, const fs::path& root,
                                  ArchiveFormat format) {
        std::size_t accepted = 0;
        if (auto vetted = vetAll(archivePath, root, format, accepted); !vetted.ok())
            return vetted;
        if (accepted == 0) {
            logger_->info("No files to extract (archive is empty or all entries filtered)");
            return {};
        }
        logger_->info("Extracting {} entries...", accepted);

        auto reader = openReader(archivePath, format);
        if (!reader.ok())
            return reader.error();
        auto* a = reader.value().get();

        WriteArchive ext(archive_write_disk_new());
        if (!ext)
            return extractionError("archive_write_disk_new failed");
        // Entries are rewritten to absolute paths under root below, so only the
        // dot-dot and symlink guards apply here.
        archive_write_disk_set_options(ext.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                      ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                      ARCHIVE_EXTRACT_SECURE_SYMLINKS);
        archive_write_disk_set_standard_lookup(ext.get());

        struct archive_entry* entry = nullptr;
        int rc = ARCHIVE_OK;
        while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
            auto verdict = vetEntry(entry, root, *logger_);
            if (!verdict.ok())
                return verdict.error();
            if (verdict.value() == EntryVerdict::Skip) {
                archive_read_data_skip(a);
                continue;
            }

            const std::string name = archive_entry_pathname(entry);
            const auto target = (root / name).lexically_normal();
            archive_entry_set_pathname(entry, target.string().c_str());
            if (const char* link = archive_entry_hardlink(entry)) {
                const auto linkTarget = (root / link).lexically_normal();
                archive_entry_set_hardlink(entry, linkTarget.string().c_str());
            }

            if (archive_write_header(ext.get(), entry) != ARCHIVE_OK) {
                return extractionError("Failed to extract " + name + ": " +
                                       archiveError(ext.get()));
            }
            if (archive_entry_size(entry) > 0) {
                const void* buff = nullptr;
                size_t size = 0;
                la_int64_t offset = 0;
                int dr = ARCHIVE_OK;
                while ((dr = archive_read_data_block(a, &buff, &size, &offset)) == ARCHIVE_OK) {
                    if (archive_write_data_block(ext.get(), buff, size, offset) != ARCHIVE_OK) {
                        return extractionError("Failed to write " + name + ": " +
                                               archiveError(ext.get()));
                    }
                }
                if (dr != ARCHIVE_EOF) {
                    return extractionError("Failed to read " + name + ": " + archiveError(a));
                }
            }
            if (archive_write_finish_entry(ext.get()) != ARCHIVE_OK) {
                return extractionError("Failed to finish " + name + ": " +
                                       archiveError(ext.get()));
            }
        }
        if (rc != ARCHIVE_EOF) {
            return extractionError("Corrupt archive " + archivePath.string() + ": " +
                                   archiveError(a));
        }
        if (archive_write_close(ext.get()) != ARCHIVE_OK) {
            return extractionError("Failed to finalize extraction: " + archiveError(ext.get()));
        }
        return {};
    }

    Expected<void> extractGzip(const fs::path& archivePath, const fs::path& root) {
        auto name = archivePath.filename().string();
        if (endsWith(lower(name), ".gz"))
            name.resize(name.size() - 3);
        else
            name += ".extracted";
        const auto outPath = root / name;
        logger_->info("Decompressing to: {}", outPath.string());

        auto reader = openReader(archivePath, ArchiveFormat::Gz);
        if (!reader.ok())
            return reader.error();
        auto* a = reader.value().get();

        struct archive_entry* entry = nullptr;
        if (archive_read_next_header(a, &entry) != ARCHIVE_OK) {
            return extractionError("Not a gzip stream: " + archivePath.string() + ": " +
                                   archiveError(a));
        }

        std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            return extractionError("Cannot open " + outPath.string() + " for write");
        }
        char buffer[8192];
        la_ssize_t n = 0;
        while ((n = archive_read_data(a, buffer, sizeof(buffer))) > 0) {
            out.write(buffer, static_cast<std::streamsize>(n));
            if (!out) {
                return extractionError("Write failed for " + outPath.string());
            }
        }
        if (n < 0) {
            return extractionError("Failed to decompress " + archivePath.string() + ": " +
                                   archiveError(a));
        }
        return {};
    }

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

Expected<ArchiveFormat> parseArchiveFormat(std::string_view hint) {
    const auto h = lower(hint);
    if (h == "tar")
        return ArchiveFormat::Tar;
    if (h == "tar.gz" || h == "tgz")
        return ArchiveFormat::TarGz;
    if (h == "zip")
        return ArchiveFormat::Zip;
    if (h == "gz")
        return ArchiveFormat::Gz;
    return extractionError("Unsupported archive format: " + std::string(hint));
}

Expected<ArchiveFormat> detectArchiveFormat(const fs::path& archivePath) {
    const auto name = lower(archivePath.filename().string());
    if (endsWith(name, ".tar.gz") || endsWith(name, ".tgz"))
        return ArchiveFormat::TarGz;
    if (endsWith(name, ".tar"))
        return ArchiveFormat::Tar;
    if (endsWith(name, ".zip"))
        return ArchiveFormat::Zip;
    if (endsWith(name, ".gz"))
        return ArchiveFormat::Gz;
    return extractionError("Cannot determine archive format from filename: " +
                           archivePath.string());
}

std::unique_ptr<IArchiveExtractor> makeArchiveExtractor(std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<LibArchiveExtractor>(std::move(logger));
}

} // namespace datafetch::extraction
