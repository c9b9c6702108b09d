/*
 * datafetch/src/dataset/dataset_loader.cpp
 *
 * Dataset list loading and validation (nlohmann::json).
 * Every rule violation is an InvalidDescriptor error naming the dataset; an unknown
 * checksum_type is UnsupportedAlgorithm.
 */

#include <datafetch/dataset/dataset_spec.hpp>
#include <datafetch/downloader/checksum.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <set>
#include <system_error>

namespace datafetch::dataset {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

Error invalid(std::string msg) {
    return Error{ErrorCode::InvalidDescriptor, std::move(msg)};
}

fs::path expandTilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        if (const char* home = std::getenv("HOME")) {
            if (path.size() == 1)
                return fs::path(home);
            if (path[1] == '/')
                return fs::path(home) / path.substr(2);
        }
    }
    return path;
}

bool isHex(std::string_view s) {
    for (unsigned char c : s) {
        if (!std::isxdigit(c))
            return false;
    }
    return true;
}

Expected<void> checkDigestFormat(const std::string& name, const std::string& checksum,
                                 HashAlgo algo, std::string_view where) {
    if (downloader::isSkipDigest(checksum))
        return {};
    const std::size_t want = algo == HashAlgo::Sha256 ? 64 : 32;
    if (checksum.size() != want || !isHex(checksum)) {
        return invalid("Dataset '" + name + "' has invalid " +
                       (algo == HashAlgo::Sha256 ? std::string("SHA256") : std::string("MD5")) +
                       " checksum format" + std::string(where));
    }
    return {};
}

bool isPositiveInteger(const json& j) {
    return j.is_number_unsigned() ? j.get<std::uint64_t>() > 0
                                  : (j.is_number_integer() && j.get<std::int64_t>() > 0);
}

} // namespace

Expected<Strategy> parseStrategy(std::string_view name) {
    if (name == "single_threaded")
        return Strategy::SingleThreaded;
    if (name == "multi_file")
        return Strategy::MultiFile;
    if (name == "chunked")
        return Strategy::Chunked;
    return invalid("download_strategy must be one of [single_threaded, multi_file, chunked], got '" +
                   std::string(name) + "'");
}

std::string_view strategyName(Strategy s) noexcept {
    switch (s) {
        case Strategy::SingleThreaded:
            return "single_threaded";
        case Strategy::MultiFile:
            return "multi_file";
        case Strategy::Chunked:
            return "chunked";
    }
    return "single_threaded";
}

std::string urlBasename(std::string_view url) {
    const auto cut = url.find_first_of("?#");
    if (cut != std::string_view::npos)
        url = url.substr(0, cut);
    while (!url.empty() && url.back() == '/')
        url.remove_suffix(1);
    const auto slash = url.rfind('/');
    return std::string(slash == std::string_view::npos ? url : url.substr(slash + 1));
}

Expected<DatasetSpec> parseDatasetSpec(const json& entry) {
    if (!entry.is_object())
        return invalid("Dataset entry must be an object");

    // name
    if (!entry.contains("name"))
        return invalid("Dataset missing required field: 'name'");
    if (!entry["name"].is_string())
        return invalid("Dataset 'name' must be a non-empty string");
    DatasetSpec spec;
    spec.name = entry["name"].get<std::string>();
    bool blank = true;
    for (unsigned char c : spec.name)
        blank = blank && std::isspace(c);
    if (blank)
        return invalid("Dataset 'name' must be a non-empty string");
    const auto& name = spec.name;

    // url xor urls
    const bool hasUrl = entry.contains("url");
    const bool hasUrls = entry.contains("urls");
    if (hasUrl && hasUrls)
        return invalid("Dataset '" + name + "' cannot have both 'url' and 'urls'");
    if (!hasUrl && !hasUrls)
        return invalid("Dataset '" + name + "' must have either 'url' or 'urls'");

    // checksum_type
    std::string checksumType = "md5";
    if (entry.contains("checksum_type")) {
        if (!entry["checksum_type"].is_string())
            return invalid("Dataset '" + name + "' checksum_type must be 'md5' or 'sha256'");
        checksumType = entry["checksum_type"].get<std::string>();
    }
    auto algo = downloader::parseHashAlgo(checksumType);
    if (!algo.ok()) {
        return Error{ErrorCode::UnsupportedAlgorithm,
                     "Dataset '" + name + "' checksum_type must be 'md5' or 'sha256'"};
    }
    spec.checksumAlgo = algo.value();

    if (hasUrl) {
        if (!entry["url"].is_string() || entry["url"].get<std::string>().empty())
            return invalid("Dataset '" + name + "' url must be a non-empty string");
        if (!entry.contains("file_size"))
            return invalid("Dataset '" + name + "' missing 'file_size'");
        if (!isPositiveInteger(entry["file_size"]))
            return invalid("Dataset '" + name + "' file_size must be positive integer");
        if (!entry.contains("checksum"))
            return invalid("Dataset '" + name + "' missing 'checksum'");
        if (!entry["checksum"].is_string())
            return invalid("Dataset '" + name + "' checksum must be a string");

        SingleFile single;
        single.url = entry["url"].get<std::string>();
        single.fileSize = entry["file_size"].get<std::uint64_t>();
        single.checksum = entry["checksum"].get<std::string>();
        if (auto r = checkDigestFormat(name, single.checksum, spec.checksumAlgo, ""); !r.ok())
            return r.error();
        spec.source = std::move(single);
    } else {
        const auto& urls = entry["urls"];
        if (!urls.is_array() || urls.empty())
            return invalid("Dataset '" + name + "' urls must be a non-empty list");
        if (!entry.contains("file_sizes"))
            return invalid("Dataset '" + name + "' missing 'file_sizes'");
        const auto& sizes = entry["file_sizes"];
        if (!sizes.is_array())
            return invalid("Dataset '" + name + "' file_sizes must be a list");

        const json* checksums = nullptr;
        if (entry.contains("checksums")) {
            if (!entry["checksums"].is_array())
                return invalid("Dataset '" + name + "' checksums must be a list");
            checksums = &entry["checksums"];
        }

        if (urls.size() != sizes.size()) {
            return invalid("Dataset '" + name + "': urls (" + std::to_string(urls.size()) +
                           ") and file_sizes (" + std::to_string(sizes.size()) +
                           ") length mismatch");
        }
        if (checksums && checksums->size() != urls.size()) {
            return invalid("Dataset '" + name + "': urls (" + std::to_string(urls.size()) +
                           ") and checksums (" + std::to_string(checksums->size()) +
                           ") length mismatch");
        }

        MultiFile multi;
        std::set<std::string> basenames;
        for (std::size_t i = 0; i < urls.size(); ++i) {
            const auto at = " at index " + std::to_string(i);
            if (!urls[i].is_string() || urls[i].get<std::string>().empty())
                return invalid("Dataset '" + name + "' has an invalid url" + at);
            if (!sizes[i].is_number_unsigned())
                return invalid("Dataset '" + name + "' has an invalid file size" + at);
            RemoteFile file;
            file.url = urls[i].get<std::string>();
            // Files land in one directory under their basename.
            if (!basenames.insert(urlBasename(file.url)).second)
                return invalid("Dataset '" + name + "' has duplicate file name '" +
                               urlBasename(file.url) + "'" + at);
            file.fileSize = sizes[i].get<std::uint64_t>();
            if (checksums) {
                const auto& c = (*checksums)[i];
                if (!c.is_string())
                    return invalid("Dataset '" + name + "' has an invalid checksum" + at);
                file.checksum = c.get<std::string>();
                if (auto r = checkDigestFormat(name, *file.checksum, spec.checksumAlgo, at);
                    !r.ok())
                    return r.error();
            }
            multi.files.push_back(std::move(file));
        }
        spec.source = std::move(multi);
    }

    if (entry.contains("download_strategy")) {
        if (!entry["download_strategy"].is_string())
            return invalid("Dataset '" + name + "' download_strategy must be a string");
        auto strategy = parseStrategy(entry["download_strategy"].get<std::string>());
        if (!strategy.ok())
            return invalid("Dataset '" + name + "' " + strategy.error().message);
        spec.strategy = strategy.value();
    }

    if (!entry.contains("destination_folder"))
        return invalid("Dataset '" + name + "' missing 'destination_folder'");
    if (!entry["destination_folder"].is_string())
        return invalid("Dataset '" + name + "' destination_folder must be string");
    spec.destinationFolder = expandTilde(entry["destination_folder"].get<std::string>());

    if (entry.contains("extract_after_download")) {
        if (!entry["extract_after_download"].is_boolean())
            return invalid("Dataset '" + name + "' extract_after_download must be a boolean");
        spec.extractAfterDownload = entry["extract_after_download"].get<bool>();
    }
    if (entry.contains("extract_format") && !entry["extract_format"].is_null()) {
        if (!entry["extract_format"].is_string())
            return invalid("Dataset '" + name + "' extract_format must be a string");
        spec.extractFormat = entry["extract_format"].get<std::string>();
    }
    return spec;
}

Expected<std::vector<DatasetSpec>> parseDatasetList(const json& document) {
    if (!document.is_object() || !document.contains("datasets"))
        return invalid("Config must contain 'datasets' key");
    const auto& list = document["datasets"];
    if (!list.is_array())
        return invalid("'datasets' must be a list");

    std::vector<DatasetSpec> out;
    out.reserve(list.size());
    for (const auto& entry : list) {
        auto spec = parseDatasetSpec(entry);
        if (!spec.ok())
            return spec.error();
        out.push_back(std::move(spec).value());
    }
    return out;
}

Expected<std::vector<DatasetSpec>> loadDatasetList(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return invalid("Config file not found: " + path.string());

    std::ifstream in(path);
    if (!in)
        return invalid("Cannot read config file: " + path.string());

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        return invalid("Invalid JSON in " + path.string() + ": " + e.what());
    }
    return parseDatasetList(document);
}

} // namespace datafetch::dataset
