#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <datafetch/dataset/dataset_spec.hpp>

#include "support/temp_dir_scope.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <string>

using json = nlohmann::json;
using namespace datafetch::dataset;
using datafetch::test_support::TempDirScope;
using datafetch::test_support::write_file;

namespace {

json singleEntry() {
    return json{{"name", "mnist"},
                {"url", "https://example.org/mnist.tar.gz"},
                {"file_size", 1024},
                {"checksum", "65a8e27d8879283831b664bd8b7f0ad4"},
                {"destination_folder", "/data"}};
}

json multiEntry() {
    return json{{"name", "shards"},
                {"urls", {"https://example.org/a.bin", "https://example.org/b.bin?sig=1"}},
                {"file_sizes", {10, 20}},
                {"checksums", {"skip", "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f"}},
                {"checksum_type", "sha256"},
                {"download_strategy", "multi_file"},
                {"destination_folder", "/data"}};
}

ErrorCode codeOf(const json& entry) {
    auto r = parseDatasetSpec(entry);
    REQUIRE_FALSE(r.ok());
    return r.error().code;
}

} // namespace

TEST_CASE("Single-file entry parses with defaults", "[dataset][loader]") {
    auto r = parseDatasetSpec(singleEntry());
    REQUIRE(r.ok());
    const auto& spec = r.value();
    CHECK(spec.name == "mnist");
    CHECK(spec.checksumAlgo == HashAlgo::Md5);
    CHECK(spec.strategy == Strategy::SingleThreaded);
    CHECK_FALSE(spec.extractAfterDownload);
    CHECK(spec.datasetDir() == std::filesystem::path("/data/mnist"));
    const auto* single = std::get_if<SingleFile>(&spec.source);
    REQUIRE(single != nullptr);
    CHECK(single->fileSize == 1024);
}

TEST_CASE("Multi-file entry parses per-file fields", "[dataset][loader]") {
    auto r = parseDatasetSpec(multiEntry());
    REQUIRE(r.ok());
    CHECK(r.value().strategy == Strategy::MultiFile);
    CHECK(r.value().checksumAlgo == HashAlgo::Sha256);
    const auto& files = std::get<MultiFile>(r.value().source).files;
    REQUIRE(files.size() == 2);
    CHECK(files[0].checksum == std::optional<std::string>("skip"));
    CHECK(files[1].fileSize == 20);
}

TEST_CASE("Multi-file checksums are optional", "[dataset][loader]") {
    auto e = multiEntry();
    e.erase("checksums");
    auto r = parseDatasetSpec(e);
    REQUIRE(r.ok());
    CHECK_FALSE(std::get<MultiFile>(r.value().source).files[0].checksum.has_value());
}

TEST_CASE("Descriptor rule violations are rejected", "[dataset][loader]") {
    SECTION("empty name") {
        auto e = singleEntry();
        e["name"] = "  ";
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("both url and urls") {
        auto e = singleEntry();
        e["urls"] = json::array({"https://example.org/x"});
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("neither url nor urls") {
        auto e = singleEntry();
        e.erase("url");
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("non-positive file size") {
        auto e = singleEntry();
        e["file_size"] = 0;
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
        e["file_size"] = "big";
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("missing checksum") {
        auto e = singleEntry();
        e.erase("checksum");
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("malformed md5") {
        auto e = singleEntry();
        e["checksum"] = "abc123";
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("md5-length digest under sha256") {
        auto e = singleEntry();
        e["checksum_type"] = "sha256";
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("unknown checksum type") {
        auto e = singleEntry();
        e["checksum_type"] = "crc32";
        CHECK(codeOf(e) == ErrorCode::UnsupportedAlgorithm);
    }
    SECTION("unknown strategy") {
        auto e = singleEntry();
        e["download_strategy"] = "torrent";
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("missing destination") {
        auto e = singleEntry();
        e.erase("destination_folder");
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
    SECTION("length mismatch") {
        auto e = multiEntry();
        e["file_sizes"] = json::array({10});
        auto r = parseDatasetSpec(e);
        REQUIRE_FALSE(r.ok());
        CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("length mismatch"));
    }
    SECTION("two urls with the same file name") {
        auto e = multiEntry();
        e["urls"] = json::array({"https://example.org/v1/data.csv", "https://mirror.example.org/v2/data.csv?x=1"});
        e.erase("checksums");
        auto r = parseDatasetSpec(e);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidDescriptor);
        CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("data.csv"));
    }
    SECTION("file_sizes not a list") {
        auto e = multiEntry();
        e["file_sizes"] = 30;
        CHECK(codeOf(e) == ErrorCode::InvalidDescriptor);
    }
}

TEST_CASE("skip checksum bypasses format validation", "[dataset][loader]") {
    auto e = singleEntry();
    e["checksum"] = "SKIP";
    CHECK(parseDatasetSpec(e).ok());
}

TEST_CASE("Destination folder expands a leading tilde", "[dataset][loader]") {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        WARN("HOME is not set; tilde expansion not exercised");
        return;
    }
    auto e = singleEntry();
    e["destination_folder"] = "~/datasets";
    auto r = parseDatasetSpec(e);
    REQUIRE(r.ok());
    CHECK(r.value().destinationFolder == std::filesystem::path(home) / "datasets");
}

TEST_CASE("urlBasename strips query and fragment", "[dataset][loader]") {
    CHECK(urlBasename("https://example.org/a/b/file.tar.gz") == "file.tar.gz");
    CHECK(urlBasename("https://example.org/b.bin?sig=1#frag") == "b.bin");
    CHECK(urlBasename("https://example.org/dir/") == "dir");
}

TEST_CASE("Strategy names round-trip", "[dataset][loader]") {
    for (auto s : {Strategy::SingleThreaded, Strategy::MultiFile, Strategy::Chunked})
        CHECK(parseStrategy(strategyName(s)).value() == s);
}

TEST_CASE("loadDatasetList reads a descriptor document", "[dataset][loader]") {
    auto dir = TempDirScope::unique_under("datafetch-loader");

    SECTION("valid document") {
        json doc{{"datasets", {singleEntry(), multiEntry()}}};
        write_file(dir / "datasets.json", doc.dump());
        auto r = loadDatasetList(dir / "datasets.json");
        REQUIRE(r.ok());
        CHECK(r.value().size() == 2);
    }
    SECTION("missing file") {
        auto r = loadDatasetList(dir / "absent.json");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidDescriptor);
    }
    SECTION("unparsable file") {
        write_file(dir / "broken.json", "{ datasets: ");
        auto r = loadDatasetList(dir / "broken.json");
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::InvalidDescriptor);
    }
    SECTION("datasets key missing or not a list") {
        write_file(dir / "nokey.json", R"({"items": []})");
        CHECK(loadDatasetList(dir / "nokey.json").error().code == ErrorCode::InvalidDescriptor);
        write_file(dir / "notlist.json", R"({"datasets": {}})");
        CHECK(loadDatasetList(dir / "notlist.json").error().code == ErrorCode::InvalidDescriptor);
    }
    SECTION("one invalid dataset fails the load") {
        auto bad = singleEntry();
        bad.erase("checksum");
        json doc{{"datasets", {singleEntry(), bad}}};
        write_file(dir / "bad.json", doc.dump());
        CHECK_FALSE(loadDatasetList(dir / "bad.json").ok());
    }
}
