#include <catch2/catch_test_macros.hpp>

#include <datafetch/downloader/progress_store.hpp>

#include "support/temp_dir_scope.hpp"

#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
using namespace datafetch::downloader;
using datafetch::test_support::TempDirScope;
using datafetch::test_support::write_file;

namespace {

TransferState sampleState(const fs::path& dest) {
    TransferState st;
    st.sourceUrl = "https://example.org/data.bin";
    st.destinationPath = dest.string();
    st.totalSizeBytes = 1000;
    st.downloadedBytes = 400;
    st.digestExpected = "65a8e27d8879283831b664bd8b7f0ad4";
    st.digestAlgorithm = HashAlgo::Md5;
    return st;
}

} // namespace

TEST_CASE("JsonProgressStore round-trips a record", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress");
    JsonProgressStore store(dir / ".progress");
    const auto dest = dir / "data" / "set" / "data.bin";

    REQUIRE(store.save(dest, sampleState(dest)).ok());
    CHECK(fs::exists(store.pathFor(dest)));

    auto loaded = store.load(dest);
    REQUIRE(loaded.state.has_value());
    CHECK_FALSE(loaded.warning.has_value());
    CHECK(loaded.state->sourceUrl == "https://example.org/data.bin");
    CHECK(loaded.state->downloadedBytes == 400);
    CHECK(loaded.state->totalSizeBytes == std::optional<std::uint64_t>(1000));
    CHECK(loaded.state->status == TransferStatus::InProgress);
    CHECK_FALSE(loaded.state->lastUpdated.empty());

    SECTION("no temp artifacts remain after save") {
        std::size_t files = 0;
        for (const auto& e : fs::recursive_directory_iterator(dir / ".progress")) {
            if (e.is_regular_file())
                ++files;
        }
        CHECK(files == 1);
    }
}

TEST_CASE("Missing record loads as absent without warning", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress-missing");
    JsonProgressStore store(dir.path());
    auto loaded = store.load(dir / "nothing.bin");
    CHECK_FALSE(loaded.state.has_value());
    CHECK_FALSE(loaded.warning.has_value());
}

TEST_CASE("Corrupt record loads as absent with a warning", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress-corrupt");
    JsonProgressStore store(dir / "root");
    const auto dest = dir / "file.bin";
    write_file(store.pathFor(dest), "{ not json");

    auto loaded = store.load(dest);
    CHECK_FALSE(loaded.state.has_value());
    REQUIRE(loaded.warning.has_value());

    SECTION("well-formed JSON missing required fields is also rejected") {
        write_file(store.pathFor(dest), R"({"url": "https://x", "downloaded_bytes": "many"})");
        auto again = store.load(dest);
        CHECK_FALSE(again.state.has_value());
        CHECK(again.warning.has_value());
    }
}

TEST_CASE("pathFor keeps records under the store root", "[downloader][progress]") {
    JsonProgressStore store("/tmp/records");
    const auto p = store.pathFor("../../etc/passwd");
    CHECK(p == fs::path("/tmp/records/etc/passwd.progress"));
    CHECK(store.pathFor("/abs/dir/file.bin") == fs::path("/tmp/records/abs/dir/file.bin.progress"));
}

TEST_CASE("remove deletes the record and is idempotent", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress-remove");
    JsonProgressStore store(dir / "root");
    const auto dest = dir / "a.bin";
    REQUIRE(store.save(dest, sampleState(dest)).ok());

    store.remove(dest);
    CHECK_FALSE(fs::exists(store.pathFor(dest)));
    store.remove(dest);
    CHECK_FALSE(store.load(dest).state.has_value());
}

TEST_CASE("validatePartial checks the on-disk length", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress-partial");
    JsonProgressStore store(dir / "root");
    const auto dest = dir / "partial.bin";

    CHECK_FALSE(store.validatePartial(dest, 0));
    write_file(dest, std::string(400, 'x'));
    CHECK(store.validatePartial(dest, 400));
    CHECK_FALSE(store.validatePartial(dest, 500));
}

TEST_CASE("listActive and cleanupStale maintain the root", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress-maint");
    JsonProgressStore store(dir / "root");
    const auto fresh = dir / "fresh.bin";
    const auto old = dir / "sub" / "old.bin";
    REQUIRE(store.save(fresh, sampleState(fresh)).ok());
    REQUIRE(store.save(old, sampleState(old)).ok());
    write_file(dir / "root" / "junk.progress", "garbage");

    auto active = store.listActive();
    CHECK(active.size() == 2);
    CHECK(active.count(fresh.string()) == 1);
    CHECK(active.count(old.string()) == 1);

    fs::last_write_time(store.pathFor(old),
                        fs::file_time_type::clock::now() - std::chrono::hours(72));
    CHECK(store.cleanupStale(std::chrono::hours(48)) == 1);
    CHECK_FALSE(fs::exists(store.pathFor(old)));
    CHECK(fs::exists(store.pathFor(fresh)));
}

TEST_CASE("Leftover temp files never shadow the published record", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress-tmp");
    JsonProgressStore store(dir / "root");
    const auto dest = dir / "data.bin";
    REQUIRE(store.save(dest, sampleState(dest)).ok());

    // A save interrupted before its rename leaves only a temp artifact behind.
    auto tmp = store.pathFor(dest);
    tmp += ".tmp.99";
    write_file(tmp, R"({"url": "https://example.org/data.bin", "destina)");
    auto other = store.pathFor(dest);
    other += ".tmp.100";
    write_file(other, "");

    auto loaded = store.load(dest);
    REQUIRE(loaded.state.has_value());
    CHECK_FALSE(loaded.warning.has_value());
    CHECK(loaded.state->downloadedBytes == 400);
    CHECK(store.listActive().size() == 1);

    auto next = sampleState(dest);
    next.downloadedBytes = 700;
    REQUIRE(store.save(dest, next).ok());
    CHECK(store.load(dest).state->downloadedBytes == 700);
}

TEST_CASE("A record stored for another destination is not reused", "[downloader][progress]") {
    auto dir = TempDirScope::unique_under("datafetch-progress-owner");
    JsonProgressStore store(dir / "root");
    const fs::path absolute("/x/f.bin");
    const fs::path relative("x/f.bin");
    const fs::path escaping("../x/f.bin");
    REQUIRE(store.pathFor(absolute) == store.pathFor(relative));
    REQUIRE(store.pathFor(escaping) == store.pathFor(relative));

    REQUIRE(store.save(absolute, sampleState(absolute)).ok());
    CHECK(store.load(absolute).state.has_value());

    for (const auto& p : {relative, escaping}) {
        auto loaded = store.load(p);
        CHECK_FALSE(loaded.state.has_value());
        REQUIRE(loaded.warning.has_value());
        CHECK(loaded.warning->find("/x/f.bin") != std::string::npos);
    }
    CHECK(store.root() == dir / "root");
}
