#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <datafetch/downloader/progress_store.hpp>
#include <datafetch/downloader/resumable_downloader.hpp>

#include "support/fake_http_adapter.hpp"
#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace fs = std::filesystem;
using namespace datafetch::downloader;
using namespace datafetch::test_support;
using namespace std::chrono_literals;

namespace {

constexpr const char* kUrl = "https://data.example.org/files/archive.bin";

struct Fixture {
    TempDirScope dir = TempDirScope::unique_under("datafetch-resumable");
    std::shared_ptr<FakeHttpAdapter> http = std::make_shared<FakeHttpAdapter>();
    std::shared_ptr<JsonProgressStore> store =
        std::make_shared<JsonProgressStore>(dir / ".progress");
    RecordingSleeper sleeper;
    std::string payload = make_payload(1000);
    fs::path dest = dir / "out" / "archive.bin";

    ResumableDownloader downloader() { return ResumableDownloader(http, store, nullptr, sleeper.fn()); }

    DownloadOptions options() const {
        DownloadOptions o;
        o.expectedSize = payload.size();
        o.checkpointBytes = 256;
        return o;
    }

    void seedPartial(std::size_t bytes, const std::string& url = kUrl) {
        write_file(dest, payload.substr(0, bytes));
        TransferState st;
        st.sourceUrl = url;
        st.destinationPath = dest.string();
        st.totalSizeBytes = payload.size();
        st.downloadedBytes = bytes;
        REQUIRE(store->save(dest, st).ok());
    }
};

} // namespace

TEST_CASE("Fresh download writes the full body and records completion",
          "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, f.payload);

    std::uint64_t reported = 0;
    auto opts = f.options();
    opts.onBytes = [&](std::uint64_t n) { reported += n; };

    auto r = f.downloader().download(kUrl, f.dest, opts);
    REQUIRE(r.ok());
    CHECK(r.value().status == TransferStatus::Complete);
    CHECK(r.value().downloadedBytes == 1000);
    CHECK(read_file(f.dest) == f.payload);
    CHECK(reported == 1000);

    auto requests = f.http->requests();
    REQUIRE(requests.size() == 1);
    CHECK_FALSE(requests[0].range.has_value());

    auto record = f.store->load(f.dest);
    REQUIRE(record.state.has_value());
    CHECK(record.state->status == TransferStatus::Complete);
}

TEST_CASE("Download resumes from the recorded offset", "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, f.payload);
    f.seedPartial(400);

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(read_file(f.dest) == f.payload);

    auto requests = f.http->requests();
    REQUIRE(requests.size() == 1);
    REQUIRE(requests[0].range.has_value());
    CHECK(requests[0].range->first == 400);
    CHECK_FALSE(requests[0].range->last.has_value());
}

TEST_CASE("Server ignoring the range restarts from byte zero", "[downloader][resumable]") {
    Fixture f;
    FakeHttpAdapter::Resource res;
    res.body = f.payload;
    res.honorRanges = false;
    f.http->serve(kUrl, res);
    f.seedPartial(400);

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(fs::file_size(f.dest) == 1000);
    CHECK(read_file(f.dest) == f.payload);
}

TEST_CASE("Record that disagrees with the disk is discarded", "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, f.payload);
    f.seedPartial(400);
    write_file(f.dest, f.payload.substr(0, 123)); // disk no longer matches the record

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(read_file(f.dest) == f.payload);
    auto requests = f.http->requests();
    REQUIRE(requests.size() == 1);
    CHECK_FALSE(requests[0].range.has_value());
}

TEST_CASE("Record for a different URL is discarded", "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, f.payload);
    f.seedPartial(400, "https://mirror.example.org/other.bin");

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(read_file(f.dest) == f.payload);
    CHECK_FALSE(f.http->requests()[0].range.has_value());
}

TEST_CASE("Range not satisfiable on a complete file is success", "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, f.payload);
    f.seedPartial(1000);

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(r.value().status == TransferStatus::Complete);
    CHECK(read_file(f.dest) == f.payload);
}

TEST_CASE("Repeating a finished download is idempotent", "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, f.payload);
    REQUIRE(f.downloader().download(kUrl, f.dest, f.options()).ok());
    auto second = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(second.ok());
    CHECK(read_file(f.dest) == f.payload);
    CHECK(f.sleeper.delays->empty());
}

TEST_CASE("404 and 403 are fatal without retries", "[downloader][resumable]") {
    Fixture f;

    SECTION("not found") {
        auto r = f.downloader().download(kUrl, f.dest, f.options());
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::NotFound);
        CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("404"));
    }
    SECTION("forbidden") {
        FakeHttpAdapter::Resource res;
        res.body = f.payload;
        res.forcedStatus = 403;
        f.http->serve(kUrl, res);
        auto r = f.downloader().download(kUrl, f.dest, f.options());
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::Forbidden);
    }
    CHECK(f.http->getCount() == 1);
    CHECK(f.sleeper.delays->empty());
}

TEST_CASE("Server errors are retried with exponential backoff", "[downloader][resumable]") {
    Fixture f;
    FakeHttpAdapter::Resource res;
    res.body = f.payload;
    res.forcedStatus = 503;
    f.http->serve(kUrl, res);

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::RetriesExhausted);
    CHECK_THAT(r.error().message, Catch::Matchers::ContainsSubstring("after 3 attempts"));
    CHECK(f.http->getCount() == 3);
    REQUIRE(f.sleeper.delays->size() == 2);
    CHECK((*f.sleeper.delays)[0] == 2000ms);
    CHECK((*f.sleeper.delays)[1] == 4000ms);
}

TEST_CASE("Transient connection failures recover within the budget",
          "[downloader][resumable]") {
    Fixture f;
    FakeHttpAdapter::Resource res;
    res.body = f.payload;
    res.transientFailures = 2;
    f.http->serve(kUrl, res);

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(read_file(f.dest) == f.payload);
    CHECK(f.http->getCount() == 3);
    CHECK(f.sleeper.delays->size() == 2);
}

TEST_CASE("A dropped connection resumes from the bytes on disk", "[downloader][resumable]") {
    Fixture f;
    FakeHttpAdapter::Resource res;
    res.body = f.payload;
    res.cutAfter = 300;
    res.cuts = 1;
    res.deliveryBlock = 100;
    f.http->serve(kUrl, res);

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(read_file(f.dest) == f.payload);

    auto requests = f.http->requests();
    REQUIRE(requests.size() == 2);
    CHECK_FALSE(requests[0].range.has_value());
    REQUIRE(requests[1].range.has_value());
    CHECK(requests[1].range->first == 300);
}

TEST_CASE("Declared size that contradicts the expected size is fatal",
          "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, make_payload(3000));
    auto opts = f.options();
    opts.expectedSize = 5000;

    auto r = f.downloader().download(kUrl, f.dest, opts);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::SizeMismatch);
    CHECK(f.http->getCount() == 1);
}

TEST_CASE("Invalid arguments are rejected up front", "[downloader][resumable]") {
    Fixture f;
    auto opts = f.options();
    CHECK(f.downloader().download("", f.dest, opts).error().code == ErrorCode::InvalidArgument);
    opts.retry.maxAttempts = 0;
    CHECK(f.downloader().download(kUrl, f.dest, opts).error().code ==
          ErrorCode::InvalidArgument);
    CHECK(f.http->getCount() == 0);
}

TEST_CASE("Progress is checkpointed while the body streams", "[downloader][resumable]") {
    Fixture f;
    FakeHttpAdapter::Resource res;
    res.body = f.payload;
    res.deliveryBlock = 100;
    f.http->serve(kUrl, res);

    // Checkpoint every 256 bytes: with 100-byte blocks the record lands at 300 and 600.
    std::vector<std::uint64_t> recorded;
    std::uint64_t seen = 0;
    auto opts = f.options();
    opts.onBytes = [&](std::uint64_t n) {
        seen += n;
        if (seen == 400 || seen == 700) {
            auto record = f.store->load(f.dest);
            REQUIRE(record.state.has_value());
            CHECK(record.state->status == TransferStatus::InProgress);
            CHECK(record.state->totalSizeBytes == std::optional<std::uint64_t>(1000));
            recorded.push_back(record.state->downloadedBytes);
        }
    };

    auto r = f.downloader().download(kUrl, f.dest, opts);
    REQUIRE(r.ok());
    REQUIRE(recorded.size() == 2);
    CHECK(recorded[0] == 300);
    CHECK(recorded[1] == 600);
    CHECK(f.store->load(f.dest).state->status == TransferStatus::Complete);
}

TEST_CASE("Record whose total contradicts the expected size is discarded",
          "[downloader][resumable]") {
    Fixture f;
    f.http->serve(kUrl, f.payload);
    f.seedPartial(400);
    auto seeded = f.store->load(f.dest).state.value();
    seeded.totalSizeBytes = 1200;
    REQUIRE(f.store->save(f.dest, seeded).ok());

    auto r = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE(r.ok());
    CHECK(read_file(f.dest) == f.payload);
    auto requests = f.http->requests();
    REQUIRE(requests.size() == 1);
    CHECK_FALSE(requests[0].range.has_value());
}

TEST_CASE("Range not satisfiable on an inconsistent partial discards it",
          "[downloader][resumable]") {
    Fixture f;
    // The server now holds fewer bytes than the partial already on disk.
    f.http->serve(kUrl, make_payload(500));
    f.seedPartial(600);

    auto first = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE_FALSE(first.ok());
    CHECK(first.error().code == ErrorCode::RangeNotSatisfiable);
    CHECK_FALSE(fs::exists(f.dest));
    CHECK_FALSE(f.store->load(f.dest).state.has_value());
    CHECK(f.sleeper.delays->empty());

    // The next run starts over instead of repeating the same range request.
    auto second = f.downloader().download(kUrl, f.dest, f.options());
    REQUIRE_FALSE(second.ok());
    CHECK(second.error().code == ErrorCode::SizeMismatch);
    auto requests = f.http->requests();
    REQUIRE(requests.size() == 2);
    REQUIRE(requests[0].range.has_value());
    CHECK(requests[0].range->first == 600);
    CHECK_FALSE(requests[1].range.has_value());
}

TEST_CASE("backoffDelay doubles and saturates", "[downloader][retry]") {
    RetryPolicy p;
    CHECK(backoffDelay(p, 1) == 2000ms);
    CHECK(backoffDelay(p, 2) == 4000ms);
    CHECK(backoffDelay(p, 5) == 32000ms);
    CHECK(backoffDelay(p, 6) == 60000ms);
    CHECK(backoffDelay(p, 100) == 60000ms);
}

TEST_CASE("classify separates retryable from fatal codes", "[downloader][retry]") {
    CHECK(classify(ErrorCode::Timeout) == Disposition::Retryable);
    CHECK(classify(ErrorCode::NetworkError) == Disposition::Retryable);
    CHECK(classify(ErrorCode::ServerError) == Disposition::Retryable);
    CHECK(classify(ErrorCode::NotFound) == Disposition::Fatal);
    CHECK(classify(ErrorCode::ChecksumMismatch) == Disposition::Fatal);
    CHECK(classify(ErrorCode::TlsVerificationFailed) == Disposition::Fatal);
    CHECK(errorCodeName(ErrorCode::RangeNotSatisfiable) == "RangeNotSatisfiable");
    CHECK(errorCodeName(ErrorCode::InvalidDescriptor) == "InvalidDescriptor");
}
