#pragma once

#include <datafetch/downloader/downloader.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace datafetch::test_support {

using downloader::ByteRange;
using downloader::BodySink;
using downloader::Error;
using downloader::ErrorCode;
using downloader::Expected;
using downloader::ResponseHandler;
using downloader::ResponseHead;

/**
 * In-memory IHttpAdapter. Each URL maps to a Resource describing the payload and
 * how the "server" misbehaves. Requests are recorded for assertions.
 */
class FakeHttpAdapter : public downloader::IHttpAdapter {
public:
    struct Resource {
        std::string body;
        bool advertiseRanges{true};   // Accept-Ranges: bytes on HEAD
        bool honorRanges{true};       // answer Range requests with 206
        int headStatus{200};
        int forcedStatus{0};          // non-zero: every GET answers with this status, no body
        int transientFailures{0};     // first N GETs fail with NetworkError before any response
        std::optional<std::size_t> cutAfter{}; // deliver this many bytes, then drop the connection
        int cuts{0};                  // how many GETs get cut
        std::map<std::uint64_t, int> rangeStatus{}; // range start -> forced status
        std::size_t deliveryBlock{1000};
        std::function<void(const std::optional<ByteRange>&)> beforeBody{};
    };

    struct Request {
        std::string url;
        std::optional<ByteRange> range;
    };

    void serve(const std::string& url, Resource r) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(r);
    }

    void serve(const std::string& url, std::string body) {
        Resource r;
        r.body = std::move(body);
        serve(url, std::move(r));
    }

    Expected<ResponseHead> head(std::string_view url, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++headCount_;
        auto it = resources_.find(std::string(url));
        if (it == resources_.end())
            return ResponseHead{404, std::nullopt, false};
        const auto& r = it->second;
        return ResponseHead{r.headStatus, static_cast<std::uint64_t>(r.body.size()),
                            r.advertiseRanges};
    }

    Expected<ResponseHead> get(std::string_view url, const std::optional<ByteRange>& range,
                               std::chrono::milliseconds, const ResponseHandler& onResponse,
                               const BodySink& sink) override {
        Resource r;
        bool found = false;
        bool failTransient = false;
        bool cut = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(Request{std::string(url), range});
            auto it = resources_.find(std::string(url));
            if (it != resources_.end()) {
                found = true;
                if (it->second.transientFailures > 0) {
                    --it->second.transientFailures;
                    failTransient = true;
                } else if (it->second.cutAfter && it->second.cuts > 0) {
                    --it->second.cuts;
                    cut = true;
                }
                r = it->second;
            }
        }

        if (!found)
            return respond(ResponseHead{404, std::nullopt, false}, onResponse);
        if (failTransient)
            return Error{ErrorCode::NetworkError, "simulated connection failure"};
        if (r.forcedStatus != 0)
            return respond(ResponseHead{r.forcedStatus, std::nullopt, r.advertiseRanges},
                           onResponse);

        const std::uint64_t size = r.body.size();
        std::uint64_t first = 0;
        std::uint64_t last = size == 0 ? 0 : size - 1;
        ResponseHead head{200, size, r.advertiseRanges};
        if (range && r.honorRanges) {
            if (auto forced = r.rangeStatus.find(range->first); forced != r.rangeStatus.end())
                return respond(ResponseHead{forced->second, std::nullopt, true}, onResponse);
            if (range->first >= size)
                return respond(ResponseHead{416, std::nullopt, true}, onResponse);
            first = range->first;
            last = std::min<std::uint64_t>(range->last.value_or(size - 1), size - 1);
            head = ResponseHead{206, last - first + 1, true};
        }

        if (auto ok = onResponse(head); !ok.ok())
            return ok.error();
        if (r.beforeBody)
            r.beforeBody(range);

        const std::string_view slice =
            size == 0 ? std::string_view{}
                      : std::string_view(r.body).substr(static_cast<std::size_t>(first),
                                                        static_cast<std::size_t>(last - first + 1));
        std::size_t limit = slice.size();
        if (cut)
            limit = std::min(limit, *r.cutAfter);

        const std::size_t block = std::max<std::size_t>(1, r.deliveryBlock);
        for (std::size_t off = 0; off < limit; off += block) {
            const auto n = std::min(block, limit - off);
            auto bytes = std::as_bytes(std::span<const char>(slice.data() + off, n));
            if (auto s = sink(bytes); !s.ok())
                return s.error();
        }
        if (cut)
            return Error{ErrorCode::NetworkError, "simulated connection reset"};
        return head;
    }

    std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::size_t getCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::size_t headCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return headCount_;
    }

private:
    static Expected<ResponseHead> respond(const ResponseHead& head,
                                          const ResponseHandler& onResponse) {
        if (auto ok = onResponse(head); !ok.ok())
            return ok.error();
        return head;
    }

    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::vector<Request> requests_;
    std::size_t headCount_{0};
};

/// Sleeper that records requested delays instead of sleeping.
struct RecordingSleeper {
    std::shared_ptr<std::vector<std::chrono::milliseconds>> delays =
        std::make_shared<std::vector<std::chrono::milliseconds>>();
    std::shared_ptr<std::mutex> mutex = std::make_shared<std::mutex>();

    downloader::Sleeper fn() const {
        auto d = delays;
        auto m = mutex;
        return [d, m](std::chrono::milliseconds ms) {
            std::lock_guard<std::mutex> lock(*m);
            d->push_back(ms);
        };
    }
};

} // namespace datafetch::test_support
