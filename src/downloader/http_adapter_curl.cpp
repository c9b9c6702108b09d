/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Implements IHttpAdapter::head() and IHttpAdapter::get() with the libcurl easy API.
 * - One easy handle per request; handles are never shared between threads.
 * - Redirects are followed; headers are re-parsed for every response in the chain so
 *   the handler only ever sees the final response.
 * - The response handler runs before the first body byte reaches the sink, or after
 *   the transfer when the body is empty.
 * - Body fetches abort when no byte arrives for the whole request timeout.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <datafetch/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace datafetch::downloader {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// curl_global_init is not thread-safe; run it once per process.
Expected<void> ensureCurlInitialized() {
    static std::once_flag flag;
    static CURLcode initResult = CURLE_OK;
    std::call_once(flag, [] {
        initResult = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (initResult == CURLE_OK) {
            std::atexit([] { curl_global_cleanup(); });
        }
    });
    if (initResult != CURLE_OK) {
        return Error{ErrorCode::Unknown,
                     std::string("curl_global_init failed: ") + curl_easy_strerror(initResult)};
    }
    return {};
}

// Local helper: lowercase copy
std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

std::optional<std::uint64_t> parse_u64(std::string_view sv) {
    std::uint64_t tmp{0};
    auto res = std::from_chars(sv.data(), sv.data() + sv.size(), tmp);
    if (res.ec != std::errc() || res.ptr != sv.data() + sv.size())
        return std::nullopt;
    return tmp;
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where, std::string_view url) {
    Error err;
    err.message = std::string(where) + " " + std::string(url) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_TOO_MANY_REDIRECTS:
            err.code = ErrorCode::HttpError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Per-response header state; reset on every status line so redirects are dropped.
struct HeaderParseContext {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::uint64_t> contentRangeTotal{};
};

// CURL header callback
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.starts_with("HTTP/")) {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        if (to_lower(val) == "bytes")
            ctx->acceptRangesBytes = true;
    } else if (key == "content-length") {
        ctx->contentLength = parse_u64(val);
    } else if (key == "content-range") {
        // bytes <first>-<last>/<total>
        auto slash = val.rfind('/');
        if (slash != std::string_view::npos)
            ctx->contentRangeTotal = parse_u64(trim(val.substr(slash + 1)));
    }
    return total;
}

// Shared state between get() and its write callback
struct TransferContext {
    CURL* curl{nullptr};
    HeaderParseContext* headers{nullptr};
    const ResponseHandler* onResponse{nullptr};
    const BodySink* sink{nullptr};
    bool dispatched{false};
    std::optional<Error> callbackError{};
    ResponseHead head{};
};

ResponseHead snapshot(CURL* curl, const HeaderParseContext& hctx) {
    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);
    ResponseHead head;
    head.status = static_cast<int>(http_status);
    head.contentLength = hctx.contentLength;
    head.acceptRangesBytes = hctx.acceptRangesBytes;
    return head;
}

// Runs the response handler once; false means the handler vetoed the body.
bool dispatch_response(TransferContext& ctx) {
    if (ctx.dispatched)
        return !ctx.callbackError.has_value();
    ctx.dispatched = true;
    ctx.head = snapshot(ctx.curl, *ctx.headers);
    if (ctx.onResponse && *ctx.onResponse) {
        auto r = (*ctx.onResponse)(ctx.head);
        if (!r.ok()) {
            ctx.callbackError = r.error();
            return false;
        }
    }
    return true;
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!dispatch_response(*ctx))
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    if (total == 0)
        return 0;

    if (ctx->sink && *ctx->sink) {
        std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
        auto r = (*ctx->sink)(bytes);
        if (!r.ok()) {
            ctx->callbackError = r.error();
            return 0;
        }
    }
    return total;
}

size_t discard_cb(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

std::string range_header(const ByteRange& range) {
    std::string h = "Range: bytes=" + std::to_string(range.first) + "-";
    if (range.last)
        h += std::to_string(*range.last);
    return h;
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, std::string_view url, std::chrono::milliseconds timeout) {
    curl_easy_setopt(curl, CURLOPT_URL, std::string(url).c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

} // namespace

class CurlHttpAdapter final : public IHttpAdapter {
public:
    explicit CurlHttpAdapter(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger ? std::move(logger) : spdlog::default_logger()) {}
    ~CurlHttpAdapter() override = default;

    Expected<ResponseHead> head(std::string_view url, std::chrono::milliseconds timeout) override {
        if (auto init = ensureCurlInitialized(); !init.ok())
            return init.error();

        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        HeaderParseContext hctx{};
        configure_common(curl.get(), url, timeout);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "HEAD", url);
        }
        auto result = snapshot(curl.get(), hctx);

        if (result.status == 405 || result.status == 501) {
            // Some servers reject HEAD; a one-byte range GET answers the same questions
            logger_->debug("HEAD rejected with {} for {}, probing with GET Range 0-0",
                           result.status, url);
            hctx = HeaderParseContext{};
            CurlList range(curl_slist_append(nullptr, "Range: bytes=0-0"), &curl_slist_free_all);
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, range.get());
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_cb);
            rc = curl_easy_perform(curl.get());
            if (rc != CURLE_OK) {
                return makeCurlError(rc, "GET(range probe)", url);
            }
            result = snapshot(curl.get(), hctx);
            if (result.status == 206) {
                result.status = 200;
                result.acceptRangesBytes = true;
                result.contentLength = hctx.contentRangeTotal;
            }
        }
        logger_->debug("HEAD {} -> {} (length={}, ranges={})", url, result.status,
                       result.contentLength ? std::to_string(*result.contentLength) : "unknown",
                       result.acceptRangesBytes);
        return result;
    }

    Expected<ResponseHead> get(std::string_view url, const std::optional<ByteRange>& range,
                               std::chrono::milliseconds timeout,
                               const ResponseHandler& onResponse, const BodySink& sink) override {
        if (auto init = ensureCurlInitialized(); !init.ok())
            return init.error();

        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        CurlList list(nullptr, &curl_slist_free_all);
        if (range) {
            const auto line = range_header(*range);
            list.reset(curl_slist_append(nullptr, line.c_str()));
        }

        HeaderParseContext hctx{};
        TransferContext tctx;
        tctx.curl = curl.get();
        tctx.headers = &hctx;
        tctx.onResponse = &onResponse;
        tctx.sink = &sink;

        configure_common(curl.get(), url, timeout);
        // Stall detection instead of a whole-transfer deadline: large bodies may take long.
        const auto stallSeconds =
            std::max<long>(1L, static_cast<long>((timeout.count() + 999) / 1000));
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, stallSeconds);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &tctx);

        const CURLcode rc = curl_easy_perform(curl.get());

        if (tctx.callbackError) {
            return *tctx.callbackError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "GET", url);
        }
        if (!dispatch_response(tctx)) {
            return *tctx.callbackError;
        }
        return tctx.head;
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<CurlHttpAdapter>(std::move(logger));
}

} // namespace datafetch::downloader
