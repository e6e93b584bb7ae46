/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Implements IHttpAdapter::get() with the libcurl easy API, one handle per request.
 * - Honors timeout, TLS verify/CA, proxy, headers, redirects, User-Agent and Range.
 * - The status line is inspected before the first body byte: error bodies are never
 *   handed to the sink, and a 200 answer to a Range request is reported to the caller
 *   so it can restart its staging file.
 * - Cooperative cancellation through the transfer-info callback, which curl calls even
 *   when no bytes arrive, so a stalled transfer still observes its deadline.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <kfetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace kfetch::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
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
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
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
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::Cancelled;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// Map an HTTP error status to Error
static Error makeStatusError(long status, std::string_view url) {
    Error err;
    err.httpStatus = static_cast<int>(status);
    err.message = "HTTP " + std::to_string(status) + " for " + std::string(url);
    if (status == 401 || status == 403) {
        err.code = ErrorCode::AuthenticationFailed;
    } else if (status == 408) {
        err.code = ErrorCode::Timeout;
    } else if (status == 429) {
        err.code = ErrorCode::RateLimited;
    } else if (status >= 500) {
        err.code = ErrorCode::ServerError;
    } else {
        err.code = ErrorCode::ClientError;
    }
    return err;
}

// Header parser context; reset on every status line so redirects do not leak values
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    }

    return total;
}

// Write sink context
struct WriteContext {
    CURL* curl{nullptr};
    std::string_view url;
    const ResponseCallback* onResponse{nullptr};
    const ByteSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    HeaderParseContext* headers{nullptr};
    ResponseInfo info{};
    bool notified{false};
    bool cancelRequested{false};
    std::optional<Error> callbackError{};
    std::uint64_t received{0};
};

// Deliver the status line to the caller exactly once
static bool notify_response(WriteContext* ctx) {
    if (ctx->notified)
        return true;
    ctx->notified = true;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    ctx->info.status = status;
    ctx->info.partialContent = (status == 206);
    ctx->info.contentLength = ctx->headers ? ctx->headers->contentLength : std::nullopt;

    if (status >= 400) {
        // Error body is not content; stop reading it
        return false;
    }
    if (ctx->onResponse && *ctx->onResponse) {
        auto r = (*ctx->onResponse)(ctx->info);
        if (!r.ok()) {
            ctx->callbackError = r.error();
            return false;
        }
    }
    return true;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    if (!notify_response(ctx))
        return 0;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Expected<void>{Error{ErrorCode::IoError, "No sink provided"}};
    if (!r.ok()) {
        ctx->callbackError = r.error();
        return 0;
    }

    ctx->received += static_cast<std::uint64_t>(total);
    return total;
}

// CURL transfer-info callback: polled periodically, used for cancellation only
static int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, const RequestOptions& options) {
    // Timeouts: connect, then stall (under 1 byte/s for the whole window). Total duration
    // is bounded by the caller through shouldCancel.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long long>(options.timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(std::max<long long>(1, options.timeout.count() / 1000)));

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.tls.insecure ? 0L : 2L);
    if (!options.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, options.tls.caPath.c_str());
    }

    // Proxy
    if (options.proxy && !options.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, options.proxy->c_str());
    }

    if (!options.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() = default;
    ~CurlHttpAdapter() override = default;

    Expected<ResponseInfo> get(std::string_view url, const std::vector<Header>& headers,
                               std::uint64_t offset, const RequestOptions& options,
                               const ResponseCallback& onResponse, const ByteSink& sink,
                               const ShouldCancel& shouldCancel) override {
        if (url.empty()) {
            return Error{ErrorCode::InvalidArgument, "get: empty url"};
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(headers);
        if (offset > 0) {
            const std::string rangeHeader = "Range: bytes=" + std::to_string(offset) + "-";
            list = curl_slist_append(list, rangeHeader.c_str());
        }

        const std::string urlStr(url);
        curl_easy_setopt(curl, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.url = url;
        wctx.onResponse = &onResponse;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        wctx.headers = &hctx;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);

        configure_common(curl, options);

        spdlog::debug("GET {} (offset {})", url, offset);
        CURLcode rc = curl_easy_perform(curl);

        // Empty bodies never reach write_cb
        bool notifyOk = true;
        if (rc == CURLE_OK && !wctx.notified) {
            notifyOk = notify_response(&wctx);
        }
        if (wctx.info.status == 0) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            wctx.info.status = status;
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.callbackError) {
            return *wctx.callbackError;
        }
        if (wctx.cancelRequested) {
            return Error{ErrorCode::Cancelled, "Transfer cancelled: " + urlStr};
        }
        if (wctx.info.status >= 400) {
            return makeStatusError(wctx.info.status, url);
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "get(" + urlStr + ")");
        }
        if (!notifyOk) {
            return Error{ErrorCode::Unknown, "Response rejected: " + urlStr};
        }
        if (wctx.info.contentLength && wctx.received != *wctx.info.contentLength) {
            spdlog::debug("GET {} received {} of {} announced bytes", url, wctx.received,
                          *wctx.info.contentLength);
        }
        return wctx.info;
    }
};

/// Factory: provide a way for higher layers to create a CURL adapter.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    static std::once_flag curlInit;
    std::call_once(curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace kfetch::downloader
