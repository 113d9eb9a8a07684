/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - IChunkTransport over the libcurl easy API: one handle per fetch, so calls are safe from
 *   any number of worker threads.
 * - Honors timeout, TLS verify/CA, proxy, headers, redirects, and Range.
 * - Cooperative cancellation from both the write and the transfer-info callbacks.
 * - Failures are classified here; retry decisions belong to the ChunkFetcher.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <mediafetch/downloader/downloader.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>
#include <string_view>

namespace mediafetch::downloader {

namespace {

std::once_flag g_curlInitOnce;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
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
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_URL_MALFORMAT:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

Error makeHttpStatusError(long status, std::string_view url) {
    ErrorCode code;
    if (status == 429) {
        code = ErrorCode::RateLimited;
    } else if (status >= 500) {
        code = ErrorCode::ServerError;
    } else if (status == 401 || status == 403) {
        code = ErrorCode::Unauthorized;
    } else if (status == 404 || status == 410) {
        code = ErrorCode::NotFound;
    } else {
        code = ErrorCode::HttpError;
    }
    return Error{code, "HTTP " + std::to_string(status) + " for " + std::string(url)};
}

// Write sink context for fetch
struct WriteContext {
    ByteVector* body{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::uint64_t expected{0}; // 0 if unknown
    bool cancelRequested{false};
};

bool cancelled(WriteContext* ctx) {
    if (ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return true;
    }
    return false;
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (cancelled(ctx)) {
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    const auto* bytes = reinterpret_cast<const std::byte*>(ptr);
    ctx->body->insert(ctx->body->end(), bytes, bytes + total);
    return total;
}

// Transfer-info callback: lets a cancel land while the connection is idle.
int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    return (ctx && cancelled(ctx)) ? 1 : 0;
}

// Helper to build curl_slist from headers
curl_slist* build_header_list(const std::vector<Header>& headers) {
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
void configure_common(CURL* curl, std::chrono::milliseconds timeout, const TransportConfig& cfg) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, cfg.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, cfg.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, cfg.tls.insecure ? 0L : 2L);
    if (!cfg.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, cfg.tls.caPath.c_str());
    }

    // Proxy
    if (cfg.proxy && !cfg.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, cfg.proxy->c_str());
    }

    if (!cfg.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, cfg.userAgent.c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

struct CurlEasyDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

class CurlChunkTransport final : public IChunkTransport {
public:
    explicit CurlChunkTransport(TransportConfig config) : config_(std::move(config)) {
        std::call_once(g_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlChunkTransport() override = default;

    Result<ByteVector> fetch(const ChunkLocator& locator, const ByteRange& range,
                             std::chrono::milliseconds timeout,
                             const ShouldCancel& shouldCancel) override {
        std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        std::unique_ptr<curl_slist, CurlSlistDeleter> list(build_header_list(config_.headers));

        ByteVector body;
        WriteContext wctx;
        wctx.body = &body;
        wctx.shouldCancel = &shouldCancel;

        std::string rangeSpec;
        if (locator.useRangeHeader && range.length > 0) {
            const auto last = range.offset + range.length - 1;
            rangeSpec = std::to_string(range.offset) + "-" + std::to_string(last);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, rangeSpec.c_str());
            body.reserve(static_cast<std::size_t>(range.length));
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, locator.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        if (list) {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        }

        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

        configure_common(curl.get(), timeout, config_);

        CURLcode rc = curl_easy_perform(curl.get());

        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(" + locator.url + ")");
        }
        if (http_status >= 400) {
            return makeHttpStatusError(http_status, locator.url);
        }

        spdlog::debug("Fetched {} bytes from {} (HTTP {})", body.size(), locator.url,
                      http_status);
        return body;
    }

private:
    TransportConfig config_;
};

} // namespace

std::unique_ptr<IChunkTransport> makeCurlChunkTransport(const TransportConfig& config) {
    return std::make_unique<CurlChunkTransport>(config);
}

} // namespace mediafetch::downloader
