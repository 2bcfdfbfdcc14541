/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - probe() and fetch() on top of the libcurl easy API; one easy handle per call.
 * - Honors total/connect timeouts, TLS verify/CA, proxy, headers, redirects and Range.
 * - fetch() reports the response head to the caller before the first body byte so a status
 *   mismatch can be rejected without touching the local file.
 * - Errors raised by the caller's head handler or sink abort the transfer and are returned as-is.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <wildfetch/downloader/downloader.hpp>
#include <wildfetch/downloader/http_headers.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>

namespace wildfetch::downloader {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept {
        if (list)
            curl_slist_free_all(list);
    }
};
using SlistHandle = std::unique_ptr<curl_slist, SlistDeleter>;

void ensureCurlInitialized() {
    static std::once_flag curlInitFlag;
    std::call_once(curlInitFlag, []() {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
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
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// CURL header callback
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;
    consumeHeaderLine(std::string_view(buffer, total), *static_cast<ResponseHeaders*>(userdata));
    return total;
}

// Discards the body of probe requests
size_t discard_cb(char*, size_t size, size_t nmemb, void*) {
    return size * nmemb;
}

// Write sink context for fetch()
struct WriteContext {
    CURL* curl{nullptr};
    const HeadHandler* onHead{nullptr};
    const ChunkSink* sink{nullptr};
    ResponseHeaders* headers{nullptr};
    ResponseHead head{};
    bool headDelivered{false};
    std::optional<Error> abortError{};
};

ResponseHead makeHead(CURL* curl, const ResponseHeaders& h) {
    ResponseHead head;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &head.httpStatus);
    head.contentLength = h.contentLength;
    head.contentRangeStart = h.contentRangeStart;
    head.contentRangeTotal = h.contentRangeTotal;
    return head;
}

Expected<void> deliverHead(WriteContext& ctx) {
    ctx.headDelivered = true;
    ctx.head = makeHead(ctx.curl, *ctx.headers);
    if (ctx.onHead && *ctx.onHead) {
        return (*ctx.onHead)(ctx.head);
    }
    if (ctx.head.httpStatus >= 400) {
        return Error{ErrorCode::ServerError, "HTTP error " + std::to_string(ctx.head.httpStatus)};
    }
    return Expected<void>{};
}

// CURL write callback
size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    try {
        if (!ctx->headDelivered) {
            auto hr = deliverHead(*ctx);
            if (!hr.ok()) {
                ctx->abortError = hr.error();
                return 0; // signal error to curl => CURLE_WRITE_ERROR
            }
        }

        std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
        auto r = (ctx->sink && *ctx->sink)
                     ? (*ctx->sink)(bytes)
                     : Expected<void>{Error{ErrorCode::IoError, "No sink provided"}};
        if (!r.ok()) {
            ctx->abortError = r.error();
            return 0;
        }
    } catch (const std::exception& e) {
        ctx->abortError = Error{ErrorCode::Unknown, std::string("Exception in sink: ") + e.what()};
        return 0;
    }

    return total;
}

// Helper to build curl_slist from headers
SlistHandle build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return SlistHandle{list};
}

// Common CURL easy handle configuration
void configure_common(CURL* curl, const FetchRequest& request) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.total.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.timeout.connect.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, request.followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, request.tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, request.tls.insecure ? 0L : 2L);
    if (!request.tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, request.tls.caPath.c_str());
    }

    // Proxy
    if (request.proxy && !request.proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, request.proxy->c_str());
    }

    if (!request.userAgent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());
    }

    if (request.bufferSizeHint != 0) {
        // libcurl clamps to [1024, CURL_MAX_READ_SIZE]
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(request.bufferSizeHint));
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

} // namespace

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensureCurlInitialized(); }
    ~CurlHttpAdapter() override = default;

    Expected<ProbeResult> probe(const FetchRequest& request) override {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        auto list = build_header_list(request.headers);
        ResponseHeaders hctx{};

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discard_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        configure_common(curl.get(), request);

        CURLcode rc = curl_easy_perform(curl.get());
        long http_status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

        // Some servers reject HEAD; try GET range 0-0 as fallback
        if (rc != CURLE_OK || http_status == 405 || http_status == 501) {
            spdlog::debug("HEAD probe failed for {} ({}), attempting GET Range 0-0", request.url,
                          rc != CURLE_OK ? curl_easy_strerror(rc)
                                         : ("HTTP " + std::to_string(http_status)).c_str());
            hctx = ResponseHeaders{};
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 0L);
            curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

            auto withRange = build_header_list(request.headers);
            withRange.reset(curl_slist_append(withRange.release(), "Range: bytes=0-0"));
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, withRange.get());
            rc = curl_easy_perform(curl.get());
            if (rc != CURLE_OK) {
                return makeCurlError(rc, "probe(GET range)");
            }
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
            if (http_status == 206) {
                // If 206, Range works; if 200, server ignored Range.
                hctx.acceptRangesBytes = true;
                hctx.contentLength = hctx.contentRangeTotal;
            }
        }

        if (http_status < 200 || http_status >= 300) {
            return Error{ErrorCode::ServerError,
                         "probe: HTTP " + std::to_string(http_status) + " for " + request.url};
        }

        ProbeResult out;
        out.acceptsRanges = hctx.acceptRangesBytes;
        if (hctx.contentLength && *hctx.contentLength > 0) {
            out.contentLength = hctx.contentLength;
        }
        return out;
    }

    Expected<ResponseHead> fetch(const FetchRequest& request, const HeadHandler& onHead,
                                 const ChunkSink& sink) override {
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        // Build headers including Range (open-ended from offset)
        auto list = build_header_list(request.headers);
        if (request.rangeStart) {
            const std::string rangeHeader =
                "Range: bytes=" + std::to_string(*request.rangeStart) + "-";
            list.reset(curl_slist_append(list.release(), rangeHeader.c_str()));
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());

        ResponseHeaders hctx{};
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl.get();
        wctx.onHead = &onHead;
        wctx.sink = &sink;
        wctx.headers = &hctx;
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);

        configure_common(curl.get(), request);

        CURLcode rc = curl_easy_perform(curl.get());

        if (wctx.abortError) {
            return *wctx.abortError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(GET)");
        }
        if (!wctx.headDelivered) {
            // Empty body: the write callback never ran
            auto hr = deliverHead(wctx);
            if (!hr.ok()) {
                return hr.error();
            }
        }
        return wctx.head;
    }
};

/// Factory: higher layers create the adapter without seeing libcurl.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace wildfetch::downloader
