#include "http_transport.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <exception>

namespace relay {

namespace {

// Per-transfer state shared with the curl callbacks.
struct TransferContext {
    CURL* curl = nullptr;
    const ChunkCallback* on_chunk = nullptr;
    HttpResponse* response = nullptr;
    bool aborted = false;
    std::exception_ptr callback_error;  // Exceptions must not unwind through curl.
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t total = size * nitems;
    std::string line(buffer, total);

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }

    // A new status line starts a new header block (redirects, 100-continue).
    if (line.rfind("HTTP/", 0) == 0) {
        ctx->response->headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = (start == std::string::npos) ? "" : value.substr(start);
        ctx->response->headers.emplace_back(name, value);
    }
    return total;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t total = size * nmemb;

    if (!ctx->on_chunk) {
        ctx->response->body.append(ptr, total);
        return total;
    }

    long http_code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        ctx->response->body.append(ptr, total);
        return total;
    }

    try {
        if (!(*ctx->on_chunk)(std::string(ptr, total))) {
            ctx->aborted = true;
            return 0;
        }
    } catch (...) {
        ctx->callback_error = std::current_exception();
        return 0;
    }
    return total;
}

TransportError to_transport_error(CURLcode code) {
    std::string detail = curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportError(TransportFailure::Timeout, "Upstream request timeout: " + detail);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return TransportError(TransportFailure::Dns, "DNS lookup failed: " + detail);
        case CURLE_COULDNT_CONNECT:
            return TransportError(TransportFailure::Connect, "Connection refused by upstream: " + detail);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            // curl's own text for these mentions "connect", which would misclassify.
            return TransportError(TransportFailure::Tls,
                                  "SSL/TLS failure (curl code " + std::to_string(static_cast<int>(code)) + ")");
        default:
            return TransportError(TransportFailure::Network, "Network error: " + detail);
    }
}

} // namespace

CurlTransport::CurlTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlTransport::~CurlTransport() {
    curl_global_cleanup();
}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    return perform(request, nullptr);
}

HttpResponse CurlTransport::stream(const HttpRequest& request, const ChunkCallback& on_chunk) {
    return perform(request, &on_chunk);
}

HttpResponse CurlTransport::perform(const HttpRequest& request, const ChunkCallback* on_chunk) {
    Logger::instance().debug("CURL " + request.method + " " + request.url);

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError(TransportFailure::Network, "Network error: failed to initialize CURL");
    }

    HttpResponse response;
    TransferContext ctx;
    ctx.curl = curl;
    ctx.on_chunk = on_chunk;
    ctx.response = &response;

    struct curl_slist* headers = nullptr;
    for (const auto& [name, value] : request.headers) {
        headers = curl_slist_append(headers, (name + ": " + value).c_str());
    }
    // Stop curl from adding "Expect: 100-continue" to large POSTs.
    headers = curl_slist_append(headers, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else {
        if (request.method != "POST") {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    if (on_chunk) {
        // No total limit on streams: bound connect time and idle time instead.
        long idle_seconds = std::max(1L, request.timeout_ms / 1000);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, request.timeout_ms);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, idle_seconds);
    } else {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    }

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    response.status = static_cast<int>(http_code);

    if (ctx.callback_error) {
        std::rethrow_exception(ctx.callback_error);
    }

    if (ctx.aborted) {
        Logger::instance().debug("CURL transfer aborted by receiver: " + request.url);
        return response;
    }

    if (res != CURLE_OK) {
        TransportError error = to_transport_error(res);
        Logger::instance().debug(std::string("CURL failed: ") + error.what());
        throw error;
    }

    Logger::instance().debug("CURL HTTP " + std::to_string(http_code) + " - " +
                             format_json_compact(response.body, 300));
    return response;
}

} // namespace relay
