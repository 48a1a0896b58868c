#pragma once

/**
 * Outbound HTTP transport.
 *
 * HttpTransport is the seam between the gateway and the network. The
 * production implementation uses libcurl; tests script responses with a
 * fake implementation.
 */

#include "http_types.hpp"
#include <functional>
#include <string>

namespace relay {

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    HeaderList headers;
    std::string body;
    long timeout_ms = 30000;  // Total time for send(); connect and idle time for stream().
};

struct HttpResponse {
    int status = 0;
    HeaderList headers;
    std::string body;
};

// Receives body bytes of a streamed response. Returning false aborts the transfer.
using ChunkCallback = std::function<bool(const std::string&)>;

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Performs the request and buffers the whole body.
    // Throws TransportError on network-level failure.
    virtual HttpResponse send(const HttpRequest& request) = 0;

    // Performs the request, handing body bytes of a successful (< 400)
    // response to on_chunk as they arrive; the returned body is then empty.
    // Error responses are buffered into the returned body instead.
    // Throws TransportError on network-level failure.
    virtual HttpResponse stream(const HttpRequest& request, const ChunkCallback& on_chunk) = 0;
};

/**
 * libcurl implementation, one easy handle per request.
 */
class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;
    HttpResponse stream(const HttpRequest& request, const ChunkCallback& on_chunk) override;

private:
    HttpResponse perform(const HttpRequest& request, const ChunkCallback* on_chunk);
};

} // namespace relay
