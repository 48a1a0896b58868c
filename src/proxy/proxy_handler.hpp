#pragma once

/**
 * Generic reverse proxy for /api/{alias}/{path}.
 *
 * Forwards the request to the aliased host with client-identifying headers
 * removed, and relays the buffered response with upstream-internal headers
 * removed.
 */

#include "path_parser.hpp"
#include "../errors.hpp"
#include "../http_transport.hpp"
#include "../http_types.hpp"
#include <string>

namespace relay {
class Logger;
}

namespace relay::proxy {

class ProxyHandler {
public:
    ProxyHandler(HttpTransport& transport, PathParser& parser, Logger& logger,
                 const ErrorResponder& responder, long timeout_ms);

    Reply handle(const InboundRequest& request) const;

private:
    HttpTransport& transport_;
    PathParser& parser_;
    Logger& logger_;
    const ErrorResponder& responder_;
    long timeout_ms_;
};

// https://{host}/{path}{query}, with one leading slash of `path` dropped.
std::string build_target_url(const std::string& host, const std::string& path, const std::string& query);

// Copies request headers minus blacklisted and hop-by-hop ones, adds CORS
// headers and per-service defaults.
HeaderList forward_request_headers(const HeaderList& headers, const std::string& alias);

// Copies response headers minus blacklisted, x-*, content-encoding,
// content-type and hop-by-hop ones, then adds CORS headers.
HeaderList filter_response_headers(const HeaderList& headers);

// Forces generationConfig.thinkingBudget = 0 when generationConfig is an
// object. Bodies that are not JSON are returned unchanged.
std::string disable_thinking(const std::string& body);

} // namespace relay::proxy
