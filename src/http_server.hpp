#pragma once

/**
 * HTTP front end for the gateway.
 *
 * Binds cpp-httplib to a Gateway: every method and path is translated to an
 * InboundRequest, and the Reply is written back, streamed with chunked
 * encoding when it carries a ReplyStream. A maintenance thread runs the
 * gateway's periodic work while the server is listening.
 */

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace relay {

class Gateway;

class HttpServer {
public:
    explicit HttpServer(Gateway& gateway);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Starts the server on the given address and port.
    // This call blocks until the server is stopped.
    // Returns true if the server shut down cleanly, false if it could not bind.
    bool start(const std::string& address, int port);

    // Stops a running server; safe to call from another thread.
    void stop();

    // Sets a callback to be called once the routes are registered, right before listening.
    void on_start(std::function<void(const std::string&, int)> callback);

private:
    Gateway& gateway_;
    std::unique_ptr<httplib::Server> server_;
    std::function<void(const std::string&, int)> on_start_callback_;
    std::atomic<bool> running_{false};
    std::thread maintenance_;

    void run_maintenance_loop();
};

} // namespace relay
