#include "http_server.hpp"
#include "config.hpp"
#include "gateway.hpp"
#include "http_types.hpp"
#include "logger.hpp"
#include <httplib.h>
#include <chrono>

namespace relay {

namespace {

InboundRequest to_inbound(const httplib::Request& req) {
    InboundRequest inbound;
    inbound.method = req.method;
    inbound.path = req.path;
    inbound.body = req.body;

    // Keep the query exactly as the client sent it; it is forwarded verbatim.
    auto question = req.target.find('?');
    if (question != std::string::npos) {
        inbound.query = req.target.substr(question);
    }

    for (const auto& [name, value] : req.headers) {
        inbound.headers.emplace_back(name, value);
    }
    return inbound;
}

void write_reply(const Reply& reply, httplib::Response& res) {
    res.status = reply.status;
    for (const auto& [name, value] : reply.headers) {
        res.set_header(name, value);
    }

    if (reply.stream) {
        auto stream = reply.stream;
        res.set_chunked_content_provider(
            reply.content_type,
            [stream](size_t, httplib::DataSink& sink) {
                std::string chunk;
                if (!stream->next(chunk)) {
                    sink.done();
                    return true;
                }
                return sink.write(chunk.data(), chunk.size());
            },
            [stream](bool success) {
                if (!success) {
                    Logger::instance().debug("Client disconnected, cancelling upstream stream");
                }
                stream->cancel();
            });
        return;
    }

    if (reply.status != 204) {
        res.set_content(reply.body, reply.content_type.empty() ? "text/plain" : reply.content_type);
    }
}

} // namespace

HttpServer::HttpServer(Gateway& gateway)
    : gateway_(gateway), server_(std::make_unique<httplib::Server>()) {}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(const std::string& address, int port) {
    auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
        write_reply(gateway_.handle(to_inbound(req)), res);
    };

    // Every method on every path goes through the gateway router.
    server_->Get(".*", dispatch);
    server_->Post(".*", dispatch);
    server_->Put(".*", dispatch);
    server_->Patch(".*", dispatch);
    server_->Delete(".*", dispatch);
    server_->Options(".*", dispatch);

    // Call the on_start callback before blocking
    if (on_start_callback_) {
        on_start_callback_(address, port);
    }

    running_ = true;
    maintenance_ = std::thread(&HttpServer::run_maintenance_loop, this);

    // This blocks until server is stopped
    bool result = server_->listen(address, port);

    running_ = false;
    if (maintenance_.joinable()) {
        maintenance_.join();
    }
    gateway_.run_maintenance();
    return result;
}

void HttpServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
    }
}

void HttpServer::on_start(std::function<void(const std::string&, int)> callback) {
    on_start_callback_ = std::move(callback);
}

void HttpServer::run_maintenance_loop() {
    const auto tick = std::chrono::milliseconds(100);
    auto elapsed = std::chrono::milliseconds(0);

    while (running_) {
        std::this_thread::sleep_for(tick);
        elapsed += tick;
        if (elapsed.count() >= LOG_FLUSH_INTERVAL_MS) {
            elapsed = std::chrono::milliseconds(0);
            gateway_.run_maintenance();
        }
    }
}

} // namespace relay
