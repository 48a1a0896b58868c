#include "config.hpp"
#include "console.hpp"
#include "errors.hpp"
#include "gateway.hpp"
#include "http_server.hpp"
#include "http_transport.hpp"
#include "logger.hpp"
#include "settings.hpp"
#include "proxy/services.hpp"

#include <CLI/CLI.hpp>
#include <csignal>
#include <cstdlib>
#include <optional>
#include <unistd.h>

using namespace relay;

// ========== Signal Handling ==========

static HttpServer* g_server = nullptr;  // Global server for signal handler.

// Handles SIGINT and SIGTERM by stopping the listener; main then exits normally.
void signal_handler(int) {
    if (g_server) {
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    Console console;

    CLI::App app{"API gateway for generative-AI backends with Gemini anti-truncation"};
    app.footer("\nEnvironment:\n"
               "  GEMINI_API_KEY           Key for the anti-truncation endpoints\n"
               "  PORT, MAX_RETRIES, REQUEST_TIMEOUT, MAX_REQUESTS_PER_MINUTE,\n"
               "  ENABLE_CACHE, CACHE_SIZE, DEBUG_MODE, UPSTREAM_URL_BASE, RELAY_ENV\n");

    std::string config_file;
    app.add_option("-c,--config", config_file, "JSON settings file")
        ->check(CLI::ExistingFile);

    std::optional<int> port;
    app.add_option("-p,--port", port, "Port to listen on (default: 8000)")
        ->check(CLI::Range(1, 65535));

    std::optional<std::string> address;
    app.add_option("--address", address, "Address to bind (default: 0.0.0.0)");

    std::optional<std::string> upstream;
    app.add_option("--upstream", upstream, "Gemini API base URL");

    bool debug = false;
    app.add_flag("-v,--debug", debug, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    GatewaySettings settings = GatewaySettings::defaults();
    try {
        if (!config_file.empty()) {
            settings = load_settings_file(config_file, settings);
        }
        apply_env_overrides(settings);
        if (port) settings.port = *port;
        if (address) settings.listen_address = *address;
        if (upstream) settings.upstream_url_base = *upstream;
        if (debug) settings.debug_mode = true;
        settings.validate();
    } catch (const ConfigurationError& e) {
        console.print_error(std::string("Configuration error: ") + e.what());
        return 1;
    }

    Logger& logger = Logger::instance();
    logger.set_debug(settings.debug_mode);
    logger.set_colors(isatty(STDERR_FILENO) != 0);
    logger.debug("Settings: " + describe_settings(settings));

    if (settings.api_key.empty()) {
        console.print_warning(std::string(env::API_KEY) +
                              " is not set; /api/gemini-anti requests will fail until it is configured.");
    }

    CurlTransport transport;
    Gateway gateway(settings, transport, logger);
    HttpServer server(gateway);

    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server.on_start([&](const std::string&, int) {
        console.print_startup(settings, proxy::GENERIC_SERVICES.size(), proxy::special_services().size());
    });

    bool ok = server.start(settings.listen_address, settings.port);
    g_server = nullptr;

    if (!ok) {
        console.print_error("Failed to listen on " + settings.listen_address + ":" +
                            std::to_string(settings.port));
        return 1;
    }

    console.println();
    console.print_success("Shut down gracefully.");
    return 0;
}
