#pragma once

/**
 * Runtime settings for the gateway.
 *
 * Settings are layered: compiled-in defaults, then an optional JSON file,
 * then environment variables. Command-line overrides are applied by main.
 */

#include <string>
#include <optional>
#include <functional>

namespace relay {

/**
 * Effective gateway settings.
 */
struct GatewaySettings {
    std::string listen_address;
    int port;
    int max_retries;
    long request_timeout_ms;
    long backoff_base_ms;
    long backoff_cap_ms;
    int max_requests_per_minute;
    bool enable_cache;
    size_t cache_size;
    bool debug_mode;
    bool production;
    std::string upstream_url_base;
    std::string api_key;  // Never written back to disk or logged.

    // Returns settings populated with defaults.
    static GatewaySettings defaults();

    // Throws ConfigurationError when a value is out of range.
    void validate() const;
};

// Looks up an environment variable; returns nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads from the process environment.
std::optional<std::string> process_env(const std::string& name);

// Loads settings from a JSON file on top of the defaults.
// Throws ConfigurationError when the file exists but cannot be parsed.
GatewaySettings load_settings_file(const std::string& path, GatewaySettings base);

// Applies environment overrides. Invalid numbers are skipped with a warning.
void apply_env_overrides(GatewaySettings& settings, const EnvLookup& lookup = process_env);

// Serializes settings (without the API key) for diagnostics.
std::string describe_settings(const GatewaySettings& settings);

} // namespace relay
