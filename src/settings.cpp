#include "settings.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <algorithm>

namespace relay {

using json = nlohmann::json;

GatewaySettings GatewaySettings::defaults() {
    GatewaySettings s;
    s.listen_address = DEFAULT_LISTEN_ADDRESS;
    s.port = DEFAULT_PORT;
    s.max_retries = DEFAULT_MAX_RETRIES;
    s.request_timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;
    s.backoff_base_ms = DEFAULT_BACKOFF_BASE_MS;
    s.backoff_cap_ms = DEFAULT_BACKOFF_CAP_MS;
    s.max_requests_per_minute = DEFAULT_MAX_REQUESTS_PER_MINUTE;
    s.enable_cache = DEFAULT_ENABLE_CACHE;
    s.cache_size = DEFAULT_CACHE_SIZE;
    s.debug_mode = false;
    s.production = false;
    s.upstream_url_base = DEFAULT_UPSTREAM_URL_BASE;
    return s;
}

void GatewaySettings::validate() const {
    if (port < 1 || port > 65535) {
        throw ConfigurationError("port out of range: " + std::to_string(port));
    }
    if (max_retries < 0) {
        throw ConfigurationError("max_retries must not be negative");
    }
    if (request_timeout_ms <= 0) {
        throw ConfigurationError("request_timeout must be positive");
    }
    if (backoff_base_ms < 0 || backoff_cap_ms < backoff_base_ms) {
        throw ConfigurationError("backoff cap must be at least the backoff base");
    }
    if (max_requests_per_minute <= 0) {
        throw ConfigurationError("max_requests_per_minute must be positive");
    }
    if (upstream_url_base.empty()) {
        throw ConfigurationError("upstream_url_base must not be empty");
    }
}

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

GatewaySettings load_settings_file(const std::string& path, GatewaySettings base) {
    if (!std::filesystem::exists(path)) {
        throw ConfigurationError("config file not found: " + path);
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("cannot open config file: " + path);
    }

    try {
        json j;
        file >> j;

        base.listen_address = j.value("listen_address", base.listen_address);
        base.port = j.value("port", base.port);
        base.max_retries = j.value("max_retries", base.max_retries);
        base.request_timeout_ms = j.value("request_timeout_ms", base.request_timeout_ms);
        base.backoff_base_ms = j.value("backoff_base_ms", base.backoff_base_ms);
        base.backoff_cap_ms = j.value("backoff_cap_ms", base.backoff_cap_ms);
        base.max_requests_per_minute = j.value("max_requests_per_minute", base.max_requests_per_minute);
        base.enable_cache = j.value("enable_cache", base.enable_cache);
        base.cache_size = j.value("cache_size", base.cache_size);
        base.debug_mode = j.value("debug_mode", base.debug_mode);
        base.production = j.value("production", base.production);
        base.upstream_url_base = j.value("upstream_url_base", base.upstream_url_base);

        return base;
    } catch (const json::exception& e) {
        throw ConfigurationError("invalid config file " + path + ": " + e.what());
    }
}

// Parses a whole string as a number, rejecting trailing garbage.
static std::optional<long> parse_long(const std::string& text) {
    if (text.empty()) return std::nullopt;
    try {
        size_t consumed = 0;
        long value = std::stol(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

static void override_number(const EnvLookup& lookup, const char* name, long& target) {
    auto raw = lookup(name);
    if (!raw) return;
    auto parsed = parse_long(*raw);
    if (!parsed) {
        Logger::instance().info(std::string("Ignoring invalid ") + name + "=" + *raw);
        return;
    }
    target = *parsed;
}

void apply_env_overrides(GatewaySettings& settings, const EnvLookup& lookup) {
    if (auto v = lookup(env::LISTEN_ADDRESS)) settings.listen_address = *v;
    if (auto v = lookup(env::UPSTREAM_URL_BASE)) settings.upstream_url_base = *v;
    if (auto v = lookup(env::API_KEY)) settings.api_key = *v;

    long port = settings.port;
    long retries = settings.max_retries;
    long rpm = settings.max_requests_per_minute;
    long cache_size = static_cast<long>(settings.cache_size);
    override_number(lookup, env::PORT, port);
    override_number(lookup, env::MAX_RETRIES, retries);
    override_number(lookup, env::REQUEST_TIMEOUT, settings.request_timeout_ms);
    override_number(lookup, env::BACKOFF_BASE, settings.backoff_base_ms);
    override_number(lookup, env::BACKOFF_CAP, settings.backoff_cap_ms);
    override_number(lookup, env::MAX_REQUESTS_PER_MINUTE, rpm);
    override_number(lookup, env::CACHE_SIZE, cache_size);
    settings.port = static_cast<int>(port);
    settings.max_retries = static_cast<int>(retries);
    settings.max_requests_per_minute = static_cast<int>(rpm);
    settings.cache_size = static_cast<size_t>(std::max(0L, cache_size));

    // Cache stays on unless explicitly disabled; debug stays off unless explicitly enabled.
    if (auto v = lookup(env::ENABLE_CACHE)) settings.enable_cache = (*v != "false");
    if (auto v = lookup(env::DEBUG_MODE)) settings.debug_mode = (*v == "true");
    if (auto v = lookup(env::ENVIRONMENT)) settings.production = (*v == "production");
}

std::string describe_settings(const GatewaySettings& settings) {
    json j = {
        {"listen_address", settings.listen_address},
        {"port", settings.port},
        {"max_retries", settings.max_retries},
        {"request_timeout_ms", settings.request_timeout_ms},
        {"backoff_base_ms", settings.backoff_base_ms},
        {"backoff_cap_ms", settings.backoff_cap_ms},
        {"max_requests_per_minute", settings.max_requests_per_minute},
        {"enable_cache", settings.enable_cache},
        {"cache_size", settings.cache_size},
        {"debug_mode", settings.debug_mode},
        {"production", settings.production},
        {"upstream_url_base", settings.upstream_url_base},
        {"api_key_configured", !settings.api_key.empty()}
    };
    return j.dump();
}

} // namespace relay
