#pragma once

/**
 * Service table for the generic reverse proxy.
 *
 * Generic services map an alias under /api/ to an upstream host (optionally
 * with a base path). Special services own a path prefix and have a
 * dedicated handler.
 */

#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace relay::proxy {

// Alias to "host[/base-path]", in listing order.
inline const std::vector<std::pair<std::string, std::string>> GENERIC_SERVICES = {
    {"discord", "discord.com/api"},
    {"telegram", "api.telegram.org"},
    {"httpbin", "httpbin.org"},
    {"openai", "api.openai.com"},
    {"claude", "api.anthropic.com"},
    {"gemini", "generativelanguage.googleapis.com"},
    {"gemininothink", "generativelanguage.googleapis.com"},
    {"meta", "www.meta.ai/api"},
    {"groq", "api.groq.com/openai"},
    {"xai", "api.x.ai"},
    {"cohere", "api.cohere.ai"},
    {"huggingface", "api-inference.huggingface.co"},
    {"together", "api.together.xyz"},
    {"novita", "api.novita.ai"},
    {"portkey", "api.portkey.ai"},
    {"fireworks", "api.fireworks.ai"},
    {"targon", "api.targon.com"},
    {"openrouter", "openrouter.ai/api"},
    {"siliconflow", "api.siliconflow.cn"},
    {"modelscope", "api-inference.modelscope.cn"},
    {"gmi", "api.gmi-serving.com"},
    {"azureinference", "models.inference.ai.azure.com"},
    {"githubai", "models.github.ai/inference"},
    {"dmxcom", "www.dmxapi.com"},
    {"dmxcn", "www.dmxapi.cn"}
};

struct SpecialService {
    std::string alias;
    std::string path_prefix;
    std::vector<std::string> models;
};

// Special services, matched by path prefix before the generic proxy.
const std::vector<SpecialService>& special_services();

// Request headers never forwarded upstream (CDN, tracing and client address headers).
inline const std::unordered_set<std::string> BLACKLISTED_HEADERS = {
    "cf-connecting-ip", "cf-ipcountry", "cf-ray", "cf-visitor", "cf-worker",
    "cdn-loop", "cf-ew-via", "baggage", "sb-request-id", "x-amzn-trace-id",
    "x-forwarded-for", "x-forwarded-host", "x-forwarded-proto", "x-forwarded-server",
    "x-real-ip", "x-original-host", "forwarded", "via", "referer",
    "x-request-id", "x-correlation-id", "x-trace-id"
};

// Connection-level headers that the transport and server set themselves.
inline const std::unordered_set<std::string> HOP_BY_HOP_HEADERS = {
    "host", "connection", "keep-alive", "proxy-connection", "transfer-encoding",
    "te", "trailer", "upgrade", "content-length", "accept-encoding"
};

std::optional<std::string> find_service_host(const std::string& alias);

// Returns the special service whose prefix `path` starts with, if any.
const SpecialService* find_special_service(const std::string& path);

} // namespace relay::proxy
