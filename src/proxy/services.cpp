#include "services.hpp"
#include "../gemini/protocol.hpp"
#include <algorithm>

namespace relay::proxy {

const std::vector<SpecialService>& special_services() {
    static const std::vector<SpecialService> services = [] {
        SpecialService anti;
        anti.alias = gemini::SPECIAL_SERVICE_ALIAS;
        anti.path_prefix = gemini::SPECIAL_PATH_PREFIX;
        anti.models = {gemini::TARGET_MODELS.begin(), gemini::TARGET_MODELS.end()};
        std::sort(anti.models.rbegin(), anti.models.rend());
        return std::vector<SpecialService>{anti};
    }();
    return services;
}

std::optional<std::string> find_service_host(const std::string& alias) {
    for (const auto& [name, host] : GENERIC_SERVICES) {
        if (name == alias) {
            return host;
        }
    }
    return std::nullopt;
}

const SpecialService* find_special_service(const std::string& path) {
    for (const auto& service : special_services()) {
        if (path.compare(0, service.path_prefix.size(), service.path_prefix) == 0) {
            return &service;
        }
    }
    return nullptr;
}

} // namespace relay::proxy
