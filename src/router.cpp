#include "router.hpp"
#include "util.hpp"

namespace hookgate {

Route resolve_route(const std::string& method, const std::string& path) {
    Route route;

    if (path == "/") {
        route.kind = RouteKind::Health;
        route.method_allowed = (method == "GET");
        return route;
    }

    if (path == "/webhook") {
        route.kind = RouteKind::Generic;
        route.method_allowed = (method == "POST");
        return route;
    }

    const std::string prefix = "/webhook/";
    if (path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0) {
        std::string name = path.substr(prefix.size());
        if (name.find('/') == std::string::npos) {
            route.kind = RouteKind::NamedProvider;
            route.provider = name;
            route.method_allowed = (method == "POST");
            return route;
        }
    }

    return route;
}

static std::optional<std::string> optional_header(const HeaderMap& headers,
                                                  const std::string& name) {
    if (name.empty()) return std::nullopt;
    auto it = headers.find(name);
    if (it == headers.end()) return std::nullopt;
    std::string value = trim(it->second);
    if (value.empty()) return std::nullopt;
    return sanitize_utf8(value);
}

ProviderEvent read_provider_event(const ProviderSpec& spec,
                                  const HeaderMap& headers,
                                  Payload payload) {
    ProviderEvent ev;
    ev.provider    = spec.name;
    ev.event_type  = optional_header(headers, spec.event_header);
    ev.signature   = optional_header(headers, spec.signature_header);
    ev.delivery_id = optional_header(headers, spec.delivery_header);
    ev.payload     = std::move(payload);
    return ev;
}

} // namespace hookgate
