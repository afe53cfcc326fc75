#pragma once
#include "provider.hpp"
#include "payload.hpp"
#include <string>

namespace hookgate {

enum class RouteKind { Health, Generic, NamedProvider, NotFound };

struct Route {
    RouteKind kind = RouteKind::NotFound;
    std::string provider;          // set for NamedProvider
    bool method_allowed = false;   // false -> 405 on a known path
};

// Map method + path to a route. Paths:
//   GET  /                   Health
//   POST /webhook            Generic
//   POST /webhook/<name>     NamedProvider (name not checked against the registry)
Route resolve_route(const std::string& method, const std::string& path);

// Read the provider's event-type, signature and delivery headers.
// Empty header values are treated as absent.
ProviderEvent read_provider_event(const ProviderSpec& spec,
                                  const HeaderMap& headers,
                                  Payload payload);

} // namespace hookgate
