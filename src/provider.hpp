#pragma once
#include "payload.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <mutex>

namespace hookgate {

enum class EventKind { Push, PullRequest, Other };

const char* event_kind_name(EventKind kind);

// Header conventions and event table of one webhook sender.
struct ProviderSpec {
    std::string name;              // route segment: /webhook/<name>
    std::string display_name;      // used in response messages
    std::string event_header;      // lower-case, e.g. "x-github-event"
    std::string signature_header;  // lower-case, e.g. "x-hub-signature-256"
    std::string delivery_header;   // lower-case, optional
    std::unordered_map<std::string, EventKind> events;
};

// One request on a named-provider route.
struct ProviderEvent {
    std::string provider;
    std::optional<std::string> event_type;
    std::optional<std::string> signature;
    std::optional<std::string> delivery_id;
    Payload payload;
};

// Registry of known providers. Populated at static-init time by
// ProviderRegistrar objects; read-only afterwards. All methods are thread-safe.
class ProviderRegistry {
public:
    static ProviderRegistry& instance();

    void register_provider(ProviderSpec spec);

    // Copy of the spec, or nullopt for unknown names
    std::optional<ProviderSpec> find(const std::string& name) const;

    bool has_provider(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    ProviderRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderSpec> providers_;
};

struct ProviderRegistrar {
    explicit ProviderRegistrar(ProviderSpec spec) {
        ProviderRegistry::instance().register_provider(std::move(spec));
    }
};

} // namespace hookgate
