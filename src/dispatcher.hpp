#pragma once
#include "provider.hpp"
#include "log.hpp"
#include <string>
#include <functional>
#include <map>

namespace hookgate {

struct DispatchOutcome {
    EventKind kind = EventKind::Other;
    bool handled = false;
    std::string message;
};

// Look up event_type in the provider's event table. Missing, empty and
// unlisted types all classify as Other.
EventKind classify_event(const ProviderSpec& spec, const std::optional<std::string>& event_type);

// Routes provider events to per-kind handlers. Every event type maps to
// exactly one kind; Other is accepted and reported as unhandled.
class EventDispatcher {
public:
    using Handler = std::function<void(const ProviderEvent&)>;

    explicit EventDispatcher(Logger& logger);

    // Default handlers capture this
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Replace the handler for Push or PullRequest. Exceptions thrown by a
    // handler propagate to the caller.
    void set_handler(EventKind kind, Handler handler);

    DispatchOutcome dispatch(const ProviderSpec& spec, const ProviderEvent& event) const;

private:
    Logger& logger_;
    std::map<EventKind, Handler> handlers_;
};

} // namespace hookgate
