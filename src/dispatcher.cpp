#include "dispatcher.hpp"

namespace hookgate {

EventKind classify_event(const ProviderSpec& spec, const std::optional<std::string>& event_type) {
    if (!event_type || event_type->empty()) return EventKind::Other;
    auto it = spec.events.find(*event_type);
    return it != spec.events.end() ? it->second : EventKind::Other;
}

EventDispatcher::EventDispatcher(Logger& logger)
    : logger_(logger)
{
    handlers_[EventKind::Push] = [this](const ProviderEvent& ev) {
        logger_.info(ev.provider, "Processing push event");
    };
    handlers_[EventKind::PullRequest] = [this](const ProviderEvent& ev) {
        logger_.info(ev.provider, "Processing pull request event");
    };
}

void EventDispatcher::set_handler(EventKind kind, Handler handler) {
    if (kind == EventKind::Other) return; // Other is always the unhandled branch
    handlers_[kind] = std::move(handler);
}

DispatchOutcome EventDispatcher::dispatch(const ProviderSpec& spec,
                                          const ProviderEvent& event) const {
    DispatchOutcome outcome;
    outcome.kind = classify_event(spec, event.event_type);

    if (outcome.kind == EventKind::Other) {
        if (event.event_type) {
            logger_.info(spec.name, "Unhandled " + spec.display_name + " event: " + *event.event_type);
            outcome.message = spec.display_name + " " + *event.event_type +
                              " event received (unhandled)";
        } else {
            logger_.info(spec.name, "Unhandled " + spec.display_name + " event: no event type");
            outcome.message = spec.display_name +
                              " event received without event type (unhandled)";
        }
        return outcome;
    }

    auto it = handlers_.find(outcome.kind);
    if (it != handlers_.end() && it->second) {
        it->second(event);
    }
    outcome.handled = true;
    outcome.message = spec.display_name + " " + *event.event_type + " event processed";
    return outcome;
}

} // namespace hookgate
