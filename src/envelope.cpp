#include "envelope.hpp"
#include "util.hpp"

namespace hookgate {

nlohmann::json ResponseEnvelope::to_json() const {
    nlohmann::json j = {
        {"status", status},
        {"message", message},
        {"timestamp", timestamp}
    };
    if (data) j["data"] = *data;
    return j;
}

Outcome Outcome::success(std::string message, std::optional<nlohmann::json> data) {
    Outcome o;
    o.kind = OutcomeKind::Success;
    o.message = std::move(message);
    o.data = std::move(data);
    return o;
}

Outcome Outcome::failure(OutcomeKind kind, std::string message) {
    Outcome o;
    o.kind = kind;
    o.message = std::move(message);
    return o;
}

int http_status_for(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success:          return 200;
        case OutcomeKind::MalformedPayload: return 400;
        case OutcomeKind::InvalidSignature: return 401;
        case OutcomeKind::NotFound:         return 404;
        case OutcomeKind::MethodNotAllowed: return 405;
        case OutcomeKind::PayloadTooLarge:  return 413;
        case OutcomeKind::InternalFailure:  return 500;
    }
    return 500;
}

BuiltResponse build_response(const Outcome& outcome) {
    BuiltResponse built;
    built.http_status = http_status_for(outcome.kind);
    built.envelope.status = (outcome.kind == OutcomeKind::Success) ? "success" : "error";
    built.envelope.message = outcome.message;
    built.envelope.timestamp = timestamp_now();
    if (outcome.kind == OutcomeKind::Success) {
        built.envelope.data = outcome.data;
    }
    return built;
}

BuiltResponse build_health() {
    BuiltResponse built;
    built.http_status = 200;
    built.envelope.status = "healthy";
    built.envelope.message = "Webhook gateway is running";
    built.envelope.timestamp = timestamp_now();
    return built;
}

HttpResponse to_http_response(const BuiltResponse& built) {
    return {built.http_status, "application/json", built.envelope.to_json().dump()};
}

} // namespace hookgate
