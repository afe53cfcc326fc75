#pragma once
#include "http_server.hpp"
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace hookgate {

struct ResponseEnvelope {
    std::string status;     // "success", "error" or "healthy"
    std::string message;
    std::string timestamp;  // ISO 8601 UTC
    std::optional<nlohmann::json> data;

    nlohmann::json to_json() const;
};

enum class OutcomeKind {
    Success,
    MalformedPayload,
    InvalidSignature,
    NotFound,
    MethodNotAllowed,
    PayloadTooLarge,
    InternalFailure
};

struct Outcome {
    OutcomeKind kind = OutcomeKind::InternalFailure;
    std::string message;
    std::optional<nlohmann::json> data; // used on Success only

    static Outcome success(std::string message, std::optional<nlohmann::json> data = std::nullopt);
    static Outcome failure(OutcomeKind kind, std::string message);
};

// Envelope and status are always produced together.
struct BuiltResponse {
    ResponseEnvelope envelope;
    int http_status = 500;
};

int http_status_for(OutcomeKind kind);

BuiltResponse build_response(const Outcome& outcome);

BuiltResponse build_health();

HttpResponse to_http_response(const BuiltResponse& built);

} // namespace hookgate
