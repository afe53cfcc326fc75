#include "gateway.hpp"
#include "router.hpp"
#include "util.hpp"

namespace hookgate {

Gateway::Gateway(const Config& config, Logger& logger)
    : logger_(logger)
    , dispatcher_(logger)
{
    for (const auto& name : ProviderRegistry::instance().names()) {
        auto verifier = make_verifier(config.secret_for(name));
        if (verifier) {
            logger_.info("gateway", "Signature verification enabled for " + name +
                         " (" + verifier->scheme() + ")");
            verifiers_[name] = std::move(verifier);
        }
    }
}

void Gateway::set_verifier(const std::string& provider,
                           std::unique_ptr<SignatureVerifier> verifier) {
    if (verifier) {
        verifiers_[provider] = std::move(verifier);
    } else {
        verifiers_.erase(provider);
    }
}

nlohmann::json Gateway::summarize_payload(const Payload& payload) {
    return {
        {"received_at", timestamp_now()},
        {"payload_size", payload_to_json(payload).dump().size()},
        {"payload_type", payload_type_name(payload)}
    };
}

HttpResponse Gateway::handle(const HttpRequest& req) const {
    BuiltResponse built;
    try {
        built = route_request(req);
    } catch (const std::exception& e) {
        logger_.error("gateway", std::string("Unexpected failure: ") + e.what());
        built = build_response(Outcome::failure(OutcomeKind::InternalFailure,
                                                "Internal server error"));
    } catch (...) {
        logger_.error("gateway", "Unexpected failure: unknown exception");
        built = build_response(Outcome::failure(OutcomeKind::InternalFailure,
                                                "Internal server error"));
    }

    logger_.info("gateway", req.method + " " + sanitize_utf8(req.path) + " -> " +
                 std::to_string(built.http_status));
    return to_http_response(built);
}

HttpResponse Gateway::reject(int status) const {
    OutcomeKind kind = OutcomeKind::InternalFailure;
    std::string message = "Internal server error";
    if (status == 400) {
        kind = OutcomeKind::MalformedPayload;
        message = "Malformed request";
    } else if (status == 413) {
        kind = OutcomeKind::PayloadTooLarge;
        message = "Payload too large";
    }

    BuiltResponse built = build_response(Outcome::failure(kind, message));
    if (status == 503) {
        built.http_status = 503;
        built.envelope.message = "Server busy";
    }
    return to_http_response(built);
}

BuiltResponse Gateway::route_request(const HttpRequest& req) const {
    Route route = resolve_route(req.method, req.path);

    switch (route.kind) {
        case RouteKind::NotFound:
            return build_response(Outcome::failure(OutcomeKind::NotFound, "Not Found"));
        case RouteKind::Health:
            if (!route.method_allowed) break;
            return build_health();
        case RouteKind::Generic:
            if (!route.method_allowed) break;
            return handle_generic(req);
        case RouteKind::NamedProvider: {
            auto spec = ProviderRegistry::instance().find(route.provider);
            if (!spec) {
                logger_.warn("gateway", "Unknown webhook provider: " + sanitize_utf8(route.provider));
                return build_response(Outcome::failure(OutcomeKind::NotFound,
                                                       "Unknown webhook provider"));
            }
            if (!route.method_allowed) break;
            return handle_provider(*spec, req);
        }
    }
    return build_response(Outcome::failure(OutcomeKind::MethodNotAllowed, "Method Not Allowed"));
}

BuiltResponse Gateway::handle_generic(const HttpRequest& req) const {
    std::string content_type = req.header("content-type");
    logger_.info("webhook", "Webhook received from IP: " + req.remote_addr);
    logger_.info("webhook", "Content-Type: " + sanitize_utf8(content_type));
    if (logger_.enabled(LogLevel::Debug)) {
        nlohmann::json headers(req.headers);
        logger_.debug("webhook", "Headers: " + headers.dump(-1, ' ', false,
                      nlohmann::json::error_handler_t::replace));
    }

    Payload payload;
    try {
        payload = decode_payload(req.headers, req.body);
    } catch (const MalformedPayload& e) {
        logger_.error("webhook", std::string("Invalid JSON in webhook payload: ") + e.what());
        return build_response(Outcome::failure(OutcomeKind::MalformedPayload,
                                               "Invalid JSON format"));
    }

    if (logger_.enabled(LogLevel::Debug)) {
        logger_.debug("webhook", "Webhook payload: " + payload_to_json(payload).dump(2));
    }

    return build_response(Outcome::success("Webhook processed successfully",
                                           summarize_payload(payload)));
}

BuiltResponse Gateway::handle_provider(const ProviderSpec& spec, const HttpRequest& req) const {
    try {
        auto vit = verifiers_.find(spec.name);
        if (vit != verifiers_.end()) {
            auto sig_it = req.headers.find(spec.signature_header);
            std::optional<std::string> signature;
            if (sig_it != req.headers.end()) signature = sig_it->second;
            if (!vit->second->verify(req.body, signature)) {
                logger_.warn(spec.name, "Rejected " + spec.display_name +
                             " webhook from " + req.remote_addr + ": bad signature");
                return build_response(Outcome::failure(OutcomeKind::InvalidSignature,
                                                       "Invalid signature"));
            }
        }

        Payload payload;
        try {
            payload = decode_payload(req.headers, req.body);
        } catch (const MalformedPayload& e) {
            logger_.error(spec.name, std::string("Invalid JSON in webhook payload: ") + e.what());
            return build_response(Outcome::failure(OutcomeKind::MalformedPayload,
                                                   "Invalid JSON format"));
        }

        ProviderEvent event = read_provider_event(spec, req.headers, std::move(payload));
        logger_.info(spec.name, spec.display_name + " webhook event: " +
                     event.event_type.value_or("(none)"));
        logger_.debug(spec.name, std::string("Signature header ") +
                      (event.signature ? "present" : "absent") +
                      ", delivery " + event.delivery_id.value_or("(none)"));

        DispatchOutcome outcome = dispatcher_.dispatch(spec, event);

        nlohmann::json data = {
            {"provider", spec.name},
            {"event_type", nullptr},
            {"handled", outcome.handled}
        };
        if (event.event_type) data["event_type"] = *event.event_type;

        return build_response(Outcome::success(outcome.message, std::move(data)));
    } catch (const std::exception& e) {
        logger_.error(spec.name, "Error processing " + spec.display_name + " webhook: " + e.what());
        return build_response(Outcome::failure(OutcomeKind::InternalFailure,
                                               "Failed to process " + spec.display_name +
                                               " webhook"));
    }
}

} // namespace hookgate
