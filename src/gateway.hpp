#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "envelope.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "payload.hpp"
#include "provider.hpp"
#include "signature.hpp"
#include <memory>
#include <string>
#include <unordered_map>

namespace hookgate {

// Per-request pipeline: decode -> route -> dispatch -> build response.
// handle() never throws; every request yields exactly one envelope and
// one status code. Safe to call concurrently.
class Gateway {
public:
    Gateway(const Config& config, Logger& logger);

    HttpResponse handle(const HttpRequest& req) const;

    // Response for requests the transport rejects before handle() runs
    HttpResponse reject(int status) const;

    // Install or replace the verifier for a provider (nullptr disables it).
    // Not synchronized with handle(); configure before serving.
    void set_verifier(const std::string& provider, std::unique_ptr<SignatureVerifier> verifier);

    EventDispatcher& dispatcher() { return dispatcher_; }

    // {received_at, payload_size, payload_type}
    static nlohmann::json summarize_payload(const Payload& payload);

private:
    BuiltResponse route_request(const HttpRequest& req) const;
    BuiltResponse handle_generic(const HttpRequest& req) const;
    BuiltResponse handle_provider(const ProviderSpec& spec, const HttpRequest& req) const;

    Logger& logger_;
    EventDispatcher dispatcher_;
    std::unordered_map<std::string, std::unique_ptr<SignatureVerifier>> verifiers_;
};

} // namespace hookgate
