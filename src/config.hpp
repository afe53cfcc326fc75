#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace hookgate {

struct ProviderSettings {
    std::string secret; // empty = signature verification disabled
};

struct Config {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    bool debug = false;
    std::string secret_key = "change-me";
    uint32_t max_body = 1048576;      // 1 MiB
    uint32_t max_connections = 64;    // in-flight handler threads

    std::unordered_map<std::string, ProviderSettings> providers;

    // Load defaults, merge the JSON file at path (if it exists), then apply
    // environment overrides. An empty path skips the file.
    static Config load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build from an already-merged JSON document (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Apply HOST, PORT, DEBUG, SECRET_KEY, HOOKGATE_MAX_BODY and
    // <PROVIDER>_WEBHOOK_SECRET from the environment
    void apply_env_overrides();

    // Shared secret for a provider name (empty if none)
    std::string secret_for(const std::string& provider) const;

    // "host:port"
    std::string listen_addr() const;
};

// Accepts "true"/"1"/"yes" (any case) as true
bool parse_bool_flag(const std::string& value);

} // namespace hookgate
