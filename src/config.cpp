#include "config.hpp"
#include "provider.hpp"
#include "util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace hookgate {

nlohmann::json Config::defaults_json() {
    return {
        {"host", "0.0.0.0"},
        {"port", 5000},
        {"debug", false},
        {"secret_key", "change-me"},
        {"max_body", 1048576},
        {"max_connections", 64},
        {"providers", {
            {"github", {{"secret", ""}}}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

bool parse_bool_flag(const std::string& value) {
    std::string v = to_lower(trim(value));
    return v == "true" || v == "1" || v == "yes";
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("host") && j["host"].is_string())
        cfg.host = j["host"].get<std::string>();
    if (j.contains("port") && j["port"].is_number_unsigned()) {
        auto p = j["port"].get<uint32_t>();
        if (p > 0 && p <= 65535) cfg.port = static_cast<uint16_t>(p);
    }
    if (j.contains("debug") && j["debug"].is_boolean())
        cfg.debug = j["debug"].get<bool>();
    if (j.contains("secret_key") && j["secret_key"].is_string())
        cfg.secret_key = j["secret_key"].get<std::string>();
    if (j.contains("max_body") && j["max_body"].is_number_unsigned())
        cfg.max_body = j["max_body"].get<uint32_t>();
    if (j.contains("max_connections") && j["max_connections"].is_number_unsigned())
        cfg.max_connections = j["max_connections"].get<uint32_t>();

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderSettings settings;
            if (obj.contains("secret") && obj["secret"].is_string())
                settings.secret = obj["secret"].get<std::string>();
            cfg.providers[name] = std::move(settings);
        }
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    nlohmann::json j = defaults_json();

    if (!path.empty()) {
        std::ifstream file(path);
        if (file.is_open()) {
            try {
                j = merge_defaults(nlohmann::json::parse(file), defaults_json());
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "[config] Ignoring malformed config " << path
                          << ": " << e.what() << "\n";
                j = defaults_json();
            }
        } else {
            std::cerr << "[config] Config file not found, using defaults: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("HOST"))
        host = v;
    if (const char* v = std::getenv("PORT")) {
        uint64_t p = 0;
        if (parse_unsigned(trim(v), 65535, p) && p > 0) {
            port = static_cast<uint16_t>(p);
        } else {
            std::cerr << "[config] Ignoring invalid PORT: " << v << "\n";
        }
    }
    if (const char* v = std::getenv("DEBUG"))
        debug = parse_bool_flag(v);
    if (const char* v = std::getenv("SECRET_KEY"))
        secret_key = v;
    if (const char* v = std::getenv("HOOKGATE_MAX_BODY")) {
        uint64_t n = 0;
        if (parse_unsigned(trim(v), UINT32_MAX, n)) {
            max_body = static_cast<uint32_t>(n);
        } else {
            std::cerr << "[config] Ignoring invalid HOOKGATE_MAX_BODY: " << v << "\n";
        }
    }

    // Per-provider secrets, e.g. GITHUB_WEBHOOK_SECRET
    for (const auto& name : ProviderRegistry::instance().names()) {
        std::string var;
        for (char c : name) var += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        var += "_WEBHOOK_SECRET";
        if (const char* v = std::getenv(var.c_str()))
            providers[name].secret = v;
    }
}

std::string Config::secret_for(const std::string& provider) const {
    auto it = providers.find(provider);
    if (it != providers.end()) return it->second.secret;
    return {};
}

std::string Config::listen_addr() const {
    return host + ":" + std::to_string(port);
}

} // namespace hookgate
