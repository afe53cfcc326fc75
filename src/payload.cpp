#include "payload.hpp"
#include "util.hpp"

namespace hookgate {

Payload Payload::from_json(nlohmann::json value) {
    Payload p;
    p.kind = PayloadKind::Json;
    p.json = std::move(value);
    return p;
}

Payload Payload::from_raw(std::string text, std::optional<FormFields> fields) {
    Payload p;
    p.kind = PayloadKind::Raw;
    p.text = std::move(text);
    p.form_fields = std::move(fields);
    return p;
}

bool Payload::operator==(const Payload& other) const {
    if (kind != other.kind) return false;
    if (kind == PayloadKind::Json) return json == other.json;
    return text == other.text && form_fields == other.form_fields;
}

static std::string header_value(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

Payload decode_payload(const HeaderMap& headers, const std::string& body) {
    std::string content_type = header_value(headers, "content-type");

    if (contains_ci(content_type, "application/json")) {
        // Copying, comparing and dumping recurse per level; reject deep input
        // while parsing, before any of that runs.
        nlohmann::json::parser_callback_t depth_guard =
            [](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
                if ((event == nlohmann::json::parse_event_t::object_start ||
                     event == nlohmann::json::parse_event_t::array_start) &&
                    depth >= kMaxJsonDepth) {
                    throw MalformedPayload("JSON nesting exceeds " +
                                           std::to_string(kMaxJsonDepth) + " levels");
                }
                return true;
            };
        try {
            return Payload::from_json(nlohmann::json::parse(body, depth_guard));
        } catch (const nlohmann::json::parse_error& e) {
            throw MalformedPayload(e.what());
        }
    }

    std::optional<FormFields> fields;
    if (contains_ci(content_type, "application/x-www-form-urlencoded")) {
        auto parsed = parse_query_string(body);
        if (!parsed.empty()) {
            FormFields clean;
            for (auto& [key, value] : parsed)
                clean[sanitize_utf8(key)] = sanitize_utf8(value);
            fields = std::move(clean);
        }
    }

    return Payload::from_raw(sanitize_utf8(body), std::move(fields));
}

nlohmann::json payload_to_json(const Payload& payload) {
    if (payload.kind == PayloadKind::Json) return payload.json;

    nlohmann::json j = {
        {"raw_data", payload.text},
        {"form_data", nullptr}
    };
    if (payload.form_fields) {
        j["form_data"] = nlohmann::json::object();
        for (const auto& [key, value] : *payload.form_fields)
            j["form_data"][key] = value;
    }
    return j;
}

std::string payload_type_name(const Payload& payload) {
    if (payload.kind == PayloadKind::Raw)
        return payload.form_fields ? "form" : "raw";

    switch (payload.json.type()) {
        case nlohmann::json::value_t::object:          return "object";
        case nlohmann::json::value_t::array:           return "array";
        case nlohmann::json::value_t::string:          return "string";
        case nlohmann::json::value_t::boolean:         return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:    return "number";
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:       return "null";
    }
    return "null";
}

} // namespace hookgate
