#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace hookgate {

using FormFields = std::map<std::string, std::string>;
using HeaderMap  = std::map<std::string, std::string>; // names lower-cased

enum class PayloadKind { Json, Raw };

// Decoded request body. Exactly one representation is populated, selected by
// kind: `json` for Json, `text` + `form_fields` for Raw.
struct Payload {
    PayloadKind kind = PayloadKind::Raw;
    nlohmann::json json;
    std::string text;
    std::optional<FormFields> form_fields;

    static Payload from_json(nlohmann::json value);
    static Payload from_raw(std::string text, std::optional<FormFields> fields = std::nullopt);

    bool operator==(const Payload& other) const;
    bool operator!=(const Payload& other) const { return !(*this == other); }
};

// Maximum nesting of arrays and objects accepted in a JSON body
constexpr int kMaxJsonDepth = 256;

// Body declared as JSON but not parseable as JSON.
class MalformedPayload : public std::runtime_error {
public:
    explicit MalformedPayload(const std::string& what) : std::runtime_error(what) {}
};

// Decode a request body according to its Content-Type header.
// Throws MalformedPayload when the body claims JSON and fails to parse
// (an empty body is not valid JSON) or nests deeper than kMaxJsonDepth.
Payload decode_payload(const HeaderMap& headers, const std::string& body);

// JSON view of any payload. Raw payloads become
// {"raw_data": text, "form_data": {...} | null}.
nlohmann::json payload_to_json(const Payload& payload);

// Coarse type tag: "object", "array", "string", "number", "boolean", "null"
// for JSON payloads; "form" or "raw" otherwise.
std::string payload_type_name(const Payload& payload);

} // namespace hookgate
