#pragma once
#include <memory>
#include <optional>
#include <string>

namespace hookgate {

// Checks a provider's signature header against the raw request body.
class SignatureVerifier {
public:
    virtual ~SignatureVerifier() = default;

    // signature is the header value as sent, or nullopt if the header was absent
    virtual bool verify(const std::string& body,
                        const std::optional<std::string>& signature) const = 0;

    virtual std::string scheme() const = 0;
};

// GitHub-style "sha256=<hex HMAC-SHA256(secret, body)>"
class HmacSha256Verifier : public SignatureVerifier {
public:
    explicit HmacSha256Verifier(std::string secret);

    bool verify(const std::string& body,
                const std::optional<std::string>& signature) const override;

    std::string scheme() const override { return "sha256"; }

private:
    std::string secret_;
};

// Lower-case hex HMAC-SHA256 digest. Throws std::runtime_error if OpenSSL fails.
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

// Constant-time comparison for equal-length strings; strings of different
// length compare unequal immediately.
bool constant_time_equals(const std::string& a, const std::string& b);

// Factory: null when secret is empty (verification disabled)
std::unique_ptr<SignatureVerifier> make_verifier(const std::string& secret);

} // namespace hookgate
