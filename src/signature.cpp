#include "signature.hpp"
#include "util.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace hookgate {

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             digest, &digest_len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return hex_encode(digest, digest_len);
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

HmacSha256Verifier::HmacSha256Verifier(std::string secret)
    : secret_(std::move(secret))
{}

bool HmacSha256Verifier::verify(const std::string& body,
                                const std::optional<std::string>& signature) const {
    if (!signature) return false;

    std::string header = trim(*signature);
    const std::string prefix = "sha256=";
    if (header.compare(0, prefix.size(), prefix) != 0) return false;

    std::string expected = hmac_sha256_hex(secret_, body);
    return constant_time_equals(to_lower(header.substr(prefix.size())), expected);
}

std::unique_ptr<SignatureVerifier> make_verifier(const std::string& secret) {
    if (secret.empty()) return nullptr;
    return std::make_unique<HmacSha256Verifier>(secret);
}

} // namespace hookgate
