#include "stockguard/signature.hpp"

#include <iomanip>
#include <sstream>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace stockguard {
namespace signature {

std::string hmac_sha256_hex(const std::string& secret, const std::string& payload) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    HMAC(EVP_sha256(),
         secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
         digest, &digest_len);

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

bool verify(const std::string& secret, const std::string& payload, const std::string& signature) {
    if (secret.empty() || signature.empty()) return false;

    std::string expected = hmac_sha256_hex(secret, payload);
    if (expected.size() != signature.size()) return false;
    return CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

} // namespace signature
} // namespace stockguard
