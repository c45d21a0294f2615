#pragma once

#include <string>

namespace stockguard {
namespace signature {

/**
 * Lowercase hex HMAC-SHA256 of `payload` keyed with `secret`.
 */
std::string hmac_sha256_hex(const std::string& secret, const std::string& payload);

/**
 * Check a provider signature against the payload in constant time.
 * An empty secret or signature never verifies.
 */
bool verify(const std::string& secret, const std::string& payload, const std::string& signature);

} // namespace signature
} // namespace stockguard
