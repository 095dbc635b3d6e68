#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace bastion {

// FNV-1a 64-bit - deterministic, cross-platform stable.
// Used for Tier-2 sampling so the same decision_id always lands in the same bucket.
inline uint64_t fnv1a64(std::string_view s) noexcept {
    uint64_t hash = 14695981039346656037ULL;  // FNV offset basis
    for (char c : s) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 1099511628211ULL;  // FNV prime
    }
    return hash;
}

// Lowercase hex SHA-256 digest (OpenSSL EVP). Empty string on digest failure.
std::string sha256Hex(std::string_view data);

} // namespace bastion
