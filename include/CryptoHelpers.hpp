#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace CryptoHelpers {
    // HMAC-SHA256 of `message` keyed with `key`, raw 32 bytes
    std::vector<uint8_t> hmacSha256(const std::string& key, const std::string& message);

    // Helper: base64 encode/decode
    std::string base64Encode(const std::vector<uint8_t>& data);
    std::vector<uint8_t> base64Decode(const std::string& b64);

    // URL-safe alphabet, no padding. Decode returns false on characters outside the alphabet.
    std::string base64UrlEncode(const std::vector<uint8_t>& data);
    std::string base64UrlEncode(const std::string& data);
    bool base64UrlDecode(const std::string& b64url, std::string& out);

    // Compare without early exit
    bool constTimeEqual(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

    // `n` random bytes from the OS pool, hex encoded (lowercase)
    std::string randomHex(size_t n);
}
