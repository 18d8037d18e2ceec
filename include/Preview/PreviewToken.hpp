#pragma once
#include <string>
#include <optional>
#include <functional>
#include <cstdint>

namespace CadPreview {

// Grant to read exactly one (bucket, path) as one user until `exp`.
struct PreviewTokenPayload {
    std::string userId;
    std::string bucket;
    std::string path;
    int64_t exp = 0; // unix seconds
    // audit context, not checked
    std::optional<std::string> quoteId;
    std::optional<std::string> fileId;
    std::optional<std::string> filename;
};

enum class TokenError { None, Malformed, BadSignature, Expired, UserMismatch, BucketMismatch, PathMismatch };

struct TokenVerifyResult {
    bool ok = false;
    TokenError error = TokenError::None;
    std::string reason; // token_format, token_signature, token_payload, token_expired, ...
    PreviewTokenPayload payload;
};

const char* tokenErrorName(TokenError error);

// Signs and verifies preview tokens:
//   base64url(json payload) "." base64url(HMAC-SHA256(secret, encoded payload))
class PreviewTokenIssuer {
public:
    using Clock = std::function<int64_t()>;

    explicit PreviewTokenIssuer(std::string secret, int64_t defaultTtlSeconds = 60 * 60, Clock clock = {});

    // Fails when userId/bucket/path are empty, the secret is empty, or exp is not in the future.
    bool sign(const PreviewTokenPayload& payload, std::string& outToken, std::string* outError = nullptr) const;

    // Stamps exp = now + ttl (default ttl when ttlSeconds <= 0) and signs.
    bool issue(PreviewTokenPayload payload, std::string& outToken, int64_t ttlSeconds = 0, std::string* outError = nullptr) const;

    TokenVerifyResult verify(const std::string& token) const;

    // verify() plus binding to the calling user. Empty expected values are not checked.
    TokenVerifyResult verifyFor(const std::string& token, const std::string& userId,
                                const std::string& bucket = std::string(), const std::string& path = std::string()) const;

    int64_t now() const;
    int64_t defaultTtlSeconds() const { return defaultTtl_; }

private:
    std::string secret_;
    int64_t defaultTtl_;
    Clock clock_;
};

} // namespace CadPreview
