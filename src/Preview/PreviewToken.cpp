#include "Preview/PreviewToken.hpp"
#include "CryptoHelpers.hpp"
#include "stringUtils.hpp"
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <chrono>

namespace CadPreview {

const char* tokenErrorName(TokenError error){
    switch(error){
        case TokenError::None: return "none";
        case TokenError::Malformed: return "malformed";
        case TokenError::BadSignature: return "bad_signature";
        case TokenError::Expired: return "expired";
        case TokenError::UserMismatch: return "user_mismatch";
        case TokenError::BucketMismatch: return "bucket_mismatch";
        case TokenError::PathMismatch: return "path_mismatch";
    }
    return "malformed";
}

static TokenVerifyResult fail(TokenError error, const char* reason){
    TokenVerifyResult r;
    r.ok = false;
    r.error = error;
    r.reason = reason;
    return r;
}

static std::string normalizeTokenPath(const std::string& p){ return stripLeadingSlashes(trimCopy(p)); }

PreviewTokenIssuer::PreviewTokenIssuer(std::string secret, int64_t defaultTtlSeconds, Clock clock)
    : secret_(std::move(secret)), defaultTtl_(defaultTtlSeconds > 0 ? defaultTtlSeconds : 60 * 60), clock_(std::move(clock)) {}

int64_t PreviewTokenIssuer::now() const {
    if(clock_) return clock_();
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

bool PreviewTokenIssuer::sign(const PreviewTokenPayload& payload, std::string& outToken, std::string* outError) const {
    if(secret_.empty()){
        if(outError) *outError = "missing_CAD_PREVIEW_TOKEN_SECRET";
        return false;
    }
    std::string uid = trimCopy(payload.userId);
    std::string bucket = trimCopy(payload.bucket);
    std::string path = normalizeTokenPath(payload.path);
    if(uid.empty() || bucket.empty() || path.empty() || payload.exp <= 0){
        if(outError) *outError = "invalid_preview_token_payload";
        return false;
    }
    if(payload.exp <= now()){
        if(outError) *outError = "preview_token_exp_not_in_future";
        return false;
    }

    bool extended = payload.quoteId || payload.fileId || payload.filename;
    nlohmann::json j;
    j["v"] = extended ? 2 : 1;
    j["uid"] = uid;
    j["b"] = bucket;
    j["p"] = path;
    j["exp"] = payload.exp;
    if(payload.quoteId) j["qid"] = *payload.quoteId;
    if(payload.fileId) j["fid"] = *payload.fileId;
    if(payload.filename) j["fn"] = *payload.filename;

    std::string payloadB64 = CryptoHelpers::base64UrlEncode(j.dump());
    std::string sigB64 = CryptoHelpers::base64UrlEncode(CryptoHelpers::hmacSha256(secret_, payloadB64));
    outToken = payloadB64 + "." + sigB64;
    return true;
}

bool PreviewTokenIssuer::issue(PreviewTokenPayload payload, std::string& outToken, int64_t ttlSeconds, std::string* outError) const {
    payload.exp = now() + (ttlSeconds > 0 ? ttlSeconds : defaultTtl_);
    return sign(payload, outToken, outError);
}

TokenVerifyResult PreviewTokenIssuer::verify(const std::string& token) const {
    std::string raw = trimCopy(token);
    auto dot = raw.find('.');
    if(raw.empty() || dot == std::string::npos || dot == 0 || dot + 1 >= raw.size() || raw.find('.', dot + 1) != std::string::npos)
        return fail(TokenError::Malformed, "token_format");
    if(secret_.empty()){
        PLOGE << "PreviewTokenIssuer: verify called without a secret";
        return fail(TokenError::BadSignature, "token_signature");
    }

    std::string payloadB64 = raw.substr(0, dot);
    std::string sigB64 = raw.substr(dot + 1);

    std::string sigRaw;
    if(!CryptoHelpers::base64UrlDecode(sigB64, sigRaw)) return fail(TokenError::Malformed, "token_format");
    std::vector<uint8_t> expected = CryptoHelpers::hmacSha256(secret_, payloadB64);
    std::vector<uint8_t> provided(sigRaw.begin(), sigRaw.end());
    if(!CryptoHelpers::constTimeEqual(expected, provided)) return fail(TokenError::BadSignature, "token_signature");

    std::string json;
    if(!CryptoHelpers::base64UrlDecode(payloadB64, json)) return fail(TokenError::Malformed, "token_payload_decode");
    nlohmann::json j = nlohmann::json::parse(json, nullptr, false);
    if(j.is_discarded() || !j.is_object()) return fail(TokenError::Malformed, "token_payload_decode");

    auto str = [&](const char* key) -> std::string {
        if(!j.contains(key) || !j[key].is_string()) return std::string();
        return j[key].get<std::string>();
    };
    int version = (j.contains("v") && j["v"].is_number_integer()) ? j["v"].get<int>() : 0;
    if(version != 1 && version != 2) return fail(TokenError::Malformed, "token_payload");
    if(!j.contains("exp") || !j["exp"].is_number()) return fail(TokenError::Malformed, "token_payload");

    TokenVerifyResult r;
    r.payload.userId = trimCopy(str("uid"));
    r.payload.bucket = trimCopy(str("b"));
    r.payload.path = normalizeTokenPath(str("p"));
    r.payload.exp = j["exp"].is_number_integer() ? j["exp"].get<int64_t>() : static_cast<int64_t>(j["exp"].get<double>());
    if(r.payload.userId.empty() || r.payload.bucket.empty() || r.payload.path.empty() || r.payload.exp <= 0)
        return fail(TokenError::Malformed, "token_payload");
    if(version == 2){
        if(j.contains("qid") && j["qid"].is_string()) r.payload.quoteId = j["qid"].get<std::string>();
        if(j.contains("fid") && j["fid"].is_string()) r.payload.fileId = j["fid"].get<std::string>();
        if(j.contains("fn") && j["fn"].is_string()) r.payload.filename = j["fn"].get<std::string>();
    }

    if(r.payload.exp < now()) return fail(TokenError::Expired, "token_expired");

    r.ok = true;
    return r;
}

TokenVerifyResult PreviewTokenIssuer::verifyFor(const std::string& token, const std::string& userId,
                                                const std::string& bucket, const std::string& path) const {
    TokenVerifyResult r = verify(token);
    if(!r.ok) return r;
    if(r.payload.userId != trimCopy(userId)) return fail(TokenError::UserMismatch, "token_user_mismatch");
    if(!trimCopy(bucket).empty() && r.payload.bucket != trimCopy(bucket)) return fail(TokenError::BucketMismatch, "token_bucket_mismatch");
    if(!normalizeTokenPath(path).empty() && r.payload.path != normalizeTokenPath(path)) return fail(TokenError::PathMismatch, "token_path_mismatch");
    return r;
}

} // namespace CadPreview
