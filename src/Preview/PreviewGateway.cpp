#include "Preview/PreviewGateway.hpp"
#include "CadKind.hpp"
#include "CryptoHelpers.hpp"
#include "stringUtils.hpp"
#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace CadPreview {

PreviewGateway::PreviewGateway(std::shared_ptr<StorageBackend> storage,
                               std::shared_ptr<const PreviewTokenIssuer> tokens,
                               std::shared_ptr<const StorageResolver> resolver,
                               std::shared_ptr<StepPreviewService> stepPreviews,
                               GatewayOptions options)
    : storage_(std::move(storage)), tokens_(std::move(tokens)), resolver_(std::move(resolver)),
      stepPreviews_(std::move(stepPreviews)), options_(options) {}

std::string PreviewGateway::contentDisposition(const std::string& disposition, const std::string& filename){
    std::string safe;
    for(char c : filename){
        if(c == '"' || c == '\r' || c == '\n') continue;
        safe.push_back(c);
    }
    if(safe.empty()) safe = "file";
    return disposition + "; filename=\"" + safe + "\"";
}

PreviewResponse PreviewGateway::error(int status, const std::string& reason, const std::string& rid, const std::string& detail) const {
    PreviewResponse r;
    r.status = status;
    r.errorReason = reason;
    r.requestId = rid;
    r.contentType = "application/json";
    nlohmann::json j = {{"ok", false}, {"error", reason}, {"requestId", rid}};
    if(!detail.empty()) j["reason"] = detail;
    std::string s = j.dump();
    r.body.assign(s.begin(), s.end());
    PLOGI << "[cad-preview] rid=" << rid << " stage=response status=" << status << " error=" << reason
          << (detail.empty() ? std::string() : " detail=" + detail);
    return r;
}

PreviewResponse PreviewGateway::handle(const PreviewRequest& req, const CallerIdentity& caller){
    const std::string rid = CryptoHelpers::randomHex(4);
    const std::string token = trimCopy(req.token);
    const std::string disposition = toLowerCopy(trimCopy(req.disposition)) == "attachment" ? "attachment" : "inline";
    const bool wantsStlPreview = toLowerCopy(trimCopy(req.previewAs)) == "stl_preview";

    PLOGI << "[cad-preview] rid=" << rid << " stage=hit hasToken=" << !token.empty() << " disposition=" << disposition
          << " user=" << (caller.authenticated() ? caller.userId : std::string("-"));

    if(token.empty() && trimCopy(req.bucket).empty() && trimCopy(req.path).empty())
        return error(400, "missing_token", rid);
    if(!caller.authenticated())
        return error(401, "unauthorized", rid);

    std::string bucket, path, tokenFilename;
    if(!token.empty()){
        TokenVerifyResult v = tokens_->verifyFor(token, caller.userId, req.bucket, req.path);
        if(!v.ok) return error(401, "invalid_token", rid, v.reason);
        bucket = v.payload.bucket;
        path = v.payload.path;
        if(v.payload.filename) tokenFilename = *v.payload.filename;
        PLOGI << "[cad-preview] rid=" << rid << " stage=token_decoded bucket=" << bucket << " path=" << path
              << " quote=" << v.payload.quoteId.value_or("-");
    } else {
        if(!caller.privileged) return error(403, "forbidden", rid);
        bucket = trimCopy(req.bucket);
        path = trimCopy(req.path);
    }

    if(bucket.empty() || path.empty()) return error(400, "missing_bucket_or_path", rid);
    auto id = resolver_->normalize(bucket, path);
    if(!id) return error(400, resolver_->isAllowedBucket(resolver_->canonicalBucket(bucket)) ? "missing_bucket_or_path" : "bucket_not_allowed", rid);
    StorageKey key{id->bucket, id->path};

    std::optional<CadKind> kind = trimCopy(req.kind).empty() ? std::nullopt : parseCadKind(req.kind);
    if(!kind){
        auto c = classifyCadFile(key.path);
        if(c.ok) kind = c.kind;
    }
    // downloads do not need a renderable kind
    if(!kind && disposition != "attachment") return error(400, "unsupported_kind", rid);

    const std::string baseName = tokenFilename.empty() ? lastPathSegment(key.path) : lastPathSegment(tokenFilename);

    if(kind && *kind == CadKind::STEP && wantsStlPreview){
        if(!stepPreviews_) return error(502, "step_preview_unavailable", rid);
        StepPreviewResult sp = stepPreviews_->fetchOrConvert(key, rid);
        if(!sp.ok) return error(sp.status, sp.error, rid);
        if(sp.stl.size() > options_.maxPreviewBytes) return error(413, "file_too_large", rid);
        PreviewResponse r;
        r.requestId = rid;
        r.contentType = contentTypeFor(CadKind::STEP, true);
        r.contentDisposition = contentDisposition(disposition, stripExtension(baseName) + ".stl");
        r.body = std::move(sp.stl);
        PLOGI << "[cad-preview] rid=" << rid << " stage=response status=200 bytes=" << r.body.size() << " cacheHit=" << sp.cacheHit;
        return r;
    }

    PLOGI << "[cad-preview] rid=" << rid << " stage=storage_download_start bucket=" << key.bucket << " path=" << key.path;
    StorageResult obj = storage_->get(key);
    if(!obj.ok){
        PLOGW << "[cad-preview] rid=" << rid << " stage=storage_download_failed error=" << obj.error;
        return error(obj.notFound ? 404 : 502, obj.notFound ? "source_not_found" : "storage_unavailable", rid);
    }
    if(obj.data.size() > options_.maxPreviewBytes) return error(413, "file_too_large", rid);
    if(obj.data.empty()) return error(502, "empty_object", rid);

    PreviewResponse r;
    r.requestId = rid;
    r.contentType = kind ? contentTypeFor(*kind, false) : std::string("application/octet-stream");
    r.contentDisposition = contentDisposition(disposition, baseName);
    r.body = std::move(obj.data);
    PLOGI << "[cad-preview] rid=" << rid << " stage=response status=200 kind=" << (kind ? cadKindName(*kind) : "unknown")
          << " bytes=" << r.body.size();
    return r;
}

} // namespace CadPreview
