#include "Preview/PreviewCatalog.hpp"
#include "stringUtils.hpp"
#include <plog/Log.h>
#include <map>

namespace CadPreview {

nlohmann::json PreviewEntry::toJSON() const {
    nlohmann::json j;
    j["id"] = id;
    j["label"] = label;
    j["fileName"] = fileName;
    j["previewUrl"] = previewUrl.empty() ? nlohmann::json() : nlohmann::json(previewUrl);
    j["downloadUrl"] = downloadUrl.empty() ? nlohmann::json() : nlohmann::json(downloadUrl);
    j["cadKind"] = cadKind ? nlohmann::json(cadKindName(*cadKind)) : nlohmann::json();
    if(!cadKind) j["classification"] = classifyFailureName(classifyFailure);
    if(storage){
        j["storage"] = {
            {"bucket", storage->bucket},
            {"path", storage->path},
            {"table", storage->provenance.table},
            {"fields", storage->provenance.candidate}
        };
    }
    j["fallbackMessage"] = fallbackMessage.empty() ? nlohmann::json() : nlohmann::json(fallbackMessage);
    j["extra"] = extra;
    return j;
}

const char* PreviewCatalog::previewUnavailableMessage(){ return "Preview not available for this file yet."; }

PreviewCatalog::PreviewCatalog(std::shared_ptr<const StorageResolver> resolver,
                               std::shared_ptr<const PreviewTokenIssuer> tokens,
                               std::shared_ptr<StorageBackend> storage,
                               CatalogOptions options)
    : resolver_(std::move(resolver)), tokens_(std::move(tokens)), storage_(std::move(storage)), options_(std::move(options)) {}

std::string PreviewCatalog::buildUrl(const std::string& token, const StorageIdentity& id, const std::optional<CadKind>& kind,
                                     const std::string& disposition) const {
    std::string url = options_.previewEndpoint + "?";
    if(!token.empty()) url += "token=" + urlEncode(token);
    else url += "bucket=" + urlEncode(id.bucket) + "&path=" + urlEncode(id.path);
    if(kind) url += std::string("&kind=") + cadKindName(*kind);
    url += "&disposition=" + disposition;
    if(kind && *kind == CadKind::STEP && disposition == "inline") url += "&previewAs=stl_preview";
    return url;
}

void PreviewCatalog::probe(const StorageIdentity& id) const {
    if(!storage_) return;
    auto slash = id.path.find_last_of('/');
    std::string prefix = slash == std::string::npos ? std::string() : id.path.substr(0, slash);
    std::string name = lastPathSegment(id.path);
    std::string err;
    auto entries = storage_->list(id.bucket, prefix, &err);
    if(!err.empty()){
        PLOGW << "PreviewCatalog: probe list failed bucket=" << id.bucket << " prefix=" << prefix << " error=" << err;
        return;
    }
    bool found = false;
    for(const auto& e : entries){ if(e.name == name){ found = true; break; } }
    if(found) PLOGD << "PreviewCatalog: probe found " << id.bucket << ":" << id.path;
    else PLOGW << "PreviewCatalog: probe did not find " << id.bucket << ":" << id.path << " (" << entries.size() << " entries under prefix)";
}

std::vector<PreviewEntry> PreviewCatalog::build(const std::string& quoteId,
                                                const std::vector<std::string>& declaredNames,
                                                const std::vector<FileRecord>& records,
                                                const CallerIdentity& viewer) const {
    struct Grant { std::string token; bool ok = false; };
    // bucket:path plus the audit fields the token carries; lives for this render only
    std::map<std::string, Grant> grants;

    std::vector<PreviewEntry> out;
    auto matches = matchDeclaredFiles(declaredNames, records, resolver_->config().candidates);
    for(size_t i = 0; i < matches.size(); ++i){
        const auto& m = matches[i];
        PreviewEntry e;
        e.id = quoteId + ":" + std::to_string(i);
        e.label = m.label;
        e.fileName = m.label;
        e.extra = m.extra;

        if(!m.candidateIndex){
            auto c = classifyCadFile(e.label);
            if(c.ok) e.cadKind = c.kind;
            else e.classifyFailure = c.failure;
            e.fallbackMessage = previewUnavailableMessage();
            out.push_back(std::move(e));
            continue;
        }

        const FileRecord& rec = records[*m.candidateIndex];
        if(rec.declaredFilename && !trimCopy(*rec.declaredFilename).empty()) e.fileName = trimCopy(*rec.declaredFilename);
        if(rec.fileId) e.id = *rec.fileId;

        auto id = resolver_->resolve(rec);
        if(!id){
            PLOGW << "PreviewCatalog: unresolved storage for quote=" << quoteId << " name=" << e.label;
            e.fallbackMessage = previewUnavailableMessage();
            out.push_back(std::move(e));
            continue;
        }
        e.storage = id;

        auto c = classifyCadFile(e.fileName);
        if(!c.ok) c = classifyCadFile(id->path);
        if(c.ok) e.cadKind = c.kind;
        else {
            e.classifyFailure = c.failure;
            e.fallbackMessage = "Preview is not available for this file type. You can still download it.";
        }

        StorageKey key{id->bucket, id->path};
        const std::string grantKey = key.toString() + "|" + rec.fileId.value_or("") + "|" + e.fileName;
        auto it = grants.find(grantKey);
        if(it == grants.end()){
            Grant g;
            if(viewer.authenticated()){
                PreviewTokenPayload p;
                p.userId = viewer.userId;
                p.bucket = id->bucket;
                p.path = id->path;
                p.quoteId = quoteId;
                p.fileId = rec.fileId;
                p.filename = e.fileName;
                std::string err;
                g.ok = tokens_->issue(p, g.token, options_.ttlSeconds, &err);
                if(!g.ok) PLOGE << "PreviewCatalog: could not sign preview token: " << err;
                else if(options_.probeOnSign) probe(*id);
            }
            it = grants.emplace(grantKey, g).first;
        }

        if(it->second.ok){
            if(e.cadKind) e.previewUrl = buildUrl(it->second.token, *id, e.cadKind, "inline");
            e.downloadUrl = buildUrl(it->second.token, *id, e.cadKind, "attachment");
        } else if(viewer.authenticated() && viewer.privileged){
            if(e.cadKind) e.previewUrl = buildUrl(std::string(), *id, e.cadKind, "inline");
            e.downloadUrl = buildUrl(std::string(), *id, e.cadKind, "attachment");
        } else if(e.fallbackMessage.empty()){
            e.fallbackMessage = previewUnavailableMessage();
        }
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace CadPreview
