#include "StorageResolver.hpp"
#include "stringUtils.hpp"
#include <plog/Log.h>
#include <algorithm>

namespace CadPreview {

std::string FileRecord::field(const std::string& name) const {
    auto it = fields.find(name);
    if(it == fields.end()) return std::string();
    return trimCopy(it->second);
}

std::string StorageIdentity::displayName() const {
    if(declaredFilename && !trimCopy(*declaredFilename).empty()) return trimCopy(*declaredFilename);
    return lastPathSegment(path);
}

std::vector<FieldPairCandidate> defaultFieldPairs(){
    // path column decides first, then bucket column
    return {
        {"canonical", "storage_bucket_id", "storage_path"},
        {"canonical_path_legacy_bucket", "bucket_id", "storage_path"},
        {"canonical_path_only", "", "storage_path"},
        {"legacy", "bucket_id", "file_path"},
        {"legacy_path_canonical_bucket", "storage_bucket_id", "file_path"},
        {"legacy_path_only", "", "file_path"},
    };
}

ResolverConfig ResolverConfig::defaults(){
    ResolverConfig c;
    c.candidates = defaultFieldPairs();
    c.allowedBuckets = {"cad_uploads", "cad_previews"};
    c.bucketAliases = {{"cad-uploads", "cad_uploads"}, {"cad-previews", "cad_previews"}};
    return c;
}

StorageResolver::StorageResolver(ResolverConfig config) : config_(std::move(config)) {
    if(config_.candidates.empty()) config_.candidates = defaultFieldPairs();
}

std::string StorageResolver::canonicalBucket(const std::string& bucket) const {
    std::string b = trimCopy(bucket);
    auto it = config_.bucketAliases.find(b);
    if(it != config_.bucketAliases.end()) return it->second;
    return b;
}

bool StorageResolver::isAllowedBucket(const std::string& bucket) const {
    if(bucket.empty()) return false;
    return std::find(config_.allowedBuckets.begin(), config_.allowedBuckets.end(), bucket) != config_.allowedBuckets.end();
}

std::string StorageResolver::stripBucketPrefix(const std::string& bucket, const std::string& path) const {
    std::vector<std::string> spellings{bucket};
    for(const auto& kv : config_.bucketAliases){
        if(kv.second == bucket) spellings.push_back(kv.first);
    }
    std::string p = path;
    bool changed = true;
    while(changed && !p.empty()){
        changed = false;
        for(const auto& s : spellings){
            if(p == s){ p.clear(); changed = true; break; }
            if(startsWith(p, s + "/")){
                p = stripLeadingSlashes(collapseSlashes(p.substr(s.size() + 1)));
                changed = true;
                break;
            }
        }
    }
    return p;
}

std::optional<StorageIdentity> StorageResolver::normalize(const std::string& bucket, const std::string& path) const {
    std::string b = canonicalBucket(bucket);
    if(!isAllowedBucket(b)) return std::nullopt;
    std::string p = collapseSlashes(stripLeadingSlashes(trimCopy(path)));
    p = stripBucketPrefix(b, p);
    if(p.empty()) return std::nullopt;
    StorageIdentity out;
    out.bucket = b;
    out.path = p;
    return out;
}

std::optional<StorageIdentity> StorageResolver::resolve(const FileRecord& record) const {
    const FieldPairCandidate* chosen = nullptr;
    std::string rawBucket, rawPath;
    for(const auto& cand : config_.candidates){
        std::string p = record.field(cand.pathField);
        if(p.empty()) continue;
        std::string b;
        if(!cand.bucketField.empty()){
            b = record.field(cand.bucketField);
            if(b.empty()) continue;
        }
        chosen = &cand;
        rawBucket = b;
        rawPath = p;
        break;
    }
    if(!chosen){
        PLOGW << "StorageResolver: no storage fields on " << record.table << " record quote=" << record.quoteId
              << " file=" << record.fileId.value_or("");
        return std::nullopt;
    }

    StorageProvenance prov;
    prov.table = record.table;
    prov.candidate = chosen->name;
    prov.bucketField = chosen->bucketField;
    prov.pathField = chosen->pathField;

    std::string bucket = canonicalBucket(rawBucket);
    std::string path = collapseSlashes(stripLeadingSlashes(rawPath));
    if(bucket.empty()){
        auto segments = splitPath(path);
        if(!segments.empty()){
            std::string fromPath = canonicalBucket(segments.front());
            if(isAllowedBucket(fromPath)){
                bucket = fromPath;
                prov.bucketFromPathPrefix = true;
            }
        }
        if(bucket.empty() && !config_.defaultBucket.empty()){
            bucket = canonicalBucket(config_.defaultBucket);
            prov.bucketFromDefault = true;
            PLOGI << "StorageResolver: using default bucket " << bucket << " for quote=" << record.quoteId << " path=" << path;
        }
    }
    if(bucket.empty()){
        PLOGW << "StorageResolver: no bucket for " << record.table << " record quote=" << record.quoteId << " path=" << path;
        return std::nullopt;
    }

    auto id = normalize(bucket, path);
    if(!id){
        PLOGW << "StorageResolver: rejected bucket=" << bucket << " path=" << path << " via " << chosen->name;
        return std::nullopt;
    }
    id->declaredFilename = record.declaredFilename;
    id->provenance = prov;
    PLOGV << "StorageResolver: " << record.table << " -> " << id->bucket << ":" << id->path << " via " << chosen->name;
    return id;
}

static std::string candidatePath(const FileRecord& record, const std::vector<FieldPairCandidate>& pairs){
    for(const auto& pair : pairs){
        std::string p = record.field(pair.pathField);
        if(!p.empty()) return p;
    }
    return std::string();
}

static std::string candidateLabel(const FileRecord& record, const std::vector<FieldPairCandidate>& pairs){
    if(record.declaredFilename && !trimCopy(*record.declaredFilename).empty()) return trimCopy(*record.declaredFilename);
    std::string base = lastPathSegment(candidatePath(record, pairs));
    return base.empty() ? std::string("file") : base;
}

static bool candidateMatches(const FileRecord& record, const std::string& name, const std::vector<FieldPairCandidate>& pairs){
    std::string target = trimCopy(name);
    if(target.empty()) return false;
    if(record.declaredFilename && equalsIgnoreCase(trimCopy(*record.declaredFilename), target)) return true;
    std::string base = lastPathSegment(candidatePath(record, pairs));
    return !base.empty() && equalsIgnoreCase(base, target);
}

std::vector<DeclaredFileMatch> matchDeclaredFiles(const std::vector<std::string>& declaredNames,
                                                  const std::vector<FileRecord>& candidates,
                                                  const std::vector<FieldPairCandidate>& fieldPairs){
    std::vector<DeclaredFileMatch> out;
    std::vector<bool> claimed(candidates.size(), false);

    if(declaredNames.empty()){
        for(size_t i = 0; i < candidates.size(); ++i){
            DeclaredFileMatch m;
            m.label = candidateLabel(candidates[i], fieldPairs);
            m.candidateIndex = i;
            out.push_back(std::move(m));
        }
        return out;
    }

    for(const auto& name : declaredNames){
        DeclaredFileMatch m;
        m.label = trimCopy(name);
        for(size_t i = 0; i < candidates.size(); ++i){
            if(claimed[i]) continue;
            if(candidateMatches(candidates[i], name, fieldPairs)){
                claimed[i] = true;
                m.candidateIndex = i;
                break;
            }
        }
        out.push_back(std::move(m));
    }
    for(size_t i = 0; i < candidates.size(); ++i){
        if(claimed[i]) continue;
        DeclaredFileMatch m;
        m.label = candidateLabel(candidates[i], fieldPairs);
        m.candidateIndex = i;
        m.extra = true;
        out.push_back(std::move(m));
    }
    return out;
}

std::vector<std::string> extractDeclaredNames(const std::vector<std::string>& fileNames,
                                              const std::vector<std::string>& uploadFileNames,
                                              const std::string& fileName){
    std::vector<std::string> out;
    for(const auto& n : fileNames){ std::string t = trimCopy(n); if(!t.empty()) out.push_back(t); }
    for(const auto& n : uploadFileNames){ std::string t = trimCopy(n); if(!t.empty()) out.push_back(t); }
    if(out.empty()){
        std::string t = trimCopy(fileName);
        if(!t.empty()) out.push_back(t);
    }
    return out;
}

} // namespace CadPreview
