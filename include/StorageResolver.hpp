#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace CadPreview {

// One uploaded-file reference as stored by the marketplace. `fields` holds only the
// storage columns that were present and non-null for this row.
struct FileRecord {
    std::string table; // "files" | "uploads"
    std::string quoteId;
    std::optional<std::string> fileId;
    std::optional<std::string> declaredFilename;
    std::optional<std::string> mime;
    std::map<std::string, std::string> fields;

    std::string field(const std::string& name) const;
};

// A (bucket column, path column) pair tried when resolving a record.
// An empty bucketField means the pair carries a path only.
struct FieldPairCandidate {
    std::string name;
    std::string bucketField;
    std::string pathField;
};

struct StorageProvenance {
    std::string table;
    std::string candidate;
    std::string bucketField;
    std::string pathField;
    bool bucketFromPathPrefix = false;
    bool bucketFromDefault = false;
};

struct StorageIdentity {
    std::string bucket;
    std::string path;
    std::optional<std::string> declaredFilename;
    StorageProvenance provenance;

    // Declared filename, else the path's last segment.
    std::string displayName() const;
};

struct ResolverConfig {
    std::vector<FieldPairCandidate> candidates;
    std::vector<std::string> allowedBuckets;
    std::map<std::string, std::string> bucketAliases; // alias -> canonical
    // Used only when neither a bucket column nor the path prefix names a bucket. Empty disables.
    std::string defaultBucket;

    static ResolverConfig defaults();
};

// storage_path pairs first (canonical bucket, legacy bucket, none), then the same for file_path.
std::vector<FieldPairCandidate> defaultFieldPairs();

class StorageResolver {
public:
    explicit StorageResolver(ResolverConfig config = ResolverConfig::defaults());

    // Null when no usable path exists or the bucket is not allowed.
    std::optional<StorageIdentity> resolve(const FileRecord& record) const;

    // Bucket alias folding + path cleanup + allow-list check. Idempotent.
    std::optional<StorageIdentity> normalize(const std::string& bucket, const std::string& path) const;

    std::string canonicalBucket(const std::string& bucket) const;
    bool isAllowedBucket(const std::string& bucket) const;

    const ResolverConfig& config() const { return config_; }

private:
    std::string stripBucketPrefix(const std::string& bucket, const std::string& path) const;

    ResolverConfig config_;
};

// One row of the preview list for a quote.
struct DeclaredFileMatch {
    std::string label;
    std::optional<size_t> candidateIndex; // into the candidates passed to matchDeclaredFiles
    bool extra = false;                   // storage row that matched no declared name
};

// Candidate names for matching: declaredFilename, else the last segment of the
// first path column present, in `fieldPairs` order.
std::vector<DeclaredFileMatch> matchDeclaredFiles(const std::vector<std::string>& declaredNames,
                                                  const std::vector<FileRecord>& candidates,
                                                  const std::vector<FieldPairCandidate>& fieldPairs = defaultFieldPairs());

// Declared names of a quote: file_names + upload_file_names, else the single file_name.
std::vector<std::string> extractDeclaredNames(const std::vector<std::string>& fileNames,
                                              const std::vector<std::string>& uploadFileNames,
                                              const std::string& fileName);

} // namespace CadPreview
