// StorageBackend.hpp - object store interface keyed by bucket + path
#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace CadPreview {

struct StorageKey
{
    std::string bucket;
    std::string path;

    // "bucket:path", used for caches
    std::string toString() const { return bucket + ":" + path; }
    bool operator==(const StorageKey &o) const { return bucket == o.bucket && path == o.path; }
};

struct StorageResult
{
    bool ok = false;
    bool notFound = false; // object missing, as opposed to a backend failure
    std::string error;
    std::vector<uint8_t> data;
    std::string contentType;

    std::string text() const { return std::string(data.begin(), data.end()); }
};

struct StorageListEntry
{
    std::string name;
    uint64_t size = 0;
};

class StorageBackend
{
public:
    virtual ~StorageBackend() = default;

    virtual StorageResult get(const StorageKey &key) = 0;

    // Upsert. Only the STEP preview cache writes.
    virtual StorageResult put(const StorageKey &key, const std::vector<uint8_t> &data, const std::string &contentType) = 0;

    // Entries directly under `prefix` (a directory-like path inside the bucket).
    virtual std::vector<StorageListEntry> list(const std::string &bucket, const std::string &prefix, std::string *outError = nullptr) = 0;
};

} // namespace CadPreview
