#pragma once
#include <StorageBackend.hpp>
#include <filesystem>
#include <string>
#include <mutex>

namespace CadPreview {

// Buckets are directories under `root`; object paths are relative files inside them.
class LocalStorageBackend : public StorageBackend
{
public:
    explicit LocalStorageBackend(std::filesystem::path root);
    ~LocalStorageBackend() override = default;

    StorageResult get(const StorageKey &key) override;
    StorageResult put(const StorageKey &key, const std::vector<uint8_t> &data, const std::string &contentType) override;
    std::vector<StorageListEntry> list(const std::string &bucket, const std::string &prefix, std::string *outError = nullptr) override;

    const std::filesystem::path &root() const { return root_; }

private:
    // Empty path when the key would escape the bucket directory.
    std::filesystem::path resolveKey(const StorageKey &key) const;

    std::filesystem::path root_;
    std::mutex mtx;
};

} // namespace CadPreview
