#pragma once
#include <StorageBackend.hpp>
#include <string>
#include <vector>

namespace CadPreview {

// Object storage REST client using libcurl
// - GET    {base}/storage/v1/object/{bucket}/{path}
// - POST   {base}/storage/v1/object/{bucket}/{path}   (x-upsert: true)
// - POST   {base}/storage/v1/object/list/{bucket}     (JSON body with prefix)
// Authenticates with the service key as both `apikey` and bearer token.
class HttpStorageBackend : public StorageBackend
{
public:
    HttpStorageBackend(std::string baseUrl, std::string serviceKey);
    ~HttpStorageBackend() override;

    void setTimeoutSeconds(long seconds) { timeoutSeconds_ = seconds; }

    StorageResult get(const StorageKey &key) override;
    StorageResult put(const StorageKey &key, const std::vector<uint8_t> &data, const std::string &contentType) override;
    std::vector<StorageListEntry> list(const std::string &bucket, const std::string &prefix, std::string *outError = nullptr) override;

private:
    struct Response {
        long httpCode = 0;
        std::string body;
        std::string contentType;
        std::string curlError; // empty on success
        bool ok() const { return curlError.empty() && (httpCode >= 200 && httpCode < 300); }
    };

    Response perform(const std::string &method, const std::string &url, const std::vector<std::string> &headers, const std::string *payload);
    std::string objectUrl(const StorageKey &key) const;

    std::string baseUrl_;
    std::string serviceKey_;
    long timeoutSeconds_ = 30;

    static bool curlInitialized_;
};

} // namespace CadPreview
