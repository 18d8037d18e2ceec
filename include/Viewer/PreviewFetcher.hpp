#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

namespace CadPreview {

struct FetchResponse {
    long status = 0;
    std::string transportError; // empty when the request completed
    std::vector<uint8_t> body;
    std::map<std::string, std::string> headers; // lower-cased names
    bool exceededLimit = false; // body was cut off at the byte ceiling
    bool cancelled = false;

    bool ok() const { return transportError.empty() && !cancelled && status >= 200 && status < 300; }
    std::string header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string() : it->second;
    }
    std::string bodyText() const { return std::string(body.begin(), body.end()); }
};

class PreviewFetcher {
public:
    using CancelCheck = std::function<bool()>;
    virtual ~PreviewFetcher() = default;
    // maxBytes == 0 disables the ceiling. Implementations stop reading once the
    // ceiling is passed and set exceededLimit.
    virtual FetchResponse fetch(const std::string& url, size_t maxBytes, const CancelCheck& isCancelled) = 0;
};

class CurlPreviewFetcher : public PreviewFetcher {
public:
    explicit CurlPreviewFetcher(long timeoutSeconds = 60);

    void setDefaultHeaders(const std::vector<std::string>& headers) { defaultHeaders_ = headers; }

    FetchResponse fetch(const std::string& url, size_t maxBytes, const CancelCheck& isCancelled) override;

private:
    long timeoutSeconds_;
    std::vector<std::string> defaultHeaders_;
    static bool curlInitialized_;
};

// filename*=UTF-8''... wins over filename="..." / filename=...; empty when absent.
std::string parseFilenameFromContentDisposition(const std::string& header);

} // namespace CadPreview
