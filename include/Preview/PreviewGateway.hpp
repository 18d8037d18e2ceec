#pragma once
#include "StorageBackend.hpp"
#include "StorageResolver.hpp"
#include "Preview/PreviewToken.hpp"
#include "Preview/StepPreviewService.hpp"
#include <memory>
#include <string>
#include <vector>

namespace CadPreview {

// Who is asking, as established by the trusted front proxy.
struct CallerIdentity {
    std::string userId;
    bool privileged = false;

    bool authenticated() const { return !userId.empty(); }
};

struct PreviewRequest {
    std::string token;
    std::string bucket;
    std::string path;
    std::string kind;
    std::string disposition; // "inline" (default) | "attachment"
    std::string previewAs;   // "original" (default) | "stl_preview"
};

struct PreviewResponse {
    int status = 200;
    std::string contentType;
    std::string contentDisposition;
    std::string cacheControl = "no-store";
    std::vector<uint8_t> body;
    std::string errorReason; // set on failures
    std::string requestId;

    bool isError() const { return status >= 400; }
};

struct GatewayOptions {
    uint64_t maxPreviewBytes = 50ull * 1024ull * 1024ull;
};

// Validates a preview grant, fetches (or converts) the object and shapes the response.
// Transport independent: the HTTP server only maps requests in and responses out.
class PreviewGateway {
public:
    PreviewGateway(std::shared_ptr<StorageBackend> storage,
                   std::shared_ptr<const PreviewTokenIssuer> tokens,
                   std::shared_ptr<const StorageResolver> resolver,
                   std::shared_ptr<StepPreviewService> stepPreviews,
                   GatewayOptions options = {});

    PreviewResponse handle(const PreviewRequest& request, const CallerIdentity& caller);

    // `inline; filename="name"` with quotes removed from the name
    static std::string contentDisposition(const std::string& disposition, const std::string& filename);

private:
    PreviewResponse error(int status, const std::string& reason, const std::string& rid, const std::string& detail = std::string()) const;

    std::shared_ptr<StorageBackend> storage_;
    std::shared_ptr<const PreviewTokenIssuer> tokens_;
    std::shared_ptr<const StorageResolver> resolver_;
    std::shared_ptr<StepPreviewService> stepPreviews_;
    GatewayOptions options_;
};

} // namespace CadPreview
