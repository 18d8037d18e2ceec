#pragma once
#include "CadKind.hpp"
#include "StorageBackend.hpp"
#include "StorageResolver.hpp"
#include "Preview/PreviewGateway.hpp"
#include "Preview/PreviewToken.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace CadPreview {

// One preview row shown for a quote.
struct PreviewEntry {
    std::string id;
    std::string label;
    std::string fileName;
    std::string previewUrl;  // inline, empty when no grant could be made
    std::string downloadUrl; // attachment
    std::optional<CadKind> cadKind;
    ClassifyFailure classifyFailure = ClassifyFailure::None;
    std::optional<StorageIdentity> storage;
    std::string fallbackMessage;
    bool extra = false;

    nlohmann::json toJSON() const;
};

struct CatalogOptions {
    std::string previewEndpoint = "/preview";
    int64_t ttlSeconds = 60 * 60;
    // List the object's directory after signing and log whether the object is there.
    bool probeOnSign = false;
};

// Builds the preview rows for one page render: matches declared names to storage
// rows, resolves each, classifies it and signs a grant for the viewer.
class PreviewCatalog {
public:
    PreviewCatalog(std::shared_ptr<const StorageResolver> resolver,
                   std::shared_ptr<const PreviewTokenIssuer> tokens,
                   std::shared_ptr<StorageBackend> storage = nullptr,
                   CatalogOptions options = {});

    std::vector<PreviewEntry> build(const std::string& quoteId,
                                    const std::vector<std::string>& declaredNames,
                                    const std::vector<FileRecord>& records,
                                    const CallerIdentity& viewer) const;

    static const char* previewUnavailableMessage();

private:
    std::string buildUrl(const std::string& token, const StorageIdentity& id, const std::optional<CadKind>& kind,
                         const std::string& disposition) const;
    void probe(const StorageIdentity& id) const;

    std::shared_ptr<const StorageResolver> resolver_;
    std::shared_ptr<const PreviewTokenIssuer> tokens_;
    std::shared_ptr<StorageBackend> storage_;
    CatalogOptions options_;
};

} // namespace CadPreview
