#pragma once
#include "StorageBackend.hpp"
#include "Preview/StepConverter.hpp"
#include <memory>
#include <string>

namespace CadPreview {

struct StepPreviewResult {
    bool ok = false;
    bool cacheHit = false;
    int status = 200;      // HTTP status to report on failure
    std::string error;     // machine reason on failure
    std::vector<uint8_t> stl;
    StorageKey previewKey;
};

// Serves STL approximations of STEP sources, cached in the preview bucket.
class StepPreviewService {
public:
    StepPreviewService(std::shared_ptr<StorageBackend> storage, std::shared_ptr<StepConverter> converter,
                       std::string previewBucket = "cad_previews", uint64_t maxSourceBytes = 50ull * 1024ull * 1024ull);

    // step-previews/<bucket>/<path without .step/.stp>.stl
    static std::string previewPathFor(const StorageKey& source);

    StepPreviewResult fetchOrConvert(const StorageKey& source, const std::string& requestId);

private:
    std::shared_ptr<StorageBackend> storage_;
    std::shared_ptr<StepConverter> converter_;
    std::string previewBucket_;
    uint64_t maxSourceBytes_;
};

} // namespace CadPreview
