#include "Preview/StepPreviewService.hpp"
#include "stringUtils.hpp"
#include <plog/Log.h>

namespace CadPreview {

StepPreviewService::StepPreviewService(std::shared_ptr<StorageBackend> storage, std::shared_ptr<StepConverter> converter,
                                       std::string previewBucket, uint64_t maxSourceBytes)
    : storage_(std::move(storage)), converter_(std::move(converter)), previewBucket_(std::move(previewBucket)), maxSourceBytes_(maxSourceBytes) {}

std::string StepPreviewService::previewPathFor(const StorageKey& source){
    std::string path = source.path;
    std::string ext = fileExtension(path);
    if(ext == "step" || ext == "stp") path = stripExtension(path);
    return "step-previews/" + source.bucket + "/" + path + ".stl";
}

StepPreviewResult StepPreviewService::fetchOrConvert(const StorageKey& source, const std::string& rid){
    StepPreviewResult out;
    out.previewKey = StorageKey{previewBucket_, previewPathFor(source)};

    StorageResult cached = storage_->get(out.previewKey);
    if(cached.ok && looksLikeStl(cached.data)){
        PLOGI << "[cad-preview] rid=" << rid << " stage=step_preview_cache_hit key=" << out.previewKey.toString();
        out.ok = true;
        out.cacheHit = true;
        out.stl = std::move(cached.data);
        return out;
    }
    if(cached.ok) PLOGW << "[cad-preview] rid=" << rid << " stage=step_preview_cache_invalid key=" << out.previewKey.toString();

    PLOGI << "[cad-preview] rid=" << rid << " stage=storage_download_start bucket=" << source.bucket << " path=" << source.path;
    StorageResult src = storage_->get(source);
    if(!src.ok){
        PLOGW << "[cad-preview] rid=" << rid << " stage=storage_download_failed error=" << src.error;
        out.status = src.notFound ? 404 : 502;
        out.error = src.notFound ? "source_not_found" : "storage_unavailable";
        return out;
    }
    if(src.data.size() > maxSourceBytes_){
        out.status = 413;
        out.error = "file_too_large";
        return out;
    }

    if(!converter_ || !converter_->available()){
        PLOGW << "[cad-preview] rid=" << rid << " stage=convert_step_to_stl error=no_converter";
        out.status = 502;
        out.error = "step_preview_unavailable";
        return out;
    }
    StepConversionResult conv = converter_->convert(src.data, rid);
    if(!conv.ok){
        PLOGE << "[cad-preview] rid=" << rid << " stage=convert_step_to_stl error=" << conv.error;
        out.status = 502;
        out.error = "step_preview_unavailable";
        return out;
    }

    StorageResult up = storage_->put(out.previewKey, conv.stl, "model/stl");
    if(!up.ok) PLOGW << "[cad-preview] rid=" << rid << " stage=storage_upload error=" << up.error;
    else PLOGI << "[cad-preview] rid=" << rid << " stage=storage_upload key=" << out.previewKey.toString();

    out.ok = true;
    out.stl = std::move(conv.stl);
    return out;
}

} // namespace CadPreview
