#include "Viewer/ModelViewer.hpp"
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_set>

namespace CadPreview {

const char* viewerStatusName(ViewerStatus status){
    switch(status){
        case ViewerStatus::Idle: return "idle";
        case ViewerStatus::Loading: return "loading";
        case ViewerStatus::Ready: return "ready";
        case ViewerStatus::Error: return "error";
        case ViewerStatus::Unsupported: return "unsupported";
    }
    return "unknown";
}

const char* ModelViewer::genericFailureMessage(){ return "Unable to render this CAD file. You can still download it."; }
const char* ModelViewer::unsupportedMessage(){ return "Preview is not available for this file type. You can still download it."; }
const char* ModelViewer::noAccelerationMessage(){ return "3D acceleration is not available on this display. You can still download the file."; }

namespace {

using CancelTicket = std::shared_ptr<std::atomic<bool>>;

// Result of the off-thread part of a load (fetch, classify, parse).
struct LoadOutcome {
    uint64_t generation = 0;
    ViewerStatus status = ViewerStatus::Error;
    std::optional<CadKind> kind;
    std::string reason;
    std::string message;
    std::string fileName;
    std::unique_ptr<SceneNode> object;
};

struct PendingSlot {
    std::mutex mutex;
    std::unique_ptr<LoadOutcome> outcome;
};

std::string tooLargeMessage(size_t maxBytes){
    const size_t mb = maxBytes / (1024 * 1024);
    return "This CAD file is too large to safely render (over " + std::to_string(mb) + " MB). You can still download it.";
}

std::optional<CadKind> hintedKind(const ViewerSource& source){
    if(source.kind) return source.kind;
    for(const std::string* name : { &source.filenameOverride, &source.declaredFilename }){
        if(name->empty()) continue;
        CadClassification c = classifyCadFile(*name);
        if(c.ok) return c.kind;
    }
    return std::nullopt;
}

std::string errorFieldOf(const FetchResponse& resp){
    nlohmann::json j = nlohmann::json::parse(resp.bodyText(), nullptr, false);
    if(j.is_object() && j.contains("error") && j["error"].is_string()) return j["error"].get<std::string>();
    return std::string();
}

std::unique_ptr<LoadOutcome> failure(std::optional<CadKind> kind, const std::string& reason, const std::string& message){
    auto out = std::make_unique<LoadOutcome>();
    out->status = ViewerStatus::Error;
    out->kind = kind;
    out->reason = reason;
    out->message = message;
    return out;
}

// Returns null when the ticket was cancelled.
std::unique_ptr<LoadOutcome> runLoad(PreviewFetcher& fetcher, MeshParser& parser, const ViewerSource& source,
                                     size_t maxRenderBytes, const CancelTicket& ticket){
    const std::optional<CadKind> hint = hintedKind(source);
    const bool stepHint = hint && *hint == CadKind::STEP;
    auto cancelled = [&ticket](){ return ticket->load(); };

    FetchResponse resp = fetcher.fetch(source.url, maxRenderBytes, cancelled);
    if(cancelled() || resp.cancelled) return nullptr;

    const bool httpSuccess = resp.transportError.empty() && resp.status >= 200 && resp.status < 300;
    if(resp.exceededLimit && httpSuccess){
        PLOGW << "viewer: body over " << maxRenderBytes << " bytes, not parsing";
        return failure(hint, "file_too_large", tooLargeMessage(maxRenderBytes));
    }
    if(!resp.ok()){
        std::string bodyError = resp.transportError.empty() ? errorFieldOf(resp) : std::string();
        std::string reason;
        if(stepHint) reason = bodyError == "step_preview_unavailable" ? "step_preview_unavailable" : "failed_to_load_step_stl_preview";
        else if(bodyError == "invalid_token") reason = "access_denied";
        else reason = "fetch_failed";
        PLOGW << "viewer: fetch failed status=" << resp.status << " transport='" << resp.transportError << "' body_error='" << bodyError << "' reason=" << reason;
        return failure(hint, reason, ModelViewer::genericFailureMessage());
    }
    if(maxRenderBytes > 0 && resp.body.size() > maxRenderBytes){
        PLOGW << "viewer: body " << resp.body.size() << " bytes over " << maxRenderBytes << ", not parsing";
        return failure(hint, "file_too_large", tooLargeMessage(maxRenderBytes));
    }

    // classification: explicit kind > override > Content-Disposition > declared name
    std::optional<CadKind> kind = source.kind;
    std::string fileName;
    const std::string dispositionName = parseFilenameFromContentDisposition(resp.header("content-disposition"));
    for(const std::string* name : { &source.filenameOverride, &dispositionName, &source.declaredFilename }){
        if(name->empty()) continue;
        if(fileName.empty()) fileName = *name;
        if(kind) break;
        CadClassification c = classifyCadFile(*name);
        if(c.ok){ kind = c.kind; fileName = *name; break; }
    }
    if(!kind){
        auto out = std::make_unique<LoadOutcome>();
        out->status = ViewerStatus::Unsupported;
        out->reason = "unsupported_file_type";
        out->message = ModelViewer::unsupportedMessage();
        out->fileName = fileName;
        return out;
    }
    if(cancelled()) return nullptr;

    std::string parseError;
    std::unique_ptr<SceneNode> object = parser.parse(resp.body, *kind, fileName.empty() ? source.url : fileName, &parseError);
    if(cancelled()) return nullptr;
    if(!object){
        const bool step = *kind == CadKind::STEP;
        PLOGW << "viewer: parse failed kind=" << cadKindName(*kind) << " error='" << parseError << "'";
        auto out = failure(kind, step ? "failed_to_load_step_stl_preview" : "parse_failed", ModelViewer::genericFailureMessage());
        out->fileName = fileName;
        return out;
    }

    auto out = std::make_unique<LoadOutcome>();
    out->status = ViewerStatus::Ready;
    out->kind = kind;
    out->fileName = fileName;
    out->object = std::move(object);
    return out;
}

} // namespace

struct ModelViewer::Impl {
    std::shared_ptr<PreviewFetcher> fetcher;
    std::shared_ptr<MeshParser> parser;
    std::shared_ptr<RenderDevice> device;
    ViewerOptions options;
    StatusCallback callback;

    std::shared_ptr<PendingSlot> pending = std::make_shared<PendingSlot>();
    CancelTicket ticket;
    uint64_t generation = 0;

    ViewerSource source;
    ViewerState state;
    std::unique_ptr<SceneNode> object;
    std::unique_ptr<ViewerRig> rig;
    FitStateRegistry fitRegistry;
    int width = 800, height = 600;
    bool deviceInitialized = false;

    void publish(ViewerStatus status, const std::optional<CadKind>& kind, const std::string& reason, const std::string& message){
        state.status = status;
        state.cadKind = kind;
        state.errorReason = reason;
        state.message = message;
        state.downloadUrl = source.downloadUrl;
        PLOGI << "viewer: status=" << viewerStatusName(status)
              << " kind=" << (kind ? cadKindName(*kind) : "-")
              << (reason.empty() ? std::string() : " reason=" + reason);
        if(callback) callback(status, kind, reason);
    }

    void cancelInFlight(){
        if(ticket) ticket->store(true);
        ticket.reset();
        ++generation;
        std::lock_guard<std::mutex> l(pending->mutex);
        pending->outcome.reset();
    }

    // Every geometry and material reachable from the object is released once.
    void releaseObject(){
        if(!object) return;
        std::unordered_set<Geometry*> geometries;
        std::unordered_set<Material*> materials;
        object->traverse([&](SceneNode& n){
            for(auto& m : n.meshes){
                if(m.geometry) geometries.insert(m.geometry.get());
                if(m.material) materials.insert(m.material.get());
            }
        });
        for(Geometry* g : geometries){
            if(g->gpuHandle && device) device->releaseGeometry(g->gpuHandle);
            g->gpuHandle = 0;
        }
        for(Material* m : materials){
            if(m->gpuHandle && device) device->releaseMaterial(m->gpuHandle);
            m->gpuHandle = 0;
        }
        PLOGV << "viewer: released geometries=" << geometries.size() << " materials=" << materials.size();
        fitRegistry.forget(object.get());
        object.reset();
    }

    void teardown(){
        releaseObject();
        rig.reset();
    }

    bool upload(){
        bool ok = true;
        object->traverse([&](SceneNode& n){
            for(auto& m : n.meshes){
                if(!ok) return;
                if(m.geometry && m.geometry->gpuHandle == 0){
                    m.geometry->gpuHandle = device->uploadGeometry(*m.geometry);
                    if(m.geometry->gpuHandle == 0) ok = false;
                }
                if(m.material && m.material->gpuHandle == 0){
                    m.material->gpuHandle = device->createMaterial(*m.material);
                    if(m.material->gpuHandle == 0) ok = false;
                }
            }
        });
        return ok;
    }

    void apply(std::unique_ptr<LoadOutcome> outcome){
        state.fileName = outcome->fileName;
        if(outcome->status != ViewerStatus::Ready){
            publish(outcome->status, outcome->kind, outcome->reason, outcome->message);
            return;
        }

        teardown();
        std::string err;
        if(!deviceInitialized){
            if(!device->initialize(width, height, &err)){
                PLOGE << "viewer: render device init failed: " << err;
                publish(ViewerStatus::Error, outcome->kind, "no_3d_acceleration", noAccelerationMessage());
                return;
            }
            deviceInitialized = true;
        } else {
            device->resize(width, height);
        }

        object = std::move(outcome->object);
        const bool step = outcome->kind && *outcome->kind == CadKind::STEP;
        if(!upload()){
            PLOGE << "viewer: GPU upload failed";
            releaseObject();
            publish(ViewerStatus::Error, outcome->kind, step ? "failed_to_load_step_stl_preview" : "render_failed", genericFailureMessage());
            return;
        }

        rig = std::make_unique<ViewerRig>();
        if(!fitAndCenter(*object, rig->camera, rig->controls, width, height, fitRegistry, options.fit)){
            PLOGW << "viewer: camera fit skipped for '" << state.fileName << "'";
        }
        PLOGI << "viewer: ready '" << state.fileName << "' triangles=" << object->triangleCount();
        publish(ViewerStatus::Ready, outcome->kind, std::string(), std::string());
    }
};

ModelViewer::ModelViewer(std::shared_ptr<PreviewFetcher> fetcher, std::shared_ptr<MeshParser> parser,
                         std::shared_ptr<RenderDevice> device, ViewerOptions options){
    impl = new Impl();
    impl->fetcher = std::move(fetcher);
    impl->parser = std::move(parser);
    impl->device = std::move(device);
    impl->options = options;
}

ModelViewer::~ModelViewer(){
    if(!impl) return;
    impl->cancelInFlight();
    impl->teardown();
    if(impl->deviceInitialized && impl->device) impl->device->dispose();
    delete impl;
    impl = nullptr;
}

void ModelViewer::setStatusCallback(StatusCallback cb){ impl->callback = std::move(cb); }

void ModelViewer::setSource(const ViewerSource& source){
    if(source.url.empty()){
        if(source.downloadUrl.empty()){ clearSource(); return; }
        // nothing to render, but the file can still be downloaded
        impl->cancelInFlight();
        impl->teardown();
        impl->source = source;
        impl->state = ViewerState();
        impl->state.fileName = !source.filenameOverride.empty() ? source.filenameOverride : source.declaredFilename;
        impl->publish(ViewerStatus::Unsupported, source.kind, "unsupported_file_type", unsupportedMessage());
        return;
    }

    impl->cancelInFlight();
    impl->teardown();
    impl->source = source;
    impl->state.fileName = !source.filenameOverride.empty() ? source.filenameOverride : source.declaredFilename;

    if(!impl->device || !impl->device->isAccelerationAvailable()){
        impl->publish(ViewerStatus::Error, hintedKind(source), "no_3d_acceleration", noAccelerationMessage());
        return;
    }
    if(!impl->fetcher || !impl->parser){
        PLOGE << "viewer: missing fetcher or parser";
        impl->publish(ViewerStatus::Error, hintedKind(source), "fetch_failed", genericFailureMessage());
        return;
    }

    impl->publish(ViewerStatus::Loading, hintedKind(source), std::string(), std::string());

    CancelTicket ticket = std::make_shared<std::atomic<bool>>(false);
    impl->ticket = ticket;
    const uint64_t generation = impl->generation;
    std::shared_ptr<PendingSlot> slot = impl->pending;
    std::shared_ptr<PreviewFetcher> fetcher = impl->fetcher;
    std::shared_ptr<MeshParser> parser = impl->parser;
    const size_t maxBytes = impl->options.maxRenderBytes;

    auto work = [ticket, generation, slot, fetcher, parser, source, maxBytes](){
        std::unique_ptr<LoadOutcome> outcome;
        try {
            outcome = runLoad(*fetcher, *parser, source, maxBytes, ticket);
        } catch(const std::exception& ex){
            PLOGE << "viewer: load exception: " << ex.what();
            const std::optional<CadKind> hint = hintedKind(source);
            const bool step = hint && *hint == CadKind::STEP;
            outcome = failure(hint, step ? "failed_to_load_step_stl_preview" : "render_failed", ModelViewer::genericFailureMessage());
        }
        if(!outcome || ticket->load()){
            PLOGV << "viewer: load generation " << generation << " cancelled, not publishing";
            return;
        }
        outcome->generation = generation;
        std::lock_guard<std::mutex> l(slot->mutex);
        slot->outcome = std::move(outcome);
    };

    if(impl->options.synchronous){
        work();
        processPendingUploads();
    } else {
        std::thread(work).detach();
    }
}

void ModelViewer::clearSource(){
    impl->cancelInFlight();
    impl->teardown();
    impl->source = ViewerSource();
    impl->state = ViewerState();
    impl->publish(ViewerStatus::Idle, std::nullopt, std::string(), std::string());
}

void ModelViewer::setViewportSize(int width, int height){
    if(width <= 0 || height <= 0) return;
    if(width == impl->width && height == impl->height) return;
    impl->width = width;
    impl->height = height;
    if(impl->deviceInitialized) impl->device->resize(width, height);
    if(impl->object && impl->rig){
        fitAndCenter(*impl->object, impl->rig->camera, impl->rig->controls, width, height, impl->fitRegistry, impl->options.fit);
    }
}

void ModelViewer::processPendingUploads(){
    if(!impl) return;
    std::unique_ptr<LoadOutcome> ready;
    {
        std::lock_guard<std::mutex> l(impl->pending->mutex);
        ready = std::move(impl->pending->outcome);
    }
    if(!ready) return;
    if(ready->generation != impl->generation){
        PLOGV << "viewer: dropping stale load generation " << ready->generation;
        return;
    }
    impl->ticket.reset();
    try {
        impl->apply(std::move(ready));
    } catch(const std::exception& ex){
        PLOGE << "viewer: apply exception: " << ex.what();
        impl->teardown();
        const bool step = impl->state.cadKind && *impl->state.cadKind == CadKind::STEP;
        impl->publish(ViewerStatus::Error, impl->state.cadKind, step ? "failed_to_load_step_stl_preview" : "render_failed", genericFailureMessage());
    }
}

void ModelViewer::renderFrame(){
    if(!impl || impl->state.status != ViewerStatus::Ready || !impl->object || !impl->rig) return;
    impl->rig->controls.update();
    impl->device->render(*impl->object, impl->rig->camera, impl->rig->lights);
}

ViewerState ModelViewer::state() const { return impl->state; }

bool ModelViewer::isLoading() const { return impl->state.status == ViewerStatus::Loading; }

const SceneNode* ModelViewer::object() const {
    return impl->state.status == ViewerStatus::Ready ? impl->object.get() : nullptr;
}

ViewerRig* ModelViewer::rig(){ return impl->rig.get(); }

std::string ModelViewer::fileTooLargeMessage() const { return tooLargeMessage(impl->options.maxRenderBytes); }

} // namespace CadPreview
