#pragma once

#include <string>
#include <memory>
#include <optional>
#include <functional>
#include "CadKind.hpp"
#include "Viewer/SceneGraph.hpp"
#include "Viewer/Camera.hpp"
#include "Viewer/CameraFit.hpp"
#include "Viewer/ModelLoader.hpp"
#include "Viewer/PreviewFetcher.hpp"
#include "Viewer/RenderDevice.hpp"

namespace CadPreview {

enum class ViewerStatus { Idle, Loading, Ready, Error, Unsupported };

const char* viewerStatusName(ViewerStatus status);

struct ViewerSource {
    std::string url;          // gateway URL returning preview bytes
    std::string downloadUrl;  // kept for the fallback affordance
    std::optional<CadKind> kind; // caller-supplied kind skips classification
    std::string filenameOverride;
    std::string declaredFilename;
};

struct ViewerState {
    ViewerStatus status = ViewerStatus::Idle;
    std::optional<CadKind> cadKind;
    std::string errorReason;
    std::string message;     // user-facing text for error/unsupported
    std::string fileName;
    std::string downloadUrl;

    bool canDownload() const { return !downloadUrl.empty(); }
};

struct ViewerOptions {
    size_t maxRenderBytes = 20ull * 1024ull * 1024ull;
    FitOptions fit;
    // Run fetch, parse and upload inline in setSource (tests, tools).
    bool synchronous = false;
};

// Camera, lights and orbit controls for one loaded object.
struct ViewerRig {
    PerspectiveCamera camera;
    OrbitControls controls;
    LightRig lights;

    ViewerRig() : controls(&camera) {}
    ViewerRig(const ViewerRig&) = delete;
    ViewerRig& operator=(const ViewerRig&) = delete;
};

// Loads one preview URL and renders it.
//   idle -> loading -> ready | error | unsupported
// A new source restarts from loading; clearing it returns to idle. Fetch and parse
// run off the main thread; GPU work only happens in processPendingUploads(),
// renderFrame() and teardown, all of which the host calls on the context thread.
class ModelViewer {
public:
    using StatusCallback = std::function<void(ViewerStatus, const std::optional<CadKind>&, const std::string& errorReason)>;

    ModelViewer(std::shared_ptr<PreviewFetcher> fetcher,
                std::shared_ptr<MeshParser> parser,
                std::shared_ptr<RenderDevice> device,
                ViewerOptions options = ViewerOptions());
    ~ModelViewer();

    ModelViewer(const ModelViewer&) = delete;
    ModelViewer& operator=(const ModelViewer&) = delete;

    void setStatusCallback(StatusCallback cb);

    // Cancels any load in flight, releases the current object and starts over.
    // A source with only a downloadUrl goes straight to unsupported and keeps the download.
    void setSource(const ViewerSource& source);
    void clearSource();

    // Resizes the device and refits the camera when an object is shown.
    void setViewportSize(int width, int height);

    // Applies a finished parse: upload, rig, fit, ready. Call once per frame.
    void processPendingUploads();

    // Draws the current object, if any.
    void renderFrame();

    ViewerState state() const;
    bool isLoading() const;

    // Null unless ready.
    const SceneNode* object() const;
    ViewerRig* rig();

    static const char* genericFailureMessage();
    static const char* unsupportedMessage();
    static const char* noAccelerationMessage();
    std::string fileTooLargeMessage() const;

private:
    struct Impl;
    Impl* impl = nullptr;
};

} // namespace CadPreview
