#pragma once

#include <functional>
#include <string>
#include <imgui.h>
#include "Viewer/ModelViewer.hpp"
#include "Viewer/GLRenderDevice.hpp"

namespace CadPreview {

// ImGui host for a ModelViewer: drives the per-frame calls, maps mouse input to
// the orbit controls and shows the fallback text and download button.
class ViewerPanel {
public:
    using DownloadHandler = std::function<void(const std::string& downloadUrl, const std::string& fileName)>;

    ViewerPanel(ModelViewer& viewer, GLRenderDevice& device);

    void setDownloadHandler(DownloadHandler handler) { onDownload_ = std::move(handler); }

    // Render directly into a provided area (for embedding)
    void renderToRegion(const ImVec2& size);

    // Returns whether the window is still open
    bool renderWindow(const char* title, bool* p_open = nullptr);

private:
    void handleInput(const ImVec2& size);
    void renderOverlay(const ImVec2& size, const ViewerState& state);

    ModelViewer& viewer_;
    GLRenderDevice& device_;
    DownloadHandler onDownload_;
};

} // namespace CadPreview
