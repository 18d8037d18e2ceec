#include "Viewer/ViewerPanel.hpp"
#include <plog/Log.h>
#include <cstdint>

namespace CadPreview {

ViewerPanel::ViewerPanel(ModelViewer& viewer, GLRenderDevice& device) : viewer_(viewer), device_(device) {}

void ViewerPanel::handleInput(const ImVec2& size){
    ViewerRig* rig = viewer_.rig();
    if(!rig) return;
    bool hovered = ImGui::IsItemHovered();
    // rotate with left-drag, pan with middle-drag or Ctrl+left-drag
    if(ImGui::IsItemActive()){
        ImVec2 delta = ImGui::GetIO().MouseDelta;
        if(ImGui::IsMouseDragging(ImGuiMouseButton_Left) && !ImGui::GetIO().KeyCtrl){
            rig->controls.rotate(delta.x, delta.y);
        } else if(ImGui::IsMouseDragging(ImGuiMouseButton_Middle) || (ImGui::IsMouseDragging(ImGuiMouseButton_Left) && ImGui::GetIO().KeyCtrl)){
            rig->controls.pan(delta.x, delta.y, size.y);
        }
    }
    if(hovered && ImGui::GetIO().MouseWheel != 0.0f) rig->controls.zoom(ImGui::GetIO().MouseWheel);
}

void ViewerPanel::renderOverlay(const ImVec2& size, const ViewerState& state){
    ImVec2 p = ImGui::GetCursorScreenPos();
    ImDrawList* dl = ImGui::GetWindowDrawList();
    dl->AddRectFilled(p, ImVec2(p.x + size.x, p.y + size.y), IM_COL32(0x05, 0x07, 0x0d, 255));
    ImGui::SetCursorScreenPos(ImVec2(p.x + 12.0f, p.y + 12.0f));
    ImGui::PushTextWrapPos(p.x + size.x - 12.0f);
    switch(state.status){
        case ViewerStatus::Idle:
            ImGui::TextDisabled("No preview selected");
            break;
        case ViewerStatus::Loading:
            ImGui::TextUnformatted("Loading preview...");
            break;
        case ViewerStatus::Error:
        case ViewerStatus::Unsupported:
            ImGui::TextUnformatted(state.message.empty() ? ModelViewer::genericFailureMessage() : state.message.c_str());
            if(!state.errorReason.empty()) ImGui::TextDisabled("(%s)", state.errorReason.c_str());
            if(state.canDownload() && ImGui::Button("Download")){
                if(onDownload_) onDownload_(state.downloadUrl, state.fileName);
                else PLOGW << "viewer panel: no download handler";
            }
            break;
        case ViewerStatus::Ready:
            break;
    }
    ImGui::PopTextWrapPos();
    ImGui::SetCursorScreenPos(ImVec2(p.x, p.y + size.y));
}

void ViewerPanel::renderToRegion(const ImVec2& size){
    if(size.x < 1.0f || size.y < 1.0f) return;
    viewer_.setViewportSize(static_cast<int>(size.x), static_cast<int>(size.y));
    viewer_.processPendingUploads();

    ViewerState state = viewer_.state();
    if(state.status != ViewerStatus::Ready){
        renderOverlay(size, state);
        return;
    }

    ImVec2 p = ImGui::GetCursorScreenPos();
    std::string btnId = std::string("##cad_viewport_") + std::to_string(reinterpret_cast<uintptr_t>(this));
    ImGui::InvisibleButton(btnId.c_str(), size);
    handleInput(size);

    viewer_.renderFrame();
    // framebuffer texture flush to the reserved area, flipped vertically
    ImGui::SetCursorScreenPos(p);
    ImGui::Image((ImTextureID)(intptr_t)device_.colorTexture(), size, ImVec2(0,1), ImVec2(1,0));
    ImGui::SetCursorScreenPos(ImVec2(p.x, p.y + size.y));
}

bool ViewerPanel::renderWindow(const char* title, bool* p_open){
    bool open = true;
    if(!ImGui::Begin(title, p_open)){ ImGui::End(); return p_open ? *p_open : true; }
    ViewerState state = viewer_.state();
    ImGui::Text("%s", state.fileName.empty() ? "Preview" : state.fileName.c_str());
    if(state.cadKind){ ImGui::SameLine(); ImGui::TextDisabled("[%s]", cadKindName(*state.cadKind)); }
    if(state.status == ViewerStatus::Ready && state.canDownload()){
        ImGui::SameLine();
        if(ImGui::SmallButton("Download") && onDownload_) onDownload_(state.downloadUrl, state.fileName);
    }
    ImGui::Separator();
    ImVec2 avail = ImGui::GetContentRegionAvail();
    avail.y -= ImGui::GetTextLineHeightWithSpacing();
    renderToRegion(avail);
    ImGui::TextDisabled("Drag to rotate, Ctrl+drag or middle-drag to pan, scroll to zoom");
    ImGui::End();
    if(p_open && !*p_open) open = false;
    return open;
}

} // namespace CadPreview
