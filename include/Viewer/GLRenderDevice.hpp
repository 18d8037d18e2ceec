#pragma once

#include <map>
#include <string>
#include "Viewer/RenderDevice.hpp"

namespace CadPreview {

// OpenGL 3.3 core device rendering into an offscreen framebuffer; the host shows
// colorTexture() (e.g. with ImGui::Image). Requires a current context and GLEW.
class GLRenderDevice : public RenderDevice {
public:
    GLRenderDevice() = default;
    ~GLRenderDevice() override;

    bool isAccelerationAvailable() const override;
    bool initialize(int width, int height, std::string* outError = nullptr) override;
    void resize(int width, int height) override;

    uint64_t uploadGeometry(const Geometry& geometry) override;
    void releaseGeometry(uint64_t handle) override;
    uint64_t createMaterial(const Material& material) override;
    void releaseMaterial(uint64_t handle) override;

    void render(const SceneNode& root, const PerspectiveCamera& camera, const LightRig& lights) override;
    void dispose() override;

    unsigned int colorTexture() const { return fboTex_; }
    int width() const { return fbW_; }
    int height() const { return fbH_; }
    size_t liveGeometryCount() const { return geometries_.size(); }

private:
    struct GpuGeometry { unsigned int vao = 0, vbo = 0, ibo = 0; int indexCount = 0; };
    struct GpuMaterial { float r = 0.8f, g = 0.8f, b = 0.9f; float metalness = 0.0f, roughness = 1.0f; };

    void ensureFBOSize(int w, int h);

    unsigned int prog_ = 0;
    unsigned int fbo_ = 0, fboTex_ = 0, rbo_ = 0;
    int fbW_ = 0, fbH_ = 0;
    bool initialized_ = false;

    uint64_t nextHandle_ = 1;
    std::map<uint64_t, GpuGeometry> geometries_;
    std::map<uint64_t, GpuMaterial> materials_;
};

} // namespace CadPreview
