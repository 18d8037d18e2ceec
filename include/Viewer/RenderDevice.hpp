#pragma once

#include <string>
#include <cstdint>
#include "Viewer/SceneGraph.hpp"
#include "Viewer/Camera.hpp"

namespace CadPreview {

// GPU side of the viewer. All calls happen on the thread that owns the context.
// Handles returned by upload/create are non-zero and released exactly once.
class RenderDevice {
public:
    virtual ~RenderDevice() = default;

    // False when no hardware-accelerated context can be created.
    virtual bool isAccelerationAvailable() const = 0;

    virtual bool initialize(int width, int height, std::string* outError = nullptr) = 0;
    virtual void resize(int width, int height) = 0;

    virtual uint64_t uploadGeometry(const Geometry& geometry) = 0;
    virtual void releaseGeometry(uint64_t handle) = 0;
    virtual uint64_t createMaterial(const Material& material) = 0;
    virtual void releaseMaterial(uint64_t handle) = 0;

    virtual void render(const SceneNode& root, const PerspectiveCamera& camera, const LightRig& lights) = 0;

    // Drops everything the device still holds (framebuffer, programs).
    virtual void dispose() = 0;
};

} // namespace CadPreview
