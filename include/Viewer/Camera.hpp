#pragma once

#include <glm/glm.hpp>
#include <limits>

namespace CadPreview {

// Z is up throughout the viewer.
struct PerspectiveCamera {
    float fovDegrees = 45.0f; // vertical
    float aspect = 1.0f;
    float nearPlane = 0.01f;
    float farPlane = 5000.0f;
    glm::vec3 position{ 0.0f, -3.0f, 3.0f };
    glm::vec3 target{ 0.0f };
    glm::vec3 up{ 0.0f, 0.0f, 1.0f };

    void lookAt(const glm::vec3& t) { target = t; }
    glm::mat4 viewMatrix() const;
    glm::mat4 projectionMatrix() const;
};

// Orbit/zoom/pan around `target`, distance clamped to [minDistance, maxDistance].
class OrbitControls {
public:
    explicit OrbitControls(PerspectiveCamera* camera = nullptr) : camera_(camera) {}

    glm::vec3 target{ 0.0f };
    float minDistance = 0.0f;
    float maxDistance = std::numeric_limits<float>::infinity();
    float rotateSpeed = 0.005f; // radians per pixel
    float zoomSpeed = 0.1f;

    void setCamera(PerspectiveCamera* camera) { camera_ = camera; }
    PerspectiveCamera* camera() const { return camera_; }

    void rotate(float deltaXPixels, float deltaYPixels);
    void zoom(float wheelSteps); // positive zooms in
    void pan(float deltaXPixels, float deltaYPixels, float viewportHeight);

    // Applies pending input and clamps. Returns true when the camera moved.
    bool update();

private:
    PerspectiveCamera* camera_ = nullptr;
    float pendingAzimuth_ = 0.0f;
    float pendingPolar_ = 0.0f;
    float pendingScale_ = 1.0f;
    glm::vec3 pendingPan_{ 0.0f };
};

struct Light {
    glm::vec3 color{ 1.0f };
    float intensity = 1.0f;
    glm::vec3 position{ 0.0f }; // directional lights shine from position toward the origin
};

// Ambient fill plus key and rim directional lights.
struct LightRig {
    Light ambient{ glm::vec3(1.0f), 0.65f, glm::vec3(0.0f) };
    Light key{ glm::vec3(1.0f), 0.9f, glm::vec3(3.0f, 3.0f, 4.0f) };
    Light rim{ glm::vec3(1.0f), 0.25f, glm::vec3(-3.0f, -2.0f, -4.0f) };
    glm::vec3 clearColor{ 0x05 / 255.0f, 0x07 / 255.0f, 0x0d / 255.0f };
};

} // namespace CadPreview
