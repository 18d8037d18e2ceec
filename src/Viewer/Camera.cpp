#include "Viewer/Camera.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <algorithm>
#include <cmath>

namespace CadPreview {

glm::mat4 PerspectiveCamera::viewMatrix() const {
    return glm::lookAt(position, target, up);
}

glm::mat4 PerspectiveCamera::projectionMatrix() const {
    return glm::perspective(glm::radians(fovDegrees), aspect > 0.0f ? aspect : 1.0f, nearPlane, farPlane);
}

void OrbitControls::rotate(float dx, float dy){
    pendingAzimuth_ -= dx * rotateSpeed;
    pendingPolar_ -= dy * rotateSpeed;
}

void OrbitControls::zoom(float wheelSteps){
    float s = std::pow(1.0f - zoomSpeed, wheelSteps);
    pendingScale_ *= s;
}

void OrbitControls::pan(float dx, float dy, float viewportHeight){
    if(!camera_ || viewportHeight <= 0.0f) return;
    glm::vec3 offset = camera_->position - target;
    float dist = glm::length(offset) * std::tan(glm::radians(camera_->fovDegrees) * 0.5f);
    glm::mat4 view = camera_->viewMatrix();
    glm::vec3 right(view[0][0], view[1][0], view[2][0]);
    glm::vec3 up(view[0][1], view[1][1], view[2][1]);
    pendingPan_ += (-dx * 2.0f * dist / viewportHeight) * right + (dy * 2.0f * dist / viewportHeight) * up;
}

bool OrbitControls::update(){
    if(!camera_) return false;
    const bool hasInput = pendingAzimuth_ != 0.0f || pendingPolar_ != 0.0f || pendingScale_ != 1.0f || pendingPan_ != glm::vec3(0.0f);
    glm::vec3 offset = camera_->position - target;
    float radius = glm::length(offset);
    const bool inRange = radius >= minDistance && radius <= maxDistance;

    if(!hasInput && inRange){
        camera_->lookAt(target);
        return false;
    }

    // spherical around +Z
    float theta = std::atan2(offset.y, offset.x);
    float phi = radius > 0.0f ? std::acos(std::clamp(offset.z / radius, -1.0f, 1.0f)) : 0.0f;

    theta += pendingAzimuth_;
    phi += pendingPolar_;
    const float eps = 1e-6f;
    phi = std::clamp(phi, eps, 3.14159265358979f - eps);
    radius *= pendingScale_;
    radius = std::clamp(radius, minDistance, maxDistance);

    target += pendingPan_;
    offset = glm::vec3(radius * std::sin(phi) * std::cos(theta),
                       radius * std::sin(phi) * std::sin(theta),
                       radius * std::cos(phi));
    camera_->position = target + offset;
    camera_->lookAt(target);

    pendingAzimuth_ = 0.0f;
    pendingPolar_ = 0.0f;
    pendingScale_ = 1.0f;
    pendingPan_ = glm::vec3(0.0f);
    return true;
}

} // namespace CadPreview
