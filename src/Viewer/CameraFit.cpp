#include "Viewer/CameraFit.hpp"
#include <plog/Log.h>
#include <algorithm>
#include <cmath>

namespace CadPreview {

bool fitAndCenter(SceneNode& object, PerspectiveCamera& camera, OrbitControls& controls,
                  int viewportWidth, int viewportHeight, FitStateRegistry& registry,
                  const FitOptions& options){
    object.updateWorldMatrix();
    Box3 box = computeWorldBoundingBox(object);
    if(box.isEmpty() || !box.isFinite()){
        PLOGD << "fitAndCenter: skipped, bounds empty or non-finite";
        return false;
    }

    if(!registry.isCentered(&object)){
        object.position -= box.center();
        object.updateWorldMatrix();
        Box3 centered = computeWorldBoundingBox(object);
        if(std::abs(centered.min.z) > 1e-9f){
            object.position.z -= centered.min.z;
            object.updateWorldMatrix();
        }
        registry.markCentered(&object);
    }

    Box3 finalBox = computeWorldBoundingBox(object);
    const float radius = std::max(finalBox.boundingSphereRadius(), 1e-4f);

    const int w = std::max(1, viewportWidth);
    const int h = std::max(1, viewportHeight);
    camera.aspect = static_cast<float>(w) / static_cast<float>(h);

    const float vFov = glm::radians(camera.fovDegrees);
    const float hFov = 2.0f * std::atan(std::tan(vFov / 2.0f) * camera.aspect);
    const float limiting = std::max(1e-4f, std::min(vFov, hFov));
    const float distance = radius / std::sin(limiting / 2.0f) * options.paddingFactor;

    glm::vec3 dir = glm::length(options.viewDirection) > 0.0f ? glm::normalize(options.viewDirection) : glm::vec3(1.0f, -1.0f, 1.0f) / std::sqrt(3.0f);
    camera.position = dir * distance;
    camera.nearPlane = std::max(radius / 1000.0f, 1e-4f);
    camera.farPlane = std::max(radius * 1000.0f, distance + radius * 20.0f);
    camera.lookAt(glm::vec3(0.0f));

    controls.target = glm::vec3(0.0f);
    const float currentMin = controls.minDistance > 0.0f ? controls.minDistance : std::numeric_limits<float>::infinity();
    controls.minDistance = std::min(currentMin, std::max(1e-4f, distance / 200.0f));
    const float currentMax = controls.maxDistance > 0.0f ? controls.maxDistance : 0.0f;
    controls.maxDistance = std::max({ currentMax, distance * 20.0f, radius * 2000.0f });
    controls.update();

    PLOGV << "fitAndCenter: radius=" << radius << " distance=" << distance << " aspect=" << camera.aspect;
    return true;
}

} // namespace CadPreview
