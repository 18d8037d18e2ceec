#pragma once

#include "Viewer/SceneGraph.hpp"
#include "Viewer/Camera.hpp"

namespace CadPreview {

struct FitOptions {
    float paddingFactor = 1.25f;
    glm::vec3 viewDirection{ 1.0f, -1.0f, 1.0f };
};

// Centers and grounds `object` once (tracked in `registry`), then places the camera
// on `viewDirection` far enough that the bounding sphere fills the narrower field
// of view with `paddingFactor` margin. Re-running with the same inputs gives the
// same pose. Returns false and changes nothing for empty or non-finite bounds.
bool fitAndCenter(SceneNode& object, PerspectiveCamera& camera, OrbitControls& controls,
                  int viewportWidth, int viewportHeight, FitStateRegistry& registry,
                  const FitOptions& options = FitOptions());

} // namespace CadPreview
