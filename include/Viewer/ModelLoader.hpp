#pragma once

#include <vector>
#include <memory>
#include <string>
#include <cstdint>
#include "CadKind.hpp"
#include "Viewer/SceneGraph.hpp"

namespace CadPreview {

// Turns preview bytes into a scene graph. Runs on a worker thread: no GPU calls.
class MeshParser {
public:
    virtual ~MeshParser() = default;
    virtual std::unique_ptr<SceneNode> parse(const std::vector<uint8_t>& bytes, CadKind kind,
                                             const std::string& name, std::string* outError = nullptr) = 0;
};

// Assimp-backed parser.
// - STL (and STEP, which arrives as the gateway's STL conversion): one node, fixed
//   -90 degree rotation about X, default preview material
// - OBJ: node hierarchy; meshes without a source material get the default material
// - GLB: node hierarchy with transforms and base colors
class ModelLoader : public MeshParser {
public:
    std::unique_ptr<SceneNode> parse(const std::vector<uint8_t>& bytes, CadKind kind,
                                     const std::string& name, std::string* outError = nullptr) override;

    // Light blue, slightly metallic
    static std::shared_ptr<Material> makeDefaultMaterial();
};

} // namespace CadPreview
