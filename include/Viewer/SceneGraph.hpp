#pragma once

#include <vector>
#include <memory>
#include <string>
#include <functional>
#include <unordered_set>
#include <limits>
#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace CadPreview {

struct Box3 {
    glm::vec3 min{ std::numeric_limits<float>::infinity() };
    glm::vec3 max{ -std::numeric_limits<float>::infinity() };

    bool isEmpty() const { return max.x < min.x || max.y < min.y || max.z < min.z; }
    bool isFinite() const;
    void expandByPoint(const glm::vec3& p) { min = glm::min(min, p); max = glm::max(max, p); }
    glm::vec3 center() const { return (min + max) * 0.5f; }
    glm::vec3 size() const { return max - min; }
    // Radius of the sphere through the box corners.
    float boundingSphereRadius() const { return glm::length(size()) * 0.5f; }
};

// CPU-side triangle mesh. `gpuHandle` is owned by the render device that uploaded it.
struct Geometry {
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> normals;
    std::vector<uint32_t> indices; // triangles
    uint64_t gpuHandle = 0;

    // Face normals accumulated per vertex
    void computeVertexNormals();
    Box3 boundingBox() const;
};

struct Material {
    glm::vec3 color{ 0.8f, 0.8f, 0.9f };
    float metalness = 0.0f;
    float roughness = 1.0f;
    bool isDefault = false;
    std::string name;
    uint64_t gpuHandle = 0;
};

struct MeshInstance {
    std::shared_ptr<Geometry> geometry;
    std::shared_ptr<Material> material;
};

class SceneNode {
public:
    std::string name;
    glm::vec3 position{ 0.0f };
    glm::quat rotation{ 1.0f, 0.0f, 0.0f, 0.0f };
    glm::vec3 scale{ 1.0f };

    std::vector<MeshInstance> meshes;

    glm::mat4 localMatrix() const;
    const glm::mat4& worldMatrix() const { return world_; }
    void updateWorldMatrix();

    SceneNode* addChild(std::unique_ptr<SceneNode> child);
    const std::vector<std::unique_ptr<SceneNode>>& children() const { return children_; }
    SceneNode* parent() const { return parent_; }

    void traverse(const std::function<void(SceneNode&)>& fn);
    void traverseConst(const std::function<void(const SceneNode&)>& fn) const;

    size_t triangleCount() const;

private:
    void updateWorldMatrixFrom(const glm::mat4& parentWorld);

    glm::mat4 world_{ 1.0f };
    SceneNode* parent_ = nullptr;
    std::vector<std::unique_ptr<SceneNode>> children_;
};

// World-space bounds of every vertex under `root`. Call updateWorldMatrix() first.
Box3 computeWorldBoundingBox(const SceneNode& root);

// Objects that have already been centered and grounded, by identity.
// Kept outside the nodes so parsed objects stay plain data.
class FitStateRegistry {
public:
    bool isCentered(const SceneNode* node) const { return centered_.count(node) != 0; }
    void markCentered(const SceneNode* node) { centered_.insert(node); }
    void forget(const SceneNode* node) { centered_.erase(node); }
    void clear() { centered_.clear(); }

private:
    std::unordered_set<const SceneNode*> centered_;
};

} // namespace CadPreview
