#include "Viewer/SceneGraph.hpp"
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>

namespace CadPreview {

bool Box3::isFinite() const {
    for(int i = 0; i < 3; ++i){
        if(!std::isfinite(min[i]) || !std::isfinite(max[i])) return false;
    }
    return true;
}

void Geometry::computeVertexNormals(){
    normals.assign(positions.size(), glm::vec3(0.0f));
    auto addFace = [&](uint32_t a, uint32_t b, uint32_t c){
        if(a >= positions.size() || b >= positions.size() || c >= positions.size()) return;
        glm::vec3 n = glm::cross(positions[b] - positions[a], positions[c] - positions[a]);
        normals[a] += n; normals[b] += n; normals[c] += n;
    };
    if(!indices.empty()){
        for(size_t i = 0; i + 2 < indices.size(); i += 3) addFace(indices[i], indices[i+1], indices[i+2]);
    } else {
        for(uint32_t i = 0; i + 2 < positions.size(); i += 3) addFace(i, i+1, i+2);
    }
    for(auto& n : normals){
        float len = glm::length(n);
        n = len > 0.0f ? n / len : glm::vec3(0.0f, 0.0f, 1.0f);
    }
}

Box3 Geometry::boundingBox() const {
    Box3 b;
    for(const auto& p : positions) b.expandByPoint(p);
    return b;
}

glm::mat4 SceneNode::localMatrix() const {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), position);
    m = m * glm::mat4_cast(rotation);
    m = glm::scale(m, scale);
    return m;
}

void SceneNode::updateWorldMatrix(){
    updateWorldMatrixFrom(parent_ ? parent_->world_ : glm::mat4(1.0f));
}

void SceneNode::updateWorldMatrixFrom(const glm::mat4& parentWorld){
    world_ = parentWorld * localMatrix();
    for(auto& c : children_) c->updateWorldMatrixFrom(world_);
}

SceneNode* SceneNode::addChild(std::unique_ptr<SceneNode> child){
    if(!child) return nullptr;
    child->parent_ = this;
    children_.push_back(std::move(child));
    return children_.back().get();
}

void SceneNode::traverse(const std::function<void(SceneNode&)>& fn){
    fn(*this);
    for(auto& c : children_) c->traverse(fn);
}

void SceneNode::traverseConst(const std::function<void(const SceneNode&)>& fn) const {
    fn(*this);
    for(const auto& c : children_) c->traverseConst(fn);
}

size_t SceneNode::triangleCount() const {
    size_t n = 0;
    traverseConst([&](const SceneNode& node){
        for(const auto& m : node.meshes){
            if(!m.geometry) continue;
            n += m.geometry->indices.empty() ? m.geometry->positions.size() / 3 : m.geometry->indices.size() / 3;
        }
    });
    return n;
}

Box3 computeWorldBoundingBox(const SceneNode& root){
    Box3 box;
    root.traverseConst([&](const SceneNode& node){
        const glm::mat4& w = node.worldMatrix();
        for(const auto& m : node.meshes){
            if(!m.geometry) continue;
            for(const auto& p : m.geometry->positions){
                glm::vec4 wp = w * glm::vec4(p, 1.0f);
                box.expandByPoint(glm::vec3(wp));
            }
        }
    });
    return box;
}

} // namespace CadPreview
