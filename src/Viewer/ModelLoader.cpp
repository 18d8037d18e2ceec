#include "Viewer/ModelLoader.hpp"
#include <assimp/Importer.hpp>
#include <assimp/scene.h>
#include <assimp/postprocess.h>
#include <assimp/material.h>
#include <plog/Log.h>
#include <glm/gtc/quaternion.hpp>
#include <cstring>

namespace CadPreview {

std::shared_ptr<Material> ModelLoader::makeDefaultMaterial(){
    auto m = std::make_shared<Material>();
    m->color = glm::vec3(0x7d / 255.0f, 0xd3 / 255.0f, 0xfc / 255.0f);
    m->metalness = 0.1f;
    m->roughness = 0.6f;
    m->isDefault = true;
    m->name = "cad-preview-default";
    return m;
}

static std::shared_ptr<Geometry> convertMesh(const aiMesh* mesh){
    auto g = std::make_shared<Geometry>();
    g->positions.reserve(mesh->mNumVertices);
    for(unsigned i=0;i<mesh->mNumVertices;++i){ aiVector3D v = mesh->mVertices[i]; g->positions.emplace_back(v.x, v.y, v.z); }
    g->indices.reserve(mesh->mNumFaces * 3);
    for(unsigned f=0; f<mesh->mNumFaces; ++f){ const aiFace &face = mesh->mFaces[f]; if(face.mNumIndices != 3) continue; g->indices.push_back(face.mIndices[0]); g->indices.push_back(face.mIndices[1]); g->indices.push_back(face.mIndices[2]); }
    if(mesh->HasNormals()){
        g->normals.reserve(mesh->mNumVertices);
        for(unsigned i=0;i<mesh->mNumVertices;++i){ aiVector3D n = mesh->mNormals[i]; g->normals.emplace_back(n.x, n.y, n.z); }
    } else {
        g->computeVertexNormals();
    }
    return g;
}

static bool isAssimpDefaultMaterial(const aiMaterial* mat){
    if(!mat) return true;
    aiString name;
    if(mat->Get(AI_MATKEY_NAME, name) != AI_SUCCESS) return false;
    return std::strcmp(name.C_Str(), AI_DEFAULT_MATERIAL_NAME) == 0;
}

static std::shared_ptr<Material> convertMaterial(const aiMaterial* mat){
    auto m = std::make_shared<Material>();
    aiString name;
    if(mat->Get(AI_MATKEY_NAME, name) == AI_SUCCESS) m->name = name.C_Str();
    aiColor4D bc(0.8f,0.8f,0.9f,1.0f);
    if(AI_SUCCESS == mat->Get(AI_MATKEY_BASE_COLOR, bc)) m->color = glm::vec3(bc.r, bc.g, bc.b);
    else if(AI_SUCCESS == mat->Get(AI_MATKEY_COLOR_DIFFUSE, bc)) m->color = glm::vec3(bc.r, bc.g, bc.b);
    float mf = 0.0f, rf = 1.0f;
    if(AI_SUCCESS == mat->Get(AI_MATKEY_METALLIC_FACTOR, mf)) m->metalness = mf;
    if(AI_SUCCESS == mat->Get(AI_MATKEY_ROUGHNESS_FACTOR, rf)) m->roughness = rf;
    return m;
}

struct ConvertContext {
    const aiScene* scene = nullptr;
    CadKind kind = CadKind::STL;
    std::vector<std::shared_ptr<Geometry>> geometries; // per aiMesh, shared across node references
    std::vector<std::shared_ptr<Material>> materials;  // per aiMaterial
    std::shared_ptr<Material> defaultMaterial;
};

static std::shared_ptr<Material> materialFor(ConvertContext& ctx, unsigned int index){
    const bool meshOnlyFormat = ctx.kind == CadKind::STL || ctx.kind == CadKind::STEP;
    if(meshOnlyFormat || index >= ctx.scene->mNumMaterials || isAssimpDefaultMaterial(ctx.scene->mMaterials[index])){
        if(!ctx.defaultMaterial) ctx.defaultMaterial = ModelLoader::makeDefaultMaterial();
        return ctx.defaultMaterial;
    }
    if(!ctx.materials[index]) ctx.materials[index] = convertMaterial(ctx.scene->mMaterials[index]);
    return ctx.materials[index];
}

static std::unique_ptr<SceneNode> convertNode(ConvertContext& ctx, const aiNode* node){
    auto out = std::make_unique<SceneNode>();
    out->name = node->mName.C_Str();
    aiVector3D scaling, position;
    aiQuaternion rotation;
    node->mTransformation.Decompose(scaling, rotation, position);
    out->position = glm::vec3(position.x, position.y, position.z);
    out->rotation = glm::quat(rotation.w, rotation.x, rotation.y, rotation.z);
    out->scale = glm::vec3(scaling.x, scaling.y, scaling.z);

    for(unsigned i=0;i<node->mNumMeshes;++i){
        unsigned int mi = node->mMeshes[i];
        if(mi >= ctx.scene->mNumMeshes) continue;
        const aiMesh* mesh = ctx.scene->mMeshes[mi];
        if(!ctx.geometries[mi]) ctx.geometries[mi] = convertMesh(mesh);
        if(ctx.geometries[mi]->indices.empty()) continue;
        out->meshes.push_back(MeshInstance{ ctx.geometries[mi], materialFor(ctx, mesh->mMaterialIndex) });
    }
    for(unsigned c=0;c<node->mNumChildren;++c) out->addChild(convertNode(ctx, node->mChildren[c]));
    return out;
}

std::unique_ptr<SceneNode> ModelLoader::parse(const std::vector<uint8_t>& data, CadKind kind, const std::string& name, std::string* outError){
    if(data.empty()){ if(outError) *outError = "empty payload"; return nullptr; }

    const char* hint = "stl";
    unsigned int flags = aiProcess_Triangulate | aiProcess_GenNormals;
    switch(kind){
        case CadKind::STL:
        case CadKind::STEP:
            hint = "stl";
            flags |= aiProcess_PreTransformVertices;
            break;
        case CadKind::OBJ: hint = "obj"; break;
        case CadKind::GLB: hint = "glb"; break;
    }

    try {
        Assimp::Importer importer;
        const aiScene* scene = importer.ReadFileFromMemory(data.data(), data.size(), flags, hint);
        if(!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->mRootNode || !scene->HasMeshes()){
            std::string err = importer.GetErrorString();
            PLOGW << "ModelLoader: ReadFileFromMemory failed for " << name << " (" << cadKindName(kind) << ") : " << err;
            if(outError) *outError = err.empty() ? std::string("no geometry") : err;
            return nullptr;
        }

        ConvertContext ctx;
        ctx.scene = scene;
        ctx.kind = kind;
        ctx.geometries.resize(scene->mNumMeshes);
        ctx.materials.resize(scene->mNumMaterials);

        auto root = std::make_unique<SceneNode>();
        root->name = name;
        root->addChild(convertNode(ctx, scene->mRootNode));

        if(kind == CadKind::STL || kind == CadKind::STEP){
            // mesh-only formats come in Y-up; the viewer is Z-up
            root->rotation = glm::quat(glm::vec3(-glm::half_pi<float>(), 0.0f, 0.0f));
        }

        size_t tris = root->triangleCount();
        if(tris == 0){
            if(outError) *outError = "no triangles";
            return nullptr;
        }
        PLOGI << "ModelLoader: parsed '" << name << "' kind=" << cadKindName(kind) << " triangles=" << tris;
        return root;
    } catch (const std::exception& ex) {
        PLOGE << "ModelLoader: exception parsing " << name << ": " << ex.what();
        if(outError) *outError = ex.what();
        return nullptr;
    }
}

} // namespace CadPreview
