#include "CadKind.hpp"
#include "stringUtils.hpp"

namespace CadPreview {

CadClassification classifyCadFile(const std::string& filename){
    CadClassification out;
    std::string name = trimCopy(filename);
    if(name.empty()){ out.failure = ClassifyFailure::Unknown; return out; }
    std::string ext = fileExtension(name);
    out.extension = ext;
    if(ext.empty()){ out.failure = ClassifyFailure::Unknown; return out; }
    auto kind = parseCadKind(ext);
    if(!kind){ out.failure = ClassifyFailure::Unsupported; return out; }
    out.ok = true;
    out.kind = *kind;
    out.failure = ClassifyFailure::None;
    return out;
}

std::optional<CadKind> parseCadKind(const std::string& token){
    std::string t = toLowerCopy(trimCopy(token));
    if(!t.empty() && t.front() == '.') t.erase(0, 1);
    if(t == "stl") return CadKind::STL;
    if(t == "obj") return CadKind::OBJ;
    if(t == "glb") return CadKind::GLB;
    if(t == "step" || t == "stp") return CadKind::STEP;
    return std::nullopt;
}

const char* cadKindName(CadKind kind){
    switch(kind){
        case CadKind::STL: return "stl";
        case CadKind::OBJ: return "obj";
        case CadKind::GLB: return "glb";
        case CadKind::STEP: return "step";
    }
    return "stl";
}

const char* classifyFailureName(ClassifyFailure failure){
    switch(failure){
        case ClassifyFailure::None: return "none";
        case ClassifyFailure::Unsupported: return "unsupported";
        case ClassifyFailure::Unknown: return "unknown";
    }
    return "unknown";
}

std::string contentTypeFor(CadKind kind, bool convertedPreview){
    switch(kind){
        case CadKind::STL: return "model/stl";
        case CadKind::OBJ: return "text/plain";
        case CadKind::GLB: return "model/gltf-binary";
        case CadKind::STEP: return convertedPreview ? "model/stl" : "application/step";
    }
    return "application/octet-stream";
}

} // namespace CadPreview
