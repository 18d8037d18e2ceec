#pragma once
#include <string>
#include <optional>

namespace CadPreview {

// Formats the renderer knows how to show.
enum class CadKind { STL, OBJ, GLB, STEP };

// Why a filename did not classify. These are not kinds.
enum class ClassifyFailure { None, Unsupported, Unknown };

struct CadClassification {
    bool ok = false;
    CadKind kind = CadKind::STL;
    ClassifyFailure failure = ClassifyFailure::Unknown;
    std::string extension;
};

// Classify by extension. `.stp` and `.step` both map to STEP.
CadClassification classifyCadFile(const std::string& filename);

// Parse a kind token as used in query strings ("stl", "obj", "glb", "step").
std::optional<CadKind> parseCadKind(const std::string& token);

const char* cadKindName(CadKind kind);
const char* classifyFailureName(ClassifyFailure failure);

// MIME type for a payload of `kind`. `convertedPreview` marks STEP bytes that were
// already converted to STL.
std::string contentTypeFor(CadKind kind, bool convertedPreview = false);

} // namespace CadPreview
