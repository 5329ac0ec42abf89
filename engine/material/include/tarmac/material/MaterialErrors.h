#pragma once

#include <stdexcept>
#include <string>

namespace tarmac::material {

enum class MaterialErrorCode {
    None,

    // Graph shape (reification)
    Cycle,              // Traversal revisited a node on the current path
    UnsupportedNode,    // Node kind or node setting with no lowering
    UnsupportedSocket,  // Known node, socket with no lowering
    InvalidSocket,      // Pin id not present in the graph
    InvalidGroup,       // Group without an active output or the requested socket

    // Element data (evaluation)
    MissingAttribute,   // Attribute or geometry buffer absent from the element context

    // Baking
    MissingShaderNode,  // Material has no track shader node to bake from

    // Internal defects: reifier and evaluator disagree
    UnhandledOperation,
    UnboundGroupInput,
};

inline const char* GetErrorCodeName(MaterialErrorCode code) {
    switch (code) {
        case MaterialErrorCode::None: return "None";
        case MaterialErrorCode::Cycle: return "Cycle";
        case MaterialErrorCode::UnsupportedNode: return "UnsupportedNode";
        case MaterialErrorCode::UnsupportedSocket: return "UnsupportedSocket";
        case MaterialErrorCode::InvalidSocket: return "InvalidSocket";
        case MaterialErrorCode::InvalidGroup: return "InvalidGroup";
        case MaterialErrorCode::MissingAttribute: return "MissingAttribute";
        case MaterialErrorCode::MissingShaderNode: return "MissingShaderNode";
        case MaterialErrorCode::UnhandledOperation: return "UnhandledOperation";
        case MaterialErrorCode::UnboundGroupInput: return "UnboundGroupInput";
    }
    return "Unknown";
}

// True for errors that indicate a bug rather than a problem in the user's material.
inline bool IsInternalError(MaterialErrorCode code) {
    return code == MaterialErrorCode::UnhandledOperation || code == MaterialErrorCode::UnboundGroupInput;
}

struct MaterialError {
    MaterialErrorCode code = MaterialErrorCode::None;
    std::string message;

    std::string Report() const { return std::string(GetErrorCodeName(code)) + ": " + message; }
};

// Thrown inside the reifier/evaluator and converted to a result at the public boundary.
class MaterialException : public std::runtime_error {
public:
    MaterialException(MaterialErrorCode code, const std::string& message)
        : std::runtime_error(message), m_Code(code) {}

    MaterialErrorCode GetCode() const { return m_Code; }
    MaterialError ToError() const { return MaterialError{ m_Code, what() }; }

private:
    MaterialErrorCode m_Code;
};

} // namespace tarmac::material
