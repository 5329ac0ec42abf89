#pragma once

#include "tarmac/core/Base.h"
#include <glm/glm.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <variant>
#include <cstdint>

namespace tarmac::material {

// Forward declarations
struct MaterialNode;
struct MaterialPin;
struct MaterialLink;
class MaterialGraph;

// Unique identifiers (unique within one graph only)
using NodeID = uint64_t;
using PinID = uint64_t;
using LinkID = uint64_t;

constexpr NodeID INVALID_NODE_ID = 0;
constexpr PinID INVALID_PIN_ID = 0;
constexpr LinkID INVALID_LINK_ID = 0;

// Pin data types
enum class PinType {
    Float,      // Single value
    Color,      // RGB
    Vector,     // XYZ
};

// Pin direction
enum class PinDirection {
    Input,
    Output
};

// Node types. Socket layouts and defaults mirror the shading language the
// materials are authored in.
enum class NodeType {
    // Input nodes
    Value,          // Float constant
    RGB,            // Color constant
    VertexColor,    // Named color attribute (Color, Alpha)
    Attribute,      // Named geometry attribute (Color, Vector, Fac, Alpha)
    Geometry,       // Position, Normal, ...

    // Math
    Math,           // Scalar operation selected by `operation`
    VectorMath,     // Vector operation selected by `operation`
    Clamp,          // clamp(Value, Min, Max)
    MapRange,       // Remap Value from [From Min, From Max] to [To Min, To Max]

    // Color
    MixRGB,         // Legacy color mix, blend mode in `operation`
    Mix,            // Mix with `dataType` RGBA/FLOAT/VECTOR
    Invert,
    RGBToBW,
    Gamma,
    BrightContrast,
    HueSaturation,
    ColorRamp,      // Map scalar to color via gradient

    // Split/Combine
    SeparateRGB,
    CombineRGB,
    SeparateXYZ,
    CombineXYZ,
    SeparateHSV,
    CombineHSV,

    // Groups
    Group,          // Instance of another graph
    GroupInput,     // Boundary inputs inside a group graph
    GroupOutput,    // Boundary outputs inside a group graph

    // Utility / Editor
    Reroute,        // Passthrough node for wire organization
    Frame,          // Comment frame (editor-only, no pins)

    // Textures (authored for rendering, cannot be baked per element)
    ImageTexture,
    NoiseTexture,

    // Output
    TrackShader,    // Track material output; its inputs are the baked channels
};

// Track shader inputs
constexpr const char* kTrackShaderColorInput = "Color";
constexpr const char* kTrackShaderAlphaInput = "Alpha";
constexpr const char* kTrackShaderSpecularInput = "Specular Strength";
constexpr const char* kTrackShaderSwayFrequencyInput = "Sway Frequency";
constexpr const char* kTrackShaderSwayAmplitudeInput = "Sway Amplitude";
constexpr const char* kTrackShaderSwayPhaseInput = "Sway Phase Offset";

// Get human-readable node name
inline const char* GetNodeTypeName(NodeType type) {
    switch (type) {
        case NodeType::Value: return "Value";
        case NodeType::RGB: return "RGB";
        case NodeType::VertexColor: return "Color Attribute";
        case NodeType::Attribute: return "Attribute";
        case NodeType::Geometry: return "Geometry";
        case NodeType::Math: return "Math";
        case NodeType::VectorMath: return "Vector Math";
        case NodeType::Clamp: return "Clamp";
        case NodeType::MapRange: return "Map Range";
        case NodeType::MixRGB: return "Mix RGB";
        case NodeType::Mix: return "Mix";
        case NodeType::Invert: return "Invert";
        case NodeType::RGBToBW: return "RGB to BW";
        case NodeType::Gamma: return "Gamma";
        case NodeType::BrightContrast: return "Bright/Contrast";
        case NodeType::HueSaturation: return "Hue/Saturation/Value";
        case NodeType::ColorRamp: return "Color Ramp";
        case NodeType::SeparateRGB: return "Separate RGB";
        case NodeType::CombineRGB: return "Combine RGB";
        case NodeType::SeparateXYZ: return "Separate XYZ";
        case NodeType::CombineXYZ: return "Combine XYZ";
        case NodeType::SeparateHSV: return "Separate HSV";
        case NodeType::CombineHSV: return "Combine HSV";
        case NodeType::Group: return "Group";
        case NodeType::GroupInput: return "Group Input";
        case NodeType::GroupOutput: return "Group Output";
        case NodeType::Reroute: return "Reroute";
        case NodeType::Frame: return "Frame";
        case NodeType::ImageTexture: return "Image Texture";
        case NodeType::NoiseTexture: return "Noise Texture";
        case NodeType::TrackShader: return "Track Shader";
    }
    return "Unknown";
}

// Value that can be stored in a pin/constant
using PinValue = std::variant<float, glm::vec3>;

// A pin on a node (input or output)
struct MaterialPin {
    PinID id = INVALID_PIN_ID;
    NodeID nodeId = INVALID_NODE_ID;
    // Stable key; matches the group interface for group boundary pins.
    std::string identifier;
    std::string name;
    PinType type = PinType::Float;
    PinDirection direction = PinDirection::Input;

    // Default value for inputs (used when not connected)
    PinValue defaultValue = 0.0f;
};

// A link between two pins
struct MaterialLink {
    LinkID id = INVALID_LINK_ID;
    PinID startPinId = INVALID_PIN_ID; // Output pin
    PinID endPinId = INVALID_PIN_ID;   // Input pin
};

enum class RampInterpolation {
    Linear,
    Constant,
    Ease,
    BSpline,
    Cardinal,
};

enum class RampColorMode {
    RGB,
    HSV,
    HSL,
};

struct ColorRampStop {
    float position = 0.0f;
    glm::vec4 color = glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
};

struct ColorRampSettings {
    RampColorMode colorMode = RampColorMode::RGB;
    RampInterpolation interpolation = RampInterpolation::Linear;
    std::vector<ColorRampStop> stops;
};

// One boundary socket of a group graph
struct GroupSocket {
    std::string identifier;
    std::string name;
    PinType type = PinType::Color;
    PinValue defaultValue = 0.0f;
};

// A node in the material graph
struct MaterialNode {
    NodeID id = INVALID_NODE_ID;
    NodeType type = NodeType::Value;
    std::string name;

    // Constant for Value (float) and RGB (vec3)
    PinValue parameter = 0.0f;

    // Math/VectorMath operation, MixRGB/Mix blend type, Clamp type, MapRange interpolation
    std::string operation;
    // Mix node data type (RGBA, FLOAT, VECTOR)
    std::string dataType;
    bool useClamp = false;

    // Attribute / VertexColor layer name
    std::string attributeName;

    ColorRampSettings ramp;

    // Group: referenced graph. GroupOutput: whether this is the active boundary.
    Ref<const MaterialGraph> group;
    bool isActiveOutput = false;

    // Pins owned by this node
    std::vector<PinID> inputPins;
    std::vector<PinID> outputPins;
};

// The material graph. Also used as the body of a group: a group graph declares
// its interface with AddGroupInput/AddGroupOutput and is instanced from other
// graphs through CreateGroupNode.
class MaterialGraph {
public:
    explicit MaterialGraph(const std::string& name = "Material");
    ~MaterialGraph() = default;

    // Node management
    NodeID CreateNode(NodeType type);
    NodeID CreateGroupNode(const Ref<const MaterialGraph>& group);
    void DeleteNode(NodeID nodeId);
    MaterialNode* GetNode(NodeID nodeId);
    const MaterialNode* GetNode(NodeID nodeId) const;

    // First node of the given type (lowest id), INVALID_NODE_ID if none
    NodeID FindNodeOfType(NodeType type) const;

    // Pin management
    MaterialPin* GetPin(PinID pinId);
    const MaterialPin* GetPin(PinID pinId) const;

    // Look up a pin by identifier, falling back to the display name
    PinID FindInputPin(NodeID nodeId, const std::string& key) const;
    PinID FindOutputPin(NodeID nodeId, const std::string& key) const;
    PinID GetInputPin(NodeID nodeId, size_t index) const;
    PinID GetOutputPin(NodeID nodeId, size_t index) const;

    bool SetInputDefault(PinID pinId, const PinValue& value);

    // Link management
    LinkID CreateLink(PinID startPinId, PinID endPinId);
    void DeleteLink(LinkID linkId);
    bool CanCreateLink(PinID startPinId, PinID endPinId) const;
    const MaterialLink* GetLink(LinkID linkId) const;
    LinkID FindLinkByEndPin(PinID endPinId) const;

    // Group interface; returns the new socket's identifier
    std::string AddGroupInput(const std::string& name, PinType type, const PinValue& defaultValue = 0.0f);
    std::string AddGroupOutput(const std::string& name, PinType type);
    const std::vector<GroupSocket>& GetGroupInputs() const { return m_GroupInputs; }
    const std::vector<GroupSocket>& GetGroupOutputs() const { return m_GroupOutputs; }

    // The group output node that defines the group's results
    NodeID FindActiveGroupOutput() const;

    const std::unordered_map<LinkID, MaterialLink>& GetLinks() const { return m_Links; }

    // Get graph name
    const std::string& GetName() const { return m_Name; }

private:
    uint64_t AllocateId();
    PinID CreatePin(NodeID nodeId, const std::string& identifier, const std::string& name, PinType type,
                    PinDirection direction, PinValue defaultValue = 0.0f);
    void SetupNodePins(MaterialNode& node);
    PinID FindPin(const std::vector<PinID>& pins, const std::string& key) const;
    void DeleteLinksForPin(PinID pinId);

    uint64_t m_NextId = 1;
    uint32_t m_NextSocketIndex = 0;

    std::unordered_map<NodeID, MaterialNode> m_Nodes;
    std::unordered_map<PinID, MaterialPin> m_Pins;
    std::unordered_map<LinkID, MaterialLink> m_Links;

    std::vector<GroupSocket> m_GroupInputs;
    std::vector<GroupSocket> m_GroupOutputs;

    std::string m_Name;
};

} // namespace tarmac::material
