#include "tarmac/material/MaterialGraph.h"
#include "tarmac/core/Log.h"
#include <algorithm>
#include <cstdio>

namespace tarmac::material {

namespace {

// Identifier for the n-th pin sharing a display name: "Value", "Value_001", ...
std::string MakePinIdentifier(const std::string& name, int duplicateIndex) {
    if (duplicateIndex == 0) {
        return name;
    }
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "_%03d", duplicateIndex);
    return name + suffix;
}

PinValue DefaultForType(PinType type) {
    if (type == PinType::Float) {
        return 0.0f;
    }
    return glm::vec3(0.0f);
}

} // namespace

MaterialGraph::MaterialGraph(const std::string& name)
    : m_Name(name) {
}

uint64_t MaterialGraph::AllocateId() {
    // Single monotonic ID stream for nodes, pins and links.
    const uint64_t id = m_NextId++;
    if (id == 0) {
        // Keep 0 reserved as INVALID.
        TARMAC_CORE_ERROR("MaterialGraph ID overflow (generated 0). Resetting allocator.");
        m_NextId = 1;
        return m_NextId++;
    }
    return id;
}

NodeID MaterialGraph::CreateNode(NodeType type) {
    NodeID id = AllocateId();

    MaterialNode node;
    node.id = id;
    node.type = type;
    node.name = GetNodeTypeName(type);

    // Set default parameters based on type
    switch (type) {
        case NodeType::Value:
            node.parameter = 0.5f;
            break;
        case NodeType::RGB:
            node.parameter = glm::vec3(0.5f, 0.5f, 0.5f);
            break;
        case NodeType::Math:
        case NodeType::VectorMath:
            node.operation = "ADD";
            break;
        case NodeType::MixRGB:
            node.operation = "MIX";
            break;
        case NodeType::Mix:
            node.operation = "MIX";
            node.dataType = "RGBA";
            break;
        case NodeType::Clamp:
            node.operation = "MINMAX";
            break;
        case NodeType::MapRange:
            node.operation = "LINEAR";
            node.useClamp = true;
            break;
        case NodeType::ColorRamp:
            // Black to white, linear
            node.ramp.stops.push_back({ 0.0f, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f) });
            node.ramp.stops.push_back({ 1.0f, glm::vec4(1.0f, 1.0f, 1.0f, 1.0f) });
            break;
        case NodeType::GroupOutput:
            // The first group output created becomes the active one
            node.isActiveOutput = FindActiveGroupOutput() == INVALID_NODE_ID;
            break;
        default:
            break;
    }

    m_Nodes[id] = node;
    SetupNodePins(m_Nodes[id]);
    return id;
}

NodeID MaterialGraph::CreateGroupNode(const Ref<const MaterialGraph>& group) {
    if (!group) {
        TARMAC_CORE_WARN("Cannot create a group node without a group graph");
        return INVALID_NODE_ID;
    }
    if (group.get() == this) {
        TARMAC_CORE_WARN("Group '{}' cannot instance itself", m_Name);
        return INVALID_NODE_ID;
    }

    NodeID id = AllocateId();

    MaterialNode node;
    node.id = id;
    node.type = NodeType::Group;
    node.name = group->GetName();
    node.group = group;

    m_Nodes[id] = node;
    SetupNodePins(m_Nodes[id]);
    return id;
}

void MaterialGraph::SetupNodePins(MaterialNode& node) {
    auto countNamed = [&](const std::vector<PinID>& pins, const std::string& name) {
        int count = 0;
        for (PinID pid : pins) {
            const MaterialPin* p = GetPin(pid);
            if (p && p->name == name) ++count;
        }
        return count;
    };

    auto addInput = [&](const std::string& name, PinType type, PinValue defaultVal = 0.0f) {
        const std::string identifier = MakePinIdentifier(name, countNamed(node.inputPins, name));
        PinID pinId = CreatePin(node.id, identifier, name, type, PinDirection::Input, defaultVal);
        node.inputPins.push_back(pinId);
    };

    auto addOutput = [&](const std::string& name, PinType type) {
        const std::string identifier = MakePinIdentifier(name, countNamed(node.outputPins, name));
        PinID pinId = CreatePin(node.id, identifier, name, type, PinDirection::Output);
        node.outputPins.push_back(pinId);
    };

    const glm::vec3 grey(0.5f);

    switch (node.type) {
        // Input nodes
        case NodeType::Value:
            addOutput("Value", PinType::Float);
            break;
        case NodeType::RGB:
            addOutput("Color", PinType::Color);
            break;
        case NodeType::VertexColor:
            addOutput("Color", PinType::Color);
            addOutput("Alpha", PinType::Float);
            break;
        case NodeType::Attribute:
            addOutput("Color", PinType::Color);
            addOutput("Vector", PinType::Vector);
            addOutput("Fac", PinType::Float);
            addOutput("Alpha", PinType::Float);
            break;
        case NodeType::Geometry:
            addOutput("Position", PinType::Vector);
            addOutput("Normal", PinType::Vector);
            addOutput("Tangent", PinType::Vector);
            addOutput("True Normal", PinType::Vector);
            addOutput("Incoming", PinType::Vector);
            addOutput("Parametric", PinType::Vector);
            addOutput("Backfacing", PinType::Float);
            addOutput("Pointiness", PinType::Float);
            break;

        // Math
        case NodeType::Math:
            addInput("Value", PinType::Float, 0.5f);
            addInput("Value", PinType::Float, 0.5f);
            addInput("Value", PinType::Float, 0.5f);
            addOutput("Value", PinType::Float);
            break;
        case NodeType::VectorMath:
            addInput("Vector", PinType::Vector, glm::vec3(0.0f));
            addInput("Vector", PinType::Vector, glm::vec3(0.0f));
            addInput("Vector", PinType::Vector, glm::vec3(0.0f));
            addInput("Scale", PinType::Float, 1.0f);
            addOutput("Vector", PinType::Vector);
            addOutput("Value", PinType::Float);
            break;
        case NodeType::Clamp:
            addInput("Value", PinType::Float, 1.0f);
            addInput("Min", PinType::Float, 0.0f);
            addInput("Max", PinType::Float, 1.0f);
            addOutput("Result", PinType::Float);
            break;
        case NodeType::MapRange:
            addInput("Value", PinType::Float, 1.0f);
            addInput("From Min", PinType::Float, 0.0f);
            addInput("From Max", PinType::Float, 1.0f);
            addInput("To Min", PinType::Float, 0.0f);
            addInput("To Max", PinType::Float, 1.0f);
            addInput("Steps", PinType::Float, 4.0f);
            addOutput("Result", PinType::Float);
            break;

        // Color
        case NodeType::MixRGB:
            addInput("Fac", PinType::Float, 0.5f);
            addInput("Color1", PinType::Color, grey);
            addInput("Color2", PinType::Color, grey);
            addOutput("Color", PinType::Color);
            break;
        case NodeType::Mix:
            addInput("Factor", PinType::Float, 0.5f);
            addInput("A", PinType::Color, grey);
            addInput("B", PinType::Color, grey);
            addOutput("Result", PinType::Color);
            break;
        case NodeType::Invert:
            addInput("Fac", PinType::Float, 1.0f);
            addInput("Color", PinType::Color, glm::vec3(0.0f));
            addOutput("Color", PinType::Color);
            break;
        case NodeType::RGBToBW:
            addInput("Color", PinType::Color, grey);
            addOutput("Val", PinType::Float);
            break;
        case NodeType::Gamma:
            addInput("Color", PinType::Color, glm::vec3(1.0f));
            addInput("Gamma", PinType::Float, 1.0f);
            addOutput("Color", PinType::Color);
            break;
        case NodeType::BrightContrast:
            addInput("Color", PinType::Color, glm::vec3(1.0f));
            addInput("Bright", PinType::Float, 0.0f);
            addInput("Contrast", PinType::Float, 0.0f);
            addOutput("Color", PinType::Color);
            break;
        case NodeType::HueSaturation:
            addInput("Hue", PinType::Float, 0.5f);
            addInput("Saturation", PinType::Float, 1.0f);
            addInput("Value", PinType::Float, 1.0f);
            addInput("Fac", PinType::Float, 1.0f);
            addInput("Color", PinType::Color, glm::vec3(0.8f));
            addOutput("Color", PinType::Color);
            break;
        case NodeType::ColorRamp:
            addInput("Fac", PinType::Float, 0.5f);
            addOutput("Color", PinType::Color);
            addOutput("Alpha", PinType::Float);
            break;

        // Split/Combine
        case NodeType::SeparateRGB:
            addInput("Image", PinType::Color, glm::vec3(0.8f));
            addOutput("R", PinType::Float);
            addOutput("G", PinType::Float);
            addOutput("B", PinType::Float);
            break;
        case NodeType::CombineRGB:
            addInput("R", PinType::Float, 0.0f);
            addInput("G", PinType::Float, 0.0f);
            addInput("B", PinType::Float, 0.0f);
            addOutput("Image", PinType::Color);
            break;
        case NodeType::SeparateXYZ:
            addInput("Vector", PinType::Vector, glm::vec3(0.0f));
            addOutput("X", PinType::Float);
            addOutput("Y", PinType::Float);
            addOutput("Z", PinType::Float);
            break;
        case NodeType::CombineXYZ:
            addInput("X", PinType::Float, 0.0f);
            addInput("Y", PinType::Float, 0.0f);
            addInput("Z", PinType::Float, 0.0f);
            addOutput("Vector", PinType::Vector);
            break;
        case NodeType::SeparateHSV:
            addInput("Color", PinType::Color, glm::vec3(0.8f));
            addOutput("H", PinType::Float);
            addOutput("S", PinType::Float);
            addOutput("V", PinType::Float);
            break;
        case NodeType::CombineHSV:
            addInput("H", PinType::Float, 0.0f);
            addInput("S", PinType::Float, 0.0f);
            addInput("V", PinType::Float, 0.0f);
            addOutput("Color", PinType::Color);
            break;

        // Groups: pins mirror the group interface, identifiers included
        case NodeType::Group:
            if (node.group) {
                for (const auto& socket : node.group->GetGroupInputs()) {
                    PinID pinId = CreatePin(node.id, socket.identifier, socket.name, socket.type,
                                            PinDirection::Input, socket.defaultValue);
                    node.inputPins.push_back(pinId);
                }
                for (const auto& socket : node.group->GetGroupOutputs()) {
                    PinID pinId = CreatePin(node.id, socket.identifier, socket.name, socket.type,
                                            PinDirection::Output);
                    node.outputPins.push_back(pinId);
                }
            }
            break;
        case NodeType::GroupInput:
            for (const auto& socket : m_GroupInputs) {
                PinID pinId = CreatePin(node.id, socket.identifier, socket.name, socket.type, PinDirection::Output);
                node.outputPins.push_back(pinId);
            }
            break;
        case NodeType::GroupOutput:
            for (const auto& socket : m_GroupOutputs) {
                PinID pinId = CreatePin(node.id, socket.identifier, socket.name, socket.type,
                                        PinDirection::Input, DefaultForType(socket.type));
                node.inputPins.push_back(pinId);
            }
            break;

        // Utility
        case NodeType::Reroute:
            addInput("Input", PinType::Color, glm::vec3(0.0f));
            addOutput("Output", PinType::Color);
            break;
        case NodeType::Frame:
            break;

        // Textures
        case NodeType::ImageTexture:
            addInput("Vector", PinType::Vector, glm::vec3(0.0f));
            addOutput("Color", PinType::Color);
            addOutput("Alpha", PinType::Float);
            break;
        case NodeType::NoiseTexture:
            addInput("Vector", PinType::Vector, glm::vec3(0.0f));
            addInput("Scale", PinType::Float, 5.0f);
            addInput("Detail", PinType::Float, 2.0f);
            addInput("Roughness", PinType::Float, 0.5f);
            addOutput("Fac", PinType::Float);
            addOutput("Color", PinType::Color);
            break;

        // Output
        case NodeType::TrackShader:
            addInput(kTrackShaderColorInput, PinType::Color, glm::vec3(1.0f));
            addInput(kTrackShaderAlphaInput, PinType::Float, 1.0f);
            addInput(kTrackShaderSpecularInput, PinType::Float, 0.0f);
            addInput(kTrackShaderSwayFrequencyInput, PinType::Float, 0.0f);
            addInput(kTrackShaderSwayAmplitudeInput, PinType::Float, 0.0f);
            addInput(kTrackShaderSwayPhaseInput, PinType::Float, 0.0f);
            break;
    }
}

void MaterialGraph::DeleteLinksForPin(PinID pinId) {
    std::vector<LinkID> linksToDelete;
    for (const auto& [linkId, link] : m_Links) {
        if (link.startPinId == pinId || link.endPinId == pinId) {
            linksToDelete.push_back(linkId);
        }
    }
    for (LinkID linkId : linksToDelete) {
        m_Links.erase(linkId);
    }
}

void MaterialGraph::DeleteNode(NodeID nodeId) {
    auto it = m_Nodes.find(nodeId);
    if (it == m_Nodes.end()) return;

    MaterialNode& node = it->second;
    const bool wasActiveOutput = node.type == NodeType::GroupOutput && node.isActiveOutput;

    // Delete all pins and their links
    for (PinID pinId : node.inputPins) {
        DeleteLinksForPin(pinId);
        m_Pins.erase(pinId);
    }
    for (PinID pinId : node.outputPins) {
        DeleteLinksForPin(pinId);
        m_Pins.erase(pinId);
    }

    m_Nodes.erase(it);

    // Promote another group output so the group keeps a defined result
    if (wasActiveOutput) {
        NodeID next = FindNodeOfType(NodeType::GroupOutput);
        if (auto* nextNode = GetNode(next)) {
            nextNode->isActiveOutput = true;
        }
    }
}

MaterialNode* MaterialGraph::GetNode(NodeID nodeId) {
    auto it = m_Nodes.find(nodeId);
    return it != m_Nodes.end() ? &it->second : nullptr;
}

const MaterialNode* MaterialGraph::GetNode(NodeID nodeId) const {
    auto it = m_Nodes.find(nodeId);
    return it != m_Nodes.end() ? &it->second : nullptr;
}

NodeID MaterialGraph::FindNodeOfType(NodeType type) const {
    NodeID found = INVALID_NODE_ID;
    for (const auto& [id, node] : m_Nodes) {
        if (node.type == type && (found == INVALID_NODE_ID || id < found)) {
            found = id;
        }
    }
    return found;
}

PinID MaterialGraph::CreatePin(NodeID nodeId, const std::string& identifier, const std::string& name,
                               PinType type, PinDirection direction, PinValue defaultValue) {
    PinID id = AllocateId();

    MaterialPin pin;
    pin.id = id;
    pin.nodeId = nodeId;
    pin.identifier = identifier;
    pin.name = name;
    pin.type = type;
    pin.direction = direction;
    pin.defaultValue = defaultValue;

    m_Pins[id] = pin;
    return id;
}

MaterialPin* MaterialGraph::GetPin(PinID pinId) {
    auto it = m_Pins.find(pinId);
    return it != m_Pins.end() ? &it->second : nullptr;
}

const MaterialPin* MaterialGraph::GetPin(PinID pinId) const {
    auto it = m_Pins.find(pinId);
    return it != m_Pins.end() ? &it->second : nullptr;
}

PinID MaterialGraph::FindPin(const std::vector<PinID>& pins, const std::string& key) const {
    for (PinID pid : pins) {
        const MaterialPin* p = GetPin(pid);
        if (p && p->identifier == key) return pid;
    }
    for (PinID pid : pins) {
        const MaterialPin* p = GetPin(pid);
        if (p && p->name == key) return pid;
    }
    return INVALID_PIN_ID;
}

PinID MaterialGraph::FindInputPin(NodeID nodeId, const std::string& key) const {
    const MaterialNode* node = GetNode(nodeId);
    return node ? FindPin(node->inputPins, key) : INVALID_PIN_ID;
}

PinID MaterialGraph::FindOutputPin(NodeID nodeId, const std::string& key) const {
    const MaterialNode* node = GetNode(nodeId);
    return node ? FindPin(node->outputPins, key) : INVALID_PIN_ID;
}

PinID MaterialGraph::GetInputPin(NodeID nodeId, size_t index) const {
    const MaterialNode* node = GetNode(nodeId);
    if (!node || index >= node->inputPins.size()) return INVALID_PIN_ID;
    return node->inputPins[index];
}

PinID MaterialGraph::GetOutputPin(NodeID nodeId, size_t index) const {
    const MaterialNode* node = GetNode(nodeId);
    if (!node || index >= node->outputPins.size()) return INVALID_PIN_ID;
    return node->outputPins[index];
}

bool MaterialGraph::SetInputDefault(PinID pinId, const PinValue& value) {
    MaterialPin* pin = GetPin(pinId);
    if (!pin || pin->direction != PinDirection::Input) {
        TARMAC_CORE_WARN("Cannot set default on pin {}: not an input", pinId);
        return false;
    }
    pin->defaultValue = value;
    return true;
}

LinkID MaterialGraph::CreateLink(PinID startPinId, PinID endPinId) {
    if (!CanCreateLink(startPinId, endPinId)) {
        return INVALID_LINK_ID;
    }

    // Remove any existing link to the end pin (inputs can only have one connection)
    LinkID existingLink = FindLinkByEndPin(endPinId);
    if (existingLink != INVALID_LINK_ID) {
        DeleteLink(existingLink);
    }

    LinkID id = AllocateId();

    MaterialLink link;
    link.id = id;
    link.startPinId = startPinId;
    link.endPinId = endPinId;

    m_Links[id] = link;
    return id;
}

void MaterialGraph::DeleteLink(LinkID linkId) {
    m_Links.erase(linkId);
}

bool MaterialGraph::CanCreateLink(PinID startPinId, PinID endPinId) const {
    const MaterialPin* startPin = GetPin(startPinId);
    const MaterialPin* endPin = GetPin(endPinId);

    if (!startPin || !endPin) return false;

    // Start must be output, end must be input
    if (startPin->direction != PinDirection::Output) return false;
    if (endPin->direction != PinDirection::Input) return false;

    // Links between a node's own pins are allowed: they are cycles, which
    // reification reports. All pin kinds convert into each other.
    return true;
}

const MaterialLink* MaterialGraph::GetLink(LinkID linkId) const {
    auto it = m_Links.find(linkId);
    return it != m_Links.end() ? &it->second : nullptr;
}

LinkID MaterialGraph::FindLinkByEndPin(PinID endPinId) const {
    for (const auto& [id, link] : m_Links) {
        if (link.endPinId == endPinId) {
            return id;
        }
    }
    return INVALID_LINK_ID;
}

std::string MaterialGraph::AddGroupInput(const std::string& name, PinType type, const PinValue& defaultValue) {
    GroupSocket socket;
    socket.identifier = "Socket_" + std::to_string(m_NextSocketIndex++);
    socket.name = name;
    socket.type = type;
    socket.defaultValue = defaultValue;
    m_GroupInputs.push_back(socket);

    // Existing boundary nodes grow the matching pin
    for (auto& [id, node] : m_Nodes) {
        if (node.type == NodeType::GroupInput) {
            PinID pinId = CreatePin(id, socket.identifier, socket.name, socket.type, PinDirection::Output);
            node.outputPins.push_back(pinId);
        }
    }
    return socket.identifier;
}

std::string MaterialGraph::AddGroupOutput(const std::string& name, PinType type) {
    GroupSocket socket;
    socket.identifier = "Socket_" + std::to_string(m_NextSocketIndex++);
    socket.name = name;
    socket.type = type;
    socket.defaultValue = DefaultForType(type);
    m_GroupOutputs.push_back(socket);

    for (auto& [id, node] : m_Nodes) {
        if (node.type == NodeType::GroupOutput) {
            PinID pinId = CreatePin(id, socket.identifier, socket.name, socket.type,
                                    PinDirection::Input, socket.defaultValue);
            node.inputPins.push_back(pinId);
        }
    }
    return socket.identifier;
}

NodeID MaterialGraph::FindActiveGroupOutput() const {
    for (const auto& [id, node] : m_Nodes) {
        if (node.type == NodeType::GroupOutput && node.isActiveOutput) {
            return id;
        }
    }
    return INVALID_NODE_ID;
}

} // namespace tarmac::material
