#include "tarmac/material/MaterialReify.h"
#include "tarmac/core/Log.h"

#include <algorithm>
#include <optional>
#include <set>
#include <utility>

namespace tarmac::material {

namespace {

// Nodes on the current traversal path. Copied and extended per call, never shared
// between sibling branches.
using SeenSet = std::set<std::pair<const MaterialGraph*, NodeID>>;

// Where the placeholders of a group body get their values from
struct GroupBinding {
    const MaterialGraph& outerGraph;
    const MaterialNode& groupNode;
    const SeenSet& seen;
};

ExprRef ReifyInput(const SeenSet& seen, const MaterialGraph& graph, PinID pinId);
ExprRef ReifyOutput(const SeenSet& seen, const MaterialGraph& graph, PinID pinId);
ExprRef Substitute(const ExprRef& expression, const GroupBinding& binding);

float ParameterAsFloat(const PinValue& value) {
    if (auto* f = std::get_if<float>(&value)) return *f;
    return std::get<glm::vec3>(value).x;
}

glm::vec3 ParameterAsColor(const PinValue& value) {
    if (auto* v = std::get_if<glm::vec3>(&value)) return *v;
    return glm::vec3(std::get<float>(value));
}

std::string Describe(const MaterialGraph& graph, const MaterialNode& node) {
    return "node '" + node.name + "' (" + GetNodeTypeName(node.type) + ") in '" + graph.GetName() + "'";
}

ExprRef DefaultConstant(const MaterialPin& pin) {
    if (pin.type == PinType::Float) {
        return MakeExpression(expr::ConstantScalar{ static_cast<double>(ParameterAsFloat(pin.defaultValue)) });
    }
    return MakeExpression(expr::ConstantColor{ glm::dvec3(ParameterAsColor(pin.defaultValue)) });
}

ExprRef ReifyInput(const SeenSet& seen, const MaterialGraph& graph, PinID pinId) {
    const MaterialPin* pin = graph.GetPin(pinId);
    if (!pin || pin->direction != PinDirection::Input) {
        throw MaterialException(MaterialErrorCode::InvalidSocket,
            "Input socket " + std::to_string(pinId) + " does not exist in '" + graph.GetName() + "'");
    }

    LinkID linkId = graph.FindLinkByEndPin(pinId);
    if (linkId == INVALID_LINK_ID) {
        return DefaultConstant(*pin);
    }
    const MaterialLink* link = graph.GetLink(linkId);
    return ReifyOutput(seen, graph, link->startPinId);
}

std::optional<expr::GradientInterpolation> ToGradientInterpolation(RampInterpolation interpolation) {
    switch (interpolation) {
        case RampInterpolation::Linear: return expr::GradientInterpolation::Linear;
        case RampInterpolation::Constant: return expr::GradientInterpolation::Constant;
        default: return std::nullopt;
    }
}

ExprRef ReifyColorRamp(const MaterialGraph& graph, const MaterialNode& node, bool alphaOutput, ExprRef fac) {
    const ColorRampSettings& ramp = node.ramp;

    // HSV with linear interpolation blends exactly like RGB
    RampColorMode colorMode = ramp.colorMode;
    if (colorMode == RampColorMode::HSV && ramp.interpolation == RampInterpolation::Linear) {
        colorMode = RampColorMode::RGB;
    }
    if (colorMode != RampColorMode::RGB) {
        throw MaterialException(MaterialErrorCode::UnsupportedNode,
            "Color ramp " + Describe(graph, node) + " must use RGB color mode");
    }

    auto interpolation = ToGradientInterpolation(ramp.interpolation);
    if (!interpolation) {
        throw MaterialException(MaterialErrorCode::UnsupportedNode,
            "Color ramp " + Describe(graph, node) + " must use Linear or Constant interpolation");
    }
    if (ramp.stops.empty()) {
        throw MaterialException(MaterialErrorCode::UnsupportedNode,
            "Color ramp " + Describe(graph, node) + " has no stops");
    }

    expr::Gradient gradient;
    gradient.interpolation = *interpolation;
    gradient.alphaOutput = alphaOutput;
    gradient.fac = std::move(fac);
    for (const auto& stop : ramp.stops) {
        gradient.stops.push_back({ static_cast<double>(stop.position), glm::dvec4(stop.color) });
    }
    std::stable_sort(gradient.stops.begin(), gradient.stops.end(),
        [](const expr::GradientStop& a, const expr::GradientStop& b) { return a.position < b.position; });

    return MakeExpression(std::move(gradient));
}

ExprRef ReifyGroup(const SeenSet& seen, const MaterialGraph& graph, const MaterialNode& node,
                   const MaterialPin& socket) {
    if (!node.group) {
        throw MaterialException(MaterialErrorCode::InvalidGroup,
            "Group " + Describe(graph, node) + " does not reference a group graph");
    }
    const MaterialGraph& body = *node.group;

    NodeID outputNode = body.FindActiveGroupOutput();
    if (outputNode == INVALID_NODE_ID) {
        throw MaterialException(MaterialErrorCode::InvalidGroup,
            "Group '" + body.GetName() + "' has no active group output");
    }
    PinID bodySocket = body.FindInputPin(outputNode, socket.identifier);
    if (bodySocket == INVALID_PIN_ID) {
        throw MaterialException(MaterialErrorCode::InvalidGroup,
            "Group '" + body.GetName() + "' has no output '" + socket.name + "'");
    }

    ExprRef inner = ReifyInput(seen, body, bodySocket);
    GroupBinding binding{ graph, node, seen };
    return MakeExpression(expr::GroupWrapper{ node.name, Substitute(inner, binding) });
}

ExprRef ReifyOutput(const SeenSet& seen, const MaterialGraph& graph, PinID pinId) {
    const MaterialPin* socket = graph.GetPin(pinId);
    const MaterialNode* nodePtr = socket ? graph.GetNode(socket->nodeId) : nullptr;
    if (!socket || !nodePtr || socket->direction != PinDirection::Output) {
        throw MaterialException(MaterialErrorCode::InvalidSocket,
            "Output socket " + std::to_string(pinId) + " does not exist in '" + graph.GetName() + "'");
    }
    const MaterialNode& node = *nodePtr;

    const auto key = std::make_pair(&graph, node.id);
    if (seen.count(key) > 0) {
        throw MaterialException(MaterialErrorCode::Cycle,
            "Cycle through " + Describe(graph, node));
    }
    SeenSet path = seen;
    path.insert(key);

    auto in = [&](const char* name) -> ExprRef {
        PinID input = graph.FindInputPin(node.id, name);
        if (input == INVALID_PIN_ID) {
            throw MaterialException(MaterialErrorCode::InvalidSocket,
                Describe(graph, node) + " has no input '" + name + "'");
        }
        return ReifyInput(path, graph, input);
    };

    auto unsupportedSocket = [&]() {
        return MaterialException(MaterialErrorCode::UnsupportedSocket,
            "Socket '" + socket->name + "' of " + Describe(graph, node) + " cannot be baked");
    };

    const std::string& name = socket->name;

    switch (node.type) {
        case NodeType::Value:
            return MakeExpression(expr::ConstantScalar{ static_cast<double>(ParameterAsFloat(node.parameter)) });
        case NodeType::RGB:
            return MakeExpression(expr::ConstantColor{ glm::dvec3(ParameterAsColor(node.parameter)) });

        case NodeType::VertexColor:
            if (name == "Color") return MakeExpression(expr::AttributeColor{ node.attributeName });
            if (name == "Alpha") {
                return MakeExpression(expr::AttributeScalar{ node.attributeName, expr::AttributeChannel::Alpha });
            }
            throw unsupportedSocket();

        case NodeType::Attribute:
            if (name == "Color" || name == "Vector") return MakeExpression(expr::AttributeColor{ node.attributeName });
            if (name == "Fac") {
                return MakeExpression(expr::AttributeScalar{ node.attributeName, expr::AttributeChannel::Average });
            }
            if (name == "Alpha") {
                return MakeExpression(expr::AttributeScalar{ node.attributeName, expr::AttributeChannel::Alpha });
            }
            throw unsupportedSocket();

        case NodeType::Geometry:
            if (name == "Position") return MakeExpression(expr::GeometryPosition{});
            if (name == "Normal") return MakeExpression(expr::GeometryNormal{});
            throw unsupportedSocket();

        case NodeType::Math:
            return MakeExpression(expr::Math{ node.operation, node.useClamp,
                in("Value"), in("Value_001"), in("Value_002") });

        case NodeType::VectorMath:
            if (name == "Vector") {
                return MakeExpression(expr::VectorMath{ node.operation,
                    in("Vector"), in("Vector_001"), in("Vector_002"), in("Scale") });
            }
            if (name == "Value") {
                return MakeExpression(expr::VectorMathScalar{ node.operation, in("Vector"), in("Vector_001") });
            }
            throw unsupportedSocket();

        case NodeType::MixRGB:
            return MakeExpression(expr::Blend{ node.operation, node.useClamp,
                in("Fac"), in("Color1"), in("Color2") });

        case NodeType::Mix:
            if (node.dataType == "RGBA") {
                return MakeExpression(expr::Blend{ node.operation, node.useClamp, in("Factor"), in("A"), in("B") });
            }
            if (node.dataType == "FLOAT") {
                return MakeExpression(expr::Blend{ "MIX", false, in("Factor"), in("A"), in("B") });
            }
            throw MaterialException(MaterialErrorCode::UnsupportedNode,
                "Mix " + Describe(graph, node) + ": data type '" + node.dataType + "' cannot be baked");

        case NodeType::RGBToBW:
            return MakeExpression(expr::Grayscale{ in("Color") });
        case NodeType::Invert:
            return MakeExpression(expr::Invert{ in("Fac"), in("Color") });
        case NodeType::Clamp:
            return MakeExpression(expr::Clamp{ node.operation, in("Value"), in("Min"), in("Max") });
        case NodeType::Gamma:
            return MakeExpression(expr::Gamma{ in("Color"), in("Gamma") });
        case NodeType::BrightContrast:
            return MakeExpression(expr::BrightContrast{ in("Color"), in("Bright"), in("Contrast") });

        case NodeType::SeparateRGB:
        case NodeType::SeparateXYZ:
        case NodeType::SeparateHSV: {
            const char* channels = node.type == NodeType::SeparateRGB ? "RGB"
                                 : node.type == NodeType::SeparateXYZ ? "XYZ" : "HSV";
            const char* input = node.type == NodeType::SeparateRGB ? "Image"
                              : node.type == NodeType::SeparateXYZ ? "Vector" : "Color";
            const expr::ChannelSpace space = node.type == NodeType::SeparateRGB ? expr::ChannelSpace::RGB
                                           : node.type == NodeType::SeparateXYZ ? expr::ChannelSpace::XYZ
                                           : expr::ChannelSpace::HSV;
            for (int channel = 0; channel < 3; ++channel) {
                if (name.size() == 1 && name[0] == channels[channel]) {
                    return MakeExpression(expr::SeparateChannel{ space, channel, in(input) });
                }
            }
            throw unsupportedSocket();
        }

        case NodeType::CombineRGB:
            return MakeExpression(expr::CombineChannels{ expr::ChannelSpace::RGB, in("R"), in("G"), in("B") });
        case NodeType::CombineXYZ:
            return MakeExpression(expr::CombineChannels{ expr::ChannelSpace::XYZ, in("X"), in("Y"), in("Z") });
        case NodeType::CombineHSV:
            return MakeExpression(expr::CombineChannels{ expr::ChannelSpace::HSV, in("H"), in("S"), in("V") });

        case NodeType::ColorRamp:
            if (name != "Color" && name != "Alpha") throw unsupportedSocket();
            return ReifyColorRamp(graph, node, name == "Alpha", in("Fac"));

        case NodeType::MapRange:
            return MakeExpression(expr::MapRange{ node.operation, node.useClamp,
                in("Value"), in("From Min"), in("From Max"), in("To Min"), in("To Max"), in("Steps") });

        case NodeType::HueSaturation:
            return MakeExpression(expr::HueSaturationValue{
                in("Hue"), in("Saturation"), in("Value"), in("Fac"), in("Color") });

        case NodeType::Group:
            return ReifyGroup(path, graph, node, *socket);
        case NodeType::GroupInput:
            return MakeExpression(expr::UnresolvedGroupInput{ socket->identifier });
        case NodeType::Reroute:
            return in("Input");

        case NodeType::GroupOutput:
        case NodeType::Frame:
        case NodeType::ImageTexture:
        case NodeType::NoiseTexture:
        case NodeType::TrackShader:
            break;
    }

    throw MaterialException(MaterialErrorCode::UnsupportedNode,
        Describe(graph, node) + " cannot be baked (socket '" + name + "')");
}

// -----------------------
// Placeholder substitution. Rebuilds only the spine above replaced
// placeholders; untouched subtrees stay shared.
// -----------------------

class Substituter {
public:
    explicit Substituter(const GroupBinding& binding)
        : m_Binding(binding) {
    }

    ExprRef Apply(const ExprRef& e) {
        if (!e) return e;
        return std::visit([&](const auto& n) { return Rewrite(e, n); }, e->node);
    }

private:
    ExprRef Child(const ExprRef& child, bool& changed) {
        ExprRef result = Apply(child);
        changed = changed || result != child;
        return result;
    }

    template<typename T>
    ExprRef Rebuild(const ExprRef& original, T copy, bool changed) {
        return changed ? MakeExpression(std::move(copy)) : original;
    }

    // Leaves
    ExprRef Rewrite(const ExprRef& e, const expr::ConstantColor&) { return e; }
    ExprRef Rewrite(const ExprRef& e, const expr::ConstantScalar&) { return e; }
    ExprRef Rewrite(const ExprRef& e, const expr::AttributeColor&) { return e; }
    ExprRef Rewrite(const ExprRef& e, const expr::AttributeScalar&) { return e; }
    ExprRef Rewrite(const ExprRef& e, const expr::GeometryPosition&) { return e; }
    ExprRef Rewrite(const ExprRef& e, const expr::GeometryNormal&) { return e; }

    ExprRef Rewrite(const ExprRef& e, const expr::Math& n) {
        bool changed = false;
        expr::Math copy = n;
        copy.a = Child(n.a, changed);
        copy.b = Child(n.b, changed);
        copy.c = Child(n.c, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::VectorMath& n) {
        bool changed = false;
        expr::VectorMath copy = n;
        copy.a = Child(n.a, changed);
        copy.b = Child(n.b, changed);
        copy.c = Child(n.c, changed);
        copy.scale = Child(n.scale, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::VectorMathScalar& n) {
        bool changed = false;
        expr::VectorMathScalar copy = n;
        copy.a = Child(n.a, changed);
        copy.b = Child(n.b, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::Blend& n) {
        bool changed = false;
        expr::Blend copy = n;
        copy.fac = Child(n.fac, changed);
        copy.color1 = Child(n.color1, changed);
        copy.color2 = Child(n.color2, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::Invert& n) {
        bool changed = false;
        expr::Invert copy = n;
        copy.fac = Child(n.fac, changed);
        copy.color = Child(n.color, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::Grayscale& n) {
        bool changed = false;
        expr::Grayscale copy = n;
        copy.color = Child(n.color, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::Clamp& n) {
        bool changed = false;
        expr::Clamp copy = n;
        copy.value = Child(n.value, changed);
        copy.min = Child(n.min, changed);
        copy.max = Child(n.max, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::BrightContrast& n) {
        bool changed = false;
        expr::BrightContrast copy = n;
        copy.color = Child(n.color, changed);
        copy.bright = Child(n.bright, changed);
        copy.contrast = Child(n.contrast, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::Gamma& n) {
        bool changed = false;
        expr::Gamma copy = n;
        copy.color = Child(n.color, changed);
        copy.gamma = Child(n.gamma, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::SeparateChannel& n) {
        bool changed = false;
        expr::SeparateChannel copy = n;
        copy.input = Child(n.input, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::CombineChannels& n) {
        bool changed = false;
        expr::CombineChannels copy = n;
        copy.a = Child(n.a, changed);
        copy.b = Child(n.b, changed);
        copy.c = Child(n.c, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::Gradient& n) {
        bool changed = false;
        expr::Gradient copy = n;
        copy.fac = Child(n.fac, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::MapRange& n) {
        bool changed = false;
        expr::MapRange copy = n;
        copy.value = Child(n.value, changed);
        copy.fromMin = Child(n.fromMin, changed);
        copy.fromMax = Child(n.fromMax, changed);
        copy.toMin = Child(n.toMin, changed);
        copy.toMax = Child(n.toMax, changed);
        copy.steps = Child(n.steps, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    ExprRef Rewrite(const ExprRef& e, const expr::HueSaturationValue& n) {
        bool changed = false;
        expr::HueSaturationValue copy = n;
        copy.hue = Child(n.hue, changed);
        copy.saturation = Child(n.saturation, changed);
        copy.value = Child(n.value, changed);
        copy.fac = Child(n.fac, changed);
        copy.color = Child(n.color, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    // Nested groups may still carry placeholders of this group
    ExprRef Rewrite(const ExprRef& e, const expr::GroupWrapper& n) {
        bool changed = false;
        expr::GroupWrapper copy = n;
        copy.inner = Child(n.inner, changed);
        return Rebuild(e, std::move(copy), changed);
    }

    // The replacement is lowered in the enclosing graph and is not walked again
    ExprRef Rewrite(const ExprRef&, const expr::UnresolvedGroupInput& n) {
        const MaterialGraph& outer = m_Binding.outerGraph;
        const MaterialNode& groupNode = m_Binding.groupNode;

        for (PinID pinId : groupNode.inputPins) {
            const MaterialPin* pin = outer.GetPin(pinId);
            if (pin && pin->identifier == n.identifier) {
                return ReifyInput(m_Binding.seen, outer, pinId);
            }
        }
        throw MaterialException(MaterialErrorCode::InvalidGroup,
            "Group " + Describe(outer, groupNode) + " has no input '" + n.identifier + "'");
    }

    const GroupBinding& m_Binding;
};

ExprRef Substitute(const ExprRef& expression, const GroupBinding& binding) {
    Substituter substituter(binding);
    return substituter.Apply(expression);
}

} // namespace

ReifyResult Reify(const MaterialGraph& graph, PinID socket) {
    ReifyResult result;
    try {
        const MaterialPin* pin = graph.GetPin(socket);
        if (!pin) {
            throw MaterialException(MaterialErrorCode::InvalidSocket,
                "Socket " + std::to_string(socket) + " does not exist in '" + graph.GetName() + "'");
        }

        SeenSet seen;
        result.expression = pin->direction == PinDirection::Input
            ? ReifyInput(seen, graph, socket)
            : ReifyOutput(seen, graph, socket);
        result.success = true;

        if (Log::GetCoreLogger()->should_log(spdlog::level::trace)) {
            TARMAC_CORE_TRACE("Reified '{}' socket '{}': {}", graph.GetName(), pin->name, ToString(result.expression));
        }
    } catch (const MaterialException& e) {
        result.expression.reset();
        result.error = e.ToError();
        if (IsInternalError(e.GetCode())) {
            TARMAC_CORE_ERROR("Material reification failed: {}", result.error.Report());
        } else {
            TARMAC_CORE_WARN("Material reification failed: {}", result.error.Report());
        }
    }
    return result;
}

} // namespace tarmac::material
