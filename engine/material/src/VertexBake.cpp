#include "tarmac/material/VertexBake.h"
#include "tarmac/material/ColorMath.h"
#include "tarmac/material/MaterialEval.h"
#include "tarmac/material/MaterialReify.h"
#include "tarmac/core/Assert.h"
#include "tarmac/core/Log.h"

#include <cmath>
#include <future>
#include <utility>

namespace tarmac::material {

namespace {

uint8_t Quantize(double x) {
    // nearbyint rounds half to even under the default rounding mode
    return static_cast<uint8_t>(std::nearbyint(Saturate(x) * 255.0));
}

void ThrowIfFailed(const MaterialError& error, bool success) {
    if (!success) {
        throw MaterialException(error.code, error.message);
    }
}

} // namespace

VertexBaker::VertexBaker(const MaterialGraph& graph, BakeSettings settings)
    : m_Graph(graph)
    , m_Settings(std::move(settings)) {
    m_ShaderNode = m_Graph.FindNodeOfType(NodeType::TrackShader);
    if (m_ShaderNode == INVALID_NODE_ID) {
        TARMAC_CORE_WARN("Material '{}' has no track shader node", m_Graph.GetName());
    }
}

MaterialError VertexBaker::Wrap(const MaterialError& inner) const {
    return MaterialError{ inner.code,
        "Failed to bake for material '" + m_Graph.GetName() + "': " + inner.Report() };
}

template<typename T, typename F>
BakeResult<T> VertexBaker::Run(F bake) const {
    BakeResult<T> result;
    try {
        result.values = bake();
        result.success = true;
    } catch (const MaterialException& e) {
        result.values.clear();
        result.error = Wrap(e.ToError());
        TARMAC_CORE_ERROR("{}", result.error.message);
    }
    return result;
}

ExprRef VertexBaker::ReifyShaderInput(const std::string& socket) const {
    if (!HasShaderNode()) {
        throw MaterialException(MaterialErrorCode::MissingShaderNode,
            "Material '" + m_Graph.GetName() + "' has no track shader node");
    }

    PinID pin = m_Graph.FindInputPin(m_ShaderNode, socket);
    if (pin == INVALID_PIN_ID) {
        throw MaterialException(MaterialErrorCode::InvalidSocket,
            "Track shader has no input '" + socket + "'");
    }

    ReifyResult reified = Reify(m_Graph, pin);
    if (!reified.success) {
        std::string message = reified.error.message;
        if (reified.error.code == MaterialErrorCode::UnsupportedNode
            || reified.error.code == MaterialErrorCode::UnsupportedSocket) {
            message += " while baking '" + socket + "'";
        }
        throw MaterialException(reified.error.code, message);
    }
    return reified.expression;
}

std::vector<double> VertexBaker::BakeScalarChannel(const ElementContext& context, const std::string& socket) const {
    ScalarResult evaluated = EvaluateScalar(ReifyShaderInput(socket), context);
    ThrowIfFailed(evaluated.error, evaluated.success);
    return std::move(evaluated.values);
}

std::vector<BgraColor> VertexBaker::BakeColorChannel(const ElementContext& context) const {
    ColorResult colors = EvaluateColor(ReifyShaderInput(m_Settings.colorSocket), context);
    ThrowIfFailed(colors.error, colors.success);

    std::vector<double> alpha = BakeScalarChannel(context, m_Settings.alphaSocket);
    TARMAC_CORE_ASSERT(alpha.size() == colors.values.size(), "Color and alpha bakes differ in length");

    std::vector<BgraColor> packed(colors.values.size());
    for (size_t i = 0; i < packed.size(); ++i) {
        const glm::dvec3& c = colors.values[i];
        packed[i].b = Quantize(c.b);
        packed[i].g = Quantize(c.g);
        packed[i].r = Quantize(c.r);
        packed[i].a = Quantize(alpha[i]);
    }
    return packed;
}

std::vector<SwayValue> VertexBaker::BakeSwayChannel(const ElementContext& context) const {
    std::vector<double> frequency = BakeScalarChannel(context, m_Settings.swayFrequencySocket);
    std::vector<double> amplitude = BakeScalarChannel(context, m_Settings.swayAmplitudeSocket);
    std::vector<double> phase = BakeScalarChannel(context, m_Settings.swayPhaseSocket);

    std::vector<SwayValue> sway(frequency.size());
    for (size_t i = 0; i < sway.size(); ++i) {
        sway[i].amplitude = static_cast<float>(amplitude[i]);
        sway[i].angularFrequency = static_cast<float>(frequency[i]);
        sway[i].phaseOffset = static_cast<float>(phase[i]);
    }
    return sway;
}

BakeResult<BgraColor> VertexBaker::BakeColor(const ElementContext& context) const {
    return Run<BgraColor>([&]() { return BakeColorChannel(context); });
}

BakeResult<double> VertexBaker::BakeAlpha(const ElementContext& context) const {
    return Run<double>([&]() { return BakeScalarChannel(context, m_Settings.alphaSocket); });
}

BakeResult<double> VertexBaker::BakeSpecularStrength(const ElementContext& context) const {
    return Run<double>([&]() { return BakeScalarChannel(context, m_Settings.specularSocket); });
}

BakeResult<SwayValue> VertexBaker::BakeSway(const ElementContext& context) const {
    return Run<SwayValue>([&]() { return BakeSwayChannel(context); });
}

BakeAllResult VertexBaker::BakeAll(const ElementContext& context) const {
    const std::launch policy = m_Settings.parallelChannels ? std::launch::async : std::launch::deferred;

    auto colorFuture = std::async(policy, [&]() { return BakeColor(context); });
    auto alphaFuture = std::async(policy, [&]() { return BakeAlpha(context); });
    auto specularFuture = std::async(policy, [&]() { return BakeSpecularStrength(context); });
    auto swayFuture = std::async(policy, [&]() { return BakeSway(context); });

    BakeResult<BgraColor> color = colorFuture.get();
    BakeResult<double> alpha = alphaFuture.get();
    BakeResult<double> specular = specularFuture.get();
    BakeResult<SwayValue> sway = swayFuture.get();

    BakeAllResult result;
    if (!color.success) {
        result.error = color.error;
    } else if (!alpha.success) {
        result.error = alpha.error;
    } else if (!specular.success) {
        result.error = specular.error;
    } else if (!sway.success) {
        result.error = sway.error;
    } else {
        result.success = true;
        result.channels.color = std::move(color.values);
        result.channels.alpha = std::move(alpha.values);
        result.channels.specularStrength = std::move(specular.values);
        result.channels.sway = std::move(sway.values);
        TARMAC_CORE_DEBUG("Baked material '{}' over {} elements of '{}'",
            m_Graph.GetName(), context.GetElementCount(), context.GetMeshName());
    }
    return result;
}

} // namespace tarmac::material
