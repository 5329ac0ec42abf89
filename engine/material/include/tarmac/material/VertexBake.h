#pragma once

#include "tarmac/material/BakeSettings.h"
#include "tarmac/material/ElementContext.h"
#include "tarmac/material/Expression.h"
#include "tarmac/material/MaterialErrors.h"
#include "tarmac/material/MaterialGraph.h"

#include <cstdint>
#include <vector>

namespace tarmac::material {

// Vertex color as stored in track vertex buffers
struct BgraColor {
    uint8_t b = 0;
    uint8_t g = 0;
    uint8_t r = 0;
    uint8_t a = 0;
};

struct SwayValue {
    float amplitude = 0.0f;
    float angularFrequency = 0.0f;
    float phaseOffset = 0.0f;
};

template<typename T>
struct BakeResult {
    bool success = false;
    std::vector<T> values;
    MaterialError error;
};

struct BakedChannels {
    std::vector<BgraColor> color;
    std::vector<double> alpha;
    std::vector<double> specularStrength;
    std::vector<SwayValue> sway;
};

struct BakeAllResult {
    bool success = false;
    BakedChannels channels;
    MaterialError error;    // First failing channel in color, alpha, specular, sway order
};

// Bakes the inputs of a material's TrackShader node into per-element vertex
// data. The graph must outlive the baker. Bakes never modify the graph or the
// context, so one baker may serve several threads.
class VertexBaker {
public:
    explicit VertexBaker(const MaterialGraph& graph, BakeSettings settings = {});

    // False when the graph has no TrackShader node; every bake then fails
    // with MissingShaderNode.
    bool HasShaderNode() const { return m_ShaderNode != INVALID_NODE_ID; }
    const BakeSettings& GetSettings() const { return m_Settings; }

    // Color and alpha clamped to [0, 1] and rounded to 8 bits
    BakeResult<BgraColor> BakeColor(const ElementContext& context) const;
    BakeResult<double> BakeAlpha(const ElementContext& context) const;
    BakeResult<double> BakeSpecularStrength(const ElementContext& context) const;
    BakeResult<SwayValue> BakeSway(const ElementContext& context) const;

    BakeAllResult BakeAll(const ElementContext& context) const;

private:
    ExprRef ReifyShaderInput(const std::string& socket) const;
    std::vector<BgraColor> BakeColorChannel(const ElementContext& context) const;
    std::vector<double> BakeScalarChannel(const ElementContext& context, const std::string& socket) const;
    std::vector<SwayValue> BakeSwayChannel(const ElementContext& context) const;

    template<typename T, typename F>
    BakeResult<T> Run(F bake) const;

    MaterialError Wrap(const MaterialError& inner) const;

    const MaterialGraph& m_Graph;
    BakeSettings m_Settings;
    NodeID m_ShaderNode = INVALID_NODE_ID;
};

} // namespace tarmac::material
