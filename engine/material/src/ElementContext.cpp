#include "tarmac/material/ElementContext.h"
#include "tarmac/material/ColorMath.h"
#include "tarmac/core/Log.h"

namespace tarmac::material {

ElementContext::ElementContext(size_t elementCount, const std::string& meshName)
    : m_ElementCount(elementCount)
    , m_MeshName(meshName) {
}

bool ElementContext::SetCornerVertexIndices(std::vector<uint32_t> indices) {
    if (indices.size() != m_ElementCount) {
        TARMAC_CORE_ERROR("Mesh '{}': corner index table has {} entries, expected {}",
            m_MeshName, indices.size(), m_ElementCount);
        return false;
    }
    m_CornerVertices = std::move(indices);
    return true;
}

template<typename T>
bool ElementContext::ExpandToCorners(std::vector<T>& values, AttributeDomain domain, const std::string& what) const {
    if (domain == AttributeDomain::Corner) {
        if (values.size() != m_ElementCount) {
            TARMAC_CORE_ERROR("Mesh '{}': '{}' has {} corner values, expected {}",
                m_MeshName, what, values.size(), m_ElementCount);
            return false;
        }
        return true;
    }

    if (m_CornerVertices.size() != m_ElementCount) {
        TARMAC_CORE_ERROR("Mesh '{}': '{}' is stored per vertex but no corner index table was set",
            m_MeshName, what);
        return false;
    }

    std::vector<T> expanded;
    expanded.reserve(m_ElementCount);
    for (uint32_t vertex : m_CornerVertices) {
        if (vertex >= values.size()) {
            TARMAC_CORE_ERROR("Mesh '{}': '{}' has {} vertex values, corner references vertex {}",
                m_MeshName, what, values.size(), vertex);
            return false;
        }
        expanded.push_back(values[vertex]);
    }
    values = std::move(expanded);
    return true;
}

bool ElementContext::AddColorAttribute(const std::string& name, std::vector<glm::dvec4> values,
                                       AttributeDomain domain) {
    if (!ExpandToCorners(values, domain, name)) {
        return false;
    }
    AttributeLayer layer;
    layer.isColor = true;
    layer.colors = std::move(values);
    m_Attributes[name] = std::move(layer);
    return true;
}

bool ElementContext::AddScalarAttribute(const std::string& name, std::vector<double> values,
                                        AttributeDomain domain) {
    if (!ExpandToCorners(values, domain, name)) {
        return false;
    }
    AttributeLayer layer;
    layer.isColor = false;
    layer.scalars = std::move(values);
    m_Attributes[name] = std::move(layer);
    return true;
}

bool ElementContext::SetPositions(const std::vector<glm::dvec3>& vertexPositions) {
    std::vector<glm::dvec3> values = vertexPositions;
    if (!ExpandToCorners(values, AttributeDomain::Point, "position")) {
        return false;
    }
    m_Positions = std::move(values);
    m_HasPositions = true;
    return true;
}

bool ElementContext::SetNormals(std::vector<glm::dvec3> cornerNormals) {
    if (!ExpandToCorners(cornerNormals, AttributeDomain::Corner, "normal")) {
        return false;
    }
    m_Normals = std::move(cornerNormals);
    m_HasNormals = true;
    return true;
}

const ElementContext::AttributeLayer* ElementContext::FindLayer(const std::string& name) const {
    auto it = m_Attributes.find(name);
    return it != m_Attributes.end() ? &it->second : nullptr;
}

bool ElementContext::HasAttribute(const std::string& name) const {
    return FindLayer(name) != nullptr;
}

bool ElementContext::ReadColor(const std::string& name, ColorArray& out) const {
    const AttributeLayer* layer = FindLayer(name);
    if (!layer) return false;

    out.resize(m_ElementCount);
    for (size_t i = 0; i < m_ElementCount; ++i) {
        out[i] = layer->isColor ? glm::dvec3(layer->colors[i]) : glm::dvec3(layer->scalars[i]);
    }
    return true;
}

bool ElementContext::ReadAverage(const std::string& name, ScalarArray& out) const {
    const AttributeLayer* layer = FindLayer(name);
    if (!layer) return false;

    out.resize(m_ElementCount);
    for (size_t i = 0; i < m_ElementCount; ++i) {
        if (layer->isColor) {
            // Mean of r, g, b like the shading node's Fac, not the plain channel sum
            out[i] = ChannelAverage(glm::dvec3(layer->colors[i]));
        } else {
            out[i] = layer->scalars[i];
        }
    }
    return true;
}

bool ElementContext::ReadAlpha(const std::string& name, ScalarArray& out) const {
    const AttributeLayer* layer = FindLayer(name);
    if (!layer) return false;

    out.resize(m_ElementCount);
    for (size_t i = 0; i < m_ElementCount; ++i) {
        out[i] = layer->isColor ? layer->colors[i].a : 1.0;
    }
    return true;
}

} // namespace tarmac::material
