#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tarmac::material {

// Dense per-element arrays produced by evaluation
using ColorArray = std::vector<glm::dvec3>;
using ScalarArray = std::vector<double>;

// Where an attribute layer stores its values
enum class AttributeDomain {
    Corner,     // One value per face corner (the element domain)
    Point,      // One value per vertex, expanded through the corner->vertex table
};

// Per-mesh element data the evaluator reads from. Filled by the mesh side,
// read-only during evaluation. Every array it hands out has GetElementCount()
// entries.
class ElementContext {
public:
    explicit ElementContext(size_t elementCount, const std::string& meshName = "");

    size_t GetElementCount() const { return m_ElementCount; }
    const std::string& GetMeshName() const { return m_MeshName; }

    // Required before adding Point-domain data; one vertex index per corner.
    bool SetCornerVertexIndices(std::vector<uint32_t> indices);

    // Layers are rejected (false, logged) when their size does not match the
    // domain or a vertex index is out of range. Re-adding a name replaces it.
    bool AddColorAttribute(const std::string& name, std::vector<glm::dvec4> values,
                           AttributeDomain domain = AttributeDomain::Corner);
    bool AddScalarAttribute(const std::string& name, std::vector<double> values,
                            AttributeDomain domain = AttributeDomain::Corner);

    // Positions are given per vertex, normals per corner
    bool SetPositions(const std::vector<glm::dvec3>& vertexPositions);
    bool SetNormals(std::vector<glm::dvec3> cornerNormals);

    bool HasAttribute(const std::string& name) const;

    // False when the layer is absent; `out` is left untouched then.
    // Scalar layers broadcast for ReadColor and read 1 for ReadAlpha.
    bool ReadColor(const std::string& name, ColorArray& out) const;
    bool ReadAverage(const std::string& name, ScalarArray& out) const;
    bool ReadAlpha(const std::string& name, ScalarArray& out) const;

    // nullptr when not provided
    const ColorArray* GetPositions() const { return m_HasPositions ? &m_Positions : nullptr; }
    const ColorArray* GetNormals() const { return m_HasNormals ? &m_Normals : nullptr; }

private:
    struct AttributeLayer {
        bool isColor = true;
        std::vector<glm::dvec4> colors;
        std::vector<double> scalars;
    };

    template<typename T>
    bool ExpandToCorners(std::vector<T>& values, AttributeDomain domain, const std::string& what) const;

    const AttributeLayer* FindLayer(const std::string& name) const;

    size_t m_ElementCount = 0;
    std::string m_MeshName;

    std::vector<uint32_t> m_CornerVertices;
    std::unordered_map<std::string, AttributeLayer> m_Attributes;

    ColorArray m_Positions;
    ColorArray m_Normals;
    bool m_HasPositions = false;
    bool m_HasNormals = false;
};

} // namespace tarmac::material
