#pragma once

#include "tarmac/core/Base.h"
#include <glm/glm.hpp>
#include <string>
#include <variant>
#include <vector>

namespace tarmac::material {

// Expression IR produced by reification and consumed by the evaluator.
// Expressions are immutable; children are shared by reference, so a subtree
// can appear under several parents and be evaluated from each of them.

struct Expression;
using ExprRef = Ref<const Expression>;

namespace expr {

struct ConstantColor {
    glm::dvec3 value{ 0.0 };
};

struct ConstantScalar {
    double value = 0.0;
};

// RGB of a named attribute layer
struct AttributeColor {
    std::string name;
};

enum class AttributeChannel {
    Average,    // (r + g + b) / 3
    Alpha,
};

struct AttributeScalar {
    std::string name;
    AttributeChannel channel = AttributeChannel::Average;
};

struct GeometryPosition {};
struct GeometryNormal {};

struct Math {
    std::string operation;
    bool clamp = false;
    ExprRef a, b, c;
};

// Vector-valued vector math
struct VectorMath {
    std::string operation;
    ExprRef a, b, c, scale;
};

// Scalar-valued vector math (DOT_PRODUCT, LENGTH, DISTANCE)
struct VectorMathScalar {
    std::string operation;
    ExprRef a, b;
};

struct Blend {
    std::string blendType;
    bool clamp = false;
    ExprRef fac, color1, color2;
};

struct Invert {
    ExprRef fac, color;
};

struct Grayscale {
    ExprRef color;
};

struct Clamp {
    std::string clampType;
    ExprRef value, min, max;
};

struct BrightContrast {
    ExprRef color, bright, contrast;
};

struct Gamma {
    ExprRef color, gamma;
};

enum class ChannelSpace {
    RGB,
    XYZ,
    HSV,
};

struct SeparateChannel {
    ChannelSpace space = ChannelSpace::RGB;
    int channel = 0;    // 0..2
    ExprRef input;
};

struct CombineChannels {
    ChannelSpace space = ChannelSpace::RGB;
    ExprRef a, b, c;
};

struct GradientStop {
    double position = 0.0;
    glm::dvec4 color{ 0.0, 0.0, 0.0, 1.0 };
};

enum class GradientInterpolation {
    Linear,
    Constant,
};

// Stops are sorted by position and never empty
struct Gradient {
    std::vector<GradientStop> stops;
    GradientInterpolation interpolation = GradientInterpolation::Linear;
    bool alphaOutput = false;
    ExprRef fac;
};

struct MapRange {
    std::string interpolation;
    bool clamp = true;
    ExprRef value, fromMin, fromMax, toMin, toMax, steps;
};

struct HueSaturationValue {
    ExprRef hue, saturation, value, fac, color;
};

// Result of a group instance; forwards `inner`
struct GroupWrapper {
    std::string name;
    ExprRef inner;
};

// Reference to a group input inside a group body, bound by substitution
struct UnresolvedGroupInput {
    std::string identifier;
};

} // namespace expr

using ExpressionNode = std::variant<
    expr::ConstantColor,
    expr::ConstantScalar,
    expr::AttributeColor,
    expr::AttributeScalar,
    expr::GeometryPosition,
    expr::GeometryNormal,
    expr::Math,
    expr::VectorMath,
    expr::VectorMathScalar,
    expr::Blend,
    expr::Invert,
    expr::Grayscale,
    expr::Clamp,
    expr::BrightContrast,
    expr::Gamma,
    expr::SeparateChannel,
    expr::CombineChannels,
    expr::Gradient,
    expr::MapRange,
    expr::HueSaturationValue,
    expr::GroupWrapper,
    expr::UnresolvedGroupInput
>;

struct Expression {
    ExpressionNode node;

    template<typename T>
    bool Is() const { return std::holds_alternative<T>(node); }

    template<typename T>
    const T& As() const { return std::get<T>(node); }
};

inline ExprRef MakeExpression(ExpressionNode node) {
    return CreateRef<const Expression>(Expression{ std::move(node) });
}

// Single-line debug rendering, e.g. "Math(ADD, 2, 3)"
std::string ToString(const ExprRef& expression);

} // namespace tarmac::material
