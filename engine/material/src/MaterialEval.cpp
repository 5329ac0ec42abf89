#include "tarmac/material/MaterialEval.h"
#include "tarmac/material/ColorMath.h"
#include "tarmac/core/Assert.h"
#include "tarmac/core/Log.h"

#include <glm/gtc/constants.hpp>
#include <cmath>
#include <type_traits>
#include <unordered_map>

namespace tarmac::material {

namespace {

// -----------------------
// Operator tables
// -----------------------

enum class MathOp {
    Add, Subtract, Multiply, Divide, MultiplyAdd, Power, Logarithm, Sqrt, InverseSqrt,
    Absolute, Exponent, Minimum, Maximum, LessThan, GreaterThan, Sign, Compare,
    SmoothMin, SmoothMax, Round, Floor, Ceil, Trunc, Fract, Modulo, Wrap, Snap, PingPong,
    Sine, Cosine, Tangent, Arcsine, Arccosine, Arctangent, Arctan2, Sinh, Cosh, Tanh,
    Radians, Degrees,
};

enum class VectorOp {
    Add, Subtract, Multiply, Divide, MultiplyAdd, Scale, CrossProduct, Project, Reflect,
    Faceforward, Normalize, Minimum, Maximum, Absolute, Floor, Ceil, Fraction, Snap, Modulo,
    Sine, Cosine, Tangent,
    // Scalar results
    DotProduct, Length, Distance,
};

enum class BlendMode {
    Mix, Darken, Multiply, Burn, Lighten, Screen, Dodge, Add, Overlay, SoftLight,
    LinearLight, Difference, Subtract, Divide, Hue, Saturation, Value, Color,
};

enum class RemapMode {
    Linear, Stepped, Smoothstep, Smootherstep,
};

template<typename Op>
Op LookupOperation(const std::unordered_map<std::string, Op>& table, const std::string& name, const char* family) {
    auto it = table.find(name);
    if (it == table.end()) {
        throw MaterialException(MaterialErrorCode::UnhandledOperation,
            std::string(family) + ": unhandled operation '" + name + "'");
    }
    return it->second;
}

MathOp ParseMathOp(const std::string& name) {
    static const std::unordered_map<std::string, MathOp> table = {
        { "ADD", MathOp::Add }, { "SUBTRACT", MathOp::Subtract }, { "MULTIPLY", MathOp::Multiply },
        { "DIVIDE", MathOp::Divide }, { "MULTIPLY_ADD", MathOp::MultiplyAdd }, { "POWER", MathOp::Power },
        { "LOGARITHM", MathOp::Logarithm }, { "SQRT", MathOp::Sqrt }, { "INVERSE_SQRT", MathOp::InverseSqrt },
        { "ABSOLUTE", MathOp::Absolute }, { "EXPONENT", MathOp::Exponent }, { "MINIMUM", MathOp::Minimum },
        { "MAXIMUM", MathOp::Maximum }, { "LESS_THAN", MathOp::LessThan }, { "GREATER_THAN", MathOp::GreaterThan },
        { "SIGN", MathOp::Sign }, { "COMPARE", MathOp::Compare }, { "SMOOTH_MIN", MathOp::SmoothMin },
        { "SMOOTH_MAX", MathOp::SmoothMax }, { "ROUND", MathOp::Round }, { "FLOOR", MathOp::Floor },
        { "CEIL", MathOp::Ceil }, { "TRUNC", MathOp::Trunc }, { "FRACT", MathOp::Fract },
        { "MODULO", MathOp::Modulo }, { "WRAP", MathOp::Wrap }, { "SNAP", MathOp::Snap },
        { "PINGPONG", MathOp::PingPong }, { "SINE", MathOp::Sine }, { "COSINE", MathOp::Cosine },
        { "TANGENT", MathOp::Tangent }, { "ARCSINE", MathOp::Arcsine }, { "ARCCOSINE", MathOp::Arccosine },
        { "ARCTANGENT", MathOp::Arctangent }, { "ARCTAN2", MathOp::Arctan2 }, { "SINH", MathOp::Sinh },
        { "COSH", MathOp::Cosh }, { "TANH", MathOp::Tanh }, { "RADIANS", MathOp::Radians },
        { "DEGREES", MathOp::Degrees },
    };
    return LookupOperation(table, name, "Math");
}

VectorOp ParseVectorOp(const std::string& name) {
    static const std::unordered_map<std::string, VectorOp> table = {
        { "ADD", VectorOp::Add }, { "SUBTRACT", VectorOp::Subtract }, { "MULTIPLY", VectorOp::Multiply },
        { "DIVIDE", VectorOp::Divide }, { "MULTIPLY_ADD", VectorOp::MultiplyAdd }, { "SCALE", VectorOp::Scale },
        { "CROSS_PRODUCT", VectorOp::CrossProduct }, { "PROJECT", VectorOp::Project },
        { "REFLECT", VectorOp::Reflect }, { "FACEFORWARD", VectorOp::Faceforward },
        { "NORMALIZE", VectorOp::Normalize }, { "MINIMUM", VectorOp::Minimum }, { "MAXIMUM", VectorOp::Maximum },
        { "ABSOLUTE", VectorOp::Absolute }, { "FLOOR", VectorOp::Floor }, { "CEIL", VectorOp::Ceil },
        { "FRACTION", VectorOp::Fraction }, { "SNAP", VectorOp::Snap }, { "MODULO", VectorOp::Modulo },
        { "SINE", VectorOp::Sine }, { "COSINE", VectorOp::Cosine }, { "TANGENT", VectorOp::Tangent },
        { "DOT_PRODUCT", VectorOp::DotProduct }, { "LENGTH", VectorOp::Length }, { "DISTANCE", VectorOp::Distance },
    };
    return LookupOperation(table, name, "Vector math");
}

bool IsScalarVectorOp(VectorOp op) {
    return op == VectorOp::DotProduct || op == VectorOp::Length || op == VectorOp::Distance;
}

BlendMode ParseBlendMode(const std::string& name) {
    static const std::unordered_map<std::string, BlendMode> table = {
        { "MIX", BlendMode::Mix }, { "DARKEN", BlendMode::Darken }, { "MULTIPLY", BlendMode::Multiply },
        { "BURN", BlendMode::Burn }, { "LIGHTEN", BlendMode::Lighten }, { "SCREEN", BlendMode::Screen },
        { "DODGE", BlendMode::Dodge }, { "ADD", BlendMode::Add }, { "OVERLAY", BlendMode::Overlay },
        { "SOFT_LIGHT", BlendMode::SoftLight }, { "LINEAR_LIGHT", BlendMode::LinearLight },
        { "DIFFERENCE", BlendMode::Difference }, { "SUBTRACT", BlendMode::Subtract },
        { "DIVIDE", BlendMode::Divide }, { "HUE", BlendMode::Hue }, { "SATURATION", BlendMode::Saturation },
        { "VALUE", BlendMode::Value }, { "COLOR", BlendMode::Color },
    };
    return LookupOperation(table, name, "Blend");
}

RemapMode ParseRemapMode(const std::string& name) {
    static const std::unordered_map<std::string, RemapMode> table = {
        { "LINEAR", RemapMode::Linear }, { "STEPPED", RemapMode::Stepped },
        { "SMOOTHSTEP", RemapMode::Smoothstep }, { "SMOOTHERSTEP", RemapMode::Smootherstep },
    };
    return LookupOperation(table, name, "Map range");
}

// -----------------------
// Per-element kernels
// -----------------------

double MathKernel(MathOp op, double a, double b, double c) {
    switch (op) {
        case MathOp::Add: return a + b;
        case MathOp::Subtract: return a - b;
        case MathOp::Multiply: return a * b;
        case MathOp::Divide: return SafeDivide(a, b);
        case MathOp::MultiplyAdd: return a * b + c;
        case MathOp::Power: {
            if (a >= 0.0) {
                return std::pow(a, b);
            }
            // Negative bases only for (near) integer exponents
            const double yMod1 = std::fabs(std::fmod(b, 1.0));
            if (yMod1 > 0.999 || yMod1 < 0.001) {
                return std::pow(a, std::floor(b + 0.5));
            }
            return 0.0;
        }
        case MathOp::Logarithm: return (a > 0.0 && b > 0.0) ? std::log(a) / std::log(b) : 0.0;
        case MathOp::Sqrt: return a > 0.0 ? std::sqrt(a) : 0.0;
        case MathOp::InverseSqrt: return a > 0.0 ? 1.0 / std::sqrt(a) : 0.0;
        case MathOp::Absolute: return std::fabs(a);
        case MathOp::Exponent: return std::exp(a);
        case MathOp::Minimum: return std::fmin(a, b);
        case MathOp::Maximum: return std::fmax(a, b);
        case MathOp::LessThan: return a < b ? 1.0 : 0.0;
        case MathOp::GreaterThan: return a > b ? 1.0 : 0.0;
        case MathOp::Sign: return static_cast<double>((a > 0.0) - (a < 0.0));
        case MathOp::Compare: return std::fabs(a - b) <= std::fmax(c, 1e-5) ? 1.0 : 0.0;
        case MathOp::SmoothMin: return SmoothMin(a, b, c);
        case MathOp::SmoothMax: return -SmoothMin(-a, -b, c);
        case MathOp::Round: return std::nearbyint(a);
        case MathOp::Floor: return std::floor(a);
        case MathOp::Ceil: return std::ceil(a);
        case MathOp::Trunc: return std::trunc(a);
        case MathOp::Fract: return Fract(a);
        case MathOp::Modulo: return b == 0.0 ? 0.0 : std::fmod(a, b);
        case MathOp::Wrap: {
            const double range = b - c;
            return range != 0.0 ? a - range * std::floor((a - c) / range) : c;
        }
        case MathOp::Snap: return (a == 0.0 || b == 0.0) ? 0.0 : std::floor(a / b) * b;
        case MathOp::PingPong:
            return b == 0.0 ? 0.0 : std::fabs(Fract((a - b) / (b * 2.0)) * b * 2.0 - b);
        case MathOp::Sine: return std::sin(a);
        case MathOp::Cosine: return std::cos(a);
        case MathOp::Tangent: return std::tan(a);
        case MathOp::Arcsine: return std::asin(a);
        case MathOp::Arccosine: return std::acos(a);
        case MathOp::Arctangent: return std::atan(a);
        case MathOp::Arctan2: return std::atan2(a, b);
        case MathOp::Sinh: return std::sinh(a);
        case MathOp::Cosh: return std::cosh(a);
        case MathOp::Tanh: return std::tanh(a);
        case MathOp::Radians: return glm::radians(a);
        case MathOp::Degrees: return glm::degrees(a);
    }
    return 0.0;
}

template<typename F>
glm::dvec3 PerChannel(const glm::dvec3& x, const glm::dvec3& y, F f) {
    return glm::dvec3(f(x.x, y.x), f(x.y, y.y), f(x.z, y.z));
}

template<typename F>
glm::dvec3 PerChannel(const glm::dvec3& x, F f) {
    return glm::dvec3(f(x.x), f(x.y), f(x.z));
}

glm::dvec3 VectorKernel(VectorOp op, const glm::dvec3& a, const glm::dvec3& b, const glm::dvec3& c, double scale) {
    switch (op) {
        case VectorOp::Add: return a + b;
        case VectorOp::Subtract: return a - b;
        case VectorOp::Multiply: return a * b;
        case VectorOp::Divide: return PerChannel(a, b, [](double x, double y) { return SafeDivide(x, y); });
        case VectorOp::MultiplyAdd: return a * b + c;
        case VectorOp::Scale: return a * scale;
        case VectorOp::CrossProduct: return glm::cross(a, b);
        case VectorOp::Project: {
            const double lenSquared = glm::dot(b, b);
            return lenSquared != 0.0 ? b * (glm::dot(a, b) / lenSquared) : glm::dvec3(0.0);
        }
        case VectorOp::Reflect: {
            const double len = glm::length(b);
            const glm::dvec3 n = len != 0.0 ? b / len : glm::dvec3(0.0);
            return a - 2.0 * glm::dot(n, a) * n;
        }
        case VectorOp::Faceforward: return glm::dot(c, b) < 0.0 ? a : -a;
        case VectorOp::Normalize: {
            const double len = glm::length(a);
            return len != 0.0 ? a / len : glm::dvec3(0.0);
        }
        case VectorOp::Minimum: return glm::min(a, b);
        case VectorOp::Maximum: return glm::max(a, b);
        case VectorOp::Absolute: return glm::abs(a);
        case VectorOp::Floor: return glm::floor(a);
        case VectorOp::Ceil: return glm::ceil(a);
        case VectorOp::Fraction: return a - glm::floor(a);
        case VectorOp::Snap:
            return PerChannel(a, b, [](double x, double y) { return y == 0.0 ? 0.0 : std::floor(x / y) * y; });
        case VectorOp::Modulo:
            return PerChannel(a, b, [](double x, double y) { return y == 0.0 ? 0.0 : std::fmod(x, y); });
        case VectorOp::Sine: return PerChannel(a, [](double x) { return std::sin(x); });
        case VectorOp::Cosine: return PerChannel(a, [](double x) { return std::cos(x); });
        case VectorOp::Tangent: return PerChannel(a, [](double x) { return std::tan(x); });
        case VectorOp::DotProduct:
        case VectorOp::Length:
        case VectorOp::Distance:
            break;
    }
    throw MaterialException(MaterialErrorCode::UnhandledOperation, "Vector math: operation has a scalar result");
}

double VectorScalarKernel(VectorOp op, const glm::dvec3& a, const glm::dvec3& b) {
    switch (op) {
        case VectorOp::DotProduct: return glm::dot(a, b);
        case VectorOp::Length: return glm::length(a);
        case VectorOp::Distance: return glm::length(a - b);
        default:
            break;
    }
    throw MaterialException(MaterialErrorCode::UnhandledOperation, "Vector math: operation has a vector result");
}

// Reference blend formulas; `fac` is not clamped.
glm::dvec3 BlendKernel(BlendMode mode, double fac, const glm::dvec3& c1, const glm::dvec3& c2) {
    const double inv = 1.0 - fac;

    switch (mode) {
        case BlendMode::Mix:
            return inv * c1 + fac * c2;
        case BlendMode::Darken:
            return glm::min(c1, c2) * fac + c1 * inv;
        case BlendMode::Multiply:
            return c1 * (inv + fac * c2);
        case BlendMode::Burn:
            return PerChannel(c1, c2, [&](double a, double b) {
                const double tmp = inv + fac * b;
                return tmp <= 0.0 ? 0.0 : 1.0 - (1.0 - a) / tmp;
            });
        case BlendMode::Lighten:
            return PerChannel(c1, c2, [&](double a, double b) {
                const double tmp = fac * b;
                return tmp > a ? tmp : a;
            });
        case BlendMode::Screen:
            return 1.0 - (inv + fac * (1.0 - c2)) * (1.0 - c1);
        case BlendMode::Dodge:
            return PerChannel(c1, c2, [&](double a, double b) {
                if (a == 0.0) return 0.0;
                const double tmp = 1.0 - fac * b;
                return tmp <= 0.0 ? 1.0 : std::fmin(a / tmp, 1.0);
            });
        case BlendMode::Add:
            return c1 + fac * c2;
        case BlendMode::Overlay:
            return PerChannel(c1, c2, [&](double a, double b) {
                if (a < 0.5) return a * (inv + 2.0 * fac * b);
                return 1.0 - (inv + 2.0 * fac * (1.0 - b)) * (1.0 - a);
            });
        case BlendMode::SoftLight: {
            const glm::dvec3 screen = 1.0 - (1.0 - c2) * (1.0 - c1);
            return inv * c1 + fac * ((1.0 - c1) * c2 * c1 + c1 * screen);
        }
        case BlendMode::LinearLight:
            return PerChannel(c1, c2, [&](double a, double b) {
                if (b > 0.5) return a + fac * (2.0 * (b - 0.5));
                return a + fac * (2.0 * b - 1.0);
            });
        case BlendMode::Difference:
            return inv * c1 + fac * glm::abs(c1 - c2);
        case BlendMode::Subtract:
            return c1 - fac * c2;
        case BlendMode::Divide:
            return PerChannel(c1, c2, [&](double a, double b) {
                return b != 0.0 ? inv * a + fac * a / b : a;
            });

        // HSV modes; a zero saturation has no hue, so those fall back to the base color
        case BlendMode::Hue: {
            const glm::dvec3 hsv1 = RgbToHsv(c1);
            const glm::dvec3 hsv2 = RgbToHsv(c2);
            const glm::dvec3 rgb = hsv2.y != 0.0 ? HsvToRgb(glm::dvec3(hsv2.x, hsv1.y, hsv1.z)) : c1;
            return inv * c1 + fac * rgb;
        }
        case BlendMode::Saturation: {
            const glm::dvec3 hsv1 = RgbToHsv(c1);
            const glm::dvec3 hsv2 = RgbToHsv(c2);
            if (hsv1.y == 0.0) return c1;
            return HsvToRgb(glm::dvec3(hsv1.x, inv * hsv1.y + fac * hsv2.y, hsv1.z));
        }
        case BlendMode::Value: {
            const glm::dvec3 hsv1 = RgbToHsv(c1);
            const glm::dvec3 hsv2 = RgbToHsv(c2);
            return HsvToRgb(glm::dvec3(hsv1.x, hsv1.y, inv * hsv1.z + fac * hsv2.z));
        }
        case BlendMode::Color: {
            const glm::dvec3 hsv1 = RgbToHsv(c1);
            const glm::dvec3 hsv2 = RgbToHsv(c2);
            if (hsv2.y == 0.0) return c1;
            return inv * c1 + fac * HsvToRgb(glm::dvec3(hsv2.x, hsv2.y, hsv1.z));
        }
    }
    return c1;
}

glm::dvec4 GradientKernel(const expr::Gradient& gradient, double fac) {
    const auto& stops = gradient.stops;
    TARMAC_CORE_ASSERT(!stops.empty(), "Gradient without stops");

    // Right-biased fold: a later segment wins whenever fac lies past its left stop
    glm::dvec4 result = stops.front().color;
    for (size_t i = 0; i + 1 < stops.size(); ++i) {
        const expr::GradientStop& left = stops[i];
        const expr::GradientStop& right = stops[i + 1];

        double t = 0.0;
        if (gradient.interpolation == expr::GradientInterpolation::Linear && left.position != right.position) {
            t = (fac - left.position) / (right.position - left.position);
        }
        if (fac > left.position) {
            result = (1.0 - t) * left.color + t * right.color;
        }
    }
    if (fac >= stops.back().position) {
        result = stops.back().color;
    }
    return result;
}

// -----------------------
// Natural result kind of each variant. The other kind is derived by coercion.
// -----------------------

enum class NaturalKind { Color, Scalar, Both };

template<typename T> struct NaturalKindOf;  // every variant declares one
template<> struct NaturalKindOf<expr::ConstantColor> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::ConstantScalar> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::AttributeColor> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::AttributeScalar> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::GeometryPosition> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::GeometryNormal> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::Math> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::VectorMath> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::VectorMathScalar> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::Blend> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::Invert> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::Grayscale> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::Clamp> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::BrightContrast> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::Gamma> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::SeparateChannel> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::CombineChannels> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::Gradient> { static constexpr NaturalKind value = NaturalKind::Both; };
template<> struct NaturalKindOf<expr::MapRange> { static constexpr NaturalKind value = NaturalKind::Scalar; };
template<> struct NaturalKindOf<expr::HueSaturationValue> { static constexpr NaturalKind value = NaturalKind::Color; };
template<> struct NaturalKindOf<expr::GroupWrapper> { static constexpr NaturalKind value = NaturalKind::Both; };
template<> struct NaturalKindOf<expr::UnresolvedGroupInput> { static constexpr NaturalKind value = NaturalKind::Both; };

// -----------------------
// Evaluator
// -----------------------

class Evaluator {
public:
    explicit Evaluator(const ElementContext& context)
        : m_Context(context)
        , m_Count(context.GetElementCount()) {
    }

    ColorArray Color(const ExprRef& e) {
        return std::visit([this](const auto& n) -> ColorArray {
            using T = std::decay_t<decltype(n)>;
            if constexpr (NaturalKindOf<T>::value == NaturalKind::Scalar) {
                return Broadcast(EvalScalar(n));
            } else {
                return EvalColor(n);
            }
        }, Node(e));
    }

    ScalarArray Scalar(const ExprRef& e) {
        return std::visit([this](const auto& n) -> ScalarArray {
            using T = std::decay_t<decltype(n)>;
            if constexpr (NaturalKindOf<T>::value == NaturalKind::Color) {
                return ToLuminance(EvalColor(n));
            } else {
                return EvalScalar(n);
            }
        }, Node(e));
    }

private:
    const ExpressionNode& Node(const ExprRef& e) const {
        if (!e) {
            throw MaterialException(MaterialErrorCode::UnhandledOperation, "Null expression");
        }
        return e->node;
    }

    ColorArray Broadcast(const ScalarArray& values) const {
        ColorArray out(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            out[i] = glm::dvec3(values[i]);
        }
        return out;
    }

    ScalarArray ToLuminance(const ColorArray& values) const {
        ScalarArray out(values.size());
        for (size_t i = 0; i < values.size(); ++i) {
            out[i] = Luminance(values[i]);
        }
        return out;
    }

    MaterialException MissingAttribute(const std::string& name) const {
        return MaterialException(MaterialErrorCode::MissingAttribute,
            "Mesh '" + m_Context.GetMeshName() + "' does not have required attribute '" + name + "'");
    }

    // Constants and element data

    ColorArray EvalColor(const expr::ConstantColor& n) { return ColorArray(m_Count, n.value); }
    ScalarArray EvalScalar(const expr::ConstantScalar& n) { return ScalarArray(m_Count, n.value); }

    ColorArray EvalColor(const expr::AttributeColor& n) {
        ColorArray out;
        if (!m_Context.ReadColor(n.name, out)) throw MissingAttribute(n.name);
        return out;
    }

    ScalarArray EvalScalar(const expr::AttributeScalar& n) {
        ScalarArray out;
        const bool found = n.channel == expr::AttributeChannel::Alpha
            ? m_Context.ReadAlpha(n.name, out)
            : m_Context.ReadAverage(n.name, out);
        if (!found) throw MissingAttribute(n.name);
        return out;
    }

    ColorArray EvalColor(const expr::GeometryPosition&) {
        const ColorArray* positions = m_Context.GetPositions();
        if (!positions) throw MissingAttribute("position");
        return *positions;
    }

    ColorArray EvalColor(const expr::GeometryNormal&) {
        const ColorArray* normals = m_Context.GetNormals();
        if (!normals) throw MissingAttribute("normal");
        return *normals;
    }

    // Math

    ScalarArray EvalScalar(const expr::Math& n) {
        const MathOp op = ParseMathOp(n.operation);
        const ScalarArray a = Scalar(n.a);
        const ScalarArray b = Scalar(n.b);
        const ScalarArray c = Scalar(n.c);

        ScalarArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const double r = MathKernel(op, a[i], b[i], c[i]);
            out[i] = n.clamp ? Saturate(r) : r;
        }
        return out;
    }

    ColorArray EvalColor(const expr::VectorMath& n) {
        const VectorOp op = ParseVectorOp(n.operation);
        if (IsScalarVectorOp(op)) {
            throw MaterialException(MaterialErrorCode::UnhandledOperation,
                "Vector math: '" + n.operation + "' has no vector result");
        }
        const ColorArray a = Color(n.a);
        const ColorArray b = Color(n.b);
        const ColorArray c = Color(n.c);
        const ScalarArray scale = Scalar(n.scale);

        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            out[i] = VectorKernel(op, a[i], b[i], c[i], scale[i]);
        }
        return out;
    }

    ScalarArray EvalScalar(const expr::VectorMathScalar& n) {
        const VectorOp op = ParseVectorOp(n.operation);
        if (!IsScalarVectorOp(op)) {
            throw MaterialException(MaterialErrorCode::UnhandledOperation,
                "Vector math: '" + n.operation + "' has no scalar result");
        }
        const ColorArray a = Color(n.a);
        const ColorArray b = Color(n.b);

        ScalarArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            out[i] = VectorScalarKernel(op, a[i], b[i]);
        }
        return out;
    }

    // Color

    ColorArray EvalColor(const expr::Blend& n) {
        const BlendMode mode = ParseBlendMode(n.blendType);
        // Use Clamp also bounds the HSV modes
        const bool clamp = n.clamp || mode == BlendMode::Burn;
        const ScalarArray fac = Scalar(n.fac);
        const ColorArray c1 = Color(n.color1);
        const ColorArray c2 = Color(n.color2);

        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const glm::dvec3 mixed = BlendKernel(mode, fac[i], c1[i], c2[i]);
            out[i] = clamp ? material::Clamp(mixed, 0.0, 1.0) : mixed;
        }
        return out;
    }

    ColorArray EvalColor(const expr::Invert& n) {
        const ScalarArray fac = Scalar(n.fac);
        const ColorArray color = Color(n.color);

        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            out[i] = (1.0 - color[i]) * fac[i] + color[i] * (1.0 - fac[i]);
        }
        return out;
    }

    ScalarArray EvalScalar(const expr::Grayscale& n) {
        return Scalar(n.color);
    }

    ScalarArray EvalScalar(const expr::Clamp& n) {
        if (n.clampType != "MINMAX") {
            throw MaterialException(MaterialErrorCode::UnsupportedNode,
                "Clamp type '" + n.clampType + "' is not supported, use Min Max");
        }
        const ScalarArray value = Scalar(n.value);
        const ScalarArray lo = Scalar(n.min);
        const ScalarArray hi = Scalar(n.max);

        ScalarArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            out[i] = material::Clamp(value[i], lo[i], hi[i]);
        }
        return out;
    }

    ColorArray EvalColor(const expr::BrightContrast& n) {
        const ColorArray color = Color(n.color);
        const ScalarArray bright = Scalar(n.bright);
        const ScalarArray contrast = Scalar(n.contrast);

        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const double a = 1.0 + contrast[i];
            const double b = bright[i] - contrast[i] * 0.5;
            out[i] = glm::max(a * color[i] + b, glm::dvec3(0.0));
        }
        return out;
    }

    ColorArray EvalColor(const expr::Gamma& n) {
        const ColorArray color = Color(n.color);
        const ScalarArray gamma = Scalar(n.gamma);

        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const double g = gamma[i];
            out[i] = PerChannel(color[i], [g](double x) { return x > 0.0 ? std::pow(x, g) : x; });
        }
        return out;
    }

    // Channels

    ScalarArray EvalScalar(const expr::SeparateChannel& n) {
        if (n.channel < 0 || n.channel > 2) {
            throw MaterialException(MaterialErrorCode::UnhandledOperation,
                "Separate: channel " + std::to_string(n.channel) + " out of range");
        }
        const ColorArray input = Color(n.input);

        ScalarArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const glm::dvec3 v = n.space == expr::ChannelSpace::HSV ? RgbToHsv(input[i]) : input[i];
            out[i] = v[n.channel];
        }
        return out;
    }

    ColorArray EvalColor(const expr::CombineChannels& n) {
        const ScalarArray a = Scalar(n.a);
        const ScalarArray b = Scalar(n.b);
        const ScalarArray c = Scalar(n.c);

        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const glm::dvec3 v(a[i], b[i], c[i]);
            out[i] = n.space == expr::ChannelSpace::HSV ? HsvToRgb(v) : v;
        }
        return out;
    }

    // Gradient: color output reads RGB, alpha output reads A

    std::vector<glm::dvec4> EvalGradient(const expr::Gradient& n) {
        if (n.stops.empty()) {
            throw MaterialException(MaterialErrorCode::UnsupportedNode, "Color ramp has no stops");
        }
        const ScalarArray fac = Scalar(n.fac);

        std::vector<glm::dvec4> out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            out[i] = GradientKernel(n, fac[i]);
        }
        return out;
    }

    ColorArray EvalColor(const expr::Gradient& n) {
        const std::vector<glm::dvec4> rgba = EvalGradient(n);
        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            out[i] = n.alphaOutput ? glm::dvec3(rgba[i].a) : glm::dvec3(rgba[i]);
        }
        return out;
    }

    ScalarArray EvalScalar(const expr::Gradient& n) {
        const std::vector<glm::dvec4> rgba = EvalGradient(n);
        ScalarArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            out[i] = n.alphaOutput ? rgba[i].a : Luminance(glm::dvec3(rgba[i]));
        }
        return out;
    }

    ScalarArray EvalScalar(const expr::MapRange& n) {
        const RemapMode mode = ParseRemapMode(n.interpolation);
        const ScalarArray value = Scalar(n.value);
        const ScalarArray fromMin = Scalar(n.fromMin);
        const ScalarArray fromMax = Scalar(n.fromMax);
        const ScalarArray toMin = Scalar(n.toMin);
        const ScalarArray toMax = Scalar(n.toMax);
        const ScalarArray steps = Scalar(n.steps);

        // The smoothstep modes are bounded already
        const bool clamp = n.clamp && (mode == RemapMode::Linear || mode == RemapMode::Stepped);

        ScalarArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const double lo = fromMin[i];
            const double hi = fromMax[i];
            if (lo == hi) {
                out[i] = 0.0;
                continue;
            }

            double factor = value[i];
            switch (mode) {
                case RemapMode::Linear:
                    factor = SafeDivide(value[i] - lo, hi - lo);
                    break;
                case RemapMode::Stepped:
                    factor = SafeDivide(value[i] - lo, hi - lo);
                    factor = steps[i] > 0.0 ? std::floor(factor * (steps[i] + 1.0)) / steps[i] : 0.0;
                    break;
                case RemapMode::Smoothstep:
                    factor = lo > hi ? 1.0 - Smoothstep(hi, lo, value[i]) : Smoothstep(lo, hi, value[i]);
                    break;
                case RemapMode::Smootherstep:
                    factor = lo > hi ? 1.0 - Smootherstep(hi, lo, value[i]) : Smootherstep(lo, hi, value[i]);
                    break;
            }

            const double result = toMin[i] + factor * (toMax[i] - toMin[i]);
            out[i] = clamp ? Saturate(result) : result;
        }
        return out;
    }

    ColorArray EvalColor(const expr::HueSaturationValue& n) {
        const ScalarArray hue = Scalar(n.hue);
        const ScalarArray saturation = Scalar(n.saturation);
        const ScalarArray value = Scalar(n.value);
        const ScalarArray fac = Scalar(n.fac);
        const ColorArray color = Color(n.color);

        ColorArray out(m_Count);
        for (size_t i = 0; i < m_Count; ++i) {
            const glm::dvec3 hsv = RgbToHsv(color[i]);
            const glm::dvec3 adjusted = HsvToRgb(glm::dvec3(
                std::fmod(hsv.x + hue[i] + 0.5, 1.0),
                Saturate(hsv.y * saturation[i]),
                hsv.z * value[i]));
            out[i] = glm::max(fac[i] * adjusted + (1.0 - fac[i]) * color[i], glm::dvec3(0.0));
        }
        return out;
    }

    // Groups

    ColorArray EvalColor(const expr::GroupWrapper& n) { return Color(n.inner); }
    ScalarArray EvalScalar(const expr::GroupWrapper& n) { return Scalar(n.inner); }

    MaterialException Unbound(const expr::UnresolvedGroupInput& n) const {
        return MaterialException(MaterialErrorCode::UnboundGroupInput,
            "Group input '" + n.identifier + "' was not bound before evaluation");
    }
    ColorArray EvalColor(const expr::UnresolvedGroupInput& n) { throw Unbound(n); }
    ScalarArray EvalScalar(const expr::UnresolvedGroupInput& n) { throw Unbound(n); }

    const ElementContext& m_Context;
    size_t m_Count = 0;
};

template<typename T, typename F>
EvalResult<T> RunEvaluation(const ExprRef& expression, const ElementContext& context, F evaluate) {
    EvalResult<T> result;
    if (Log::GetCoreLogger()->should_log(spdlog::level::trace)) {
        TARMAC_CORE_TRACE("Evaluating {} over {} elements of '{}'",
            ToString(expression), context.GetElementCount(), context.GetMeshName());
    }
    try {
        Evaluator evaluator(context);
        result.values = evaluate(evaluator);
        result.success = true;
    } catch (const MaterialException& e) {
        result.error = e.ToError();
        if (IsInternalError(e.GetCode())) {
            TARMAC_CORE_ERROR("Material evaluation failed: {}", result.error.Report());
        } else {
            TARMAC_CORE_WARN("Material evaluation failed: {}", result.error.Report());
        }
    }
    return result;
}

} // namespace

ColorResult EvaluateColor(const ExprRef& expression, const ElementContext& context) {
    return RunEvaluation<ColorArray>(expression, context,
        [&](Evaluator& evaluator) { return evaluator.Color(expression); });
}

ScalarResult EvaluateScalar(const ExprRef& expression, const ElementContext& context) {
    return RunEvaluation<ScalarArray>(expression, context,
        [&](Evaluator& evaluator) { return evaluator.Scalar(expression); });
}

} // namespace tarmac::material
