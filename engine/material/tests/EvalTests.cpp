#include "tarmac/material/ColorMath.h"
#include "tarmac/material/MaterialEval.h"

#include <catch2/catch.hpp>

using namespace tarmac::material;

namespace {

ExprRef Scalar(double value) {
    return MakeExpression(expr::ConstantScalar{ value });
}

ExprRef Color(const glm::dvec3& value) {
    return MakeExpression(expr::ConstantColor{ value });
}

ExprRef Blend(const std::string& mode, bool clamp, ExprRef fac, ExprRef color1, ExprRef color2) {
    return MakeExpression(expr::Blend{ mode, clamp, std::move(fac), std::move(color1), std::move(color2) });
}

ExprRef BlackToWhite(double fac) {
    expr::Gradient gradient;
    gradient.stops = {
        { 0.0, glm::dvec4(0.0, 0.0, 0.0, 1.0) },
        { 1.0, glm::dvec4(1.0, 1.0, 1.0, 1.0) },
    };
    gradient.fac = Scalar(fac);
    return MakeExpression(std::move(gradient));
}

ColorArray EvalColorOrFail(const ExprRef& e, const ElementContext& ctx) {
    ColorResult result = EvaluateColor(e, ctx);
    INFO(result.error.Report());
    REQUIRE(result.success);
    REQUIRE(result.values.size() == ctx.GetElementCount());
    return result.values;
}

ScalarArray EvalScalarOrFail(const ExprRef& e, const ElementContext& ctx) {
    ScalarResult result = EvaluateScalar(e, ctx);
    INFO(result.error.Report());
    REQUIRE(result.success);
    REQUIRE(result.values.size() == ctx.GetElementCount());
    return result.values;
}

void RequireNear(const glm::dvec3& actual, const glm::dvec3& expected) {
    INFO("actual (" << actual.x << ", " << actual.y << ", " << actual.z << ")");
    REQUIRE(actual.x == Approx(expected.x).margin(1e-9));
    REQUIRE(actual.y == Approx(expected.y).margin(1e-9));
    REQUIRE(actual.z == Approx(expected.z).margin(1e-9));
}

} // namespace

TEST_CASE("MIX returns its endpoints at fac 0 and 1") {
    ElementContext ctx(2);
    const glm::dvec3 colors[] = { { 0.0, 0.0, 0.0 }, { 1.0, 0.5, 0.25 }, { 2.0, -1.0, 0.3 } };

    for (const auto& c1 : colors) {
        for (const auto& c2 : colors) {
            REQUIRE(EvalColorOrFail(Blend("MIX", false, Scalar(0.0), Color(c1), Color(c2)), ctx)[0] == c1);
            REQUIRE(EvalColorOrFail(Blend("MIX", false, Scalar(1.0), Color(c1), Color(c2)), ctx)[1] == c2);
        }
    }
}

TEST_CASE("MULTIPLY of disjoint primaries is black") {
    ElementContext ctx(3);
    ExprRef e = Blend("MULTIPLY", true, Scalar(1.0), Color({ 1.0, 0.0, 0.0 }), Color({ 0.0, 1.0, 0.0 }));
    for (const glm::dvec3& c : EvalColorOrFail(e, ctx)) {
        REQUIRE(c == glm::dvec3(0.0));
    }
}

TEST_CASE("Blend clamping") {
    ElementContext ctx(1);
    ExprRef add = Blend("ADD", false, Scalar(1.0), Color(glm::dvec3(0.75)), Color(glm::dvec3(0.75)));
    REQUIRE(EvalColorOrFail(add, ctx)[0] == glm::dvec3(1.5));

    ExprRef clamped = Blend("ADD", true, Scalar(1.0), Color(glm::dvec3(0.75)), Color(glm::dvec3(0.75)));
    REQUIRE(EvalColorOrFail(clamped, ctx)[0] == glm::dvec3(1.0));

    // Burn always clamps
    ExprRef burn = Blend("BURN", false, Scalar(1.0), Color(glm::dvec3(0.1)), Color(glm::dvec3(0.5)));
    REQUIRE(EvalColorOrFail(burn, ctx)[0] == glm::dvec3(0.0));

    // HSV modes honour the clamp flag too
    ExprRef hue = Blend("HUE", true, Scalar(0.0), Color({ 2.0, 0.0, 0.0 }), Color({ 0.0, 1.0, 0.0 }));
    REQUIRE(EvalColorOrFail(hue, ctx)[0] == glm::dvec3(1.0, 0.0, 0.0));
}

TEST_CASE("Linear gradient over black to white") {
    ElementContext ctx(1);

    const glm::dvec3 mid = EvalColorOrFail(BlackToWhite(0.5), ctx)[0];
    REQUIRE(mid.x == Approx(0.5));
    REQUIRE(mid.y == Approx(0.5));
    REQUIRE(mid.z == Approx(0.5));

    REQUIRE(EvalColorOrFail(BlackToWhite(-1.0), ctx)[0] == glm::dvec3(0.0));
    REQUIRE(EvalColorOrFail(BlackToWhite(2.0), ctx)[0] == glm::dvec3(1.0));
}

TEST_CASE("Constant gradient holds the left stop") {
    expr::Gradient gradient;
    gradient.interpolation = expr::GradientInterpolation::Constant;
    gradient.stops = {
        { 0.0, glm::dvec4(1.0, 0.0, 0.0, 1.0) },
        { 0.5, glm::dvec4(0.0, 1.0, 0.0, 1.0) },
        { 1.0, glm::dvec4(0.0, 0.0, 1.0, 1.0) },
    };
    gradient.fac = Scalar(0.75);

    ElementContext ctx(1);
    REQUIRE(EvalColorOrFail(MakeExpression(gradient), ctx)[0] == glm::dvec3(0.0, 1.0, 0.0));
}

TEST_CASE("Kinds coerce between color and scalar") {
    ElementContext ctx(1);

    // Color read as scalar goes through luminance
    const glm::dvec3 c(0.2, 0.4, 0.6);
    REQUIRE(EvalScalarOrFail(Color(c), ctx)[0] == Approx(Luminance(c)));

    // Scalar read as color broadcasts
    REQUIRE(EvalColorOrFail(Scalar(0.3), ctx)[0] == glm::dvec3(0.3));
}

TEST_CASE("Math operations") {
    ElementContext ctx(1);
    auto math = [&](const std::string& op, double a, double b, double c = 0.0) {
        return EvalScalarOrFail(MakeExpression(expr::Math{ op, false, Scalar(a), Scalar(b), Scalar(c) }), ctx)[0];
    };

    REQUIRE(math("SUBTRACT", 1.0, 3.0) == -2.0);
    REQUIRE(math("DIVIDE", 1.0, 0.0) == 0.0);
    REQUIRE(math("MULTIPLY_ADD", 2.0, 3.0, 1.0) == 7.0);
    REQUIRE(math("POWER", -2.0, 3.0) == Approx(-8.0));
    REQUIRE(math("POWER", -2.0, 0.5) == 0.0);
    REQUIRE(math("ROUND", 2.5, 0.0) == 2.0);
    REQUIRE(math("WRAP", 5.0, 4.0, 1.0) == Approx(2.0));
    REQUIRE(math("PINGPONG", 3.0, 2.0) == Approx(1.0));
    REQUIRE(math("COMPARE", 1.0, 1.05, 0.1) == 1.0);

    auto clamped = MakeExpression(expr::Math{ "ADD", true, Scalar(0.75), Scalar(0.75), Scalar(0.0) });
    REQUIRE(EvalScalarOrFail(clamped, ctx)[0] == 1.0);
}

TEST_CASE("Vector math reads colors") {
    ElementContext ctx(1);
    auto vec = [](double x, double y, double z) { return Color({ x, y, z }); };

    ExprRef cross = MakeExpression(expr::VectorMath{ "CROSS_PRODUCT", vec(1, 0, 0), vec(0, 1, 0), vec(0, 0, 0), Scalar(1.0) });
    REQUIRE(EvalColorOrFail(cross, ctx)[0] == glm::dvec3(0, 0, 1));

    ExprRef normalize = MakeExpression(expr::VectorMath{ "NORMALIZE", vec(0, 0, 0), vec(0, 0, 0), vec(0, 0, 0), Scalar(1.0) });
    REQUIRE(EvalColorOrFail(normalize, ctx)[0] == glm::dvec3(0.0));

    ExprRef length = MakeExpression(expr::VectorMathScalar{ "LENGTH", vec(3, 4, 0), vec(0, 0, 0) });
    REQUIRE(EvalScalarOrFail(length, ctx)[0] == Approx(5.0));
}

TEST_CASE("Map range") {
    ElementContext ctx(1);
    auto remap = [&](const std::string& mode, bool clamp, double value, double fromMin, double fromMax) {
        return EvalScalarOrFail(MakeExpression(expr::MapRange{ mode, clamp, Scalar(value), Scalar(fromMin),
            Scalar(fromMax), Scalar(0.0), Scalar(2.0), Scalar(4.0) }), ctx)[0];
    };

    REQUIRE(remap("LINEAR", false, 0.25, 0.0, 1.0) == Approx(0.5));
    REQUIRE(remap("LINEAR", true, 0.75, 0.0, 1.0) == 1.0);
    REQUIRE(remap("LINEAR", false, 0.5, 1.0, 1.0) == 0.0);
    REQUIRE(remap("SMOOTHSTEP", false, 0.5, 0.0, 1.0) == Approx(1.0));
    REQUIRE(remap("STEPPED", false, 0.3, 0.0, 1.0) == Approx(0.5));
}

TEST_CASE("Channels split and combine") {
    ElementContext ctx(1);
    ExprRef combined = MakeExpression(expr::CombineChannels{ expr::ChannelSpace::HSV, Scalar(0.0), Scalar(1.0), Scalar(1.0) });
    REQUIRE(EvalColorOrFail(combined, ctx)[0] == glm::dvec3(1.0, 0.0, 0.0));

    ExprRef blue = MakeExpression(expr::SeparateChannel{ expr::ChannelSpace::RGB, 2, Color({ 0.1, 0.2, 0.3 }) });
    REQUIRE(EvalScalarOrFail(blue, ctx)[0] == 0.3);
}

TEST_CASE("Color adjustments") {
    ElementContext ctx(1);

    ExprRef inverted = MakeExpression(expr::Invert{ Scalar(1.0), Color({ 0.25, 0.5, 1.0 }) });
    REQUIRE(EvalColorOrFail(inverted, ctx)[0] == glm::dvec3(0.75, 0.5, 0.0));

    ExprRef gamma = MakeExpression(expr::Gamma{ Color({ 0.5, 0.0, -1.0 }), Scalar(2.0) });
    REQUIRE(EvalColorOrFail(gamma, ctx)[0] == glm::dvec3(0.25, 0.0, -1.0));

    ExprRef dark = MakeExpression(expr::BrightContrast{ Color(glm::dvec3(0.2)), Scalar(-0.5), Scalar(0.0) });
    REQUIRE(EvalColorOrFail(dark, ctx)[0] == glm::dvec3(0.0));

    // Neutral hue/saturation/value leaves the color alone
    ExprRef hsv = MakeExpression(expr::HueSaturationValue{ Scalar(0.5), Scalar(1.0), Scalar(1.0), Scalar(1.0),
        Color({ 0.8, 0.4, 0.2 }) });
    const glm::dvec3 out = EvalColorOrFail(hsv, ctx)[0];
    REQUIRE(out.x == Approx(0.8));
    REQUIRE(out.y == Approx(0.4));
    REQUIRE(out.z == Approx(0.2));
}

TEST_CASE("Attributes are read from the element context") {
    ElementContext ctx(2, "Verge");
    REQUIRE(ctx.AddColorAttribute("Col", { { 1.0, 0.0, 0.0, 0.25 }, { 0.0, 0.0, 1.0, 0.75 } }));

    REQUIRE(EvalColorOrFail(MakeExpression(expr::AttributeColor{ "Col" }), ctx)[1] == glm::dvec3(0.0, 0.0, 1.0));
    REQUIRE(EvalScalarOrFail(MakeExpression(expr::AttributeScalar{ "Col", expr::AttributeChannel::Alpha }), ctx)
        == ScalarArray{ 0.25, 0.75 });
}

TEST_CASE("Missing attributes fail instead of defaulting") {
    ElementContext ctx(2, "Verge");

    ColorResult result = EvaluateColor(MakeExpression(expr::AttributeColor{ "Dirt" }), ctx);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.values.empty());
    REQUIRE(result.error.code == MaterialErrorCode::MissingAttribute);
    REQUIRE(result.error.message == "Mesh 'Verge' does not have required attribute 'Dirt'");

    ScalarResult position = EvaluateScalar(MakeExpression(expr::GeometryPosition{}), ctx);
    REQUIRE(position.error.code == MaterialErrorCode::MissingAttribute);
    REQUIRE(position.error.message.find("position") != std::string::npos);
}

TEST_CASE("Internal defects are reported as such") {
    ElementContext ctx(1);

    ScalarResult unknown = EvaluateScalar(MakeExpression(expr::Math{ "FROBNICATE", false, Scalar(0), Scalar(0), Scalar(0) }), ctx);
    REQUIRE(unknown.error.code == MaterialErrorCode::UnhandledOperation);
    REQUIRE(IsInternalError(unknown.error.code));

    ColorResult unbound = EvaluateColor(MakeExpression(expr::UnresolvedGroupInput{ "Socket_0" }), ctx);
    REQUIRE(unbound.error.code == MaterialErrorCode::UnboundGroupInput);

    ScalarResult clamp = EvaluateScalar(MakeExpression(expr::Clamp{ "RANGE", Scalar(0), Scalar(0), Scalar(1) }), ctx);
    REQUIRE(clamp.error.code == MaterialErrorCode::UnsupportedNode);
    REQUIRE_FALSE(IsInternalError(clamp.error.code));
}

TEST_CASE("Evaluation is repeatable") {
    ElementContext ctx(4, "Road");
    REQUIRE(ctx.AddColorAttribute("Col", {
        { 0.1, 0.2, 0.3, 1.0 }, { 0.4, 0.5, 0.6, 1.0 }, { 0.7, 0.8, 0.9, 1.0 }, { 1.0, 0.0, 0.5, 1.0 } }));

    ExprRef e = Blend("SOFT_LIGHT", false, MakeExpression(expr::AttributeScalar{ "Col" }),
        MakeExpression(expr::AttributeColor{ "Col" }), Color({ 0.3, 0.6, 0.9 }));

    const ColorArray first = EvalColorOrFail(e, ctx);
    const ColorArray second = EvalColorOrFail(e, ctx);
    REQUIRE(first == second);
}

TEST_CASE("Blend mode formulas") {
    ElementContext ctx(1);

    struct BlendCase {
        const char* mode;
        double fac;
        glm::dvec3 color1;
        glm::dvec3 color2;
        glm::dvec3 expected;
    };

    SECTION("Per-channel modes") {
        const BlendCase cases[] = {
            { "DARKEN", 1.0, { 0.2, 0.8, 0.5 }, { 0.6, 0.4, 0.5 }, { 0.2, 0.4, 0.5 } },
            // Lighten compares against fac * color2, not a lerp
            { "LIGHTEN", 0.5, { 0.2, 0.8, 0.5 }, { 0.6, 0.4, 0.5 }, { 0.3, 0.8, 0.5 } },
            { "SCREEN", 1.0, { 0.5, 0.0, 1.0 }, { 0.5, 1.0, 0.0 }, { 0.75, 1.0, 1.0 } },
            // Zero base stays black, otherwise saturates at 1
            { "DODGE", 1.0, { 0.0, 0.25, 0.5 }, { 0.5, 0.5, 1.0 }, { 0.0, 0.5, 1.0 } },
            { "OVERLAY", 1.0, { 0.25, 0.5, 0.75 }, { 0.25, 0.25, 0.25 }, { 0.125, 0.25, 0.625 } },
            { "SOFT_LIGHT", 1.0, { 0.5, 0.5, 1.0 }, { 0.5, 1.0, 0.0 }, { 0.5, 0.75, 1.0 } },
            { "LINEAR_LIGHT", 1.0, { 0.5, 0.5, 0.5 }, { 0.75, 0.25, 0.5 }, { 1.0, 0.0, 0.5 } },
            { "DIFFERENCE", 1.0, { 0.25, 1.0, 0.5 }, { 0.75, 0.5, 0.5 }, { 0.5, 0.5, 0.0 } },
            { "SUBTRACT", 0.5, { 1.0, 0.5, 0.0 }, { 0.5, 1.0, 1.0 }, { 0.75, 0.0, -0.5 } },
            // A zero divisor channel passes color1 through
            { "DIVIDE", 1.0, { 0.5, 0.5, 0.5 }, { 0.0, 0.25, 2.0 }, { 0.5, 2.0, 0.25 } },
        };
        for (const BlendCase& c : cases) {
            INFO(c.mode);
            RequireNear(EvalColorOrFail(Blend(c.mode, false, Scalar(c.fac), Color(c.color1), Color(c.color2)), ctx)[0],
                c.expected);
        }
    }

    SECTION("HSV modes") {
        const BlendCase cases[] = {
            { "HUE", 1.0, { 1.0, 0.0, 0.0 }, { 0.0, 1.0, 0.0 }, { 0.0, 1.0, 0.0 } },
            { "SATURATION", 1.0, { 0.5, 0.5, 0.5 }, { 1.0, 0.0, 0.0 }, { 0.5, 0.5, 0.5 } },
            { "VALUE", 1.0, { 1.0, 0.0, 0.0 }, { 0.25, 0.25, 0.25 }, { 0.25, 0.0, 0.0 } },
            { "COLOR", 1.0, { 0.5, 0.5, 0.5 }, { 0.0, 0.0, 1.0 }, { 0.0, 0.0, 0.5 } },
        };
        for (const BlendCase& c : cases) {
            INFO(c.mode);
            RequireNear(EvalColorOrFail(Blend(c.mode, false, Scalar(c.fac), Color(c.color1), Color(c.color2)), ctx)[0],
                c.expected);
        }
    }

    SECTION("Gray blend colors carry no hue") {
        const glm::dvec3 red(1.0, 0.0, 0.0);
        const glm::dvec3 gray(0.2);
        for (const char* mode : { "HUE", "COLOR" }) {
            INFO(mode);
            RequireNear(EvalColorOrFail(Blend(mode, false, Scalar(0.5), Color(red), Color(gray)), ctx)[0], red);
        }
    }
}

TEST_CASE("Math operations at their domain edges") {
    ElementContext ctx(1);
    auto math = [&](const std::string& op, double a, double b, double c) {
        return EvalScalarOrFail(MakeExpression(expr::Math{ op, false, Scalar(a), Scalar(b), Scalar(c) }), ctx)[0];
    };

    struct MathCase {
        const char* op;
        double a, b, c;
        double expected;
    };

    const double pi = 3.14159265358979323846;

    SECTION("Non-positive inputs yield zero") {
        const MathCase cases[] = {
            { "LOGARITHM", 8.0, 2.0, 0.0, 3.0 },
            { "LOGARITHM", 0.0, 2.0, 0.0, 0.0 },
            { "LOGARITHM", -1.0, 2.0, 0.0, 0.0 },
            { "LOGARITHM", 8.0, 0.0, 0.0, 0.0 },
            { "SQRT", 9.0, 0.0, 0.0, 3.0 },
            { "SQRT", -4.0, 0.0, 0.0, 0.0 },
            { "INVERSE_SQRT", 4.0, 0.0, 0.0, 0.5 },
            { "INVERSE_SQRT", 0.0, 0.0, 0.0, 0.0 },
            { "INVERSE_SQRT", -1.0, 0.0, 0.0, 0.0 },
            { "MODULO", 5.5, 2.0, 0.0, 1.5 },
            { "MODULO", -5.5, 2.0, 0.0, -1.5 },
            { "MODULO", 5.0, 0.0, 0.0, 0.0 },
            { "SNAP", 7.0, 2.0, 0.0, 6.0 },
            { "SNAP", -1.0, 2.0, 0.0, -2.0 },
            { "SNAP", 7.0, 0.0, 0.0, 0.0 },
        };
        for (const MathCase& m : cases) {
            INFO(m.op << "(" << m.a << ", " << m.b << ")");
            REQUIRE(math(m.op, m.a, m.b, m.c) == Approx(m.expected).margin(1e-12));
        }
    }

    SECTION("Smooth minimum and maximum") {
        const MathCase cases[] = {
            { "SMOOTH_MIN", 1.0, 2.0, 0.0, 1.0 },
            { "SMOOTH_MIN", 0.0, 5.0, 1.0, 0.0 },
            { "SMOOTH_MIN", 1.0, 1.0, 1.0, 1.0 - 1.0 / 6.0 },
            { "SMOOTH_MAX", 1.0, 1.0, 1.0, 1.0 + 1.0 / 6.0 },
            { "SMOOTH_MAX", 0.0, 5.0, 1.0, 5.0 },
        };
        for (const MathCase& m : cases) {
            INFO(m.op << "(" << m.a << ", " << m.b << ", " << m.c << ")");
            REQUIRE(math(m.op, m.a, m.b, m.c) == Approx(m.expected).margin(1e-12));
        }
    }

    SECTION("Sign, trigonometry and angle units") {
        const MathCase cases[] = {
            { "SIGN", -3.0, 0.0, 0.0, -1.0 },
            { "SIGN", 0.0, 0.0, 0.0, 0.0 },
            { "SIGN", 2.0, 0.0, 0.0, 1.0 },
            { "SINE", pi / 2.0, 0.0, 0.0, 1.0 },
            { "COSINE", 0.0, 0.0, 0.0, 1.0 },
            { "TANGENT", pi / 4.0, 0.0, 0.0, 1.0 },
            { "ARCTAN2", 1.0, 1.0, 0.0, pi / 4.0 },
            { "RADIANS", 180.0, 0.0, 0.0, pi },
            { "DEGREES", pi, 0.0, 0.0, 180.0 },
        };
        for (const MathCase& m : cases) {
            INFO(m.op << "(" << m.a << ")");
            REQUIRE(math(m.op, m.a, m.b, m.c) == Approx(m.expected).margin(1e-12));
        }
    }
}

TEST_CASE("Gradient with coincident stops") {
    expr::Gradient gradient;
    gradient.stops = {
        { 0.0, glm::dvec4(0.0, 0.0, 0.0, 1.0) },
        { 0.5, glm::dvec4(1.0, 0.0, 0.0, 1.0) },
        { 0.5, glm::dvec4(0.0, 1.0, 0.0, 1.0) },
        { 1.0, glm::dvec4(1.0, 1.0, 1.0, 1.0) },
    };
    ElementContext ctx(1);

    // At the shared position the earlier stop still holds
    gradient.fac = Scalar(0.5);
    RequireNear(EvalColorOrFail(MakeExpression(gradient), ctx)[0], glm::dvec3(1.0, 0.0, 0.0));

    // Past it the zero-width segment is skipped over without dividing by zero
    gradient.fac = Scalar(0.6);
    RequireNear(EvalColorOrFail(MakeExpression(gradient), ctx)[0], glm::dvec3(0.2, 1.0, 0.2));
}

TEST_CASE("Map range stepped and smoother modes") {
    ElementContext ctx(1);
    auto remap = [&](const std::string& mode, double value, double fromMin, double fromMax, double steps) {
        return EvalScalarOrFail(MakeExpression(expr::MapRange{ mode, false, Scalar(value), Scalar(fromMin),
            Scalar(fromMax), Scalar(0.0), Scalar(2.0), Scalar(steps) }), ctx)[0];
    };

    SECTION("Stepped without steps maps to the lower bound") {
        REQUIRE(remap("STEPPED", 0.3, 0.0, 1.0, 0.0) == 0.0);
        REQUIRE(remap("STEPPED", 0.9, 0.0, 1.0, -2.0) == 0.0);
    }

    SECTION("Smootherstep") {
        REQUIRE(remap("SMOOTHERSTEP", 0.5, 0.0, 1.0, 4.0) == Approx(1.0));
        REQUIRE(remap("SMOOTHERSTEP", 0.25, 0.0, 1.0, 4.0) == Approx(0.20703125));
        // Reversed source range mirrors the curve
        REQUIRE(remap("SMOOTHERSTEP", 0.25, 1.0, 0.0, 4.0) == Approx(1.79296875));
    }

    SECTION("Smoothstep below the range") {
        REQUIRE(remap("SMOOTHSTEP", -1.0, 0.0, 1.0, 4.0) == 0.0);
    }
}

TEST_CASE("Vector math orientation ops") {
    ElementContext ctx(1);
    auto vec = [](double x, double y, double z) { return Color({ x, y, z }); };
    auto vectorMath = [&](const std::string& op, ExprRef a, ExprRef b, ExprRef c) {
        return EvalColorOrFail(MakeExpression(expr::VectorMath{ op, std::move(a), std::move(b), std::move(c), Scalar(1.0) }), ctx)[0];
    };

    SECTION("Faceforward flips toward the incident") {
        RequireNear(vectorMath("FACEFORWARD", vec(1, 2, 3), vec(0, 0, 1), vec(0, 0, -1)), glm::dvec3(1, 2, 3));
        RequireNear(vectorMath("FACEFORWARD", vec(1, 2, 3), vec(0, 0, 1), vec(0, 0, 1)), glm::dvec3(-1, -2, -3));
    }

    SECTION("Project and reflect") {
        RequireNear(vectorMath("PROJECT", vec(1, 1, 0), vec(2, 0, 0), vec(0, 0, 0)), glm::dvec3(1, 0, 0));
        RequireNear(vectorMath("PROJECT", vec(1, 1, 0), vec(0, 0, 0), vec(0, 0, 0)), glm::dvec3(0.0));
        RequireNear(vectorMath("REFLECT", vec(1, -1, 0), vec(0, 2, 0), vec(0, 0, 0)), glm::dvec3(1, 1, 0));
    }
}

TEST_CASE("Separate XYZ and HSV channels") {
    ElementContext ctx(1);
    auto separate = [&](expr::ChannelSpace space, int channel, const glm::dvec3& value) {
        return EvalScalarOrFail(MakeExpression(expr::SeparateChannel{ space, channel, Color(value) }), ctx)[0];
    };

    REQUIRE(separate(expr::ChannelSpace::XYZ, 0, { -1.5, 2.0, 3.0 }) == -1.5);
    REQUIRE(separate(expr::ChannelSpace::XYZ, 1, { -1.5, 2.0, 3.0 }) == 2.0);

    REQUIRE(separate(expr::ChannelSpace::HSV, 0, { 0.0, 0.5, 0.0 }) == Approx(1.0 / 3.0));
    REQUIRE(separate(expr::ChannelSpace::HSV, 1, { 0.0, 0.5, 0.0 }) == Approx(1.0));
    REQUIRE(separate(expr::ChannelSpace::HSV, 2, { 0.0, 0.5, 0.0 }) == Approx(0.5));
    REQUIRE(separate(expr::ChannelSpace::HSV, 1, { 0.4, 0.4, 0.4 }) == 0.0);
}

TEST_CASE("Only min-max clamping is supported") {
    ElementContext ctx(1);
    auto clamp = [&](const std::string& type) {
        return EvaluateScalar(MakeExpression(expr::Clamp{ type, Scalar(1.5), Scalar(0.0), Scalar(1.0) }), ctx);
    };

    ScalarResult minMax = clamp("MINMAX");
    REQUIRE(minMax.success);
    REQUIRE(minMax.values[0] == 1.0);

    ScalarResult range = clamp("RANGE");
    REQUIRE_FALSE(range.success);
    REQUIRE(range.error.code == MaterialErrorCode::UnsupportedNode);
    REQUIRE(range.error.message.find("RANGE") != std::string::npos);
}
