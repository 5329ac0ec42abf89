#include "tarmac/material/ColorMath.h"

#include <catch2/catch.hpp>

using namespace tarmac::material;

TEST_CASE("sRGB transfer functions round-trip") {
    for (int i = 0; i <= 1000; ++i) {
        const double x = i / 1000.0;
        REQUIRE(LinearToSrgb(SrgbToLinear(x)) == Approx(x).margin(1e-6));
        REQUIRE(SrgbToLinear(LinearToSrgb(x)) == Approx(x).margin(1e-6));
    }
}

TEST_CASE("sRGB transfer functions match the reference curve") {
    REQUIRE(SrgbToLinear(0.0) == 0.0);
    REQUIRE(SrgbToLinear(1.0) == Approx(1.0));
    REQUIRE(SrgbToLinear(0.5) == Approx(0.21404114).epsilon(1e-6));
    REQUIRE(LinearToSrgb(0.0031308) == Approx(0.04044994).epsilon(1e-6));

    const glm::dvec3 linear = SrgbToLinear(glm::dvec3(0.0, 0.5, 1.0));
    REQUIRE(linear.y == Approx(SrgbToLinear(0.5)));
}

TEST_CASE("HSV conversion round-trips") {
    for (int r = 0; r <= 10; ++r) {
        for (int g = 0; g <= 10; ++g) {
            for (int b = 0; b <= 10; ++b) {
                const glm::dvec3 c(r / 10.0, g / 10.0, b / 10.0);
                const glm::dvec3 back = HsvToRgb(RgbToHsv(c));
                REQUIRE(back.x == Approx(c.x).margin(1e-9));
                REQUIRE(back.y == Approx(c.y).margin(1e-9));
                REQUIRE(back.z == Approx(c.z).margin(1e-9));
            }
        }
    }
}

TEST_CASE("HSV of primaries") {
    const glm::dvec3 red = RgbToHsv(glm::dvec3(1.0, 0.0, 0.0));
    REQUIRE(red.x == Approx(0.0).margin(1e-12));
    REQUIRE(red.y == Approx(1.0));
    REQUIRE(red.z == 1.0);

    const glm::dvec3 green = RgbToHsv(glm::dvec3(0.0, 1.0, 0.0));
    REQUIRE(green.x == Approx(1.0 / 3.0));

    const glm::dvec3 grey = RgbToHsv(glm::dvec3(0.25));
    REQUIRE(grey.y == Approx(0.0).margin(1e-12));
    REQUIRE(grey.z == 0.25);
}

TEST_CASE("Luminance weights sum to one") {
    REQUIRE(Luminance(glm::dvec3(1.0, 1.0, 1.0)) == 1.0);
    REQUIRE(Luminance(glm::dvec3(0.0)) == 0.0);
    REQUIRE(Luminance(glm::dvec3(0.0, 1.0, 0.0)) == kLuminanceG);
}

TEST_CASE("Clamp stays within bounds") {
    const double values[] = { -1e300, -2.5, -0.0, 0.0, 0.3, 1.0, 7.0, 1e300 };
    const double bounds[][2] = { { 0.0, 1.0 }, { -3.0, -1.0 }, { 2.0, 2.0 }, { -1e10, 1e10 } };
    for (double x : values) {
        for (const auto& b : bounds) {
            const double r = Clamp(x, b[0], b[1]);
            REQUIRE(r >= b[0]);
            REQUIRE(r <= b[1]);
        }
    }
    REQUIRE(Saturate(1.5) == 1.0);
    REQUIRE(Saturate(-0.5) == 0.0);
}

TEST_CASE("Smooth helpers") {
    REQUIRE(Smoothstep(0.0, 1.0, -1.0) == 0.0);
    REQUIRE(Smoothstep(0.0, 1.0, 2.0) == 1.0);
    REQUIRE(Smoothstep(0.0, 1.0, 0.5) == Approx(0.5));
    REQUIRE(Smootherstep(0.0, 1.0, 0.5) == Approx(0.5));
    REQUIRE(SmoothMin(1.0, 2.0, 0.0) == 1.0);
    REQUIRE(SmoothMin(1.0, 1.0, 1.0) < 1.0);
    REQUIRE(SafeDivide(1.0, 0.0) == 0.0);
    REQUIRE(Fract(-0.25) == Approx(0.75));
}
