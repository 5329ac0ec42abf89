#pragma once

#include <glm/glm.hpp>

namespace tarmac::material {

// Scalar building blocks shared by the evaluator. All of them operate on a
// single element; the evaluator applies them across element arrays.

// Rec.709 luminance weights (the shading language's color -> float conversion).
constexpr double kLuminanceR = 0.2126;
constexpr double kLuminanceG = 0.7152;
constexpr double kLuminanceB = 0.0722;

double SrgbToLinear(double c);
double LinearToSrgb(double c);
glm::dvec3 SrgbToLinear(const glm::dvec3& c);
glm::dvec3 LinearToSrgb(const glm::dvec3& c);

// Hue, saturation and value in [0,1]. Branch-free variant of the classic
// swap-based conversion; a small epsilon keeps black and grey finite.
glm::dvec3 RgbToHsv(const glm::dvec3& rgb);
glm::dvec3 HsvToRgb(const glm::dvec3& hsv);

double Luminance(const glm::dvec3& c);
double ChannelAverage(const glm::dvec3& c);

// max(min(x, hi), lo): lo wins when the bounds are inverted.
double Clamp(double x, double lo, double hi);
glm::dvec3 Clamp(const glm::dvec3& x, double lo, double hi);
double Saturate(double x);

double SafeDivide(double a, double b);
double Fract(double x);

double Smoothstep(double edge0, double edge1, double x);
double Smootherstep(double edge0, double edge1, double x);

// Polynomial smooth minimum with a cubic kernel of width c.
double SmoothMin(double a, double b, double c);

} // namespace tarmac::material
