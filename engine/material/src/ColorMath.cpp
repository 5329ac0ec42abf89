#include "tarmac/material/ColorMath.h"

#include <algorithm>
#include <cmath>

namespace tarmac::material {

double SrgbToLinear(double c) {
    if (c <= 0.04045) {
        return c / 12.92;
    }
    return std::pow((c + 0.055) / 1.055, 2.4);
}

double LinearToSrgb(double c) {
    if (c <= 0.0031308) {
        return c * 12.92;
    }
    return 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
}

glm::dvec3 SrgbToLinear(const glm::dvec3& c) {
    return glm::dvec3(SrgbToLinear(c.x), SrgbToLinear(c.y), SrgbToLinear(c.z));
}

glm::dvec3 LinearToSrgb(const glm::dvec3& c) {
    return glm::dvec3(LinearToSrgb(c.x), LinearToSrgb(c.y), LinearToSrgb(c.z));
}

glm::dvec3 RgbToHsv(const glm::dvec3& rgb) {
    double r = rgb.x;
    double g = rgb.y;
    double b = rgb.z;
    double k = 0.0;

    if (g < b) {
        std::swap(g, b);
        k = -1.0;
    }
    double minGB = b;
    if (r < g) {
        std::swap(r, g);
        k = -2.0 / 6.0 - k;
        minGB = std::min(g, b);
    }

    const double chroma = r - minGB;
    const double h = std::fabs(k + (g - b) / (6.0 * chroma + 1e-20));
    const double s = chroma / (r + 1e-20);
    return glm::dvec3(h, s, r);
}

glm::dvec3 HsvToRgb(const glm::dvec3& hsv) {
    const double h = hsv.x;
    const double s = hsv.y;
    const double v = hsv.z;

    const double nr = Clamp(std::fabs(h * 6.0 - 3.0) - 1.0, 0.0, 1.0);
    const double ng = Clamp(2.0 - std::fabs(h * 6.0 - 2.0), 0.0, 1.0);
    const double nb = Clamp(2.0 - std::fabs(h * 6.0 - 4.0), 0.0, 1.0);

    const glm::dvec3 n(nr, ng, nb);
    return ((n - 1.0) * s + 1.0) * v;
}

double Luminance(const glm::dvec3& c) {
    return c.x * kLuminanceR + c.y * kLuminanceG + c.z * kLuminanceB;
}

double ChannelAverage(const glm::dvec3& c) {
    return (c.x + c.y + c.z) / 3.0;
}

double Clamp(double x, double lo, double hi) {
    return std::max(std::min(x, hi), lo);
}

glm::dvec3 Clamp(const glm::dvec3& x, double lo, double hi) {
    return glm::dvec3(Clamp(x.x, lo, hi), Clamp(x.y, lo, hi), Clamp(x.z, lo, hi));
}

double Saturate(double x) {
    return Clamp(x, 0.0, 1.0);
}

double SafeDivide(double a, double b) {
    return b != 0.0 ? a / b : 0.0;
}

double Fract(double x) {
    return x - std::floor(x);
}

double Smoothstep(double edge0, double edge1, double x) {
    if (x < edge0) return 0.0;
    if (x >= edge1) return 1.0;
    const double t = SafeDivide(x - edge0, edge1 - edge0);
    return (3.0 - 2.0 * t) * (t * t);
}

double Smootherstep(double edge0, double edge1, double x) {
    const double t = Saturate(SafeDivide(x - edge0, edge1 - edge0));
    return t * t * t * (t * (t * 6.0 - 15.0) + 10.0);
}

double SmoothMin(double a, double b, double c) {
    if (c == 0.0) {
        return std::fmin(a, b);
    }
    const double h = std::fmax(c - std::fabs(a - b), 0.0) / c;
    return std::fmin(a, b) - h * h * h * c * (1.0 / 6.0);
}

} // namespace tarmac::material
