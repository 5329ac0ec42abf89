#include "tarmac/material/Expression.h"
#include <sstream>

namespace tarmac::material {

namespace {

const char* ChannelSpaceName(expr::ChannelSpace space) {
    switch (space) {
        case expr::ChannelSpace::RGB: return "RGB";
        case expr::ChannelSpace::XYZ: return "XYZ";
        case expr::ChannelSpace::HSV: return "HSV";
    }
    return "?";
}

struct Printer {
    std::ostringstream& out;

    void Print(const ExprRef& e) {
        if (!e) {
            out << "<null>";
            return;
        }
        std::visit(*this, e->node);
    }

    void Args(std::initializer_list<ExprRef> args) {
        for (const auto& arg : args) {
            out << ", ";
            Print(arg);
        }
    }

    void Vec(const glm::dvec3& v) {
        out << "(" << v.x << ", " << v.y << ", " << v.z << ")";
    }

    void operator()(const expr::ConstantColor& n) { Vec(n.value); }
    void operator()(const expr::ConstantScalar& n) { out << n.value; }
    void operator()(const expr::AttributeColor& n) { out << "Attribute('" << n.name << "')"; }
    void operator()(const expr::AttributeScalar& n) {
        out << "Attribute('" << n.name << "')." << (n.channel == expr::AttributeChannel::Alpha ? "alpha" : "average");
    }
    void operator()(const expr::GeometryPosition&) { out << "Position"; }
    void operator()(const expr::GeometryNormal&) { out << "Normal"; }
    void operator()(const expr::Math& n) {
        out << "Math(" << n.operation << (n.clamp ? " clamped" : "");
        Args({ n.a, n.b, n.c });
        out << ")";
    }
    void operator()(const expr::VectorMath& n) {
        out << "VectorMath(" << n.operation;
        Args({ n.a, n.b, n.c, n.scale });
        out << ")";
    }
    void operator()(const expr::VectorMathScalar& n) {
        out << "VectorMath(" << n.operation;
        Args({ n.a, n.b });
        out << ")";
    }
    void operator()(const expr::Blend& n) {
        out << "Blend(" << n.blendType << (n.clamp ? " clamped" : "");
        Args({ n.fac, n.color1, n.color2 });
        out << ")";
    }
    void operator()(const expr::Invert& n) {
        out << "Invert(";
        Print(n.fac);
        Args({ n.color });
        out << ")";
    }
    void operator()(const expr::Grayscale& n) {
        out << "Grayscale(";
        Print(n.color);
        out << ")";
    }
    void operator()(const expr::Clamp& n) {
        out << "Clamp(" << n.clampType;
        Args({ n.value, n.min, n.max });
        out << ")";
    }
    void operator()(const expr::BrightContrast& n) {
        out << "BrightContrast(";
        Print(n.color);
        Args({ n.bright, n.contrast });
        out << ")";
    }
    void operator()(const expr::Gamma& n) {
        out << "Gamma(";
        Print(n.color);
        Args({ n.gamma });
        out << ")";
    }
    void operator()(const expr::SeparateChannel& n) {
        out << "Separate" << ChannelSpaceName(n.space) << "[" << n.channel << "](";
        Print(n.input);
        out << ")";
    }
    void operator()(const expr::CombineChannels& n) {
        out << "Combine" << ChannelSpaceName(n.space) << "(";
        Print(n.a);
        Args({ n.b, n.c });
        out << ")";
    }
    void operator()(const expr::Gradient& n) {
        out << "Gradient(" << (n.interpolation == expr::GradientInterpolation::Linear ? "LINEAR" : "CONSTANT");
        out << (n.alphaOutput ? " alpha" : " color") << ", [";
        for (size_t i = 0; i < n.stops.size(); ++i) {
            if (i > 0) out << ", ";
            out << n.stops[i].position << ":";
            Vec(glm::dvec3(n.stops[i].color));
        }
        out << "]";
        Args({ n.fac });
        out << ")";
    }
    void operator()(const expr::MapRange& n) {
        out << "MapRange(" << n.interpolation << (n.clamp ? " clamped" : "");
        Args({ n.value, n.fromMin, n.fromMax, n.toMin, n.toMax, n.steps });
        out << ")";
    }
    void operator()(const expr::HueSaturationValue& n) {
        out << "HSV(";
        Print(n.hue);
        Args({ n.saturation, n.value, n.fac, n.color });
        out << ")";
    }
    void operator()(const expr::GroupWrapper& n) {
        out << "Group '" << n.name << "'(";
        Print(n.inner);
        out << ")";
    }
    void operator()(const expr::UnresolvedGroupInput& n) { out << "GroupInput(" << n.identifier << ")"; }
};

} // namespace

std::string ToString(const ExprRef& expression) {
    std::ostringstream out;
    Printer printer{ out };
    printer.Print(expression);
    return out.str();
}

} // namespace tarmac::material
