#include "keycap-core/cad/StemGenerator.hpp"
#include "Kernel.hpp"

#include <sstream>

namespace keycap::core::cad {

namespace {

// Fraction of the wall thickness the stem reaches into the ceiling
constexpr double kCeilingEmbed = 0.5;

bool fitsClearance(const std::vector<Vector3>& outline, const StemFrame& frame) {
    for (const auto& p : outline) {
        double x = frame.origin.x + p.x;
        double y = frame.origin.y + p.y;
        if (x <= frame.clearance.xMin || x >= frame.clearance.xMax ||
            y <= frame.clearance.yMin || y >= frame.clearance.yMax) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ===========================================================================
// Cherry MX
// ===========================================================================

std::vector<Vector3> CherryMXCrossStem::outline() const {
    const double a = kBladeLength / 2.0;
    const double b = kBladeThickness / 2.0;

    return {
        Vector3( a, -b, 0), Vector3( a,  b, 0), Vector3( b,  b, 0),
        Vector3( b,  a, 0), Vector3(-b,  a, 0), Vector3(-b,  b, 0),
        Vector3(-a,  b, 0), Vector3(-a, -b, 0), Vector3(-b, -b, 0),
        Vector3(-b, -a, 0), Vector3( b, -a, 0), Vector3( b, -b, 0)
    };
}

Result<SolidPtr> CherryMXCrossStem::build(const StemFrame& frame) const {
    if (frame.cavityDepth <= 0) {
        return Result<SolidPtr>::error(errors::kDegenerateGeometry, "Stem needs a cavity of positive depth");
    }

    std::vector<Vector3> points = outline();
    if (!fitsClearance(points, frame)) {
        std::stringstream ss;
        ss << name() << " stem does not fit inside the cavity ("
           << frame.clearance.width() << " x " << frame.clearance.depth() << " mm clearance)";
        return Result<SolidPtr>::error(errors::kDegenerateGeometry, ss.str());
    }

    for (auto& p : points) {
        p = p + frame.origin;
    }

    const double height = frame.cavityDepth + frame.wallThickness * kCeilingEmbed;
    return kernel::makePrism(points, height);
}

// ===========================================================================
// Factory
// ===========================================================================

std::unique_ptr<StemGeometry> makeStemGeometry(StemType type) {
    switch (type) {
        case StemType::CherryMX:
            return std::make_unique<CherryMXCrossStem>();
        case StemType::None:
            return nullptr;
    }
    return nullptr;
}

Result<SolidPtr> buildStem(StemType type, const StemFrame& frame) {
    if (type == StemType::None) {
        return Result<SolidPtr>::ok(SolidPtr());
    }

    auto geometry = makeStemGeometry(type);
    if (!geometry) {
        return Result<SolidPtr>::error(errors::kConfiguration, "Unknown stem type");
    }

    return geometry->build(frame);
}

} // namespace keycap::core::cad
