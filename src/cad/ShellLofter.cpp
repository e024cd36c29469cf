#include "keycap-core/cad/ShellLofter.hpp"
#include "Kernel.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace keycap::core::cad {

namespace {

constexpr int kBisectionSteps = 48;

bool isFeasible(const CrossSectionCurve& curve, double t, const HollowOptions& options) {
    const double ceiling = curve.height() - t;
    if (ceiling < options.minDepth) {
        return false;
    }

    const int samples = std::max(options.feasibilitySamples, 2);
    for (int i = 0; i < samples; ++i) {
        double z = ceiling * i / (samples - 1);
        SectionRect section = cavitySectionAt(curve, z, t);
        if (section.width() < options.minSpan || section.depth() < options.minSpan) {
            return false;
        }
    }
    return true;
}

// Intersection of the cavity sections between the base plane and the ceiling
SectionRect computeClearance(const CrossSectionCurve& curve, double t, const HollowOptions& options) {
    const double ceiling = curve.height() - t;
    const int samples = std::max(options.feasibilitySamples, 2);

    SectionRect clearance = cavitySectionAt(curve, 0.0, t);
    for (int i = 1; i < samples; ++i) {
        SectionRect section = cavitySectionAt(curve, ceiling * i / (samples - 1), t);
        clearance.xMin = std::max(clearance.xMin, section.xMin);
        clearance.xMax = std::min(clearance.xMax, section.xMax);
        clearance.yMin = std::max(clearance.yMin, section.yMin);
        clearance.yMax = std::min(clearance.yMax, section.yMax);
    }
    clearance.z = 0.0;
    return clearance;
}

} // anonymous namespace

// ===========================================================================
// Outer Loft
// ===========================================================================

Result<LoftedShell> loft(const CrossSectionCurve& curve) {
    auto start = std::chrono::high_resolution_clock::now();

    auto sections = curve.sampleSections();
    if (sections.size() < 2) {
        return Result<LoftedShell>::error(errors::kConfiguration,
            "Curve must be sampled into at least 2 sections");
    }

    auto solid = kernel::loftSections(sections);
    if (!solid) {
        return Result<LoftedShell>::propagate(solid);
    }

    LoftedShell shell;
    shell.solid = solid.value;
    shell.curve = curve;

    auto end = std::chrono::high_resolution_clock::now();
    auto result = Result<LoftedShell>::ok(std::move(shell));
    result.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

// ===========================================================================
// Hollow
// ===========================================================================

SectionRect cavitySectionAt(const CrossSectionCurve& curve, double z, double wallThickness) {
    SectionRect outer = curve.sectionAt(z);
    InsetSlopes slopes = curve.slopesAt(z);

    const double t = wallThickness;

    SectionRect cavity;
    cavity.z = z;
    cavity.xMin = outer.xMin + t * std::sqrt(1.0 + slopes.side * slopes.side);
    cavity.xMax = outer.xMax - t * std::sqrt(1.0 + slopes.side * slopes.side);
    cavity.yMin = outer.yMin + t * std::sqrt(1.0 + slopes.back * slopes.back);
    cavity.yMax = outer.yMax - t * std::sqrt(1.0 + slopes.front * slopes.front);
    return cavity;
}

double maxFeasibleThickness(const CrossSectionCurve& curve,
                            double wallThickness,
                            const HollowOptions& options) {
    if (isFeasible(curve, wallThickness, options)) {
        return wallThickness;
    }

    if (wallThickness <= options.minThickness || !isFeasible(curve, options.minThickness, options)) {
        return 0.0;
    }

    double lo = options.minThickness;   // feasible
    double hi = wallThickness;          // infeasible
    for (int i = 0; i < kBisectionSteps; ++i) {
        double mid = (lo + hi) / 2.0;
        if (isFeasible(curve, mid, options)) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return lo;
}

Result<HollowShell> hollow(const LoftedShell& shell,
                           double wallThickness,
                           const HollowOptions& options) {
    auto start = std::chrono::high_resolution_clock::now();

    if (!shell.solid) {
        return Result<HollowShell>::error(errors::kDegenerateGeometry, "No outer solid to hollow");
    }
    if (!std::isfinite(wallThickness) || wallThickness <= 0) {
        return Result<HollowShell>::error(errors::kConfiguration, "Wall thickness must be positive");
    }

    const CrossSectionCurve& curve = shell.curve;

    double thickness = maxFeasibleThickness(curve, wallThickness, options);
    if (thickness <= 0.0) {
        std::stringstream ss;
        ss << "No feasible cavity: even a " << options.minThickness
           << " mm wall leaves less than " << options.minSpan << " mm span or "
           << options.minDepth << " mm depth";
        return Result<HollowShell>::error(errors::kDegenerateGeometry, ss.str());
    }

    const bool clamped = thickness < wallThickness;
    const double ceiling = curve.height() - thickness;

    // Cavity stations: one below the base plane, then base plane to ceiling
    std::vector<SectionRect> sections;
    sections.push_back(cavitySectionAt(curve, -options.baseOvershoot, thickness));

    const int count = std::max(curve.sectionCount(), 2);
    for (int i = 0; i < count; ++i) {
        double z = (i == count - 1) ? ceiling : ceiling * i / (count - 1);
        sections.push_back(cavitySectionAt(curve, z, thickness));
    }

    auto cavity = kernel::loftSections(sections);
    if (!cavity) {
        return Result<HollowShell>::propagate(cavity);
    }

    HollowShell result;
    result.outer = shell.solid;
    result.cavity = cavity.value;
    result.wallThickness = thickness;
    result.thicknessClamped = clamped;
    result.frame.origin = Vector3(0, 0, 0);
    result.frame.cavityDepth = ceiling;
    result.frame.ceilingHeight = ceiling;
    result.frame.wallThickness = thickness;
    result.frame.clearance = computeClearance(curve, thickness, options);

    auto end = std::chrono::high_resolution_clock::now();
    auto res = Result<HollowShell>::ok(std::move(result));
    res.durationMs = std::chrono::duration<double, std::milli>(end - start).count();

    if (clamped) {
        std::stringstream ss;
        ss << "Wall thickness " << wallThickness
           << " mm does not fit, clamped to " << thickness << " mm";
        res.warnings.push_back(ss.str());
    }

    return res;
}

} // namespace keycap::core::cad
