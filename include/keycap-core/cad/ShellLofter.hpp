#pragma once

#include "Types.hpp"
#include "Solid.hpp"
#include "CurveBuilder.hpp"

namespace keycap::core::cad {

/**
 * @brief Closed outer solid of the cap with the curve it was lofted from
 */
struct LoftedShell {
    SolidPtr solid;
    CrossSectionCurve curve;
};

/**
 * @brief Limits for cavity feasibility
 */
struct HollowOptions {
    double minSpan = 0.5;          // Narrowest allowed cavity section (mm)
    double minDepth = 1.0;         // Shallowest allowed cavity (mm)
    double minThickness = 0.3;     // Clamping never goes below this (mm)
    double baseOvershoot = 0.5;    // Cavity extends this far below the base plane
    int feasibilitySamples = 32;   // Heights checked between base and ceiling
};

/**
 * @brief Outer solid and the cavity to subtract from it
 */
struct HollowShell {
    SolidPtr outer;
    SolidPtr cavity;
    double wallThickness = 0;       // Effective thickness
    bool thicknessClamped = false;  // Requested thickness did not fit
    StemFrame frame;
};

/**
 * @brief Loft the curve's sampled sections into a capped outer solid
 */
Result<LoftedShell> loft(const CrossSectionCurve& curve);

/**
 * @brief Cavity section at height z for a wall of normal thickness t
 *
 * Each side moves inward by t * sqrt(1 + slope^2), which keeps the wall
 * thickness measured along the surface normal equal to t.
 */
SectionRect cavitySectionAt(const CrossSectionCurve& curve, double z, double wallThickness);

/**
 * @brief Largest thickness <= wallThickness that leaves a feasible cavity
 *
 * Returns a value < options.minThickness when even the minimum does not fit.
 */
double maxFeasibleThickness(const CrossSectionCurve& curve,
                            double wallThickness,
                            const HollowOptions& options = {});

/**
 * @brief Derive the inner cavity for a wall of the given thickness
 *
 * The cavity ceiling sits at (height - t) and the cavity reaches below the
 * base plane so the later subtraction opens the underside. When the
 * requested thickness is infeasible it is clamped and a DEGENERATE_GEOMETRY
 * warning is attached; when even the minimum thickness is infeasible the
 * call fails with DEGENERATE_GEOMETRY.
 */
Result<HollowShell> hollow(const LoftedShell& shell,
                           double wallThickness = 0.91,
                           const HollowOptions& options = {});

} // namespace keycap::core::cad
