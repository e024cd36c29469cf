#pragma once

#include "Types.hpp"
#include "Solid.hpp"

namespace keycap::core::cad {

/**
 * @brief Edge selection for the bevel
 */
struct BevelOptions {
    double sharpAngleDegrees = 30.0;   // Dihedral deviation that makes an edge sharp
    double downFacingCosine = 0.99;    // Faces with normal.z below -this face down
};

/**
 * @brief Number of edges applyBevel() would round
 *
 * An edge is selected when the normals of its two faces differ by more than
 * the sharpness threshold and neither face points down (base plane, cavity
 * mouth).
 */
Result<size_t> countSharpEdges(const SolidPtr& solid, const BevelOptions& options = {});

/**
 * @brief Round the sharp edges of a solid with a constant radius
 *
 * Radius 0 returns the input itself (same object). The input is never
 * modified, so re-applying with another radius always starts from the
 * same unbeveled solid.
 */
Result<SolidPtr> applyBevel(const SolidPtr& solid, double radius, const BevelOptions& options = {});

} // namespace keycap::core::cad
