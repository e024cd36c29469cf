#pragma once

/**
 * Kernel - thin OpenCASCADE layer used by the keycap stages
 *
 * Every function catches Standard_Failure / std::exception and reports
 * through Result, so no OCCT exception leaves the library.
 */

#include "keycap-core/cad/Solid.hpp"

#include <TopoDS_Shape.hxx>
#include <TopoDS_Edge.hxx>
#include <TopoDS_Wire.hxx>

#include <string>
#include <vector>

namespace keycap::core::cad::kernel {

// Primitives.cpp

/**
 * @brief Closed planar wire through the four corners of a section
 */
TopoDS_Wire makeSectionWire(const SectionRect& section);

/**
 * @brief Closed planar wire through the given points (at least 3)
 */
TopoDS_Wire makePolygonWire(const std::vector<Vector3>& points);

/**
 * @brief Extrude a planar polygon along +Z into a prism solid
 */
Result<SolidPtr> makePrism(const std::vector<Vector3>& polygon, double height);

// Features.cpp

/**
 * @brief Smooth (non-ruled) loft through ordered sections, capped at both ends
 */
Result<SolidPtr> loftSections(const std::vector<SectionRect>& sections);

/**
 * @brief Constant-radius fillet on the given edges of a solid
 */
Result<SolidPtr> filletEdges(const SolidPtr& solid,
                             const std::vector<TopoDS_Edge>& edges,
                             double radius);

// BooleanOps.cpp

/**
 * @brief base - tool; result must be a single sound solid
 */
Result<SolidPtr> booleanSubtract(const SolidPtr& base, const SolidPtr& tool);

/**
 * @brief a + b; result must be a single sound solid
 */
Result<SolidPtr> booleanUnion(const SolidPtr& a, const SolidPtr& b);

// SolidCheck.cpp

SolidCheck checkSolid(const TopoDS_Shape& shape);

/**
 * @brief Human-readable reason a check is not sound (empty when sound)
 */
std::string describeCheck(const SolidCheck& check);

// Tessellator.cpp

/**
 * @brief Triangulate a shape into a welded mesh and verify it is closed,
 * consistently wound and of positive volume
 */
Result<Mesh> tessellate(const TopoDS_Shape& shape, const TessellateOptions& options);

} // namespace keycap::core::cad::kernel
