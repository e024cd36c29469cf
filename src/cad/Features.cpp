/**
 * Features.cpp - Loft and fillet
 */

#include "Kernel.hpp"
#include "OCCTSolid.hpp"

#include <BRepOffsetAPI_ThruSections.hxx>
#include <BRepFilletAPI_MakeFillet.hxx>
#include <Standard_Failure.hxx>
#include <TopoDS.hxx>

namespace keycap::core::cad::kernel {

// =============================================================================
// Loft
// =============================================================================

Result<SolidPtr> loftSections(const std::vector<SectionRect>& sections) {
    if (sections.size() < 2) {
        return Result<SolidPtr>::error(errors::kDegenerateGeometry, "Loft requires at least 2 sections");
    }

    for (size_t i = 1; i < sections.size(); ++i) {
        if (sections[i].z <= sections[i - 1].z) {
            return Result<SolidPtr>::error(errors::kDegenerateGeometry,
                "Loft sections must be ordered by increasing height");
        }
    }

    try {
        // Solid with planar caps, smooth (approximated) lateral faces
        BRepOffsetAPI_ThruSections loft(Standard_True, Standard_False);

        // Every wire starts at (xMin, yMin) and runs counter-clockwise
        loft.CheckCompatibility(Standard_False);

        for (const auto& section : sections) {
            if (section.width() <= 0 || section.depth() <= 0) {
                return Result<SolidPtr>::error(errors::kDegenerateGeometry,
                    "Loft section collapsed at z = " + std::to_string(section.z));
            }
            loft.AddWire(makeSectionWire(section));
        }

        loft.Build();

        if (!loft.IsDone()) {
            return Result<SolidPtr>::error(errors::kOperationFailed, "Loft operation failed");
        }

        SolidPtr solid = makeSolid(loft.Shape());
        SolidCheck check = solid->check();
        if (!check.isSound()) {
            return Result<SolidPtr>::error(errors::kDegenerateGeometry,
                "Loft is not a sound solid: " + describeCheck(check));
        }

        return Result<SolidPtr>::ok(std::move(solid));

    } catch (const Standard_Failure& e) {
        return Result<SolidPtr>::error(errors::kOcctException, e.GetMessageString());
    } catch (const std::exception& e) {
        return Result<SolidPtr>::error(errors::kException, e.what());
    }
}

// =============================================================================
// Fillet
// =============================================================================

Result<SolidPtr> filletEdges(const SolidPtr& solid,
                             const std::vector<TopoDS_Edge>& edges,
                             double radius) {
    if (!solid) {
        return Result<SolidPtr>::error(errors::kOperationFailed, "Fillet input is empty");
    }
    if (radius <= 0) {
        return Result<SolidPtr>::error(errors::kOperationFailed, "Fillet radius must be positive");
    }
    if (edges.empty()) {
        return Result<SolidPtr>::ok(SolidPtr(solid));
    }

    try {
        BRepFilletAPI_MakeFillet fillet(getOCCT(solid));

        for (const auto& edge : edges) {
            fillet.Add(radius, edge);
        }

        fillet.Build();

        if (!fillet.IsDone()) {
            return Result<SolidPtr>::error(errors::kOperationFailed,
                "Fillet operation failed for radius " + std::to_string(radius) + " mm");
        }

        SolidPtr result = makeSolid(fillet.Shape());
        SolidCheck check = result->check();
        if (!check.isSound()) {
            return Result<SolidPtr>::error(errors::kDegenerateGeometry,
                "Fillet result is not a sound solid: " + describeCheck(check));
        }

        return Result<SolidPtr>::ok(std::move(result));

    } catch (const Standard_Failure& e) {
        return Result<SolidPtr>::error(errors::kOcctException, e.GetMessageString());
    } catch (const std::exception& e) {
        return Result<SolidPtr>::error(errors::kException, e.what());
    }
}

} // namespace keycap::core::cad::kernel
