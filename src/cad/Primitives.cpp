/**
 * Primitives.cpp - Section wires and stem prisms
 */

#include "Kernel.hpp"
#include "OCCTSolid.hpp"

#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <GC_MakeSegment.hxx>
#include <Standard_Failure.hxx>
#include <StdFail_NotDone.hxx>
#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>

namespace keycap::core::cad::kernel {

namespace {

inline gp_Pnt toGpPnt(const Vector3& v) {
    return gp_Pnt(v.x, v.y, v.z);
}

} // anonymous namespace

// ===========================================================================
// Wires
// ===========================================================================

TopoDS_Wire makePolygonWire(const std::vector<Vector3>& points) {
    if (points.size() < 3) {
        throw StdFail_NotDone("Polygon wire requires at least 3 points");
    }

    BRepBuilderAPI_MakeWire makeWire;

    for (size_t i = 0; i < points.size(); ++i) {
        const Vector3& from = points[i];
        const Vector3& to = points[(i + 1) % points.size()];

        GC_MakeSegment seg(toGpPnt(from), toGpPnt(to));
        if (!seg.IsDone()) {
            throw StdFail_NotDone("Degenerate polygon segment");
        }

        BRepBuilderAPI_MakeEdge edge(seg.Value());
        if (!edge.IsDone()) {
            throw StdFail_NotDone("Failed to create polygon edge");
        }
        makeWire.Add(edge.Edge());
    }

    makeWire.Build();
    if (!makeWire.IsDone()) {
        throw StdFail_NotDone("Failed to create polygon wire");
    }

    return makeWire.Wire();
}

TopoDS_Wire makeSectionWire(const SectionRect& section) {
    const auto corners = section.corners();
    return makePolygonWire(std::vector<Vector3>(corners.begin(), corners.end()));
}

// ===========================================================================
// Prism
// ===========================================================================

Result<SolidPtr> makePrism(const std::vector<Vector3>& polygon, double height) {
    if (height <= 0) {
        return Result<SolidPtr>::error(errors::kDegenerateGeometry, "Prism height must be positive");
    }

    try {
        TopoDS_Wire wire = makePolygonWire(polygon);

        BRepBuilderAPI_MakeFace face(wire, Standard_True);
        if (!face.IsDone()) {
            return Result<SolidPtr>::error(errors::kOperationFailed, "Failed to create prism base face");
        }

        BRepPrimAPI_MakePrism prism(face.Face(), gp_Vec(0, 0, height));
        prism.Build();

        if (!prism.IsDone()) {
            return Result<SolidPtr>::error(errors::kOperationFailed, "Prism extrusion failed");
        }

        SolidPtr solid = makeSolid(prism.Shape());
        SolidCheck check = solid->check();
        if (!check.isSound()) {
            return Result<SolidPtr>::error(errors::kDegenerateGeometry,
                "Prism is not a sound solid: " + describeCheck(check));
        }

        return Result<SolidPtr>::ok(std::move(solid));

    } catch (const Standard_Failure& e) {
        return Result<SolidPtr>::error(errors::kOcctException, e.GetMessageString());
    } catch (const std::exception& e) {
        return Result<SolidPtr>::error(errors::kException, e.what());
    }
}

} // namespace keycap::core::cad::kernel
