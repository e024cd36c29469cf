#include "keycap-core/cad/BevelEngine.hpp"
#include "Kernel.hpp"
#include "OCCTSolid.hpp"

#include <BRepAdaptor_Curve.hxx>
#include <BRepGProp_Face.hxx>
#include <BRepTools.hxx>
#include <BRep_Tool.hxx>
#include <Geom2d_Curve.hxx>
#include <Geom_Surface.hxx>
#include <ShapeAnalysis_Surface.hxx>
#include <Standard_Failure.hxx>
#include <TopExp.hxx>
#include <TopTools_IndexedDataMapOfShapeListOfShape.hxx>
#include <TopTools_ListIteratorOfListOfShape.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>
#include <gp_Pnt2d.hxx>
#include <gp_Vec.hxx>

#include <chrono>
#include <cmath>

namespace keycap::core::cad {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Outward unit normal of a face at surface parameters (u, v)
gp_Vec faceNormalAt(const TopoDS_Face& face, double u, double v) {
    BRepGProp_Face props(face);
    gp_Pnt point;
    gp_Vec normal;
    props.Normal(u, v, point, normal);

    if (normal.Magnitude() > 1e-12) {
        normal.Normalize();
    }
    return normal;
}

// Outward unit normal of a face where it meets the middle of an edge
gp_Vec faceNormalAlongEdge(const TopoDS_Face& face, const TopoDS_Edge& edge) {
    double first = 0, last = 0;
    Handle(Geom2d_Curve) pcurve = BRep_Tool::CurveOnSurface(edge, face, first, last);

    if (!pcurve.IsNull()) {
        gp_Pnt2d uv = pcurve->Value((first + last) / 2.0);
        return faceNormalAt(face, uv.X(), uv.Y());
    }

    // No parametric curve: project the 3D midpoint onto the surface
    BRepAdaptor_Curve curve(edge);
    gp_Pnt mid = curve.Value((curve.FirstParameter() + curve.LastParameter()) / 2.0);

    ShapeAnalysis_Surface surface(BRep_Tool::Surface(face));
    gp_Pnt2d uv = surface.ValueOfUV(mid, BRep_Tool::Tolerance(edge));
    return faceNormalAt(face, uv.X(), uv.Y());
}

bool isDownFacing(const TopoDS_Face& face, const BevelOptions& options) {
    double umin, umax, vmin, vmax;
    BRepTools::UVBounds(face, umin, umax, vmin, vmax);
    gp_Vec normal = faceNormalAt(face, (umin + umax) / 2.0, (vmin + vmax) / 2.0);
    return normal.Z() < -options.downFacingCosine;
}

std::vector<TopoDS_Edge> selectSharpEdges(const TopoDS_Shape& shape, const BevelOptions& options) {
    const double threshold = options.sharpAngleDegrees * kPi / 180.0;

    TopTools_IndexedDataMapOfShapeListOfShape edgeFaces;
    TopExp::MapShapesAndAncestors(shape, TopAbs_EDGE, TopAbs_FACE, edgeFaces);

    std::vector<TopoDS_Edge> sharp;

    for (int i = 1; i <= edgeFaces.Extent(); ++i) {
        const TopoDS_Edge& edge = TopoDS::Edge(edgeFaces.FindKey(i));
        const TopTools_ListOfShape& faces = edgeFaces.FindFromIndex(i);

        if (BRep_Tool::Degenerated(edge) || faces.Extent() != 2) {
            continue;
        }

        const TopoDS_Face& f1 = TopoDS::Face(faces.First());
        const TopoDS_Face& f2 = TopoDS::Face(faces.Last());
        if (f1.IsSame(f2)) {
            continue;  // seam
        }

        if (isDownFacing(f1, options) || isDownFacing(f2, options)) {
            continue;
        }

        gp_Vec n1 = faceNormalAlongEdge(f1, edge);
        gp_Vec n2 = faceNormalAlongEdge(f2, edge);
        if (n1.Magnitude() < 1e-12 || n2.Magnitude() < 1e-12) {
            continue;
        }

        if (n1.Angle(n2) > threshold) {
            sharp.push_back(edge);
        }
    }

    return sharp;
}

} // anonymous namespace

Result<size_t> countSharpEdges(const SolidPtr& solid, const BevelOptions& options) {
    if (!solid) {
        return Result<size_t>::error(errors::kOperationFailed, "No solid to inspect");
    }

    try {
        return Result<size_t>::ok(selectSharpEdges(getOCCT(solid), options).size());
    } catch (const Standard_Failure& e) {
        return Result<size_t>::error(errors::kOcctException, e.GetMessageString());
    }
}

Result<SolidPtr> applyBevel(const SolidPtr& solid, double radius, const BevelOptions& options) {
    auto start = std::chrono::high_resolution_clock::now();

    if (!solid) {
        return Result<SolidPtr>::error(errors::kOperationFailed, "No solid to bevel");
    }
    if (!std::isfinite(radius) || radius < 0) {
        return Result<SolidPtr>::error(errors::kConfiguration, "Bevel radius must not be negative");
    }

    if (radius == 0.0) {
        return Result<SolidPtr>::ok(SolidPtr(solid));
    }

    std::vector<TopoDS_Edge> edges;
    try {
        edges = selectSharpEdges(getOCCT(solid), options);
    } catch (const Standard_Failure& e) {
        return Result<SolidPtr>::error(errors::kOcctException, e.GetMessageString());
    }

    auto result = kernel::filletEdges(solid, edges, radius);

    auto end = std::chrono::high_resolution_clock::now();
    result.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

} // namespace keycap::core::cad
