/**
 * Tessellator.cpp - B-rep to welded triangle mesh
 */

#include "Kernel.hpp"

#include <BRepBuilderAPI_Copy.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRep_Tool.hxx>
#include <Poly_Triangulation.hxx>
#include <Poly_Triangle.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopLoc_Location.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>
#include <gp_Pnt.hxx>

#include <cmath>
#include <map>
#include <sstream>
#include <tuple>
#include <vector>

namespace keycap::core::cad::kernel {

namespace {

// Nodes closer than this are the same vertex
constexpr double kWeldTolerance = 1e-6;

using WeldKey = std::tuple<long long, long long, long long>;

WeldKey makeWeldKey(const gp_Pnt& p) {
    return WeldKey(
        std::llround(p.X() / kWeldTolerance),
        std::llround(p.Y() / kWeldTolerance),
        std::llround(p.Z() / kWeldTolerance)
    );
}

} // anonymous namespace

Result<Mesh> tessellate(const TopoDS_Shape& source, const TessellateOptions& options) {
    if (source.IsNull()) {
        return Result<Mesh>::error(errors::kTessellationFailed, "Cannot tessellate an empty shape");
    }

    try {
        // ========================================
        // Step 1: Mesh a private copy
        // ========================================

        // The input may be shared between cached stages; triangulation is
        // stored on the shape, so mesh a geometry copy instead.
        BRepBuilderAPI_Copy copier(source);
        TopoDS_Shape shape = copier.Shape();

        BRepMesh_IncrementalMesh mesher(shape,
                                        options.linearDeflection,
                                        options.relative ? Standard_True : Standard_False,
                                        options.angularDeflection,
                                        Standard_False);

        if (!mesher.IsDone()) {
            return Result<Mesh>::error(errors::kTessellationFailed, "Mesh generation failed");
        }

        // ========================================
        // Step 2: Extract and weld triangulation data
        // ========================================

        std::vector<Vector3> vertices;
        std::vector<Triangle> triangles;
        std::map<WeldKey, int> vertexMap;

        for (TopExp_Explorer faceExp(shape, TopAbs_FACE); faceExp.More(); faceExp.Next()) {
            const TopoDS_Face& face = TopoDS::Face(faceExp.Current());

            TopLoc_Location loc;
            Handle(Poly_Triangulation) triangulation = BRep_Tool::Triangulation(face, loc);

            if (triangulation.IsNull()) {
                return Result<Mesh>::error(errors::kTessellationFailed,
                    "Face without triangulation");
            }

            const gp_Trsf transform = loc.Transformation();

            // OCCT uses 1-based node indices
            std::vector<int> localToGlobal(triangulation->NbNodes() + 1);

            for (int i = 1; i <= triangulation->NbNodes(); ++i) {
                gp_Pnt pt = triangulation->Node(i).Transformed(transform);

                WeldKey key = makeWeldKey(pt);
                auto it = vertexMap.find(key);
                if (it != vertexMap.end()) {
                    localToGlobal[i] = it->second;
                } else {
                    int globalIndex = static_cast<int>(vertices.size());
                    vertices.emplace_back(pt.X(), pt.Y(), pt.Z());
                    vertexMap.emplace(key, globalIndex);
                    localToGlobal[i] = globalIndex;
                }
            }

            // Reversed faces have their outward normal flipped
            const bool reversed = (face.Orientation() == TopAbs_REVERSED);

            for (int i = 1; i <= triangulation->NbTriangles(); ++i) {
                int n1, n2, n3;
                triangulation->Triangle(i).Get(n1, n2, n3);

                Triangle triangle = reversed
                    ? Triangle(localToGlobal[n1], localToGlobal[n3], localToGlobal[n2])
                    : Triangle(localToGlobal[n1], localToGlobal[n2], localToGlobal[n3]);

                // Sliver collapsed by welding
                if (triangle.v0 == triangle.v1 || triangle.v1 == triangle.v2 ||
                    triangle.v2 == triangle.v0) {
                    continue;
                }

                triangles.push_back(triangle);
            }
        }

        if (triangles.empty()) {
            return Result<Mesh>::error(errors::kTessellationFailed, "No triangles extracted");
        }

        Mesh mesh(std::move(vertices), std::move(triangles));

        // ========================================
        // Step 3: Verify the mesh is printable
        // ========================================

        if (!mesh.isWatertight()) {
            std::stringstream ss;
            ss << "Tessellation is not watertight: " << mesh.countBoundaryEdges()
               << " boundary edges, " << mesh.countNonManifoldEdges() << " non-manifold edges";
            return Result<Mesh>::error(errors::kTessellationFailed, ss.str());
        }

        if (!mesh.isConsistentlyOriented()) {
            return Result<Mesh>::error(errors::kTessellationFailed,
                "Tessellation has inconsistent triangle winding");
        }

        if (mesh.getSignedVolume() <= 0) {
            return Result<Mesh>::error(errors::kTessellationFailed,
                "Tessellation encloses non-positive volume");
        }

        return Result<Mesh>::ok(std::move(mesh));

    } catch (const Standard_Failure& e) {
        return Result<Mesh>::error(errors::kOcctException, e.GetMessageString());
    } catch (const std::exception& e) {
        return Result<Mesh>::error(errors::kException, e.what());
    }
}

} // namespace keycap::core::cad::kernel
