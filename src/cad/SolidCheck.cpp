/**
 * SolidCheck.cpp - Structural validation of kernel solids
 */

#include "Kernel.hpp"

#include <BRepCheck_Analyzer.hxx>
#include <BRepGProp.hxx>
#include <BRep_Tool.hxx>
#include <GProp_GProps.hxx>
#include <Standard_Failure.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_IndexedDataMapOfShapeListOfShape.hxx>
#include <TopoDS.hxx>

#include <sstream>

namespace keycap::core::cad::kernel {

SolidCheck checkSolid(const TopoDS_Shape& shape) {
    SolidCheck check;

    if (shape.IsNull()) {
        return check;
    }

    try {
        BRepCheck_Analyzer analyzer(shape);
        check.valid = analyzer.IsValid() == Standard_True;

        for (TopExp_Explorer exp(shape, TopAbs_SOLID); exp.More(); exp.Next()) {
            check.solidCount++;
        }

        // Edge -> faces adjacency; closed manifold solids have exactly 2
        TopTools_IndexedDataMapOfShapeListOfShape edgeFaces;
        TopExp::MapShapesAndAncestors(shape, TopAbs_EDGE, TopAbs_FACE, edgeFaces);

        for (int i = 1; i <= edgeFaces.Extent(); ++i) {
            const TopoDS_Edge& edge = TopoDS::Edge(edgeFaces.FindKey(i));
            if (BRep_Tool::Degenerated(edge)) {
                continue;
            }

            int faceCount = edgeFaces.FindFromIndex(i).Extent();
            if (faceCount < 2) {
                check.freeEdges++;
            } else if (faceCount > 2) {
                check.nonManifoldEdges++;
            }
        }

        GProp_GProps props;
        BRepGProp::VolumeProperties(shape, props);
        check.volume = props.Mass();

    } catch (const Standard_Failure&) {
        check.valid = false;
    }

    return check;
}

std::string describeCheck(const SolidCheck& check) {
    if (check.isSound()) {
        return "";
    }

    std::stringstream ss;
    const char* separator = "";

    if (!check.valid) {
        ss << separator << "invalid topology";
        separator = ", ";
    }
    if (check.freeEdges > 0) {
        ss << separator << check.freeEdges << " free edges";
        separator = ", ";
    }
    if (check.nonManifoldEdges > 0) {
        ss << separator << check.nonManifoldEdges << " non-manifold edges";
        separator = ", ";
    }
    if (check.solidCount != 1) {
        ss << separator << check.solidCount << " solids";
        separator = ", ";
    }
    if (check.volume <= 0) {
        ss << separator << "non-positive volume " << check.volume;
    }

    return ss.str();
}

} // namespace keycap::core::cad::kernel
