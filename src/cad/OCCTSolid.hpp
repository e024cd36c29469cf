#pragma once

/**
 * OCCTSolid - Solid implementation over an OpenCASCADE TopoDS_Shape
 */

#include "keycap-core/cad/Solid.hpp"
#include "Kernel.hpp"

#include <TopoDS_Shape.hxx>
#include <Bnd_Box.hxx>
#include <BRepBndLib.hxx>
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <TopAbs_ShapeEnum.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopExp.hxx>

#include <optional>

namespace keycap::core::cad {

class OCCTSolid : public Solid {
public:
    explicit OCCTSolid(const TopoDS_Shape& shape)
        : shape_(shape) {
        computeCachedProperties();
    }

    explicit OCCTSolid(TopoDS_Shape&& shape)
        : shape_(std::move(shape)) {
        computeCachedProperties();
    }

    ~OCCTSolid() override = default;

    BoundingBox getBoundingBox() const override {
        return cachedBBox_;
    }

    double getVolume() const override {
        if (!cachedVolume_.has_value()) {
            GProp_GProps props;
            BRepGProp::VolumeProperties(shape_, props);
            cachedVolume_ = props.Mass();
        }
        return cachedVolume_.value();
    }

    double getSurfaceArea() const override {
        GProp_GProps props;
        BRepGProp::SurfaceProperties(shape_, props);
        return props.Mass();
    }

    Vector3 getCenterOfMass() const override {
        GProp_GProps props;
        BRepGProp::VolumeProperties(shape_, props);
        gp_Pnt center = props.CentreOfMass();
        return Vector3(center.X(), center.Y(), center.Z());
    }

    size_t getFaceCount() const override {
        return countSubShapes(TopAbs_FACE);
    }

    size_t getEdgeCount() const override {
        return countSubShapes(TopAbs_EDGE);
    }

    SolidCheck check() const override {
        return kernel::checkSolid(shape_);
    }

    Result<Mesh> tessellate(const TessellateOptions& options) const override {
        return kernel::tessellate(shape_, options);
    }

    const void* getOCCTShape() const override {
        return &shape_;
    }

private:
    void computeCachedProperties() {
        // Exact surface extents; the plain Add() box follows B-spline poles
        Bnd_Box box;
        BRepBndLib::AddOptimal(shape_, box, Standard_False, Standard_False);

        if (!box.IsVoid()) {
            double xmin, ymin, zmin, xmax, ymax, zmax;
            box.Get(xmin, ymin, zmin, xmax, ymax, zmax);
            cachedBBox_.min = Vector3(xmin, ymin, zmin);
            cachedBBox_.max = Vector3(xmax, ymax, zmax);
        }
    }

    size_t countSubShapes(TopAbs_ShapeEnum type) const {
        TopTools_IndexedMapOfShape map;
        TopExp::MapShapes(shape_, type, map);
        return static_cast<size_t>(map.Extent());
    }

    TopoDS_Shape shape_;

    BoundingBox cachedBBox_;
    mutable std::optional<double> cachedVolume_;
};

// Helper to get OCCT shape from a solid
inline const TopoDS_Shape& getOCCT(const Solid* solid) {
    return *static_cast<const TopoDS_Shape*>(solid->getOCCTShape());
}

inline const TopoDS_Shape& getOCCT(const SolidPtr& solid) {
    return getOCCT(solid.get());
}

inline SolidPtr makeSolid(const TopoDS_Shape& shape) {
    return std::make_shared<OCCTSolid>(shape);
}

} // namespace keycap::core::cad
