#pragma once

#include <memory>
#include "Types.hpp"
#include "../Mesh.hpp"

namespace keycap::core::cad {

/**
 * @brief Structural health of a solid
 */
struct SolidCheck {
    bool valid = false;            // Kernel validity analysis passed
    size_t freeEdges = 0;          // Edges bounding a single face (holes)
    size_t nonManifoldEdges = 0;   // Edges shared by more than two faces
    size_t solidCount = 0;
    double volume = 0;             // Signed; positive for outward orientation

    /**
     * @brief Valid, closed, manifold, positive volume, exactly one solid
     */
    bool isSound() const {
        return valid && freeEdges == 0 && nonManifoldEdges == 0 &&
               solidCount == 1 && volume > 0.0;
    }
};

/**
 * @brief Boundary-representation solid (abstracts the OCCT TopoDS_Shape)
 *
 * Stage outputs are shared as SolidPtr and never mutated after creation,
 * so a cache can hand the same instance to several downstream stages.
 */
class Solid {
public:
    virtual ~Solid() = default;

    virtual BoundingBox getBoundingBox() const = 0;
    virtual double getVolume() const = 0;
    virtual double getSurfaceArea() const = 0;
    virtual Vector3 getCenterOfMass() const = 0;
    virtual size_t getFaceCount() const = 0;
    virtual size_t getEdgeCount() const = 0;
    virtual SolidCheck check() const = 0;

    /**
     * @brief Triangulate into a welded, watertight mesh
     */
    virtual Result<Mesh> tessellate(const TessellateOptions& options) const = 0;

    // Kernel access for library internals
    virtual const void* getOCCTShape() const = 0;
};

using SolidPtr = std::shared_ptr<const Solid>;

} // namespace keycap::core::cad
