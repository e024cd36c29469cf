#pragma once
#include <memory>
#include <vector>
#include "Mesh.hpp"
#include "Vector3.hpp"
#include "Spatial.hpp"

namespace keycap::core {

    /**
     * @brief Wall thickness measurement over a closed mesh
     */
    struct WallThicknessReport {
        double minThickness;     // Smallest inward ray distance found (mm)
        size_t sampledVertices;  // Vertices that produced a measurement
        int thinVertexCount;     // Samples below the requested threshold
        Vector3 thinnestPoint;   // Vertex where minThickness was measured

        WallThicknessReport()
            : minThickness(0.0)
            , sampledVertices(0)
            , thinVertexCount(0)
            , thinnestPoint(0, 0, 0) {}
    };

    /**
     * @brief Geometry checks on a finished keycap mesh
     *
     * Holds a shared reference to an immutable mesh (typically the baked
     * keycap) and answers the questions asked of a printable cap: is it
     * closed, how thin is its thinnest wall, and what does a vertical probe
     * from below the base plane hit first.
     */
    class Analyzer {
    public:
        Analyzer();
        explicit Analyzer(std::shared_ptr<const Mesh> mesh);
        ~Analyzer();

        /**
         * @brief Replace the analyzed mesh (drops any spatial index)
         */
        void setMesh(std::shared_ptr<const Mesh> mesh);

        bool hasMesh() const;

        // ========================================
        // Mesh Queries
        // ========================================

        double getVolume() const;
        bool isWatertight() const;
        bool isConsistentlyOriented() const;
        size_t getComponentCount() const;

        /**
         * @brief Get bounding box dimensions
         * @return Vector3 containing (width, depth, height)
         */
        Vector3 getBoundingBox() const;

        size_t getVertexCount() const;
        size_t getTriangleCount() const;

        // ========================================
        // Ray Queries
        // ========================================

        /**
         * @brief Build spatial acceleration structure for ray queries
         *
         * Required before measureWallThickness() and probeUp().
         * @return false if no mesh is loaded
         */
        bool buildSpatialIndex();

        /**
         * @brief Measure wall thickness by casting a ray inward from each vertex
         *
         * The ray starts just inside the surface (origin pulled back along the
         * area-weighted vertex normal) and reports the distance to the first
         * surface it crosses on the far side of the material.
         *
         * @param thinThresholdMM Samples below this count toward thinVertexCount
         * @param sampleStride Measure every N-th vertex (1 = all)
         */
        WallThicknessReport measureWallThickness(double thinThresholdMM,
                                                 size_t sampleStride = 1) const;

        /**
         * @brief Cast a ray straight up (+Z) from below the base plane at (x, y)
         *
         * Used to verify what sits in the stem column: the stem's bottom face
         * at z = 0, or the cavity ceiling when there is no stem.
         */
        RayHit probeUp(double x, double y) const;

    private:
        std::shared_ptr<const Mesh> mesh;
        std::unique_ptr<AABBTree> spatialTree;

        std::vector<Vector3> computeVertexNormals() const;
    };
}
