#pragma once
#include "Vector3.hpp"
#include <cstddef>
#include <utility>
#include <vector>

namespace keycap::core {

/**
 * @brief Triangle face defined by 3 vertex indices (counter-clockwise seen
 * from outside)
 */
struct Triangle {
    int v0, v1, v2;

    Triangle() : v0(0), v1(0), v2(0) {}
    Triangle(int a, int b, int c) : v0(a), v1(b), v2(c) {}
};

/**
 * @brief Indexed triangle mesh
 *
 * Output form of the keycap pipeline: the live preview and the baked,
 * exportable keycap are both Mesh instances. Vertices are welded, so two
 * triangles sharing an edge share its vertex indices and topology checks
 * can run directly on the index buffer.
 */
class Mesh {
public:
    Mesh() = default;
    Mesh(std::vector<Vector3> vertices, std::vector<Triangle> faces);

    /**
     * @brief Signed volume using the divergence theorem
     *
     * For each triangle (p1, p2, p3): V += (1/6) * dot(p1, cross(p2, p3)).
     * Positive for a closed mesh with outward-facing winding.
     */
    double getSignedVolume() const;

    /**
     * @brief Absolute enclosed volume in mm³
     */
    double getVolume() const;

    /**
     * @brief Check if every edge is shared by exactly 2 faces
     *
     * A watertight mesh has no holes and no non-manifold edges,
     * which is the requirement for slicing and printing.
     */
    bool isWatertight() const;

    /**
     * @brief Check that adjacent faces traverse their shared edge in
     * opposite directions
     *
     * Each directed edge (a -> b) must appear exactly once and be paired
     * with its reverse (b -> a).
     */
    bool isConsistentlyOriented() const;

    /**
     * @brief Number of edges used by exactly one triangle
     */
    size_t countBoundaryEdges() const;

    /**
     * @brief Number of edges used by more than two triangles
     */
    size_t countNonManifoldEdges() const;

    /**
     * @brief Number of edge-connected triangle groups
     */
    size_t countConnectedComponents() const;

    /**
     * @brief Get bounding box dimensions
     * @return Vector3 containing (width, depth, height)
     */
    Vector3 getBoundingBox() const;

    /**
     * @brief Get bounding box corners as (min, max)
     */
    std::pair<Vector3, Vector3> getExtents() const;

    /**
     * @brief Compare vertex and index buffers within a tolerance
     */
    bool approxEquals(const Mesh& other, double tolerance) const;

    size_t getVertexCount() const { return vertices.size(); }
    size_t getTriangleCount() const { return faces.size(); }
    bool empty() const { return faces.empty(); }

    const std::vector<Vector3>& getVertices() const { return vertices; }
    const std::vector<Triangle>& getFaces() const { return faces; }

private:
    std::vector<Vector3> vertices;
    std::vector<Triangle> faces;
};

} // namespace keycap::core
