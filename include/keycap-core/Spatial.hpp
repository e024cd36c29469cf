#pragma once
#include "Vector3.hpp"
#include "Mesh.hpp"
#include <algorithm>
#include <limits>
#include <memory>
#include <vector>

namespace keycap::core {

/**
 * @brief Ray for spatial queries
 */
struct Ray {
    Vector3 origin;
    Vector3 direction; // Should be normalized

    Ray() = default;
    Ray(const Vector3& o, const Vector3& d) : origin(o), direction(d) {}

    Vector3 at(double t) const {
        return origin + direction * t;
    }
};

/**
 * @brief Axis-Aligned Bounding Box
 */
struct AABB {
    Vector3 min;
    Vector3 max;

    AABB() : min(Vector3(std::numeric_limits<double>::max(),
                        std::numeric_limits<double>::max(),
                        std::numeric_limits<double>::max())),
             max(Vector3(std::numeric_limits<double>::lowest(),
                        std::numeric_limits<double>::lowest(),
                        std::numeric_limits<double>::lowest())) {}

    void expand(const Vector3& point) {
        min.x = std::min(min.x, point.x);
        min.y = std::min(min.y, point.y);
        min.z = std::min(min.z, point.z);
        max.x = std::max(max.x, point.x);
        max.y = std::max(max.y, point.y);
        max.z = std::max(max.z, point.z);
    }

    /**
     * @brief Test ray-box intersection (slab method)
     */
    bool intersect(const Ray& ray, double& tMin, double& tMax) const;
};

/**
 * @brief Hit information from ray casting
 */
struct RayHit {
    bool hit;
    double distance;
    int triangleIndex;
    Vector3 point;
    Vector3 normal;

    RayHit() : hit(false), distance(std::numeric_limits<double>::max()), triangleIndex(-1) {}
};

/**
 * @brief Bounding volume hierarchy over the triangles of a Mesh
 *
 * Used for wall thickness measurement and stem probing on the baked
 * keycap. The tree references the mesh buffers, so the mesh must outlive it.
 */
class AABBTree {
public:
    AABBTree() = default;

    void build(const Mesh& mesh);

    /**
     * @brief Closest hit along the ray
     * @param minDistance Hits nearer than this are ignored (self-hits)
     */
    RayHit rayCast(const Ray& ray,
                   double maxDistance = std::numeric_limits<double>::max(),
                   double minDistance = 1e-6) const;

    bool isBuilt() const { return root != nullptr; }

private:
    struct Node {
        AABB bounds;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
        std::vector<int> triangleIndices; // Leaf nodes only

        bool isLeaf() const { return !left && !right; }
    };

    std::unique_ptr<Node> root;
    const std::vector<Vector3>* vertices = nullptr;
    const std::vector<Triangle>* faces = nullptr;

    std::unique_ptr<Node> buildNode(std::vector<int>& triangleIndices, int depth);
    AABB computeBounds(const std::vector<int>& triangleIndices) const;
    void rayCastRecursive(const Node* node, const Ray& ray, double maxDistance,
                          double minDistance, RayHit& bestHit) const;
};

/**
 * @brief Möller-Trumbore ray-triangle intersection
 * @return true if the ray hits the triangle at t > 0
 */
bool intersectRayTriangle(const Ray& ray,
                         const Vector3& v0,
                         const Vector3& v1,
                         const Vector3& v2,
                         double& t);

Vector3 calculateTriangleNormal(const Vector3& v0, const Vector3& v1, const Vector3& v2);

double calculateTriangleArea(const Vector3& v0, const Vector3& v1, const Vector3& v2);

} // namespace keycap::core
