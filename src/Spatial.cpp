#include "keycap-core/Spatial.hpp"
#include <algorithm>
#include <cmath>

namespace keycap::core {

namespace {

constexpr int kMaxLeafTriangles = 8;
constexpr int kMaxDepth = 32;

} // anonymous namespace

// ==========================================
// AABB
// ==========================================

bool AABB::intersect(const Ray& ray, double& tMin, double& tMax) const {
    tMin = 0.0;
    tMax = std::numeric_limits<double>::max();

    for (int i = 0; i < 3; ++i) {
        double origin_i = ray.origin.component(i);
        double dir_i = ray.direction.component(i);
        double min_i = min.component(i);
        double max_i = max.component(i);

        if (std::abs(dir_i) < 1e-12) {
            // Parallel to slab
            if (origin_i < min_i || origin_i > max_i) {
                return false;
            }
        } else {
            double invD = 1.0 / dir_i;
            double t1 = (min_i - origin_i) * invD;
            double t2 = (max_i - origin_i) * invD;

            if (t1 > t2) std::swap(t1, t2);

            tMin = std::max(tMin, t1);
            tMax = std::min(tMax, t2);

            if (tMin > tMax) {
                return false;
            }
        }
    }

    return true;
}

// ==========================================
// Triangle utilities
// ==========================================

bool intersectRayTriangle(const Ray& ray,
                         const Vector3& v0,
                         const Vector3& v1,
                         const Vector3& v2,
                         double& t) {
    const double EPSILON = 1e-12;

    Vector3 edge1 = v1 - v0;
    Vector3 edge2 = v2 - v0;

    Vector3 h = ray.direction % edge2;
    double a = edge1 * h;

    if (std::abs(a) < EPSILON) {
        return false;
    }

    double f = 1.0 / a;
    Vector3 s = ray.origin - v0;
    double u = f * (s * h);

    if (u < 0.0 || u > 1.0) {
        return false;
    }

    Vector3 q = s % edge1;
    double v = f * (ray.direction * q);

    if (v < 0.0 || u + v > 1.0) {
        return false;
    }

    t = f * (edge2 * q);
    return t > 0.0;
}

Vector3 calculateTriangleNormal(const Vector3& v0, const Vector3& v1, const Vector3& v2) {
    return ((v1 - v0) % (v2 - v0)).normalized();
}

double calculateTriangleArea(const Vector3& v0, const Vector3& v1, const Vector3& v2) {
    return ((v1 - v0) % (v2 - v0)).length() * 0.5;
}

// ==========================================
// AABBTree
// ==========================================

void AABBTree::build(const Mesh& mesh) {
    vertices = &mesh.getVertices();
    faces = &mesh.getFaces();

    std::vector<int> triangleIndices(faces->size());
    for (size_t i = 0; i < faces->size(); ++i) {
        triangleIndices[i] = static_cast<int>(i);
    }

    root = triangleIndices.empty() ? nullptr : buildNode(triangleIndices, 0);
}

AABB AABBTree::computeBounds(const std::vector<int>& triangleIndices) const {
    AABB bounds;

    for (int triIdx : triangleIndices) {
        const Triangle& tri = (*faces)[triIdx];
        bounds.expand((*vertices)[tri.v0]);
        bounds.expand((*vertices)[tri.v1]);
        bounds.expand((*vertices)[tri.v2]);
    }

    return bounds;
}

std::unique_ptr<AABBTree::Node> AABBTree::buildNode(std::vector<int>& triangleIndices, int depth) {
    auto node = std::make_unique<Node>();
    node->bounds = computeBounds(triangleIndices);

    if (triangleIndices.size() <= static_cast<size_t>(kMaxLeafTriangles) || depth >= kMaxDepth) {
        node->triangleIndices = std::move(triangleIndices);
        return node;
    }

    // Split along the longest axis at the centroid median
    Vector3 extent = node->bounds.max - node->bounds.min;
    int axis = 0;
    if (extent.y > extent.x) axis = 1;
    if (extent.z > extent.component(axis)) axis = 2;

    auto centroid = [this, axis](int index) {
        const Triangle& tri = (*faces)[index];
        return ((*vertices)[tri.v0].component(axis) +
                (*vertices)[tri.v1].component(axis) +
                (*vertices)[tri.v2].component(axis)) / 3.0;
    };

    size_t mid = triangleIndices.size() / 2;
    std::nth_element(triangleIndices.begin(), triangleIndices.begin() + mid, triangleIndices.end(),
        [&centroid](int a, int b) { return centroid(a) < centroid(b); });

    std::vector<int> leftIndices(triangleIndices.begin(), triangleIndices.begin() + mid);
    std::vector<int> rightIndices(triangleIndices.begin() + mid, triangleIndices.end());

    node->left = buildNode(leftIndices, depth + 1);
    node->right = buildNode(rightIndices, depth + 1);

    return node;
}

RayHit AABBTree::rayCast(const Ray& ray, double maxDistance, double minDistance) const {
    RayHit bestHit;

    if (!root) {
        return bestHit;
    }

    rayCastRecursive(root.get(), ray, maxDistance, minDistance, bestHit);
    return bestHit;
}

void AABBTree::rayCastRecursive(const Node* node, const Ray& ray, double maxDistance,
                                double minDistance, RayHit& bestHit) const {
    if (!node) {
        return;
    }

    double tMin, tMax;
    if (!node->bounds.intersect(ray, tMin, tMax)) {
        return;
    }

    if (tMin > maxDistance || tMin > bestHit.distance) {
        return;
    }

    if (node->isLeaf()) {
        for (int triIdx : node->triangleIndices) {
            const Triangle& tri = (*faces)[triIdx];
            const Vector3& v0 = (*vertices)[tri.v0];
            const Vector3& v1 = (*vertices)[tri.v1];
            const Vector3& v2 = (*vertices)[tri.v2];

            double t;
            if (intersectRayTriangle(ray, v0, v1, v2, t) &&
                t > minDistance && t < maxDistance && t < bestHit.distance) {
                bestHit.hit = true;
                bestHit.distance = t;
                bestHit.triangleIndex = triIdx;
                bestHit.point = ray.at(t);
                bestHit.normal = calculateTriangleNormal(v0, v1, v2);
            }
        }
    } else {
        rayCastRecursive(node->left.get(), ray, maxDistance, minDistance, bestHit);
        rayCastRecursive(node->right.get(), ray, maxDistance, minDistance, bestHit);
    }
}

} // namespace keycap::core
