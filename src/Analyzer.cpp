#include "keycap-core/Analyzer.hpp"
#include <iostream>
#include <cmath>
#include <limits>

namespace keycap::core {

namespace {

// Origin offset below the surface for inward rays
constexpr double kRayInset = 1e-4;

// Probes start this far below the base plane
constexpr double kProbeStartZ = -1.0;

} // anonymous namespace

Analyzer::Analyzer() = default;

Analyzer::Analyzer(std::shared_ptr<const Mesh> mesh_) : mesh(std::move(mesh_)) {}

Analyzer::~Analyzer() = default;

void Analyzer::setMesh(std::shared_ptr<const Mesh> mesh_) {
    mesh = std::move(mesh_);
    spatialTree.reset();
}

bool Analyzer::hasMesh() const {
    return mesh && !mesh->empty();
}

// ========================================
// Mesh Queries
// ========================================

double Analyzer::getVolume() const {
    if (!mesh) return 0.0;
    return mesh->getVolume();
}

bool Analyzer::isWatertight() const {
    if (!mesh) return false;
    return mesh->isWatertight();
}

bool Analyzer::isConsistentlyOriented() const {
    if (!mesh) return false;
    return mesh->isConsistentlyOriented();
}

size_t Analyzer::getComponentCount() const {
    if (!mesh) return 0;
    return mesh->countConnectedComponents();
}

Vector3 Analyzer::getBoundingBox() const {
    if (!mesh) return Vector3(0, 0, 0);
    return mesh->getBoundingBox();
}

size_t Analyzer::getVertexCount() const {
    if (!mesh) return 0;
    return mesh->getVertexCount();
}

size_t Analyzer::getTriangleCount() const {
    if (!mesh) return 0;
    return mesh->getTriangleCount();
}

// ========================================
// Ray Queries
// ========================================

bool Analyzer::buildSpatialIndex() {
    if (!hasMesh()) {
        std::cerr << "Error: Cannot build spatial index - no mesh loaded" << std::endl;
        return false;
    }

    spatialTree = std::make_unique<AABBTree>();
    spatialTree->build(*mesh);
    return true;
}

WallThicknessReport Analyzer::measureWallThickness(double thinThresholdMM,
                                                   size_t sampleStride) const {
    WallThicknessReport report;

    if (!spatialTree || !spatialTree->isBuilt()) {
        std::cerr << "Warning: Spatial index not built - skipping wall thickness analysis" << std::endl;
        return report;
    }

    const auto& vertices = mesh->getVertices();
    const std::vector<Vector3> normals = computeVertexNormals();
    const size_t stride = sampleStride == 0 ? 1 : sampleStride;

    double minThickness = std::numeric_limits<double>::max();

    for (size_t i = 0; i < vertices.size(); i += stride) {
        const Vector3& normal = normals[i];
        if (normal.length() < 0.5) {
            continue; // unreferenced vertex
        }

        Ray ray(vertices[i] - normal * kRayInset, -normal);
        RayHit hit = spatialTree->rayCast(ray);
        if (!hit.hit) {
            continue;
        }

        double thickness = hit.distance + kRayInset;
        report.sampledVertices++;

        if (thickness < thinThresholdMM) {
            report.thinVertexCount++;
        }
        if (thickness < minThickness) {
            minThickness = thickness;
            report.thinnestPoint = vertices[i];
        }
    }

    if (report.sampledVertices > 0) {
        report.minThickness = minThickness;
    }

    return report;
}

RayHit Analyzer::probeUp(double x, double y) const {
    if (!spatialTree || !spatialTree->isBuilt()) {
        return RayHit();
    }

    Ray ray(Vector3(x, y, kProbeStartZ), Vector3(0, 0, 1));
    return spatialTree->rayCast(ray);
}

// ========================================
// Private Helper Methods
// ========================================

std::vector<Vector3> Analyzer::computeVertexNormals() const {
    const auto& vertices = mesh->getVertices();
    const auto& faces = mesh->getFaces();

    std::vector<Vector3> normals(vertices.size(), Vector3(0, 0, 0));

    // Unnormalized cross product weights each face by its area
    for (const auto& face : faces) {
        const Vector3& v0 = vertices[face.v0];
        const Vector3& v1 = vertices[face.v1];
        const Vector3& v2 = vertices[face.v2];
        Vector3 weighted = (v1 - v0) % (v2 - v0);

        normals[face.v0] += weighted;
        normals[face.v1] += weighted;
        normals[face.v2] += weighted;
    }

    for (auto& normal : normals) {
        normal = normal.normalized();
    }

    return normals;
}

} // namespace keycap::core
