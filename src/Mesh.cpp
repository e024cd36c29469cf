#include "keycap-core/Mesh.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>

namespace keycap::core {

namespace {

using EdgeKey = std::pair<int, int>;

// Undirected edge -> number of incident triangles
std::map<EdgeKey, int> countEdgeUses(const std::vector<Triangle>& faces) {
    std::map<EdgeKey, int> edgeCount;

    for (const auto& face : faces) {
        int edges[3][2] = {
            {face.v0, face.v1},
            {face.v1, face.v2},
            {face.v2, face.v0}
        };

        for (int i = 0; i < 3; ++i) {
            int a = edges[i][0];
            int b = edges[i][1];
            EdgeKey edge = (a < b) ? std::make_pair(a, b) : std::make_pair(b, a);
            edgeCount[edge]++;
        }
    }

    return edgeCount;
}

int findRoot(std::vector<int>& parent, int i) {
    while (parent[i] != i) {
        parent[i] = parent[parent[i]];
        i = parent[i];
    }
    return i;
}

} // anonymous namespace

Mesh::Mesh(std::vector<Vector3> vertices_, std::vector<Triangle> faces_)
    : vertices(std::move(vertices_)), faces(std::move(faces_)) {}

double Mesh::getSignedVolume() const {
    double volume = 0.0;

    for (const auto& face : faces) {
        const Vector3& p1 = vertices[face.v0];
        const Vector3& p2 = vertices[face.v1];
        const Vector3& p3 = vertices[face.v2];
        volume += p1 * (p2 % p3);
    }

    return volume / 6.0;
}

double Mesh::getVolume() const {
    return std::abs(getSignedVolume());
}

bool Mesh::isWatertight() const {
    if (faces.empty()) {
        return false;
    }

    for (const auto& entry : countEdgeUses(faces)) {
        if (entry.second != 2) {
            return false;
        }
    }
    return true;
}

bool Mesh::isConsistentlyOriented() const {
    if (faces.empty()) {
        return false;
    }

    std::map<EdgeKey, int> directed;
    for (const auto& face : faces) {
        directed[{face.v0, face.v1}]++;
        directed[{face.v1, face.v2}]++;
        directed[{face.v2, face.v0}]++;
    }

    for (const auto& entry : directed) {
        if (entry.second != 1) {
            return false;
        }
        auto reverse = directed.find({entry.first.second, entry.first.first});
        if (reverse == directed.end() || reverse->second != 1) {
            return false;
        }
    }
    return true;
}

size_t Mesh::countBoundaryEdges() const {
    size_t count = 0;
    for (const auto& entry : countEdgeUses(faces)) {
        if (entry.second == 1) ++count;
    }
    return count;
}

size_t Mesh::countNonManifoldEdges() const {
    size_t count = 0;
    for (const auto& entry : countEdgeUses(faces)) {
        if (entry.second > 2) ++count;
    }
    return count;
}

size_t Mesh::countConnectedComponents() const {
    if (faces.empty()) {
        return 0;
    }

    std::vector<int> parent(vertices.size());
    std::iota(parent.begin(), parent.end(), 0);

    for (const auto& face : faces) {
        int r0 = findRoot(parent, face.v0);
        int r1 = findRoot(parent, face.v1);
        int r2 = findRoot(parent, face.v2);
        parent[r1] = r0;
        parent[r2] = r0;
    }

    std::vector<bool> isRoot(vertices.size(), false);
    for (const auto& face : faces) {
        isRoot[findRoot(parent, face.v0)] = true;
    }
    return static_cast<size_t>(std::count(isRoot.begin(), isRoot.end(), true));
}

std::pair<Vector3, Vector3> Mesh::getExtents() const {
    if (vertices.empty()) {
        return {Vector3(0, 0, 0), Vector3(0, 0, 0)};
    }

    Vector3 lo(std::numeric_limits<double>::max(),
               std::numeric_limits<double>::max(),
               std::numeric_limits<double>::max());
    Vector3 hi(std::numeric_limits<double>::lowest(),
               std::numeric_limits<double>::lowest(),
               std::numeric_limits<double>::lowest());

    for (const auto& vertex : vertices) {
        lo.x = std::min(lo.x, vertex.x);
        lo.y = std::min(lo.y, vertex.y);
        lo.z = std::min(lo.z, vertex.z);
        hi.x = std::max(hi.x, vertex.x);
        hi.y = std::max(hi.y, vertex.y);
        hi.z = std::max(hi.z, vertex.z);
    }

    return {lo, hi};
}

Vector3 Mesh::getBoundingBox() const {
    auto [lo, hi] = getExtents();
    return hi - lo;
}

bool Mesh::approxEquals(const Mesh& other, double tolerance) const {
    if (vertices.size() != other.vertices.size() || faces.size() != other.faces.size()) {
        return false;
    }

    for (size_t i = 0; i < vertices.size(); ++i) {
        if (!vertices[i].approxEquals(other.vertices[i], tolerance)) {
            return false;
        }
    }

    for (size_t i = 0; i < faces.size(); ++i) {
        const Triangle& a = faces[i];
        const Triangle& b = other.faces[i];
        if (a.v0 != b.v0 || a.v1 != b.v1 || a.v2 != b.v2) {
            return false;
        }
    }
    return true;
}

} // namespace keycap::core
