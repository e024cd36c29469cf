#pragma once
#include <cmath>

namespace keycap::core {

/**
 * @brief 3D point / direction in millimetres
 *
 * Cap space is right-handed: +X across the key, +Y toward the front
 * (typing side), +Z up from the base plane.
 */
struct Vector3 {
    double x, y, z;

    Vector3() : x(0.0), y(0.0), z(0.0) {}
    Vector3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vector3 operator+(const Vector3& other) const {
        return Vector3(x + other.x, y + other.y, z + other.z);
    }

    Vector3 operator-(const Vector3& other) const {
        return Vector3(x - other.x, y - other.y, z - other.z);
    }

    Vector3 operator-() const {
        return Vector3(-x, -y, -z);
    }

    Vector3 operator*(double scalar) const {
        return Vector3(x * scalar, y * scalar, z * scalar);
    }

    Vector3& operator+=(const Vector3& other) {
        x += other.x;
        y += other.y;
        z += other.z;
        return *this;
    }

    // Dot product
    double operator*(const Vector3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    Vector3 operator%(const Vector3& other) const {
        return Vector3(
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        );
    }

    double length() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    Vector3 normalized() const {
        double len = length();
        if (len < 1e-12) return Vector3(0, 0, 0);
        return Vector3(x / len, y / len, z / len);
    }

    double component(int axis) const {
        return (axis == 0) ? x : (axis == 1) ? y : z;
    }

    bool approxEquals(const Vector3& other, double tolerance) const {
        return std::abs(x - other.x) <= tolerance &&
               std::abs(y - other.y) <= tolerance &&
               std::abs(z - other.z) <= tolerance;
    }
};

} // namespace keycap::core
