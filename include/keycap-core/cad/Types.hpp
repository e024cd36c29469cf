#pragma once

#include <array>
#include <string>
#include <vector>
#include "../Vector3.hpp"

namespace keycap::core::cad {

// ===========================================================================
// Error Codes
// ===========================================================================

namespace errors {

// Parameter surface
inline constexpr const char* kConfiguration = "CONFIGURATION_ERROR";
inline constexpr const char* kInvalidProfile = "INVALID_PROFILE";

// Geometry stages
inline constexpr const char* kDegenerateGeometry = "DEGENERATE_GEOMETRY";
inline constexpr const char* kBooleanFailure = "BOOLEAN_FAILURE";

// Kernel
inline constexpr const char* kOperationFailed = "OPERATION_FAILED";
inline constexpr const char* kOcctException = "OCCT_EXCEPTION";
inline constexpr const char* kTessellationFailed = "TESSELLATION_FAILED";
inline constexpr const char* kException = "EXCEPTION";

} // namespace errors

// ===========================================================================
// Core Types
// ===========================================================================

/**
 * @brief Bounding box representation
 */
struct BoundingBox {
    Vector3 min{0, 0, 0};
    Vector3 max{0, 0, 0};

    Vector3 center() const {
        return Vector3(
            (min.x + max.x) / 2.0,
            (min.y + max.y) / 2.0,
            (min.z + max.z) / 2.0
        );
    }

    Vector3 size() const {
        return Vector3(
            max.x - min.x,
            max.y - min.y,
            max.z - min.z
        );
    }
};

/**
 * @brief Axis-aligned rectangle lying in the plane z = const
 *
 * One station of a loft: the horizontal cross-section of the cap (or of
 * its cavity) at a given height.
 */
struct SectionRect {
    double z = 0;
    double xMin = 0;
    double xMax = 0;
    double yMin = 0;
    double yMax = 0;

    double width() const { return xMax - xMin; }
    double depth() const { return yMax - yMin; }

    // Counter-clockwise seen from +Z, starting at (xMin, yMin)
    std::array<Vector3, 4> corners() const {
        return {
            Vector3(xMin, yMin, z),
            Vector3(xMax, yMin, z),
            Vector3(xMax, yMax, z),
            Vector3(xMin, yMax, z)
        };
    }
};

/**
 * @brief Interior coordinate frame of a hollowed cap
 *
 * Origin at the footprint centre on the base plane, +Z up into the cap.
 * The stem is built in this frame.
 */
struct StemFrame {
    Vector3 origin{0, 0, 0};
    double cavityDepth = 0;     // Base plane to ceiling (mm)
    double ceilingHeight = 0;   // Absolute Z of the cavity ceiling
    double wallThickness = 0;   // Effective (possibly clamped) wall
    SectionRect clearance;      // Narrowest cavity section between base and ceiling
};

/**
 * @brief Tessellation options
 */
struct TessellateOptions {
    double linearDeflection = 0.02;  // Max distance from true surface (mm)
    double angularDeflection = 0.2;  // Max angle between facets (radians)
    bool relative = false;           // Deflection relative to edge size
};

/**
 * @brief Operation result with error handling
 */
template<typename T>
struct Result {
    bool success = false;
    T value;
    std::string errorCode;
    std::string errorMessage;

    // Non-fatal conditions (e.g. clamped wall thickness)
    std::vector<std::string> warnings;

    // Performance metrics for monitoring
    double durationMs = 0;
    bool wasCached = false;

    static Result<T> ok(T val) {
        Result<T> r;
        r.success = true;
        r.value = std::move(val);
        return r;
    }

    static Result<T> error(const std::string& code, const std::string& msg) {
        Result<T> r;
        r.success = false;
        r.errorCode = code;
        r.errorMessage = msg;
        return r;
    }

    /**
     * @brief Re-type a failed result, keeping its code, message and warnings
     */
    template<typename U>
    static Result<T> propagate(const Result<U>& failed) {
        Result<T> r = error(failed.errorCode, failed.errorMessage);
        r.warnings = failed.warnings;
        r.durationMs = failed.durationMs;
        return r;
    }

    explicit operator bool() const { return success; }
};

} // namespace keycap::core::cad
