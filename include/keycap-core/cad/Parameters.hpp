#pragma once

#include <string>
#include "Types.hpp"

namespace keycap::core::cad {

class ProfileTable;

// ===========================================================================
// Physical Constants
// ===========================================================================

inline constexpr double kKeyPitch = 19.05;              // 1U key spacing (mm)
inline constexpr double kKeyGap = 0.9;                  // Gap between neighbouring caps (mm)
inline constexpr double kDefaultWallThickness = 0.91;   // mm
inline constexpr double kMaxWallThickness = 6.0;        // mm
inline constexpr double kMaxBevelRadius = 2.0;          // mm

// ===========================================================================
// Enumerations
// ===========================================================================

enum class KeyWidth {
    U1,
    U1_25,
    U1_5,
    U1_75,
    U2,
    U2_25,
    U2_75,
    U6,
    U6_25,
    U7
};

enum class ProfileFamily {
    Cherry,
    OEM,
    SA
};

enum class ProfileRow {
    R1,
    R2,
    R3,
    R4
};

enum class StemType {
    CherryMX,
    None
};

/**
 * @brief Width in key units (1U = 19.05 mm pitch)
 */
double widthUnits(KeyWidth width);

// ===========================================================================
// Keycap Parameters
// ===========================================================================

/**
 * @brief Full parameter set of one keycap
 *
 * Defaults describe a 1U Cherry-profile R3 cap with a 1.5 mm bevel and a
 * Cherry MX stem.
 */
struct KeycapParameters {
    KeyWidth width = KeyWidth::U1;
    ProfileFamily profileFamily = ProfileFamily::Cherry;
    ProfileRow profileRow = ProfileRow::R3;
    double bevelRadius = 1.5;                       // [0, 2] mm
    StemType stemType = StemType::CherryMX;
    double wallThickness = kDefaultWallThickness;   // (0, 6] mm

    double widthUnits() const { return cad::widthUnits(width); }

    // Physical footprint, inter-key gap removed
    double footprintWidth() const { return widthUnits() * kKeyPitch - kKeyGap; }
    double footprintDepth() const { return kKeyPitch - kKeyGap; }
};

/**
 * @brief Check ranges and that (family, row) is defined in the table
 *
 * Fails with CONFIGURATION_ERROR; never substitutes a default.
 */
Result<bool> validateParameters(const KeycapParameters& params, const ProfileTable& table);

// ===========================================================================
// String Parsing
// ===========================================================================

/**
 * @brief Parse "1", "1.25", "2.25U", ... into a KeyWidth
 */
Result<KeyWidth> parseKeyWidth(const std::string& text);

/**
 * @brief Parse "CHERRY" / "OEM" / "SA" (case-insensitive)
 */
Result<ProfileFamily> parseProfileFamily(const std::string& text);

/**
 * @brief Parse "R3" or "3" (case-insensitive)
 */
Result<ProfileRow> parseProfileRow(const std::string& text);

/**
 * @brief Parse "CHERRY_MX" / "CherryMX" / "None"
 */
Result<StemType> parseStemType(const std::string& text);

std::string toString(KeyWidth width);
std::string toString(ProfileFamily family);
std::string toString(ProfileRow row);
std::string toString(StemType stem);

} // namespace keycap::core::cad
