#include "keycap-core/cad/Parameters.hpp"
#include "keycap-core/cad/ProfileTable.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace keycap::core::cad {

namespace {

struct WidthEntry {
    KeyWidth width;
    double units;
    const char* label;
};

const WidthEntry kWidths[] = {
    {KeyWidth::U1,    1.0,  "1U"},
    {KeyWidth::U1_25, 1.25, "1.25U"},
    {KeyWidth::U1_5,  1.5,  "1.5U"},
    {KeyWidth::U1_75, 1.75, "1.75U"},
    {KeyWidth::U2,    2.0,  "2U"},
    {KeyWidth::U2_25, 2.25, "2.25U"},
    {KeyWidth::U2_75, 2.75, "2.75U"},
    {KeyWidth::U6,    6.0,  "6U"},
    {KeyWidth::U6_25, 6.25, "6.25U"},
    {KeyWidth::U7,    7.0,  "7U"},
};

const WidthEntry* findWidth(KeyWidth width) {
    for (const auto& entry : kWidths) {
        if (entry.width == width) return &entry;
    }
    return nullptr;
}

// Upper-case and strip separators: "cherry_mx" -> "CHERRYMX"
std::string normalizeToken(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '_' || c == '-' || c == ' ' || c == '\t') continue;
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string formatMM(double value) {
    std::stringstream ss;
    ss << value << " mm";
    return ss.str();
}

} // anonymous namespace

double widthUnits(KeyWidth width) {
    const WidthEntry* entry = findWidth(width);
    return entry ? entry->units : 0.0;
}

// ===========================================================================
// Validation
// ===========================================================================

Result<bool> validateParameters(const KeycapParameters& params, const ProfileTable& table) {
    if (!findWidth(params.width)) {
        return Result<bool>::error(errors::kConfiguration, "Unknown key width");
    }

    if (!std::isfinite(params.bevelRadius) ||
        params.bevelRadius < 0.0 || params.bevelRadius > kMaxBevelRadius) {
        return Result<bool>::error(errors::kConfiguration,
            "Bevel radius must be within [0, 2] mm, got " + formatMM(params.bevelRadius));
    }

    if (!std::isfinite(params.wallThickness) ||
        params.wallThickness <= 0.0 || params.wallThickness > kMaxWallThickness) {
        return Result<bool>::error(errors::kConfiguration,
            "Wall thickness must be within (0, 6] mm, got " + formatMM(params.wallThickness));
    }

    if (params.stemType != StemType::CherryMX && params.stemType != StemType::None) {
        return Result<bool>::error(errors::kConfiguration, "Unknown stem type");
    }

    if (!table.contains(params.profileFamily, params.profileRow)) {
        return Result<bool>::error(errors::kConfiguration,
            "Profile " + toString(params.profileFamily) +
            " has no row " + toString(params.profileRow));
    }

    return Result<bool>::ok(true);
}

// ===========================================================================
// String Parsing
// ===========================================================================

Result<KeyWidth> parseKeyWidth(const std::string& text) {
    std::string token = normalizeToken(text);
    if (!token.empty() && token.back() == 'U') {
        token.pop_back();
    }

    if (!token.empty()) {
        char* end = nullptr;
        double units = std::strtod(token.c_str(), &end);
        if (end == token.c_str() + token.size()) {
            for (const auto& entry : kWidths) {
                if (std::abs(entry.units - units) < 1e-9) {
                    return Result<KeyWidth>::ok(entry.width);
                }
            }
        }
    }

    return Result<KeyWidth>::error(errors::kConfiguration, "Unknown key width: '" + text + "'");
}

Result<ProfileFamily> parseProfileFamily(const std::string& text) {
    const std::string token = normalizeToken(text);

    if (token == "CHERRY") return Result<ProfileFamily>::ok(ProfileFamily::Cherry);
    if (token == "OEM") return Result<ProfileFamily>::ok(ProfileFamily::OEM);
    if (token == "SA") return Result<ProfileFamily>::ok(ProfileFamily::SA);

    return Result<ProfileFamily>::error(errors::kConfiguration,
        "Unknown profile family: '" + text + "'");
}

Result<ProfileRow> parseProfileRow(const std::string& text) {
    std::string token = normalizeToken(text);
    if (!token.empty() && token.front() == 'R') {
        token.erase(token.begin());
    }

    if (token == "1") return Result<ProfileRow>::ok(ProfileRow::R1);
    if (token == "2") return Result<ProfileRow>::ok(ProfileRow::R2);
    if (token == "3") return Result<ProfileRow>::ok(ProfileRow::R3);
    if (token == "4") return Result<ProfileRow>::ok(ProfileRow::R4);

    return Result<ProfileRow>::error(errors::kConfiguration,
        "Unknown profile row: '" + text + "'");
}

Result<StemType> parseStemType(const std::string& text) {
    const std::string token = normalizeToken(text);

    if (token == "CHERRYMX") return Result<StemType>::ok(StemType::CherryMX);
    if (token == "NONE") return Result<StemType>::ok(StemType::None);

    return Result<StemType>::error(errors::kConfiguration, "Unknown stem type: '" + text + "'");
}

std::string toString(KeyWidth width) {
    const WidthEntry* entry = findWidth(width);
    return entry ? entry->label : "?U";
}

std::string toString(ProfileFamily family) {
    switch (family) {
        case ProfileFamily::Cherry: return "Cherry";
        case ProfileFamily::OEM: return "OEM";
        case ProfileFamily::SA: return "SA";
    }
    return "Unknown";
}

std::string toString(ProfileRow row) {
    switch (row) {
        case ProfileRow::R1: return "R1";
        case ProfileRow::R2: return "R2";
        case ProfileRow::R3: return "R3";
        case ProfileRow::R4: return "R4";
    }
    return "R?";
}

std::string toString(StemType stem) {
    switch (stem) {
        case StemType::CherryMX: return "CherryMX";
        case StemType::None: return "None";
    }
    return "Unknown";
}

} // namespace keycap::core::cad
