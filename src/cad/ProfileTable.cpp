#include "keycap-core/cad/ProfileTable.hpp"

namespace keycap::core::cad {

namespace {

struct RowHeights {
    ProfileFamily family;
    double r1, r2, r3, r4;   // r4 < 0: row not defined
    double sideInset;
    double frontInset;
    double backInset;
};

// Cap heights per row and the insets reached at the top surface
const RowHeights kFamilies[] = {
    {ProfileFamily::Cherry, 11.5,  9.5,   8.5,    9.5,  2.75, 3.4, 0.0},
    {ProfileFamily::OEM,    12.5,  11.0,  9.5,    10.5, 1.5,  3.0, 0.0},
    {ProfileFamily::SA,     14.89, 13.49, 12.925, -1.0, 1.25, 2.5, 0.0},
};

// (fraction of height, fraction of top inset) between base and top.
// Inset grows slower than height, giving a slightly convex wall.
struct MidSample {
    double heightFraction;
    double insetFraction;
};

const std::vector<MidSample> kCylindricalMidSamples = {{0.5, 0.42}};
const std::vector<MidSample> kSphericalMidSamples = {{0.45, 0.30}, {0.80, 0.68}};

ProfileDefinition makeDefinition(const RowHeights& family, double height) {
    const auto& mids = (family.family == ProfileFamily::SA)
        ? kSphericalMidSamples
        : kCylindricalMidSamples;

    std::vector<ProfileSample> samples;
    samples.push_back({0.0, 0.0, 0.0, 0.0});

    for (const auto& mid : mids) {
        samples.push_back({
            height * mid.heightFraction,
            family.sideInset * mid.insetFraction,
            family.frontInset * mid.insetFraction,
            family.backInset * mid.insetFraction
        });
    }

    samples.push_back({height, family.sideInset, family.frontInset, family.backInset});
    return ProfileDefinition(std::move(samples));
}

ProfileTable buildDefaults() {
    ProfileTable table;

    for (const auto& family : kFamilies) {
        const double heights[] = {family.r1, family.r2, family.r3, family.r4};
        const ProfileRow rows[] = {ProfileRow::R1, ProfileRow::R2, ProfileRow::R3, ProfileRow::R4};

        for (int i = 0; i < 4; ++i) {
            if (heights[i] > 0) {
                table.define(family.family, rows[i], makeDefinition(family, heights[i]));
            }
        }
    }

    return table;
}

} // anonymous namespace

const ProfileTable& ProfileTable::defaults() {
    static const ProfileTable table = buildDefaults();
    return table;
}

void ProfileTable::define(ProfileFamily family, ProfileRow row, ProfileDefinition definition) {
    entries_[{family, row}] = std::move(definition);
}

bool ProfileTable::contains(ProfileFamily family, ProfileRow row) const {
    return entries_.find({family, row}) != entries_.end();
}

Result<ProfileDefinition> ProfileTable::lookup(ProfileFamily family, ProfileRow row) const {
    auto it = entries_.find({family, row});
    if (it == entries_.end()) {
        return Result<ProfileDefinition>::error(errors::kConfiguration,
            "Profile " + toString(family) + " has no row " + toString(row));
    }
    return Result<ProfileDefinition>::ok(it->second);
}

} // namespace keycap::core::cad
