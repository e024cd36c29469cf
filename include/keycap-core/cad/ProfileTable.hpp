#pragma once

#include <map>
#include <utility>
#include <vector>
#include "Types.hpp"
#include "Parameters.hpp"

namespace keycap::core::cad {

/**
 * @brief One control sample of a profile
 *
 * Insets are measured inward from the footprint edge at the given height.
 */
struct ProfileSample {
    double height = 0;       // mm above the base plane
    double sideInset = 0;    // Pulled in on each of left and right
    double frontInset = 0;   // Pulled in at the front (+Y, typing side)
    double backInset = 0;    // Pulled in at the back (-Y)
};

/**
 * @brief Immutable list of profile samples, ordered by height
 */
class ProfileDefinition {
public:
    ProfileDefinition() = default;
    explicit ProfileDefinition(std::vector<ProfileSample> samples)
        : samples_(std::move(samples)) {}

    const std::vector<ProfileSample>& samples() const { return samples_; }
    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    // Height of the last sample (cap height)
    double topHeight() const { return samples_.empty() ? 0.0 : samples_.back().height; }

private:
    std::vector<ProfileSample> samples_;
};

/**
 * @brief Lookup of (family, row) -> ProfileDefinition
 *
 * The built-in table is returned by defaults(); callers may start from an
 * empty table or a copy of the defaults and define() their own entries.
 * SA row 4 is intentionally absent from the defaults.
 */
class ProfileTable {
public:
    ProfileTable() = default;

    static const ProfileTable& defaults();

    void define(ProfileFamily family, ProfileRow row, ProfileDefinition definition);
    bool contains(ProfileFamily family, ProfileRow row) const;

    /**
     * @brief CONFIGURATION_ERROR if the pair is not defined
     */
    Result<ProfileDefinition> lookup(ProfileFamily family, ProfileRow row) const;

    size_t size() const { return entries_.size(); }

private:
    std::map<std::pair<ProfileFamily, ProfileRow>, ProfileDefinition> entries_;
};

} // namespace keycap::core::cad
