#pragma once

#include <vector>
#include "Types.hpp"
#include "ProfileTable.hpp"

namespace keycap::core::cad {

/**
 * @brief Monotone cubic Hermite interpolant (Fritsch-Carlson)
 *
 * C1, passes through every sample and never overshoots between them.
 * Outside the sample range it continues linearly with the end slope.
 */
class MonotoneCubic {
public:
    MonotoneCubic() = default;
    MonotoneCubic(std::vector<double> xs, std::vector<double> ys);

    double evaluate(double x) const;
    double derivative(double x) const;

    bool empty() const { return xs_.empty(); }

private:
    size_t segmentFor(double x) const;

    std::vector<double> xs_;
    std::vector<double> ys_;
    std::vector<double> slopes_;
};

/**
 * @brief Rate of change of each inset with height (mm per mm)
 */
struct InsetSlopes {
    double side = 0;
    double front = 0;
    double back = 0;
};

/**
 * @brief Options for sampling the curve into loft sections
 */
struct CurveOptions {
    int sections = 5;   // Minimum 2
};

/**
 * @brief Footprint plus height-dependent insets describing the outer shell
 *
 * Cap space: footprint centred on the origin, +Y toward the front,
 * base plane at z = 0.
 */
class CrossSectionCurve {
public:
    CrossSectionCurve() = default;
    CrossSectionCurve(double footprintWidth,
                      double footprintDepth,
                      const ProfileDefinition& profile,
                      int sectionCount = 5);

    double footprintWidth() const { return footprintWidth_; }
    double footprintDepth() const { return footprintDepth_; }
    double height() const { return height_; }
    int sectionCount() const { return sectionCount_; }

    double sideInsetAt(double z) const { return side_.evaluate(z); }
    double frontInsetAt(double z) const { return front_.evaluate(z); }
    double backInsetAt(double z) const { return back_.evaluate(z); }

    /**
     * @brief Horizontal section of the outer shell at height z
     */
    SectionRect sectionAt(double z) const;

    InsetSlopes slopesAt(double z) const;

    /**
     * @brief count sections evenly spaced from the base plane to the top
     */
    std::vector<SectionRect> sampleSections(int count) const;
    std::vector<SectionRect> sampleSections() const { return sampleSections(sectionCount_); }

private:
    double footprintWidth_ = 0;
    double footprintDepth_ = 0;
    double height_ = 0;
    int sectionCount_ = 5;

    MonotoneCubic side_;
    MonotoneCubic front_;
    MonotoneCubic back_;
};

/**
 * @brief Check that a profile can describe a closed cap of the given footprint
 *
 * INVALID_PROFILE for fewer than 2 samples, heights not strictly
 * increasing from 0, negative insets, or insets that collapse a section.
 */
Result<bool> validateProfile(const ProfileDefinition& profile,
                             double footprintWidth,
                             double footprintDepth);

/**
 * @brief Derive the cross-section curve for a profile at a key width
 *
 * CONFIGURATION_ERROR when widthUnits <= 0 or fewer than 2 sections are
 * requested.
 */
Result<CrossSectionCurve> buildCurve(const ProfileDefinition& profile,
                                     double widthUnits,
                                     const CurveOptions& options = {});

} // namespace keycap::core::cad
