#pragma once

#include <memory>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Solid.hpp"
#include "Parameters.hpp"

namespace keycap::core::cad {

/**
 * @brief One family of switch stems
 *
 * Implementations build their solid in the cavity's interior frame. The
 * stem rises from the base plane and is embedded into the ceiling so the
 * later union overlaps volumetrically instead of touching a face.
 */
class StemGeometry {
public:
    virtual ~StemGeometry() = default;

    virtual StemType type() const = 0;
    virtual std::string name() const = 0;

    /**
     * @brief Horizontal outline of the stem, counter-clockwise, in frame coordinates
     */
    virtual std::vector<Vector3> outline() const = 0;

    virtual Result<SolidPtr> build(const StemFrame& frame) const = 0;
};

/**
 * @brief Cherry MX cross: two perpendicular 4.15 x 1.29 mm blades
 */
class CherryMXCrossStem : public StemGeometry {
public:
    static constexpr double kBladeLength = 4.15;
    static constexpr double kBladeThickness = 1.29;

    StemType type() const override { return StemType::CherryMX; }
    std::string name() const override { return "Cherry MX cross"; }

    std::vector<Vector3> outline() const override;
    Result<SolidPtr> build(const StemFrame& frame) const override;
};

/**
 * @brief Factory; nullptr for StemType::None
 */
std::unique_ptr<StemGeometry> makeStemGeometry(StemType type);

/**
 * @brief Stem solid for the given type, or a null SolidPtr for None
 */
Result<SolidPtr> buildStem(StemType type, const StemFrame& frame);

} // namespace keycap::core::cad
