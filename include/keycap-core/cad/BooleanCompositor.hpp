#pragma once

#include "Types.hpp"
#include "Solid.hpp"

namespace keycap::core::cad {

/**
 * @brief outer - cavity, then + stem when a stem is given
 *
 * Every intermediate result must be a single valid, closed solid with
 * positive volume; anything else is BOOLEAN_FAILURE.
 */
Result<SolidPtr> composite(const SolidPtr& outer,
                           const SolidPtr& cavity,
                           const SolidPtr& stem = nullptr);

} // namespace keycap::core::cad
