#include "keycap-core/cad/BooleanCompositor.hpp"
#include "Kernel.hpp"

#include <chrono>

namespace keycap::core::cad {

Result<SolidPtr> composite(const SolidPtr& outer,
                           const SolidPtr& cavity,
                           const SolidPtr& stem) {
    auto start = std::chrono::high_resolution_clock::now();

    if (!outer || !cavity) {
        return Result<SolidPtr>::error(errors::kBooleanFailure,
            "Composite requires an outer solid and a cavity");
    }

    auto shell = kernel::booleanSubtract(outer, cavity);
    if (!shell) {
        return shell;
    }

    Result<SolidPtr> result = shell;
    if (stem) {
        result = kernel::booleanUnion(shell.value, stem);
        if (!result) {
            return result;
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}

} // namespace keycap::core::cad
