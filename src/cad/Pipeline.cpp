/**
 * Pipeline.cpp - Cached, re-evaluable keycap construction
 *
 * Library stages stay quiet; this is the boundary where failures and
 * warnings are logged and turned into diagnostics.
 */

#include "keycap-core/cad/Pipeline.hpp"
#include "keycap-core/cad/BooleanCompositor.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace keycap::core::cad {

namespace {

std::string formatKey(double value) {
    std::stringstream ss;
    ss << std::setprecision(17) << value;
    return ss.str();
}

bool sameParameters(const KeycapParameters& a, const KeycapParameters& b) {
    return a.width == b.width &&
           a.profileFamily == b.profileFamily &&
           a.profileRow == b.profileRow &&
           a.bevelRadius == b.bevelRadius &&
           a.stemType == b.stemType &&
           a.wallThickness == b.wallThickness;
}

} // anonymous namespace

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "unknown";
}

// =============================================================================
// Lifecycle
// =============================================================================

Pipeline::Pipeline(KeycapParameters params, PipelineOptions options, ProfileTable table)
    : params_(params), options_(std::move(options)), table_(std::move(table)) {}

Pipeline::~Pipeline() = default;

// =============================================================================
// Parameter Edits
// =============================================================================

Result<MeshPtr> Pipeline::setParameters(const KeycapParameters& params) {
    diagnostics_.clear();
    lastRunStages_.clear();

    auto valid = validateParameters(params, table_);
    if (!valid) {
        report({Severity::Error, valid.errorCode, "parameters", valid.errorMessage});
        return Result<MeshPtr>::propagate(valid);
    }

    if (!sameParameters(params_, params)) {
        // The previously baked mesh stays with whoever holds it
        baked_.reset();
        bakedWarnings_.clear();
    }
    params_ = params;

    return evaluate();
}

Result<MeshPtr> Pipeline::setWidth(KeyWidth width) {
    KeycapParameters params = params_;
    params.width = width;
    return setParameters(params);
}

Result<MeshPtr> Pipeline::setProfile(ProfileFamily family, ProfileRow row) {
    KeycapParameters params = params_;
    params.profileFamily = family;
    params.profileRow = row;
    return setParameters(params);
}

Result<MeshPtr> Pipeline::setBevelRadius(double radius) {
    KeycapParameters params = params_;
    params.bevelRadius = radius;
    return setParameters(params);
}

Result<MeshPtr> Pipeline::setStemType(StemType stem) {
    KeycapParameters params = params_;
    params.stemType = stem;
    return setParameters(params);
}

Result<MeshPtr> Pipeline::setWallThickness(double thickness) {
    KeycapParameters params = params_;
    params.wallThickness = thickness;
    return setParameters(params);
}

Result<bool> Pipeline::registerStem(StemType type, std::shared_ptr<const StemGeometry> geometry) {
    if (type == StemType::None) {
        return Result<bool>::error(errors::kConfiguration, "StemType::None has no geometry");
    }
    if (!geometry) {
        return Result<bool>::error(errors::kConfiguration, "Stem geometry is null");
    }

    stems_[type] = std::move(geometry);
    stemRevision_++;
    if (type == params_.stemType) {
        baked_.reset();
        bakedWarnings_.clear();
    }
    return Result<bool>::ok(true);
}

// =============================================================================
// Stage Runner
// =============================================================================

template<typename T, typename Compute>
Result<T> Pipeline::runStage(StageCache<T>& cache, const std::string& key, Compute&& compute) {
    if (cache.matches(key)) {
        stats_.cacheHits++;
        auto cached = Result<T>::ok(cache.value());
        cached.warnings = cache.warnings();
        cached.wasCached = true;
        return cached;
    }
    stats_.cacheMisses++;

    auto start = std::chrono::high_resolution_clock::now();
    Result<T> result = compute();
    auto end = std::chrono::high_resolution_clock::now();
    double durationMs = std::chrono::duration<double, std::milli>(end - start).count();

    stats_.stageRuns++;
    totalStageMs_ += durationMs;
    lastRunStages_.push_back(cache.name());
    notifySlowOperation(cache.name(), durationMs);

    result.durationMs = durationMs;

    if (!result) {
        stats_.failures++;
        report({Severity::Error, result.errorCode, cache.name(), result.errorMessage});
        return result;
    }

    cache.store(key, result.value, result.warnings);
    return result;
}

// =============================================================================
// Evaluation
// =============================================================================

Result<SolidPtr> Pipeline::evaluateSolids(std::vector<std::string>& warnings, StemFrame& frame) {
    // Profile
    std::stringstream profileKey;
    profileKey << "profile:" << toString(params_.profileFamily) << ":" << toString(params_.profileRow);

    auto profile = runStage(profileCache_, profileKey.str(), [&]() {
        return table_.lookup(params_.profileFamily, params_.profileRow);
    });
    if (!profile) return Result<SolidPtr>::propagate(profile);

    // Curve
    const std::string curveKey = profileKey.str() +
        ":w=" + formatKey(params_.widthUnits()) +
        ":n=" + std::to_string(options_.curve.sections);

    auto curve = runStage(curveCache_, curveKey, [&]() {
        return buildCurve(profile.value, params_.widthUnits(), options_.curve);
    });
    if (!curve) return Result<SolidPtr>::propagate(curve);

    // Outer shell
    const std::string outerKey = "outer:" + curveKey;

    auto outer = runStage(outerCache_, outerKey, [&]() {
        return loft(curve.value);
    });
    if (!outer) return Result<SolidPtr>::propagate(outer);

    // Hollow
    const std::string hollowKey = outerKey + ":t=" + formatKey(params_.wallThickness);

    auto hollowed = runStage(hollowCache_, hollowKey, [&]() {
        return hollow(outer.value, params_.wallThickness, options_.hollow);
    });
    if (!hollowed) return Result<SolidPtr>::propagate(hollowed);

    const HollowShell& shell = hollowed.value;
    frame = shell.frame;

    // A clamped wall is reported on every evaluation it is part of
    for (const auto& warning : hollowed.warnings) {
        report({Severity::Warning, errors::kDegenerateGeometry, hollowCache_.name(), warning});
    }
    warnings.insert(warnings.end(), hollowed.warnings.begin(), hollowed.warnings.end());

    // Bevels, always from the unbeveled solids held in the hollow cache
    const double radius = params_.bevelRadius;
    const std::string bevelOuterKey = outerKey + ":r=" + formatKey(radius);

    auto bevelOuter = runStage(bevelOuterCache_, bevelOuterKey, [&]() {
        return applyBevel(shell.outer, radius, options_.bevel);
    });
    if (!bevelOuter) return bevelOuter;

    // Concentric rounding keeps the wall thickness through the bevel
    const std::string bevelCavityKey = hollowKey + ":r=" + formatKey(radius);
    const double cavityRadius = radius - shell.wallThickness;

    auto bevelCavity = runStage(bevelCavityCache_, bevelCavityKey, [&]() {
        if (cavityRadius <= 0.0) {
            return Result<SolidPtr>::ok(SolidPtr(shell.cavity));
        }
        return applyBevel(shell.cavity, cavityRadius, options_.bevel);
    });
    if (!bevelCavity) return bevelCavity;

    // Stem
    const std::string stemKey = hollowKey + ":stem=" + toString(params_.stemType) +
        "#" + std::to_string(stemRevision_);

    auto stem = runStage(stemCache_, stemKey, [&]() {
        auto custom = stems_.find(params_.stemType);
        if (custom != stems_.end()) {
            return custom->second->build(shell.frame);
        }
        return buildStem(params_.stemType, shell.frame);
    });
    if (!stem) return stem;

    // Composite
    const std::string compositeKey = bevelOuterKey + "|" + bevelCavityKey + "|" + stemKey;

    return runStage(compositeCache_, compositeKey, [&]() {
        return composite(bevelOuter.value, bevelCavity.value, stem.value);
    });
}

Result<MeshPtr> Pipeline::evaluate() {
    auto start = std::chrono::high_resolution_clock::now();

    diagnostics_.clear();
    lastRunStages_.clear();
    stats_.evaluations++;

    try {
        auto valid = validateParameters(params_, table_);
        if (!valid) {
            report({Severity::Error, valid.errorCode, "parameters", valid.errorMessage});
            return Result<MeshPtr>::propagate(valid);
        }

        std::vector<std::string> warnings;
        StemFrame frame;
        auto solid = evaluateSolids(warnings, frame);
        if (!solid) {
            return Result<MeshPtr>::propagate(solid);
        }

        std::stringstream previewKey;
        previewKey << compositeCache_.key() << "|preview:"
                   << formatKey(options_.preview.linearDeflection) << ":"
                   << formatKey(options_.preview.angularDeflection);

        auto mesh = runStage(previewCache_, previewKey.str(), [&]() {
            auto tessellated = solid.value->tessellate(options_.preview);
            if (!tessellated) {
                return Result<MeshPtr>::propagate(tessellated);
            }
            return Result<MeshPtr>::ok(std::make_shared<const Mesh>(std::move(tessellated.value)));
        });
        if (!mesh) {
            return Result<MeshPtr>::propagate(mesh);
        }

        preview_ = mesh.value;
        frame_ = frame;
        for (const auto& cb : previewCallbacks_) {
            cb(preview_);
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto result = Result<MeshPtr>::ok(preview_);
        result.warnings = std::move(warnings);
        result.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
        result.wasCached = lastRunStages_.empty();
        return result;

    } catch (const std::exception& e) {
        report({Severity::Error, errors::kException, "pipeline", e.what()});
        return Result<MeshPtr>::error(errors::kException, e.what());
    }
}

Result<MeshPtr> Pipeline::bake() {
    if (baked_) {
        auto result = Result<MeshPtr>::ok(baked_);
        result.warnings = bakedWarnings_;
        result.wasCached = true;
        return result;
    }

    auto start = std::chrono::high_resolution_clock::now();

    diagnostics_.clear();
    lastRunStages_.clear();

    try {
        auto valid = validateParameters(params_, table_);
        if (!valid) {
            report({Severity::Error, valid.errorCode, "parameters", valid.errorMessage});
            return Result<MeshPtr>::propagate(valid);
        }

        std::vector<std::string> warnings;
        StemFrame frame;
        auto solid = evaluateSolids(warnings, frame);
        if (!solid) {
            return Result<MeshPtr>::propagate(solid);
        }

        auto tessStart = std::chrono::high_resolution_clock::now();
        auto mesh = solid.value->tessellate(options_.bake);
        auto tessEnd = std::chrono::high_resolution_clock::now();
        double tessMs = std::chrono::duration<double, std::milli>(tessEnd - tessStart).count();

        stats_.stageRuns++;
        totalStageMs_ += tessMs;
        lastRunStages_.push_back("bake");
        notifySlowOperation("bake", tessMs);

        if (!mesh) {
            stats_.failures++;
            report({Severity::Error, mesh.errorCode, "bake", mesh.errorMessage});
            return Result<MeshPtr>::propagate(mesh);
        }

        baked_ = std::make_shared<const Mesh>(std::move(mesh.value));
        bakedWarnings_ = warnings;
        frame_ = frame;
        releaseCaches();

        std::stringstream summary;
        summary << "Baked " << toString(params_.width) << " " << toString(params_.profileFamily)
                << " " << toString(params_.profileRow) << " keycap: "
                << baked_->getVertexCount() << " vertices, "
                << baked_->getTriangleCount() << " triangles, "
                << baked_->getVolume() << " mm³";
        report({Severity::Info, "", "bake", summary.str()});

        auto end = std::chrono::high_resolution_clock::now();
        auto result = Result<MeshPtr>::ok(baked_);
        result.warnings = std::move(warnings);
        result.durationMs = std::chrono::duration<double, std::milli>(end - start).count();
        return result;

    } catch (const std::exception& e) {
        report({Severity::Error, errors::kException, "bake", e.what()});
        return Result<MeshPtr>::error(errors::kException, e.what());
    }
}

SolidPtr Pipeline::compositeSolid() const {
    return compositeCache_.hasValue() ? compositeCache_.value() : nullptr;
}

size_t Pipeline::cachedStageCount() const {
    size_t count = 0;
    if (profileCache_.hasValue()) ++count;
    if (curveCache_.hasValue()) ++count;
    if (outerCache_.hasValue()) ++count;
    if (hollowCache_.hasValue()) ++count;
    if (bevelOuterCache_.hasValue()) ++count;
    if (bevelCavityCache_.hasValue()) ++count;
    if (stemCache_.hasValue()) ++count;
    if (compositeCache_.hasValue()) ++count;
    if (previewCache_.hasValue()) ++count;
    return count;
}

void Pipeline::releaseCaches() {
    profileCache_.release();
    curveCache_.release();
    outerCache_.release();
    hollowCache_.release();
    bevelOuterCache_.release();
    bevelCavityCache_.release();
    stemCache_.release();
    compositeCache_.release();
    previewCache_.release();
}

// =============================================================================
// Observers & Stats
// =============================================================================

void Pipeline::onPreview(PreviewCallback callback) {
    previewCallbacks_.push_back(std::move(callback));
}

void Pipeline::onDiagnostic(DiagnosticCallback callback) {
    diagnosticCallbacks_.push_back(std::move(callback));
}

void Pipeline::onSlowOperation(SlowOperationCallback callback, double thresholdMs) {
    slowOpCallbacks_.emplace_back(std::move(callback), thresholdMs);
}

PipelineStats Pipeline::getStats() const {
    PipelineStats stats = stats_;
    stats.averageStageMs = stats_.stageRuns > 0 ? totalStageMs_ / stats_.stageRuns : 0.0;
    return stats;
}

void Pipeline::resetStats() {
    stats_ = PipelineStats();
    totalStageMs_ = 0;
}

void Pipeline::report(const Diagnostic& diagnostic) {
    diagnostics_.push_back(diagnostic);

    if (options_.logToConsole) {
        switch (diagnostic.severity) {
            case Severity::Error:
                std::cerr << "Error [" << diagnostic.stage << "] " << diagnostic.code
                          << ": " << diagnostic.message << std::endl;
                break;
            case Severity::Warning:
                std::cerr << "Warning [" << diagnostic.stage << "] " << diagnostic.code
                          << ": " << diagnostic.message << std::endl;
                break;
            case Severity::Info:
                std::cout << diagnostic.message << std::endl;
                break;
        }
    }

    for (const auto& cb : diagnosticCallbacks_) {
        cb(diagnostic);
    }
}

void Pipeline::notifySlowOperation(const std::string& stage, double durationMs) {
    for (const auto& [callback, threshold] : slowOpCallbacks_) {
        if (durationMs >= threshold) {
            callback(stage, durationMs);
        }
    }
}

} // namespace keycap::core::cad
