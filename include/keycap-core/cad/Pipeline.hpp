#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "Types.hpp"
#include "Parameters.hpp"
#include "ProfileTable.hpp"
#include "CurveBuilder.hpp"
#include "ShellLofter.hpp"
#include "BevelEngine.hpp"
#include "StemGenerator.hpp"
#include "StageCache.hpp"
#include "../Mesh.hpp"

namespace keycap::core::cad {

// ===========================================================================
// Diagnostics
// ===========================================================================

enum class Severity {
    Info,
    Warning,
    Error
};

std::string toString(Severity severity);

/**
 * @brief Report from one stage of an evaluation
 */
struct Diagnostic {
    Severity severity = Severity::Info;
    std::string code;      // errors::k* constant
    std::string stage;     // Stage that produced it ("hollow", "composite", ...)
    std::string message;
};

// ===========================================================================
// Options & Stats
// ===========================================================================

struct PipelineOptions {
    CurveOptions curve;
    HollowOptions hollow;
    BevelOptions bevel;
    TessellateOptions preview{0.05, 0.35, false};   // Viewport mesh
    TessellateOptions bake{0.02, 0.2, false};       // Exported mesh
    bool logToConsole = true;
};

struct PipelineStats {
    size_t evaluations = 0;
    size_t stageRuns = 0;
    size_t cacheHits = 0;
    size_t cacheMisses = 0;
    size_t failures = 0;
    double averageStageMs = 0;
};

using MeshPtr = std::shared_ptr<const Mesh>;

/**
 * @brief Re-evaluable keycap construction ("modifier stack")
 *
 * Stages, each cached by the key of its inputs:
 *   profile -> curve -> outer -> hollow -> bevel_outer, bevel_cavity
 *   -> stem -> composite -> preview
 *
 * Setters validate first and then re-evaluate; only stages whose key
 * changed run again. A failing stage keeps its previous cache entry, stops
 * the evaluation and leaves the last good preview in place. Nothing throws:
 * failures come back as Result plus Diagnostic.
 *
 * bake() collapses the stack into one immutable mesh and releases the
 * stage caches. Baking again without edits returns the same mesh object;
 * an edit after bake starts a fresh evaluation.
 */
class Pipeline {
public:
    explicit Pipeline(KeycapParameters params = {},
                      PipelineOptions options = {},
                      ProfileTable table = ProfileTable::defaults());
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    const KeycapParameters& parameters() const { return params_; }
    const PipelineOptions& options() const { return options_; }
    const ProfileTable& profileTable() const { return table_; }

    // ===========================================================================
    // Parameter Edits
    // ===========================================================================

    Result<MeshPtr> setParameters(const KeycapParameters& params);
    Result<MeshPtr> setWidth(KeyWidth width);
    Result<MeshPtr> setProfile(ProfileFamily family, ProfileRow row);
    Result<MeshPtr> setBevelRadius(double radius);
    Result<MeshPtr> setStemType(StemType stem);
    Result<MeshPtr> setWallThickness(double thickness);

    /**
     * @brief Use a custom stem geometry for the given stem type
     *
     * Replaces the built-in geometry on the next evaluation; the stem stage
     * and everything after it re-run. StemType::None cannot carry a geometry.
     */
    Result<bool> registerStem(StemType type, std::shared_ptr<const StemGeometry> geometry);

    // ===========================================================================
    // Evaluation
    // ===========================================================================

    /**
     * @brief Run every stage whose inputs changed and refresh the preview
     */
    Result<MeshPtr> evaluate();

    /**
     * @brief Tessellate the final solid into the exportable mesh
     */
    Result<MeshPtr> bake();

    MeshPtr preview() const { return preview_; }
    MeshPtr bakedMesh() const { return baked_; }
    bool isBaked() const { return baked_ != nullptr; }

    /**
     * @brief Latest composite solid (null before evaluation and after bake)
     */
    SolidPtr compositeSolid() const;

    // Wall thickness and interior frame behind the current preview
    double effectiveWallThickness() const { return frame_.wallThickness; }
    const StemFrame& stemFrame() const { return frame_; }

    // Diagnostics and stages run by the last evaluate() / bake()
    const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }
    const std::vector<std::string>& lastRunStages() const { return lastRunStages_; }

    size_t cachedStageCount() const;

    // ===========================================================================
    // Observers
    // ===========================================================================

    using PreviewCallback = std::function<void(const MeshPtr& preview)>;
    using DiagnosticCallback = std::function<void(const Diagnostic& diagnostic)>;
    using SlowOperationCallback = std::function<void(const std::string& stage, double durationMs)>;

    void onPreview(PreviewCallback callback);
    void onDiagnostic(DiagnosticCallback callback);
    void onSlowOperation(SlowOperationCallback callback, double thresholdMs = 100);

    PipelineStats getStats() const;
    void resetStats();

private:
    Result<SolidPtr> evaluateSolids(std::vector<std::string>& warnings, StemFrame& frame);
    void releaseCaches();

    template<typename T, typename Compute>
    Result<T> runStage(StageCache<T>& cache, const std::string& key, Compute&& compute);

    void report(const Diagnostic& diagnostic);
    void notifySlowOperation(const std::string& stage, double durationMs);

    KeycapParameters params_;
    PipelineOptions options_;
    ProfileTable table_;

    // Stage caches
    StageCache<ProfileDefinition> profileCache_{"profile"};
    StageCache<CrossSectionCurve> curveCache_{"curve"};
    StageCache<LoftedShell> outerCache_{"outer"};
    StageCache<HollowShell> hollowCache_{"hollow"};
    StageCache<SolidPtr> bevelOuterCache_{"bevel_outer"};
    StageCache<SolidPtr> bevelCavityCache_{"bevel_cavity"};
    StageCache<SolidPtr> stemCache_{"stem"};
    StageCache<SolidPtr> compositeCache_{"composite"};
    StageCache<MeshPtr> previewCache_{"preview"};

    MeshPtr preview_;
    MeshPtr baked_;
    std::vector<std::string> bakedWarnings_;
    StemFrame frame_;

    // Custom stem geometries; the revision is part of the stem cache key
    std::map<StemType, std::shared_ptr<const StemGeometry>> stems_;
    size_t stemRevision_ = 0;

    std::vector<Diagnostic> diagnostics_;
    std::vector<std::string> lastRunStages_;

    // Stats
    PipelineStats stats_;
    double totalStageMs_ = 0;

    // Callbacks
    std::vector<PreviewCallback> previewCallbacks_;
    std::vector<DiagnosticCallback> diagnosticCallbacks_;
    std::vector<std::pair<SlowOperationCallback, double>> slowOpCallbacks_;
};

} // namespace keycap::core::cad
