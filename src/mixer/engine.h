/**
 * Segue Engine - Main Engine Class
 */

#ifndef SEGUE_ENGINE_H
#define SEGUE_ENGINE_H

#include "segue/types.h"
#include "renderer.h"
#include "tempo_matcher.h"
#include "../core/log.h"
#include "../analyzer/analyzer.h"
#include "../matcher/compatibility.h"
#include "../matcher/beat_phase.h"
#include "../matcher/transition_points.h"
#include "../matcher/style_selector.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace segue {

/**
 * Index pair (from, to) into a track list.
 */
using TrackPair = std::pair<size_t, size_t>;

/**
 * Main Segue Engine class.
 * Coordinates analysis, transition planning and rendering for track pairs.
 */
class Engine {
public:
    explicit Engine(const TransitionConfig& config = TransitionConfig());
    ~Engine();

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /* ========================================================================
     * Configuration
     * ======================================================================== */

    void set_config(const TransitionConfig& config);
    const TransitionConfig& config() const { return config_; }

    /**
     * Route diagnostic lines to a callback instead of stderr.
     */
    void set_log_callback(LogCallback callback);

    /* ========================================================================
     * Analysis
     * ======================================================================== */

    Result<TrackAnalysis> analyze(AnalysisProvider& provider, const std::string& track_id) const;
    Result<TrackAnalysis> analyze(const TrackPrimitives& primitives) const;

    /* ========================================================================
     * Planning
     * ======================================================================== */

    /**
     * Plan the transition from A to B:
     * compatibility, point search, beat alignment, style selection.
     *
     * @return IncompatiblePair only when reject_incompatible is set;
     *         InvalidKeyCode / InvalidArgument from the stages
     */
    Result<TransitionPlan> plan(const TrackAnalysis& a, const TrackAnalysis& b) const;

    /**
     * Plan independent pairs. Each pair gets its own Result; a failing pair
     * never stops the others.
     */
    std::vector<Result<TransitionPlan>> plan_batch(const std::vector<TrackAnalysis>& tracks,
                                                   const std::vector<TrackPair>& pairs) const;

    /* ========================================================================
     * Rendering
     * ======================================================================== */

    /**
     * Render a plan. With time_stretch enabled and a safe stretch, B is
     * first matched to A's tempo and the entry rescaled.
     */
    Result<AudioBuffer> render(const TransitionPlan& plan,
                               const AudioBuffer& a,
                               const AudioBuffer& b) const;

private:
    TransitionConfig config_;
    Logger logger_;

    std::unique_ptr<Analyzer> analyzer_;
    TransitionPointSearch search_;
    BeatPhaseAligner aligner_;
    StyleSelector selector_;
    TransitionRenderer renderer_;
    TempoMatcher tempo_matcher_;
};

} // namespace segue

#endif // SEGUE_ENGINE_H
