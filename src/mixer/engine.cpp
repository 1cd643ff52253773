/**
 * Segue Engine - Main Engine Implementation
 */

#include "engine.h"
#include "../core/utils.h"

namespace segue {

Engine::Engine(const TransitionConfig& config)
    : config_(config)
    , analyzer_(std::make_unique<Analyzer>(config.moments, &logger_))
    , search_(config.weights)
    , selector_(config.thresholds)
    , renderer_(config.render)
    , tempo_matcher_(&logger_) {}

Engine::~Engine() = default;

void Engine::set_config(const TransitionConfig& config) {
    config_ = config;
    analyzer_ = std::make_unique<Analyzer>(config.moments, &logger_);
    search_ = TransitionPointSearch(config.weights);
    selector_ = StyleSelector(config.thresholds);
    renderer_ = TransitionRenderer(config.render);
}

void Engine::set_log_callback(LogCallback callback) {
    logger_.set_callback(std::move(callback));
}

/* ============================================================================
 * Analysis
 * ============================================================================ */

Result<TrackAnalysis> Engine::analyze(AnalysisProvider& provider, const std::string& track_id) const {
    auto result = analyzer_->analyze(provider, track_id);
    if (result.failed()) {
        logger_.log(LogLevel::Error, "Engine", "Analysis failed: %s", result.error().c_str());
    }
    return result;
}

Result<TrackAnalysis> Engine::analyze(const TrackPrimitives& primitives) const {
    auto result = analyzer_->build(primitives);
    if (result.failed()) {
        logger_.log(LogLevel::Error, "Engine", "Analysis failed: %s", result.error().c_str());
    }
    return result;
}

/* ============================================================================
 * Planning
 * ============================================================================ */

Result<TransitionPlan> Engine::plan(const TrackAnalysis& a, const TrackAnalysis& b) const {
    auto compat = evaluate_compatibility(a, b, config_.tempo);
    if (compat.failed()) {
        return compat.failure();
    }
    const auto& c = compat.value();

    if (!c.tempo_compatible) {
        if (config_.reject_incompatible) {
            return ResultError{ErrorCode::IncompatiblePair,
                utils::format("Effective BPM delta %.2f exceeds %.2f",
                              c.delta_eff_bpm, config_.tempo.max_bpm_delta)};
        }
        logger_.log(LogLevel::Warning, "Engine", "Tempo delta %.2f BPM beyond the hard limit",
                    c.delta_eff_bpm);
    }

    auto found = search_.search(a, b, c.stretch_pct, config_.strategy);
    if (found.failed()) {
        return found.failure();
    }
    const auto& best = found.value();

    auto aligned = aligner_.align(a, best.exit.time, b, best.entry.time, c.bpm_b_normalized);

    StyleInputs inputs;
    inputs.delta_eff_bpm = c.delta_eff_bpm;
    inputs.stretch_pct = c.stretch_pct;
    inputs.key_score = c.key_score;
    inputs.entry_label = best.entry.label;
    inputs.energy_jump = best.energy_jump;
    auto style = selector_.select(inputs);

    TransitionPlan plan;
    plan.exit_time = aligned.exit_time;
    plan.entry_time = aligned.entry_time;
    plan.type = style.type;
    plan.duration_beats = style.duration_beats;
    plan.bpm_ref = a.bpm;
    plan.phase_offset = aligned.phase_offset;
    plan.entry_phase = aligned.entry_phase;
    plan.exit_label = best.exit.label;
    plan.entry_label = best.entry.label;
    plan.energy_jump = best.energy_jump;
    plan.pair_score = best.score;
    plan.rule = style.rule;
    plan.compatibility = c;

    logger_.log(LogLevel::Info, "Engine",
                "Plan: exit %.2fs (%s) -> entry %.2fs (%s), %s %d beats [%s], key %.2f, stretch %.3f. %s",
                plan.exit_time, segment_label_name(plan.exit_label),
                plan.entry_time, segment_label_name(plan.entry_label),
                transition_type_name(plan.type), plan.duration_beats, style.rule,
                c.key_score, c.stretch_pct, CamelotCompatibility::advice(c.key_score));

    return plan;
}

std::vector<Result<TransitionPlan>> Engine::plan_batch(const std::vector<TrackAnalysis>& tracks,
                                                       const std::vector<TrackPair>& pairs) const {
    std::vector<Result<TransitionPlan>> results;
    results.reserve(pairs.size());

    for (const auto& pair : pairs) {
        if (pair.first >= tracks.size() || pair.second >= tracks.size()) {
            results.push_back(ResultError{ErrorCode::InvalidArgument,
                utils::format("Pair (%zu, %zu) out of range for %zu tracks",
                              pair.first, pair.second, tracks.size())});
            continue;
        }

        auto result = plan(tracks[pair.first], tracks[pair.second]);
        if (result.failed()) {
            logger_.log(LogLevel::Warning, "Engine", "Pair (%zu, %zu) failed: %s",
                        pair.first, pair.second, result.error().c_str());
        }
        results.push_back(std::move(result));
    }

    return results;
}

/* ============================================================================
 * Rendering
 * ============================================================================ */

Result<AudioBuffer> Engine::render(const TransitionPlan& plan,
                                   const AudioBuffer& a,
                                   const AudioBuffer& b) const {
    Result<AudioBuffer> result = ResultError{ErrorCode::RenderError, "Not rendered"};

    double ratio = TempoMatcher::time_ratio(plan.compatibility.bpm_b_normalized, plan.bpm_ref);
    bool stretch = config_.render.time_stretch &&
                   plan.compatibility.stretch_safe &&
                   !TempoMatcher::is_identity(ratio);

    if (stretch) {
        auto stretched = tempo_matcher_.stretch(b, ratio);
        if (stretched.failed()) {
            return ResultError{ErrorCode::RenderError, "Time-stretch failed: " + stretched.error()};
        }

        // B now runs at A's tempo: rescale the entry and its position in the bar
        TransitionPlan matched = plan;
        matched.entry_time = static_cast<float>(plan.entry_time * ratio);
        matched.entry_phase = static_cast<float>(plan.entry_phase * ratio);
        matched.phase_offset = BeatPhaseAligner::rescale_offset(plan.phase_offset, plan.entry_phase, ratio);
        result = renderer_.render(matched, a, stretched.value());
    } else {
        result = renderer_.render(plan, a, b);
    }

    if (result.failed()) {
        logger_.log(LogLevel::Error, "Engine", "Render failed: %s", result.error().c_str());
    }
    return result;
}

} // namespace segue
