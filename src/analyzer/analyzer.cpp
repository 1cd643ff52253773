/**
 * Segue Engine - Track Analyzer Implementation
 */

#include "analyzer.h"
#include "energy_curve.h"
#include "../core/utils.h"
#include <cmath>
#include <algorithm>

namespace segue {

Analyzer::Analyzer(const MomentConfig& config, const Logger* logger)
    : moment_extractor_(config)
    , logger_(logger) {}

void Analyzer::warn(const char* fmt, const std::string& detail) const {
    if (logger_) {
        logger_->log(LogLevel::Warning, "Analyzer", fmt, detail.c_str());
    }
}

Result<TrackAnalysis> Analyzer::analyze(AnalysisProvider& provider, const std::string& track_id) const {
    TrackPrimitives primitives;

    auto bpm = provider.tempo(track_id);
    if (bpm.failed()) return bpm.failure();
    primitives.bpm = bpm.value();

    auto chroma = provider.chroma(track_id);
    if (chroma.failed()) return chroma.failure();
    primitives.chroma = std::move(chroma.value());

    auto segments = provider.segments(track_id);
    if (segments.failed()) return segments.failure();
    primitives.segments = std::move(segments.value());

    auto beats = provider.beat_grid(track_id);
    if (beats.failed()) return beats.failure();
    primitives.beats = std::move(beats.value());

    auto curve = provider.energy_curve(track_id);
    if (curve.failed()) return curve.failure();
    primitives.energy_curve = std::move(curve.value());

    auto rate = provider.sample_rate(track_id);
    if (rate.failed()) return rate.failure();
    primitives.sample_rate = rate.value();

    auto duration = provider.duration(track_id);
    if (duration.failed()) return duration.failure();
    primitives.duration = duration.value();

    auto unlabeled = provider.cluster_segmentation(track_id);
    if (unlabeled.failed()) return unlabeled.failure();
    primitives.unlabeled = std::move(unlabeled.value());

    auto result = build(primitives);
    if (result.failed()) {
        return ResultError{result.code(), track_id + ": " + result.error()};
    }
    return result;
}

Result<TrackAnalysis> Analyzer::build(const TrackPrimitives& primitives) const {
    if (!std::isfinite(primitives.bpm) || primitives.bpm <= 0.0f) {
        return ResultError{ErrorCode::AnalysisError,
            utils::format("Invalid tempo %.3f", primitives.bpm)};
    }
    if (primitives.sample_rate <= 0) {
        return ResultError{ErrorCode::AnalysisError,
            utils::format("Invalid sample rate %d", primitives.sample_rate)};
    }
    if (!std::is_sorted(primitives.beats.begin(), primitives.beats.end())) {
        return ResultError{ErrorCode::AnalysisError, "Beat grid is not ordered"};
    }
    if (!EnergyCurve::is_well_formed(primitives.energy_curve)) {
        return ResultError{ErrorCode::AnalysisError, "Energy curve is not time-ordered"};
    }

    TrackAnalysis analysis;
    analysis.sample_rate = primitives.sample_rate;
    analysis.bpm = primitives.bpm;
    analysis.segments = primitives.segments;
    analysis.beats = primitives.beats;
    analysis.energy_curve = primitives.energy_curve;

    // Key
    auto key = key_estimator_.estimate(primitives.chroma);
    if (key.ok()) {
        analysis.key = key.value();
    } else {
        warn("No key: %s", key.error());
    }

    // Structure: labeled segments, else boundaries and clusters
    const auto& unlabeled = primitives.unlabeled;
    if (!primitives.segments.empty()) {
        auto moments = moment_extractor_.extract(primitives.segments, primitives.energy_curve);
        if (moments.failed()) {
            return moments.failure();
        }
        analysis.moments = moments.value();
    } else if (!unlabeled.clusters.empty()) {
        auto moments = moment_extractor_.extract_unlabeled(unlabeled.boundaries, unlabeled.clusters,
                                                           primitives.energy_curve);
        if (moments.failed()) {
            return moments.failure();
        }
        analysis.moments = moments.value();
    } else {
        warn("%s, all key moments absent", "Empty segment list");
    }

    if (logger_) {
        for (const auto& moment : analysis.moments.moments) {
            if (moment.time) {
                logger_->log(LogLevel::Debug, "Analyzer", "%s at %.2fs",
                             moment_kind_name(moment.kind), *moment.time);
            }
        }
    }

    // Duration: explicit, else the furthest known time
    analysis.duration = primitives.duration;
    if (analysis.duration <= 0.0f) {
        if (!analysis.segments.empty()) {
            analysis.duration = std::max(analysis.duration, analysis.segments.back().end);
        }
        if (!unlabeled.boundaries.empty()) {
            analysis.duration = std::max(analysis.duration, unlabeled.boundaries.back());
        }
        if (!analysis.beats.empty()) {
            analysis.duration = std::max(analysis.duration, analysis.beats.back());
        }
        if (!analysis.energy_curve.empty()) {
            analysis.duration = std::max(analysis.duration, analysis.energy_curve.back().time);
        }
    }

    return analysis;
}

} // namespace segue
