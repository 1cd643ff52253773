/**
 * Segue Engine - Key Moment Extraction Implementation
 */

#include "key_moments.h"
#include "energy_curve.h"
#include "../core/utils.h"
#include <algorithm>
#include <map>

namespace segue {

namespace {

// Segmenters round boundaries; touching segments may overlap by this much
constexpr float kOverlapTolerance = 1e-3f;

std::optional<float> first_of(const std::vector<Segment>& segments, SegmentLabel label) {
    for (const auto& seg : segments) {
        if (seg.label == label) {
            return seg.start;
        }
    }
    return std::nullopt;
}

} // namespace

KeyMomentExtractor::KeyMomentExtractor(const MomentConfig& config)
    : config_(config) {}

Result<bool> KeyMomentExtractor::validate(const std::vector<Segment>& segments) {
    if (segments.empty()) {
        return ResultError{ErrorCode::AnalysisError, "Empty segment list"};
    }

    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        if (!(seg.start >= 0.0f) || !(seg.end > seg.start)) {
            return ResultError{ErrorCode::AnalysisError,
                utils::format("Segment %zu has invalid bounds [%.3f, %.3f]", i, seg.start, seg.end)};
        }
        if (i > 0 && seg.start < segments[i - 1].end - kOverlapTolerance) {
            return ResultError{ErrorCode::AnalysisError,
                utils::format("Segment %zu overlaps or precedes segment %zu", i, i - 1)};
        }
    }

    return true;
}

std::optional<float> KeyMomentExtractor::find_beatdrop(const std::vector<Segment>& segments) {
    for (size_t i = 1; i < segments.size(); ++i) {
        if (segments[i].label != SegmentLabel::Chorus) continue;

        SegmentLabel prev = segments[i - 1].label;
        if (prev == SegmentLabel::Verse ||
            prev == SegmentLabel::PreChorus ||
            prev == SegmentLabel::Intro) {
            return segments[i].start;
        }
    }
    return std::nullopt;
}

float KeyMomentExtractor::find_buildup(const std::vector<EnergyPoint>& energy_curve,
                                       float drop_time, float window) {
    auto earliest = EnergyCurve::earliest_in_window(energy_curve, drop_time - window, drop_time);
    if (earliest) {
        return *earliest;
    }
    return std::max(0.0f, drop_time - window);
}

Result<KeyMoments> KeyMomentExtractor::extract(const std::vector<Segment>& segments,
                                               const std::vector<EnergyPoint>& energy_curve) const {
    auto valid = validate(segments);
    if (valid.failed()) {
        return valid.failure();
    }

    KeyMoments moments;
    moments.at(MomentKind::Intro)  = first_of(segments, SegmentLabel::Intro);
    moments.at(MomentKind::Verse)  = first_of(segments, SegmentLabel::Verse);
    moments.at(MomentKind::Chorus) = first_of(segments, SegmentLabel::Chorus);
    moments.at(MomentKind::Outro)  = first_of(segments, SegmentLabel::Outro);

    auto drop = find_beatdrop(segments);
    moments.at(MomentKind::Beatdrop) = drop;
    if (drop) {
        moments.at(MomentKind::Buildup) = find_buildup(energy_curve, *drop, config_.buildup_window);
    }

    return moments;
}

Result<KeyMoments> KeyMomentExtractor::extract_unlabeled(const std::vector<float>& boundaries,
                                                         const std::vector<int>& clusters,
                                                         const std::vector<EnergyPoint>& energy_curve) const {
    if (clusters.empty()) {
        return ResultError{ErrorCode::AnalysisError, "Empty segment list"};
    }
    if (boundaries.size() != clusters.size() && boundaries.size() != clusters.size() + 1) {
        return ResultError{ErrorCode::AnalysisError,
            utils::format("%zu boundaries do not fit %zu segments", boundaries.size(), clusters.size())};
    }
    if (!std::is_sorted(boundaries.begin(), boundaries.end())) {
        return ResultError{ErrorCode::AnalysisError, "Boundaries are not ordered"};
    }

    // Most frequent cluster, first appearance wins ties
    std::map<int, int> counts;
    for (int c : clusters) counts[c]++;

    int chorus_cluster = clusters.front();
    int best_count = 0;
    for (int c : clusters) {
        if (counts[c] > best_count) {
            best_count = counts[c];
            chorus_cluster = c;
        }
    }

    int intro_cluster = clusters.front();
    int outro_cluster = clusters.back();

    KeyMoments moments;
    moments.at(MomentKind::Intro) = boundaries.front();

    for (size_t i = 0; i < clusters.size(); ++i) {
        if (clusters[i] == chorus_cluster) {
            moments.at(MomentKind::Chorus) = boundaries[i];
            break;
        }
    }

    if (outro_cluster != intro_cluster) {
        for (size_t i = clusters.size(); i-- > 0;) {
            if (clusters[i] == outro_cluster) {
                moments.at(MomentKind::Outro) = boundaries[i];
                break;
            }
        }
    } else {
        moments.at(MomentKind::Outro) = boundaries.back();
    }

    for (size_t i = 0; i < clusters.size(); ++i) {
        if (clusters[i] != intro_cluster && clusters[i] != chorus_cluster) {
            moments.at(MomentKind::Verse) = boundaries[i];
            break;
        }
    }

    auto drop = EnergyCurve::largest_rise(energy_curve);
    moments.at(MomentKind::Beatdrop) = drop;
    if (drop) {
        moments.at(MomentKind::Buildup) = find_buildup(energy_curve, *drop, config_.unlabeled_buildup_window);
    }

    return moments;
}

} // namespace segue
