/**
 * Segue Engine - Transition Point Search Implementation
 */

#include "transition_points.h"
#include "../analyzer/energy_curve.h"
#include "../core/utils.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace segue {

namespace {

constexpr float kTimeEpsilon = 1e-4f;
constexpr float kLongestStyleBeats = 16.0f;
constexpr float kEnergyWindowBars = 2.0f;

bool has_label(const std::vector<Segment>& segments, SegmentLabel label) {
    return std::any_of(segments.begin(), segments.end(),
                       [label](const Segment& s) { return s.label == label; });
}

} // namespace

TransitionPointSearch::TransitionPointSearch(const SearchWeights& weights)
    : weights_(weights) {}

// ============================================================================
// Candidate generation
// ============================================================================

void TransitionPointSearch::merge_duplicates(std::vector<CandidatePoint>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const CandidatePoint& x, const CandidatePoint& y) { return x.time < y.time; });

    std::vector<CandidatePoint> merged;
    for (const auto& c : candidates) {
        if (!merged.empty() && std::abs(merged.back().time - c.time) <= kTimeEpsilon) {
            if (c.score > merged.back().score) {
                merged.back() = c;
            }
            continue;
        }
        merged.push_back(c);
    }
    candidates.swap(merged);
}

std::vector<CandidatePoint> TransitionPointSearch::exit_candidates(const TrackAnalysis& track) {
    std::vector<CandidatePoint> candidates;

    for (const auto& seg : track.segments) {
        switch (seg.label) {
            case SegmentLabel::Chorus:
            case SegmentLabel::Drop:
                candidates.push_back({seg.end, seg.label, 1.0f});
                break;
            case SegmentLabel::Break:
                candidates.push_back({seg.start, seg.label, 0.8f});
                break;
            case SegmentLabel::Verse:
                candidates.push_back({seg.end, seg.label, 0.4f});
                break;
            default:
                break;
        }
    }

    // An exit must leave room for the longest transition before A ends
    if (track.duration > 0.0f) {
        float latest = track.duration - kLongestStyleBeats * utils::beat_period(track.bpm) + kTimeEpsilon;
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [latest](const CandidatePoint& c) { return c.time > latest; }),
                         candidates.end());
    }

    if (candidates.empty()) {
        const auto& outro = track.moments.at(MomentKind::Outro);
        float t = outro ? *outro
                        : std::max(0.0f, track.duration - kLongestStyleBeats * utils::beat_period(track.bpm));
        candidates.push_back({t, SegmentLabel::Outro, 0.0f});
    }

    merge_duplicates(candidates);
    return candidates;
}

std::vector<CandidatePoint> TransitionPointSearch::entry_candidates(const TrackAnalysis& track,
                                                                   SearchStrategy strategy) {
    std::vector<CandidatePoint> candidates;
    bool hype = strategy == SearchStrategy::Hype;

    for (const auto& seg : track.segments) {
        switch (seg.label) {
            case SegmentLabel::Drop:
                if (hype) candidates.push_back({seg.start, seg.label, 1.0f});
                break;
            case SegmentLabel::Intro:
                candidates.push_back({seg.start, seg.label, 0.8f});
                break;
            case SegmentLabel::Buildup:
                candidates.push_back({seg.start, seg.label, 0.8f});
                break;
            default:
                break;
        }
    }

    // Moments stand in for segments the labeler did not emit
    const auto& beatdrop = track.moments.at(MomentKind::Beatdrop);
    if (hype && beatdrop && !has_label(track.segments, SegmentLabel::Drop)) {
        candidates.push_back({*beatdrop, SegmentLabel::Drop, 1.0f});
    }

    const auto& buildup = track.moments.at(MomentKind::Buildup);
    if (buildup && !has_label(track.segments, SegmentLabel::Buildup)) {
        candidates.push_back({*buildup, SegmentLabel::Buildup, 0.8f});
    }

    if (candidates.empty()) {
        candidates.push_back({0.0f, SegmentLabel::Intro, 0.0f});
    }

    merge_duplicates(candidates);
    return candidates;
}

// ============================================================================
// Scoring
// ============================================================================

float TransitionPointSearch::score_pair(float exit_weight, float entry_weight,
                                        float energy_a, float energy_b,
                                        float stretch_pct, SearchStrategy strategy) const {
    float score = weights_.exit * exit_weight
                + weights_.entry * entry_weight
                - weights_.stretch * stretch_pct;

    if (strategy == SearchStrategy::Smooth) {
        score -= weights_.energy * std::abs(energy_a - energy_b);
    }
    return score;
}

Result<SearchOutcome> TransitionPointSearch::search(const TrackAnalysis& a,
                                                    const TrackAnalysis& b,
                                                    float stretch_pct,
                                                    SearchStrategy strategy) const {
    if (!(a.bpm > 0.0f) || !(b.bpm > 0.0f)) {
        return ResultError{ErrorCode::InvalidArgument,
            utils::format("Cannot search with tempo %.2f / %.2f", a.bpm, b.bpm)};
    }

    auto exits = exit_candidates(a);
    auto entries = entry_candidates(b, strategy);

    float window_a = kEnergyWindowBars * utils::bar_period(a.bpm);
    float window_b = kEnergyWindowBars * utils::bar_period(b.bpm);

    // Entry energies do not depend on the exit
    std::vector<float> entry_energy;
    entry_energy.reserve(entries.size());
    for (const auto& entry : entries) {
        entry_energy.push_back(EnergyCurve::mean_rms(b.energy_curve, entry.time, entry.time + window_b));
    }

    SearchOutcome best;
    float best_score = -std::numeric_limits<float>::infinity();

    // Both lists are time-ordered; strict '>' keeps the earliest pair on ties
    for (const auto& exit : exits) {
        float energy_a = EnergyCurve::mean_rms(a.energy_curve, exit.time - window_a, exit.time);

        for (size_t j = 0; j < entries.size(); ++j) {
            float energy_b = entry_energy[j];
            float score = score_pair(exit.score, entries[j].score, energy_a, energy_b, stretch_pct, strategy);

            if (score > best_score) {
                best_score = score;
                best.exit = exit;
                best.entry = entries[j];
                best.score = score;
                best.energy_a = energy_a;
                best.energy_b = energy_b;
                best.energy_jump = energy_b - energy_a;
            }
        }
    }

    return best;
}

} // namespace segue
