/**
 * Segue Engine - Beat Phase Alignment Implementation
 */

#include "beat_phase.h"
#include "../core/utils.h"
#include <algorithm>
#include <cmath>

namespace segue {

static constexpr float kPhaseEpsilon = 1e-3f;

std::vector<float> BeatPhaseAligner::downbeats(const std::vector<float>& beats) {
    std::vector<float> result;
    result.reserve(beats.size() / 4 + 1);

    // Each bar = 4 beats (4/4 time signature)
    for (size_t i = 0; i < beats.size(); i += 4) {
        result.push_back(beats[i]);
    }

    return result;
}

float BeatPhaseAligner::nearest(const std::vector<float>& grid, float time) {
    auto it = std::lower_bound(grid.begin(), grid.end(), time);

    if (it == grid.end()) {
        return grid.back();
    }

    if (it == grid.begin()) {
        return *it;
    }

    // Strictly closer later neighbour wins, equal distance keeps the earlier one
    auto prev = it - 1;
    if (*it - time < time - *prev) {
        return *it;
    }
    return *prev;
}

float BeatPhaseAligner::snap_to_downbeat(const std::vector<float>& beats, float bpm, float time) {
    auto grid = downbeats(beats);
    if (!grid.empty()) {
        return nearest(grid, time);
    }

    float bar = utils::bar_period(bpm);
    if (bar <= 0.0f) {
        return time;
    }

    float lower = std::floor(time / bar) * bar;
    float upper = lower + bar;
    float snapped = (upper - time < time - lower) ? upper : lower;
    return std::max(0.0f, snapped);
}

float BeatPhaseAligner::grid_anchor(const std::vector<float>& beats) {
    return beats.empty() ? 0.0f : beats.front();
}

float BeatPhaseAligner::bar_phase(float time, float bpm, float anchor) {
    float bar = utils::bar_period(bpm);
    if (bar <= 0.0f) {
        return 0.0f;
    }

    float phase = utils::positive_fmod(time - anchor, bar);
    if (bar - phase < kPhaseEpsilon) {
        phase = 0.0f;
    }
    return phase;
}

float BeatPhaseAligner::phase_offset(float time_a, float bpm_a, float time_b, float bpm_b,
                                     float anchor_a, float anchor_b) {
    return bar_phase(time_a, bpm_a, anchor_a) - bar_phase(time_b, bpm_b, anchor_b);
}

float BeatPhaseAligner::rescale_offset(float phase_offset, float entry_phase, double ratio) {
    float exit_phase = phase_offset + entry_phase;
    return exit_phase - static_cast<float>(entry_phase * ratio);
}

AlignedPoints BeatPhaseAligner::align(const TrackAnalysis& a, float time_a,
                                      const TrackAnalysis& b, float time_b,
                                      float bpm_b_normalized) const {
    AlignedPoints points;
    points.exit_time = snap_to_downbeat(a.beats, a.bpm, time_a);
    points.entry_time = snap_to_downbeat(b.beats, b.bpm, time_b);

    float anchor_a = grid_anchor(a.beats);
    float anchor_b = grid_anchor(b.beats);
    points.entry_phase = bar_phase(points.entry_time, bpm_b_normalized, anchor_b);
    points.phase_offset = bar_phase(points.exit_time, a.bpm, anchor_a) - points.entry_phase;
    return points;
}

} // namespace segue
