/**
 * Segue Engine - Beat Phase Alignment
 */

#ifndef SEGUE_BEAT_PHASE_H
#define SEGUE_BEAT_PHASE_H

#include "segue/types.h"

namespace segue {

struct AlignedPoints {
    float exit_time = 0.0f;
    float entry_time = 0.0f;
    float phase_offset = 0.0f;
    float entry_phase = 0.0f;   // Entry position inside B's bar
};

/**
 * Snaps transition times to downbeats and computes the bar-phase shift
 * between two tracks. Assumes 4/4: every 4th beat of the grid is a downbeat.
 */
class BeatPhaseAligner {
public:
    BeatPhaseAligner() = default;

    /**
     * Beats at indices 0, 4, 8, ...
     */
    static std::vector<float> downbeats(const std::vector<float>& beats);

    /**
     * Nearest downbeat by absolute distance, ties going to the earlier one.
     * An empty grid falls back to bars of 4*60/bpm counted from 0.
     */
    static float snap_to_downbeat(const std::vector<float>& beats, float bpm, float time);

    /**
     * First downbeat of a grid; bars of an empty grid start at 0.
     */
    static float grid_anchor(const std::vector<float>& beats);

    /**
     * Position of `time` inside its bar, counted from `anchor`, in [0, bar).
     * Remainders within 1 ms of a full bar fold to 0.
     */
    static float bar_phase(float time, float bpm, float anchor = 0.0f);

    /**
     * bar_phase(tA) - bar_phase(tB), bar = 4*60/bpm. Each phase is measured
     * from its own track's first downbeat.
     */
    static float phase_offset(float time_a, float bpm_a, float time_b, float bpm_b,
                              float anchor_a = 0.0f, float anchor_b = 0.0f);

    /**
     * Offset after B is time-stretched by `ratio`: A's bar phase is kept,
     * B's phase scales with the stretch.
     */
    static float rescale_offset(float phase_offset, float entry_phase, double ratio);

    /**
     * Snap both points and compute the offset, using B's tempo normalized
     * to A's time-scale.
     */
    AlignedPoints align(const TrackAnalysis& a, float time_a,
                        const TrackAnalysis& b, float time_b,
                        float bpm_b_normalized) const;

private:
    static float nearest(const std::vector<float>& grid, float time);
};

} // namespace segue

#endif // SEGUE_BEAT_PHASE_H
