/**
 * Segue Engine - Tempo Matching (offline time-stretch)
 */

#ifndef SEGUE_TEMPO_MATCHER_H
#define SEGUE_TEMPO_MATCHER_H

#include "segue/types.h"
#include "../core/log.h"

namespace segue {

/**
 * Pitch-preserving offline time-stretch with Rubber Band.
 */
class TempoMatcher {
public:
    explicit TempoMatcher(const Logger* logger = nullptr);

    /**
     * Output/input length ratio that brings a track at `source_bpm` to
     * `target_bpm`.
     */
    static double time_ratio(float source_bpm, float target_bpm);

    /**
     * True when the ratio is close enough to 1.0 to skip stretching.
     */
    static bool is_identity(double ratio);

    /**
     * Stretch a buffer by `ratio` (2.0 = twice as long).
     * A ratio within 0.1% of 1.0 returns the input unchanged.
     *
     * @return InvalidArgument for a non-positive ratio or an empty buffer
     */
    Result<AudioBuffer> stretch(const AudioBuffer& input, double ratio) const;

private:
    const Logger* logger_;
};

} // namespace segue

#endif // SEGUE_TEMPO_MATCHER_H
