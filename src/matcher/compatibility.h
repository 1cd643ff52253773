/**
 * Segue Engine - Harmonic and Tempo Compatibility
 */

#ifndef SEGUE_COMPATIBILITY_H
#define SEGUE_COMPATIBILITY_H

#include "segue/types.h"
#include <string>

namespace segue {

/**
 * Camelot wheel key compatibility.
 * Keys are represented as "NA" where N is 1-12 and A is 'A' (minor) or 'B' (major).
 * Adjacent numbers on the wheel are a fifth apart; 12 wraps to 1.
 */
class CamelotCompatibility {
public:
    /**
     * Parse a code such as "8A" or "12b".
     */
    static Result<CamelotCode> parse(const std::string& code);

    /**
     * Check number (1..12) and letter (A/B).
     */
    static bool is_valid(const CamelotCode& code);

    /**
     * Steps around the wheel between two numbers, 0..6.
     */
    static int circular_distance(int number_a, int number_b);

    /**
     * Score table, first match wins:
     *   same number, same letter        1.0
     *   same number, other letter       0.9
     *   one step,    same letter        0.8
     *   one step,    other letter       0.6
     *   two steps                       0.3
     *   anything else                   0.0
     *
     * @return score, or InvalidKeyCode for a malformed code
     */
    static Result<float> score(const CamelotCode& a, const CamelotCode& b);

    /**
     * DJ strategy for a compatibility score.
     */
    static const char* advice(float score);
};

/**
 * Tempo compatibility with half/double-time handling.
 */
class TempoCompatibility {
public:
    /**
     * min(|A-B|, |A-2B|, |A-B/2|), taken over both orderings so the
     * result does not depend on which track is A.
     */
    static float effective_delta(float bpm_a, float bpm_b);

    /**
     * B's tempo on A's time-scale: doubled below double_below*A,
     * halved above halve_above*A.
     */
    static float normalize(float bpm_a, float bpm_b, const TempoLimits& limits = TempoLimits());

    /**
     * |A / B_norm - 1|.
     */
    static float stretch_pct(float bpm_a, float bpm_b_normalized);
};

/**
 * Combined key + tempo assessment of a track pair.
 *
 * A pair where either side has no key scores 0.0 on the key axis.
 * Tempo beyond the hard limit only clears tempo_compatible; the caller
 * decides whether that rejects the pair.
 *
 * @return InvalidKeyCode for malformed codes, InvalidArgument for
 *         non-positive tempos
 */
Result<CompatibilityResult> evaluate_compatibility(
    const TrackAnalysis& a,
    const TrackAnalysis& b,
    const TempoLimits& limits = TempoLimits()
);

} // namespace segue

#endif // SEGUE_COMPATIBILITY_H
