/**
 * Segue Engine - Transition Point Search
 */

#ifndef SEGUE_TRANSITION_POINTS_H
#define SEGUE_TRANSITION_POINTS_H

#include "segue/types.h"

namespace segue {

/**
 * Winning exit/entry pair of a search.
 */
struct SearchOutcome {
    CandidatePoint exit;
    CandidatePoint entry;
    float score = 0.0f;
    float energy_a = 0.0f;      // Mean RMS over the 2 bars before the exit
    float energy_b = 0.0f;      // Mean RMS over the 2 bars after the entry
    float energy_jump = 0.0f;   // energy_b - energy_a
};

/**
 * Finds the best (exit in A, entry in B) pair from structural boundaries.
 */
class TransitionPointSearch {
public:
    explicit TransitionPointSearch(const SearchWeights& weights = SearchWeights::defaults());

    /**
     * Exit candidates in A:
     * - End of chorus or drop (1.0)
     * - Start of break (0.8)
     * - End of verse (0.4)
     *
     * Exits later than 16 beats before the end of the track are dropped.
     * Without any, a zero-weight candidate at the Outro moment, or 16 beats
     * before the end of the track.
     */
    static std::vector<CandidatePoint> exit_candidates(const TrackAnalysis& track);

    /**
     * Entry candidates in B:
     * - Start of drop (1.0), Hype only; the Beatdrop moment stands in
     * - Start of intro (0.8)
     * - Start of buildup (0.8); the Buildup moment stands in
     *
     * Without any, a zero-weight candidate at 0.0.
     */
    static std::vector<CandidatePoint> entry_candidates(const TrackAnalysis& track, SearchStrategy strategy);

    /**
     * Score every exit x entry pair and return the best one.
     * Ties keep the earliest exit, then the earliest entry.
     *
     * @param stretch_pct Tempo stretch needed for the pair
     */
    Result<SearchOutcome> search(const TrackAnalysis& a,
                                 const TrackAnalysis& b,
                                 float stretch_pct,
                                 SearchStrategy strategy) const;

    /**
     * Pair score for the given strategy.
     */
    float score_pair(float exit_weight, float entry_weight,
                     float energy_a, float energy_b,
                     float stretch_pct, SearchStrategy strategy) const;

    const SearchWeights& weights() const { return weights_; }

private:
    SearchWeights weights_;

    // Merge candidates sharing a time, keeping the higher weight; sort by time
    static void merge_duplicates(std::vector<CandidatePoint>& candidates);
};

} // namespace segue

#endif // SEGUE_TRANSITION_POINTS_H
