/**
 * Segue Engine - Key Estimator
 */

#ifndef SEGUE_KEY_ESTIMATOR_H
#define SEGUE_KEY_ESTIMATOR_H

#include "segue/types.h"

namespace segue {

/**
 * Musical key estimation from an averaged 12-bin chroma vector.
 * Returns the key name plus its Camelot code (e.g. "A minor" / 8A).
 */
class KeyEstimator {
public:
    KeyEstimator() = default;

    /**
     * Estimate the key of a chroma vector (C..B energies).
     *
     * Every root is scored against the rotated major and minor profiles
     * in C, C#, ..., B order, major before minor; only a strictly better
     * score replaces the current best, so ties keep the first key found.
     *
     * Bins past the 12th are ignored.
     *
     * @return KeyEstimate, or AnalysisError for fewer than 12 bins, or
     *         bins that are negative, non-finite or all zero
     */
    Result<KeyEstimate> estimate(const std::vector<float>& chroma) const;

    /**
     * Similarity of a chroma vector to one rotated profile.
     */
    static float score_key(const std::vector<float>& chroma, int root, bool is_major);

    static const char* pitch_name(int pitch_class);

private:
    // Krumhansl-Schmuckler key profiles
    static const float major_profile_[12];
    static const float minor_profile_[12];
};

/**
 * Look up the Camelot code of a key name such as "A minor".
 */
std::optional<CamelotCode> key_name_to_camelot(const std::string& key_name);

/**
 * Reverse lookup: Camelot code to key name ("8B" -> "C major").
 */
std::optional<std::string> camelot_to_key_name(const CamelotCode& code);

} // namespace segue

#endif // SEGUE_KEY_ESTIMATOR_H
