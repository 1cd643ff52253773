/**
 * Segue Engine - Track Analyzer
 */

#ifndef SEGUE_ANALYZER_H
#define SEGUE_ANALYZER_H

#include "segue/types.h"
#include "provider.h"
#include "key_estimator.h"
#include "key_moments.h"
#include "../core/log.h"
#include <string>

namespace segue {

/**
 * Builds an immutable TrackAnalysis from externally supplied primitives.
 *
 * Degenerate chroma and an empty segment list are recovered here: the
 * analysis carries no key / absent moments and a warning is logged.
 * A missing tempo or malformed segments, beats or energy curve fail the
 * track.
 */
class Analyzer {
public:
    explicit Analyzer(const MomentConfig& config = MomentConfig(), const Logger* logger = nullptr);

    // Non-copyable
    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

    /**
     * Query every primitive of a track from the provider and build its analysis.
     */
    Result<TrackAnalysis> analyze(AnalysisProvider& provider, const std::string& track_id) const;

    /**
     * Build an analysis from primitives already in hand.
     */
    Result<TrackAnalysis> build(const TrackPrimitives& primitives) const;

private:
    void warn(const char* fmt, const std::string& detail) const;

    KeyEstimator key_estimator_;
    KeyMomentExtractor moment_extractor_;
    const Logger* logger_;
};

} // namespace segue

#endif // SEGUE_ANALYZER_H
