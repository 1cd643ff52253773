/**
 * Segue Engine - Key Moment Extraction
 */

#ifndef SEGUE_KEY_MOMENTS_H
#define SEGUE_KEY_MOMENTS_H

#include "segue/types.h"

namespace segue {

/**
 * Reduces structural segments to the six canonical moments
 * (Intro, Verse, Buildup, Beatdrop, Chorus, Outro).
 */
class KeyMomentExtractor {
public:
    explicit KeyMomentExtractor(const MomentConfig& config = MomentConfig());

    /**
     * Extract moments from labeled segments.
     *
     * Intro/Verse/Chorus/Outro are the starts of the first segment with that
     * label. Beatdrop is the start of the first chorus directly preceded by
     * a verse, pre-chorus or intro. Buildup is searched on the energy curve
     * in the window before the Beatdrop.
     *
     * @return AnalysisError for an empty, unordered or overlapping list
     */
    Result<KeyMoments> extract(const std::vector<Segment>& segments,
                               const std::vector<EnergyPoint>& energy_curve) const;

    /**
     * Extract moments from unlabeled boundaries and cluster ids, as produced
     * by boundary/cluster segmenters. The most frequent cluster is taken as
     * the chorus, the first segment's cluster as the intro and the last
     * segment's cluster as the outro; the Beatdrop comes from the energy curve.
     *
     * @param boundaries Segment start times; may carry one trailing end time
     * @param clusters   Cluster id per segment
     */
    Result<KeyMoments> extract_unlabeled(const std::vector<float>& boundaries,
                                         const std::vector<int>& clusters,
                                         const std::vector<EnergyPoint>& energy_curve) const;

    /**
     * Start of the first chorus directly preceded by verse, pre-chorus or intro.
     */
    static std::optional<float> find_beatdrop(const std::vector<Segment>& segments);

    /**
     * Earliest energy sample inside [drop - window, drop), or
     * max(0, drop - window) when the curve has no sample there.
     */
    static float find_buildup(const std::vector<EnergyPoint>& energy_curve, float drop_time, float window);

    /**
     * Check ordering and overlap of a segment list.
     */
    static Result<bool> validate(const std::vector<Segment>& segments);

    const MomentConfig& config() const { return config_; }

private:
    MomentConfig config_;
};

} // namespace segue

#endif // SEGUE_KEY_MOMENTS_H
