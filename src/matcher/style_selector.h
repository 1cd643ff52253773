/**
 * Segue Engine - Transition Style Selection
 */

#ifndef SEGUE_STYLE_SELECTOR_H
#define SEGUE_STYLE_SELECTOR_H

#include "segue/types.h"

namespace segue {

/**
 * Inputs of the style decision.
 */
struct StyleInputs {
    float delta_eff_bpm = 0.0f;
    float stretch_pct = 0.0f;
    float key_score = 0.0f;
    SegmentLabel entry_label = SegmentLabel::Intro;
    float energy_jump = 0.0f;
};

struct StyleDecision {
    TransitionType type = TransitionType::ReverbTail;
    int duration_beats = 8;
    int rule_index = 0;         // 1-based position in the rule table
    const char* rule = "";
};

/**
 * Ordered rule table, first matching rule wins:
 *   1. great_tempo_and_key     delta <= great, key >= good, |jump| <= big  -> crossfade, 16
 *   2. key_clash               key < clash                                 -> low_cut_filter, 8
 *   3. smooth_harmonic_entry   stretch safe, key >= good, entry intro/verse -> reverb_tail, 8
 *   4. hard_tempo_or_energy    stretch unsafe, delta > good, entry drop
 *                              or |jump| > big                             -> low_cut_echo_slam, 4
 *   5. fallback                                                            -> reverb_tail, 8
 */
class StyleSelector {
public:
    explicit StyleSelector(const StyleThresholds& thresholds = StyleThresholds());

    StyleDecision select(const StyleInputs& inputs) const;

    static size_t rule_count();

    const StyleThresholds& thresholds() const { return thresholds_; }

private:
    StyleThresholds thresholds_;
};

} // namespace segue

#endif // SEGUE_STYLE_SELECTOR_H
