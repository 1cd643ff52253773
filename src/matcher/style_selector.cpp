/**
 * Segue Engine - Transition Style Selection Implementation
 */

#include "style_selector.h"
#include <cmath>

namespace segue {

namespace {

using RulePredicate = bool (*)(const StyleInputs&, const StyleThresholds&);

struct StyleRule {
    const char* name;
    RulePredicate matches;
    TransitionType type;
    int duration_beats;
};

bool great_tempo_and_key(const StyleInputs& in, const StyleThresholds& t) {
    return in.delta_eff_bpm <= t.great_bpm &&
           in.key_score >= t.good_key &&
           std::abs(in.energy_jump) <= t.big_jump;
}

// Checked before the stretch rules so a clash is masked, never slammed
bool key_clash(const StyleInputs& in, const StyleThresholds& t) {
    return in.key_score < t.clash_key;
}

bool smooth_harmonic_entry(const StyleInputs& in, const StyleThresholds& t) {
    bool soft_entry = in.entry_label == SegmentLabel::Intro || in.entry_label == SegmentLabel::Verse;
    return in.stretch_pct <= t.safe_stretch && in.key_score >= t.good_key && soft_entry;
}

bool hard_tempo_or_energy(const StyleInputs& in, const StyleThresholds& t) {
    return in.stretch_pct > t.safe_stretch ||
           in.delta_eff_bpm > t.good_bpm ||
           in.entry_label == SegmentLabel::Drop ||
           std::abs(in.energy_jump) > t.big_jump;
}

bool always(const StyleInputs&, const StyleThresholds&) {
    return true;
}

const StyleRule kRules[] = {
    {"great_tempo_and_key",   great_tempo_and_key,   TransitionType::Crossfade,      16},
    {"key_clash",             key_clash,             TransitionType::LowCutFilter,   8},
    {"smooth_harmonic_entry", smooth_harmonic_entry, TransitionType::ReverbTail,     8},
    {"hard_tempo_or_energy",  hard_tempo_or_energy,  TransitionType::LowCutEchoSlam, 4},
    {"fallback",              always,                TransitionType::ReverbTail,     8},
};

constexpr size_t kRuleCount = sizeof(kRules) / sizeof(kRules[0]);

} // namespace

StyleSelector::StyleSelector(const StyleThresholds& thresholds)
    : thresholds_(thresholds) {}

StyleDecision StyleSelector::select(const StyleInputs& inputs) const {
    StyleDecision decision;

    for (size_t i = 0; i < kRuleCount; ++i) {
        const auto& rule = kRules[i];
        if (rule.matches(inputs, thresholds_)) {
            decision.type = rule.type;
            decision.duration_beats = rule.duration_beats;
            decision.rule_index = static_cast<int>(i) + 1;
            decision.rule = rule.name;
            return decision;
        }
    }

    // Unreachable: the last rule always matches
    return decision;
}

size_t StyleSelector::rule_count() {
    return kRuleCount;
}

} // namespace segue
