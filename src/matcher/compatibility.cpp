/**
 * Segue Engine - Harmonic and Tempo Compatibility Implementation
 */

#include "compatibility.h"
#include "../core/utils.h"
#include <cmath>
#include <cctype>
#include <algorithm>

namespace segue {

/* ============================================================================
 * Camelot
 * ============================================================================ */

Result<CamelotCode> CamelotCompatibility::parse(const std::string& code) {
    if (code.size() < 2 || code.size() > 3) {
        return ResultError{ErrorCode::InvalidKeyCode, "Malformed Camelot code '" + code + "'"};
    }

    CamelotCode parsed;
    parsed.letter = static_cast<char>(std::toupper(static_cast<unsigned char>(code.back())));

    int number = 0;
    for (size_t i = 0; i + 1 < code.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(code[i]))) {
            return ResultError{ErrorCode::InvalidKeyCode, "Malformed Camelot code '" + code + "'"};
        }
        number = number * 10 + (code[i] - '0');
    }
    parsed.number = number;

    if (!is_valid(parsed)) {
        return ResultError{ErrorCode::InvalidKeyCode, "Camelot code out of range '" + code + "'"};
    }
    return parsed;
}

bool CamelotCompatibility::is_valid(const CamelotCode& code) {
    return code.number >= 1 && code.number <= 12 &&
           (code.letter == 'A' || code.letter == 'B');
}

int CamelotCompatibility::circular_distance(int number_a, int number_b) {
    int diff = std::abs(number_a - number_b);
    return std::min(diff, 12 - diff);
}

Result<float> CamelotCompatibility::score(const CamelotCode& a, const CamelotCode& b) {
    if (!is_valid(a)) {
        return ResultError{ErrorCode::InvalidKeyCode, "Invalid Camelot code " + a.to_string()};
    }
    if (!is_valid(b)) {
        return ResultError{ErrorCode::InvalidKeyCode, "Invalid Camelot code " + b.to_string()};
    }

    int circ_diff = circular_distance(a.number, b.number);
    bool same_letter = (a.letter == b.letter);

    if (circ_diff == 0 && same_letter)  return 1.0f;
    if (circ_diff == 0)                 return 0.9f;    // relative major/minor
    if (circ_diff == 1 && same_letter)  return 0.8f;
    if (circ_diff == 1)                 return 0.6f;
    if (circ_diff == 2)                 return 0.3f;
    return 0.0f;
}

const char* CamelotCompatibility::advice(float score) {
    if (score >= 0.8f) return "Smooth harmonic crossfade recommended.";
    if (score >= 0.6f) return "Harmonic blend possible. Use short crossfade.";
    if (score >= 0.3f) return "Harmonic clash likely. Transition during percussion-only section.";
    return "Keys are incompatible. Use hard cut at drop or echo-out transition.";
}

/* ============================================================================
 * Tempo
 * ============================================================================ */

float TempoCompatibility::effective_delta(float bpm_a, float bpm_b) {
    auto one_way = [](float a, float b) {
        float deltas[] = {
            std::abs(a - b),
            std::abs(a - 2.0f * b),
            std::abs(a - 0.5f * b)
        };
        return *std::min_element(std::begin(deltas), std::end(deltas));
    };
    return std::min(one_way(bpm_a, bpm_b), one_way(bpm_b, bpm_a));
}

float TempoCompatibility::normalize(float bpm_a, float bpm_b, const TempoLimits& limits) {
    if (bpm_b < limits.double_below * bpm_a) return bpm_b * 2.0f;
    if (bpm_b > limits.halve_above * bpm_a) return bpm_b * 0.5f;
    return bpm_b;
}

float TempoCompatibility::stretch_pct(float bpm_a, float bpm_b_normalized) {
    if (bpm_b_normalized <= 0.0f) return 0.0f;
    return std::abs(bpm_a / bpm_b_normalized - 1.0f);
}

/* ============================================================================
 * Pair assessment
 * ============================================================================ */

Result<CompatibilityResult> evaluate_compatibility(
    const TrackAnalysis& a,
    const TrackAnalysis& b,
    const TempoLimits& limits
) {
    if (!(a.bpm > 0.0f) || !(b.bpm > 0.0f)) {
        return ResultError{ErrorCode::InvalidArgument,
            utils::format("Non-positive tempo (%.2f / %.2f)", a.bpm, b.bpm)};
    }

    CompatibilityResult result;

    result.delta_eff_bpm = TempoCompatibility::effective_delta(a.bpm, b.bpm);
    result.bpm_b_normalized = TempoCompatibility::normalize(a.bpm, b.bpm, limits);
    result.stretch_pct = TempoCompatibility::stretch_pct(a.bpm, result.bpm_b_normalized);
    result.tempo_compatible = result.delta_eff_bpm <= limits.max_bpm_delta;
    result.stretch_safe = result.stretch_pct <= limits.safe_stretch;

    if (a.key && b.key) {
        auto score = CamelotCompatibility::score(a.key->camelot, b.key->camelot);
        if (score.failed()) {
            return score.failure();
        }
        result.key_score = score.value();
    } else {
        result.key_score = 0.0f;
    }
    result.key_compatible = result.key_score >= limits.key_compatible_score;

    return result;
}

} // namespace segue
