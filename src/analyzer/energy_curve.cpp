/**
 * Segue Engine - Energy Curve Queries Implementation
 */

#include "energy_curve.h"
#include <cmath>
#include <algorithm>

namespace segue {

float EnergyCurve::mean_rms(const std::vector<EnergyPoint>& curve, float start, float end) {
    if (curve.empty()) {
        return 0.0f;
    }

    if (end < start) std::swap(start, end);

    float sum = 0.0f;
    int count = 0;

    for (const auto& point : curve) {
        if (point.time < start) continue;
        if (point.time > end) break;
        sum += point.rms;
        count++;
    }

    if (count == 0) {
        return value_at(curve, 0.5f * (start + end));
    }

    return sum / count;
}

float EnergyCurve::value_at(const std::vector<EnergyPoint>& curve, float time) {
    if (curve.empty()) {
        return 0.0f;
    }

    if (time <= curve.front().time) return curve.front().rms;
    if (time >= curve.back().time) return curve.back().rms;

    auto it = std::lower_bound(curve.begin(), curve.end(), time,
        [](const EnergyPoint& p, float t) { return p.time < t; });

    // it->time >= time > prev->time
    auto prev = it - 1;
    float span = it->time - prev->time;
    if (span <= 0.0f) return it->rms;

    float frac = (time - prev->time) / span;
    return prev->rms * (1.0f - frac) + it->rms * frac;
}

std::optional<float> EnergyCurve::earliest_in_window(const std::vector<EnergyPoint>& curve,
                                                     float start, float end) {
    for (const auto& point : curve) {
        if (point.time >= end) break;
        if (point.time >= start) {
            return point.time;
        }
    }
    return std::nullopt;
}

std::optional<float> EnergyCurve::largest_rise(const std::vector<EnergyPoint>& curve) {
    if (curve.size() < 2) {
        return std::nullopt;
    }

    size_t best_index = 0;
    float best_rise = curve[1].rms - curve[0].rms;

    for (size_t i = 1; i + 1 < curve.size(); ++i) {
        float rise = curve[i + 1].rms - curve[i].rms;
        if (rise > best_rise) {
            best_rise = rise;
            best_index = i;
        }
    }

    return curve[best_index].time;
}

bool EnergyCurve::is_well_formed(const std::vector<EnergyPoint>& curve) {
    for (size_t i = 0; i < curve.size(); ++i) {
        if (!std::isfinite(curve[i].time) || !std::isfinite(curve[i].rms)) return false;
        if (i > 0 && curve[i].time < curve[i - 1].time) return false;
    }
    return true;
}

float EnergyCurve::compute_rms(const float* samples, size_t count) {
    if (count == 0 || !samples) {
        return 0.0f;
    }

    float sum_sq = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        sum_sq += samples[i] * samples[i];
    }

    return std::sqrt(sum_sq / count);
}

} // namespace segue
