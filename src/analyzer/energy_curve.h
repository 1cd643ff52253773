/**
 * Segue Engine - Energy Curve Queries
 */

#ifndef SEGUE_ENERGY_CURVE_H
#define SEGUE_ENERGY_CURVE_H

#include "segue/types.h"

namespace segue {

/**
 * Read-only queries over a time-ordered (time, rms) energy curve.
 */
class EnergyCurve {
public:
    /**
     * Mean RMS of the samples with start <= time <= end.
     * A window holding no sample falls back to the value interpolated at
     * its centre; an empty curve yields 0.
     */
    static float mean_rms(const std::vector<EnergyPoint>& curve, float start, float end);

    /**
     * Linearly interpolated RMS at a time, clamped to the curve ends.
     */
    static float value_at(const std::vector<EnergyPoint>& curve, float time);

    /**
     * Time of the earliest sample with start <= time < end.
     */
    static std::optional<float> earliest_in_window(const std::vector<EnergyPoint>& curve,
                                                   float start, float end);

    /**
     * Time of the sample where the largest step-to-step RMS increase
     * begins (first one on ties). Needs at least two samples.
     */
    static std::optional<float> largest_rise(const std::vector<EnergyPoint>& curve);

    /**
     * True when times are non-decreasing and every value is finite.
     */
    static bool is_well_formed(const std::vector<EnergyPoint>& curve);

    /**
     * Compute RMS energy of a run of samples.
     */
    static float compute_rms(const float* samples, size_t count);
};

} // namespace segue

#endif // SEGUE_ENERGY_CURVE_H
