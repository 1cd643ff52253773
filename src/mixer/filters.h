/**
 * Segue Engine - Offline Effects (high-pass filter, echo)
 */

#ifndef SEGUE_FILTERS_H
#define SEGUE_FILTERS_H

#include <cstddef>
#include <vector>

namespace segue {

// =============================================================================
// Biquad filter - single channel, direct-form II transposed
// =============================================================================

struct BiquadCoeffs {
    float b0 = 1.0f, b1 = 0.0f, b2 = 0.0f;
    float a1 = 0.0f, a2 = 0.0f;
};

struct BiquadState {
    float z1 = 0.0f, z2 = 0.0f;

    float process(float x, const BiquadCoeffs& c) {
        float y = c.b0 * x + z1;
        z1 = c.b1 * x - c.a1 * y + z2;
        z2 = c.b2 * x - c.a2 * y;
        return y;
    }

    void reset() { z1 = z2 = 0.0f; }
};

/**
 * Cook high-pass biquad coefficients. The cutoff is clamped below Nyquist.
 */
BiquadCoeffs make_high_pass(float sample_rate, float freq, float q);

/**
 * 4th-order Butterworth high-pass over interleaved audio, built from two
 * cascaded biquads. State starts at rest.
 */
class HighPassFilter {
public:
    HighPassFilter(float sample_rate, float cutoff_hz, int channels);

    /**
     * Filter `frames` interleaved frames in place.
     */
    void process(float* samples, size_t frames);

    void reset();

private:
    static constexpr int kStages = 2;

    int channels_;
    BiquadCoeffs stages_[kStages];
    std::vector<BiquadState> state_;    // kStages per channel
};

/**
 * Single-tap echo: y[n] += decay * x[n - delay], in place over interleaved
 * frames. The echo is cut at the end of the buffer.
 */
void apply_echo(float* samples, size_t frames, int channels, int sample_rate,
                float delay_seconds, float decay);

} // namespace segue

#endif // SEGUE_FILTERS_H
