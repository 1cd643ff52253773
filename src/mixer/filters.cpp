/**
 * Segue Engine - Offline Effects Implementation
 */

#include "filters.h"
#include <cmath>
#include <algorithm>

namespace segue {

namespace {

// Butterworth pole pairs of a 4th-order section: Q = 1 / (2 cos(k*pi/8)), k = 1, 3
constexpr float kButterworthQ[2] = {0.5411961f, 1.3065630f};

} // namespace

BiquadCoeffs make_high_pass(float sample_rate, float freq, float q) {
    BiquadCoeffs c;
    freq = std::min(freq, 0.49f * sample_rate);

    float w0 = 2.0f * static_cast<float>(M_PI) * freq / sample_rate;
    float cs = std::cos(w0);
    float sn = std::sin(w0);
    float alpha = sn / (2.0f * q);

    float a0 = 1 + alpha;
    c.b0 = ((1 + cs) / 2) / a0;
    c.b1 = -(1 + cs) / a0;
    c.b2 = ((1 + cs) / 2) / a0;
    c.a1 = (-2 * cs) / a0;
    c.a2 = (1 - alpha) / a0;
    return c;
}

HighPassFilter::HighPassFilter(float sample_rate, float cutoff_hz, int channels)
    : channels_(std::max(1, channels))
    , state_(static_cast<size_t>(kStages * std::max(1, channels))) {
    for (int s = 0; s < kStages; ++s) {
        stages_[s] = make_high_pass(sample_rate, cutoff_hz, kButterworthQ[s]);
    }
}

void HighPassFilter::process(float* samples, size_t frames) {
    for (size_t f = 0; f < frames; ++f) {
        for (int ch = 0; ch < channels_; ++ch) {
            float& x = samples[f * channels_ + ch];
            for (int s = 0; s < kStages; ++s) {
                x = state_[ch * kStages + s].process(x, stages_[s]);
            }
        }
    }
}

void HighPassFilter::reset() {
    for (auto& s : state_) {
        s.reset();
    }
}

void apply_echo(float* samples, size_t frames, int channels, int sample_rate,
                float delay_seconds, float decay) {
    if (channels <= 0 || sample_rate <= 0) return;

    size_t delay = static_cast<size_t>(delay_seconds * sample_rate);
    if (delay == 0 || delay >= frames) return;

    // Walk backwards so x[n - delay] is still the dry sample
    for (size_t f = frames; f-- > delay;) {
        for (int ch = 0; ch < channels; ++ch) {
            samples[f * channels + ch] += decay * samples[(f - delay) * channels + ch];
        }
    }
}

} // namespace segue
