/**
 * Segue Engine - Crossfader Implementation
 */

#include "crossfader.h"
#include "../core/utils.h"
#include <cmath>

namespace segue {

Crossfader::Crossfader(CurveType curve) : curve_(curve) {}

void Crossfader::gains(float t, float& out_gain, float& in_gain) const {
    float normalized = utils::clamp(t, 0.0f, 1.0f);

    switch (curve_) {
        case CurveType::Linear:
            out_gain = 1.0f - normalized;
            in_gain = normalized;
            break;

        case CurveType::EqualPower:
            out_gain = std::cos(normalized * static_cast<float>(M_PI) / 2.0f);
            in_gain = std::sin(normalized * static_cast<float>(M_PI) / 2.0f);
            break;
    }
}

float Crossfader::position(size_t frame, size_t frames) {
    if (frames <= 1) return 1.0f;
    return static_cast<float>(frame) / static_cast<float>(frames - 1);
}

void Crossfader::mix(const float* outgoing, const float* incoming, float* out,
                     size_t frames, int channels) const {
    for (size_t f = 0; f < frames; ++f) {
        float g_out, g_in;
        gains(position(f, frames), g_out, g_in);

        for (int ch = 0; ch < channels; ++ch) {
            size_t i = f * channels + ch;
            out[i] = outgoing[i] * g_out + incoming[i] * g_in;
        }
    }
}

} // namespace segue
