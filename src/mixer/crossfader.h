/**
 * Segue Engine - Crossfader
 */

#ifndef SEGUE_CROSSFADER_H
#define SEGUE_CROSSFADER_H

#include <cstddef>

namespace segue {

/**
 * Complementary fade gains over a transition window.
 */
class Crossfader {
public:
    enum class CurveType {
        Linear,     // Linear crossfade
        EqualPower  // Equal power (constant loudness)
    };

    explicit Crossfader(CurveType curve = CurveType::EqualPower);

    void set_curve(CurveType curve) { curve_ = curve; }
    CurveType curve() const { return curve_; }

    /**
     * Gains at fade position t (0 = outgoing only, 1 = incoming only).
     */
    void gains(float t, float& out_gain, float& in_gain) const;

    /**
     * Fade position of frame i in a window of `frames`, first frame 0,
     * last frame 1.
     */
    static float position(size_t frame, size_t frames);

    /**
     * out[i] = outgoing[i] * g_out + incoming[i] * g_in over interleaved frames.
     */
    void mix(const float* outgoing, const float* incoming, float* out,
             size_t frames, int channels) const;

private:
    CurveType curve_;
};

} // namespace segue

#endif // SEGUE_CROSSFADER_H
