/**
 * Segue Engine - Transition Renderer
 */

#ifndef SEGUE_RENDERER_H
#define SEGUE_RENDERER_H

#include "segue/types.h"

namespace segue {

/**
 * Frame range of a transition in both buffers.
 */
struct RenderWindow {
    size_t a_start = 0;         // First frame of A's window (the exit)
    size_t b_start = 0;         // First frame of B's window (the entry)
    size_t frames = 0;
};

/**
 * Processing applied to A's window before the fade.
 */
struct TailEffects {
    bool low_cut = false;
    bool echo = false;
    float echo_decay = 0.0f;
};

/**
 * Renders a planned transition from two in-memory buffers.
 *
 * Output = A[0, exit) + mix(window) + B[entry + window, end), peak-normalized.
 * Rendering is all-or-nothing: any RenderError leaves no partial output.
 */
class TransitionRenderer {
public:
    explicit TransitionRenderer(const RenderConfig& config = RenderConfig());

    /**
     * Render a plan. B's window starts at entry_time + phase_offset
     * (clamped at 0) unless phase offsets are disabled.
     */
    Result<AudioBuffer> render(const TransitionPlan& plan,
                               const AudioBuffer& a,
                               const AudioBuffer& b) const;

    /**
     * Equal-power (or linear) crossfade of A's tail against B's head.
     */
    Result<AudioBuffer> render_crossfade(const AudioBuffer& a, float exit_time,
                                         const AudioBuffer& b, float entry_time,
                                         float seconds) const;

    /**
     * Stepped low-cut of A's tail with an echo, faded against B's clean head.
     */
    Result<AudioBuffer> render_low_cut_echo(const AudioBuffer& a, float exit_time,
                                            const AudioBuffer& b, float entry_time,
                                            float seconds) const;

    /**
     * Check both buffers and locate the window.
     *
     * @return RenderError for empty buffers, mismatched rates or channel
     *         counts, a non-positive length, or a window past either end
     */
    Result<RenderWindow> locate(const AudioBuffer& a, float exit_time,
                                const AudioBuffer& b, float entry_time,
                                float seconds) const;

    /**
     * The mixed window before normalization.
     */
    std::vector<float> mix_window(const AudioBuffer& a, const AudioBuffer& b,
                                  const RenderWindow& window,
                                  const TailEffects& effects) const;

    /**
     * Effects used for a transition style.
     */
    TailEffects effects_for(TransitionType type) const;

    /**
     * Scale so the largest magnitude is 1.0. Silence stays silent.
     */
    static void normalize_peak(std::vector<float>& samples);

    static float peak(const float* samples, size_t count);

    const RenderConfig& config() const { return config_; }

private:
    // Stepped high-pass over an interleaved window, in place
    void apply_low_cut(std::vector<float>& tail, int sample_rate, int channels) const;

    AudioBuffer assemble(const AudioBuffer& a, const AudioBuffer& b,
                         const RenderWindow& window,
                         const std::vector<float>& mixed) const;

    Result<AudioBuffer> render_with(const AudioBuffer& a, float exit_time,
                                    const AudioBuffer& b, float entry_time,
                                    float seconds, const TailEffects& effects) const;

    RenderConfig config_;
};

} // namespace segue

#endif // SEGUE_RENDERER_H
