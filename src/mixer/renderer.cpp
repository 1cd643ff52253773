/**
 * Segue Engine - Transition Renderer Implementation
 */

#include "renderer.h"
#include "crossfader.h"
#include "filters.h"
#include "../core/utils.h"
#include <algorithm>
#include <cmath>

namespace segue {

TransitionRenderer::TransitionRenderer(const RenderConfig& config)
    : config_(config) {}

// ============================================================================
// Window checks
// ============================================================================

Result<RenderWindow> TransitionRenderer::locate(const AudioBuffer& a, float exit_time,
                                                const AudioBuffer& b, float entry_time,
                                                float seconds) const {
    if (a.samples.empty() || b.samples.empty()) {
        return ResultError{ErrorCode::RenderError, "Empty source buffer"};
    }
    if (a.sample_rate <= 0 || a.sample_rate != b.sample_rate) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Sample rate mismatch (%d / %d), resample first", a.sample_rate, b.sample_rate)};
    }
    if (a.channels <= 0 || a.channels != b.channels) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Channel count mismatch (%d / %d)", a.channels, b.channels)};
    }
    if (!(seconds > 0.0f)) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Non-positive transition length %.3fs", seconds)};
    }
    if (exit_time < 0.0f || entry_time < 0.0f) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Negative window start (%.3f / %.3f)", exit_time, entry_time)};
    }

    RenderWindow window;
    window.frames = static_cast<size_t>(std::lround(seconds * a.sample_rate));
    window.a_start = static_cast<size_t>(std::lround(exit_time * a.sample_rate));
    window.b_start = static_cast<size_t>(std::lround(entry_time * b.sample_rate));

    if (window.frames == 0) {
        return ResultError{ErrorCode::RenderError, "Transition window shorter than one frame"};
    }
    if (window.a_start + window.frames > a.frame_count()) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Window [%.2fs, %.2fs] exceeds track A (%.2fs)",
                          exit_time, exit_time + seconds, a.duration_seconds())};
    }
    if (window.b_start + window.frames > b.frame_count()) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Window [%.2fs, %.2fs] exceeds track B (%.2fs)",
                          entry_time, entry_time + seconds, b.duration_seconds())};
    }

    return window;
}

// ============================================================================
// Effects
// ============================================================================

TailEffects TransitionRenderer::effects_for(TransitionType type) const {
    TailEffects fx;
    switch (type) {
        case TransitionType::Crossfade:
            break;
        case TransitionType::LowCutEchoSlam:
            fx.low_cut = true;
            fx.echo = true;
            fx.echo_decay = config_.echo_decay;
            break;
        case TransitionType::LowCutFilter:
            fx.low_cut = true;
            break;
        case TransitionType::ReverbTail:
            fx.echo = true;
            fx.echo_decay = config_.reverb_tail_decay;
            break;
    }
    return fx;
}

void TransitionRenderer::apply_low_cut(std::vector<float>& tail, int sample_rate, int channels) const {
    size_t frames = tail.size() / channels;
    int steps = std::max(1, config_.filter_steps);
    size_t step_frames = frames / steps;

    for (int i = 0; i < steps; ++i) {
        size_t start = i * step_frames;
        size_t end = (i == steps - 1) ? frames : start + step_frames;
        if (end <= start) continue;

        // Cutoff rises from 0 toward the ceiling; the first stages pass dry
        float cutoff = static_cast<float>(i) / steps * config_.filter_ceiling_hz;
        if (cutoff <= config_.filter_min_hz) continue;

        HighPassFilter filter(static_cast<float>(sample_rate), cutoff, channels);
        filter.process(tail.data() + start * channels, end - start);
    }
}

// ============================================================================
// Mixing
// ============================================================================

std::vector<float> TransitionRenderer::mix_window(const AudioBuffer& a, const AudioBuffer& b,
                                                  const RenderWindow& window,
                                                  const TailEffects& effects) const {
    int channels = a.channels;
    size_t count = window.frames * channels;

    const float* a_begin = a.samples.data() + window.a_start * channels;
    const float* b_begin = b.samples.data() + window.b_start * channels;

    std::vector<float> tail(a_begin, a_begin + count);

    if (effects.low_cut) {
        apply_low_cut(tail, a.sample_rate, channels);
    }
    if (effects.echo) {
        apply_echo(tail.data(), window.frames, channels, a.sample_rate,
                   config_.echo_delay, effects.echo_decay);
    }

    Crossfader fader(config_.equal_power ? Crossfader::CurveType::EqualPower
                                         : Crossfader::CurveType::Linear);
    std::vector<float> mixed(count);
    fader.mix(tail.data(), b_begin, mixed.data(), window.frames, channels);
    return mixed;
}

AudioBuffer TransitionRenderer::assemble(const AudioBuffer& a, const AudioBuffer& b,
                                         const RenderWindow& window,
                                         const std::vector<float>& mixed) const {
    int channels = a.channels;
    size_t b_tail_start = (window.b_start + window.frames) * channels;

    AudioBuffer out;
    out.sample_rate = a.sample_rate;
    out.channels = channels;
    out.samples.reserve(window.a_start * channels + mixed.size() + (b.samples.size() - b_tail_start));

    out.samples.insert(out.samples.end(), a.samples.begin(), a.samples.begin() + window.a_start * channels);
    out.samples.insert(out.samples.end(), mixed.begin(), mixed.end());
    out.samples.insert(out.samples.end(), b.samples.begin() + b_tail_start, b.samples.end());

    normalize_peak(out.samples);
    return out;
}

Result<AudioBuffer> TransitionRenderer::render_with(const AudioBuffer& a, float exit_time,
                                                    const AudioBuffer& b, float entry_time,
                                                    float seconds, const TailEffects& effects) const {
    auto window = locate(a, exit_time, b, entry_time, seconds);
    if (window.failed()) {
        return window.failure();
    }

    auto mixed = mix_window(a, b, window.value(), effects);
    return assemble(a, b, window.value(), mixed);
}

Result<AudioBuffer> TransitionRenderer::render(const TransitionPlan& plan,
                                               const AudioBuffer& a,
                                               const AudioBuffer& b) const {
    if (!(plan.bpm_ref > 0.0f)) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Non-positive reference tempo %.2f", plan.bpm_ref)};
    }
    if (plan.duration_beats <= 0) {
        return ResultError{ErrorCode::RenderError,
            utils::format("Non-positive transition length %d beats", plan.duration_beats)};
    }

    float entry = plan.entry_time;
    if (config_.apply_phase_offset) {
        entry = std::max(0.0f, entry + plan.phase_offset);
    }

    return render_with(a, plan.exit_time, b, entry, plan.duration_seconds(), effects_for(plan.type));
}

Result<AudioBuffer> TransitionRenderer::render_crossfade(const AudioBuffer& a, float exit_time,
                                                         const AudioBuffer& b, float entry_time,
                                                         float seconds) const {
    return render_with(a, exit_time, b, entry_time, seconds, effects_for(TransitionType::Crossfade));
}

Result<AudioBuffer> TransitionRenderer::render_low_cut_echo(const AudioBuffer& a, float exit_time,
                                                            const AudioBuffer& b, float entry_time,
                                                            float seconds) const {
    return render_with(a, exit_time, b, entry_time, seconds, effects_for(TransitionType::LowCutEchoSlam));
}

// ============================================================================
// Normalization
// ============================================================================

float TransitionRenderer::peak(const float* samples, size_t count) {
    float p = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        p = std::max(p, std::abs(samples[i]));
    }
    return p;
}

void TransitionRenderer::normalize_peak(std::vector<float>& samples) {
    float p = peak(samples.data(), samples.size());
    if (p <= 0.0f) return;

    float gain = 1.0f / p;
    for (auto& s : samples) {
        s *= gain;
    }
}

} // namespace segue
