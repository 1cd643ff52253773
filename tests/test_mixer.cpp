/**
 * Segue Engine - Mixer Tests
 * Tests for Mixer module: Crossfader, filters, TransitionRenderer, TempoMatcher
 */

#include "segue/types.h"
#include "../src/analyzer/energy_curve.h"
#include "../src/mixer/crossfader.h"
#include "../src/mixer/filters.h"
#include "../src/mixer/renderer.h"
#include "../src/mixer/tempo_matcher.h"

#include <iostream>
#include <cmath>
#include <stdexcept>

using namespace segue;

/* ============================================================================
 * Test Utilities
 * ============================================================================ */

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Test: " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failed_tests++; \
    } \
} while(0)

static int failed_tests = 0;

void assert_near(float actual, float expected, float tolerance, const char* msg = "") {
    if (std::abs(actual - expected) > tolerance) {
        throw std::runtime_error(std::string(msg) +
            " Expected: " + std::to_string(expected) +
            ", Actual: " + std::to_string(actual));
    }
}

void assert_true(bool condition, const char* msg = "") {
    if (!condition) {
        throw std::runtime_error(std::string("Assertion failed: ") + msg);
    }
}

/* ============================================================================
 * Test Data Helpers
 * ============================================================================ */

static const int kRate = 8000;

// Sine at `freq` Hz, same signal on every channel
AudioBuffer sine(float freq, float seconds, float amplitude = 0.5f, int channels = 2, int rate = kRate) {
    AudioBuffer buf;
    buf.sample_rate = rate;
    buf.channels = channels;
    size_t frames = static_cast<size_t>(seconds * rate);
    buf.samples.resize(frames * channels);
    for (size_t i = 0; i < frames; ++i) {
        float v = amplitude * std::sin(2.0f * static_cast<float>(M_PI) * freq * i / rate);
        for (int ch = 0; ch < channels; ++ch) {
            buf.samples[i * channels + ch] = v;
        }
    }
    return buf;
}

TransitionPlan make_plan(float exit, float entry, TransitionType type, int beats = 16, float bpm = 120.0f) {
    TransitionPlan plan;
    plan.exit_time = exit;
    plan.entry_time = entry;
    plan.type = type;
    plan.duration_beats = beats;
    plan.bpm_ref = bpm;
    return plan;
}

/* ============================================================================
 * Crossfader Tests
 * ============================================================================ */

TEST(crossfader_equal_power_curve) {
    Crossfader fader;
    float out, in;

    fader.gains(0.0f, out, in);
    assert_near(out, 1.0f, 1e-6f, "Start: outgoing only");
    assert_near(in, 0.0f, 1e-6f, "Start: incoming silent");

    fader.gains(1.0f, out, in);
    assert_near(out, 0.0f, 1e-6f, "End: outgoing silent");
    assert_near(in, 1.0f, 1e-6f, "End: incoming only");

    for (float t = 0.0f; t <= 1.0f; t += 0.1f) {
        fader.gains(t, out, in);
        assert_near(out * out + in * in, 1.0f, 1e-5f, "Constant power");
    }
}

TEST(crossfader_linear_curve) {
    Crossfader fader(Crossfader::CurveType::Linear);
    float out, in;
    fader.gains(0.25f, out, in);
    assert_near(out, 0.75f, 1e-6f, "Linear outgoing");
    assert_near(in, 0.25f, 1e-6f, "Linear incoming");
}

TEST(crossfader_position_endpoints) {
    assert_near(Crossfader::position(0, 100), 0.0f, 1e-6f, "First frame at 0");
    assert_near(Crossfader::position(99, 100), 1.0f, 1e-6f, "Last frame at 1");
}

/* ============================================================================
 * Filter Tests
 * ============================================================================ */

TEST(high_pass_removes_bass) {
    auto low = sine(50.0f, 2.0f, 0.5f, 1);
    float before = EnergyCurve::compute_rms(low.samples.data() + kRate, kRate);

    HighPassFilter filter(static_cast<float>(kRate), 200.0f, 1);
    filter.process(low.samples.data(), low.frame_count());

    // Skip the first second while the filter settles
    float after = EnergyCurve::compute_rms(low.samples.data() + kRate, kRate);
    assert_true(after < 0.05f * before, "50 Hz is removed by a 200 Hz high-pass");
}

TEST(high_pass_keeps_highs) {
    auto high = sine(2000.0f, 2.0f, 0.5f, 2);
    float before = EnergyCurve::compute_rms(high.samples.data() + 2 * kRate, 2 * kRate);

    HighPassFilter filter(static_cast<float>(kRate), 200.0f, 2);
    filter.process(high.samples.data(), high.frame_count());

    float after = EnergyCurve::compute_rms(high.samples.data() + 2 * kRate, 2 * kRate);
    assert_near(after, before, 0.05f * before, "2 kHz passes");
}

TEST(high_pass_reset_clears_state) {
    auto tone = sine(300.0f, 0.5f, 0.5f, 1);
    std::vector<float> first = tone.samples;
    std::vector<float> second = tone.samples;

    HighPassFilter filter(static_cast<float>(kRate), 200.0f, 1);
    filter.process(first.data(), tone.frame_count());
    filter.reset();
    filter.process(second.data(), tone.frame_count());

    for (size_t i = 0; i < first.size(); i += 997) {
        assert_near(second[i], first[i], 1e-6f, "Reset filter repeats its output");
    }
}

TEST(echo_single_tap) {
    std::vector<float> impulse(200, 0.0f);
    impulse[0] = 1.0f;

    apply_echo(impulse.data(), impulse.size(), 1, 100, 0.3f, 0.4f);
    assert_near(impulse[0], 1.0f, 1e-6f, "Dry signal kept");
    assert_near(impulse[30], 0.4f, 1e-6f, "Echo after 0.3s at decay 0.4");
    assert_near(impulse[60], 0.0f, 1e-6f, "Single tap, no feedback");
}

/* ============================================================================
 * TransitionRenderer Tests
 * ============================================================================ */

TEST(render_crossfade_layout) {
    auto a = sine(220.0f, 20.0f);
    auto b = sine(330.0f, 20.0f);
    TransitionRenderer renderer;

    // 16 beats at 120 BPM = 8s
    auto r = renderer.render(make_plan(10.0f, 2.0f, TransitionType::Crossfade), a, b);
    assert_true(r.ok(), "Render succeeds");

    const auto& out = r.value();
    size_t expected = 10 * kRate + 8 * kRate + (20 - 2 - 8) * kRate;
    assert_true(out.frame_count() == expected, "A head + window + B tail");
    assert_true(out.channels == 2 && out.sample_rate == kRate, "Format kept");

    float peak = TransitionRenderer::peak(out.samples.data(), out.samples.size());
    assert_near(peak, 1.0f, 1e-5f, "Peak-normalized");
}

TEST(render_overlap_bounded_by_input_peaks) {
    auto a = sine(220.0f, 20.0f, 0.7f);
    auto b = sine(331.0f, 20.0f, 0.4f);
    TransitionRenderer renderer;

    auto window = renderer.locate(a, 10.0f, b, 2.0f, 8.0f);
    assert_true(window.ok(), "Window fits");

    auto mixed = renderer.mix_window(a, b, window.value(), renderer.effects_for(TransitionType::Crossfade));
    float peak_a = TransitionRenderer::peak(a.samples.data(), a.samples.size());
    float peak_b = TransitionRenderer::peak(b.samples.data(), b.samples.size());
    float peak_mix = TransitionRenderer::peak(mixed.data(), mixed.size());
    assert_true(peak_mix <= peak_a + peak_b + 1e-5f, "Overlap never exceeds the summed input peaks");
}

TEST(render_deterministic) {
    auto a = sine(220.0f, 20.0f);
    auto b = sine(330.0f, 20.0f);
    TransitionRenderer renderer;
    auto plan = make_plan(8.0f, 0.0f, TransitionType::LowCutEchoSlam, 4);

    auto first = renderer.render(plan, a, b);
    auto second = renderer.render(plan, a, b);
    assert_true(first.ok() && second.ok(), "Both renders succeed");
    assert_true(first.value().samples == second.value().samples, "Identical output");
}

TEST(render_silence_stays_silent) {
    AudioBuffer a;
    a.sample_rate = kRate;
    a.channels = 1;
    a.samples.assign(10 * kRate, 0.0f);
    AudioBuffer b = a;

    TransitionRenderer renderer;
    auto r = renderer.render(make_plan(2.0f, 0.0f, TransitionType::ReverbTail, 8), a, b);
    assert_true(r.ok(), "Silent render succeeds");
    for (float s : r.value().samples) {
        assert_true(s == 0.0f, "No gain applied to silence");
    }
}

TEST(render_low_cut_removes_bass_late_in_window) {
    auto a = sine(50.0f, 20.0f, 0.5f, 1);
    AudioBuffer b;
    b.sample_rate = kRate;
    b.channels = 1;
    b.samples.assign(20 * kRate, 0.0f);

    TransitionRenderer renderer;
    auto window = renderer.locate(a, 4.0f, b, 0.0f, 8.0f);
    assert_true(window.ok(), "Window fits");

    TailEffects filter_only;
    filter_only.low_cut = true;
    auto filtered = renderer.mix_window(a, b, window.value(), filter_only);
    auto dry = renderer.mix_window(a, b, window.value(), TailEffects());

    // Step 6 of 8 (cutoff 150 Hz) lies in [6s, 7s) of the window
    size_t start = 6 * kRate + kRate / 4;
    float rms_filtered = EnergyCurve::compute_rms(filtered.data() + start, kRate / 2);
    float rms_dry = EnergyCurve::compute_rms(dry.data() + start, kRate / 2);
    assert_true(rms_filtered < 0.2f * rms_dry, "Bass cut in the late steps");

    // Step 0 (cutoff 0 Hz) passes dry
    float early_filtered = EnergyCurve::compute_rms(filtered.data(), kRate / 2);
    float early_dry = EnergyCurve::compute_rms(dry.data(), kRate / 2);
    assert_near(early_filtered, early_dry, 1e-6f, "No filtering before 20 Hz");
}

TEST(render_style_effects) {
    TransitionRenderer renderer;

    auto cf = renderer.effects_for(TransitionType::Crossfade);
    assert_true(!cf.low_cut && !cf.echo, "Crossfade is clean");

    auto slam = renderer.effects_for(TransitionType::LowCutEchoSlam);
    assert_true(slam.low_cut && slam.echo, "Slam filters and echoes");
    assert_near(slam.echo_decay, 0.4f, 1e-6f, "Slam echo decay");

    auto filter = renderer.effects_for(TransitionType::LowCutFilter);
    assert_true(filter.low_cut && !filter.echo, "Filter only");

    auto tail = renderer.effects_for(TransitionType::ReverbTail);
    assert_true(!tail.low_cut && tail.echo, "Echo only");
    assert_near(tail.echo_decay, 0.6f, 1e-6f, "Longer tail");
}

TEST(render_applies_phase_offset) {
    auto a = sine(220.0f, 20.0f);
    auto b = sine(330.0f, 20.0f);
    TransitionRenderer renderer;

    auto plan = make_plan(10.0f, 1.0f, TransitionType::Crossfade);
    plan.phase_offset = 0.5f;
    auto shifted = renderer.render(plan, a, b);
    assert_true(shifted.ok(), "Render succeeds");
    size_t expected = 10 * kRate + 8 * kRate + static_cast<size_t>((20.0f - 1.5f - 8.0f) * kRate);
    assert_true(shifted.value().frame_count() == expected, "B read from entry + offset");

    plan.phase_offset = -3.0f;
    auto clamped = renderer.render(plan, a, b);
    assert_true(clamped.ok(), "Negative start clamps to 0");
    assert_true(clamped.value().frame_count() == static_cast<size_t>(10 + 8 + 12) * kRate, "Clamped at 0");

    RenderConfig no_offset;
    no_offset.apply_phase_offset = false;
    TransitionRenderer plain(no_offset);
    plan.phase_offset = 0.5f;
    auto unshifted = plain.render(plan, a, b);
    assert_true(unshifted.ok(), "Render succeeds");
    assert_true(unshifted.value().frame_count() == static_cast<size_t>(10 + 8 + 11) * kRate, "Offset ignored");
}

TEST(render_errors) {
    auto a = sine(220.0f, 10.0f);
    auto b = sine(330.0f, 10.0f);
    TransitionRenderer renderer;

    auto past_a = renderer.render(make_plan(5.0f, 0.0f, TransitionType::Crossfade), a, b);
    assert_true(past_a.failed() && past_a.code() == ErrorCode::RenderError, "Window past A's end");

    auto past_b = renderer.render(make_plan(0.0f, 5.0f, TransitionType::Crossfade), a, b);
    assert_true(past_b.failed() && past_b.code() == ErrorCode::RenderError, "Window past B's end");

    auto other_rate = sine(330.0f, 10.0f, 0.5f, 2, 16000);
    auto rate = renderer.render(make_plan(0.0f, 0.0f, TransitionType::Crossfade, 4), a, other_rate);
    assert_true(rate.failed() && rate.code() == ErrorCode::RenderError, "Sample rate mismatch");

    auto mono = sine(330.0f, 10.0f, 0.5f, 1);
    auto ch = renderer.render(make_plan(0.0f, 0.0f, TransitionType::Crossfade, 4), a, mono);
    assert_true(ch.failed() && ch.code() == ErrorCode::RenderError, "Channel mismatch");

    AudioBuffer empty;
    auto e = renderer.render(make_plan(0.0f, 0.0f, TransitionType::Crossfade, 4), a, empty);
    assert_true(e.failed() && e.code() == ErrorCode::RenderError, "Empty buffer");

    auto no_tempo = renderer.render(make_plan(0.0f, 0.0f, TransitionType::Crossfade, 4, 0.0f), a, b);
    assert_true(no_tempo.failed() && no_tempo.code() == ErrorCode::RenderError, "Zero reference tempo");

    auto no_beats = renderer.render(make_plan(0.0f, 0.0f, TransitionType::Crossfade, 0), a, b);
    assert_true(no_beats.failed() && no_beats.code() == ErrorCode::RenderError, "Zero beats");
}

TEST(render_direct_entry_points) {
    auto a = sine(220.0f, 12.0f);
    auto b = sine(330.0f, 12.0f);
    TransitionRenderer renderer;

    auto cf = renderer.render_crossfade(a, 4.0f, b, 0.0f, 8.0f);
    assert_true(cf.ok(), "Crossfade succeeds");
    auto slam = renderer.render_low_cut_echo(a, 4.0f, b, 0.0f, 8.0f);
    assert_true(slam.ok(), "Low-cut echo succeeds");
    assert_true(cf.value().frame_count() == slam.value().frame_count(), "Same layout");
    assert_true(cf.value().samples != slam.value().samples, "Different processing");
}

/* ============================================================================
 * TempoMatcher Tests
 * ============================================================================ */

TEST(tempo_matcher_ratio) {
    assert_near(static_cast<float>(TempoMatcher::time_ratio(120.0f, 120.0f)), 1.0f, 1e-6f, "Same tempo");
    assert_near(static_cast<float>(TempoMatcher::time_ratio(120.0f, 125.0f)), 0.96f, 1e-6f, "Speed up B");
    assert_true(TempoMatcher::is_identity(1.0005), "Within 0.1%");
    assert_true(!TempoMatcher::is_identity(1.01), "Outside 0.1%");
}

TEST(tempo_matcher_identity) {
    auto buf = sine(440.0f, 1.0f);
    TempoMatcher matcher;

    auto r = matcher.stretch(buf, 1.0005);
    assert_true(r.ok(), "Identity stretch succeeds");
    assert_true(r.value().samples == buf.samples, "Buffer unchanged");
}

TEST(tempo_matcher_invalid) {
    TempoMatcher matcher;
    auto buf = sine(440.0f, 1.0f);

    auto zero = matcher.stretch(buf, 0.0);
    assert_true(zero.failed() && zero.code() == ErrorCode::InvalidArgument, "Zero ratio");

    auto empty = matcher.stretch(AudioBuffer(), 1.2);
    assert_true(empty.failed() && empty.code() == ErrorCode::InvalidArgument, "Empty buffer");
}

TEST(tempo_matcher_stretches_length) {
    auto buf = sine(440.0f, 2.0f);
    TempoMatcher matcher;

    auto r = matcher.stretch(buf, 1.5);
    assert_true(r.ok(), "Stretch succeeds");
    assert_true(r.value().channels == 2, "Channels kept");

    float expected = 1.5f * buf.frame_count();
    assert_near(static_cast<float>(r.value().frame_count()), expected, 0.05f * expected, "1.5x length");
}

int main() {
    std::cout << "======================================\n";
    std::cout << "Segue Engine - Mixer Tests\n";
    std::cout << "======================================\n\n";

    std::cout << "--- Crossfader ---\n";
    RUN_TEST(crossfader_equal_power_curve);
    RUN_TEST(crossfader_linear_curve);
    RUN_TEST(crossfader_position_endpoints);

    std::cout << "\n--- Filters ---\n";
    RUN_TEST(high_pass_removes_bass);
    RUN_TEST(high_pass_keeps_highs);
    RUN_TEST(high_pass_reset_clears_state);
    RUN_TEST(echo_single_tap);

    std::cout << "\n--- TransitionRenderer ---\n";
    RUN_TEST(render_crossfade_layout);
    RUN_TEST(render_overlap_bounded_by_input_peaks);
    RUN_TEST(render_deterministic);
    RUN_TEST(render_silence_stays_silent);
    RUN_TEST(render_low_cut_removes_bass_late_in_window);
    RUN_TEST(render_style_effects);
    RUN_TEST(render_applies_phase_offset);
    RUN_TEST(render_errors);
    RUN_TEST(render_direct_entry_points);

    std::cout << "\n--- TempoMatcher ---\n";
    RUN_TEST(tempo_matcher_ratio);
    RUN_TEST(tempo_matcher_identity);
    RUN_TEST(tempo_matcher_invalid);
    RUN_TEST(tempo_matcher_stretches_length);

    std::cout << "\n======================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    } else {
        std::cout << failed_tests << " test(s) failed.\n";
        return 1;
    }
}
