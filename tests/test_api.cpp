/**
 * Segue Engine - Engine and C API Tests
 * End-to-end planning and rendering through Engine and the C interface
 */

#include "segue/segue.h"
#include "segue/types.h"
#include "../src/mixer/engine.h"

#include <iostream>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

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

static const float kMajorProfile[12] = {
    6.35f, 2.23f, 3.48f, 2.33f, 4.38f, 4.09f, 2.52f, 5.19f, 2.39f, 3.66f, 2.29f, 2.88f
};
static const float kMinorProfile[12] = {
    6.33f, 2.68f, 3.52f, 5.38f, 2.60f, 3.53f, 2.54f, 4.75f, 3.98f, 2.69f, 3.34f, 3.17f
};

std::vector<float> profile_chroma(int root, bool major) {
    const float* profile = major ? kMajorProfile : kMinorProfile;
    std::vector<float> chroma(12);
    for (int i = 0; i < 12; ++i) {
        chroma[(i + root) % 12] = profile[i];
    }
    return chroma;
}

std::vector<float> beat_grid(float bpm, float duration) {
    std::vector<float> beats;
    float period = 60.0f / bpm;
    for (int i = 0; i * period < duration; ++i) {
        beats.push_back(i * period);
    }
    return beats;
}

std::vector<EnergyPoint> flat_curve(float duration, float rms) {
    std::vector<EnergyPoint> curve;
    for (float t = 0.0f; t <= duration; t += 1.0f) {
        curve.push_back({t, rms});
    }
    return curve;
}

// A minor (8A), 120 BPM, 64s: intro | verse | chorus | outro
TrackPrimitives outgoing(float bpm = 120.0f) {
    TrackPrimitives p;
    p.sample_rate = kRate;
    p.bpm = bpm;
    p.duration = 64.0f;
    p.chroma = profile_chroma(9, false);
    p.segments = {
        {SegmentLabel::Intro, 0.0f, 8.0f},
        {SegmentLabel::Verse, 8.0f, 24.0f},
        {SegmentLabel::Chorus, 24.0f, 48.0f},
        {SegmentLabel::Outro, 48.0f, 64.0f},
    };
    p.beats = beat_grid(bpm, p.duration);
    p.energy_curve = flat_curve(p.duration, 0.5f);
    return p;
}

// C major (8B), 56s: intro | buildup | drop | outro
TrackPrimitives incoming(float bpm = 120.0f) {
    TrackPrimitives p;
    p.sample_rate = kRate;
    p.bpm = bpm;
    p.duration = 56.0f;
    p.chroma = profile_chroma(0, true);
    p.segments = {
        {SegmentLabel::Intro, 0.0f, 8.0f},
        {SegmentLabel::Buildup, 8.0f, 16.0f},
        {SegmentLabel::Drop, 16.0f, 40.0f},
        {SegmentLabel::Outro, 40.0f, 56.0f},
    };
    p.beats = beat_grid(bpm, p.duration);
    p.energy_curve = flat_curve(p.duration, 0.5f);
    return p;
}

AudioBuffer tone(float freq, float seconds) {
    AudioBuffer buf;
    buf.sample_rate = kRate;
    buf.channels = 2;
    size_t frames = static_cast<size_t>(seconds * kRate);
    buf.samples.resize(frames * 2);
    for (size_t i = 0; i < frames; ++i) {
        float v = 0.5f * std::sin(2.0f * static_cast<float>(M_PI) * freq * i / kRate);
        buf.samples[i * 2] = v;
        buf.samples[i * 2 + 1] = v;
    }
    return buf;
}

/* ============================================================================
 * Engine Tests
 * ============================================================================ */

TEST(engine_plans_chorus_into_intro) {
    Engine engine;
    auto a = engine.analyze(outgoing());
    auto b = engine.analyze(incoming());
    assert_true(a.ok() && b.ok(), "Both tracks analyze");

    auto r = engine.plan(a.value(), b.value());
    assert_true(r.ok(), "Plan succeeds");

    const auto& plan = r.value();
    assert_near(plan.exit_time, 48.0f, 1e-4f, "Exit at chorus end");
    assert_near(plan.entry_time, 0.0f, 1e-4f, "Entry at intro");
    assert_true(plan.exit_label == SegmentLabel::Chorus, "Exit label");
    assert_true(plan.entry_label == SegmentLabel::Intro, "Entry label");
    assert_true(plan.type == TransitionType::Crossfade, "Crossfade");
    assert_true(plan.duration_beats == 16, "16 beats");
    assert_near(plan.bpm_ref, 120.0f, 1e-6f, "Reference tempo is A's");
    assert_near(plan.duration_seconds(), 8.0f, 1e-4f, "16 beats at 120 BPM");
    assert_near(plan.phase_offset, 0.0f, 1e-4f, "Already in phase");
    assert_near(plan.compatibility.key_score, 0.9f, 1e-6f, "8A -> 8B");
    assert_true(plan.rule == "great_tempo_and_key", "Rule recorded");
}

TEST(engine_renders_plan) {
    Engine engine;
    auto a = engine.analyze(outgoing());
    auto b = engine.analyze(incoming());
    auto plan = engine.plan(a.value(), b.value());
    assert_true(plan.ok(), "Plan succeeds");

    auto r = engine.render(plan.value(), tone(220.0f, 64.0f), tone(330.0f, 56.0f));
    assert_true(r.ok(), "Render succeeds");
    // 48s of A, 8s overlap, 48s of B
    assert_true(r.value().frame_count() == static_cast<size_t>(104 * kRate), "Output length");
}

TEST(engine_time_stretch_render) {
    TransitionConfig config;
    config.render.time_stretch = true;
    Engine engine(config);

    auto a = engine.analyze(outgoing());
    auto b = engine.analyze(incoming(125.0f));
    auto plan = engine.plan(a.value(), b.value());
    assert_true(plan.ok(), "Plan succeeds");
    assert_true(plan.value().compatibility.stretch_safe, "4% stretch is safe");

    auto r = engine.render(plan.value(), tone(220.0f, 64.0f), tone(330.0f, 56.0f));
    assert_true(r.ok(), "Render succeeds");

    // B slowed to 120 BPM: 56s * 125/120
    float expected = (48.0f + 56.0f * 125.0f / 120.0f) * kRate;
    assert_near(static_cast<float>(r.value().frame_count()), expected, 0.02f * expected, "Stretched B tail");
}

TEST(engine_rejects_incompatible_when_asked) {
    Engine lenient;
    auto a = lenient.analyze(outgoing(100.0f));
    auto b = lenient.analyze(incoming(140.0f));
    assert_true(a.ok() && b.ok(), "Both tracks analyze");

    auto planned = lenient.plan(a.value(), b.value());
    assert_true(planned.ok(), "Incompatible pair still planned by default");
    assert_true(!planned.value().compatibility.tempo_compatible, "Flagged incompatible");

    TransitionConfig config;
    config.reject_incompatible = true;
    Engine strict(config);
    auto rejected = strict.plan(a.value(), b.value());
    assert_true(rejected.failed(), "Strict engine refuses");
    assert_true(rejected.code() == ErrorCode::IncompatiblePair, "IncompatiblePair");
}

TEST(engine_batch_isolates_failures) {
    Engine engine;
    auto a = engine.analyze(outgoing());
    auto b = engine.analyze(incoming());

    TrackAnalysis broken = b.value();
    broken.bpm = 0.0f;

    std::vector<TrackAnalysis> tracks = {a.value(), b.value(), broken};
    std::vector<TrackPair> pairs = {{0, 1}, {0, 2}, {1, 0}, {0, 7}};

    auto results = engine.plan_batch(tracks, pairs);
    assert_true(results.size() == 4, "One result per pair");
    assert_true(results[0].ok(), "Good pair planned");
    assert_true(results[1].failed() && results[1].code() == ErrorCode::InvalidArgument, "Zero tempo fails alone");
    assert_true(results[2].ok(), "Later pair unaffected");
    assert_true(results[3].failed() && results[3].code() == ErrorCode::InvalidArgument, "Out of range");
}

TEST(engine_log_callback) {
    Engine engine;
    std::vector<std::string> lines;
    engine.set_log_callback([&lines](LogLevel, const std::string& message) {
        lines.push_back(message);
    });

    auto a = engine.analyze(outgoing(100.0f));
    auto b = engine.analyze(incoming(140.0f));
    auto plan = engine.plan(a.value(), b.value());
    assert_true(plan.ok(), "Plan succeeds");

    bool warned = false;
    bool planned = false;
    bool advised = false;
    for (const auto& line : lines) {
        if (line.rfind("[Engine] Tempo delta", 0) == 0) warned = true;
        if (line.rfind("[Engine] Plan:", 0) == 0) {
            planned = true;
            // 8A -> 8B scores 0.9
            advised = line.find(CamelotCompatibility::advice(0.9f)) != std::string::npos;
        }
    }
    assert_true(warned, "Tempo warning forwarded");
    assert_true(planned, "Plan summary forwarded");
    assert_true(advised, "Mixing advice in the plan summary");
}

TEST(engine_from_provider) {
    MemoryProvider provider;
    provider.add_track("a", outgoing());
    Engine engine;

    auto ok = engine.analyze(provider, "a");
    assert_true(ok.ok(), "Known track");
    assert_true(ok.value().key.has_value(), "Key estimated");

    auto missing = engine.analyze(provider, "nope");
    assert_true(missing.failed(), "Unknown track fails");
}

/* ============================================================================
 * C API Tests
 * ============================================================================ */

struct TrackInputData {
    std::vector<SegueSegment> segments;
    std::vector<SegueEnergyPoint> energy;
    std::vector<float> beats;
    SegueTrackInput input;
};

void fill_input(const TrackPrimitives& p, TrackInputData& data) {
    for (const auto& s : p.segments) {
        data.segments.push_back({static_cast<SegueSegmentLabel>(s.label), s.start, s.end});
    }
    for (const auto& e : p.energy_curve) {
        data.energy.push_back({e.time, e.rms});
    }
    data.beats = p.beats;

    std::memset(&data.input, 0, sizeof(data.input));
    data.input.sample_rate = p.sample_rate;
    data.input.bpm = p.bpm;
    data.input.duration = p.duration;
    for (int i = 0; i < 12; ++i) {
        data.input.chroma[i] = p.chroma[i];
    }
    data.input.segments = data.segments.data();
    data.input.segment_count = data.segments.size();
    data.input.beats = data.beats.data();
    data.input.beat_count = data.beats.size();
    data.input.energy = data.energy.data();
    data.input.energy_count = data.energy.size();
}

TEST(c_api_key_score) {
    float score = -1.0f;
    assert_true(segue_key_score("8A", "9A", &score) == SEGUE_OK, "Valid codes");
    assert_near(score, 0.8f, 1e-6f, "Adjacent number, same mode");

    assert_true(segue_key_score("13A", "9A", &score) == SEGUE_ERROR_INVALID_KEY_CODE, "Out of range");
    assert_true(segue_key_score("8C", "9A", &score) == SEGUE_ERROR_INVALID_KEY_CODE, "Bad letter");
    assert_true(segue_key_score(nullptr, "9A", &score) == SEGUE_ERROR_INVALID_ARGUMENT, "Null code");
}

TEST(c_api_segment_labels) {
    SegueSegmentLabel label = SEGUE_SEGMENT_INTRO;
    assert_true(segue_parse_segment_label("Pre-Chorus", &label) == SEGUE_OK, "Hyphenated label");
    assert_true(label == SEGUE_SEGMENT_PRECHORUS, "Pre-chorus");
    assert_true(segue_parse_segment_label("breakdown", &label) == SEGUE_OK, "Alias");
    assert_true(label == SEGUE_SEGMENT_BREAK, "Breakdown is a break");

    assert_true(segue_parse_segment_label("bridge", &label) == SEGUE_ERROR_INVALID_ARGUMENT, "Unknown label");
    assert_true(label == SEGUE_SEGMENT_BREAK, "Unknown label leaves the output alone");
    assert_true(segue_parse_segment_label(nullptr, &label) == SEGUE_ERROR_INVALID_ARGUMENT, "Null name");
}

TEST(c_api_hype_preset) {
    SegueTransitionConfig smooth;
    SegueTransitionConfig hype;
    segue_get_default_config(&smooth);
    segue_get_preset_config(SEGUE_STRATEGY_HYPE, &hype);

    assert_true(smooth.strategy == SEGUE_STRATEGY_SMOOTH, "Default is smooth");
    assert_true(hype.strategy == SEGUE_STRATEGY_HYPE, "Hype strategy");
    assert_near(hype.weight_exit, 1.0f, 1e-6f, "Exit weight");
    assert_near(hype.weight_entry, 1.5f, 1e-6f, "Entries favoured");
    assert_near(hype.weight_energy, 0.0f, 1e-6f, "Energy jumps ignored");
    assert_near(hype.weight_stretch, 1.0f, 1e-6f, "Stretch weight");
    assert_near(hype.max_bpm_delta, smooth.max_bpm_delta, 1e-6f, "Tempo limits shared");

    SegueEngine* engine = segue_create();
    assert_true(segue_set_config(engine, &hype) == SEGUE_OK, "Hype preset accepted");
    segue_destroy(engine);
}

TEST(c_api_plan_and_render) {
    SegueEngine* engine = segue_create();
    assert_true(engine != nullptr, "Engine created");

    TrackInputData a, b;
    fill_input(outgoing(), a);
    fill_input(incoming(), b);

    SegueTransitionPlan plan;
    SegueError err = segue_plan_transition(engine, &a.input, &b.input, &plan);
    assert_true(err == SEGUE_OK, "Plan succeeds");
    assert_near(plan.exit_time, 48.0f, 1e-4f, "Exit");
    assert_near(plan.entry_time, 0.0f, 1e-4f, "Entry");
    assert_true(plan.type == SEGUE_TRANSITION_CROSSFADE, "Crossfade");
    assert_true(plan.duration_beats == 16, "16 beats");
    assert_true(plan.key_compatible == 1, "Keys compatible");
    assert_true(std::strcmp(plan.rule, "great_tempo_and_key") == 0, "Rule name copied");

    AudioBuffer a_audio = tone(220.0f, 64.0f);
    AudioBuffer b_audio = tone(330.0f, 56.0f);
    SegueAudioBuffer a_buf = {a_audio.samples.data(), a_audio.frame_count(), kRate, 2};
    SegueAudioBuffer b_buf = {b_audio.samples.data(), b_audio.frame_count(), kRate, 2};
    SegueAudioBuffer out = {nullptr, 0, 0, 0};

    err = segue_render_transition(engine, &plan, &a_buf, &b_buf, &out);
    assert_true(err == SEGUE_OK, "Render succeeds");
    assert_true(out.samples != nullptr, "Output allocated");
    assert_true(out.frame_count == static_cast<size_t>(104 * kRate), "Output length");
    assert_true(out.channels == 2 && out.sample_rate == kRate, "Output format");

    segue_free_buffer(&out);
    assert_true(out.samples == nullptr && out.frame_count == 0, "Buffer released");

    segue_destroy(engine);
}

TEST(c_api_errors) {
    SegueEngine* engine = segue_create();

    TrackInputData a, b;
    fill_input(outgoing(), a);
    fill_input(incoming(), b);
    b.input.bpm = 0.0f;

    SegueTransitionPlan plan;
    SegueError err = segue_plan_transition(engine, &a.input, &b.input, &plan);
    assert_true(err == SEGUE_ERROR_ANALYSIS_FAILED, "Zero tempo rejected by analysis");
    assert_true(std::string(segue_get_error(engine)).rfind("AnalysisError", 0) == 0, "Error message kept");

    b.input.bpm = 120.0f;
    b.input.segments = nullptr;
    err = segue_plan_transition(engine, &a.input, &b.input, &plan);
    assert_true(err == SEGUE_ERROR_INVALID_ARGUMENT, "Dangling segment count");

    SegueTransitionConfig config;
    segue_get_default_config(&config);
    assert_near(config.max_bpm_delta, 15.0f, 1e-6f, "Default hard limit");
    assert_near(config.weight_stretch, 2.0f, 1e-6f, "Default w4");
    config.max_bpm_delta = 0.0f;
    assert_true(segue_set_config(engine, &config) == SEGUE_ERROR_INVALID_ARGUMENT, "Zero limit rejected");

    segue_destroy(engine);
}

TEST(c_api_reject_incompatible) {
    SegueEngine* engine = segue_create();

    SegueTransitionConfig config;
    segue_get_default_config(&config);
    config.reject_incompatible = 1;
    assert_true(segue_set_config(engine, &config) == SEGUE_OK, "Config applied");

    TrackInputData a, b;
    fill_input(outgoing(100.0f), a);
    fill_input(incoming(140.0f), b);

    SegueTransitionPlan plan;
    SegueError err = segue_plan_transition(engine, &a.input, &b.input, &plan);
    assert_true(err == SEGUE_ERROR_INCOMPATIBLE_PAIR, "Tempo too far apart");

    segue_destroy(engine);
}

int main() {
    std::cout << "======================================\n";
    std::cout << "Segue Engine - Engine and C API Tests\n";
    std::cout << "======================================\n\n";

    std::cout << "--- Engine ---\n";
    RUN_TEST(engine_plans_chorus_into_intro);
    RUN_TEST(engine_renders_plan);
    RUN_TEST(engine_time_stretch_render);
    RUN_TEST(engine_rejects_incompatible_when_asked);
    RUN_TEST(engine_batch_isolates_failures);
    RUN_TEST(engine_log_callback);
    RUN_TEST(engine_from_provider);

    std::cout << "\n--- C API ---\n";
    RUN_TEST(c_api_key_score);
    RUN_TEST(c_api_segment_labels);
    RUN_TEST(c_api_hype_preset);
    RUN_TEST(c_api_plan_and_render);
    RUN_TEST(c_api_errors);
    RUN_TEST(c_api_reject_incompatible);

    std::cout << "\n======================================\n";
    if (failed_tests == 0) {
        std::cout << "All tests passed!\n";
        return 0;
    } else {
        std::cout << failed_tests << " test(s) failed.\n";
        return 1;
    }
}
