/**
 * Segue Engine - C API Implementation
 */

#include "segue/segue.h"
#include "../mixer/engine.h"
#include <cstdlib>
#include <cstring>
#include <new>

using namespace segue;

/* ============================================================================
 * Internal Structures
 * ============================================================================ */

struct SegueEngine {
    std::unique_ptr<Engine> engine;
    std::string last_error;
};

static SegueError to_api_error(ErrorCode code) {
    switch (code) {
        case ErrorCode::AnalysisError:    return SEGUE_ERROR_ANALYSIS_FAILED;
        case ErrorCode::InvalidKeyCode:   return SEGUE_ERROR_INVALID_KEY_CODE;
        case ErrorCode::IncompatiblePair: return SEGUE_ERROR_INCOMPATIBLE_PAIR;
        case ErrorCode::RenderError:      return SEGUE_ERROR_RENDER_FAILED;
        case ErrorCode::InvalidArgument:  return SEGUE_ERROR_INVALID_ARGUMENT;
    }
    return SEGUE_ERROR_INVALID_ARGUMENT;
}

template<typename T>
static SegueError fail(SegueEngine* engine, const Result<T>& result) {
    engine->last_error = std::string(error_code_name(result.code())) + ": " + result.error();
    return to_api_error(result.code());
}

static TrackPrimitives to_primitives(const SegueTrackInput& in) {
    TrackPrimitives p;
    p.sample_rate = in.sample_rate;
    p.bpm = in.bpm;
    p.duration = in.duration;
    p.chroma.assign(in.chroma, in.chroma + 12);

    if (in.segments) {
        for (size_t i = 0; i < in.segment_count; ++i) {
            Segment s;
            s.label = static_cast<SegmentLabel>(in.segments[i].label);
            s.start = in.segments[i].start;
            s.end = in.segments[i].end;
            p.segments.push_back(s);
        }
    }
    if (in.beats) {
        p.beats.assign(in.beats, in.beats + in.beat_count);
    }
    if (in.energy) {
        for (size_t i = 0; i < in.energy_count; ++i) {
            p.energy_curve.push_back({in.energy[i].time, in.energy[i].rms});
        }
    }
    return p;
}

static bool valid_label(int label) {
    return label >= SEGUE_SEGMENT_INTRO && label <= SEGUE_SEGMENT_OUTRO;
}

static bool valid_input(const SegueTrackInput& in) {
    if (in.segment_count > 0 && !in.segments) return false;
    if (in.beat_count > 0 && !in.beats) return false;
    if (in.energy_count > 0 && !in.energy) return false;
    for (size_t i = 0; i < in.segment_count; ++i) {
        if (!valid_label(in.segments[i].label)) return false;
    }
    return true;
}

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

SegueEngine* segue_create(void) {
    auto handle = new (std::nothrow) SegueEngine();
    if (!handle) return nullptr;

    handle->engine = std::make_unique<Engine>();
    return handle;
}

void segue_destroy(SegueEngine* engine) {
    delete engine;
}

const char* segue_get_error(SegueEngine* engine) {
    if (!engine) return "Invalid engine";
    return engine->last_error.c_str();
}

void segue_set_log_callback(SegueEngine* engine, SegueLogCallback callback, void* user_data) {
    if (!engine || !engine->engine) return;

    if (!callback) {
        engine->engine->set_log_callback(nullptr);
        return;
    }

    engine->engine->set_log_callback([callback, user_data](LogLevel level, const std::string& message) {
        callback(static_cast<SegueLogLevel>(level), message.c_str(), user_data);
    });
}

/* ============================================================================
 * Configuration
 * ============================================================================ */

void segue_get_default_config(SegueTransitionConfig* config) {
    segue_get_preset_config(SEGUE_STRATEGY_SMOOTH, config);
}

void segue_get_preset_config(SegueSearchStrategy strategy, SegueTransitionConfig* config) {
    if (!config) return;

    bool hype = strategy == SEGUE_STRATEGY_HYPE;
    TransitionConfig defaults = TransitionConfig::for_strategy(hype ? SearchStrategy::Hype
                                                                     : SearchStrategy::Smooth);
    config->max_bpm_delta = defaults.tempo.max_bpm_delta;
    config->safe_stretch = defaults.tempo.safe_stretch;
    config->strategy = hype ? SEGUE_STRATEGY_HYPE : SEGUE_STRATEGY_SMOOTH;
    config->weight_exit = defaults.weights.exit;
    config->weight_entry = defaults.weights.entry;
    config->weight_energy = defaults.weights.energy;
    config->weight_stretch = defaults.weights.stretch;
    config->equal_power = defaults.render.equal_power ? 1 : 0;
    config->apply_phase_offset = defaults.render.apply_phase_offset ? 1 : 0;
    config->time_stretch = defaults.render.time_stretch ? 1 : 0;
    config->reject_incompatible = defaults.reject_incompatible ? 1 : 0;
}

SegueError segue_set_config(SegueEngine* engine, const SegueTransitionConfig* config) {
    if (!engine || !engine->engine || !config) return SEGUE_ERROR_INVALID_ARGUMENT;

    if (!(config->max_bpm_delta > 0.0f) || !(config->safe_stretch >= 0.0f)) {
        engine->last_error = "Tempo limits must be positive";
        return SEGUE_ERROR_INVALID_ARGUMENT;
    }

    TransitionConfig cfg = engine->engine->config();
    cfg.tempo.max_bpm_delta = config->max_bpm_delta;
    cfg.tempo.safe_stretch = config->safe_stretch;
    cfg.thresholds.safe_stretch = config->safe_stretch;
    cfg.strategy = config->strategy == SEGUE_STRATEGY_HYPE ? SearchStrategy::Hype : SearchStrategy::Smooth;
    cfg.weights.exit = config->weight_exit;
    cfg.weights.entry = config->weight_entry;
    cfg.weights.energy = config->weight_energy;
    cfg.weights.stretch = config->weight_stretch;
    cfg.render.equal_power = config->equal_power != 0;
    cfg.render.apply_phase_offset = config->apply_phase_offset != 0;
    cfg.render.time_stretch = config->time_stretch != 0;
    cfg.reject_incompatible = config->reject_incompatible != 0;

    engine->engine->set_config(cfg);
    return SEGUE_OK;
}

/* ============================================================================
 * Planning
 * ============================================================================ */

SegueError segue_plan_transition(
    SegueEngine* engine,
    const SegueTrackInput* track_a,
    const SegueTrackInput* track_b,
    SegueTransitionPlan* plan
) {
    if (!engine || !engine->engine || !track_a || !track_b || !plan) {
        return SEGUE_ERROR_INVALID_ARGUMENT;
    }
    if (!valid_input(*track_a) || !valid_input(*track_b)) {
        engine->last_error = "Malformed track input";
        return SEGUE_ERROR_INVALID_ARGUMENT;
    }

    auto a = engine->engine->analyze(to_primitives(*track_a));
    if (a.failed()) return fail(engine, a);

    auto b = engine->engine->analyze(to_primitives(*track_b));
    if (b.failed()) return fail(engine, b);

    auto result = engine->engine->plan(a.value(), b.value());
    if (result.failed()) return fail(engine, result);

    const auto& p = result.value();
    std::memset(plan, 0, sizeof(*plan));
    plan->exit_time = p.exit_time;
    plan->entry_time = p.entry_time;
    plan->type = static_cast<SegueTransitionType>(p.type);
    plan->duration_beats = p.duration_beats;
    plan->bpm_ref = p.bpm_ref;
    plan->phase_offset = p.phase_offset;
    plan->entry_phase = p.entry_phase;
    plan->exit_label = static_cast<SegueSegmentLabel>(p.exit_label);
    plan->entry_label = static_cast<SegueSegmentLabel>(p.entry_label);
    plan->energy_jump = p.energy_jump;
    plan->pair_score = p.pair_score;
    plan->delta_eff_bpm = p.compatibility.delta_eff_bpm;
    plan->bpm_b_normalized = p.compatibility.bpm_b_normalized;
    plan->stretch_pct = p.compatibility.stretch_pct;
    plan->key_score = p.compatibility.key_score;
    plan->key_compatible = p.compatibility.key_compatible ? 1 : 0;
    plan->tempo_compatible = p.compatibility.tempo_compatible ? 1 : 0;
    plan->stretch_safe = p.compatibility.stretch_safe ? 1 : 0;
    std::strncpy(plan->rule, p.rule.c_str(), sizeof(plan->rule) - 1);

    return SEGUE_OK;
}

SegueError segue_key_score(const char* code_a, const char* code_b, float* score) {
    if (!code_a || !code_b || !score) return SEGUE_ERROR_INVALID_ARGUMENT;

    auto a = CamelotCompatibility::parse(code_a);
    if (a.failed()) return to_api_error(a.code());

    auto b = CamelotCompatibility::parse(code_b);
    if (b.failed()) return to_api_error(b.code());

    auto s = CamelotCompatibility::score(a.value(), b.value());
    if (s.failed()) return to_api_error(s.code());

    *score = s.value();
    return SEGUE_OK;
}

SegueError segue_parse_segment_label(const char* name, SegueSegmentLabel* label) {
    if (!name || !label) return SEGUE_ERROR_INVALID_ARGUMENT;

    auto parsed = parse_segment_label(name);
    if (!parsed) return SEGUE_ERROR_INVALID_ARGUMENT;

    *label = static_cast<SegueSegmentLabel>(*parsed);
    return SEGUE_OK;
}

/* ============================================================================
 * Rendering
 * ============================================================================ */

static AudioBuffer to_buffer(const SegueAudioBuffer& in) {
    AudioBuffer out;
    out.sample_rate = in.sample_rate;
    out.channels = in.channels;
    if (in.samples && in.channels > 0) {
        out.samples.assign(in.samples, in.samples + in.frame_count * in.channels);
    }
    return out;
}

SegueError segue_render_transition(
    SegueEngine* engine,
    const SegueTransitionPlan* plan,
    const SegueAudioBuffer* track_a,
    const SegueAudioBuffer* track_b,
    SegueAudioBuffer* output
) {
    if (!engine || !engine->engine || !plan || !track_a || !track_b || !output) {
        return SEGUE_ERROR_INVALID_ARGUMENT;
    }
    if (plan->type < SEGUE_TRANSITION_CROSSFADE || plan->type > SEGUE_TRANSITION_LOW_CUT_ECHO_SLAM) {
        engine->last_error = "Unknown transition type";
        return SEGUE_ERROR_INVALID_ARGUMENT;
    }

    TransitionPlan p;
    p.exit_time = plan->exit_time;
    p.entry_time = plan->entry_time;
    p.type = static_cast<TransitionType>(plan->type);
    p.duration_beats = plan->duration_beats;
    p.bpm_ref = plan->bpm_ref;
    p.phase_offset = plan->phase_offset;
    p.entry_phase = plan->entry_phase;
    p.compatibility.bpm_b_normalized = plan->bpm_b_normalized;
    p.compatibility.stretch_pct = plan->stretch_pct;
    p.compatibility.stretch_safe = plan->stretch_safe != 0;

    auto result = engine->engine->render(p, to_buffer(*track_a), to_buffer(*track_b));
    if (result.failed()) return fail(engine, result);

    const auto& mixed = result.value();
    float* samples = static_cast<float*>(std::malloc(mixed.samples.size() * sizeof(float)));
    if (!samples && !mixed.samples.empty()) {
        engine->last_error = "Out of memory";
        return SEGUE_ERROR_OUT_OF_MEMORY;
    }
    if (!mixed.samples.empty()) {
        std::memcpy(samples, mixed.samples.data(), mixed.samples.size() * sizeof(float));
    }

    output->samples = samples;
    output->frame_count = mixed.frame_count();
    output->sample_rate = mixed.sample_rate;
    output->channels = mixed.channels;
    return SEGUE_OK;
}

void segue_free_buffer(SegueAudioBuffer* buffer) {
    if (!buffer) return;
    std::free(buffer->samples);
    buffer->samples = nullptr;
    buffer->frame_count = 0;
}
