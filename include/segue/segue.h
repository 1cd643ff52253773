/**
 * Segue Engine - Public C API
 *
 * A library for planning and rendering DJ-style transitions between two
 * tracks from their key, tempo, structure and energy.
 */

#ifndef SEGUE_H
#define SEGUE_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct SegueEngine SegueEngine;

typedef enum {
    SEGUE_OK = 0,
    SEGUE_ERROR_INVALID_ARGUMENT = -1,
    SEGUE_ERROR_ANALYSIS_FAILED = -2,
    SEGUE_ERROR_INVALID_KEY_CODE = -3,
    SEGUE_ERROR_INCOMPATIBLE_PAIR = -4,
    SEGUE_ERROR_RENDER_FAILED = -5,
    SEGUE_ERROR_OUT_OF_MEMORY = -6,
} SegueError;

typedef enum {
    SEGUE_SEGMENT_INTRO = 0,
    SEGUE_SEGMENT_VERSE = 1,
    SEGUE_SEGMENT_PRECHORUS = 2,
    SEGUE_SEGMENT_CHORUS = 3,
    SEGUE_SEGMENT_BREAK = 4,
    SEGUE_SEGMENT_BUILDUP = 5,
    SEGUE_SEGMENT_DROP = 6,
    SEGUE_SEGMENT_OUTRO = 7,
} SegueSegmentLabel;

typedef enum {
    SEGUE_TRANSITION_CROSSFADE = 0,
    SEGUE_TRANSITION_REVERB_TAIL = 1,
    SEGUE_TRANSITION_LOW_CUT_FILTER = 2,
    SEGUE_TRANSITION_LOW_CUT_ECHO_SLAM = 3,
} SegueTransitionType;

typedef enum {
    SEGUE_STRATEGY_SMOOTH = 0,
    SEGUE_STRATEGY_HYPE = 1,
} SegueSearchStrategy;

typedef enum {
    SEGUE_LOG_DEBUG = 0,
    SEGUE_LOG_INFO = 1,
    SEGUE_LOG_WARNING = 2,
    SEGUE_LOG_ERROR = 3,
} SegueLogLevel;

/* Labeled structural segment, seconds */
typedef struct {
    SegueSegmentLabel label;
    float start;
    float end;
} SegueSegment;

typedef struct {
    float time;
    float rms;
} SegueEnergyPoint;

/* Analysis primitives of one track (arrays are borrowed, not copied out) */
typedef struct {
    int sample_rate;
    float bpm;
    float duration;                     /* 0 = derive from segments / beats */
    float chroma[12];                   /* C..B */
    const SegueSegment* segments;
    size_t segment_count;
    const float* beats;
    size_t beat_count;
    const SegueEnergyPoint* energy;
    size_t energy_count;
} SegueTrackInput;

/* Planned transition and the metrics behind it */
typedef struct {
    float exit_time;
    float entry_time;
    SegueTransitionType type;
    int duration_beats;
    float bpm_ref;
    float phase_offset;
    float entry_phase;                  /* Entry position inside B's bar */

    SegueSegmentLabel exit_label;
    SegueSegmentLabel entry_label;
    float energy_jump;
    float pair_score;

    float delta_eff_bpm;
    float bpm_b_normalized;
    float stretch_pct;
    float key_score;
    int key_compatible;
    int tempo_compatible;
    int stretch_safe;

    char rule[32];                      /* Style rule that fired */
} SegueTransitionPlan;

/* Transition configuration */
typedef struct {
    float max_bpm_delta;                /* Hard effective-BPM limit (default: 15) */
    float safe_stretch;                 /* Max time-stretch (default: 0.06 for +/-6%) */
    SegueSearchStrategy strategy;
    float weight_exit;                  /* w1 (default: 1) */
    float weight_entry;                 /* w2 (default: 1) */
    float weight_energy;                /* w3 (default: 1) */
    float weight_stretch;               /* w4 (default: 2) */
    int equal_power;                    /* 0 = linear crossfade */
    int apply_phase_offset;
    int time_stretch;                   /* Match B to A's tempo before rendering */
    int reject_incompatible;            /* Fail pairs beyond max_bpm_delta */
} SegueTransitionConfig;

/* Interleaved float audio */
typedef struct {
    float* samples;
    size_t frame_count;
    int sample_rate;
    int channels;
} SegueAudioBuffer;

typedef void (*SegueLogCallback)(SegueLogLevel level, const char* message, void* user_data);

/* ============================================================================
 * Engine Lifecycle
 * ============================================================================ */

/**
 * Create an engine with the default configuration.
 * @return Engine handle, or NULL on failure
 */
SegueEngine* segue_create(void);

/**
 * Destroy an engine instance and free all resources.
 */
void segue_destroy(SegueEngine* engine);

/**
 * Get the last error message of an engine.
 */
const char* segue_get_error(SegueEngine* engine);

/**
 * Route diagnostics to a callback (NULL restores stderr).
 */
void segue_set_log_callback(SegueEngine* engine, SegueLogCallback callback, void* user_data);

/* ============================================================================
 * Configuration
 * ============================================================================ */

/**
 * Fill a config with the defaults.
 */
void segue_get_default_config(SegueTransitionConfig* config);

/**
 * Fill a config with the defaults for a search strategy
 * (Hype favours entries and ignores energy jumps).
 */
void segue_get_preset_config(SegueSearchStrategy strategy, SegueTransitionConfig* config);

SegueError segue_set_config(SegueEngine* engine, const SegueTransitionConfig* config);

/* ============================================================================
 * Planning
 * ============================================================================ */

/**
 * Analyze both tracks and plan the transition from A to B.
 */
SegueError segue_plan_transition(
    SegueEngine* engine,
    const SegueTrackInput* track_a,
    const SegueTrackInput* track_b,
    SegueTransitionPlan* plan
);

/**
 * Camelot compatibility score of two codes such as "8A" and "9A".
 */
SegueError segue_key_score(const char* code_a, const char* code_b, float* score);

/**
 * Map a segmenter label such as "chorus" or "Pre-Chorus" (case-insensitive).
 * Unknown labels return SEGUE_ERROR_INVALID_ARGUMENT and leave *label untouched.
 */
SegueError segue_parse_segment_label(const char* name, SegueSegmentLabel* label);

/* ============================================================================
 * Rendering
 * ============================================================================ */

/**
 * Render a planned transition.
 *
 * @param output Receives the mixed buffer (free with segue_free_buffer)
 */
SegueError segue_render_transition(
    SegueEngine* engine,
    const SegueTransitionPlan* plan,
    const SegueAudioBuffer* track_a,
    const SegueAudioBuffer* track_b,
    SegueAudioBuffer* output
);

/**
 * Free samples allocated by segue_render_transition.
 */
void segue_free_buffer(SegueAudioBuffer* buffer);

#ifdef __cplusplus
}
#endif

#endif /* SEGUE_H */
