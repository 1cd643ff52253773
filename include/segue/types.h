/**
 * Segue Engine - Internal Types
 */

#ifndef SEGUE_TYPES_H
#define SEGUE_TYPES_H

#include <array>
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <type_traits>
#include <cstdint>

namespace segue {

/* ============================================================================
 * Result Type
 * ============================================================================ */

enum class ErrorCode {
    AnalysisError,      // Malformed or degenerate analysis input
    InvalidKeyCode,     // Camelot code outside 1..12 / A..B
    IncompatiblePair,   // Tempo delta beyond the hard limit
    RenderError,        // Buffers cannot hold the requested window
    InvalidArgument
};

const char* error_code_name(ErrorCode code);

// Error wrapper type to avoid variant<T, T> when T = std::string
struct ResultError {
    ErrorCode code = ErrorCode::InvalidArgument;
    std::string message;
    ResultError() = default;
    ResultError(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ResultError error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool failed() const { return !ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const std::string& error() const { return std::get<ResultError>(data_).message; }
    ErrorCode code() const { return std::get<ResultError>(data_).code; }
    const ResultError& failure() const { return std::get<ResultError>(data_); }

private:
    std::variant<T, ResultError> data_;
};

/* ============================================================================
 * Audio Types
 * ============================================================================ */

struct AudioBuffer {
    std::vector<float> samples;  // Interleaved, `channels` samples per frame
    int sample_rate = 44100;
    int channels = 2;

    size_t frame_count() const {
        return channels > 0 ? samples.size() / channels : 0;
    }

    float duration_seconds() const {
        return sample_rate > 0 ? static_cast<float>(frame_count()) / sample_rate : 0.0f;
    }
};

/* ============================================================================
 * Key Types
 * ============================================================================ */

struct CamelotCode {
    int number = 0;     // 1..12
    char letter = 'A';  // 'A' = minor, 'B' = major

    std::string to_string() const { return std::to_string(number) + letter; }

    bool operator==(const CamelotCode& other) const {
        return number == other.number && letter == other.letter;
    }
    bool operator!=(const CamelotCode& other) const { return !(*this == other); }
};

struct KeyEstimate {
    std::string key_name;               // "<Pitch> <major|minor>", e.g. "A minor"
    CamelotCode camelot;
    float confidence = 0.0f;            // Similarity of the winning profile

    // Runner-up key, reported only when within 90% of the best score
    std::optional<std::string> alternate_key_name;
    float alternate_confidence = 0.0f;
};

/* ============================================================================
 * Structure Types
 * ============================================================================ */

enum class SegmentLabel {
    Intro,
    Verse,
    PreChorus,
    Chorus,
    Break,
    Buildup,
    Drop,
    Outro
};

const char* segment_label_name(SegmentLabel label);
std::optional<SegmentLabel> parse_segment_label(const std::string& name);

struct Segment {
    SegmentLabel label = SegmentLabel::Intro;
    float start = 0.0f;                 // Seconds, >= 0
    float end = 0.0f;                   // Seconds, > start
};

enum class MomentKind {
    Intro,
    Verse,
    Buildup,
    Beatdrop,
    Chorus,
    Outro
};

const char* moment_kind_name(MomentKind kind);

struct KeyMoment {
    MomentKind kind = MomentKind::Intro;
    std::optional<float> time;          // nullopt = not detected; 0.0 is a valid detection
};

/**
 * The six canonical moments, always in Intro, Verse, Buildup, Beatdrop,
 * Chorus, Outro order.
 */
struct KeyMoments {
    std::array<KeyMoment, 6> moments = {{
        {MomentKind::Intro, std::nullopt},
        {MomentKind::Verse, std::nullopt},
        {MomentKind::Buildup, std::nullopt},
        {MomentKind::Beatdrop, std::nullopt},
        {MomentKind::Chorus, std::nullopt},
        {MomentKind::Outro, std::nullopt},
    }};

    std::optional<float>& at(MomentKind kind) { return moments[static_cast<size_t>(kind)].time; }
    const std::optional<float>& at(MomentKind kind) const { return moments[static_cast<size_t>(kind)].time; }
};

struct EnergyPoint {
    float time = 0.0f;                  // Seconds
    float rms = 0.0f;                   // Normalized RMS (0-1)
};

/* ============================================================================
 * Track Analysis
 * ============================================================================ */

struct TrackAnalysis {
    int sample_rate = 44100;
    float bpm = 0.0f;
    float duration = 0.0f;              // Seconds
    std::optional<KeyEstimate> key;     // nullopt when chroma was degenerate
    std::vector<Segment> segments;      // Ordered by start, non-overlapping
    std::vector<float> beats;           // Beat grid in seconds
    KeyMoments moments;
    std::vector<EnergyPoint> energy_curve;
};

/* ============================================================================
 * Compatibility
 * ============================================================================ */

struct CompatibilityResult {
    float delta_eff_bpm = 0.0f;         // Half/double-time aware BPM delta
    float bpm_b_normalized = 0.0f;      // B's tempo on A's time-scale
    float stretch_pct = 0.0f;           // |bpmA / bpmB_norm - 1|
    float key_score = 0.0f;             // 0-1
    bool key_compatible = false;
    bool tempo_compatible = true;       // delta_eff_bpm within the hard limit
    bool stretch_safe = true;           // stretch_pct within the safe limit
};

/* ============================================================================
 * Transition Types
 * ============================================================================ */

enum class TransitionType {
    Crossfade,
    ReverbTail,
    LowCutFilter,
    LowCutEchoSlam
};

const char* transition_type_name(TransitionType type);

enum class SearchStrategy {
    Smooth,     // Penalizes energy discontinuity
    Hype        // Accepts energy jumps, also considers drops in B
};

struct CandidatePoint {
    float time = 0.0f;
    SegmentLabel label = SegmentLabel::Intro;
    float score = 0.0f;                 // Preference weight
};

struct TransitionPlan {
    float exit_time = 0.0f;             // Seconds into A, downbeat aligned
    float entry_time = 0.0f;            // Seconds into B, downbeat aligned
    TransitionType type = TransitionType::Crossfade;
    int duration_beats = 16;
    float bpm_ref = 0.0f;               // Tempo the beat count refers to (A's)
    float phase_offset = 0.0f;          // Seconds to shift B onto A's bar phase
    float entry_phase = 0.0f;           // Entry position inside B's bar, seconds

    // Metrics that led to the choice
    SegmentLabel exit_label = SegmentLabel::Outro;
    SegmentLabel entry_label = SegmentLabel::Intro;
    float energy_jump = 0.0f;           // energyB - energyA (signed)
    float pair_score = 0.0f;
    std::string rule;                   // Name of the style rule that fired
    CompatibilityResult compatibility;

    float duration_seconds() const {
        return bpm_ref > 0.0f ? duration_beats * 60.0f / bpm_ref : 0.0f;
    }
};

/* ============================================================================
 * Configuration
 * ============================================================================ */

struct TempoLimits {
    float max_bpm_delta = 15.0f;        // Hard limit on effective BPM delta
    float safe_stretch = 0.06f;         // Max +/-6% time stretch
    float key_compatible_score = 0.6f;  // Camelot score counted as compatible
    float double_below = 0.75f;         // B doubled when below this fraction of A
    float halve_above = 1.33f;          // B halved when above this fraction of A
};

struct StyleThresholds {
    float great_bpm = 2.0f;
    float good_bpm = 6.0f;
    float safe_stretch = 0.06f;
    float good_key = 0.7f;
    float clash_key = 0.6f;
    float big_jump = 0.15f;
};

struct SearchWeights {
    float exit = 1.0f;                  // w1
    float entry = 1.0f;                 // w2
    float energy = 1.0f;                // w3
    float stretch = 2.0f;               // w4

    static SearchWeights defaults() {
        return SearchWeights{};
    }

    static SearchWeights for_hype() {
        SearchWeights w;
        w.exit = 1.0f; w.entry = 1.5f; w.energy = 0.0f; w.stretch = 1.0f;
        return w;
    }
};

struct MomentConfig {
    float buildup_window = 16.0f;           // Seconds before the drop, labeled mode
    float unlabeled_buildup_window = 8.0f;  // Seconds before the drop, unlabeled mode
};

struct RenderConfig {
    int filter_steps = 8;               // Discrete high-pass stages
    float filter_ceiling_hz = 200.0f;   // Final cutoff
    float filter_min_hz = 20.0f;        // Stages at or below this pass unfiltered
    float echo_delay = 0.3f;            // Seconds
    float echo_decay = 0.4f;
    float reverb_tail_decay = 0.6f;
    bool equal_power = true;            // false = linear crossfade
    bool apply_phase_offset = true;
    bool time_stretch = false;          // Match B to A with Rubber Band
};

struct TransitionConfig {
    TempoLimits tempo;
    StyleThresholds thresholds;
    SearchWeights weights;
    SearchStrategy strategy = SearchStrategy::Smooth;
    MomentConfig moments;
    RenderConfig render;
    bool reject_incompatible = false;   // Fail pairs beyond max_bpm_delta

    // Defaults with the search weights that go with the strategy
    static TransitionConfig for_strategy(SearchStrategy strategy) {
        TransitionConfig c;
        c.strategy = strategy;
        c.weights = strategy == SearchStrategy::Hype ? SearchWeights::for_hype()
                                                     : SearchWeights::defaults();
        return c;
    }
};

} // namespace segue

#endif // SEGUE_TYPES_H
