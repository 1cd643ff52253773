/**
 * Segue Engine - Type Names and Parsing
 */

#include "segue/types.h"
#include "utils.h"

namespace segue {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::AnalysisError:    return "AnalysisError";
        case ErrorCode::InvalidKeyCode:   return "InvalidKeyCode";
        case ErrorCode::IncompatiblePair: return "IncompatiblePair";
        case ErrorCode::RenderError:      return "RenderError";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
    }
    return "Unknown";
}

const char* segment_label_name(SegmentLabel label) {
    switch (label) {
        case SegmentLabel::Intro:     return "intro";
        case SegmentLabel::Verse:     return "verse";
        case SegmentLabel::PreChorus: return "prechorus";
        case SegmentLabel::Chorus:    return "chorus";
        case SegmentLabel::Break:     return "break";
        case SegmentLabel::Buildup:   return "buildup";
        case SegmentLabel::Drop:      return "drop";
        case SegmentLabel::Outro:     return "outro";
    }
    return "unknown";
}

std::optional<SegmentLabel> parse_segment_label(const std::string& name) {
    std::string n = utils::to_lower(name);

    if (n == "intro")                            return SegmentLabel::Intro;
    if (n == "verse")                            return SegmentLabel::Verse;
    if (n == "prechorus" || n == "pre-chorus")   return SegmentLabel::PreChorus;
    if (n == "chorus")                           return SegmentLabel::Chorus;
    if (n == "break" || n == "breakdown")        return SegmentLabel::Break;
    if (n == "buildup" || n == "build-up")       return SegmentLabel::Buildup;
    if (n == "drop")                             return SegmentLabel::Drop;
    if (n == "outro")                            return SegmentLabel::Outro;
    return std::nullopt;
}

const char* moment_kind_name(MomentKind kind) {
    switch (kind) {
        case MomentKind::Intro:    return "Intro";
        case MomentKind::Verse:    return "Verse";
        case MomentKind::Buildup:  return "Buildup";
        case MomentKind::Beatdrop: return "Beatdrop";
        case MomentKind::Chorus:   return "Chorus";
        case MomentKind::Outro:    return "Outro";
    }
    return "Unknown";
}

const char* transition_type_name(TransitionType type) {
    switch (type) {
        case TransitionType::Crossfade:      return "crossfade";
        case TransitionType::ReverbTail:     return "reverb_tail";
        case TransitionType::LowCutFilter:   return "low_cut_filter";
        case TransitionType::LowCutEchoSlam: return "low_cut_echo_slam";
    }
    return "unknown";
}

} // namespace segue
