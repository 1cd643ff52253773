/**
 * Segue Engine - Tempo Matching Implementation
 */

#include "tempo_matcher.h"
#include "../core/utils.h"
#include <rubberband/RubberBandStretcher.h>
#include <algorithm>
#include <cmath>

namespace segue {

static constexpr size_t kRubberBandBlockSize = 1024;
static constexpr double kIdentityTolerance = 0.001;

TempoMatcher::TempoMatcher(const Logger* logger) : logger_(logger) {}

double TempoMatcher::time_ratio(float source_bpm, float target_bpm) {
    if (source_bpm <= 0.0f || target_bpm <= 0.0f) return 1.0;
    return static_cast<double>(source_bpm) / target_bpm;
}

bool TempoMatcher::is_identity(double ratio) {
    return std::abs(ratio - 1.0) <= kIdentityTolerance;
}

Result<AudioBuffer> TempoMatcher::stretch(const AudioBuffer& input, double ratio) const {
    if (!(ratio > 0.0) || !std::isfinite(ratio)) {
        return ResultError{ErrorCode::InvalidArgument,
            utils::format("Invalid time ratio %.4f", ratio)};
    }
    if (input.samples.empty() || input.channels <= 0 || input.sample_rate <= 0) {
        return ResultError{ErrorCode::InvalidArgument, "Cannot stretch an empty buffer"};
    }
    if (is_identity(ratio)) {
        return input;
    }

    const int channels = input.channels;
    const size_t frames = input.frame_count();

    RubberBand::RubberBandStretcher stretcher(
        static_cast<size_t>(input.sample_rate),
        static_cast<size_t>(channels),
        RubberBand::RubberBandStretcher::OptionProcessOffline |
        RubberBand::RubberBandStretcher::OptionPitchHighQuality,
        ratio,
        1.0
    );
    stretcher.setExpectedInputDuration(frames);
    stretcher.setMaxProcessSize(kRubberBandBlockSize);

    // Deinterleave into per-channel blocks
    std::vector<std::vector<float>> in_bufs(channels, std::vector<float>(kRubberBandBlockSize));
    std::vector<std::vector<float>> out_bufs(channels, std::vector<float>(kRubberBandBlockSize));
    std::vector<const float*> in_ptrs(channels);
    std::vector<float*> out_ptrs(channels);
    for (int ch = 0; ch < channels; ++ch) {
        in_ptrs[ch] = in_bufs[ch].data();
        out_ptrs[ch] = out_bufs[ch].data();
    }

    auto load_block = [&](size_t offset, size_t count) {
        for (size_t i = 0; i < count; ++i) {
            for (int ch = 0; ch < channels; ++ch) {
                in_bufs[ch][i] = input.samples[(offset + i) * channels + ch];
            }
        }
    };

    AudioBuffer output;
    output.sample_rate = input.sample_rate;
    output.channels = channels;
    output.samples.reserve(static_cast<size_t>(frames * ratio + kRubberBandBlockSize) * channels);

    auto drain = [&]() {
        int available;
        while ((available = stretcher.available()) > 0) {
            size_t want = std::min(static_cast<size_t>(available), kRubberBandBlockSize);
            size_t got = stretcher.retrieve(out_ptrs.data(), want);
            for (size_t i = 0; i < got; ++i) {
                for (int ch = 0; ch < channels; ++ch) {
                    output.samples.push_back(out_bufs[ch][i]);
                }
            }
        }
    };

    // Pass 1: study
    for (size_t offset = 0; offset < frames; offset += kRubberBandBlockSize) {
        size_t count = std::min(kRubberBandBlockSize, frames - offset);
        load_block(offset, count);
        stretcher.study(in_ptrs.data(), count, offset + count >= frames);
    }

    // Pass 2: process
    for (size_t offset = 0; offset < frames; offset += kRubberBandBlockSize) {
        size_t count = std::min(kRubberBandBlockSize, frames - offset);
        load_block(offset, count);
        stretcher.process(in_ptrs.data(), count, offset + count >= frames);
        drain();
    }
    drain();

    if (logger_) {
        logger_->log(LogLevel::Debug, "TempoMatcher", "Stretched %zu -> %zu frames (ratio %.4f)",
                     frames, output.frame_count(), ratio);
    }

    return output;
}

} // namespace segue
