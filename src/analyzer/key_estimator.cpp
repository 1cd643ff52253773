/**
 * Segue Engine - Key Estimator Implementation
 */

#include "key_estimator.h"
#include "../core/utils.h"
#include <cmath>
#include <algorithm>

namespace segue {

namespace {

const char* const kPitchNames[12] = {
    "C", "C#", "D", "D#", "E", "F", "F#", "G", "G#", "A", "A#", "B"
};

struct CamelotEntry {
    const char* key_name;
    int number;
    char letter;
};

// A = minor, B = major
const CamelotEntry kCamelotTable[24] = {
    {"C major",  8,  'B'}, {"C minor",  5,  'A'},
    {"C# major", 3,  'B'}, {"C# minor", 12, 'A'},
    {"D major",  10, 'B'}, {"D minor",  7,  'A'},
    {"D# major", 5,  'B'}, {"D# minor", 2,  'A'},
    {"E major",  12, 'B'}, {"E minor",  9,  'A'},
    {"F major",  7,  'B'}, {"F minor",  4,  'A'},
    {"F# major", 2,  'B'}, {"F# minor", 11, 'A'},
    {"G major",  9,  'B'}, {"G minor",  6,  'A'},
    {"G# major", 4,  'B'}, {"G# minor", 1,  'A'},
    {"A major",  11, 'B'}, {"A minor",  8,  'A'},
    {"A# major", 6,  'B'}, {"A# minor", 3,  'A'},
    {"B major",  1,  'B'}, {"B minor",  10, 'A'},
};

std::string make_key_name(int root, bool is_major) {
    return std::string(kPitchNames[root]) + (is_major ? " major" : " minor");
}

} // namespace

const float KeyEstimator::major_profile_[12] = {
    6.35f, 2.23f, 3.48f, 2.33f, 4.38f, 4.09f,
    2.52f, 5.19f, 2.39f, 3.66f, 2.29f, 2.88f
};

const float KeyEstimator::minor_profile_[12] = {
    6.33f, 2.68f, 3.52f, 5.38f, 2.60f, 3.53f,
    2.54f, 4.75f, 3.98f, 2.69f, 3.34f, 3.17f
};

const char* KeyEstimator::pitch_name(int pitch_class) {
    if (pitch_class < 0 || pitch_class >= 12) return "?";
    return kPitchNames[pitch_class];
}

float KeyEstimator::score_key(const std::vector<float>& chroma, int root, bool is_major) {
    if (chroma.size() < 12) return 0.0f;

    // Rotate the profile so its tonic sits on `root`
    const float* profile = is_major ? major_profile_ : minor_profile_;
    float rotated[12];
    for (int i = 0; i < 12; ++i) {
        rotated[(i + root) % 12] = profile[i];
    }

    return utils::cosine_similarity(chroma.data(), rotated, 12);
}

Result<KeyEstimate> KeyEstimator::estimate(const std::vector<float>& chroma) const {
    if (chroma.size() < 12) {
        return ResultError{ErrorCode::AnalysisError,
            utils::format("Chroma vector needs 12 bins, got %zu", chroma.size())};
    }

    // Only the first 12 bins (C..B) are read
    bool any_energy = false;
    for (size_t i = 0; i < 12; ++i) {
        float v = chroma[i];
        if (!std::isfinite(v) || v < 0.0f) {
            return ResultError{ErrorCode::AnalysisError, "Chroma vector has a negative or non-finite bin"};
        }
        if (v > 0.0f) any_energy = true;
    }

    if (!any_energy) {
        return ResultError{ErrorCode::AnalysisError, "Zero chroma vector, key undefined"};
    }

    // Scores indexed root * 2 + (minor ? 1 : 0), i.e. in search order
    float scores[24];
    int best_index = 0;
    float best_score = -2.0f;

    for (int root = 0; root < 12; ++root) {
        float major_score = score_key(chroma, root, true);
        scores[root * 2] = major_score;
        if (major_score > best_score) {
            best_score = major_score;
            best_index = root * 2;
        }

        float minor_score = score_key(chroma, root, false);
        scores[root * 2 + 1] = minor_score;
        if (minor_score > best_score) {
            best_score = minor_score;
            best_index = root * 2 + 1;
        }
    }

    int best_root = best_index / 2;
    bool best_major = (best_index % 2) == 0;

    KeyEstimate estimate;
    estimate.key_name = make_key_name(best_root, best_major);
    estimate.confidence = best_score;

    auto code = key_name_to_camelot(estimate.key_name);
    if (!code) {
        return ResultError{ErrorCode::AnalysisError, "No Camelot code for " + estimate.key_name};
    }
    estimate.camelot = *code;

    // Runner-up
    int alt_index = -1;
    float alt_score = -2.0f;
    for (int i = 0; i < 24; ++i) {
        if (i == best_index) continue;
        if (scores[i] > alt_score) {
            alt_score = scores[i];
            alt_index = i;
        }
    }

    if (alt_index >= 0 && best_score > 0.0f && alt_score >= 0.9f * best_score) {
        estimate.alternate_key_name = make_key_name(alt_index / 2, (alt_index % 2) == 0);
        estimate.alternate_confidence = alt_score;
    }

    return estimate;
}

std::optional<CamelotCode> key_name_to_camelot(const std::string& key_name) {
    for (const auto& entry : kCamelotTable) {
        if (key_name == entry.key_name) {
            return CamelotCode{entry.number, entry.letter};
        }
    }
    return std::nullopt;
}

std::optional<std::string> camelot_to_key_name(const CamelotCode& code) {
    for (const auto& entry : kCamelotTable) {
        if (entry.number == code.number && entry.letter == code.letter) {
            return std::string(entry.key_name);
        }
    }
    return std::nullopt;
}

} // namespace segue
