/**
 * Segue Engine - Utility Functions
 */

#ifndef SEGUE_UTILS_H
#define SEGUE_UTILS_H

#include <string>
#include <vector>
#include <cmath>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <algorithm>

namespace segue {
namespace utils {

/* ============================================================================
 * Math Utilities
 * ============================================================================ */

inline float clamp(float value, float min_val, float max_val) {
    return std::max(min_val, std::min(max_val, value));
}

/**
 * Non-negative remainder of value / period (period > 0).
 */
inline float positive_fmod(float value, float period) {
    if (period <= 0.0f) return 0.0f;
    float r = std::fmod(value, period);
    if (r < 0.0f) r += period;
    // fmod can land exactly on period after the correction above
    if (r >= period) r -= period;
    return r;
}

/* ============================================================================
 * Vector Math
 * ============================================================================ */

/**
 * Cosine similarity in [-1, 1]. Returns 0 when either vector has zero
 * magnitude or the sizes differ.
 */
inline float cosine_similarity(const float* a, const float* b, size_t n) {
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) return 0.0f;

    double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return clamp(static_cast<float>(similarity), -1.0f, 1.0f);
}

inline float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;
    return cosine_similarity(a.data(), b.data(), a.size());
}

/* ============================================================================
 * Music Theory Utilities
 * ============================================================================ */

/**
 * Seconds per beat for a tempo, 0 for a non-positive tempo.
 */
inline float beat_period(float bpm) {
    return bpm > 0.0f ? 60.0f / bpm : 0.0f;
}

/**
 * Seconds per 4/4 bar.
 */
inline float bar_period(float bpm) {
    return 4.0f * beat_period(bpm);
}

/* ============================================================================
 * String Utilities
 * ============================================================================ */

inline std::string format(const char* fmt, ...) {
    char buffer[512];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    return std::string(buffer);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace utils
} // namespace segue

#endif // SEGUE_UTILS_H
