/**
 * Cadence Engine - Utility Functions
 */

#ifndef CADENCE_UTILS_H
#define CADENCE_UTILS_H

#include "cadence/types.h"
#include <string>
#include <vector>
#include <cmath>
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <cctype>
#include <cstdint>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <limits>

namespace cadence {
namespace utils {

/* ============================================================================
 * Math Utilities
 * ============================================================================ */

inline float clamp(float value, float min_val, float max_val) {
    return std::max(min_val, std::min(max_val, value));
}

inline float normalize(float value, float min_val, float max_val) {
    if (max_val <= min_val) return 0.0f;
    return (value - min_val) / (max_val - min_val);
}

// Golden ratio, used to spread feature regions across embedding dimensions
constexpr double kGoldenRatio = 1.6180339887498949;
constexpr double kPi = 3.14159265358979323846;

inline double fract(double x) {
    return x - std::floor(x);
}

/* ============================================================================
 * Vector Math
 * ============================================================================ */

inline float dot(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) return 0.0f;
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * b[i];
    }
    return static_cast<float>(sum);
}

inline float l2_norm(const std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    return static_cast<float>(std::sqrt(sum));
}

/**
 * Scale a vector to unit length in place.
 * Returns false (and leaves the vector untouched) for a zero or non-finite vector.
 */
inline bool normalize_in_place(std::vector<float>& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    if (!std::isfinite(sum) || sum <= 1e-18) return false;

    double inv = 1.0 / std::sqrt(sum);
    for (auto& x : v) x = static_cast<float>(x * inv);
    return true;
}

/**
 * Cosine similarity in [-1, 1]. Zero or mismatched vectors compare as 0.
 */
inline float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;

    double d = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        d += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) return 0.0f;

    double similarity = d / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return clamp(static_cast<float>(similarity), -1.0f, 1.0f);
}

inline float cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
    return 1.0f - cosine_similarity(a, b);
}

/* ============================================================================
 * Music Theory Utilities
 * ============================================================================ */

/**
 * Position of a key on the Circle of Fifths (0-11), or -1 if unknown.
 * Minor keys share the position of their relative major.
 */
inline int circle_of_fifths_position(const std::string& key) {
    static const struct { const char* name; int pos; } table[] = {
        {"C", 0}, {"G", 1}, {"D", 2}, {"A", 3}, {"E", 4}, {"B", 5},
        {"F#", 6}, {"Gb", 6}, {"C#", 7}, {"Db", 7}, {"Ab", 8}, {"G#", 8},
        {"Eb", 9}, {"D#", 9}, {"Bb", 10}, {"A#", 10}, {"F", 11},
        {"Am", 0}, {"Em", 1}, {"Bm", 2}, {"F#m", 3}, {"C#m", 4}, {"G#m", 5},
        {"D#m", 6}, {"Ebm", 6}, {"A#m", 7}, {"Bbm", 7}, {"Fm", 8},
        {"Cm", 9}, {"Gm", 10}, {"Dm", 11}
    };

    for (const auto& entry : table) {
        if (key == entry.name) return entry.pos;
    }
    return -1;
}

/**
 * Steps between two keys on the Circle of Fifths (0-6), or -1 if either is unknown.
 */
inline int fifths_distance(const std::string& key1, const std::string& key2) {
    int pos1 = circle_of_fifths_position(key1);
    int pos2 = circle_of_fifths_position(key2);
    if (pos1 < 0 || pos2 < 0) return -1;

    int diff = std::abs(pos1 - pos2);
    return std::min(diff, 12 - diff);
}

/**
 * Harmonic compatibility: same key = 1.0, adjacent = 0.8, two steps = 0.6, ...
 * Unknown keys are neutral (0.5).
 */
inline float key_compatibility(const std::string& key1, const std::string& key2) {
    if (key1.empty() || key2.empty()) return 0.5f;

    int distance = fifths_distance(key1, key2);
    if (distance < 0) return 0.5f;

    return std::max(0.0f, 1.0f - distance * 0.2f);
}

/**
 * Relative BPM difference |a - b| / a, capped at 1.
 */
inline float bpm_difference_ratio(float reference_bpm, float other_bpm) {
    if (reference_bpm <= 0.0f || other_bpm <= 0.0f) return 1.0f;
    return std::min(std::abs(reference_bpm - other_bpm) / reference_bpm, 1.0f);
}

/* ============================================================================
 * String Utilities
 * ============================================================================ */

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

inline std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string current;
    for (char c : s) {
        if (c == ' ') {
            if (!current.empty()) words.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

/**
 * 64-bit FNV-1a hash. Stable across runs and platforms.
 */
inline uint64_t fnv1a(const std::string& s, uint64_t seed = 1469598103934665603ULL) {
    uint64_t hash = seed;
    for (unsigned char c : s) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

/**
 * Normalize a title for duplicate detection: lower-case, drop parenthetical and
 * bracketed parts, version suffixes ("- remaster", "- live", ...), leading
 * articles and punctuation.
 */
inline std::string normalize_title(const std::string& title) {
    std::string s = to_lower(title);

    // Parenthetical and bracketed content
    std::string stripped;
    int depth_paren = 0, depth_bracket = 0;
    for (char c : s) {
        if (c == '(') { depth_paren++; continue; }
        if (c == ')' && depth_paren > 0) { depth_paren--; stripped += ' '; continue; }
        if (c == '[') { depth_bracket++; continue; }
        if (c == ']' && depth_bracket > 0) { depth_bracket--; stripped += ' '; continue; }
        if (depth_paren == 0 && depth_bracket == 0) stripped += c;
    }
    s = stripped;

    // Version suffix after a dash
    static const char* suffixes[] = {
        "remaster", "remix", "live", "acoustic", "demo", "radio edit", "extended", "original"
    };
    for (size_t pos = s.find('-'); pos != std::string::npos; pos = s.find('-', pos + 1)) {
        size_t start = pos + 1;
        while (start < s.size() && s[start] == ' ') start++;
        bool matched = false;
        for (const char* suffix : suffixes) {
            if (s.compare(start, std::strlen(suffix), suffix) == 0) {
                matched = true;
                break;
            }
        }
        if (matched) {
            s.erase(pos);
            break;
        }
    }

    // Punctuation and whitespace
    std::string cleaned;
    for (char c : s) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_') {
            cleaned += c;
        } else if (std::isspace(uc)) {
            if (!cleaned.empty() && cleaned.back() != ' ') cleaned += ' ';
        }
    }
    while (!cleaned.empty() && cleaned.back() == ' ') cleaned.pop_back();

    // Leading articles
    static const char* articles[] = {"the ", "a ", "an "};
    for (const char* article : articles) {
        size_t len = std::strlen(article);
        if (cleaned.size() > len && cleaned.compare(0, len, article) == 0) {
            cleaned.erase(0, len);
            break;
        }
    }

    return cleaned;
}

/**
 * Check if two titles most likely name the same song.
 */
inline bool titles_too_similar(const std::string& title1, const std::string& title2) {
    std::string norm1 = normalize_title(title1);
    std::string norm2 = normalize_title(title2);

    if (norm1 == norm2) return true;

    // One contains the other, only when the shorter side is meaningful
    if (contains(norm1, norm2) || contains(norm2, norm1)) {
        const std::string& shorter = norm1.size() < norm2.size() ? norm1 : norm2;
        if (shorter.size() >= 5) return true;
    }

    auto significant = [](const std::string& s) {
        std::vector<std::string> out;
        for (auto& w : split_words(s)) {
            if (w.size() > 2) out.push_back(w);
        }
        return out;
    };

    auto words1 = significant(norm1);
    auto words2 = significant(norm2);
    if (words1.empty() || words2.empty()) return false;

    size_t common = 0;
    for (const auto& w : words1) {
        if (std::find(words2.begin(), words2.end(), w) != words2.end()) common++;
    }

    float overlap = static_cast<float>(common) /
                    static_cast<float>(std::min(words1.size(), words2.size()));
    return overlap >= 0.8f;
}

/* ============================================================================
 * Time Utilities
 * ============================================================================ */

constexpr int64_t kMillisPerHour = 60LL * 60 * 1000;
constexpr int64_t kMillisPerDay = 24 * kMillisPerHour;

inline int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline double days_between(int64_t from_ms, int64_t to_ms) {
    return static_cast<double>(to_ms - from_ms) / static_cast<double>(kMillisPerDay);
}

/**
 * Derive hour-of-day and day-of-week from a timestamp and UTC offset.
 */
inline TimeContext make_time_context(int64_t timestamp_ms, int utc_offset_minutes = 0) {
    int64_t local = timestamp_ms + static_cast<int64_t>(utc_offset_minutes) * 60 * 1000;

    int64_t days = local / kMillisPerDay;
    int64_t ms_of_day = local % kMillisPerDay;
    if (ms_of_day < 0) {
        ms_of_day += kMillisPerDay;
        days -= 1;
    }

    TimeContext ctx;
    ctx.timestamp = timestamp_ms;
    ctx.hour = static_cast<int>(ms_of_day / kMillisPerHour);
    // 1970-01-01 was a Thursday
    ctx.day_of_week = static_cast<int>(((days + 4) % 7 + 7) % 7);
    return ctx;
}

/* ============================================================================
 * Logging
 * ============================================================================ */

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::Warn)};
    return threshold;
}

inline void set_log_level(LogLevel level) {
    log_threshold() = static_cast<int>(level);
}

/**
 * Write a tagged diagnostic line to stderr, e.g. "[SmartQueue] 12 candidates".
 */
inline void log(LogLevel level, const char* tag, const char* format, ...) {
    if (static_cast<int>(level) < log_threshold().load()) return;

    std::fprintf(stderr, "[%s] ", tag);
    va_list args;
    va_start(args, format);
    std::vfprintf(stderr, format, args);
    va_end(args);
    std::fputc('\n', stderr);
}

} // namespace utils
} // namespace cadence

#endif // CADENCE_UTILS_H
