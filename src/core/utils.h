/**
 * Segue Engine - Utility Functions
 */

#ifndef SEGUE_UTILS_H
#define SEGUE_UTILS_H

#include "segue/types.h"
#include <string>
#include <vector>
#include <cmath>
#include <chrono>
#include <cstdint>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace segue {
namespace utils {

/* ============================================================================
 * Math Utilities
 * ============================================================================ */

inline float clamp(float value, float min_val, float max_val) {
    return std::max(min_val, std::min(max_val, value));
}

inline double clamp(double value, double min_val, double max_val) {
    return std::max(min_val, std::min(max_val, value));
}

/* ============================================================================
 * Level Conversion
 * ============================================================================ */

inline float db_to_linear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

/**
 * Amplitude to dBFS. Zero (or negative) amplitude maps to `floor_db`.
 */
inline float linear_to_db(float amplitude, float floor_db = -100.0f) {
    if (amplitude <= 0.0f) return floor_db;
    return std::max(floor_db, 20.0f * std::log10(amplitude));
}

/* ============================================================================
 * Curve Names
 * ============================================================================ */

inline const char* curve_name(CrossfadeCurve curve) {
    switch (curve) {
        case CrossfadeCurve::Linear:      return "linear";
        case CrossfadeCurve::EqualPower:  return "equalPower";
        case CrossfadeCurve::SCurve:      return "sCurve";
        case CrossfadeCurve::Logarithmic: return "logarithmic";
        case CrossfadeCurve::Exponential: return "exponential";
    }
    return "sCurve";
}

inline std::optional<CrossfadeCurve> parse_curve(const std::string& name) {
    static const CrossfadeCurve all[] = {
        CrossfadeCurve::Linear, CrossfadeCurve::EqualPower, CrossfadeCurve::SCurve,
        CrossfadeCurve::Logarithmic, CrossfadeCurve::Exponential
    };
    for (CrossfadeCurve c : all) {
        if (name == curve_name(c)) return c;
    }
    return std::nullopt;
}

/* ============================================================================
 * File Utilities
 * ============================================================================ */

/**
 * Size and modification time used for cheap cache invalidation.
 */
struct FileIdentity {
    int64_t size = 0;
    int64_t modified_ms = 0;
};

inline std::optional<FileIdentity> file_identity(const std::filesystem::path& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;

    auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) return std::nullopt;

    FileIdentity id;
    id.size = static_cast<int64_t>(size);
    id.modified_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ftime.time_since_epoch()).count();
    return id;
}

/* ============================================================================
 * Time Utilities
 * ============================================================================ */

inline int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace utils
} // namespace segue

#endif // SEGUE_UTILS_H
