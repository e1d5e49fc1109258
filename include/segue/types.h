/**
 * Segue Engine - Internal Types
 */

#ifndef SEGUE_TYPES_H
#define SEGUE_TYPES_H

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <cstdint>
#include <type_traits>

namespace segue {

/* ============================================================================
 * Result Type
 * ============================================================================ */

// Error wrapper type to avoid variant<T, T> when T = std::string
struct ResultError {
    std::string message;
    ResultError() = default;
    ResultError(std::string m) : message(std::move(m)) {}
    ResultError(const char* m) : message(m) {}
};

template<typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ResultError error) : data_(std::move(error)) {}
    Result(const char* error) : data_(ResultError{error}) {}

    // Only enable this constructor when T is not std::string to avoid ambiguity
    template<typename U = T, typename = std::enable_if_t<!std::is_same_v<U, std::string>>>
    Result(std::string error) : data_(ResultError{std::move(error)}) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    bool failed() const { return !ok(); }

    T& value() { return std::get<T>(data_); }
    const T& value() const { return std::get<T>(data_); }

    const std::string& error() const { return std::get<ResultError>(data_).message; }

    T value_or(T default_value) const {
        return ok() ? value() : default_value;
    }

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

    /**
     * Average all channels into a single mono channel.
     */
    std::vector<float> to_mono() const {
        size_t frames = frame_count();
        std::vector<float> mono(frames, 0.0f);
        if (channels <= 0) return mono;

        float scale = 1.0f / channels;
        for (size_t i = 0; i < frames; ++i) {
            float sum = 0.0f;
            for (int ch = 0; ch < channels; ++ch) {
                sum += samples[i * channels + ch];
            }
            mono[i] = sum * scale;
        }
        return mono;
    }
};

/**
 * Stream properties reported by a metadata-only probe.
 */
struct AudioInfo {
    int sample_rate = 0;
    int channels = 0;
    float duration = 0.0f;
    std::string codec;
};

/* ============================================================================
 * Track Reference
 * ============================================================================ */

struct TrackRef {
    int64_t id = 0;
    std::string locator;                // File path or other content locator
    float duration = 0.0f;              // Seconds, 0 if unknown
};

/* ============================================================================
 * Analysis Metrics
 * ============================================================================ */

struct LoudnessMetrics {
    float integrated = -23.0f;          // LUFS over the whole signal
    float short_term = -23.0f;          // Trailing 3 s
    float momentary = -23.0f;           // Trailing 400 ms
    float loudness_range = 7.0f;        // LU
    float true_peak = -1.0f;            // dBFS
    float gain_adjustment = 0.0f;       // dB, clamped to +/-20

    static LoudnessMetrics defaults() { return LoudnessMetrics{}; }
};

struct SilenceMetrics {
    float start_silence = 0.0f;         // Seconds
    float end_silence = 0.0f;
    float start_fade = 0.0f;            // Fade-in length after start silence
    float end_fade = 0.0f;              // Fade-out length before end silence
    bool has_gapless_markers = false;
    int encoder_delay = 0;              // Samples, normalized to 44.1 kHz
    int encoder_padding = 0;

    static SilenceMetrics defaults() { return SilenceMetrics{}; }
};

struct BeatMetrics {
    float bpm = 120.0f;
    float confidence = 0.0f;            // 0.0-1.0
    std::vector<float> beats;           // Beat positions in seconds
    std::vector<float> downbeats;       // Subset of beats starting a bar
    std::string time_signature = "4/4";
    float first_downbeat = 0.0f;
    float phase_shift = 0.0f;           // Seconds to move the grid onto whole beats

    static BeatMetrics defaults() { return BeatMetrics{}; }
};

struct TrackMetrics {
    LoudnessMetrics loudness;
    SilenceMetrics silence;
    BeatMetrics beats;
};

/**
 * Aggregate analysis record. Immutable once produced.
 * An empty content_hash marks a result built from defaults after a failure.
 */
struct AnalysisResult {
    LoudnessMetrics loudness;
    SilenceMetrics silence;
    BeatMetrics beats;
    std::string content_hash;
    int64_t computed_at = 0;            // Unix time in milliseconds

    bool is_default() const { return content_hash.empty(); }
};

/**
 * Seconds to skip at the head and tail of a track.
 */
struct TrimPoints {
    float start = 0.0f;
    float end = 0.0f;
};

/* ============================================================================
 * Cache Statistics
 * ============================================================================ */

struct CacheStats {
    int entries = 0;
    int64_t total_size_bytes = 0;       // Sum of cached file sizes
    int64_t oldest = 0;                 // computed_at of the oldest entry, ms
    int64_t newest = 0;
};

/* ============================================================================
 * Transition Configuration
 * ============================================================================ */

enum class CrossfadeCurve {
    Linear,
    EqualPower,
    SCurve,
    Logarithmic,
    Exponential
};

struct EngineOptions {
    float crossfade_duration = 5.0f;    // Seconds
    CrossfadeCurve curve = CrossfadeCurve::SCurve;
    float target_loudness = -16.0f;     // LUFS
    bool true_peak_limiting = true;
    bool beat_matching = false;
    float gapless_threshold_ms = 50.0f;
    int tick_interval_ms = 10;

    bool crossfade_enabled = true;      // Auto-advance uses crossfade, else gapless
    bool normalization_enabled = true;
    bool trim_silence = true;

    float load_timeout = 10.0f;         // Seconds until a load is declared failed
    float preload_timeout = 5.0f;       // Seconds a scheduled transition waits for readiness
    float analysis_wait = 2.0f;         // Seconds a ready voice waits for analysis
    float preload_lookahead = 10.0f;    // Seconds before track end to preload the next item
};

/* ============================================================================
 * Playback State
 * ============================================================================ */

enum class VoiceState {
    Empty,
    Loading,
    Ready,
    Playing,
    Paused
};

enum class TransitionPhase {
    None,
    Active,
    Handoff
};

} // namespace segue

#endif // SEGUE_TYPES_H
