/**
 * Segue Engine - Silence / Fade Detector Implementation
 */

#include "silence_detector.h"
#include "../core/utils.h"

#include <cmath>
#include <algorithm>

namespace segue {

namespace {

constexpr float kReferenceRate = 44100.0f;
constexpr float kMaxTrim = 2.0f;
constexpr float kArtisticFade = 0.5f;

// Count leading samples of channel 0 below the near-zero level
int count_leading_zeros(const AudioBuffer& audio, size_t limit) {
    int count = 0;
    for (size_t i = 0; i < limit; ++i) {
        if (std::abs(audio.samples[i * audio.channels]) >= SilenceDetector::kNearZero) break;
        count++;
    }
    return count;
}

int count_trailing_zeros(const AudioBuffer& audio, size_t limit) {
    size_t frames = audio.frame_count();
    int count = 0;
    for (size_t i = 0; i < limit; ++i) {
        size_t frame = frames - 1 - i;
        if (std::abs(audio.samples[frame * audio.channels]) >= SilenceDetector::kNearZero) break;
        count++;
    }
    return count;
}

} // namespace

std::vector<float> SilenceDetector::peak_envelope_db(const AudioBuffer& audio, int window_size) {
    std::vector<float> envelope;
    size_t frames = audio.frame_count();
    if (frames == 0 || window_size <= 0) return envelope;

    envelope.reserve(frames / window_size + 1);
    for (size_t start = 0; start < frames; start += window_size) {
        size_t end = std::min(frames, start + static_cast<size_t>(window_size));
        float peak = 0.0f;
        for (size_t i = start * audio.channels; i < end * audio.channels; ++i) {
            peak = std::max(peak, std::abs(audio.samples[i]));
        }
        envelope.push_back(utils::linear_to_db(peak, -100.0f));
    }
    return envelope;
}

Result<SilenceMetrics> SilenceDetector::analyze(const AudioBuffer& audio) const {
    if (audio.channels <= 0 || audio.sample_rate <= 0) {
        return "Invalid buffer format";
    }
    size_t frames = audio.frame_count();
    if (frames == 0) {
        return "Empty buffer";
    }

    const float duration = audio.duration_seconds();
    const float window_seconds = static_cast<float>(kWindowSize) / audio.sample_rate;
    std::vector<float> envelope = peak_envelope_db(audio, kWindowSize);
    const int windows = static_cast<int>(envelope.size());

    SilenceMetrics metrics;

    // Forward scan: silence ends at the first window above the silence
    // threshold, the fade-in ends at the first window above the fade threshold
    int audio_start = -1;
    for (int i = 0; i < windows; ++i) {
        if (envelope[i] > kSilenceThresholdDb) {
            audio_start = i;
            break;
        }
    }
    if (audio_start >= 0) {
        metrics.start_silence = std::min(audio_start * window_seconds, kMaxSilence);
        for (int i = audio_start; i < windows; ++i) {
            if (envelope[i] > kFadeThresholdDb) {
                metrics.start_fade = (i - audio_start) * window_seconds;
                break;
            }
        }
    }

    // Backward scan, mirrored
    int audio_end = -1;
    for (int i = windows - 1; i >= 0; --i) {
        if (envelope[i] > kSilenceThresholdDb) {
            audio_end = i;
            break;
        }
    }
    if (audio_end >= 0) {
        metrics.end_silence = std::min((windows - 1 - audio_end) * window_seconds, kMaxSilence);
        for (int i = audio_end; i >= 0; --i) {
            if (envelope[i] > kFadeThresholdDb) {
                // Runs from the start of the last loud window to the end of audio
                metrics.end_fade = (audio_end + 1 - i) * window_seconds;
                break;
            }
        }
    }

    metrics.start_silence = utils::clamp(metrics.start_silence, 0.0f, duration);
    metrics.end_silence = utils::clamp(metrics.end_silence, 0.0f, duration);
    metrics.start_fade = utils::clamp(metrics.start_fade, 0.0f, duration);
    metrics.end_fade = utils::clamp(metrics.end_fade, 0.0f, duration);

    // Encoder delay/padding, normalized to 44.1 kHz sample counts
    size_t scan = std::min(frames, static_cast<size_t>(kEncoderScanSamples));
    float rate_ratio = audio.sample_rate / kReferenceRate;
    metrics.encoder_delay = static_cast<int>(std::round(count_leading_zeros(audio, scan) / rate_ratio));
    metrics.encoder_padding = static_cast<int>(std::round(count_trailing_zeros(audio, scan) / rate_ratio));

    // Material that is still loud in its final samples was mastered to run
    // straight into the next track
    size_t tail = std::min(frames, static_cast<size_t>(kGaplessTailSamples));
    double tail_sum = 0.0;
    for (size_t i = frames - tail; i < frames; ++i) {
        tail_sum += std::abs(audio.samples[i * audio.channels]);
    }
    metrics.has_gapless_markers = (tail_sum / tail) > kGaplessTailLevel;

    return metrics;
}

TrimPoints compute_trim_points(const SilenceMetrics& silence, float duration) {
    TrimPoints trim;
    float limit = std::max(0.0f, duration);

    if (silence.has_gapless_markers) {
        trim.start = silence.encoder_delay / kReferenceRate;
        trim.end = silence.encoder_padding / kReferenceRate;
    } else {
        trim.start = silence.start_fade > kArtisticFade ? 0.0f : std::min(silence.start_silence, kMaxTrim);
        trim.end = silence.end_fade > kArtisticFade ? 0.0f : std::min(silence.end_silence, kMaxTrim);
    }

    trim.start = utils::clamp(trim.start, 0.0f, limit);
    trim.end = utils::clamp(trim.end, 0.0f, limit);
    return trim;
}

} // namespace segue
