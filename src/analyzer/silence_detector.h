/**
 * Segue Engine - Silence / Fade Detector
 */

#ifndef SEGUE_SILENCE_DETECTOR_H
#define SEGUE_SILENCE_DETECTOR_H

#include "segue/types.h"
#include <vector>

namespace segue {

/**
 * Amplitude-threshold detection of leading/trailing silence and fades,
 * plus heuristics for encoder delay/padding and gapless mastering.
 */
class SilenceDetector {
public:
    static constexpr int kWindowSize = 256;
    static constexpr float kSilenceThresholdDb = -60.0f;
    static constexpr float kFadeThresholdDb = -40.0f;
    static constexpr float kMaxSilence = 5.0f;
    static constexpr int kEncoderScanSamples = 3000;
    static constexpr float kNearZero = 1e-5f;
    static constexpr int kGaplessTailSamples = 100;
    static constexpr float kGaplessTailLevel = 0.01f;

    SilenceDetector() = default;

    Result<SilenceMetrics> analyze(const AudioBuffer& audio) const;

    /**
     * Peak amplitude per window across all channels, in dBFS (-100 for
     * digital silence).
     */
    static std::vector<float> peak_envelope_db(const AudioBuffer& audio, int window_size);
};

/**
 * Trim policy applied at playback.
 *
 * With gapless markers only encoder delay/padding is removed (counts are at
 * 44.1 kHz). Otherwise up to 2 s of detected silence is removed per end,
 * except on a side whose fade is longer than 0.5 s. Both values are
 * clamped to [0, duration].
 */
TrimPoints compute_trim_points(const SilenceMetrics& silence, float duration);

} // namespace segue

#endif // SEGUE_SILENCE_DETECTOR_H
