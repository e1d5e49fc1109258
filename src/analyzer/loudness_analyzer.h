/**
 * Segue Engine - Loudness Analyzer
 */

#ifndef SEGUE_LOUDNESS_ANALYZER_H
#define SEGUE_LOUDNESS_ANALYZER_H

#include "segue/types.h"

namespace segue {

/**
 * Approximate K-weighted loudness measurement.
 *
 * Each channel runs through a 38 Hz high-pass and a +4 dB high-shelf at
 * 1.5 kHz. Mean-square energy is taken over the whole signal (integrated),
 * the trailing 3 s (short-term) and the trailing 400 ms (momentary).
 * Channels 4 and 5 of a surround layout are weighted by 1.41; channels
 * beyond the fifth are not measured. There is no gating.
 */
class LoudnessAnalyzer {
public:
    static constexpr float kTargetLoudness = -18.0f;
    static constexpr float kMaxGainAdjustment = 20.0f;
    static constexpr float kSilenceFloor = -70.0f;
    static constexpr float kPeakFloor = -100.0f;

    LoudnessAnalyzer() = default;

    /**
     * Measure a buffer. Fails only on an empty or malformed buffer; an
     * all-zero signal measures kSilenceFloor.
     */
    Result<LoudnessMetrics> analyze(const AudioBuffer& audio) const;

    /**
     * Convert a mean-square energy to LUFS, flooring at kSilenceFloor.
     */
    static float mean_square_to_lufs(double mean_square);
};

} // namespace segue

#endif // SEGUE_LOUDNESS_ANALYZER_H
