/**
 * Segue Engine - Tempo Detector
 */

#ifndef SEGUE_TEMPO_DETECTOR_H
#define SEGUE_TEMPO_DETECTOR_H

#include "segue/types.h"
#include <vector>

namespace segue {

/**
 * Spectral-flux onset detection, inter-onset-interval tempo estimation and
 * beat-grid fitting.
 *
 * The per-frame spectrum is an energy proxy: a small DFT over a decimated
 * copy of the Hamming-windowed frame. Only relative frame-to-frame change
 * matters for flux, so exact frequency resolution is not needed.
 */
class TempoDetector {
public:
    static constexpr int kFrameSize = 2048;
    static constexpr int kHopSize = 512;
    static constexpr int kDecimation = 8;
    static constexpr int kProxyBins = 64;
    static constexpr int kMinOnsets = 10;
    static constexpr float kMinBpm = 60.0f;
    static constexpr float kMaxBpm = 200.0f;
    static constexpr int kHistogramBins = 100;
    static constexpr float kOnsetThreshold = 1.5f;
    static constexpr float kSmoothingSeconds = 0.1f;
    static constexpr float kPhaseStep = 0.01f;
    static constexpr float kPhaseTolerance = 0.05f;
    static constexpr float kEnergyTolerance = 0.01f;

    struct Onset {
        float time = 0.0f;              // Seconds
        float strength = 0.0f;          // Flux value at the onset
    };

    TempoDetector();

    /**
     * Detect tempo, beats and downbeats. Fewer than kMinOnsets onsets
     * yields BeatMetrics::defaults().
     */
    Result<BeatMetrics> analyze(const AudioBuffer& audio) const;

    /**
     * Spectral flux per hop, frame i starting at sample i * kHopSize.
     */
    std::vector<float> compute_flux(const std::vector<float>& mono) const;

    /**
     * Flux peaks above 1.5x the local moving average.
     */
    static std::vector<Onset> pick_onsets(const std::vector<float>& flux, int sample_rate);

    /**
     * Modal inter-onset interval within [60, 200] BPM.
     * @return BPM, with the modal bin's share of intervals in `confidence`
     */
    static float estimate_tempo(const std::vector<Onset>& onsets, float& confidence);

    /**
     * Best-scoring beat grid at the given tempo, all beats < duration.
     */
    static std::vector<float> fit_beat_grid(const std::vector<Onset>& onsets, float bpm, float duration);

private:
    std::vector<float> window_;         // Hamming, kFrameSize
    std::vector<float> cos_table_;      // kProxyBins x (kFrameSize / kDecimation)
    std::vector<float> sin_table_;
};

} // namespace segue

#endif // SEGUE_TEMPO_DETECTOR_H
