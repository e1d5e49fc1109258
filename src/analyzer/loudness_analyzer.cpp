/**
 * Segue Engine - Loudness Analyzer Implementation
 */

#include "loudness_analyzer.h"
#include "biquad.h"
#include "../core/utils.h"

#include <vector>
#include <cmath>
#include <algorithm>

namespace segue {

namespace {

// K-weighting stage parameters
constexpr double kHighPassFreq = 38.13547087602444;
constexpr double kHighPassQ = 0.5003270373238773;
constexpr double kShelfFreq = 1500.0;
constexpr double kShelfGainDb = 3.999843853973347;

constexpr double kShortTermSeconds = 3.0;
constexpr double kMomentarySeconds = 0.4;

// Per-channel weights for layouts with more than two channels
constexpr double kSurroundWeights[] = {1.0, 1.0, 1.0, 1.41, 1.41};
constexpr int kMaxWeightedChannels = 5;

struct EnergyWindow {
    double sum = 0.0;
    size_t count = 0;

    double mean() const { return count > 0 ? sum / count : 0.0; }
};

} // namespace

float LoudnessAnalyzer::mean_square_to_lufs(double mean_square) {
    if (!(mean_square > 0.0) || !std::isfinite(mean_square)) {
        return kSilenceFloor;
    }
    double lufs = -0.691 + 10.0 * std::log10(mean_square);
    return static_cast<float>(std::max(lufs, static_cast<double>(kSilenceFloor)));
}

Result<LoudnessMetrics> LoudnessAnalyzer::analyze(const AudioBuffer& audio) const {
    if (audio.channels <= 0 || audio.sample_rate <= 0) {
        return "Invalid buffer format";
    }
    size_t frames = audio.frame_count();
    if (frames == 0) {
        return "Empty buffer";
    }

    const int channels = audio.channels;
    const int measured = channels > 2 ? std::min(channels, kMaxWeightedChannels) : channels;
    const double sr = static_cast<double>(audio.sample_rate);

    BiquadCoeffs high_pass = make_high_pass(sr, kHighPassFreq, kHighPassQ);
    BiquadCoeffs shelf = make_high_shelf(sr, kShelfFreq, kShelfGainDb);
    std::vector<BiquadState> hp_state(measured);
    std::vector<BiquadState> shelf_state(measured);

    size_t short_term_start = frames - std::min(frames, static_cast<size_t>(kShortTermSeconds * sr));
    size_t momentary_start = frames - std::min(frames, static_cast<size_t>(kMomentarySeconds * sr));

    EnergyWindow integrated, short_term, momentary;
    float peak = 0.0f;

    for (size_t i = 0; i < frames; ++i) {
        const float* frame = &audio.samples[i * channels];

        for (int ch = 0; ch < channels; ++ch) {
            peak = std::max(peak, std::abs(frame[ch]));
        }

        for (int ch = 0; ch < measured; ++ch) {
            double x = hp_state[ch].process(frame[ch], high_pass);
            x = shelf_state[ch].process(x, shelf);

            double weight = channels > 2 ? kSurroundWeights[ch] : 1.0;
            double energy = x * x * weight;

            integrated.sum += energy;
            integrated.count++;
            if (i >= short_term_start) {
                short_term.sum += energy;
                short_term.count++;
            }
            if (i >= momentary_start) {
                momentary.sum += energy;
                momentary.count++;
            }
        }
    }

    LoudnessMetrics metrics;
    metrics.integrated = mean_square_to_lufs(integrated.mean());
    metrics.short_term = mean_square_to_lufs(short_term.mean());
    metrics.momentary = mean_square_to_lufs(momentary.mean());
    metrics.loudness_range = std::abs(metrics.short_term - metrics.momentary) * 2.0f;
    metrics.true_peak = utils::linear_to_db(peak, kPeakFloor);
    metrics.gain_adjustment = utils::clamp(kTargetLoudness - metrics.integrated,
                                           -kMaxGainAdjustment, kMaxGainAdjustment);

    if (!std::isfinite(metrics.integrated) || !std::isfinite(metrics.true_peak)) {
        return "Non-finite loudness measurement";
    }
    return metrics;
}

} // namespace segue
