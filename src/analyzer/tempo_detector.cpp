/**
 * Segue Engine - Tempo Detector Implementation
 */

#include "tempo_detector.h"
#include "../core/utils.h"

#include <cmath>
#include <algorithm>
#include <numeric>
#include <limits>
#include <iterator>

namespace segue {

namespace {

constexpr int kProxyPoints = TempoDetector::kFrameSize / TempoDetector::kDecimation;

// Distance from t to the closest onset (onsets sorted by time)
float nearest_onset(const std::vector<TempoDetector::Onset>& onsets, float t, size_t* index = nullptr) {
    auto it = std::lower_bound(onsets.begin(), onsets.end(), t,
        [](const TempoDetector::Onset& o, float value) { return o.time < value; });

    float best = std::numeric_limits<float>::max();
    size_t best_index = 0;
    if (it != onsets.end()) {
        best = it->time - t;
        best_index = static_cast<size_t>(it - onsets.begin());
    }
    if (it != onsets.begin()) {
        auto prev = std::prev(it);
        if (t - prev->time < best) {
            best = t - prev->time;
            best_index = static_cast<size_t>(prev - onsets.begin());
        }
    }
    if (index) *index = best_index;
    return best;
}

} // namespace

TempoDetector::TempoDetector()
    : window_(kFrameSize)
    , cos_table_(static_cast<size_t>(kProxyBins) * kProxyPoints)
    , sin_table_(static_cast<size_t>(kProxyBins) * kProxyPoints) {
    for (int i = 0; i < kFrameSize; ++i) {
        window_[i] = 0.54f - 0.46f * std::cos(2.0f * static_cast<float>(M_PI) * i / (kFrameSize - 1));
    }

    // Bins 1..kProxyBins of a kProxyPoints-point DFT; DC is skipped
    for (int k = 0; k < kProxyBins; ++k) {
        for (int n = 0; n < kProxyPoints; ++n) {
            double phase = -2.0 * M_PI * (k + 1) * n / kProxyPoints;
            cos_table_[static_cast<size_t>(k) * kProxyPoints + n] = static_cast<float>(std::cos(phase));
            sin_table_[static_cast<size_t>(k) * kProxyPoints + n] = static_cast<float>(std::sin(phase));
        }
    }
}

std::vector<float> TempoDetector::compute_flux(const std::vector<float>& mono) const {
    std::vector<float> flux;
    if (mono.size() < static_cast<size_t>(kFrameSize)) {
        return flux;
    }

    flux.reserve((mono.size() - kFrameSize) / kHopSize + 1);

    std::vector<float> frame(kProxyPoints);
    std::vector<float> spectrum(kProxyBins, 0.0f);
    std::vector<float> prev_spectrum(kProxyBins, 0.0f);
    const float norm = 1.0f / std::sqrt(static_cast<float>(kProxyPoints));
    bool first = true;

    for (size_t start = 0; start + kFrameSize <= mono.size(); start += kHopSize) {
        for (int n = 0; n < kProxyPoints; ++n) {
            int i = n * kDecimation;
            frame[n] = mono[start + i] * window_[i];
        }

        for (int k = 0; k < kProxyBins; ++k) {
            const float* c = &cos_table_[static_cast<size_t>(k) * kProxyPoints];
            const float* s = &sin_table_[static_cast<size_t>(k) * kProxyPoints];
            float re = 0.0f, im = 0.0f;
            for (int n = 0; n < kProxyPoints; ++n) {
                re += frame[n] * c[n];
                im += frame[n] * s[n];
            }
            spectrum[k] = std::sqrt(re * re + im * im) * norm;
        }

        // Half-wave rectified difference; the first frame has no predecessor
        float value = 0.0f;
        if (!first) {
            for (int k = 0; k < kProxyBins; ++k) {
                float diff = spectrum[k] - prev_spectrum[k];
                if (diff > 0.0f) value += diff;
            }
        }
        first = false;

        flux.push_back(value);
        prev_spectrum.swap(spectrum);
    }

    return flux;
}

std::vector<TempoDetector::Onset> TempoDetector::pick_onsets(const std::vector<float>& flux, int sample_rate) {
    std::vector<Onset> onsets;
    const size_t n = flux.size();
    if (n < 3 || sample_rate <= 0) return onsets;

    const size_t half = std::max<size_t>(1, static_cast<size_t>(kSmoothingSeconds * sample_rate / kHopSize));

    // Prefix sums for the moving average
    std::vector<double> prefix(n + 1, 0.0);
    for (size_t i = 0; i < n; ++i) {
        prefix[i + 1] = prefix[i] + flux[i];
    }

    for (size_t i = 1; i + 1 < n; ++i) {
        size_t lo = i >= half ? i - half : 0;
        size_t hi = std::min(n, i + half);
        double mean = (prefix[hi] - prefix[lo]) / static_cast<double>(hi - lo);

        if (flux[i] > mean * kOnsetThreshold && flux[i] > flux[i - 1] && flux[i] > flux[i + 1]) {
            Onset onset;
            onset.time = static_cast<float>(i * kHopSize) / sample_rate;
            onset.strength = flux[i];
            onsets.push_back(onset);
        }
    }

    return onsets;
}

float TempoDetector::estimate_tempo(const std::vector<Onset>& onsets, float& confidence) {
    const float min_interval = 60.0f / kMaxBpm;
    const float max_interval = 60.0f / kMinBpm;
    const float bin_size = (max_interval - min_interval) / kHistogramBins;

    std::vector<int> histogram(kHistogramBins, 0);
    int total = 0;

    for (size_t i = 1; i < onsets.size(); ++i) {
        float interval = onsets[i].time - onsets[i - 1].time;
        if (interval < min_interval || interval > max_interval) continue;

        int bin = static_cast<int>((interval - min_interval) / bin_size);
        bin = std::min(bin, kHistogramBins - 1);
        histogram[bin]++;
        total++;
    }

    if (total == 0) {
        confidence = 0.0f;
        return 120.0f;
    }

    auto peak = std::max_element(histogram.begin(), histogram.end());
    int peak_bin = static_cast<int>(peak - histogram.begin());
    float interval = min_interval + (peak_bin + 0.5f) * bin_size;

    confidence = utils::clamp(static_cast<float>(*peak) / total, 0.0f, 1.0f);
    return utils::clamp(std::round(60.0f / interval), kMinBpm, kMaxBpm);
}

std::vector<float> TempoDetector::fit_beat_grid(const std::vector<Onset>& onsets, float bpm, float duration) {
    std::vector<float> beats;
    if (bpm <= 0.0f || duration <= 0.0f) return beats;

    const float interval = 60.0f / bpm;

    // Brute-force phase search, scoring proximity to onsets
    float best_phase = 0.0f;
    float best_score = -1.0f;
    int steps = static_cast<int>(std::ceil(interval / kPhaseStep));

    for (int s = 0; s < steps; ++s) {
        float phase = s * kPhaseStep;
        float score = 0.0f;
        for (int k = 0;; ++k) {
            float t = phase + k * interval;
            if (t >= duration) break;
            float d = nearest_onset(onsets, t);
            if (d < kPhaseTolerance) {
                score += 1.0f / (1.0f + d);
            }
        }
        if (score > best_score) {
            best_score = score;
            best_phase = phase;
        }
    }

    for (int k = 0;; ++k) {
        float t = best_phase + k * interval;
        if (t >= duration) break;
        beats.push_back(t);
    }
    return beats;
}

Result<BeatMetrics> TempoDetector::analyze(const AudioBuffer& audio) const {
    if (audio.channels <= 0 || audio.sample_rate <= 0) {
        return "Invalid buffer format";
    }
    if (audio.frame_count() < static_cast<size_t>(kFrameSize)) {
        return "Buffer shorter than one analysis frame";
    }

    std::vector<float> flux = compute_flux(audio.to_mono());
    std::vector<Onset> onsets = pick_onsets(flux, audio.sample_rate);

    if (onsets.size() < static_cast<size_t>(kMinOnsets)) {
        return BeatMetrics::defaults();
    }

    const float duration = audio.duration_seconds();

    BeatMetrics metrics;
    metrics.bpm = estimate_tempo(onsets, metrics.confidence);
    metrics.beats = fit_beat_grid(onsets, metrics.bpm, duration);

    // Onset energy on each grid position (0 when no onset is close)
    std::vector<float> energy(metrics.beats.size(), 0.0f);
    for (size_t i = 0; i < metrics.beats.size(); ++i) {
        size_t idx = 0;
        float d = nearest_onset(onsets, metrics.beats[i], &idx);
        if (d <= kEnergyTolerance) {
            energy[i] = onsets[idx].strength;
        }
    }

    // Compare accent strength every 4th vs every 3rd beat
    double sum4 = 0.0, sum3 = 0.0;
    int n4 = 0, n3 = 0;
    for (size_t i = 0; i < energy.size(); ++i) {
        if (i % 4 == 0) { sum4 += energy[i]; n4++; }
        if (i % 3 == 0) { sum3 += energy[i]; n3++; }
    }
    double avg4 = n4 > 0 ? sum4 / n4 : 0.0;
    double avg3 = n3 > 0 ? sum3 / n3 : 0.0;

    size_t stride = 4;
    metrics.time_signature = "4/4";
    if (avg3 > avg4) {
        stride = 3;
        metrics.time_signature = "3/4";
    }

    for (size_t i = 0; i < metrics.beats.size(); i += stride) {
        metrics.downbeats.push_back(metrics.beats[i]);
    }
    metrics.first_downbeat = metrics.downbeats.empty() ? 0.0f : metrics.downbeats.front();

    if (!metrics.beats.empty()) {
        float interval = 60.0f / metrics.bpm;
        float offset = std::fmod(metrics.beats.front(), interval);
        metrics.phase_shift = offset < interval / 2.0f ? -offset : interval - offset;
    }

    return metrics;
}

} // namespace segue
