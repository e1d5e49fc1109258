/**
 * Segue Engine - Audio Analyzer Implementation
 */

#include "analyzer.h"
#include "loudness_analyzer.h"
#include "silence_detector.h"
#include "tempo_detector.h"

#include <cstdio>
#include <exception>

namespace segue {

namespace {

// Run one analyzer, substituting `fallback` for any failure
template<typename T, typename Fn>
T run_or_default(const char* name, Fn&& fn, T fallback) {
    try {
        Result<T> result = fn();
        if (result.ok()) {
            return result.value();
        }
        std::fprintf(stderr, "[Analyzer] %s failed: %s\n", name, result.error().c_str());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[Analyzer] %s threw: %s\n", name, e.what());
    }
    return fallback;
}

} // namespace

class Analyzer::Impl {
public:
    LoudnessAnalyzer loudness;
    SilenceDetector silence;
    TempoDetector tempo;
};

Analyzer::Analyzer() : impl_(std::make_unique<Impl>()) {}
Analyzer::~Analyzer() = default;

TrackMetrics Analyzer::analyze(const AudioBuffer& audio) const {
    TrackMetrics metrics;
    metrics.loudness = analyze_loudness(audio);
    metrics.silence = analyze_silence(audio);
    metrics.beats = analyze_tempo(audio);
    return metrics;
}

LoudnessMetrics Analyzer::analyze_loudness(const AudioBuffer& audio) const {
    return run_or_default<LoudnessMetrics>("Loudness",
        [&]() { return impl_->loudness.analyze(audio); },
        LoudnessMetrics::defaults());
}

SilenceMetrics Analyzer::analyze_silence(const AudioBuffer& audio) const {
    return run_or_default<SilenceMetrics>("Silence",
        [&]() { return impl_->silence.analyze(audio); },
        SilenceMetrics::defaults());
}

BeatMetrics Analyzer::analyze_tempo(const AudioBuffer& audio) const {
    return run_or_default<BeatMetrics>("Tempo",
        [&]() { return impl_->tempo.analyze(audio); },
        BeatMetrics::defaults());
}

} // namespace segue
