/**
 * Segue Engine - Audio Analyzer
 */

#ifndef SEGUE_ANALYZER_H
#define SEGUE_ANALYZER_H

#include "segue/types.h"
#include <memory>

namespace segue {

/**
 * Runs the loudness, silence/fade and tempo analyzers over a decoded buffer.
 *
 * Analysis is best-effort: each analyzer that fails (bad input, exception in
 * the numeric code) contributes its documented default instead, and the
 * failure is logged. Nothing thrown here reaches the caller.
 */
class Analyzer {
public:
    Analyzer();
    ~Analyzer();

    // Non-copyable
    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

    /**
     * Analyze a buffer with all three analyzers.
     */
    TrackMetrics analyze(const AudioBuffer& audio) const;

    /**
     * Run a single analyzer.
     */
    LoudnessMetrics analyze_loudness(const AudioBuffer& audio) const;
    SilenceMetrics analyze_silence(const AudioBuffer& audio) const;
    BeatMetrics analyze_tempo(const AudioBuffer& audio) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace segue

#endif // SEGUE_ANALYZER_H
