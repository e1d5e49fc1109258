/**
 * Segue Engine - Crossfade Curves and Sessions
 */

#ifndef SEGUE_CROSSFADER_H
#define SEGUE_CROSSFADER_H

#include "segue/types.h"

namespace segue {

/**
 * Gain pair for the outgoing and incoming voice.
 */
struct CurveGains {
    float fade_out = 1.0f;
    float fade_in = 0.0f;
};

/**
 * Evaluate a crossfade curve. Progress is clamped to [0, 1].
 * Every curve satisfies fade_out(0) = fade_in(1) = 1 and
 * fade_out(1) = fade_in(0) = 0 exactly.
 */
CurveGains crossfade_gains(CrossfadeCurve curve, float progress);

/**
 * One transition between the active and the inactive voice.
 * Exists from scheduling until completion or abort.
 */
struct CrossfadeSession {
    enum class Kind {
        Crossfade,
        Gapless
    };

    Kind kind = Kind::Crossfade;
    TrackRef next;
    CrossfadeCurve curve = CrossfadeCurve::SCurve;
    double duration = 0.0;              // Seconds
    double start_time = 0.0;            // Clock time the fade started (phase Active)
    double ready_deadline = 0.0;        // Clock time the incoming voice must be ready by
    double paused_at = -1.0;            // Clock time of a pause, or -1
    TransitionPhase phase = TransitionPhase::None;

    /**
     * Fraction of the fade elapsed at `now`, in [0, 1].
     * A paused session reports the progress at the moment it was paused.
     */
    float progress(double now) const;

    CurveGains gains(double now) const { return crossfade_gains(curve, progress(now)); }

    void pause(double now);
    void resume(double now);
};

} // namespace segue

#endif // SEGUE_CROSSFADER_H
