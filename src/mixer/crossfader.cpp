/**
 * Segue Engine - Crossfade Curves and Sessions Implementation
 */

#include "crossfader.h"
#include "../core/utils.h"
#include <cmath>

namespace segue {

CurveGains crossfade_gains(CrossfadeCurve curve, float progress) {
    float p = utils::clamp(progress, 0.0f, 1.0f);

    CurveGains g;
    if (!(p > 0.0f)) {
        return g;
    }
    if (p >= 1.0f) {
        g.fade_out = 0.0f;
        g.fade_in = 1.0f;
        return g;
    }

    switch (curve) {
        case CrossfadeCurve::Linear:
            g.fade_out = 1.0f - p;
            g.fade_in = p;
            break;

        case CrossfadeCurve::EqualPower:
            g.fade_out = std::cos(p * static_cast<float>(M_PI) / 2.0f);
            g.fade_in = std::sin(p * static_cast<float>(M_PI) / 2.0f);
            break;

        case CrossfadeCurve::SCurve: {
            // Smoothstep ease-in-out
            float s = p * p * (3.0f - 2.0f * p);
            g.fade_out = 1.0f - s;
            g.fade_in = s;
            break;
        }

        case CrossfadeCurve::Logarithmic:
            g.fade_out = std::log10(1.0f + 9.0f * (1.0f - p));
            g.fade_in = std::log10(1.0f + 9.0f * p);
            break;

        case CrossfadeCurve::Exponential: {
            const float denom = std::exp(2.0f) - 1.0f;
            g.fade_out = (std::exp(2.0f * (1.0f - p)) - 1.0f) / denom;
            g.fade_in = (std::exp(2.0f * p) - 1.0f) / denom;
            break;
        }
    }

    g.fade_out = utils::clamp(g.fade_out, 0.0f, 1.0f);
    g.fade_in = utils::clamp(g.fade_in, 0.0f, 1.0f);
    return g;
}

float CrossfadeSession::progress(double now) const {
    if (phase == TransitionPhase::None) return 0.0f;
    if (phase == TransitionPhase::Handoff || duration <= 0.0) return 1.0f;

    double at = paused_at >= 0.0 ? paused_at : now;
    double p = (at - start_time) / duration;
    return static_cast<float>(utils::clamp(p, 0.0, 1.0));
}

void CrossfadeSession::pause(double now) {
    if (paused_at < 0.0) {
        paused_at = now;
    }
}

void CrossfadeSession::resume(double now) {
    if (paused_at >= 0.0) {
        // Shift the fade so no progress is made while paused
        start_time += now - paused_at;
        ready_deadline += now - paused_at;
        paused_at = -1.0;
    }
}

} // namespace segue
