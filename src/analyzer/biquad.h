/**
 * Segue Engine - Biquad Filter
 */

#ifndef SEGUE_BIQUAD_H
#define SEGUE_BIQUAD_H

#include <cmath>

namespace segue {

// =============================================================================
// Biquad filter: single channel, direct-form II transposed
// =============================================================================

struct BiquadCoeffs {
    double b0 = 1.0, b1 = 0.0, b2 = 0.0;
    double a1 = 0.0, a2 = 0.0;
};

struct BiquadState {
    double z1 = 0.0, z2 = 0.0;

    double process(double x, const BiquadCoeffs& c) {
        double y = c.b0 * x + z1;
        z1 = c.b1 * x - c.a1 * y + z2;
        z2 = c.b2 * x - c.a2 * y;
        return y;
    }
};

// Cook second-order high-pass coefficients (RBJ cookbook)
inline BiquadCoeffs make_high_pass(double sample_rate, double freq, double q) {
    BiquadCoeffs c;
    double w0 = 2.0 * M_PI * freq / sample_rate;
    double cs = std::cos(w0);
    double alpha = std::sin(w0) / (2.0 * q);

    double a0 = 1.0 + alpha;
    c.b0 = (1.0 + cs) / 2.0 / a0;
    c.b1 = -(1.0 + cs) / a0;
    c.b2 = (1.0 + cs) / 2.0 / a0;
    c.a1 = -2.0 * cs / a0;
    c.a2 = (1.0 - alpha) / a0;
    return c;
}

// Cook high-shelf coefficients (RBJ cookbook, shelf slope 1)
inline BiquadCoeffs make_high_shelf(double sample_rate, double freq, double gain_db) {
    BiquadCoeffs c;
    double A  = std::pow(10.0, gain_db / 40.0);
    double w0 = 2.0 * M_PI * freq / sample_rate;
    double cs = std::cos(w0);
    double sn = std::sin(w0);
    double alpha = sn / 2.0 * std::sqrt(2.0);

    double a0 = (A + 1) - (A - 1) * cs + 2 * std::sqrt(A) * alpha;
    c.b0 = A * ((A + 1) + (A - 1) * cs + 2 * std::sqrt(A) * alpha) / a0;
    c.b1 = -2 * A * ((A - 1) + (A + 1) * cs) / a0;
    c.b2 = A * ((A + 1) + (A - 1) * cs - 2 * std::sqrt(A) * alpha) / a0;
    c.a1 = 2 * ((A - 1) - (A + 1) * cs) / a0;
    c.a2 = ((A + 1) - (A - 1) * cs - 2 * std::sqrt(A) * alpha) / a0;
    return c;
}

} // namespace segue

#endif // SEGUE_BIQUAD_H
