/**
 * @file WaveSpectrum.cpp
 * @brief JONSWAP / Pierson-Moskowitz spectral densities
 */

#include "WaveSpectrum.hpp"
#include <cmath>

namespace OWF {
namespace WaveSpectrum {

static inline double pow2(double x) { return x * x; }

double piersonMoskowitz(double frequency, double peak_frequency, double alpha) {
    const double ratio4 = pow2(pow2(peak_frequency / frequency));
    const double decay = std::exp(-1.25 * ratio4);

    // Far below the peak the decay underflows before f⁵ does
    if (decay == 0.0) return 0.0;

    const double tau4 = pow2(pow2(TWO_PI));
    const double f5 = pow2(pow2(frequency)) * frequency;

    return alpha * GRAVITY * GRAVITY / tau4 / f5 * decay;
}

double peakShape(double frequency, double peak_frequency) {
    const double sigma = (frequency <= peak_frequency) ? SIGMA_LOW : SIGMA_HIGH;
    return std::exp(-pow2(frequency - peak_frequency) /
                    (2.0 * pow2(sigma) * pow2(peak_frequency)));
}

double jonswap(double frequency, double peak_frequency, double gamma, double alpha) {
    const double S_pm = piersonMoskowitz(frequency, peak_frequency, alpha);
    return S_pm * std::pow(gamma, peakShape(frequency, peak_frequency));
}

double deepWaterWavenumber(double omega) {
    return pow2(omega) / GRAVITY;
}

} // namespace WaveSpectrum
} // namespace OWF
