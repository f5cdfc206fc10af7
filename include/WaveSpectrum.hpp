/**
 * @file WaveSpectrum.hpp
 * @brief One-dimensional frequency spectra for wind-generated seas
 *
 * Provides the JONSWAP spectral energy density used to derive component
 * amplitudes, together with its Pierson-Moskowitz base and the
 * deep-water dispersion relation.
 *
 * All frequencies are in Hz, energy density in m²/Hz.
 */

#ifndef OWF_WAVE_SPECTRUM_HPP
#define OWF_WAVE_SPECTRUM_HPP

#include "OWF.hpp"

namespace OWF {
namespace WaveSpectrum {

/// Spectral width below the peak
constexpr double SIGMA_LOW = 0.07;
/// Spectral width above the peak
constexpr double SIGMA_HIGH = 0.09;

/**
 * @brief Pierson-Moskowitz energy density
 *
 * S_pm(f) = α g² (2π)⁻⁴ f⁻⁵ exp(-1.25 (fp/f)⁴)
 *
 * @pre frequency > 0
 */
double piersonMoskowitz(double frequency, double peak_frequency, double alpha);

/**
 * @brief Exponent r of the JONSWAP peak enhancement term γ^r
 *
 * r = exp(-(f - fp)² / (2 σ² fp²)), σ = 0.07 for f ≤ fp, 0.09 otherwise.
 */
double peakShape(double frequency, double peak_frequency);

/**
 * @brief JONSWAP spectral energy density
 *
 * S(f) = S_pm(f) · γ^r
 *
 * @param frequency Frequency f (Hz), must be > 0
 * @param peak_frequency Peak frequency fp (Hz)
 * @param gamma Peak enhancement factor (γ = 1 reduces to Pierson-Moskowitz)
 * @param alpha Phillips constant
 */
double jonswap(double frequency, double peak_frequency, double gamma, double alpha);

/**
 * @brief Deep-water wavenumber for an angular frequency: k = ω²/g
 */
double deepWaterWavenumber(double omega);

} // namespace WaveSpectrum
} // namespace OWF

#endif // OWF_WAVE_SPECTRUM_HPP
