/**
 * @file WaveFieldGenerator.hpp
 * @brief Synthesizes a WaveField from a JONSWAP spectrum
 *
 * For component i = 1..count:
 *   f = i Δf, ω = 2π f
 *   A = sqrt(2 S(f) Δf) · scale · amplitude_scale
 *   θ, phase ~ U[0, 2π)          (θ drawn first)
 *   k = ω² / g                    (deep water)
 *
 * Identical configuration, seed and amplitude scale give a bit-identical
 * field.
 */

#ifndef OWF_WAVE_FIELD_GENERATOR_HPP
#define OWF_WAVE_FIELD_GENERATOR_HPP

#include "OWF.hpp"
#include "WaveField.hpp"
#include "AngleSource.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace OWF {

/**
 * @brief Invalid wave configuration (raised before any component is built)
 */
class WaveConfigError : public std::invalid_argument {
public:
    explicit WaveConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

class WaveFieldGenerator {
public:
    /// @throws WaveConfigError
    explicit WaveFieldGenerator(const WaveConfig& config);

    /**
     * @brief Generate a field
     * @param seed Seed for MersenneAngleSource; drawn from std::random_device if empty
     * @param amplitude_scale External amplitude multiplier
     * @throws WaveConfigError if amplitude_scale is negative or not finite, or if
     *         the spectrum yields a non-finite component amplitude
     */
    std::shared_ptr<const WaveField> generate(std::optional<std::uint64_t> seed = std::nullopt,
                                              double amplitude_scale = 1.0) const;

    /// Generate with a caller-supplied random source
    std::shared_ptr<const WaveField> generate(AngleSource& source,
                                              double amplitude_scale = 1.0) const;

    const WaveConfig& config() const { return config_; }

    /// @throws WaveConfigError describing the first invalid parameter
    static void validate(const WaveConfig& config);

private:
    std::vector<WaveComponent> buildComponents(AngleSource& source,
                                               double amplitude_scale) const;

    WaveConfig config_;
};

/// Convenience wrapper: validate, then generate
std::shared_ptr<const WaveField> generateWaveField(const WaveConfig& config,
                                                   std::optional<std::uint64_t> seed = std::nullopt,
                                                   double amplitude_scale = 1.0);

} // namespace OWF

#endif // OWF_WAVE_FIELD_GENERATOR_HPP
