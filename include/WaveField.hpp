/**
 * @file WaveField.hpp
 * @brief Immutable set of discrete wave components
 *
 * A WaveField is built once by WaveFieldGenerator and never modified
 * afterwards, so a single instance can be sampled from any number of
 * threads without synchronization.
 */

#ifndef OWF_WAVE_FIELD_HPP
#define OWF_WAVE_FIELD_HPP

#include "OWF.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace OWF {

/**
 * @brief One sinusoidal contributor to the surface
 */
struct WaveComponent {
    double k;          ///< Wavenumber (rad/m)
    double omega;      ///< Angular frequency (rad/s)
    double amplitude;  ///< Amplitude (m)
    double phase;      ///< Phase offset in [0, 2π)
    double dx, dz;     ///< Unit propagation direction
};

/**
 * @brief Ordered collection of wave components with derived peak height
 */
class WaveField {
public:
    using const_iterator = std::vector<WaveComponent>::const_iterator;

    explicit WaveField(std::vector<WaveComponent> components,
                       std::optional<std::uint64_t> seed = std::nullopt);

    const std::vector<WaveComponent>& components() const { return components_; }
    size_t size() const { return components_.size(); }
    bool empty() const { return components_.empty(); }
    const WaveComponent& operator[](size_t i) const { return components_[i]; }
    const_iterator begin() const { return components_.begin(); }
    const_iterator end() const { return components_.end(); }

    double totalAmplitude() const { return total_amplitude_; }

    /**
     * @brief Visual peak height: (Σ amplitude) / 2
     *
     * A display heuristic for normalizing heights, not the significant
     * wave height 4√m₀.
     */
    double peakHeight() const { return 0.5 * total_amplitude_; }

    /// Seed the components were drawn with, if known
    const std::optional<std::uint64_t>& seed() const { return seed_; }

    /// Displacement at horizontal position and time t
    Displacement sample(double t, const SurfacePoint& position) const;

private:
    const std::vector<WaveComponent> components_;
    const std::optional<std::uint64_t> seed_;
    const double total_amplitude_;
};

} // namespace OWF

#endif // OWF_WAVE_FIELD_HPP
