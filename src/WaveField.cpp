#include "WaveField.hpp"
#include "DisplacementSampler.hpp"
#include <utility>

namespace OWF {

static double sumAmplitudes(const std::vector<WaveComponent>& components) {
    double total = 0.0;
    for (const auto& c : components) total += c.amplitude;
    return total;
}

WaveField::WaveField(std::vector<WaveComponent> components,
                     std::optional<std::uint64_t> seed)
    : components_(std::move(components)),
      seed_(seed),
      total_amplitude_(sumAmplitudes(components_)) {}

Displacement WaveField::sample(double t, const SurfacePoint& position) const {
    return DisplacementSampler::evaluate(*this, t, position);
}

} // namespace OWF
