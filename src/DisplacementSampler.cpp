#include "DisplacementSampler.hpp"
#include "PerformanceOptimizations.hpp"
#include <stdexcept>

namespace OWF {

using Performance::approxSin;
using Performance::approxCos;

DisplacementSampler::DisplacementSampler(std::shared_ptr<const WaveField> field)
    : field_(std::move(field)) {
    if (!field_) {
        throw std::invalid_argument("DisplacementSampler: wave field is null");
    }
}

Displacement DisplacementSampler::evaluate(const WaveField& field, double t,
                                           const SurfacePoint& position) {
    double sx = 0.0, sy = 0.0, sz = 0.0;
    const double x = position.x, z = position.z;

    for (const WaveComponent& w : field) {
        // Project onto the propagation direction
        const double dot = w.dx * x + w.dz * z;
        const double phi = w.k * dot - w.omega * t + w.phase;

        const double sinF = approxSin(phi);
        const double cosF = approxCos(phi);

        const double AcosF = w.amplitude * cosF;

        sx += w.dx * AcosF;
        sy += w.amplitude * sinF;
        sz += w.dz * AcosF;
    }

    return Displacement{sx, sy, sz};
}

void DisplacementSampler::sampleBatch(double t, const std::vector<SurfacePoint>& points,
                                      std::vector<Displacement>& out) const {
    if (out.size() != points.size()) {
        out.resize(points.size());
    }

    for (size_t i = 0; i < points.size(); ++i) {
        out[i] = evaluate(*field_, t, points[i]);
    }
}

} // namespace OWF
