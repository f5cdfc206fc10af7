/**
 * @file DisplacementSampler.hpp
 * @brief Evaluates wave field displacement at query points
 *
 * Each component contributes A·sin(φ) vertically and A·cos(φ) along its
 * direction, with φ = k (d·x) - ω t + phase. Trigonometry uses the
 * parabolic approximations from PerformanceOptimizations.hpp.
 *
 * Sampling only reads the field and its own stack, so concurrent calls
 * on a shared field need no locking.
 */

#ifndef OWF_DISPLACEMENT_SAMPLER_HPP
#define OWF_DISPLACEMENT_SAMPLER_HPP

#include "OWF.hpp"
#include "WaveField.hpp"
#include <memory>
#include <vector>

namespace OWF {

class DisplacementSampler {
public:
    /// @throws std::invalid_argument if field is null
    explicit DisplacementSampler(std::shared_ptr<const WaveField> field);

    Displacement sample(double t, const SurfacePoint& position) const {
        return evaluate(*field_, t, position);
    }

    /**
     * @brief Sample every point into a caller-owned buffer
     *
     * @p out is resized only if its size differs from points.size().
     */
    void sampleBatch(double t, const std::vector<SurfacePoint>& points,
                     std::vector<Displacement>& out) const;

    const WaveField& field() const { return *field_; }
    std::shared_ptr<const WaveField> sharedField() const { return field_; }

    /// Summation kernel
    static Displacement evaluate(const WaveField& field, double t,
                                 const SurfacePoint& position);

private:
    std::shared_ptr<const WaveField> field_;
};

} // namespace OWF

#endif // OWF_DISPLACEMENT_SAMPLER_HPP
