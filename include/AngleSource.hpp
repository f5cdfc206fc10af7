#ifndef OWF_ANGLE_SOURCE_HPP
#define OWF_ANGLE_SOURCE_HPP

#include "OWF.hpp"
#include <cstdint>
#include <random>

namespace OWF {

/**
 * @brief Source of uniform deviates used for component directions and phases
 *
 * Implementations must produce a reproducible sequence for a given seed.
 */
class AngleSource {
public:
    virtual ~AngleSource() = default;

    /// Uniform deviate in [lo, hi)
    virtual double nextUniform(double lo, double hi) = 0;

    /// Uniform angle in [0, 2π)
    double nextAngle() { return nextUniform(0.0, TWO_PI); }
};

/**
 * @brief 64-bit Mersenne Twister angle source
 *
 * Deviates are built from the top 53 bits of each engine output,
 * u = (x >> 11) · 2⁻⁵³, so the sequence depends only on std::mt19937_64
 * (fully specified by the standard) and not on the library's
 * distribution implementations.
 */
class MersenneAngleSource : public AngleSource {
public:
    explicit MersenneAngleSource(std::uint64_t seed);

    /// Seeds from std::random_device; seed() reports the value drawn
    static MersenneAngleSource fromEntropy();

    double nextUniform(double lo, double hi) override;

    std::uint64_t seed() const { return seed_; }

private:
    std::uint64_t seed_;
    std::mt19937_64 engine_;
};

/// Draws a fresh non-reproducible seed
std::uint64_t entropySeed();

} // namespace OWF

#endif // OWF_ANGLE_SOURCE_HPP
