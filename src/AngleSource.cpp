#include "AngleSource.hpp"
#include <cmath>

namespace OWF {

MersenneAngleSource::MersenneAngleSource(std::uint64_t seed)
    : seed_(seed), engine_(seed) {}

MersenneAngleSource MersenneAngleSource::fromEntropy() {
    return MersenneAngleSource(entropySeed());
}

double MersenneAngleSource::nextUniform(double lo, double hi) {
    const double u = static_cast<double>(engine_() >> 11) * 0x1.0p-53;
    double value = lo + (hi - lo) * u;

    // Rounding in the affine map can land exactly on hi
    if (value >= hi) value = std::nextafter(hi, lo);
    return value;
}

std::uint64_t entropySeed() {
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

} // namespace OWF
