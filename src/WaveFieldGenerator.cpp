#include "WaveFieldGenerator.hpp"
#include "WaveSpectrum.hpp"
#include <cmath>
#include <sstream>

namespace OWF {

static void requirePositive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        std::ostringstream msg;
        msg << "WaveConfig: " << name << " must be positive and finite (got " << value << ")";
        throw WaveConfigError(msg.str());
    }
}

static void requireScale(double value, const char* name) {
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream msg;
        msg << "WaveConfig: " << name << " must be non-negative and finite (got " << value << ")";
        throw WaveConfigError(msg.str());
    }
}

void WaveFieldGenerator::validate(const WaveConfig& config) {
    if (config.count <= 0) {
        throw WaveConfigError("WaveConfig: count must be positive (got " +
                              std::to_string(config.count) + ")");
    }
    requirePositive(config.delta_f, "delta_f");
    requirePositive(config.peak_frequency, "peak_frequency");
    requirePositive(config.alpha, "alpha");
    requirePositive(config.gamma, "gamma");
    requireScale(config.scale, "scale");
}

WaveFieldGenerator::WaveFieldGenerator(const WaveConfig& config)
    : config_(config) {
    validate(config_);
}

std::shared_ptr<const WaveField> WaveFieldGenerator::generate(std::optional<std::uint64_t> seed,
                                                              double amplitude_scale) const {
    requireScale(amplitude_scale, "amplitude_scale");

    const std::uint64_t used_seed = seed ? *seed : entropySeed();
    MersenneAngleSource source(used_seed);

    return std::make_shared<WaveField>(buildComponents(source, amplitude_scale),
                                       used_seed);
}

std::shared_ptr<const WaveField> WaveFieldGenerator::generate(AngleSource& source,
                                                              double amplitude_scale) const {
    requireScale(amplitude_scale, "amplitude_scale");
    return std::make_shared<WaveField>(buildComponents(source, amplitude_scale));
}

std::vector<WaveComponent> WaveFieldGenerator::buildComponents(AngleSource& source,
                                                               double amplitude_scale) const {
    const double df = config_.delta_f;
    const double fp = config_.peak_frequency;

    std::vector<WaveComponent> waves;
    waves.reserve(static_cast<size_t>(config_.count));
    double total = 0.0;

    for (int i = 1; i <= config_.count; ++i) {
        const double f = i * df;
        const double omega = TWO_PI * f;
        const double S = WaveSpectrum::jonswap(f, fp, config_.gamma, config_.alpha);
        const double A = std::sqrt(2.0 * S * df) * config_.scale * amplitude_scale;
        if (!std::isfinite(A)) {
            std::ostringstream msg;
            msg << "WaveConfig: amplitude of component " << i << " (f = " << f
                << " Hz) is not finite; check alpha, delta_f and the scale factors";
            throw WaveConfigError(msg.str());
        }
        total += A;

        // Direction is drawn before phase
        const double theta = source.nextAngle();
        const double phase = source.nextAngle();

        WaveComponent w;
        w.k = WaveSpectrum::deepWaterWavenumber(omega);
        w.omega = omega;
        w.amplitude = A;
        w.phase = phase;
        w.dx = std::cos(theta);
        w.dz = std::sin(theta);
        waves.push_back(w);
    }

    if (!std::isfinite(total)) {
        throw WaveConfigError("WaveConfig: summed amplitude overflows; reduce alpha or the scale factors");
    }

    return waves;
}

std::shared_ptr<const WaveField> generateWaveField(const WaveConfig& config,
                                                   std::optional<std::uint64_t> seed,
                                                   double amplitude_scale) {
    return WaveFieldGenerator(config).generate(seed, amplitude_scale);
}

} // namespace OWF
