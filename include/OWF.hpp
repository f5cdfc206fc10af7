#ifndef OWF_HPP
#define OWF_HPP

#include <petsc.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace OWF {

// Forward declarations
class WaveField;
class WaveFieldGenerator;
class DisplacementSampler;
class SurfacePatch;
class SurfaceSimulator;

// Physical constants
constexpr double GRAVITY = 9.81;                 ///< Gravitational acceleration (m/s²)
constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

/**
 * @brief Horizontal query point on the mean water plane
 *
 * The surface lies in the x/z plane; y is the vertical axis.
 */
struct SurfacePoint {
    double x = 0.0;
    double z = 0.0;
};

/**
 * @brief 3D surface displacement (x, z horizontal, y vertical)
 */
struct Displacement {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

/**
 * @brief Spectral wave field parameters
 *
 * Defaults describe a moderate developing sea (JONSWAP with gamma = 3.3,
 * Phillips constant 0.0081 and a 7.7 s peak period).
 */
struct WaveConfig {
    int count = 32;                  ///< Number of discrete wave components
    double delta_f = 0.02;           ///< Frequency bin width (Hz)
    double peak_frequency = 0.13;    ///< Spectral peak frequency fp (Hz)
    double alpha = 0.0081;           ///< Phillips constant
    double gamma = 3.3;              ///< Peak enhancement factor
    double scale = 1.0;              ///< Amplitude multiplier applied per component
};

/**
 * @brief Regular grid of query points evaluated each update
 */
struct SurfaceConfig {
    int nx = 32, nz = 32;            ///< Points along x and z
    double Lx = 64.0, Lz = 64.0;     ///< Patch extent (m)
    double origin_x = 0.0;           ///< Patch centre
    double origin_z = 0.0;
    double anchor_x = 0.0;           ///< World offset added to every query point
    double anchor_z = 0.0;
};

/**
 * @brief Batch driver settings
 */
struct SimulationConfig {
    double start_time = 0.0;
    double end_time = 10.0;
    double output_interval = 1.0 / 30.0;
    std::vector<double> output_times;  ///< Explicit times; overrides the interval when set

    // Generation inputs supplied alongside the wave parameters
    std::optional<std::uint64_t> seed;
    double wave_scale = 1.0;         ///< External amplitude scale

    int num_threads = 0;             ///< 0 = hardware concurrency
    bool write_output = true;
    std::string output_prefix = "output/surface";
    std::string output_format = "VTS"; // VTS, CSV
};

} // namespace OWF

#endif // OWF_HPP
