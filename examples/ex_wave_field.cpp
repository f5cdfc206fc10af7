/**
 * @file ex_wave_field.cpp
 * @brief Example: Generating and sampling a spectral wave field in-process
 *
 * Demonstrates:
 *
 * 1. Wave Field Generation
 *    - JONSWAP component synthesis from a WaveConfig
 *    - Reproducible fields from a fixed seed
 *
 * 2. Point Sampling
 *    - Displacement at a single query point over time
 *    - Batch sampling into a reused buffer
 *
 * 3. Surface Patch Updates
 *    - Grid of query points anchored to a moving object
 *    - Parallel update with a thread pool
 */

#include <iostream>
#include <iomanip>
#include <cmath>
#include <vector>
#include <memory>

#include "OWF.hpp"
#include "WaveFieldGenerator.hpp"
#include "DisplacementSampler.hpp"
#include "SurfacePatch.hpp"
#include "PerformanceOptimizations.hpp"

using namespace OWF;

// =============================================================================
// Example 1: Field Generation
// =============================================================================

std::shared_ptr<const WaveField> runGenerationExample() {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Example 1: JONSWAP Wave Field\n";
    std::cout << std::string(70, '=') << "\n\n";

    // Developing sea with a 10 s peak period
    WaveConfig config;
    config.count = 24;
    config.delta_f = 0.01;
    config.peak_frequency = 0.1;
    config.alpha = 0.0081;
    config.gamma = 3.3;
    config.scale = 1.0;

    auto field = generateWaveField(config, 20240611ULL);

    std::cout << "Components:      " << field->size() << "\n";
    std::cout << "Seed:            " << *field->seed() << "\n";
    std::cout << "Total amplitude: " << field->totalAmplitude() << " m\n";
    std::cout << "Peak height:     " << field->peakHeight() << " m\n\n";

    std::cout << std::setw(6) << "i" << std::setw(14) << "omega [rad/s]"
              << std::setw(14) << "k [rad/m]" << std::setw(14) << "A [m]"
              << std::setw(14) << "lambda [m]" << "\n";
    for (size_t i = 0; i < field->size(); i += 4) {
        const WaveComponent& c = (*field)[i];
        std::cout << std::setw(6) << i
                  << std::setw(14) << std::fixed << std::setprecision(4) << c.omega
                  << std::setw(14) << c.k
                  << std::setw(14) << c.amplitude
                  << std::setw(14) << std::setprecision(1) << TWO_PI / c.k << "\n";
    }
    std::cout.unsetf(std::ios::fixed);
    std::cout << std::setprecision(6);

    return field;
}

// =============================================================================
// Example 2: Point Sampling
// =============================================================================

void runPointSamplingExample(const std::shared_ptr<const WaveField>& field) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Example 2: Buoy Time Series\n";
    std::cout << std::string(70, '=') << "\n\n";

    DisplacementSampler sampler(field);
    SurfacePoint buoy{12.0, -5.0};

    std::cout << std::setw(10) << "t [s]" << std::setw(12) << "dx [m]"
              << std::setw(12) << "dy [m]" << std::setw(12) << "dz [m]" << "\n";
    std::cout << std::fixed << std::setprecision(4);
    for (int step = 0; step <= 20; ++step) {
        const double t = 0.5 * step;
        Displacement d = sampler.sample(t, buoy);
        std::cout << std::setw(10) << t << std::setw(12) << d.x
                  << std::setw(12) << d.y << std::setw(12) << d.z << "\n";
    }

    // Transect sampled into one reused buffer
    std::vector<SurfacePoint> transect;
    for (int i = 0; i < 11; ++i) {
        transect.push_back({-50.0 + 10.0 * i, 0.0});
    }
    std::vector<Displacement> heights;
    sampler.sampleBatch(3.0, transect, heights);

    std::cout << "\nTransect at t = 3 s:\n";
    for (size_t i = 0; i < transect.size(); ++i) {
        std::cout << "  x = " << std::setw(8) << transect[i].x
                  << "  height = " << std::setw(8) << heights[i].y << " m\n";
    }
    std::cout.unsetf(std::ios::fixed);
}

// =============================================================================
// Example 3: Surface Patch Following a Vessel
// =============================================================================

void runSurfacePatchExample(const std::shared_ptr<const WaveField>& field) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Example 3: Surface Patch Following a Vessel\n";
    std::cout << std::string(70, '=') << "\n\n";

    SurfaceConfig surface;
    surface.nx = 64;
    surface.nz = 64;
    surface.Lx = 128.0;
    surface.Lz = 128.0;

    SurfacePatch patch(field, surface);
    Performance::ThreadPool pool(4);
    Performance::Timer timer;

    // Vessel moving at 5 m/s along x
    const double speed = 5.0;
    const double dt = 1.0 / 30.0;

    timer.start();
    std::cout << std::fixed << std::setprecision(4);
    for (int frame = 0; frame < 90; ++frame) {
        const double t = frame * dt;
        patch.setAnchor(speed * t, 0.0);
        patch.update(t, pool);

        if (frame % 15 == 0) {
            auto range = patch.heightRange();
            size_t centre = patch.index(surface.nx / 2, surface.nz / 2);
            std::cout << "Frame " << std::setw(3) << frame
                      << "  t = " << std::setw(7) << t
                      << "  height [" << std::setw(8) << range.first
                      << ", " << std::setw(8) << range.second << "] m"
                      << "  centre rel = " << std::setw(7) << patch.relativeHeight(centre)
                      << "\n";
        }
    }
    double elapsed = timer.stop();
    std::cout.unsetf(std::ios::fixed);

    std::cout << "\n90 frames of " << patch.numPoints() << " points on "
              << pool.numThreads() << " threads: " << elapsed << " s\n";
}

// =============================================================================
// Main Function
// =============================================================================

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    std::cout << "================================================\n";
    std::cout << "OWF Wave Field Examples\n";
    std::cout << "================================================\n";

    try {
        auto field = runGenerationExample();
        runPointSamplingExample(field);
        runSurfacePatchExample(field);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n================================================\n";
    std::cout << "All wave field examples completed successfully!\n";
    std::cout << "================================================\n";

    return 0;
}
