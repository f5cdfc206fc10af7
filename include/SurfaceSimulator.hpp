#ifndef OWF_SURFACE_SIMULATOR_HPP
#define OWF_SURFACE_SIMULATOR_HPP

#include "OWF.hpp"
#include "WaveField.hpp"
#include "SurfacePatch.hpp"
#include "PerformanceOptimizations.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace OWF {

/**
 * @brief Offline evaluation of a surface patch over a series of output times
 *
 * Every rank builds the same wave field (the seed is broadcast from rank 0),
 * samples a contiguous block of patch points with a local thread pool, and
 * rank 0 gathers the blocks and writes one snapshot per output time.
 */
class SurfaceSimulator {
public:
    explicit SurfaceSimulator(MPI_Comm comm);
    ~SurfaceSimulator() = default;

    // Initialization
    PetscErrorCode initialize(const SimulationConfig& sim_config,
                              const WaveConfig& wave_config,
                              const SurfaceConfig& surface_config);
    PetscErrorCode initializeFromConfigFile(const std::string& config_file);
    PetscErrorCode setup();

    // Evaluate and write every snapshot
    PetscErrorCode run();
    PetscErrorCode writeSummary();

    const WaveField& field() const { return *field_; }
    const SurfacePatch& patch() const { return *patch_; }
    std::uint64_t seed() const { return seed_; }

    const std::vector<double>& outputTimes() const { return output_times_; }
    const std::vector<std::string>& outputFiles() const { return output_files_; }

    /// Patch point range [first, second) sampled by this rank
    std::pair<size_t, size_t> localRange() const { return {local_begin_, local_end_}; }

    /// {min, max} height of every snapshot written so far (valid on rank 0)
    const std::vector<std::pair<double, double>>& heightHistory() const { return height_history_; }

    SimulationConfig& simulationConfig() { return sim_config_; }

private:
    PetscErrorCode buildOutputTimes();
    PetscErrorCode sampleSnapshot(double t);
    PetscErrorCode gatherSnapshot();
    PetscErrorCode writeSnapshot(size_t index, double t);

    MPI_Comm comm;
    int rank, size;

    SimulationConfig sim_config_;
    WaveConfig wave_config_;
    SurfaceConfig surface_config_;
    bool initialized_ = false;
    bool setup_done_ = false;

    std::uint64_t seed_ = 0;
    std::shared_ptr<const WaveField> field_;
    std::unique_ptr<SurfacePatch> patch_;
    std::unique_ptr<Performance::ThreadPool> pool_;

    size_t local_begin_ = 0, local_end_ = 0;
    std::vector<int> recv_counts_, recv_displs_;

    std::vector<double> output_times_;
    std::vector<std::string> output_files_;
    std::vector<std::pair<double, double>> height_history_;
    double sampling_time_ = 0.0;
};

} // namespace OWF

#endif // OWF_SURFACE_SIMULATOR_HPP
