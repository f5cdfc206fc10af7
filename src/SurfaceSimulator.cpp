#include "SurfaceSimulator.hpp"
#include "WaveFieldGenerator.hpp"
#include "AngleSource.hpp"
#include "SurfaceWriter.hpp"
#include "ConfigReader.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace OWF {

static_assert(sizeof(Displacement) == 3 * sizeof(double),
              "Displacement must be gatherable as packed doubles");

SurfaceSimulator::SurfaceSimulator(MPI_Comm comm_in)
    : comm(comm_in) {
    MPI_Comm_rank(comm, &rank);
    MPI_Comm_size(comm, &size);
}

PetscErrorCode SurfaceSimulator::initialize(const SimulationConfig& sim_config,
                                            const WaveConfig& wave_config,
                                            const SurfaceConfig& surface_config) {
    PetscFunctionBeginUser;

    sim_config_ = sim_config;
    wave_config_ = wave_config;
    surface_config_ = surface_config;

    if (sim_config_.output_format != "VTS" && sim_config_.output_format != "CSV") {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Invalid SIMULATION.output_format='%s'. Valid: VTS, CSV",
                sim_config_.output_format.c_str());
    }

    initialized_ = true;
    setup_done_ = false;
    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::initializeFromConfigFile(const std::string& config_file) {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (rank == 0) {
        PetscPrintf(comm, "Loading configuration from: %s\n", config_file.c_str());
    }

    ConfigReader reader;
    if (!reader.loadFile(config_file)) {
        SETERRQ(comm, PETSC_ERR_FILE_OPEN, "Failed to load configuration file");
    }

    ConfigReader::ValidationResult validation = reader.validate();
    if (rank == 0) {
        for (const auto& w : validation.warnings) {
            PetscPrintf(comm, "Warning: %s\n", w.c_str());
        }
        for (const auto& e : validation.errors) {
            PetscPrintf(comm, "Error: %s\n", e.c_str());
        }
    }
    if (!validation.valid) {
        SETERRQ(comm, PETSC_ERR_ARG_WRONG, "Configuration file %s failed validation",
                config_file.c_str());
    }

    SimulationConfig sim_config;
    WaveConfig wave_config;
    SurfaceConfig surface_config;
    reader.parseSimulationConfig(sim_config);
    reader.parseWaveConfig(wave_config);
    reader.parseSurfaceConfig(surface_config);

    ierr = initialize(sim_config, wave_config, surface_config); CHKERRQ(ierr);
    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::setup() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!initialized_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "SurfaceSimulator::setup() called before initialize()");
    }

    // All ranks must build the identical field
    seed_ = sim_config_.seed ? *sim_config_.seed : 0;
    if (!sim_config_.seed && rank == 0) {
        seed_ = entropySeed();
    }
    MPI_Bcast(&seed_, 1, MPI_UINT64_T, 0, comm);

    try {
        field_ = WaveFieldGenerator(wave_config_).generate(seed_, sim_config_.wave_scale);
        patch_ = std::make_unique<SurfacePatch>(field_, surface_config_);
    } catch (const std::invalid_argument& e) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "%s", e.what());
    }

    // Contiguous block decomposition of patch points
    const size_t n = patch_->numPoints();
    const size_t base = n / static_cast<size_t>(size);
    const size_t rem = n % static_cast<size_t>(size);

    recv_counts_.assign(size, 0);
    recv_displs_.assign(size, 0);
    size_t offset = 0;
    for (int r = 0; r < size; ++r) {
        size_t count = base + (static_cast<size_t>(r) < rem ? 1 : 0);
        if (r == rank) {
            local_begin_ = offset;
            local_end_ = offset + count;
        }
        recv_counts_[r] = static_cast<int>(3 * count);
        recv_displs_[r] = static_cast<int>(3 * offset);
        offset += count;
    }

    size_t threads = sim_config_.num_threads > 0
                         ? static_cast<size_t>(sim_config_.num_threads)
                         : std::thread::hardware_concurrency();
    pool_ = std::make_unique<Performance::ThreadPool>(threads);

    ierr = buildOutputTimes(); CHKERRQ(ierr);

    if (sim_config_.write_output && rank == 0) {
        std::filesystem::path prefix(sim_config_.output_prefix);
        if (prefix.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(prefix.parent_path(), ec);
            if (ec) {
                PetscPrintf(comm, "Warning: Cannot create output directory %s: %s\n",
                            prefix.parent_path().string().c_str(), ec.message().c_str());
            }
        }
    }

    if (rank == 0) {
        PetscPrintf(comm, "Wave components:   %d\n", wave_config_.count);
        PetscPrintf(comm, "Seed:              %llu\n", static_cast<unsigned long long>(seed_));
        PetscPrintf(comm, "Peak height:       %.6g m\n", field_->peakHeight());
        PetscPrintf(comm, "Surface points:    %d x %d\n", surface_config_.nx, surface_config_.nz);
        PetscPrintf(comm, "Output times:      %d\n", static_cast<int>(output_times_.size()));
        PetscPrintf(comm, "Threads per rank:  %d\n", static_cast<int>(pool_->numThreads()));
    }

    setup_done_ = true;
    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::buildOutputTimes() {
    PetscFunctionBeginUser;

    output_times_.clear();

    if (!sim_config_.output_times.empty()) {
        output_times_ = sim_config_.output_times;
        PetscFunctionReturn(0);
    }

    if (sim_config_.output_interval <= 0.0) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "output_interval must be positive");
    }
    if (sim_config_.end_time < sim_config_.start_time) {
        SETERRQ(comm, PETSC_ERR_ARG_OUTOFRANGE, "end_time must not precede start_time");
    }

    const double span = sim_config_.end_time - sim_config_.start_time;
    const long n_steps = static_cast<long>(std::floor(span / sim_config_.output_interval + 1e-9));
    output_times_.reserve(static_cast<size_t>(n_steps) + 1);
    for (long i = 0; i <= n_steps; ++i) {
        output_times_.push_back(sim_config_.start_time + i * sim_config_.output_interval);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::sampleSnapshot(double t) {
    PetscFunctionBeginUser;

    SurfacePatch& patch = *patch_;
    pool_->parallelFor(local_begin_, local_end_, [&patch, t](size_t begin, size_t end) {
        patch.updateRange(t, begin, end);
    });

    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::gatherSnapshot() {
    PetscFunctionBeginUser;

    if (size == 1) PetscFunctionReturn(0);

    double* buffer = reinterpret_cast<double*>(patch_->displacementBuffer().data());
    const int local_count = recv_counts_[rank];

    if (rank == 0) {
        MPI_Gatherv(MPI_IN_PLACE, local_count, MPI_DOUBLE,
                    buffer, recv_counts_.data(), recv_displs_.data(), MPI_DOUBLE,
                    0, comm);
    } else {
        MPI_Gatherv(buffer + recv_displs_[rank], local_count, MPI_DOUBLE,
                    nullptr, nullptr, nullptr, MPI_DOUBLE,
                    0, comm);
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::writeSnapshot(size_t index, double t) {
    PetscFunctionBeginUser;

    int failed = 0;
    std::string message;

    if (rank == 0) {
        height_history_.push_back(patch_->heightRange());

        if (sim_config_.write_output) {
            std::ostringstream name;
            name << sim_config_.output_prefix << "_" << std::setw(5) << std::setfill('0') << index
                 << SurfaceWriter::extension(sim_config_.output_format);

            try {
                if (sim_config_.output_format == "CSV") {
                    SurfaceWriter::writeCSV(name.str(), *patch_, t);
                } else {
                    SurfaceWriter::writeVTS(name.str(), *patch_, t);
                }
                output_files_.push_back(name.str());
            } catch (const std::runtime_error& e) {
                failed = 1;
                message = e.what();
            }
        }
    }

    MPI_Bcast(&failed, 1, MPI_INT, 0, comm);
    if (failed) {
        if (rank == 0) {
            PetscPrintf(comm, "Error: %s\n", message.c_str());
        }
        SETERRQ(comm, PETSC_ERR_FILE_WRITE, "Failed to write surface snapshot %d",
                static_cast<int>(index));
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::run() {
    PetscFunctionBeginUser;
    PetscErrorCode ierr;

    if (!setup_done_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "SurfaceSimulator::run() called before setup()");
    }

    output_files_.clear();
    height_history_.clear();
    sampling_time_ = 0.0;

    Performance::Timer timer;

    for (size_t i = 0; i < output_times_.size(); ++i) {
        const double t = output_times_[i];

        timer.start();
        ierr = sampleSnapshot(t); CHKERRQ(ierr);
        sampling_time_ += timer.stop();

        ierr = gatherSnapshot(); CHKERRQ(ierr);
        ierr = writeSnapshot(i, t); CHKERRQ(ierr);

        if (rank == 0) {
            const auto& range = height_history_.back();
            PetscPrintf(comm, "Snapshot %5d  t = %10.4f s  height [%9.4f, %9.4f] m\n",
                        static_cast<int>(i), t, range.first, range.second);
        }
    }

    PetscFunctionReturn(0);
}

PetscErrorCode SurfaceSimulator::writeSummary() {
    PetscFunctionBeginUser;

    if (!setup_done_) {
        SETERRQ(comm, PETSC_ERR_ORDER, "SurfaceSimulator::writeSummary() called before setup()");
    }

    double local_time = sampling_time_, max_time = 0.0;
    MPI_Reduce(&local_time, &max_time, 1, MPI_DOUBLE, MPI_MAX, 0, comm);

    if (rank == 0 && sim_config_.write_output) {
        const std::string summary_file = sim_config_.output_prefix + "_SUMMARY.txt";
        std::ofstream summary(summary_file);
        if (!summary.is_open()) {
            SETERRQ(PETSC_COMM_SELF, PETSC_ERR_FILE_OPEN, "Cannot open %s", summary_file.c_str());
        }

        summary << "Wave Field Summary\n";
        summary << "==================\n\n";
        summary << "Components: " << field_->size() << "\n";
        summary << "Seed: " << seed_ << "\n";
        summary << "Total amplitude: " << field_->totalAmplitude() << "\n";
        summary << "Peak height: " << field_->peakHeight() << "\n";
        summary << "Surface points: " << patch_->numPoints() << "\n";
        summary << "Snapshots: " << height_history_.size() << "\n";
        summary << "MPI ranks: " << size << "\n";
        summary << "Sampling time (max over ranks): " << max_time << " s\n";

        if (!height_history_.empty()) {
            double lo = height_history_.front().first, hi = height_history_.front().second;
            for (const auto& r : height_history_) {
                lo = std::min(lo, r.first);
                hi = std::max(hi, r.second);
            }
            summary << "Height range: [" << lo << ", " << hi << "]\n";
        }

        if (sim_config_.output_format == "VTS" && !output_files_.empty()) {
            std::vector<std::string> names;
            for (const auto& f : output_files_) {
                names.push_back(std::filesystem::path(f).filename().string());
            }
            try {
                SurfaceWriter::writeCollection(sim_config_.output_prefix + ".pvd", names,
                                               std::vector<double>(output_times_.begin(),
                                                                   output_times_.begin() + names.size()));
            } catch (const std::runtime_error& e) {
                SETERRQ(PETSC_COMM_SELF, PETSC_ERR_FILE_WRITE, "%s", e.what());
            }
        }
    }

    if (rank == 0) {
        PetscPrintf(comm, "Sampling time: %.3f s (%d snapshots)\n", max_time,
                    static_cast<int>(height_history_.size()));
    }

    PetscFunctionReturn(0);
}

} // namespace OWF
