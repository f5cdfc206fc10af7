#include "SurfacePatch.hpp"
#include "DisplacementSampler.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace OWF {

SurfacePatch::SurfacePatch(std::shared_ptr<const WaveField> field, const SurfaceConfig& config)
    : field_(std::move(field)), config_(config) {
    if (!field_) {
        throw std::invalid_argument("SurfacePatch: wave field is null");
    }
    if (config_.nx <= 0 || config_.nz <= 0) {
        throw std::invalid_argument("SurfacePatch: grid must have nx > 0 and nz > 0");
    }

    anchor_.x = config_.anchor_x;
    anchor_.z = config_.anchor_z;

    // Cell-vertex grid centred on the origin
    const double hx = (config_.nx > 1) ? config_.Lx / (config_.nx - 1) : 0.0;
    const double hz = (config_.nz > 1) ? config_.Lz / (config_.nz - 1) : 0.0;
    const double x0 = config_.origin_x - 0.5 * (config_.nx > 1 ? config_.Lx : 0.0);
    const double z0 = config_.origin_z - 0.5 * (config_.nz > 1 ? config_.Lz : 0.0);

    rest_.resize(static_cast<size_t>(config_.nx) * config_.nz);
    for (int k = 0; k < config_.nz; ++k) {
        for (int i = 0; i < config_.nx; ++i) {
            SurfacePoint& p = rest_[index(i, k)];
            p.x = x0 + i * hx;
            p.z = z0 + k * hz;
        }
    }

    displacements_.assign(rest_.size(), Displacement{});
}

void SurfacePatch::setAnchor(double x, double z) {
    anchor_.x = x;
    anchor_.z = z;
}

void SurfacePatch::updateRange(double t, size_t begin, size_t end) {
    end = std::min(end, rest_.size());
    if (begin >= end) return;

    const WaveField& field = *field_;
    const double ax = anchor_.x, az = anchor_.z;

    Performance::BlockIterator blocks(end - begin);
    blocks.iterate([&](size_t b0, size_t b1) {
        for (size_t i = begin + b0; i < begin + b1; ++i) {
            const SurfacePoint query{rest_[i].x + ax, rest_[i].z + az};
            displacements_[i] = DisplacementSampler::evaluate(field, t, query);
        }
    });
}

void SurfacePatch::update(double t) {
    updateRange(t, 0, rest_.size());
}

void SurfacePatch::update(double t, Performance::ThreadPool& pool) {
    // Ranges are disjoint, so workers never write the same slot
    pool.parallelFor(0, rest_.size(), [this, t](size_t begin, size_t end) {
        updateRange(t, begin, end);
    });
}

std::array<double, 3> SurfacePatch::worldPosition(size_t i) const {
    const SurfacePoint& p = rest_[i];
    const Displacement& d = displacements_[i];
    return {p.x + d.x, d.y, p.z + d.z};
}

double SurfacePatch::relativeHeight(size_t i) const {
    const double peak = field_->peakHeight();
    if (peak <= 0.0) return 0.0;
    return displacements_[i].y / peak;
}

std::pair<double, double> SurfacePatch::heightRange() const {
    double lo = std::numeric_limits<double>::max();
    double hi = std::numeric_limits<double>::lowest();
    for (const auto& d : displacements_) {
        lo = std::min(lo, d.y);
        hi = std::max(hi, d.y);
    }
    return {lo, hi};
}

} // namespace OWF
