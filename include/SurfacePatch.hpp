/**
 * @file SurfacePatch.hpp
 * @brief Regular grid of surface points with a reusable displacement buffer
 *
 * The buffer is sized once to the number of query points and refilled on
 * every update. Consumers (mesh deformers, colour mappers) read the
 * results after update() returns; the patch itself does not synchronize
 * with them.
 */

#ifndef OWF_SURFACE_PATCH_HPP
#define OWF_SURFACE_PATCH_HPP

#include "OWF.hpp"
#include "WaveField.hpp"
#include "PerformanceOptimizations.hpp"
#include <array>
#include <memory>
#include <utility>
#include <vector>

namespace OWF {

class SurfacePatch {
public:
    /**
     * @throws std::invalid_argument if field is null or the grid is empty
     */
    SurfacePatch(std::shared_ptr<const WaveField> field, const SurfaceConfig& config);

    /// World offset added to every query point (e.g. a followed object)
    void setAnchor(double x, double z);
    SurfacePoint anchor() const { return anchor_; }

    // Fill the displacement buffer at time t
    void update(double t);
    void update(double t, Performance::ThreadPool& pool);
    void updateRange(double t, size_t begin, size_t end);

    size_t numPoints() const { return rest_.size(); }
    int nx() const { return config_.nx; }
    int nz() const { return config_.nz; }
    size_t index(int i, int k) const { return static_cast<size_t>(k) * config_.nx + i; }

    const std::vector<SurfacePoint>& restPositions() const { return rest_; }
    const std::vector<Displacement>& displacements() const { return displacements_; }
    std::vector<Displacement>& displacementBuffer() { return displacements_; }

    /// Rest position plus displacement, in patch-local coordinates
    std::array<double, 3> worldPosition(size_t i) const;

    double height(size_t i) const { return displacements_[i].y; }

    /// Height divided by the field's peak height (0 for a flat field)
    double relativeHeight(size_t i) const;

    /// {min, max} height of the current buffer
    std::pair<double, double> heightRange() const;

    const WaveField& field() const { return *field_; }
    const SurfaceConfig& config() const { return config_; }

private:
    std::shared_ptr<const WaveField> field_;
    SurfaceConfig config_;
    SurfacePoint anchor_;

    std::vector<SurfacePoint> rest_;
    std::vector<Displacement> displacements_;
};

} // namespace OWF

#endif // OWF_SURFACE_PATCH_HPP
