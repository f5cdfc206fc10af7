#ifndef OWF_SURFACE_WRITER_HPP
#define OWF_SURFACE_WRITER_HPP

#include "OWF.hpp"
#include "SurfacePatch.hpp"
#include <string>
#include <vector>

namespace OWF {

/**
 * @brief Snapshot output for displaced surfaces
 *
 * VTS files open directly in ParaView; a PVD collection strings them into
 * a time series. All writers throw std::runtime_error if the file cannot
 * be opened.
 */
class SurfaceWriter {
public:
    /// XML StructuredGrid (ASCII) with height, relative_height and displacement
    static void writeVTS(const std::string& filename, const SurfacePatch& patch, double time);

    /// One row per point: x,z,dx,dy,dz,height,relative_height
    static void writeCSV(const std::string& filename, const SurfacePatch& patch, double time);

    /// ParaView time collection over previously written snapshots
    static void writeCollection(const std::string& filename,
                                const std::vector<std::string>& files,
                                const std::vector<double>& times);

    /// File extension for an output format name ("VTS" -> ".vts")
    static std::string extension(const std::string& format);
};

} // namespace OWF

#endif // OWF_SURFACE_WRITER_HPP
