#include "SurfaceWriter.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace OWF {

static std::ofstream openOutput(const std::string& filename) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    out << std::setprecision(9);
    return out;
}

void SurfaceWriter::writeVTS(const std::string& filename, const SurfacePatch& patch, double time) {
    std::ofstream out = openOutput(filename);

    const int nx = patch.nx();
    const int nz = patch.nz();
    const size_t n = patch.numPoints();

    // Grid is nx × nz points in a single layer (extent in VTK i, j, k order)
    const std::string extent = "0 " + std::to_string(nx - 1) + " 0 " +
                               std::to_string(nz - 1) + " 0 0";

    out << "<?xml version=\"1.0\"?>\n";
    out << "<VTKFile type=\"StructuredGrid\" version=\"0.1\" byte_order=\"LittleEndian\">\n";
    out << "  <StructuredGrid WholeExtent=\"" << extent << "\">\n";
    out << "    <FieldData>\n";
    out << "      <DataArray type=\"Float64\" Name=\"TIME\" NumberOfTuples=\"1\" format=\"ascii\">"
        << time << "</DataArray>\n";
    out << "      <DataArray type=\"Float64\" Name=\"PEAK_HEIGHT\" NumberOfTuples=\"1\" format=\"ascii\">"
        << patch.field().peakHeight() << "</DataArray>\n";
    out << "    </FieldData>\n";
    out << "    <Piece Extent=\"" << extent << "\">\n";

    out << "      <PointData Scalars=\"height\" Vectors=\"displacement\">\n";
    out << "        <DataArray type=\"Float64\" Name=\"height\" format=\"ascii\">\n";
    for (size_t i = 0; i < n; ++i) {
        out << "          " << patch.height(i) << "\n";
    }
    out << "        </DataArray>\n";
    out << "        <DataArray type=\"Float64\" Name=\"relative_height\" format=\"ascii\">\n";
    for (size_t i = 0; i < n; ++i) {
        out << "          " << patch.relativeHeight(i) << "\n";
    }
    out << "        </DataArray>\n";
    out << "        <DataArray type=\"Float64\" Name=\"displacement\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    for (const auto& d : patch.displacements()) {
        out << "          " << d.x << " " << d.y << " " << d.z << "\n";
    }
    out << "        </DataArray>\n";
    out << "      </PointData>\n";

    // VTK is z-up; map surface (x, height, z) to (x, z, height)
    out << "      <Points>\n";
    out << "        <DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    for (size_t i = 0; i < n; ++i) {
        auto p = patch.worldPosition(i);
        out << "          " << p[0] << " " << p[2] << " " << p[1] << "\n";
    }
    out << "        </DataArray>\n";
    out << "      </Points>\n";

    out << "    </Piece>\n";
    out << "  </StructuredGrid>\n";
    out << "</VTKFile>\n";
}

void SurfaceWriter::writeCSV(const std::string& filename, const SurfacePatch& patch, double time) {
    std::ofstream out = openOutput(filename);

    out << "# time = " << time << ", peak_height = " << patch.field().peakHeight() << "\n";
    out << "x,z,dx,dy,dz,height,relative_height\n";

    const auto& rest = patch.restPositions();
    const auto& disp = patch.displacements();
    for (size_t i = 0; i < patch.numPoints(); ++i) {
        out << rest[i].x << "," << rest[i].z << ","
            << disp[i].x << "," << disp[i].y << "," << disp[i].z << ","
            << patch.height(i) << "," << patch.relativeHeight(i) << "\n";
    }
}

void SurfaceWriter::writeCollection(const std::string& filename,
                                   const std::vector<std::string>& files,
                                   const std::vector<double>& times) {
    if (files.size() != times.size()) {
        throw std::invalid_argument("SurfaceWriter: files and times differ in length");
    }

    std::ofstream pvd = openOutput(filename);

    pvd << "<?xml version=\"1.0\"?>\n";
    pvd << "<VTKFile type=\"Collection\" version=\"0.1\">\n";
    pvd << "  <Collection>\n";

    for (size_t i = 0; i < files.size(); ++i) {
        pvd << "    <DataSet timestep=\"" << times[i] << "\" file=\""
            << files[i] << "\"/>\n";
    }

    pvd << "  </Collection>\n";
    pvd << "</VTKFile>\n";
}

std::string SurfaceWriter::extension(const std::string& format) {
    if (format == "CSV") return ".csv";
    return ".vts";
}

} // namespace OWF
