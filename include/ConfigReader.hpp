#ifndef OWF_CONFIG_READER_HPP
#define OWF_CONFIG_READER_HPP

#include "OWF.hpp"
#include <string>
#include <map>
#include <vector>
#include <cstdint>
#include <optional>

namespace OWF {

/**
 * @brief INI-style configuration reader
 *
 * Sections:
 *   [WAVES]       spectral parameters (WaveConfig)
 *   [SURFACE]     query grid (SurfaceConfig)
 *   [SIMULATION]  output times, seed, wave scale, output settings
 *
 * Lines starting with '#' or ';' are comments; '#' also starts an inline
 * comment after a value.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Values from a later file override earlier ones
    bool mergeFile(const std::string& filename);

    // =========================================================================
    // Parsing Methods
    // =========================================================================

    bool parseWaveConfig(WaveConfig& config) const;
    bool parseSurfaceConfig(SurfaceConfig& config) const;
    bool parseSimulationConfig(SimulationConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
              int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    /// Unsigned 64-bit value, empty if the key is absent or malformed
    std::optional<std::uint64_t> getSeed(const std::string& section,
                                         const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    ValidationResult validate() const;

    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace OWF

#endif // OWF_CONFIG_READER_HPP
