#include "ConfigReader.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace OWF {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    auto tokens = split(val, ',');
    for (const auto& token : tokens) {
        try {
            result.push_back(std::stod(token));
        } catch (const std::exception&) {
            std::cerr << "Warning: Cannot parse '" << token << "' as double" << std::endl;
        }
    }

    return result;
}

std::optional<std::uint64_t> ConfigReader::getSeed(const std::string& section,
                                                   const std::string& key) const {
    std::string val = getString(section, key);
    if (val.empty()) return std::nullopt;

    if (val[0] == '-') {
        std::cerr << "Warning: Seed [" << section << "]:" << key
                  << " must be non-negative, ignoring '" << val << "'" << std::endl;
        return std::nullopt;
    }

    try {
        size_t pos = 0;
        unsigned long long seed = std::stoull(val, &pos);
        if (pos != val.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return static_cast<std::uint64_t>(seed);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse seed '" << val << "'" << std::endl;
        return std::nullopt;
    }
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Parsing Methods
// =============================================================================

bool ConfigReader::parseWaveConfig(WaveConfig& config) const {
    if (!hasSection("WAVES")) return false;

    config.count = getInt("WAVES", "count", 32);
    config.delta_f = getDouble("WAVES", "delta_f", 0.02);
    config.peak_frequency = getDouble("WAVES", "peak_frequency", 0.13);
    config.alpha = getDouble("WAVES", "alpha", 0.0081);
    config.gamma = getDouble("WAVES", "gamma", 3.3);
    config.scale = getDouble("WAVES", "scale", 1.0);

    return true;
}

bool ConfigReader::parseSurfaceConfig(SurfaceConfig& config) const {
    if (!hasSection("SURFACE")) return false;

    config.nx = getInt("SURFACE", "nx", 32);
    config.nz = getInt("SURFACE", "nz", 32);
    config.Lx = getDouble("SURFACE", "Lx", 64.0);
    config.Lz = getDouble("SURFACE", "Lz", 64.0);
    config.origin_x = getDouble("SURFACE", "origin_x", 0.0);
    config.origin_z = getDouble("SURFACE", "origin_z", 0.0);
    config.anchor_x = getDouble("SURFACE", "anchor_x", 0.0);
    config.anchor_z = getDouble("SURFACE", "anchor_z", 0.0);

    return true;
}

bool ConfigReader::parseSimulationConfig(SimulationConfig& config) const {
    if (!hasSection("SIMULATION")) return false;

    config.start_time = getDouble("SIMULATION", "start_time", 0.0);
    config.end_time = getDouble("SIMULATION", "end_time", 10.0);
    config.output_interval = getDouble("SIMULATION", "output_interval", 1.0 / 30.0);
    config.output_times = getDoubleArray("SIMULATION", "output_times");

    config.seed = getSeed("SIMULATION", "seed");
    config.wave_scale = getDouble("SIMULATION", "wave_scale", 1.0);

    config.num_threads = getInt("SIMULATION", "num_threads", 0);
    config.write_output = getBool("SIMULATION", "write_output", true);
    config.output_prefix = getString("SIMULATION", "output_prefix", "output/surface");

    std::string format = getString("SIMULATION", "output_format", "VTS");
    std::transform(format.begin(), format.end(), format.begin(), ::toupper);
    config.output_format = format;

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("WAVES")) {
        result.warnings.push_back("No [WAVES] section found - using defaults");
    }
    if (!hasSection("SURFACE")) {
        result.warnings.push_back("No [SURFACE] section found - using defaults");
    }
    if (!hasSection("SIMULATION")) {
        result.warnings.push_back("No [SIMULATION] section found - using defaults");
    }

    if (hasSection("WAVES")) {
        if (getInt("WAVES", "count", 32) <= 0) {
            result.errors.push_back("Invalid wave count (must be > 0)");
            result.valid = false;
        }
        if (getDouble("WAVES", "delta_f", 0.02) <= 0.0) {
            result.errors.push_back("Invalid delta_f (must be > 0)");
            result.valid = false;
        }
        if (getDouble("WAVES", "peak_frequency", 0.13) <= 0.0) {
            result.errors.push_back("Invalid peak_frequency (must be > 0)");
            result.valid = false;
        }
        if (getDouble("WAVES", "gamma", 3.3) < 1.0) {
            result.warnings.push_back("gamma < 1 flattens the spectral peak below Pierson-Moskowitz");
        }
    }

    if (hasSection("SURFACE")) {
        if (getInt("SURFACE", "nx", 32) <= 0 || getInt("SURFACE", "nz", 32) <= 0) {
            result.errors.push_back("Invalid surface grid (nx and nz must be > 0)");
            result.valid = false;
        }
    }

    if (hasSection("SIMULATION")) {
        double t0 = getDouble("SIMULATION", "start_time", 0.0);
        double t1 = getDouble("SIMULATION", "end_time", 10.0);
        if (t1 < t0) {
            result.errors.push_back("end_time must not precede start_time");
            result.valid = false;
        }
        if (getDouble("SIMULATION", "output_interval", 1.0 / 30.0) <= 0.0) {
            result.errors.push_back("Invalid output_interval (must be > 0)");
            result.valid = false;
        }
        if (hasKey("SIMULATION", "seed") && !getSeed("SIMULATION", "seed")) {
            result.errors.push_back("Invalid seed (must be a non-negative integer)");
            result.valid = false;
        }
        if (!hasKey("SIMULATION", "seed")) {
            result.warnings.push_back("No seed given - wave field will not be reproducible");
        }
        std::string format = getString("SIMULATION", "output_format", "VTS");
        std::transform(format.begin(), format.end(), format.begin(), ::toupper);
        if (format != "VTS" && format != "CSV") {
            result.errors.push_back("Unknown output_format '" + format + "' (VTS or CSV)");
            result.valid = false;
        }
    }

    return result;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    file << "# OWF Configuration File\n";
    file << "# All units in SI unless otherwise specified\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[WAVES]\n";
    file << "# JONSWAP spectrum sampled at f = i * delta_f, i = 1..count\n";
    file << "count = 32                            # Number of wave components\n";
    file << "delta_f = 0.02                        # Frequency step (Hz)\n";
    file << "peak_frequency = 0.13                 # Spectral peak (Hz)\n";
    file << "alpha = 0.0081                        # Phillips constant\n";
    file << "gamma = 3.3                           # Peak enhancement (1 = Pierson-Moskowitz)\n";
    file << "scale = 1.0                           # Amplitude multiplier\n\n";

    file << "[SURFACE]\n";
    file << "# Query grid (points along each axis)\n";
    file << "nx = 32\n";
    file << "nz = 32\n\n";
    file << "# Patch size and centre (meters)\n";
    file << "Lx = 64.0\n";
    file << "Lz = 64.0\n";
    file << "origin_x = 0.0\n";
    file << "origin_z = 0.0\n\n";
    file << "# World offset added to every query point\n";
    file << "anchor_x = 0.0\n";
    file << "anchor_z = 0.0\n\n";

    file << "[SIMULATION]\n";
    file << "# Output times (seconds)\n";
    file << "start_time = 0.0\n";
    file << "end_time = 10.0\n";
    file << "output_interval = 0.0333333           # 30 snapshots per second\n";
    file << "# output_times = 0.0, 2.5, 5.0        # Explicit list, overrides output_interval\n\n";
    file << "# Generation\n";
    file << "seed = 42                             # Omit for a non-reproducible field\n";
    file << "wave_scale = 1.0                      # External amplitude scale\n\n";
    file << "# Execution and output\n";
    file << "num_threads = 0                       # 0 = hardware concurrency\n";
    file << "write_output = true\n";
    file << "output_prefix = output/surface\n";
    file << "output_format = VTS                   # VTS (ParaView) or CSV\n";
}

} // namespace OWF
