/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "OWF.hpp"
#include <algorithm>
#include <fstream>
#include <cstdio>

using namespace OWF;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit_" + std::to_string(rank) + ".config";

        std::ofstream config(test_config_file);
        config << "# Rough sea state\n";
        config << "[WAVES]\n";
        config << "count = 48\n";
        config << "delta_f = 0.01\n";
        config << "peak_frequency = 0.09   # 11 s peak period\n";
        config << "alpha = 0.0081\n";
        config << "gamma = 2.0\n";
        config << "scale = 1.5\n";
        config << "\n[SURFACE]\n";
        config << "nx = 20\n";
        config << "nz = 10\n";
        config << "Lx = 200.0\n";
        config << "Lz = 100.0\n";
        config << "anchor_x = 5.0\n";
        config << "\n[SIMULATION]\n";
        config << "start_time = 1.0\n";
        config << "end_time = 4.0\n";
        config << "output_interval = 0.5\n";
        config << "seed = 18446744073709551615\n";
        config << "wave_scale = 0.8\n";
        config << "num_threads = 2\n";
        config << "write_output = no\n";
        config << "output_prefix = out/rough\n";
        config << "output_format = csv\n";
        config.close();
    }

    void TearDown() override {
        std::remove(test_config_file.c_str());
    }

    void writeFile(const std::string& name, const std::string& contents) {
        std::ofstream out(name);
        out << contents;
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    bool loaded = reader.loadFile(test_config_file);
    EXPECT_TRUE(loaded) << "Should load config file successfully";
}

TEST_F(ConfigReaderTest, MissingFile) {
    ConfigReader reader;
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, ReadIntegerValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("WAVES", "count", 0), 48);
    EXPECT_EQ(reader.getInt("SURFACE", "nx", 0), 20);
    EXPECT_EQ(reader.getInt("SURFACE", "nz", 0), 10);
}

TEST_F(ConfigReaderTest, ReadDoubleValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_DOUBLE_EQ(reader.getDouble("WAVES", "delta_f", 0.0), 0.01);
    EXPECT_DOUBLE_EQ(reader.getDouble("WAVES", "peak_frequency", 0.0), 0.09);
    EXPECT_DOUBLE_EQ(reader.getDouble("SURFACE", "Lx", 0.0), 200.0);
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    // Non-existent key with default
    EXPECT_EQ(reader.getInt("nonexistent", "key", 42), 42);
    EXPECT_DOUBLE_EQ(reader.getDouble("nonexistent", "key", 3.14), 3.14);
    EXPECT_EQ(reader.getString("WAVES", "missing", "fallback"), "fallback");
}

TEST_F(ConfigReaderTest, HasSection) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasSection("WAVES"));
    EXPECT_TRUE(reader.hasSection("SURFACE"));
    EXPECT_TRUE(reader.hasSection("SIMULATION"));
    EXPECT_FALSE(reader.hasSection("nonexistent"));
    EXPECT_EQ(reader.getSections().size(), 3u);
}

TEST_F(ConfigReaderTest, HasKey) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasKey("WAVES", "gamma"));
    EXPECT_TRUE(reader.hasKey("SURFACE", "anchor_x"));
    EXPECT_FALSE(reader.hasKey("SURFACE", "anchor_z"));

    auto keys = reader.getKeys("SURFACE");
    EXPECT_EQ(keys.size(), 5u);
    EXPECT_NE(std::find(keys.begin(), keys.end(), "Lz"), keys.end());
    EXPECT_TRUE(reader.getKeys("nonexistent").empty());
}

TEST_F(ConfigReaderTest, ParseWaveConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    WaveConfig wave;
    ASSERT_TRUE(reader.parseWaveConfig(wave));
    EXPECT_EQ(wave.count, 48);
    EXPECT_DOUBLE_EQ(wave.delta_f, 0.01);
    EXPECT_DOUBLE_EQ(wave.peak_frequency, 0.09);
    EXPECT_DOUBLE_EQ(wave.alpha, 0.0081);
    EXPECT_DOUBLE_EQ(wave.gamma, 2.0);
    EXPECT_DOUBLE_EQ(wave.scale, 1.5);
}

TEST_F(ConfigReaderTest, ParseSurfaceConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    SurfaceConfig surface;
    ASSERT_TRUE(reader.parseSurfaceConfig(surface));
    EXPECT_EQ(surface.nx, 20);
    EXPECT_EQ(surface.nz, 10);
    EXPECT_DOUBLE_EQ(surface.Lx, 200.0);
    EXPECT_DOUBLE_EQ(surface.Lz, 100.0);
    EXPECT_DOUBLE_EQ(surface.anchor_x, 5.0);
    EXPECT_DOUBLE_EQ(surface.anchor_z, 0.0);
}

TEST_F(ConfigReaderTest, ParseSimulationConfig) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    SimulationConfig sim;
    ASSERT_TRUE(reader.parseSimulationConfig(sim));
    EXPECT_DOUBLE_EQ(sim.start_time, 1.0);
    EXPECT_DOUBLE_EQ(sim.end_time, 4.0);
    EXPECT_DOUBLE_EQ(sim.output_interval, 0.5);
    EXPECT_TRUE(sim.output_times.empty());
    ASSERT_TRUE(sim.seed.has_value());
    EXPECT_EQ(*sim.seed, 18446744073709551615ULL);
    EXPECT_DOUBLE_EQ(sim.wave_scale, 0.8);
    EXPECT_EQ(sim.num_threads, 2);
    EXPECT_FALSE(sim.write_output);
    EXPECT_EQ(sim.output_prefix, "out/rough");
    EXPECT_EQ(sim.output_format, "CSV");
}

TEST_F(ConfigReaderTest, MissingSectionLeavesDefaults) {
    const std::string name = "test_config_partial_" + std::to_string(rank) + ".config";
    writeFile(name, "[WAVES]\ncount = 4\n");

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(name));

    SurfaceConfig surface;
    EXPECT_FALSE(reader.parseSurfaceConfig(surface));
    EXPECT_EQ(surface.nx, 32);

    SimulationConfig sim;
    EXPECT_FALSE(reader.parseSimulationConfig(sim));
    EXPECT_FALSE(sim.seed.has_value());

    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_GE(result.warnings.size(), 2u);

    std::remove(name.c_str());
}

TEST_F(ConfigReaderTest, OutputTimesArray) {
    const std::string name = "test_config_times_" + std::to_string(rank) + ".config";
    writeFile(name, "[SIMULATION]\noutput_times = 0.0, 1.5, 3.25\nseed = 3\n");

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(name));
    SimulationConfig sim;
    ASSERT_TRUE(reader.parseSimulationConfig(sim));
    ASSERT_EQ(sim.output_times.size(), 3u);
    EXPECT_DOUBLE_EQ(sim.output_times[1], 1.5);
    EXPECT_DOUBLE_EQ(sim.output_times[2], 3.25);

    std::remove(name.c_str());
}

TEST_F(ConfigReaderTest, SeedParsing) {
    const std::string name = "test_config_seed_" + std::to_string(rank) + ".config";
    writeFile(name, "[A]\nneg = -5\ntrailing = 12abc\ngood = 0\n");

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(name));
    EXPECT_FALSE(reader.getSeed("A", "neg").has_value());
    EXPECT_FALSE(reader.getSeed("A", "trailing").has_value());
    EXPECT_FALSE(reader.getSeed("A", "missing").has_value());
    ASSERT_TRUE(reader.getSeed("A", "good").has_value());
    EXPECT_EQ(*reader.getSeed("A", "good"), 0u);

    std::remove(name.c_str());
}

TEST_F(ConfigReaderTest, ValidateRejectsBadValues) {
    const std::string name = "test_config_bad_" + std::to_string(rank) + ".config";
    writeFile(name,
              "[WAVES]\ncount = 0\ndelta_f = -0.1\n"
              "[SURFACE]\nnx = 0\n"
              "[SIMULATION]\nstart_time = 5\nend_time = 1\nseed = -1\noutput_format = HDF5\n");

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(name));
    auto result = reader.validate();
    EXPECT_FALSE(result.valid);
    EXPECT_GE(result.errors.size(), 6u);

    std::remove(name.c_str());
}

TEST_F(ConfigReaderTest, ValidateAcceptsFixture) {
    ConfigReader reader;
    reader.loadFile(test_config_file);
    auto result = reader.validate();
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ConfigReaderTest, MergeOverridesValues) {
    const std::string name = "test_config_override_" + std::to_string(rank) + ".config";
    writeFile(name, "[WAVES]\ncount = 8\n[SURFACE]\norigin_z = -3\n");

    ConfigReader reader;
    reader.loadFile(test_config_file);
    ASSERT_TRUE(reader.mergeFile(name));

    EXPECT_EQ(reader.getInt("WAVES", "count", 0), 8);
    EXPECT_DOUBLE_EQ(reader.getDouble("WAVES", "gamma", 0.0), 2.0);
    EXPECT_DOUBLE_EQ(reader.getDouble("SURFACE", "origin_z", 0.0), -3.0);

    std::remove(name.c_str());
}

TEST_F(ConfigReaderTest, GeneratedTemplateIsValid) {
    const std::string name = "test_config_template_" + std::to_string(rank) + ".config";
    ConfigReader::generateTemplate(name);

    ConfigReader reader;
    ASSERT_TRUE(reader.loadFile(name));
    auto result = reader.validate();
    EXPECT_TRUE(result.valid);

    WaveConfig wave;
    EXPECT_TRUE(reader.parseWaveConfig(wave));
    EXPECT_EQ(wave.count, 32);

    SimulationConfig sim;
    EXPECT_TRUE(reader.parseSimulationConfig(sim));
    ASSERT_TRUE(sim.seed.has_value());
    EXPECT_EQ(*sim.seed, 42u);
    EXPECT_EQ(sim.output_format, "VTS");

    std::remove(name.c_str());
}
