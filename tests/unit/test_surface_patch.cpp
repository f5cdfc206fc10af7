/**
 * @file test_surface_patch.cpp
 * @brief Unit tests for SurfacePatch and ThreadPool updates
 */

#include <gtest/gtest.h>
#include "SurfacePatch.hpp"
#include "DisplacementSampler.hpp"
#include "WaveFieldGenerator.hpp"
#include "PerformanceOptimizations.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <thread>
#include <vector>

using namespace OWF;

class SurfacePatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        WaveConfig wave;
        wave.count = 12;
        wave.delta_f = 0.02;
        wave.peak_frequency = 0.11;
        field = generateWaveField(wave, 555ULL);

        surface.nx = 9;
        surface.nz = 5;
        surface.Lx = 16.0;
        surface.Lz = 8.0;
    }

    std::shared_ptr<const WaveField> field;
    SurfaceConfig surface;
};

TEST_F(SurfacePatchTest, GridLayout) {
    SurfacePatch patch(field, surface);
    ASSERT_EQ(patch.numPoints(), 45u);
    EXPECT_EQ(patch.nx(), 9);
    EXPECT_EQ(patch.nz(), 5);

    const auto& rest = patch.restPositions();
    // Centred on the origin with 2 m spacing
    EXPECT_DOUBLE_EQ(rest[patch.index(0, 0)].x, -8.0);
    EXPECT_DOUBLE_EQ(rest[patch.index(0, 0)].z, -4.0);
    EXPECT_DOUBLE_EQ(rest[patch.index(8, 4)].x, 8.0);
    EXPECT_DOUBLE_EQ(rest[patch.index(8, 4)].z, 4.0);
    EXPECT_DOUBLE_EQ(rest[patch.index(4, 2)].x, 0.0);
    EXPECT_DOUBLE_EQ(rest[patch.index(3, 1)].x - rest[patch.index(2, 1)].x, 2.0);
}

TEST_F(SurfacePatchTest, OriginShiftsGrid) {
    surface.origin_x = 100.0;
    surface.origin_z = -20.0;
    SurfacePatch patch(field, surface);
    EXPECT_DOUBLE_EQ(patch.restPositions()[patch.index(4, 2)].x, 100.0);
    EXPECT_DOUBLE_EQ(patch.restPositions()[patch.index(4, 2)].z, -20.0);
}

TEST_F(SurfacePatchTest, SinglePointGrid) {
    surface.nx = 1;
    surface.nz = 1;
    SurfacePatch patch(field, surface);
    ASSERT_EQ(patch.numPoints(), 1u);
    EXPECT_DOUBLE_EQ(patch.restPositions()[0].x, 0.0);
    EXPECT_DOUBLE_EQ(patch.restPositions()[0].z, 0.0);
}

TEST_F(SurfacePatchTest, InvalidConstruction) {
    EXPECT_THROW(SurfacePatch(nullptr, surface), std::invalid_argument);
    surface.nx = 0;
    EXPECT_THROW(SurfacePatch(field, surface), std::invalid_argument);
}

TEST_F(SurfacePatchTest, UpdateMatchesSampler) {
    SurfacePatch patch(field, surface);
    patch.update(3.5);

    DisplacementSampler sampler(field);
    for (size_t i = 0; i < patch.numPoints(); ++i) {
        Displacement d = sampler.sample(3.5, patch.restPositions()[i]);
        EXPECT_EQ(patch.displacements()[i].x, d.x);
        EXPECT_EQ(patch.displacements()[i].y, d.y);
        EXPECT_EQ(patch.displacements()[i].z, d.z);
        EXPECT_EQ(patch.height(i), d.y);
    }
}

TEST_F(SurfacePatchTest, AnchorOffsetsQueries) {
    SurfacePatch patch(field, surface);
    patch.setAnchor(25.0, -10.0);
    EXPECT_DOUBLE_EQ(patch.anchor().x, 25.0);
    EXPECT_DOUBLE_EQ(patch.anchor().z, -10.0);
    patch.update(1.0);

    DisplacementSampler sampler(field);
    for (size_t i = 0; i < patch.numPoints(); ++i) {
        const SurfacePoint& p = patch.restPositions()[i];
        Displacement d = sampler.sample(1.0, SurfacePoint{p.x + 25.0, p.z - 10.0});
        EXPECT_EQ(patch.height(i), d.y);
    }
}

TEST_F(SurfacePatchTest, AnchorFromConfig) {
    surface.anchor_x = 3.0;
    surface.anchor_z = 4.0;
    SurfacePatch patch(field, surface);
    EXPECT_DOUBLE_EQ(patch.anchor().x, 3.0);
    EXPECT_DOUBLE_EQ(patch.anchor().z, 4.0);
}

TEST_F(SurfacePatchTest, ThreadPoolUpdateMatchesSequential) {
    surface.nx = 33;
    surface.nz = 17;
    SurfacePatch sequential(field, surface);
    SurfacePatch parallel(field, surface);

    Performance::ThreadPool pool(4);
    for (double t : {0.0, 0.75, 12.0}) {
        sequential.update(t);
        parallel.update(t, pool);
        for (size_t i = 0; i < sequential.numPoints(); ++i) {
            EXPECT_EQ(parallel.displacements()[i].x, sequential.displacements()[i].x);
            EXPECT_EQ(parallel.displacements()[i].y, sequential.displacements()[i].y);
            EXPECT_EQ(parallel.displacements()[i].z, sequential.displacements()[i].z);
        }
    }
}

TEST_F(SurfacePatchTest, BufferIsReused) {
    SurfacePatch patch(field, surface);
    const Displacement* data = patch.displacements().data();
    for (int frame = 0; frame < 5; ++frame) {
        patch.update(frame / 30.0);
    }
    EXPECT_EQ(patch.displacements().data(), data);
}

TEST_F(SurfacePatchTest, UpdateRangeTouchesOnlyRange) {
    SurfacePatch patch(field, surface);
    patch.updateRange(2.0, 10, 20);

    for (size_t i = 0; i < patch.numPoints(); ++i) {
        if (i >= 10 && i < 20) continue;
        EXPECT_DOUBLE_EQ(patch.height(i), 0.0);
    }
    // Out-of-range end is clamped
    EXPECT_NO_THROW(patch.updateRange(2.0, 40, 1000));
}

TEST_F(SurfacePatchTest, WorldPositionAndRelativeHeight) {
    SurfacePatch patch(field, surface);
    patch.update(4.0);

    const double peak = field->peakHeight();
    ASSERT_GT(peak, 0.0);

    for (size_t i = 0; i < patch.numPoints(); ++i) {
        auto p = patch.worldPosition(i);
        const auto& rest = patch.restPositions()[i];
        const auto& d = patch.displacements()[i];
        EXPECT_DOUBLE_EQ(p[0], rest.x + d.x);
        EXPECT_DOUBLE_EQ(p[1], d.y);
        EXPECT_DOUBLE_EQ(p[2], rest.z + d.z);
        EXPECT_DOUBLE_EQ(patch.relativeHeight(i), d.y / peak);
    }

    auto range = patch.heightRange();
    EXPECT_LE(range.first, range.second);
    EXPECT_LE(std::abs(range.first), field->totalAmplitude());
}

TEST_F(SurfacePatchTest, FlatFieldRelativeHeightIsZero) {
    auto flat = std::make_shared<WaveField>(std::vector<WaveComponent>{});
    SurfacePatch patch(flat, surface);
    patch.update(1.0);
    EXPECT_DOUBLE_EQ(patch.relativeHeight(0), 0.0);
}

TEST(ThreadPoolTest, ParallelForCoversRangeOnce) {
    Performance::ThreadPool pool(3);
    EXPECT_EQ(pool.numThreads(), 3u);

    std::vector<std::atomic<int>> hits(1000);
    for (auto& h : hits) h = 0;

    pool.parallelFor(0, hits.size(), [&hits](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) hits[i]++;
    });

    for (const auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST(ThreadPoolTest, SmallAndEmptyRanges) {
    Performance::ThreadPool pool(8);
    std::atomic<int> calls{0};

    pool.parallelFor(5, 5, [&calls](size_t, size_t) { calls++; });
    EXPECT_EQ(calls.load(), 0);

    // Fewer items than workers
    std::atomic<size_t> covered{0};
    pool.parallelFor(0, 3, [&covered](size_t begin, size_t end) { covered += end - begin; });
    EXPECT_EQ(covered.load(), 3u);
}

TEST(ThreadPoolTest, ZeroThreadsFallsBackToOne) {
    Performance::ThreadPool pool(0);
    EXPECT_EQ(pool.numThreads(), 1u);
}

TEST(TimerTest, ElapsedIsMonotonic) {
    Performance::Timer timer;
    timer.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    double first = timer.elapsed();
    double second = timer.elapsed();
    double total = timer.stop();

    EXPECT_GE(first, 0.004);
    EXPECT_GE(second, first);
    EXPECT_GE(total, second);
}
