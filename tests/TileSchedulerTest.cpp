#include "DomainGrid.hpp"
#include "Errors.hpp"
#include "TestUtils.hpp"
#include "TileArtifact.hpp"
#include "TileScheduler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using testutil::TempDir;

SchedulerOptions schedulerOptions(const TempDir &dir, int workers)
{
    SchedulerOptions opt;
    opt.tile_dir = dir.file("tiles");
    opt.worker_count = workers;
    opt.max_workers = 8;
    opt.worker.retry_backoff_ms = 1;
    return opt;
}

float cellId(int, size_t i, size_t j)
{
    return (float)(i * 100 + j);
}

/* Throws unless refs hold exactly the window of the slice it is given. */
class WindowCheckingCalculator final : public Calculator {
public:
    std::string name() const override { return "WindowCheckingCalculator"; }
    std::set<std::string> referenceNames() const override { return {"cell_threshold"}; }

    CalculationOutput compute(const GriddedDataset &slice, const SurfaceMap &refs) const override
    {
        const ReferenceSurface &s = refs.at("cell_threshold");
        if (s.nlat() != slice.nlat() || s.nlon() != slice.nlon()) {
            throw std::runtime_error("reference window does not match the slice");
        }
        const size_t i0 = (size_t)std::lround((50.0 - slice.lat.front()) / 0.5);
        const size_t j0 = (size_t)std::lround((slice.lon.front() + 110.0) / 0.5);
        if (s.at(1, 0, 0) != cellId(1, i0, j0)) {
            throw std::runtime_error("reference window is offset");
        }
        return testutil::annualMean(slice, "tas", "Y");
    }
};

/* Sleeps, then throws on the tile starting at column 0. */
class SlowThrowingCalculator final : public Calculator {
public:
    explicit SlowThrowingCalculator(int delay_ms) : delay_ms_(delay_ms) {}

    std::string name() const override { return "SlowThrowingCalculator"; }
    std::set<std::string> referenceNames() const override { return std::set<std::string>(); }

    CalculationOutput compute(const GriddedDataset &slice, const SurfaceMap &) const override
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        if (slice.lon.front() == -110.0) {
            throw std::runtime_error("late failure");
        }
        return testutil::annualMean(slice, "tas", "Y");
    }

private:
    int delay_ms_;
};

TEST(TileSchedulerTest, AllTilesSucceed)
{
    TempDir dir;
    const GriddedDataset input = testutil::makeDaily(2000, 2000, 6, 8);
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(input.extent(), 4);
    const testutil::SelectiveFailureCalculator calc(-1.0, -1.0);
    const TileArtifactIO io;
    TileScheduler sched(io, schedulerOptions(dir, 0));
    EXPECT_EQ(CHUNK_PENDING, sched.state());

    {
        TileArtifactSet artifacts = sched.runChunk(input, tiles, ReferenceCache(), calc, "2000");
        EXPECT_EQ(CHUNK_ALL_SUCCEEDED, sched.state());
        const std::vector<TileArtifactHandle> written = artifacts.written();
        ASSERT_EQ(4u, written.size());
        for (size_t k = 0; k < tiles.size(); k++) {
            EXPECT_EQ(tiles[k].name, written[k].tile.name);
        }
        EXPECT_EQ(4u, testutil::listFiles(dir.file("tiles")).size());
        artifacts.clear();
        EXPECT_TRUE(testutil::listFiles(dir.file("tiles")).empty());
    }
    EXPECT_STREQ("AllSucceeded", ChunkStateName(sched.state()));
}

TEST(TileSchedulerTest, FailuresAreCollectedInTileOrder)
{
    TempDir dir;
    const GriddedDataset input = testutil::makeDaily(2000, 2000, 6, 8);
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(input.extent(), 4);
    // Fails northeast and southeast (both start at column 4).
    const testutil::ThrowingCalculator calc({input.lon[4]});
    const TileArtifactIO io;
    TileScheduler sched(io, schedulerOptions(dir, 4));

    try {
        sched.runChunk(input, tiles, ReferenceCache(), calc, "2000");
        FAIL() << "expected ChunkTilesFailed";
    } catch (const ChunkTilesFailed &e) {
        ASSERT_EQ(2u, e.failures().size());
        EXPECT_EQ("northeast", e.failures()[0].tile_name);
        EXPECT_EQ("southeast", e.failures()[1].tile_name);
        EXPECT_NE(std::string::npos, e.failures()[0].message.find("boom"));
    }
    EXPECT_EQ(CHUNK_PARTIALLY_FAILED, sched.state());
    EXPECT_TRUE(testutil::listFiles(dir.file("tiles")).empty());
}

TEST(TileSchedulerTest, NonStandardExceptionStaysInsideTheChunk)
{
    TempDir dir;
    const GriddedDataset input = testutil::makeDaily(2000, 2000, 6, 8);
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(input.extent(), 4);
    // Throws int on northwest and southwest (both start at column 0).
    const testutil::IntThrowingCalculator calc({input.lon[0]});
    const TileArtifactIO io;
    TileScheduler sched(io, schedulerOptions(dir, 4));

    try {
        sched.runChunk(input, tiles, ReferenceCache(), calc, "2000");
        FAIL() << "expected ChunkTilesFailed";
    } catch (const ChunkTilesFailed &e) {
        ASSERT_EQ(2u, e.failures().size());
        EXPECT_EQ("northwest", e.failures()[0].tile_name);
        EXPECT_EQ("southwest", e.failures()[1].tile_name);
        EXPECT_NE(std::string::npos, e.failures()[0].message.find("unknown exception"));
    }
    EXPECT_EQ(CHUNK_PARTIALLY_FAILED, sched.state());
    EXPECT_TRUE(testutil::listFiles(dir.file("tiles")).empty());
}

TEST(TileSchedulerTest, EachTileGetsItsReferenceWindow)
{
    TempDir dir;
    const GriddedDataset input = testutil::makeDaily(2000, 2000, 6, 8);
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(input.extent(), 8);

    std::shared_ptr<MemorySurfaceSource> src = std::make_shared<MemorySurfaceSource>(input.extent());
    src->add(testutil::makeSurface("cell_threshold", 6, 8, cellId));
    const ReferenceCache refs = ReferenceCache::load(src, {"cell_threshold"});

    const WindowCheckingCalculator calc;
    const TileArtifactIO io;
    TileScheduler sched(io, schedulerOptions(dir, 4));
    TileArtifactSet artifacts = sched.runChunk(input, tiles, refs, calc, "2000");
    EXPECT_EQ(8u, artifacts.written().size());
}

TEST(TileSchedulerTest, TimeoutDiscardsChunk)
{
    TempDir dir;
    const GriddedDataset input = testutil::makeDaily(2000, 2000, 6, 8);
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(input.extent(), 4);
    const testutil::SlowCalculator calc(200);
    const TileArtifactIO io;
    SchedulerOptions opt = schedulerOptions(dir, 1);
    opt.timeout_sec = 0.05;
    TileScheduler sched(io, opt);

    try {
        sched.runChunk(input, tiles, ReferenceCache(), calc, "2000");
        FAIL() << "expected ChunkTimeoutExceeded";
    } catch (const ChunkTimeoutExceeded &e) {
        EXPECT_EQ(4u, e.discardedTiles());
    }
    EXPECT_EQ(CHUNK_PARTIALLY_FAILED, sched.state());
    EXPECT_TRUE(testutil::listFiles(dir.file("tiles")).empty());
}

TEST(TileSchedulerTest, TileFailureOutranksTimeout)
{
    TempDir dir;
    const GriddedDataset input = testutil::makeDaily(2000, 2000, 6, 8);
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(input.extent(), 2);
    const SlowThrowingCalculator calc(150);
    const TileArtifactIO io;
    SchedulerOptions opt = schedulerOptions(dir, 1);
    opt.timeout_sec = 0.05;
    TileScheduler sched(io, opt);

    // west fails after the deadline, east is never started.
    try {
        sched.runChunk(input, tiles, ReferenceCache(), calc, "2000");
        FAIL() << "expected ChunkTilesFailed";
    } catch (const ChunkTilesFailed &e) {
        ASSERT_EQ(1u, e.failures().size());
        EXPECT_EQ("west", e.failures()[0].tile_name);
    }
    EXPECT_TRUE(testutil::listFiles(dir.file("tiles")).empty());
}

TEST(TileSchedulerTest, HugeTimeoutNeverExpires)
{
    TempDir dir;
    const GriddedDataset input = testutil::makeDaily(2000, 2000, 6, 8);
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(input.extent(), 4);
    const testutil::SelectiveFailureCalculator calc(-1.0, -1.0);
    const TileArtifactIO io;

    for (double timeout : {1e10, 1e300}) {
        SchedulerOptions opt = schedulerOptions(dir, 2);
        opt.timeout_sec = timeout;
        TileScheduler sched(io, opt);
        TileArtifactSet artifacts = sched.runChunk(input, tiles, ReferenceCache(), calc, "2000");
        EXPECT_EQ(CHUNK_ALL_SUCCEEDED, sched.state()) << timeout;
        EXPECT_EQ(4u, artifacts.written().size()) << timeout;
    }
}

TEST(TileSchedulerTest, ResolveWorkerCount)
{
    EXPECT_EQ(4, TileScheduler::resolveWorkerCount(0, 8, 4));
    EXPECT_EQ(8, TileScheduler::resolveWorkerCount(0, 8, 8));
    EXPECT_EQ(2, TileScheduler::resolveWorkerCount(0, 2, 8));
    EXPECT_EQ(3, TileScheduler::resolveWorkerCount(3, 8, 8));
    EXPECT_EQ(4, TileScheduler::resolveWorkerCount(16, 8, 4));
    EXPECT_EQ(1, TileScheduler::resolveWorkerCount(0, 8, 1));
    EXPECT_EQ(1, TileScheduler::resolveWorkerCount(-5, 0, 0));
}

} // namespace
