#include "DomainGrid.hpp"
#include "Errors.hpp"
#include "TestUtils.hpp"
#include "TileArtifact.hpp"
#include "TileMerger.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

namespace {

using testutil::TempDir;

/* Full-domain reference result with two steps and two variables. */
GriddedDataset fullResult(size_t nlat, size_t nlon)
{
    GriddedDataset ds;
    ds.time = {0.0, 366.0};
    ds.time_units = testutil::kDayUnits;
    for (size_t i = 0; i < nlat; i++) {
        ds.lat.push_back(50.0 - 0.5 * (double)i);
    }
    for (size_t j = 0; j < nlon; j++) {
        ds.lon.push_back(-110.0 + 0.5 * (double)j);
    }
    DataVar a;
    DataVar b;
    a.units = "degC";
    b.units = "days";
    for (size_t c = 0; c < ds.frameSize(); c++) {
        a.values.push_back((float)c);
        b.values.push_back((float)(c % 7));
    }
    ds.vars["tas_mean"] = a;
    ds.vars["frost_days"] = b;
    return ds;
}

std::vector<LoadedTile> cut(const GriddedDataset &full, const std::vector<TileSpec> &tiles)
{
    std::vector<LoadedTile> out;
    for (const TileSpec &t : tiles) {
        LoadedTile lt;
        lt.tile = t;
        lt.data = full.slice(t.lat, t.lon);
        out.push_back(lt);
    }
    return out;
}

TEST(TileMergerTest, ReassemblesEveryTiling)
{
    const GriddedDataset full = fullResult(7, 9);
    for (int tc : {1, 2, 4, 8}) {
        std::vector<LoadedTile> tiles = cut(full, DomainGrid::computeTiles(full.extent(), tc));
        // Merge must not depend on the order tiles finished in.
        std::reverse(tiles.begin(), tiles.end());

        const GriddedDataset merged = TileMerger::mergeLoaded(tiles, full.extent());
        EXPECT_EQ(full.lat, merged.lat) << tc;
        EXPECT_EQ(full.lon, merged.lon) << tc;
        EXPECT_EQ(full.time, merged.time) << tc;
        ASSERT_EQ(2u, merged.vars.size());
        for (const auto &it : full.vars) {
            EXPECT_TRUE(testutil::sameValues(it.second.values, merged.vars.at(it.first).values)) << it.first << " " << tc;
            EXPECT_EQ(it.second.units, merged.vars.at(it.first).units);
        }
    }
}

TEST(TileMergerTest, MissingResultIsFilledOnThatTile)
{
    const GriddedDataset full = fullResult(6, 8);
    const std::vector<TileSpec> specs = DomainGrid::computeTiles(full.extent(), 4);
    std::vector<LoadedTile> tiles = cut(full, specs);
    tiles[0].data.vars.erase("frost_days");

    const GriddedDataset merged = TileMerger::mergeLoaded(tiles, full.extent());
    const std::vector<float> &v = merged.vars.at("frost_days").values;
    for (size_t t = 0; t < merged.nt(); t++) {
        for (size_t i = 0; i < 6; i++) {
            for (size_t j = 0; j < 8; j++) {
                const float got = v[merged.index(t, i, j)];
                if (i < 3 && j < 4) {
                    EXPECT_TRUE(isMissing(got));
                } else {
                    EXPECT_EQ(full.vars.at("frost_days").values[full.index(t, i, j)], got);
                }
            }
        }
    }
}

TEST(TileMergerTest, GapIsDimensionMismatch)
{
    const GriddedDataset full = fullResult(6, 8);
    std::vector<LoadedTile> tiles = cut(full, DomainGrid::computeTiles(full.extent(), 4));
    tiles.erase(tiles.begin() + 1);
    EXPECT_THROW(TileMerger::mergeLoaded(tiles, full.extent()), DimensionMismatch);

    std::vector<LoadedTile> rows = cut(full, DomainGrid::computeTiles(full.extent(), 4));
    rows.erase(rows.begin(), rows.begin() + 2);
    EXPECT_THROW(TileMerger::mergeLoaded(rows, full.extent()), DimensionMismatch);
}

TEST(TileMergerTest, OverlapIsDimensionMismatch)
{
    const GriddedDataset full = fullResult(6, 8);
    std::vector<TileSpec> specs = DomainGrid::computeTiles(full.extent(), 2);
    specs[1].lon = IndexRange(3, 8);
    const std::vector<LoadedTile> tiles = cut(full, specs);
    EXPECT_THROW(TileMerger::mergeLoaded(tiles, full.extent()), DimensionMismatch);
}

TEST(TileMergerTest, WrongExpectedExtentIsDimensionMismatch)
{
    const GriddedDataset full = fullResult(6, 8);
    const std::vector<LoadedTile> tiles = cut(full, DomainGrid::computeTiles(full.extent(), 4));
    try {
        TileMerger::mergeLoaded(tiles, GridExtent(6, 9));
        FAIL() << "expected DimensionMismatch";
    } catch (const DimensionMismatch &e) {
        EXPECT_EQ(GridExtent(6, 9).str(), e.expected());
        EXPECT_EQ(GridExtent(6, 8).str(), e.actual());
    }
}

TEST(TileMergerTest, TimeAxisDisagreementIsDimensionMismatch)
{
    const GriddedDataset full = fullResult(6, 8);
    std::vector<LoadedTile> tiles = cut(full, DomainGrid::computeTiles(full.extent(), 2));
    tiles[1].data.time[1] = 365.0;
    EXPECT_THROW(TileMerger::mergeLoaded(tiles, full.extent()), DimensionMismatch);
}

TEST(TileMergerTest, EmptyInputIsDimensionMismatch)
{
    EXPECT_THROW(TileMerger::mergeLoaded(std::vector<LoadedTile>(), GridExtent(6, 8)), DimensionMismatch);
}

TEST(TileMergerTest, MergesArtifactsFromDisk)
{
    TempDir dir;
    const GriddedDataset full = fullResult(6, 8);
    const std::vector<TileSpec> specs = DomainGrid::computeTiles(full.extent(), 4);
    const TileArtifactIO io;

    TileArtifactSet set(dir.file("tiles"), "2000", specs);
    for (size_t k = 0; k < specs.size(); k++) {
        io.writeTile(set.path(k), specs[k], full.slice(specs[k].lat, specs[k].lon));
        set.markWritten(k);
    }
    const TileMerger merger(io);
    const GriddedDataset merged = merger.merge(set.written(), full.extent());
    EXPECT_TRUE(testutil::sameValues(full.vars.at("tas_mean").values, merged.vars.at("tas_mean").values));
    EXPECT_EQ(0u, merged.text_attrs.count("tile_name"));

    // A handle whose TileSpec disagrees with what the file recorded.
    std::vector<TileArtifactHandle> handles = set.written();
    handles[0].tile.lon = IndexRange(0, 3);
    EXPECT_THROW(merger.merge(handles, full.extent()), DimensionMismatch);
}

} // namespace
