#include "DomainGrid.hpp"
#include "Errors.hpp"
#include "PathUtils.hpp"
#include "TestUtils.hpp"
#include "TileArtifact.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

namespace {

using testutil::TempDir;

GriddedDataset tileResult(const TileSpec &tile)
{
    GriddedDataset ds;
    ds.time = {0.0, 366.0};
    ds.time_units = testutil::kDayUnits;
    ds.calendar = "standard";
    for (size_t i = 0; i < tile.lat.size(); i++) {
        ds.lat.push_back(50.0 - 0.5 * (double)(tile.lat.begin + i));
    }
    for (size_t j = 0; j < tile.lon.size(); j++) {
        ds.lon.push_back(-110.0 + 0.5 * (double)(tile.lon.begin + j));
    }
    DataVar v;
    v.units = "degC";
    v.long_name = "annual mean of tas";
    for (size_t c = 0; c < ds.frameSize(); c++) {
        v.values.push_back((float)c * 0.5f);
    }
    v.values[1] = kFillValue;
    ds.vars["tas_mean"] = v;
    ds.text_attrs["history"] = "unit test";
    return ds;
}

TEST(TileArtifactTest, TileRoundTripKeepsValuesAndSpec)
{
    TempDir dir;
    const TileSpec tile = DomainGrid::computeTiles(GridExtent(6, 8), 4)[3];
    const GriddedDataset ds = tileResult(tile);
    const TileArtifactIO io;
    const std::string path = dir.file("t.nc");

    io.writeTile(path, tile, ds);
    const LoadedTile back = io.readTile(path);

    EXPECT_EQ("southeast", back.tile.name);
    EXPECT_EQ(tile.lat, back.tile.lat);
    EXPECT_EQ(tile.lon, back.tile.lon);
    EXPECT_EQ(ds.time, back.data.time);
    EXPECT_EQ(ds.lat, back.data.lat);
    EXPECT_EQ(ds.lon, back.data.lon);
    EXPECT_EQ(ds.time_units, back.data.time_units);
    EXPECT_EQ("standard", back.data.calendar);
    ASSERT_TRUE(back.data.hasVar("tas_mean"));
    const DataVar &v = back.data.vars.at("tas_mean");
    EXPECT_EQ("degC", v.units);
    EXPECT_EQ("annual mean of tas", v.long_name);
    EXPECT_TRUE(testutil::sameValues(ds.vars.at("tas_mean").values, v.values));
    EXPECT_TRUE(isMissing(v.values[1]));

    EXPECT_EQ("unit test", back.data.text_attrs.at("history"));
    EXPECT_EQ(0u, back.data.text_attrs.count("tile_name"));
    EXPECT_EQ(0u, back.data.int_attrs.count("tile_lat_begin"));
}

TEST(TileArtifactTest, ReadTileRejectsPlainDataset)
{
    TempDir dir;
    const TileSpec tile = DomainGrid::computeTiles(GridExtent(6, 8), 1)[0];
    const TileArtifactIO io;
    const std::string path = dir.file("chunk.nc");
    io.writeChunk(path, tileResult(tile));
    EXPECT_THROW(io.readTile(path), ArtifactIOError);
    EXPECT_NO_THROW(io.readDataset(path));
}

TEST(TileArtifactTest, ShapeMismatchLeavesNoFile)
{
    TempDir dir;
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(GridExtent(6, 8), 4);
    const TileArtifactIO io;
    const std::string path = dir.file("bad.nc");

    EXPECT_THROW(io.writeTile(path, tiles[0], tileResult(tiles[0]).slice(IndexRange(0, 2), IndexRange(0, 4))),
                 DimensionMismatch);
    EXPECT_FALSE(fileExists(path));

    GriddedDataset short_var = tileResult(tiles[0]);
    short_var.vars["tas_mean"].values.pop_back();
    EXPECT_THROW(io.writeTile(path, tiles[0], short_var), DimensionMismatch);
    EXPECT_FALSE(fileExists(path));
}

TEST(TileArtifactTest, SetPlansUniquePathsInsideDir)
{
    TempDir dir;
    const std::string tile_dir = dir.file("tiles");
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(GridExtent(8, 8), 8);

    TileArtifactSet a(tile_dir, "2000-2001", tiles);
    TileArtifactSet b(tile_dir, "2000-2001", tiles);
    ASSERT_EQ(tiles.size(), a.size());

    std::set<std::string> seen;
    for (size_t k = 0; k < a.size(); k++) {
        EXPECT_EQ(tile_dir, dirnameOf(a.path(k)));
        EXPECT_EQ(tiles[k].name, a.tile(k).name);
        EXPECT_NE(std::string::npos, basenameOf(a.path(k)).find(tiles[k].name));
        seen.insert(a.path(k));
        seen.insert(b.path(k));
    }
    EXPECT_EQ(2 * tiles.size(), seen.size());
}

TEST(TileArtifactTest, SetRemovesFilesOnDestruction)
{
    TempDir dir;
    const std::string tile_dir = dir.file("tiles");
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(GridExtent(6, 8), 4);
    const TileArtifactIO io;
    {
        TileArtifactSet set(tile_dir, "2000", tiles);
        for (size_t k = 0; k < 2; k++) {
            io.writeTile(set.path(k), tiles[k], tileResult(tiles[k]));
            set.markWritten(k);
        }
        EXPECT_EQ(2u, testutil::listFiles(tile_dir).size());

        const std::vector<TileArtifactHandle> w = set.written();
        ASSERT_EQ(2u, w.size());
        EXPECT_EQ("northwest", w[0].tile.name);
        EXPECT_EQ("northeast", w[1].tile.name);
        EXPECT_FALSE(set.isWritten(2));
    }
    EXPECT_TRUE(testutil::listFiles(tile_dir).empty());
}

TEST(TileArtifactTest, MovedSetOwnsFiles)
{
    TempDir dir;
    const std::string tile_dir = dir.file("tiles");
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(GridExtent(6, 8), 2);
    const TileArtifactIO io;

    TileArtifactSet outer;
    {
        TileArtifactSet inner(tile_dir, "2000", tiles);
        io.writeTile(inner.path(0), tiles[0], tileResult(tiles[0]));
        inner.markWritten(0);
        outer = std::move(inner);
    }
    ASSERT_EQ(2u, outer.size());
    EXPECT_TRUE(outer.isWritten(0));
    EXPECT_EQ(1u, testutil::listFiles(tile_dir).size());

    outer.clear();
    EXPECT_EQ(0u, outer.size());
    EXPECT_TRUE(testutil::listFiles(tile_dir).empty());
}

TEST(TileArtifactTest, ChunkFileKeepsGlobalAttributes)
{
    TempDir dir;
    const TileSpec tile = DomainGrid::computeTiles(GridExtent(18, 27), 1)[0];
    GriddedDataset ds = tileResult(tile);
    ds.int_attrs["tile_count"] = 4;
    ds.text_attrs["time_range"] = "2000-2001";

    const TileArtifactIO io(6);
    EXPECT_EQ(6, io.deflateLevel());
    const std::string path = dir.file("out.nc");
    io.writeChunk(path, ds);

    const GriddedDataset back = io.readDataset(path);
    EXPECT_EQ(4, back.int_attrs.at("tile_count"));
    EXPECT_EQ("2000-2001", back.text_attrs.at("time_range"));
    EXPECT_EQ(GridExtent(18, 27), back.extent());
    EXPECT_TRUE(testutil::sameValues(ds.vars.at("tas_mean").values, back.vars.at("tas_mean").values));
}

} // namespace
