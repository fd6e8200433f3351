#include "DomainGrid.hpp"
#include "Errors.hpp"
#include "ReferenceCache.hpp"
#include "TestUtils.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace {

using testutil::TempDir;

const size_t kLat = 6;
const size_t kLon = 8;

float thresholdValue(int doy, size_t i, size_t j)
{
    return (float)(doy * 0.01 + (double)i * 10.0 + (double)j);
}

ReferenceSurface staticSurface(const std::string &name)
{
    ReferenceSurface s;
    s.name = name;
    s.has_doy = false;
    s.ndoy = 1;
    for (size_t c = 0; c < kLat * kLon; c++) {
        s.values.push_back((float)c);
    }
    return s;
}

std::shared_ptr<MemorySurfaceSource> memorySource()
{
    std::shared_ptr<MemorySurfaceSource> src = std::make_shared<MemorySurfaceSource>(GridExtent(kLat, kLon));
    src->add(testutil::makeSurface("tx90p_threshold", kLat, kLon, thresholdValue));
    src->add(staticSurface("land_mask"));
    return src;
}

void expectWindow(const ReferenceSurface &s, const TileSpec &tile)
{
    ASSERT_EQ(tile.lat, s.lat);
    ASSERT_EQ(tile.lon, s.lon);
    ASSERT_EQ(s.ndoy * tile.cells(), s.values.size());
    for (int doy : {1, 59, 200, 366}) {
        for (size_t i = 0; i < tile.lat.size(); i++) {
            for (size_t j = 0; j < tile.lon.size(); j++) {
                ASSERT_EQ(thresholdValue(doy, tile.lat.begin + i, tile.lon.begin + j), s.at(doy, i, j));
            }
        }
    }
}

/* N threads, N tiles, each repeated; every result must equal a lone call. */
void checkConcurrentPurity(const ReferenceCache &cache)
{
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(GridExtent(kLat, kLon), 8);
    std::vector<SurfaceMap> lone;
    for (const TileSpec &t : tiles) {
        lone.push_back(cache.subset(t));
    }

    std::vector<std::vector<SurfaceMap> > got(tiles.size());
    std::vector<std::thread> threads;
    for (size_t k = 0; k < tiles.size(); k++) {
        threads.push_back(std::thread([&, k]() {
            for (int rep = 0; rep < 5; rep++) {
                got[k].push_back(cache.subset(tiles[k]));
            }
        }));
    }
    for (std::thread &th : threads) {
        th.join();
    }

    for (size_t k = 0; k < tiles.size(); k++) {
        ASSERT_EQ(5u, got[k].size());
        for (const SurfaceMap &m : got[k]) {
            ASSERT_EQ(lone[k].size(), m.size());
            for (const auto &it : lone[k]) {
                const ReferenceSurface &a = it.second;
                const ReferenceSurface &b = m.at(it.first);
                EXPECT_EQ(a.lat, b.lat);
                EXPECT_EQ(a.lon, b.lon);
                EXPECT_EQ(a.ndoy, b.ndoy);
                EXPECT_TRUE(testutil::sameValues(a.values, b.values)) << "tile " << tiles[k].name << " " << it.first;
            }
        }
        expectWindow(lone[k].at("tx90p_threshold"), tiles[k]);
    }
}

TEST(ReferenceCacheTest, EmptyCacheGivesEmptySubset)
{
    const ReferenceCache cache;
    EXPECT_TRUE(cache.empty());
    const TileSpec t = DomainGrid::computeTiles(GridExtent(kLat, kLon), 1)[0];
    EXPECT_TRUE(cache.subset(t).empty());
}

TEST(ReferenceCacheTest, SubsetReturnsTileWindow)
{
    const ReferenceCache cache = ReferenceCache::load(memorySource(), {"tx90p_threshold", "land_mask"});
    EXPECT_EQ(2u, cache.names().size());
    EXPECT_EQ(GridExtent(kLat, kLon), cache.extent());

    const TileSpec t = DomainGrid::computeTiles(GridExtent(kLat, kLon), 4)[3];
    const SurfaceMap m = cache.subset(t);
    ASSERT_EQ(2u, m.size());
    expectWindow(m.at("tx90p_threshold"), t);

    const ReferenceSurface &mask = m.at("land_mask");
    EXPECT_FALSE(mask.has_doy);
    ASSERT_EQ(t.cells(), mask.values.size());
    EXPECT_EQ((float)(t.lat.begin * kLon + t.lon.begin), mask.at(150, 0, 0));
}

TEST(ReferenceCacheTest, SubsetValuesAreIndependentCopies)
{
    const ReferenceCache cache = ReferenceCache::load(memorySource(), {"tx90p_threshold"});
    const TileSpec t = DomainGrid::computeTiles(GridExtent(kLat, kLon), 2)[0];
    SurfaceMap first = cache.subset(t);
    first["tx90p_threshold"].values[0] = -999.0f;
    const SurfaceMap second = cache.subset(t);
    EXPECT_EQ(thresholdValue(1, 0, 0), second.at("tx90p_threshold").values[0]);
}

TEST(ReferenceCacheTest, MissingSurfaceFailsLoad)
{
    try {
        ReferenceCache::load(memorySource(), {"tx90p_threshold", "tn10p_threshold"});
        FAIL() << "expected ReferenceDataError";
    } catch (const ReferenceDataError &e) {
        EXPECT_EQ("tn10p_threshold", e.surface());
    }
}

TEST(ReferenceCacheTest, AllowMissingDropsSurface)
{
    const ReferenceCache cache = ReferenceCache::load(memorySource(), {"tx90p_threshold", "tn10p_threshold"}, true);
    ASSERT_EQ(1u, cache.names().size());
    EXPECT_EQ("tx90p_threshold", *cache.names().begin());
}

TEST(ReferenceCacheTest, MemorySourceRejectsWrongSize)
{
    MemorySurfaceSource src(GridExtent(kLat, kLon));
    ReferenceSurface s = staticSurface("short");
    s.values.pop_back();
    EXPECT_THROW(src.add(s), ReferenceDataError);
}

TEST(ReferenceCacheTest, ConcurrentSubsetIsPureInMemory)
{
    const ReferenceCache cache = ReferenceCache::load(memorySource(), {"tx90p_threshold", "land_mask"});
    checkConcurrentPurity(cache);
}

TEST(ReferenceCacheTest, ConcurrentSubsetIsPureFromNetcdf)
{
    TempDir dir;
    const std::string path = dir.file("refs.nc");
    testutil::writeReferenceFile(path,
                                 {testutil::makeSurface("tx90p_threshold", kLat, kLon, thresholdValue),
                                  staticSurface("land_mask")},
                                 kLat,
                                 kLon,
                                 "1981-2000");

    std::shared_ptr<NetcdfSurfaceSource> src = std::make_shared<NetcdfSurfaceSource>(path, "lat", "lon", "1981-2000");
    EXPECT_EQ("1981-2000", src->baselinePeriod());
    EXPECT_EQ(GridExtent(kLat, kLon), src->extent());

    const SurfaceLayout lay = src->layout("tx90p_threshold");
    EXPECT_TRUE(lay.exists);
    EXPECT_TRUE(lay.has_doy);
    EXPECT_EQ(366u, lay.ndoy);
    EXPECT_FALSE(src->layout("land_mask").has_doy);
    EXPECT_FALSE(src->layout("nope").exists);

    const ReferenceCache cache = ReferenceCache::load(src, {"tx90p_threshold", "land_mask"});
    checkConcurrentPurity(cache);
}

TEST(ReferenceCacheTest, NetcdfMissingSurfaceFailsLoad)
{
    TempDir dir;
    const std::string path = dir.file("refs.nc");
    testutil::writeReferenceFile(path, {staticSurface("land_mask")}, kLat, kLon, "");
    std::shared_ptr<NetcdfSurfaceSource> src = std::make_shared<NetcdfSurfaceSource>(path, "lat", "lon", "1981-2000");
    EXPECT_THROW(ReferenceCache::load(src, {"tx90p_threshold"}), ReferenceDataError);
}

TEST(ReferenceCacheTest, AllMissingSurfaceStillLoads)
{
    std::shared_ptr<MemorySurfaceSource> src = std::make_shared<MemorySurfaceSource>(GridExtent(kLat, kLon));
    src->add(testutil::makeSurface("empty_threshold", kLat, kLon, [](int, size_t, size_t) { return kFillValue; }));
    EXPECT_TRUE(src->allMissing("empty_threshold"));
    const ReferenceCache cache = ReferenceCache::load(src, {"empty_threshold"});
    EXPECT_EQ(1u, cache.names().size());
}

TEST(ReferenceCacheTest, EmptyDayOfYearAxisIsRejected)
{
    ReferenceSurface s;
    s.name = "tx90p_threshold";
    s.has_doy = true;
    s.ndoy = 0;
    MemorySurfaceSource mem(GridExtent(kLat, kLon));
    EXPECT_THROW(mem.add(s), ReferenceDataError);

    // An unlimited dayofyear dimension with no records written.
    TempDir dir;
    const std::string path = dir.file("refs.nc");
    {
        std::lock_guard<std::mutex> lock(ncLibraryMutex());
        NcFile f;
        f.create(path, NC_NETCDF4 | NC_CLASSIC_MODEL | NC_CLOBBER);
        int dims[3] = {-1, -1, -1};
        int varid = -1;
        ncCheck(nc_def_dim(f.id(), "dayofyear", NC_UNLIMITED, &dims[0]), "nc_def_dim", path);
        ncCheck(nc_def_dim(f.id(), "lat", kLat, &dims[1]), "nc_def_dim", path);
        ncCheck(nc_def_dim(f.id(), "lon", kLon, &dims[2]), "nc_def_dim", path);
        ncCheck(nc_def_var(f.id(), "tx90p_threshold", NC_FLOAT, 3, dims, &varid), "nc_def_var", path);
        ncCheck(nc_enddef(f.id()), "nc_enddef", path);
        f.close();
    }
    std::shared_ptr<NetcdfSurfaceSource> src = std::make_shared<NetcdfSurfaceSource>(path, "lat", "lon", "");
    try {
        ReferenceCache::load(src, {"tx90p_threshold"});
        FAIL() << "expected ReferenceDataError";
    } catch (const ReferenceDataError &e) {
        EXPECT_EQ("tx90p_threshold", e.surface());
    }
}

} // namespace
