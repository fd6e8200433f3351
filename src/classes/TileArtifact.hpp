//  TileArtifact.hpp
//  gridtiler
//
//  Temporary per-tile netCDF artifacts and the chunk output file.
//
//  File layout (both kinds): dims time/lat/lon, coordinate variables
//  time(units, calendar), lat, lon, and one float(time, lat, lon) variable
//  per result with _FillValue/units/long_name. netCDF-4 classic model with
//  zlib deflate. Tile artifacts also record their TileSpec as global
//  attributes tile_name, tile_lat_begin/end, tile_lon_begin/end.
//
#ifndef TileArtifact_hpp
#define TileArtifact_hpp

#include "GridTypes.hpp"

#include <string>
#include <vector>

struct TileArtifactHandle {
    std::string path;
    TileSpec tile;
};

struct LoadedTile {
    TileSpec tile;
    GriddedDataset data;
};

/*
 * Owner of every artifact path planned for one chunk. Paths are fixed when
 * the set is created; each planned file is removed exactly once, by clear()
 * or by the destructor, whether or not it was ever written.
 */
class TileArtifactSet {
public:
    TileArtifactSet() = default;
    /* Creates dir if needed. Throws ArtifactIOError. */
    TileArtifactSet(const std::string &dir, const std::string &chunk_label, const std::vector<TileSpec> &tiles);
    ~TileArtifactSet();

    TileArtifactSet(const TileArtifactSet &) = delete;
    TileArtifactSet &operator=(const TileArtifactSet &) = delete;
    TileArtifactSet(TileArtifactSet &&other) noexcept;
    TileArtifactSet &operator=(TileArtifactSet &&other) noexcept;

    size_t size() const { return slots_.size(); }
    const std::string &path(size_t slot) const { return slots_[slot].path; }
    const TileSpec &tile(size_t slot) const { return slots_[slot].tile; }

    /* Distinct slots may be marked from different threads. */
    void markWritten(size_t slot) { written_[slot] = 1; }
    bool isWritten(size_t slot) const { return written_[slot] != 0; }
    /* Handles of written artifacts, in tile order. */
    std::vector<TileArtifactHandle> written() const;

    /* Remove every planned file and forget the paths. */
    void clear();

    /* Process-wide "<pid>_<random>" tag used in artifact names. */
    static const std::string &runId();

private:
    std::vector<TileArtifactHandle> slots_;
    std::vector<char> written_;
};

class TileArtifactIO {
public:
    explicit TileArtifactIO(int deflate_level = 4) : deflate_level_(deflate_level) {}
    virtual ~TileArtifactIO() = default;

    /* Throws ArtifactIOError; a partially written file is removed. */
    virtual void writeTile(const std::string &path, const TileSpec &tile, const GriddedDataset &result) const;
    LoadedTile readTile(const std::string &path) const;

    /* Full-domain output with (1, lat/9, lon/9) chunking. */
    virtual void writeChunk(const std::string &path, const GriddedDataset &result) const;

    GriddedDataset readDataset(const std::string &path) const;

    int deflateLevel() const { return deflate_level_; }

private:
    int deflate_level_;

    void writeDataset(const std::string &path, const GriddedDataset &ds, bool chunk_layout) const;
};

#endif /* TileArtifact_hpp */
