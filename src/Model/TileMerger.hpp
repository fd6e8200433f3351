//  TileMerger.hpp
//  gridtiler
//
//  Reassembles the tile artifacts of one chunk into the full-domain result.
//  Tiles are grouped into latitude bands, joined along longitude within a
//  band, then the bands are stacked. No padding or truncation: any shape
//  disagreement is a DimensionMismatch.
//
#ifndef TileMerger_hpp
#define TileMerger_hpp

#include "GridTypes.hpp"
#include "TileArtifact.hpp"

#include <vector>

class TileMerger {
public:
    explicit TileMerger(const TileArtifactIO &io);

    /* Throws DimensionMismatch, ArtifactIOError. */
    GriddedDataset merge(const std::vector<TileArtifactHandle> &artifacts, const GridExtent &expected) const;

    /* Merge already-loaded tiles. Result names absent from a tile are filled with kFillValue there. */
    static GriddedDataset mergeLoaded(const std::vector<LoadedTile> &tiles, const GridExtent &expected);

private:
    const TileArtifactIO &io_;
};

#endif /* TileMerger_hpp */
