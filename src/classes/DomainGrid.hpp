//  DomainGrid.hpp
//  gridtiler
//
//  Rectangular tile decomposition of a lat/lon extent.
//
//    1 tile : full
//    2 tiles: west | east
//    4 tiles: northwest northeast / southwest southeast
//    8 tiles: nw1 nw2 ne1 ne2 / sw1 sw2 se1 se2
//
//  Latitude index 0 is the northern row. On uneven axes the leading
//  partitions take the extra index. Tiles come back in merge order
//  (latitude band first, then longitude).
//
#ifndef DomainGrid_hpp
#define DomainGrid_hpp

#include "GridTypes.hpp"

#include <vector>

class DomainGrid {
public:
    static bool isValidTileCount(int tile_count);

    /* Throws InvalidTileCount. */
    static std::vector<TileSpec> computeTiles(const GridExtent &extent, int tile_count);

    /* Split [0, n) into parts ranges differing in size by at most one. */
    static std::vector<IndexRange> splitAxis(size_t n, size_t parts);
};

#endif /* DomainGrid_hpp */
