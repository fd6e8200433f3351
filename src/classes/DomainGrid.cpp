#include "DomainGrid.hpp"

#include "Errors.hpp"

bool DomainGrid::isValidTileCount(int tile_count)
{
    return tile_count == 1 || tile_count == 2 || tile_count == 4 || tile_count == 8;
}

std::vector<IndexRange> DomainGrid::splitAxis(size_t n, size_t parts)
{
    std::vector<IndexRange> out;
    if (parts == 0) {
        return out;
    }
    const size_t base = n / parts;
    const size_t rem = n % parts;
    size_t pos = 0;
    for (size_t i = 0; i < parts; i++) {
        const size_t len = base + (i < rem ? 1 : 0);
        out.push_back(IndexRange(pos, pos + len));
        pos += len;
    }
    return out;
}

std::vector<TileSpec> DomainGrid::computeTiles(const GridExtent &extent, int tile_count)
{
    if (!isValidTileCount(tile_count)) {
        throw InvalidTileCount(tile_count, "supported values are 1, 2, 4, 8");
    }
    if (extent.lat_count == 0 || extent.lon_count == 0) {
        throw InvalidTileCount(tile_count, "empty extent " + extent.str());
    }

    size_t lat_parts = 1;
    size_t lon_parts = 1;
    std::vector<std::string> names;
    switch (tile_count) {
        case 1:
            names = {"full"};
            break;
        case 2:
            lon_parts = 2;
            names = {"west", "east"};
            break;
        case 4:
            lat_parts = 2;
            lon_parts = 2;
            names = {"northwest", "northeast", "southwest", "southeast"};
            break;
        case 8:
            lat_parts = 2;
            lon_parts = 4;
            names = {"nw1", "nw2", "ne1", "ne2", "sw1", "sw2", "se1", "se2"};
            break;
    }

    if (extent.lat_count < lat_parts || extent.lon_count < lon_parts) {
        throw InvalidTileCount(tile_count, "extent " + extent.str() + " too small to give every tile a cell");
    }

    const std::vector<IndexRange> lat_r = splitAxis(extent.lat_count, lat_parts);
    const std::vector<IndexRange> lon_r = splitAxis(extent.lon_count, lon_parts);

    std::vector<TileSpec> tiles;
    tiles.reserve((size_t)tile_count);
    for (size_t a = 0; a < lat_parts; a++) {
        for (size_t b = 0; b < lon_parts; b++) {
            TileSpec t;
            t.name = names[a * lon_parts + b];
            t.lat = lat_r[a];
            t.lon = lon_r[b];
            tiles.push_back(t);
        }
    }
    return tiles;
}
