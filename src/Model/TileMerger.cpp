#include "TileMerger.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace {

static std::string rangeStr(const IndexRange &r)
{
    std::ostringstream oss;
    oss << "[" << r.begin << "," << r.end << ")";
    return oss.str();
}

static std::string tileStr(const TileSpec &t)
{
    return t.name + " lat" + rangeStr(t.lat) + " lon" + rangeStr(t.lon);
}

static void checkTileShape(const LoadedTile &lt)
{
    const GriddedDataset &d = lt.data;
    if (d.nlat() != lt.tile.lat.size() || d.nlon() != lt.tile.lon.size()) {
        std::ostringstream act;
        act << "(lat=" << d.nlat() << ", lon=" << d.nlon() << ") in tile " << lt.tile.name;
        throw DimensionMismatch(GridExtent(lt.tile.lat.size(), lt.tile.lon.size()).str() + " for " + tileStr(lt.tile),
                                act.str());
    }
    for (const auto &it : d.vars) {
        if (it.second.values.size() != d.frameSize()) {
            throw DimensionMismatch(std::to_string(d.frameSize()) + " values for " + it.first + " in tile " + lt.tile.name,
                                    std::to_string(it.second.values.size()));
        }
    }
}

} // namespace

TileMerger::TileMerger(const TileArtifactIO &io) : io_(io)
{
}

GriddedDataset TileMerger::merge(const std::vector<TileArtifactHandle> &artifacts, const GridExtent &expected) const
{
    std::vector<LoadedTile> tiles;
    tiles.reserve(artifacts.size());
    for (const TileArtifactHandle &h : artifacts) {
        LoadedTile lt = io_.readTile(h.path);
        if (lt.tile.lat != h.tile.lat || lt.tile.lon != h.tile.lon) {
            throw DimensionMismatch("artifact " + h.path + " for " + tileStr(h.tile), "recorded " + tileStr(lt.tile));
        }
        tiles.push_back(std::move(lt));
    }
    return mergeLoaded(tiles, expected);
}

GriddedDataset TileMerger::mergeLoaded(const std::vector<LoadedTile> &tiles, const GridExtent &expected)
{
    if (tiles.empty()) {
        throw DimensionMismatch(expected.str(), GridExtent().str() + " (no tiles)");
    }

    const GriddedDataset &first = tiles.front().data;
    for (const LoadedTile &lt : tiles) {
        checkTileShape(lt);
        if (lt.data.time != first.time) {
            throw DimensionMismatch("time axis of " + std::to_string(first.nt()) + " step(s) from tile " +
                                        tiles.front().tile.name,
                                    std::to_string(lt.data.nt()) + " differing step(s) in tile " + lt.tile.name);
        }
    }

    // Latitude bands keyed by their first row, tiles in each band ordered by longitude.
    std::map<size_t, std::vector<const LoadedTile *> > bands;
    for (const LoadedTile &lt : tiles) {
        bands[lt.tile.lat.begin].push_back(&lt);
    }

    size_t lat_pos = 0;
    size_t width = 0;
    for (auto &band : bands) {
        std::vector<const LoadedTile *> &row = band.second;
        std::sort(row.begin(), row.end(), [](const LoadedTile *a, const LoadedTile *b) {
            return a->tile.lon.begin < b->tile.lon.begin;
        });
        const IndexRange lat_r = row.front()->tile.lat;
        if (lat_r.begin != lat_pos) {
            throw DimensionMismatch(expected.str(),
                                    "latitude band " + rangeStr(lat_r) + " does not continue from row " +
                                        std::to_string(lat_pos));
        }
        size_t lon_pos = 0;
        for (const LoadedTile *lt : row) {
            if (lt->tile.lat != lat_r) {
                throw DimensionMismatch("band lat" + rangeStr(lat_r), tileStr(lt->tile));
            }
            if (lt->tile.lon.begin != lon_pos) {
                throw DimensionMismatch(expected.str(),
                                        "band lat" + rangeStr(lat_r) + ": " + tileStr(lt->tile) +
                                            " does not continue from column " + std::to_string(lon_pos));
            }
            lon_pos = lt->tile.lon.end;
        }
        if (width != 0 && lon_pos != width) {
            throw DimensionMismatch(expected.str(),
                                    "band lat" + rangeStr(lat_r) + " spans " + std::to_string(lon_pos) +
                                        " column(s), previous bands span " + std::to_string(width));
        }
        width = lon_pos;
        lat_pos = lat_r.end;
    }

    const GridExtent actual(lat_pos, width);
    if (actual != expected) {
        throw DimensionMismatch(expected.str(), actual.str());
    }

    GriddedDataset out;
    out.time = first.time;
    out.time_units = first.time_units;
    out.calendar = first.calendar;
    out.text_attrs = first.text_attrs;
    out.int_attrs = first.int_attrs;
    out.lat.assign(expected.lat_count, 0.0);
    out.lon.assign(expected.lon_count, 0.0);

    std::set<std::string> names;
    for (const LoadedTile &lt : tiles) {
        for (const auto &it : lt.data.vars) {
            if (names.insert(it.first).second) {
                DataVar v;
                v.units = it.second.units;
                v.long_name = it.second.long_name;
                v.values.assign(out.nt() * expected.cells(), kFillValue);
                out.vars[it.first] = std::move(v);
            }
        }
    }

    const size_t nt = out.nt();
    for (const LoadedTile &lt : tiles) {
        const TileSpec &t = lt.tile;
        std::copy(lt.data.lat.begin(), lt.data.lat.end(), out.lat.begin() + (long)t.lat.begin);
        std::copy(lt.data.lon.begin(), lt.data.lon.end(), out.lon.begin() + (long)t.lon.begin);

        for (auto &it : out.vars) {
            const auto src = lt.data.vars.find(it.first);
            if (src == lt.data.vars.end()) {
                logMsg(LOG_DEBUG, "Merge: %s missing in tile %s, left as fill", it.first.c_str(), t.name.c_str());
                continue;
            }
            const std::vector<float> &sv = src->second.values;
            std::vector<float> &dv = it.second.values;
            for (size_t k = 0; k < nt; k++) {
                for (size_t i = 0; i < t.lat.size(); i++) {
                    const size_t s0 = (k * t.lat.size() + i) * t.lon.size();
                    const size_t d0 = out.index(k, t.lat.begin + i, t.lon.begin);
                    std::copy(sv.begin() + (long)s0, sv.begin() + (long)(s0 + t.lon.size()), dv.begin() + (long)d0);
                }
            }
        }
    }
    return out;
}
