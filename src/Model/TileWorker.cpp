#include "TileWorker.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <chrono>
#include <sstream>
#include <thread>

TileWorker::TileWorker(const Calculator &calc, const TileArtifactIO &io, const TileWorkerOptions &opt)
    : calc_(calc), io_(io), opt_(opt)
{
}

GriddedDataset TileWorker::tileResult(const GriddedDataset &slice, CalculationOutput &out)
{
    GriddedDataset r;
    r.time = out.time;
    r.time_units = slice.time_units;
    r.calendar = slice.calendar;
    r.lat = slice.lat;
    r.lon = slice.lon;
    r.vars.swap(out.results);
    return r;
}

TileArtifactHandle TileWorker::process(const GriddedDataset &chunk_input,
                                       const TileSpec &tile,
                                       const SurfaceMap &tile_refs,
                                       const std::string &artifact_path) const
{
    const GriddedDataset slice = chunk_input.slice(tile.lat, tile.lon);

    CalculationOutput out;
    try {
        out = calc_.compute(slice, tile_refs);
    } catch (const std::exception &e) {
        throw TileComputationFailed(tile.name, e.what());
    } catch (...) {
        throw TileComputationFailed(tile.name, "unknown exception");
    }

    if (!out.failures.empty()) {
        if (opt_.policy == CALC_FAIL_TILE) {
            const CalculationFailure &f = out.failures.front();
            throw TileComputationFailed(tile.name, CalculationError(f.name, f.cause).what());
        }
        for (const CalculationFailure &f : out.failures) {
            logMsg(LOG_WARN, "Tile %s: result %s dropped: %s", tile.name.c_str(), f.name.c_str(), f.cause.c_str());
        }
    }

    const size_t expect = out.time.size() * tile.cells();
    for (const auto &it : out.results) {
        if (it.second.values.size() != expect) {
            std::ostringstream exp;
            exp << it.first << " on tile " << tile.name << " (time=" << out.time.size() << ", lat=" << tile.lat.size()
                << ", lon=" << tile.lon.size() << ")";
            throw DimensionMismatch(exp.str(), std::to_string(it.second.values.size()) + " values");
        }
    }

    const GriddedDataset result = tileResult(slice, out);
    writeWithRetry(artifact_path, tile, result);

    logMsg(LOG_DEBUG,
           "Tile %s done: %zu result(s), nt=%zu -> %s",
           tile.name.c_str(),
           result.vars.size(),
           result.nt(),
           artifact_path.c_str());

    TileArtifactHandle h;
    h.path = artifact_path;
    h.tile = tile;
    return h;
}

void TileWorker::writeWithRetry(const std::string &path, const TileSpec &tile, const GriddedDataset &result) const
{
    for (int attempt = 0;; attempt++) {
        try {
            io_.writeTile(path, tile, result);
            return;
        } catch (const ArtifactIOError &e) {
            if (!e.transient() || attempt >= opt_.io_retries) {
                throw;
            }
            logMsg(LOG_WARN,
                   "Tile %s: transient write error (attempt %d of %d): %s",
                   tile.name.c_str(),
                   attempt + 1,
                   opt_.io_retries + 1,
                   e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds((long)(attempt + 1) * opt_.retry_backoff_ms));
        }
    }
}
