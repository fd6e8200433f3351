#include "TileScheduler.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#ifdef _OPENMP_ON
#include <omp.h>
#endif

#include <chrono>

namespace {

enum TileOutcome {
    TILE_NOT_RUN = 0,
    TILE_OK,
    TILE_FAILED,
    TILE_SKIPPED,   /* not started before the deadline */
    TILE_DISCARDED  /* finished after the deadline */
};

/* Seconds elapsed since t0. */
double secondsSince(std::chrono::steady_clock::time_point t0)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
}

} // namespace

TileScheduler::TileScheduler(const TileArtifactIO &io, const SchedulerOptions &opt) : io_(io), opt_(opt)
{
}

int TileScheduler::resolveWorkerCount(int requested, int max_workers, size_t tile_count)
{
    int n = requested > 0 ? requested : (int)tile_count;
    if (max_workers > 0 && n > max_workers) {
        n = max_workers;
    }
    if (n > (int)tile_count) {
        n = (int)tile_count;
    }
    return n < 1 ? 1 : n;
}

TileArtifactSet TileScheduler::runChunk(const GriddedDataset &chunk_input,
                                        const std::vector<TileSpec> &tiles,
                                        const ReferenceCache &refs,
                                        const Calculator &calc,
                                        const std::string &chunk_label)
{
    state_ = CHUNK_PENDING;
    TileArtifactSet artifacts(opt_.tile_dir, chunk_label, tiles);

    const int ntiles = (int)tiles.size();
    const int nthreads = resolveWorkerCount(opt_.worker_count, opt_.max_workers, tiles.size());
    const TileWorker worker(calc, io_, opt_.worker);

    typedef std::chrono::steady_clock Clock;
    const bool timed = opt_.timeout_sec > 0.0;
    const Clock::time_point started = Clock::now();

    std::vector<int> outcome((size_t)ntiles, TILE_NOT_RUN);
    std::vector<std::string> error((size_t)ntiles);

    logMsg(LOG_INFO, "Chunk %s: %d tile(s) on %d worker(s)", chunk_label.c_str(), ntiles, nthreads);
    state_ = CHUNK_RUNNING;

    int i;
#ifdef _OPENMP_ON
#pragma omp parallel for num_threads(nthreads) schedule(dynamic, 1)
#endif
    for (i = 0; i < ntiles; i++) {
        const TileSpec &tile = tiles[(size_t)i];
        if (timed && secondsSince(started) >= opt_.timeout_sec) {
            outcome[(size_t)i] = TILE_SKIPPED;
            continue;
        }
        try {
            const SurfaceMap tile_refs = refs.subset(tile);
            worker.process(chunk_input, tile, tile_refs, artifacts.path((size_t)i));
            artifacts.markWritten((size_t)i);
            outcome[(size_t)i] = (timed && secondsSince(started) > opt_.timeout_sec) ? TILE_DISCARDED : TILE_OK;
        } catch (const std::exception &e) {
            outcome[(size_t)i] = TILE_FAILED;
            error[(size_t)i] = e.what();
        } catch (...) {
            outcome[(size_t)i] = TILE_FAILED;
            error[(size_t)i] = "unknown exception";
        }
    }

    std::vector<TileFailure> failures;
    size_t late = 0;
    for (size_t k = 0; k < tiles.size(); k++) {
        if (outcome[k] == TILE_FAILED) {
            TileFailure f;
            f.tile_name = tiles[k].name;
            f.message = error[k];
            failures.push_back(f);
            logMsg(LOG_ERROR, "Chunk %s: tile %s failed: %s", chunk_label.c_str(), tiles[k].name.c_str(), error[k].c_str());
        } else if (outcome[k] == TILE_SKIPPED || outcome[k] == TILE_DISCARDED) {
            late++;
            logMsg(LOG_WARN,
                   "Chunk %s: tile %s %s after the deadline",
                   chunk_label.c_str(),
                   tiles[k].name.c_str(),
                   outcome[k] == TILE_SKIPPED ? "skipped" : "discarded");
        }
    }

    if (!failures.empty() || late > 0) {
        state_ = CHUNK_PARTIALLY_FAILED;
        artifacts.clear();
        if (!failures.empty()) {
            throw ChunkTilesFailed(failures);
        }
        throw ChunkTimeoutExceeded(opt_.timeout_sec, late);
    }

    state_ = CHUNK_ALL_SUCCEEDED;
    return artifacts;
}
