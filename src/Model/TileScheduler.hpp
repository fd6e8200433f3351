//  TileScheduler.hpp
//  gridtiler
//
//  Runs every tile of one chunk on an OpenMP pool and hands back the set of
//  written artifacts. Tile failures are collected, never thrown across the
//  parallel region; the chunk fails once every dispatched tile is done.
//
#ifndef TileScheduler_hpp
#define TileScheduler_hpp

#include "Calculator.hpp"
#include "GridTypes.hpp"
#include "ReferenceCache.hpp"
#include "TileArtifact.hpp"
#include "TileWorker.hpp"

#include <string>
#include <vector>

enum ChunkState {
    CHUNK_PENDING = 0,
    CHUNK_RUNNING,
    CHUNK_ALL_SUCCEEDED,
    CHUNK_PARTIALLY_FAILED
};

static inline const char *ChunkStateName(ChunkState s)
{
    switch (s) {
        case CHUNK_PENDING:          return "Pending";
        case CHUNK_RUNNING:          return "Running";
        case CHUNK_ALL_SUCCEEDED:    return "AllSucceeded";
        case CHUNK_PARTIALLY_FAILED: return "PartiallyFailed";
        default:                     return "Unknown";
    }
}

struct SchedulerOptions {
    std::string tile_dir;
    int worker_count = 0;     /* 0 = one per tile */
    int max_workers = 8;
    double timeout_sec = 0.0; /* 0 = none */
    TileWorkerOptions worker;
};

class TileScheduler {
public:
    TileScheduler(const TileArtifactIO &io, const SchedulerOptions &opt);

    /*
     * Throws ChunkTilesFailed (every tile failure, in tile order) or
     * ChunkTimeoutExceeded. Artifacts are removed before either propagates.
     * On success the returned set owns the artifacts until it is cleared or
     * destroyed.
     */
    TileArtifactSet runChunk(const GriddedDataset &chunk_input,
                             const std::vector<TileSpec> &tiles,
                             const ReferenceCache &refs,
                             const Calculator &calc,
                             const std::string &chunk_label);

    ChunkState state() const { return state_; }

    static int resolveWorkerCount(int requested, int max_workers, size_t tile_count);

private:
    const TileArtifactIO &io_;
    SchedulerOptions opt_;
    ChunkState state_ = CHUNK_PENDING;
};

#endif /* TileScheduler_hpp */
