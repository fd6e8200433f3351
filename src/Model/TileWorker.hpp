//  TileWorker.hpp
//  gridtiler
//
//  One tile of one chunk: slice the input, run the Calculator, check the
//  result shapes, write the tile artifact.
//
#ifndef TileWorker_hpp
#define TileWorker_hpp

#include "Calculator.hpp"
#include "EngineConfig.hpp"
#include "GridTypes.hpp"
#include "TileArtifact.hpp"

#include <string>

struct TileWorkerOptions {
    CalcFailurePolicy policy = CALC_KEEP_PARTIAL;
    int io_retries = 3;
    int retry_backoff_ms = 200; /* attempt k sleeps k * backoff */
};

class TileWorker {
public:
    TileWorker(const Calculator &calc, const TileArtifactIO &io, const TileWorkerOptions &opt);

    /*
     * Throws TileComputationFailed when the Calculator throws (or reports a
     * failure under CALC_FAIL_TILE), DimensionMismatch for a badly shaped
     * result and ArtifactIOError when the write fails. No artifact is left
     * behind on any of these paths.
     */
    TileArtifactHandle process(const GriddedDataset &chunk_input,
                               const TileSpec &tile,
                               const SurfaceMap &tile_refs,
                               const std::string &artifact_path) const;

    /* Calculator output on the tile's frame. */
    static GriddedDataset tileResult(const GriddedDataset &slice, CalculationOutput &out);

private:
    const Calculator &calc_;
    const TileArtifactIO &io_;
    TileWorkerOptions opt_;

    void writeWithRetry(const std::string &path, const TileSpec &tile, const GriddedDataset &result) const;
};

#endif /* TileWorker_hpp */
