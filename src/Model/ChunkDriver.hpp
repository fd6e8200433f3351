//  ChunkDriver.hpp
//  gridtiler
//
//  Walks [start, end] in chunks of chunk_size calendar years. Each chunk is
//  loaded, tiled, computed, merged and written to
//  <out_dir>/<prefix>_<first>_<last>.nc. A failed chunk is recorded and the
//  run moves on to the next one.
//
#ifndef ChunkDriver_hpp
#define ChunkDriver_hpp

#include "Calculator.hpp"
#include "ChunkSource.hpp"
#include "ReferenceCache.hpp"
#include "TileArtifact.hpp"
#include "TileScheduler.hpp"

#include <string>
#include <utility>
#include <vector>

#ifndef GRIDTILER_VERSION
#define GRIDTILER_VERSION "0.1.0"
#endif

struct ChunkOutcome {
    int first_year = 0;
    int last_year = 0;    /* inclusive */
    bool ok = false;
    std::string state;    /* scheduler state when the chunk ended */
    std::string output_path;
    std::string error;    /* first error message on failure */
    double wall_sec = 0.0;
};

struct RunSummary {
    std::vector<ChunkOutcome> chunks;

    size_t succeeded() const;
    size_t failed() const;
    bool allSucceeded() const { return failed() == 0; }
    std::string toJson() const;
};

struct DriverOptions {
    std::string out_dir = "./outputs";
    std::string output_prefix = "indices";
    std::string baseline_period;
    SchedulerOptions scheduler;
};

class ChunkDriver {
public:
    ChunkDriver(const ChunkSource &source,
                const ReferenceCache &refs,
                const Calculator &calc,
                const TileArtifactIO &io,
                const DriverOptions &opt);

    /*
     * Throws ConfigError (bad range), InvalidTileCount, ReferenceDataError
     * (reference grid differs from the input grid) before any chunk runs.
     * Chunk failures are reported in the summary only.
     */
    RunSummary run(int start_year, int end_year, int chunk_size, int tile_count);

    /* Half-open year ranges [y, min(y + chunk_size, end_year + 1)). Throws ConfigError. */
    static std::vector<std::pair<int, int> > chunkRanges(int start_year, int end_year, int chunk_size);

    std::string outputPath(int first_year, int last_year) const;

private:
    const ChunkSource &source_;
    const ReferenceCache &refs_;
    const Calculator &calc_;
    const TileArtifactIO &io_;
    DriverOptions opt_;

    void runChunk(int first_year, int end_year, const std::vector<TileSpec> &tiles, ChunkOutcome &outcome);
    void stampAttrs(GriddedDataset &result, int first_year, int last_year, int tile_count) const;
};

#endif /* ChunkDriver_hpp */
