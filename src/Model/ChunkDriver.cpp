#include "ChunkDriver.hpp"

#include "DomainGrid.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "PathUtils.hpp"
#include "TileMerger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <ctime>

namespace {

static std::string utcNow()
{
    const std::time_t now = std::time(nullptr);
    std::tm tm_utc;
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buf);
}

} // namespace

size_t RunSummary::succeeded() const
{
    size_t n = 0;
    for (const ChunkOutcome &c : chunks) {
        n += c.ok ? 1 : 0;
    }
    return n;
}

size_t RunSummary::failed() const
{
    return chunks.size() - succeeded();
}

std::string RunSummary::toJson() const
{
    nlohmann::json j;
    j["succeeded"] = succeeded();
    j["failed"] = failed();
    j["chunks"] = nlohmann::json::array();
    for (const ChunkOutcome &c : chunks) {
        nlohmann::json r;
        r["start_year"] = c.first_year;
        r["end_year"] = c.last_year;
        r["status"] = c.ok ? "ok" : "failed";
        r["state"] = c.state;
        r["output"] = c.ok ? nlohmann::json(c.output_path) : nlohmann::json(nullptr);
        r["error"] = c.ok ? nlohmann::json(nullptr) : nlohmann::json(c.error);
        r["wall_sec"] = c.wall_sec;
        j["chunks"].push_back(r);
    }
    return j.dump(2);
}

ChunkDriver::ChunkDriver(const ChunkSource &source,
                         const ReferenceCache &refs,
                         const Calculator &calc,
                         const TileArtifactIO &io,
                         const DriverOptions &opt)
    : source_(source), refs_(refs), calc_(calc), io_(io), opt_(opt)
{
}

std::vector<std::pair<int, int> > ChunkDriver::chunkRanges(int start_year, int end_year, int chunk_size)
{
    if (start_year > end_year) {
        throw ConfigError("start year " + std::to_string(start_year) + " is after end year " + std::to_string(end_year));
    }
    if (chunk_size < 1) {
        throw ConfigError("chunk size must be >= 1, got " + std::to_string(chunk_size));
    }
    std::vector<std::pair<int, int> > out;
    for (int y = start_year; y <= end_year; y += chunk_size) {
        const int stop = y + chunk_size < end_year + 1 ? y + chunk_size : end_year + 1;
        out.push_back(std::make_pair(y, stop));
    }
    return out;
}

std::string ChunkDriver::outputPath(int first_year, int last_year) const
{
    return joinPath(opt_.out_dir,
                    opt_.output_prefix + "_" + std::to_string(first_year) + "_" + std::to_string(last_year) + ".nc");
}

RunSummary ChunkDriver::run(int start_year, int end_year, int chunk_size, int tile_count)
{
    const std::vector<std::pair<int, int> > ranges = chunkRanges(start_year, end_year, chunk_size);
    const GridExtent extent = source_.extent();
    const std::vector<TileSpec> tiles = DomainGrid::computeTiles(extent, tile_count);

    if (!refs_.empty() && refs_.extent() != extent) {
        throw ReferenceDataError(*refs_.names().begin(),
                                 "reference grid " + refs_.extent().str() + " differs from input grid " + extent.str());
    }
    if (!makeDirs(opt_.out_dir)) {
        throw ArtifactIOError("mkdir", opt_.out_dir, errno != 0 ? errno : EACCES);
    }

    logMsg(LOG_INFO,
           "Run %d-%d: %zu chunk(s) of %d year(s), %d tile(s) over %s",
           start_year,
           end_year,
           ranges.size(),
           chunk_size,
           tile_count,
           extent.str().c_str());

    RunSummary summary;
    for (const auto &r : ranges) {
        ChunkOutcome outcome;
        outcome.first_year = r.first;
        outcome.last_year = r.second - 1;
        outcome.output_path = outputPath(outcome.first_year, outcome.last_year);

        const auto t0 = std::chrono::steady_clock::now();
        runChunk(r.first, r.second, tiles, outcome);
        outcome.wall_sec = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

        if (outcome.ok) {
            logMsg(LOG_INFO,
                   "Chunk %d-%d done in %.2f s -> %s",
                   outcome.first_year,
                   outcome.last_year,
                   outcome.wall_sec,
                   outcome.output_path.c_str());
        }
        summary.chunks.push_back(outcome);
    }

    logMsg(LOG_INFO, "Run finished: %zu succeeded, %zu failed", summary.succeeded(), summary.failed());
    return summary;
}

void ChunkDriver::runChunk(int first_year, int end_year, const std::vector<TileSpec> &tiles, ChunkOutcome &outcome)
{
    const std::string label = std::to_string(first_year) + "-" + std::to_string(end_year - 1);
    const GridExtent extent = source_.extent();
    TileScheduler scheduler(io_, opt_.scheduler);

    try {
        const GriddedDataset input = source_.load(first_year, end_year);
        if (input.extent() != extent) {
            throw DimensionMismatch(extent.str(), input.extent().str() + " in chunk input " + label);
        }

        TileArtifactSet artifacts = scheduler.runChunk(input, tiles, refs_, calc_, label);
        const TileMerger merger(io_);
        GriddedDataset result = merger.merge(artifacts.written(), extent);
        artifacts.clear();

        stampAttrs(result, first_year, end_year - 1, (int)tiles.size());

        const std::string tmp = outcome.output_path + ".tmp";
        try {
            io_.writeChunk(tmp, result);
        } catch (...) {
            removeFile(tmp);
            throw;
        }
        if (!renameFile(tmp, outcome.output_path)) {
            const int err = errno;
            removeFile(tmp);
            throw ArtifactIOError("rename", outcome.output_path, err);
        }
        outcome.ok = true;
    } catch (const DimensionMismatch &e) {
        outcome.error = e.what();
        logMsg(LOG_ERROR, "Chunk %s failed with a dimension mismatch (programming error): %s", label.c_str(), e.what());
    } catch (const std::exception &e) {
        outcome.error = e.what();
        logMsg(LOG_ERROR, "Chunk %s failed: %s", label.c_str(), e.what());
    } catch (...) {
        outcome.error = "unknown exception";
        logMsg(LOG_ERROR, "Chunk %s failed with an unknown exception", label.c_str());
    }
    outcome.state = ChunkStateName(scheduler.state());
}

void ChunkDriver::stampAttrs(GriddedDataset &result, int first_year, int last_year, int tile_count) const
{
    result.text_attrs["time_range"] = std::to_string(first_year) + "-" + std::to_string(last_year);
    result.int_attrs["tile_count"] = tile_count;
    result.int_attrs["indices_count"] = (long long)result.vars.size();
    result.text_attrs["calculator"] = calc_.name();
    result.text_attrs["calc_failure_policy"] = CalcFailurePolicyName(opt_.scheduler.worker.policy);
    result.text_attrs["source_file"] = source_.description();
    result.text_attrs["software"] = std::string("gridtiler ") + GRIDTILER_VERSION;
    result.text_attrs["creation_date"] = utcNow();
    if (!refs_.empty() && !opt_.baseline_period.empty()) {
        result.text_attrs["baseline_period"] = opt_.baseline_period;
    }
}
