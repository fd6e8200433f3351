#include "Errors.hpp"

#include "NcUtil.hpp"

#include <cerrno>
#include <sstream>

InvalidTileCount::InvalidTileCount(int count, const std::string &detail)
    : EngineError("invalid tile count " + std::to_string(count) + (detail.empty() ? "" : ": " + detail)),
      count_(count)
{
}

ReferenceDataError::ReferenceDataError(const std::string &surface, const std::string &detail)
    : EngineError("reference surface '" + surface + "': " + detail), surface_(surface)
{
}

DimensionMismatch::DimensionMismatch(const std::string &expected, const std::string &actual)
    : EngineError("dimension mismatch: expected " + expected + ", actual " + actual),
      expected_(expected),
      actual_(actual)
{
}

ArtifactIOError::ArtifactIOError(const std::string &op, const std::string &path, int status)
    : EngineError(op + " failed for " + path + ": " + ncStrError(status)), path_(path), status_(status)
{
}

bool ArtifactIOError::transient() const
{
    /* netCDF passes system errno values through as positive statuses. */
    return status_ == EINTR || status_ == EAGAIN || status_ == EBUSY || status_ == ETIMEDOUT;
}

CalculationError::CalculationError(const std::string &name, const std::string &cause)
    : EngineError("calculation of '" + name + "' failed: " + cause), name_(name), cause_(cause)
{
}

TileComputationFailed::TileComputationFailed(const std::string &tile_name, const std::string &cause)
    : EngineError("tile " + tile_name + " failed: " + cause), tile_name_(tile_name), cause_(cause)
{
}

static std::string describeFailures(const std::vector<TileFailure> &failures)
{
    std::ostringstream oss;
    oss << failures.size() << " tile(s) failed";
    if (!failures.empty()) {
        oss << "; first: " << failures.front().message;
    }
    return oss.str();
}

ChunkTilesFailed::ChunkTilesFailed(const std::vector<TileFailure> &failures)
    : EngineError(describeFailures(failures)), failures_(failures)
{
}

ChunkTimeoutExceeded::ChunkTimeoutExceeded(double timeout_sec, size_t discarded_tiles)
    : EngineError("chunk timeout of " + std::to_string(timeout_sec) + " s exceeded; " +
                  std::to_string(discarded_tiles) + " tile result(s) discarded"),
      discarded_(discarded_tiles)
{
}
