//  Errors.hpp
//  gridtiler
//
//  Error taxonomy of the tiling engine. Everything derives from EngineError
//  so callers can catch the engine's failures as one family.
//
#ifndef Errors_hpp
#define Errors_hpp

#include <stdexcept>
#include <string>
#include <vector>

class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string &what) : std::runtime_error(what) {}
};

class ConfigError : public EngineError {
public:
    explicit ConfigError(const std::string &what) : EngineError(what) {}
};

class InvalidTileCount : public EngineError {
public:
    InvalidTileCount(int count, const std::string &detail);
    int count() const { return count_; }

private:
    int count_;
};

class ReferenceDataError : public EngineError {
public:
    ReferenceDataError(const std::string &surface, const std::string &detail);
    const std::string &surface() const { return surface_; }

private:
    std::string surface_;
};

class ChunkInputError : public EngineError {
public:
    explicit ChunkInputError(const std::string &what) : EngineError(what) {}
};

class DimensionMismatch : public EngineError {
public:
    DimensionMismatch(const std::string &expected, const std::string &actual);
    const std::string &expected() const { return expected_; }
    const std::string &actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class ArtifactIOError : public EngineError {
public:
    ArtifactIOError(const std::string &op, const std::string &path, int status);
    const std::string &path() const { return path_; }
    int status() const { return status_; }
    /* System-level hiccups (EINTR, EAGAIN, EBUSY, ETIMEDOUT) may be retried. */
    bool transient() const;

private:
    std::string path_;
    int status_;
};

class CalculationError : public EngineError {
public:
    CalculationError(const std::string &name, const std::string &cause);
    const std::string &name() const { return name_; }
    const std::string &cause() const { return cause_; }

private:
    std::string name_;
    std::string cause_;
};

class TileComputationFailed : public EngineError {
public:
    TileComputationFailed(const std::string &tile_name, const std::string &cause);
    const std::string &tileName() const { return tile_name_; }
    const std::string &cause() const { return cause_; }

private:
    std::string tile_name_;
    std::string cause_;
};

struct TileFailure {
    std::string tile_name;
    std::string message;
};

/* Raised by the scheduler once every tile of the chunk has finished. */
class ChunkTilesFailed : public EngineError {
public:
    explicit ChunkTilesFailed(const std::vector<TileFailure> &failures);
    const std::vector<TileFailure> &failures() const { return failures_; }

private:
    std::vector<TileFailure> failures_;
};

class ChunkTimeoutExceeded : public EngineError {
public:
    ChunkTimeoutExceeded(double timeout_sec, size_t discarded_tiles);
    size_t discardedTiles() const { return discarded_; }

private:
    size_t discarded_;
};

#endif /* Errors_hpp */
