//  NetcdfChunkSource.hpp
//  gridtiler
//
//  Chunk input from one netCDF variable shaped (time, lat, lon). The file
//  is opened once; coordinates and the time axis are read up front, data
//  hyperslabs per chunk.
//
#ifndef NetcdfChunkSource_hpp
#define NetcdfChunkSource_hpp

#include "ChunkSource.hpp"

#include <memory>
#include <string>

class EngineConfig;

class NetcdfChunkSource final : public ChunkSource {
public:
    /* Uses INPUT_FILE, INPUT_VAR and the NC_DIM_ / _VAR names of cfg. Throws ArtifactIOError, ChunkInputError. */
    explicit NetcdfChunkSource(const EngineConfig &cfg);
    ~NetcdfChunkSource() override;

    GridExtent extent() const override;
    const std::string &varName() const override;
    std::string description() const override;
    GriddedDataset load(int first_year, int end_year) const override;

    /* Years covered by the time axis. */
    int firstYear() const;
    int lastYear() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

#endif /* NetcdfChunkSource_hpp */
