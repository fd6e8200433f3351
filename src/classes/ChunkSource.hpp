//  ChunkSource.hpp
//  gridtiler
//
//  Provider of per-chunk input: every time step whose calendar year lies in
//  [first_year, end_year) over the full lat/lon extent, as one variable of a
//  GriddedDataset.
//
#ifndef ChunkSource_hpp
#define ChunkSource_hpp

#include "GridTypes.hpp"

#include <string>

class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual GridExtent extent() const = 0;
    virtual const std::string &varName() const = 0;
    /* Human-readable origin, stamped as source_file on chunk outputs. */
    virtual std::string description() const = 0;

    /* Throws ChunkInputError when nothing falls in the range or the read fails. */
    virtual GriddedDataset load(int first_year, int end_year) const = 0;
};

/* A whole time series already in memory (tests, small inputs). */
class MemoryChunkSource final : public ChunkSource {
public:
    /* dataset must carry var_name and CF time units. Throws ConfigError. */
    MemoryChunkSource(const GriddedDataset &dataset, const std::string &var_name);

    GridExtent extent() const override { return dataset_.extent(); }
    const std::string &varName() const override { return var_name_; }
    std::string description() const override { return "memory:" + var_name_; }
    GriddedDataset load(int first_year, int end_year) const override;

private:
    GriddedDataset dataset_;
    std::string var_name_;
};

#endif /* ChunkSource_hpp */
