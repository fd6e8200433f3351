#include "ChunkSource.hpp"

#include "Errors.hpp"
#include "TimeContext.hpp"

MemoryChunkSource::MemoryChunkSource(const GriddedDataset &dataset, const std::string &var_name)
    : dataset_(dataset), var_name_(var_name)
{
    if (!dataset_.hasVar(var_name_)) {
        throw ConfigError("memory chunk source has no variable '" + var_name_ + "'");
    }
    if (dataset_.vars[var_name_].values.size() != dataset_.frameSize()) {
        throw ConfigError("memory chunk source variable '" + var_name_ + "' does not match its (time, lat, lon) frame");
    }
    TimeContext tc;
    tc.setUnits(dataset_.time_units);
}

GriddedDataset MemoryChunkSource::load(int first_year, int end_year) const
{
    TimeContext tc;
    tc.setUnits(dataset_.time_units);

    std::vector<size_t> picked;
    for (size_t t = 0; t < dataset_.nt(); t++) {
        const int y = tc.year(dataset_.time[t]);
        if (y >= first_year && y < end_year) {
            picked.push_back(t);
        }
    }
    if (picked.empty()) {
        throw ChunkInputError("no time steps in years [" + std::to_string(first_year) + ", " +
                              std::to_string(end_year) + ") of " + description());
    }

    GriddedDataset out;
    out.time_units = dataset_.time_units;
    out.calendar = dataset_.calendar;
    out.lat = dataset_.lat;
    out.lon = dataset_.lon;

    const DataVar &src = dataset_.vars.at(var_name_);
    DataVar v;
    v.units = src.units;
    v.long_name = src.long_name;
    const size_t frame = dataset_.nlat() * dataset_.nlon();
    v.values.reserve(picked.size() * frame);
    for (size_t t : picked) {
        out.time.push_back(dataset_.time[t]);
        v.values.insert(v.values.end(),
                        src.values.begin() + (long)(t * frame),
                        src.values.begin() + (long)((t + 1) * frame));
    }
    out.vars[var_name_] = std::move(v);
    return out;
}
