#include "NetcdfChunkSource.hpp"

#include "EngineConfig.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "NcUtil.hpp"
#include "TimeContext.hpp"

#include <netcdf.h>

#include <mutex>
#include <utility>
#include <vector>

struct NetcdfChunkSource::Impl {
    std::string path;
    std::string var_name;
    std::string dim_time;
    std::string dim_lat;
    std::string dim_lon;

    NcFile file;
    NcVarInfo info;

    std::vector<double> time;
    std::vector<double> lat;
    std::vector<double> lon;
    TimeContext tc;
    std::string time_units;
    std::string calendar = "standard";
    std::string units;
    std::string long_name;
};

NetcdfChunkSource::NetcdfChunkSource(const EngineConfig &cfg) : impl_(new Impl())
{
    impl_->path = cfg.input_file;
    impl_->var_name = cfg.input_var;
    impl_->dim_time = cfg.dim_time;
    impl_->dim_lat = cfg.dim_lat;
    impl_->dim_lon = cfg.dim_lon;
    const std::string &path = impl_->path;

    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    try {
        impl_->file.open(path, NC_NOWRITE);
        const int ncid = impl_->file.id();

        impl_->info = ncInqVar(ncid, impl_->var_name, path);
        const NcVarInfo &info = impl_->info;
        if (info.ndims != 3 || info.dimPos(cfg.dim_time) != 0 || info.dimPos(cfg.dim_lat) != 1 ||
            info.dimPos(cfg.dim_lon) != 2) {
            std::string got;
            for (size_t i = 0; i < info.dim_names.size(); i++) {
                got += (i ? ", " : "") + info.dim_names[i];
            }
            throw ChunkInputError("input variable '" + impl_->var_name + "' in " + path + " must have dims (" +
                                  cfg.dim_time + ", " + cfg.dim_lat + ", " + cfg.dim_lon + "), got (" + got + ")");
        }

        impl_->time = ncReadCoord1d(ncid, cfg.time_var, path);
        impl_->lat = ncReadCoord1d(ncid, cfg.lat_var, path);
        impl_->lon = ncReadCoord1d(ncid, cfg.lon_var, path);
        if (impl_->time.size() != info.dim_lens[0] || impl_->lat.size() != info.dim_lens[1] ||
            impl_->lon.size() != info.dim_lens[2]) {
            throw ChunkInputError("coordinate lengths do not match dims of '" + impl_->var_name + "' in " + path);
        }
        if (impl_->time.empty()) {
            throw ChunkInputError("empty time axis in " + path);
        }

        int time_varid = -1;
        ncCheck(nc_inq_varid(ncid, cfg.time_var.c_str(), &time_varid), "nc_inq_varid(time)", path);
        impl_->time_units = ncGetAttText(ncid, time_varid, "units");
        const std::string cal = ncGetAttText(ncid, time_varid, "calendar");
        if (!cal.empty()) {
            impl_->calendar = cal;
        }
        try {
            impl_->tc.setUnits(impl_->time_units);
        } catch (const ConfigError &e) {
            throw ChunkInputError(std::string(e.what()) + " (" + path + ")");
        }
        if (impl_->calendar != "standard" && impl_->calendar != "gregorian" && impl_->calendar != "proleptic_gregorian") {
            logMsg(LOG_WARN, "Calendar '%s' of %s is read as proleptic Gregorian", impl_->calendar.c_str(), path.c_str());
        }

        impl_->units = ncGetAttText(ncid, info.varid, "units");
        impl_->long_name = ncGetAttText(ncid, info.varid, "long_name");

        logMsg(LOG_INFO,
               "Input %s:%s grid=(lat=%zu, lon=%zu) nt=%zu [%s .. %s]",
               path.c_str(),
               impl_->var_name.c_str(),
               impl_->lat.size(),
               impl_->lon.size(),
               impl_->time.size(),
               impl_->tc.formatDate(impl_->time.front()).c_str(),
               impl_->tc.formatDate(impl_->time.back()).c_str());
    } catch (...) {
        // Close under the lock before the exception leaves the constructor.
        impl_.reset();
        throw;
    }
}

NetcdfChunkSource::~NetcdfChunkSource()
{
    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    impl_.reset();
}

GridExtent NetcdfChunkSource::extent() const
{
    return GridExtent(impl_->lat.size(), impl_->lon.size());
}

const std::string &NetcdfChunkSource::varName() const
{
    return impl_->var_name;
}

std::string NetcdfChunkSource::description() const
{
    return impl_->path;
}

int NetcdfChunkSource::firstYear() const
{
    return impl_->tc.year(impl_->time.front());
}

int NetcdfChunkSource::lastYear() const
{
    return impl_->tc.year(impl_->time.back());
}

GriddedDataset NetcdfChunkSource::load(int first_year, int end_year) const
{
    // Contiguous runs of matching time indices; one hyperslab per run.
    std::vector<std::pair<size_t, size_t> > runs;
    for (size_t t = 0; t < impl_->time.size(); t++) {
        const int y = impl_->tc.year(impl_->time[t]);
        if (y < first_year || y >= end_year) {
            continue;
        }
        if (!runs.empty() && runs.back().second == t) {
            runs.back().second = t + 1;
        } else {
            runs.push_back(std::make_pair(t, t + 1));
        }
    }
    if (runs.empty()) {
        throw ChunkInputError("no time steps in years [" + std::to_string(first_year) + ", " +
                              std::to_string(end_year) + ") of " + impl_->path);
    }

    GriddedDataset out;
    out.time_units = impl_->time_units;
    out.calendar = impl_->calendar;
    out.lat = impl_->lat;
    out.lon = impl_->lon;

    DataVar v;
    v.units = impl_->units;
    v.long_name = impl_->long_name;
    const size_t nlat = impl_->lat.size();
    const size_t nlon = impl_->lon.size();

    for (const auto &run : runs) {
        const std::vector<size_t> start = {run.first, 0, 0};
        const std::vector<size_t> count = {run.second - run.first, nlat, nlon};
        std::vector<float> slab;
        try {
            std::lock_guard<std::mutex> lock(ncLibraryMutex());
            slab = ncReadUnpacked(impl_->file.id(), impl_->info, start, count, impl_->path);
        } catch (const ArtifactIOError &e) {
            throw ChunkInputError(std::string("input read failed: ") + e.what());
        }
        v.values.insert(v.values.end(), slab.begin(), slab.end());
        out.time.insert(out.time.end(),
                        impl_->time.begin() + (long)run.first,
                        impl_->time.begin() + (long)run.second);
    }
    out.vars[impl_->var_name] = std::move(v);

    logMsg(LOG_DEBUG,
           "Loaded %s years [%d, %d): nt=%zu",
           impl_->var_name.c_str(),
           first_year,
           end_year,
           out.nt());
    return out;
}
