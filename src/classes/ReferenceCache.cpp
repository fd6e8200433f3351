#include "ReferenceCache.hpp"

#include "Errors.hpp"
#include "Logging.hpp"
#include "NcUtil.hpp"

#include <netcdf.h>

#include <algorithm>

namespace {

static void checkWindow(const std::string &name, const GridExtent &ext, const IndexRange &lat, const IndexRange &lon)
{
    if (lat.end > ext.lat_count || lon.end > ext.lon_count || lat.size() == 0 || lon.size() == 0) {
        throw ReferenceDataError(name,
                                 "window lat[" + std::to_string(lat.begin) + "," + std::to_string(lat.end) +
                                     ") lon[" + std::to_string(lon.begin) + "," + std::to_string(lon.end) +
                                     ") outside extent " + ext.str());
    }
}

} // namespace

/* ------------------------------------------------------------------ */
/* MemorySurfaceSource                                                 */
/* ------------------------------------------------------------------ */

MemorySurfaceSource::MemorySurfaceSource(const GridExtent &extent) : extent_(extent)
{
}

void MemorySurfaceSource::add(const ReferenceSurface &full_surface)
{
    ReferenceSurface s = full_surface;
    s.lat = IndexRange(0, extent_.lat_count);
    s.lon = IndexRange(0, extent_.lon_count);
    if (!s.has_doy) {
        s.ndoy = 1;
    } else if (s.ndoy == 0) {
        throw ReferenceDataError(s.name, "dayofyear dimension has length 0");
    }
    if (s.values.size() != s.ndoy * extent_.cells()) {
        throw ReferenceDataError(s.name,
                                 "expected " + std::to_string(s.ndoy * extent_.cells()) + " values, got " +
                                     std::to_string(s.values.size()));
    }
    surfaces_[s.name] = s;
}

SurfaceLayout MemorySurfaceSource::layout(const std::string &name) const
{
    SurfaceLayout out;
    const auto it = surfaces_.find(name);
    if (it == surfaces_.end()) {
        return out;
    }
    out.exists = true;
    out.has_doy = it->second.has_doy;
    out.ndoy = it->second.ndoy;
    out.units = it->second.units;
    return out;
}

ReferenceSurface MemorySurfaceSource::read(const std::string &name, const IndexRange &lat, const IndexRange &lon) const
{
    const auto it = surfaces_.find(name);
    if (it == surfaces_.end()) {
        throw ReferenceDataError(name, "not present in memory source");
    }
    checkWindow(name, extent_, lat, lon);
    const ReferenceSurface &src = it->second;

    ReferenceSurface out;
    out.name = src.name;
    out.units = src.units;
    out.has_doy = src.has_doy;
    out.ndoy = src.ndoy;
    out.lat = lat;
    out.lon = lon;
    out.values.resize(src.ndoy * lat.size() * lon.size());
    for (size_t d = 0; d < src.ndoy; d++) {
        for (size_t i = 0; i < lat.size(); i++) {
            const size_t s0 = (d * extent_.lat_count + lat.begin + i) * extent_.lon_count + lon.begin;
            const size_t d0 = (d * lat.size() + i) * lon.size();
            std::copy(src.values.begin() + (long)s0,
                      src.values.begin() + (long)(s0 + lon.size()),
                      out.values.begin() + (long)d0);
        }
    }
    return out;
}

bool MemorySurfaceSource::allMissing(const std::string &name) const
{
    const auto it = surfaces_.find(name);
    if (it == surfaces_.end()) {
        return true;
    }
    for (float v : it->second.values) {
        if (!isMissing(v)) {
            return false;
        }
    }
    return true;
}

/* ------------------------------------------------------------------ */
/* NetcdfSurfaceSource                                                 */
/* ------------------------------------------------------------------ */

struct NetcdfSurfaceSource::Impl {
    std::string path;
    std::string dim_lat;
    std::string dim_lon;
    NcFile file;
    GridExtent extent;
    std::string baseline_period;

    /* Caller holds ncLibraryMutex(). */
    NcVarInfo inqSurface(const std::string &name) const
    {
        const NcVarInfo info = ncInqVar(file.id(), name, path);
        const int plat = info.dimPos(dim_lat);
        const int plon = info.dimPos(dim_lon);
        if (info.ndims < 2 || info.ndims > 3 || plat != info.ndims - 2 || plon != info.ndims - 1) {
            throw ReferenceDataError(name,
                                     "expected dims ([dayofyear,] " + dim_lat + ", " + dim_lon + ") in " + path);
        }
        if (info.ndims == 3 && info.dim_lens[0] == 0) {
            throw ReferenceDataError(name, "dayofyear dimension has length 0 in " + path);
        }
        return info;
    }
};

NetcdfSurfaceSource::NetcdfSurfaceSource(const std::string &path,
                                         const std::string &dim_lat,
                                         const std::string &dim_lon,
                                         const std::string &expected_baseline_period)
    : impl_(new Impl())
{
    impl_->path = path;
    impl_->dim_lat = dim_lat;
    impl_->dim_lon = dim_lon;

    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    try {
        impl_->file.open(path, NC_NOWRITE);
        const int ncid = impl_->file.id();

        int dimid = -1;
        size_t nlat = 0;
        size_t nlon = 0;
        ncCheck(nc_inq_dimid(ncid, dim_lat.c_str(), &dimid), ("nc_inq_dimid(" + dim_lat + ")").c_str(), path);
        ncCheck(nc_inq_dimlen(ncid, dimid, &nlat), "nc_inq_dimlen(lat)", path);
        ncCheck(nc_inq_dimid(ncid, dim_lon.c_str(), &dimid), ("nc_inq_dimid(" + dim_lon + ")").c_str(), path);
        ncCheck(nc_inq_dimlen(ncid, dimid, &nlon), "nc_inq_dimlen(lon)", path);
        impl_->extent = GridExtent(nlat, nlon);

        impl_->baseline_period = ncGetAttText(ncid, NC_GLOBAL, "baseline_period");
        if (!expected_baseline_period.empty() && impl_->baseline_period != expected_baseline_period) {
            logMsg(LOG_WARN,
                   "Baseline period mismatch in %s: expected '%s', got '%s'. Results may not be comparable.",
                   path.c_str(),
                   expected_baseline_period.c_str(),
                   impl_->baseline_period.c_str());
        }
        logMsg(LOG_INFO, "Reference file %s: grid=(lat=%zu, lon=%zu)", path.c_str(), nlat, nlon);
    } catch (...) {
        // Close under the lock before the exception leaves the constructor.
        impl_.reset();
        throw;
    }
}

NetcdfSurfaceSource::~NetcdfSurfaceSource()
{
    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    impl_.reset();
}

GridExtent NetcdfSurfaceSource::extent() const
{
    return impl_->extent;
}

const std::string &NetcdfSurfaceSource::baselinePeriod() const
{
    return impl_->baseline_period;
}

SurfaceLayout NetcdfSurfaceSource::layout(const std::string &name) const
{
    SurfaceLayout out;
    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    if (!ncHasVar(impl_->file.id(), name)) {
        return out;
    }
    const NcVarInfo info = impl_->inqSurface(name);
    out.exists = true;
    out.has_doy = info.ndims == 3;
    out.ndoy = out.has_doy ? info.dim_lens[0] : 1;
    out.units = ncGetAttText(impl_->file.id(), info.varid, "units");
    if (out.has_doy && info.dim_names[0] != "dayofyear") {
        logMsg(LOG_WARN, "%s: leading dimension '%s' treated as dayofyear", name.c_str(), info.dim_names[0].c_str());
    }
    return out;
}

ReferenceSurface NetcdfSurfaceSource::read(const std::string &name, const IndexRange &lat, const IndexRange &lon) const
{
    checkWindow(name, impl_->extent, lat, lon);

    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    const NcVarInfo info = impl_->inqSurface(name);

    ReferenceSurface out;
    out.name = name;
    out.units = ncGetAttText(impl_->file.id(), info.varid, "units");
    out.has_doy = info.ndims == 3;
    out.ndoy = out.has_doy ? info.dim_lens[0] : 1;
    out.lat = lat;
    out.lon = lon;

    std::vector<size_t> start;
    std::vector<size_t> count;
    if (out.has_doy) {
        start.push_back(0);
        count.push_back(out.ndoy);
    }
    start.push_back(lat.begin);
    count.push_back(lat.size());
    start.push_back(lon.begin);
    count.push_back(lon.size());
    out.values = ncReadUnpacked(impl_->file.id(), info, start, count, impl_->path);
    return out;
}

bool NetcdfSurfaceSource::allMissing(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    const NcVarInfo info = impl_->inqSurface(name);
    const size_t ndoy = info.ndims == 3 ? info.dim_lens[0] : 1;

    // One calendar-day slab at a time; stop at the first valid value.
    for (size_t d = 0; d < ndoy; d++) {
        std::vector<size_t> start;
        std::vector<size_t> count;
        if (info.ndims == 3) {
            start.push_back(d);
            count.push_back(1);
        }
        start.push_back(0);
        count.push_back(impl_->extent.lat_count);
        start.push_back(0);
        count.push_back(impl_->extent.lon_count);
        const std::vector<float> slab = ncReadUnpacked(impl_->file.id(), info, start, count, impl_->path);
        for (float v : slab) {
            if (!isMissing(v)) {
                return false;
            }
        }
    }
    return true;
}

/* ------------------------------------------------------------------ */
/* ReferenceCache                                                      */
/* ------------------------------------------------------------------ */

ReferenceCache ReferenceCache::load(std::shared_ptr<const SurfaceSource> source,
                                    const std::set<std::string> &names,
                                    bool allow_missing)
{
    ReferenceCache cache;
    if (names.empty()) {
        return cache;
    }
    if (!source) {
        throw ReferenceDataError(*names.begin(), "no reference source configured");
    }

    std::vector<std::string> missing;
    for (const std::string &name : names) {
        const SurfaceLayout lay = source->layout(name);
        if (!lay.exists) {
            missing.push_back(name);
            if (allow_missing) {
                logMsg(LOG_WARN, "Missing expected reference surface: %s", name.c_str());
            }
            continue;
        }
        if (!lay.has_doy) {
            logMsg(LOG_WARN, "%s has no dayofyear dimension; used as a static surface", name.c_str());
        }
        if (source->allMissing(name)) {
            logMsg(LOG_WARN, "%s contains only missing values; reference data may be corrupted", name.c_str());
        }
        logMsg(LOG_DEBUG, "  Registered reference surface %s (ndoy=%zu)", name.c_str(), lay.ndoy);
        cache.names_.insert(name);
    }

    if (!missing.empty() && !allow_missing) {
        std::string list;
        for (size_t i = 0; i < missing.size(); i++) {
            list += (i ? ", " : "") + missing[i];
        }
        throw ReferenceDataError(list, "required surface(s) not found");
    }

    cache.source_ = std::move(source);
    logMsg(LOG_INFO, "Reference cache: %zu surface(s) registered", cache.names_.size());
    return cache;
}

SurfaceMap ReferenceCache::subset(const TileSpec &tile) const
{
    SurfaceMap out;
    for (const std::string &name : names_) {
        out[name] = source_->read(name, tile.lat, tile.lon);
    }
    return out;
}

GridExtent ReferenceCache::extent() const
{
    if (!source_) {
        return GridExtent();
    }
    return source_->extent();
}
