#include "TileArtifact.hpp"

#include "Errors.hpp"
#include "Logging.hpp"
#include "NcUtil.hpp"
#include "PathUtils.hpp"

#include <netcdf.h>

#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <random>
#include <sstream>

namespace {

static std::atomic<unsigned long> g_set_seq(0);

static std::string safeLabel(const std::string &s)
{
    std::string out = s;
    for (char &c : out) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                        c == '_';
        if (!ok) {
            c = '_';
        }
    }
    return out;
}

static void putText(int ncid, int varid, const char *name, const std::string &value, const std::string &path)
{
    ncCheck(nc_put_att_text(ncid, varid, name, value.size(), value.c_str()),
            ("nc_put_att_text(" + std::string(name) + ")").c_str(),
            path);
}

static void putCoord(int ncid, int varid, const std::vector<double> &values, const std::string &path)
{
    if (values.empty()) {
        return;
    }
    ncCheck(nc_put_var_double(ncid, varid, values.data()), "nc_put_var_double(coord)", path);
}

/* Caller holds ncLibraryMutex(). */
static void writeLocked(const std::string &path, const GriddedDataset &ds, int deflate_level, bool chunk_layout)
{
    const size_t nt = ds.nt();
    const size_t nlat = ds.nlat();
    const size_t nlon = ds.nlon();
    for (const auto &it : ds.vars) {
        if (it.second.values.size() != ds.frameSize()) {
            std::ostringstream exp;
            exp << "(" << nt << ", " << nlat << ", " << nlon << ") for '" << it.first << "'";
            throw DimensionMismatch(exp.str(), std::to_string(it.second.values.size()) + " values");
        }
    }

    NcFile f;
    f.create(path, NC_NETCDF4 | NC_CLASSIC_MODEL | NC_CLOBBER);
    const int ncid = f.id();

    int dim_time = -1;
    int dim_lat = -1;
    int dim_lon = -1;
    ncCheck(nc_def_dim(ncid, "time", nt, &dim_time), "nc_def_dim(time)", path);
    ncCheck(nc_def_dim(ncid, "lat", nlat, &dim_lat), "nc_def_dim(lat)", path);
    ncCheck(nc_def_dim(ncid, "lon", nlon, &dim_lon), "nc_def_dim(lon)", path);

    int var_time = -1;
    int var_lat = -1;
    int var_lon = -1;
    ncCheck(nc_def_var(ncid, "time", NC_DOUBLE, 1, &dim_time, &var_time), "nc_def_var(time)", path);
    ncCheck(nc_def_var(ncid, "lat", NC_DOUBLE, 1, &dim_lat, &var_lat), "nc_def_var(lat)", path);
    ncCheck(nc_def_var(ncid, "lon", NC_DOUBLE, 1, &dim_lon, &var_lon), "nc_def_var(lon)", path);
    if (!ds.time_units.empty()) {
        putText(ncid, var_time, "units", ds.time_units, path);
    }
    putText(ncid, var_time, "calendar", ds.calendar.empty() ? std::string("standard") : ds.calendar, path);
    putText(ncid, var_lat, "units", "degrees_north", path);
    putText(ncid, var_lon, "units", "degrees_east", path);

    const int dims[3] = {dim_time, dim_lat, dim_lon};
    size_t chunks[3] = {1, nlat / 9, nlon / 9};
    for (size_t &c : chunks) {
        if (c == 0) {
            c = 1;
        }
    }

    std::vector<int> varids;
    for (const auto &it : ds.vars) {
        int varid = -1;
        ncCheck(nc_def_var(ncid, it.first.c_str(), NC_FLOAT, 3, dims, &varid),
                ("nc_def_var(" + it.first + ")").c_str(),
                path);
        if (deflate_level > 0 && nt > 0 && nlat > 0 && nlon > 0) {
            ncCheck(nc_def_var_deflate(ncid, varid, 1, 1, deflate_level), "nc_def_var_deflate", path);
        }
        if (chunk_layout && nt > 0 && nlat > 0 && nlon > 0) {
            ncCheck(nc_def_var_chunking(ncid, varid, NC_CHUNKED, chunks), "nc_def_var_chunking", path);
        }
        ncCheck(nc_put_att_float(ncid, varid, "_FillValue", NC_FLOAT, 1, &kFillValue),
                "nc_put_att_float(_FillValue)",
                path);
        if (!it.second.units.empty()) {
            putText(ncid, varid, "units", it.second.units, path);
        }
        if (!it.second.long_name.empty()) {
            putText(ncid, varid, "long_name", it.second.long_name, path);
        }
        varids.push_back(varid);
    }

    for (const auto &it : ds.text_attrs) {
        putText(ncid, NC_GLOBAL, it.first.c_str(), it.second, path);
    }
    for (const auto &it : ds.int_attrs) {
        const long long v = it.second;
        ncCheck(nc_put_att_longlong(ncid, NC_GLOBAL, it.first.c_str(), NC_INT, 1, &v),
                ("nc_put_att_longlong(" + it.first + ")").c_str(),
                path);
    }
    ncCheck(nc_enddef(ncid), "nc_enddef", path);

    putCoord(ncid, var_time, ds.time, path);
    putCoord(ncid, var_lat, ds.lat, path);
    putCoord(ncid, var_lon, ds.lon, path);

    size_t k = 0;
    for (const auto &it : ds.vars) {
        if (!it.second.values.empty()) {
            ncCheck(nc_put_var_float(ncid, varids[k], it.second.values.data()),
                    ("nc_put_var_float(" + it.first + ")").c_str(),
                    path);
        }
        k++;
    }
    f.close();
}

/* Caller holds ncLibraryMutex(). */
static GriddedDataset readLocked(const std::string &path)
{
    NcFile f;
    f.open(path, NC_NOWRITE);
    const int ncid = f.id();

    GriddedDataset ds;
    ds.time = ncReadCoord1d(ncid, "time", path);
    ds.lat = ncReadCoord1d(ncid, "lat", path);
    ds.lon = ncReadCoord1d(ncid, "lon", path);
    int var_time = -1;
    ncCheck(nc_inq_varid(ncid, "time", &var_time), "nc_inq_varid(time)", path);
    ds.time_units = ncGetAttText(ncid, var_time, "units");
    const std::string cal = ncGetAttText(ncid, var_time, "calendar");
    if (!cal.empty()) {
        ds.calendar = cal;
    }

    int natts = 0;
    ncCheck(nc_inq_natts(ncid, &natts), "nc_inq_natts", path);
    for (int a = 0; a < natts; a++) {
        char name[NC_MAX_NAME + 1];
        ncCheck(nc_inq_attname(ncid, NC_GLOBAL, a, name), "nc_inq_attname", path);
        nc_type xtype;
        size_t len = 0;
        ncCheck(nc_inq_att(ncid, NC_GLOBAL, name, &xtype, &len), "nc_inq_att", path);
        if (xtype == NC_CHAR) {
            ds.text_attrs[name] = ncGetAttText(ncid, NC_GLOBAL, name);
        } else if (len == 1 && xtype != NC_FLOAT && xtype != NC_DOUBLE) {
            long long v = 0;
            if (ncGetAttLongLong(ncid, NC_GLOBAL, name, v)) {
                ds.int_attrs[name] = v;
            }
        }
    }

    int nvars = 0;
    ncCheck(nc_inq_nvars(ncid, &nvars), "nc_inq_nvars", path);
    const std::vector<size_t> start = {0, 0, 0};
    const std::vector<size_t> count = {ds.nt(), ds.nlat(), ds.nlon()};
    for (int v = 0; v < nvars; v++) {
        char name[NC_MAX_NAME + 1];
        ncCheck(nc_inq_varname(ncid, v, name), "nc_inq_varname", path);
        const NcVarInfo info = ncInqVar(ncid, name, path);
        if (info.ndims != 3) {
            continue;
        }
        if (info.dim_names[0] != "time" || info.dim_names[1] != "lat" || info.dim_names[2] != "lon") {
            logMsg(LOG_WARN, "Skipping variable %s with unexpected dims in %s", name, path.c_str());
            continue;
        }
        DataVar dv;
        dv.units = ncGetAttText(ncid, info.varid, "units");
        dv.long_name = ncGetAttText(ncid, info.varid, "long_name");
        dv.values = ncReadUnpacked(ncid, info, start, count, path);
        ds.vars[name] = std::move(dv);
    }
    f.close();
    return ds;
}

static long long requireIntAttr(const GriddedDataset &ds, const char *name, const std::string &path)
{
    const auto it = ds.int_attrs.find(name);
    if (it == ds.int_attrs.end() || it->second < 0) {
        throw ArtifactIOError(std::string("tile attribute '") + name + "' missing in", path, NC_ENOTATT);
    }
    return it->second;
}

} // namespace

/* ------------------------------------------------------------------ */
/* TileArtifactSet                                                     */
/* ------------------------------------------------------------------ */

const std::string &TileArtifactSet::runId()
{
    static const std::string id = []() {
        std::random_device rd;
        std::ostringstream oss;
        oss << (long)getpid() << "_" << std::hex << (rd() & 0xffffffu);
        return oss.str();
    }();
    return id;
}

TileArtifactSet::TileArtifactSet(const std::string &dir,
                                 const std::string &chunk_label,
                                 const std::vector<TileSpec> &tiles)
{
    if (!makeDirs(dir)) {
        throw ArtifactIOError("mkdir", dir, errno != 0 ? errno : EACCES);
    }
    const unsigned long seq = g_set_seq.fetch_add(1);
    const std::string label = safeLabel(chunk_label);
    for (const TileSpec &t : tiles) {
        TileArtifactHandle h;
        h.tile = t;
        h.path = joinPath(dir, "tile_" + runId() + "_" + std::to_string(seq) + "_" + label + "_" + safeLabel(t.name) + ".nc");
        slots_.push_back(h);
    }
    written_.assign(slots_.size(), 0);
}

TileArtifactSet::~TileArtifactSet()
{
    clear();
}

TileArtifactSet::TileArtifactSet(TileArtifactSet &&other) noexcept
    : slots_(std::move(other.slots_)), written_(std::move(other.written_))
{
    other.slots_.clear();
    other.written_.clear();
}

TileArtifactSet &TileArtifactSet::operator=(TileArtifactSet &&other) noexcept
{
    if (this != &other) {
        clear();
        slots_ = std::move(other.slots_);
        written_ = std::move(other.written_);
        other.slots_.clear();
        other.written_.clear();
    }
    return *this;
}

std::vector<TileArtifactHandle> TileArtifactSet::written() const
{
    std::vector<TileArtifactHandle> out;
    for (size_t i = 0; i < slots_.size(); i++) {
        if (written_[i]) {
            out.push_back(slots_[i]);
        }
    }
    return out;
}

void TileArtifactSet::clear()
{
    for (const TileArtifactHandle &h : slots_) {
        if (!removeFile(h.path)) {
            logMsg(LOG_WARN, "Failed to remove tile artifact %s: %s", h.path.c_str(), strerror(errno));
        }
    }
    slots_.clear();
    written_.clear();
}

/* ------------------------------------------------------------------ */
/* TileArtifactIO                                                      */
/* ------------------------------------------------------------------ */

void TileArtifactIO::writeDataset(const std::string &path, const GriddedDataset &ds, bool chunk_layout) const
{
    try {
        std::lock_guard<std::mutex> lock(ncLibraryMutex());
        writeLocked(path, ds, deflate_level_, chunk_layout);
    } catch (...) {
        removeFile(path);
        throw;
    }
}

void TileArtifactIO::writeTile(const std::string &path, const TileSpec &tile, const GriddedDataset &result) const
{
    if (result.nlat() != tile.lat.size() || result.nlon() != tile.lon.size()) {
        std::ostringstream exp;
        std::ostringstream act;
        exp << "tile " << tile.name << " (lat=" << tile.lat.size() << ", lon=" << tile.lon.size() << ")";
        act << "(lat=" << result.nlat() << ", lon=" << result.nlon() << ")";
        throw DimensionMismatch(exp.str(), act.str());
    }
    GriddedDataset ds = result;
    ds.text_attrs["tile_name"] = tile.name;
    ds.int_attrs["tile_lat_begin"] = (long long)tile.lat.begin;
    ds.int_attrs["tile_lat_end"] = (long long)tile.lat.end;
    ds.int_attrs["tile_lon_begin"] = (long long)tile.lon.begin;
    ds.int_attrs["tile_lon_end"] = (long long)tile.lon.end;
    writeDataset(path, ds, false);
}

LoadedTile TileArtifactIO::readTile(const std::string &path) const
{
    LoadedTile out;
    out.data = readDataset(path);

    const auto name = out.data.text_attrs.find("tile_name");
    if (name == out.data.text_attrs.end()) {
        throw ArtifactIOError("tile attribute 'tile_name' missing in", path, NC_ENOTATT);
    }
    out.tile.name = name->second;
    out.tile.lat = IndexRange((size_t)requireIntAttr(out.data, "tile_lat_begin", path),
                              (size_t)requireIntAttr(out.data, "tile_lat_end", path));
    out.tile.lon = IndexRange((size_t)requireIntAttr(out.data, "tile_lon_begin", path),
                              (size_t)requireIntAttr(out.data, "tile_lon_end", path));

    out.data.text_attrs.erase("tile_name");
    out.data.int_attrs.erase("tile_lat_begin");
    out.data.int_attrs.erase("tile_lat_end");
    out.data.int_attrs.erase("tile_lon_begin");
    out.data.int_attrs.erase("tile_lon_end");
    return out;
}

void TileArtifactIO::writeChunk(const std::string &path, const GriddedDataset &result) const
{
    writeDataset(path, result, true);
}

GriddedDataset TileArtifactIO::readDataset(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(ncLibraryMutex());
    return readLocked(path);
}
