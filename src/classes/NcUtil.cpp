#include "NcUtil.hpp"

#include "Errors.hpp"
#include "GridTypes.hpp"
#include "Logging.hpp"
#include "PathUtils.hpp"

#include <netcdf.h>

#include <cmath>

std::mutex &ncLibraryMutex()
{
    static std::mutex m;
    return m;
}

std::string ncStrError(int status)
{
    const char *msg = nc_strerror(status);
    return msg ? std::string(msg) : std::string("unknown netcdf error");
}

void ncCheck(int status, const char *what, const std::string &path)
{
    if (status == NC_NOERR) {
        return;
    }
    throw ArtifactIOError(what, path, status);
}

NcFile::~NcFile()
{
    if (ncid_ != -1) {
        const int rc = nc_close(ncid_);
        if (rc != NC_NOERR) {
            logMsg(LOG_WARN, "nc_close failed for %s: %s", path_.c_str(), ncStrError(rc).c_str());
        }
        ncid_ = -1;
    }
}

void NcFile::open(const std::string &path, int mode)
{
    path_ = path;
    ncCheck(nc_open(path.c_str(), mode, &ncid_), "nc_open", path);
}

void NcFile::create(const std::string &path, int cmode)
{
    path_ = path;
    ncCheck(nc_create(path.c_str(), cmode, &ncid_), "nc_create", path);
}

void NcFile::close()
{
    if (ncid_ == -1) {
        return;
    }
    const int rc = nc_close(ncid_);
    ncid_ = -1;
    ncCheck(rc, "nc_close", path_);
}

std::string ncGetAttText(int ncid, int varid, const char *name)
{
    size_t len = 0;
    const int rc_len = nc_inq_attlen(ncid, varid, name, &len);
    if (rc_len != NC_NOERR) {
        return "";
    }
    nc_type xtype;
    if (nc_inq_atttype(ncid, varid, name, &xtype) != NC_NOERR || xtype != NC_CHAR) {
        return "";
    }
    std::string out(len, '\0');
    if (len == 0) {
        return out;
    }
    const int rc = nc_get_att_text(ncid, varid, name, &out[0]);
    if (rc != NC_NOERR) {
        return "";
    }
    // NetCDF text attrs are not guaranteed to be NUL-terminated.
    return trim(out);
}

bool ncGetAttDouble(int ncid, int varid, const char *name, double &out_val)
{
    const int rc = nc_get_att_double(ncid, varid, name, &out_val);
    return rc == NC_NOERR;
}

bool ncGetAttLongLong(int ncid, int varid, const char *name, long long &out_val)
{
    const int rc = nc_get_att_longlong(ncid, varid, name, &out_val);
    return rc == NC_NOERR;
}

int NcVarInfo::dimPos(const std::string &dim_name) const
{
    for (size_t i = 0; i < dim_names.size(); i++) {
        if (dim_names[i] == dim_name) {
            return (int)i;
        }
    }
    return -1;
}

bool ncHasVar(int ncid, const std::string &var_name)
{
    int varid = -1;
    return nc_inq_varid(ncid, var_name.c_str(), &varid) == NC_NOERR;
}

NcVarInfo ncInqVar(int ncid, const std::string &var_name, const std::string &path)
{
    NcVarInfo r;
    r.name = var_name;
    ncCheck(nc_inq_varid(ncid, var_name.c_str(), &r.varid), ("nc_inq_varid(" + var_name + ")").c_str(), path);

    char name_buf[NC_MAX_NAME + 1];
    nc_type xtype;
    int dimids[NC_MAX_VAR_DIMS];
    int natts = 0;
    ncCheck(nc_inq_var(ncid, r.varid, name_buf, &xtype, &r.ndims, dimids, &natts),
            ("nc_inq_var(" + var_name + ")").c_str(),
            path);

    for (int i = 0; i < r.ndims; i++) {
        char dimname[NC_MAX_NAME + 1];
        size_t len = 0;
        ncCheck(nc_inq_dim(ncid, dimids[i], dimname, &len), "nc_inq_dim", path);
        r.dim_names.push_back(std::string(dimname));
        r.dim_lens.push_back(len);
    }

    double v = 0.0;
    if (ncGetAttDouble(ncid, r.varid, "scale_factor", v)) {
        r.has_scale = true;
        r.scale = v;
    }
    if (ncGetAttDouble(ncid, r.varid, "add_offset", v)) {
        r.has_offset = true;
        r.offset = v;
    }
    if (ncGetAttDouble(ncid, r.varid, "_FillValue", v)) {
        r.has_fill = true;
        r.fill = v;
    }
    if (ncGetAttDouble(ncid, r.varid, "missing_value", v)) {
        r.has_missing = true;
        r.missing = v;
    }
    return r;
}

std::vector<double> ncReadCoord1d(int ncid, const std::string &var_name, const std::string &path)
{
    const NcVarInfo info = ncInqVar(ncid, var_name, path);
    if (info.ndims != 1) {
        throw ArtifactIOError("coordinate '" + var_name + "' is not 1-D in", path, NC_EINVAL);
    }
    std::vector<double> out(info.dim_lens[0], 0.0);
    if (!out.empty()) {
        ncCheck(nc_get_var_double(ncid, info.varid, out.data()), ("nc_get_var_double(" + var_name + ")").c_str(), path);
    }
    return out;
}

std::vector<float> ncReadUnpacked(int ncid,
                                  const NcVarInfo &info,
                                  const std::vector<size_t> &start,
                                  const std::vector<size_t> &count,
                                  const std::string &path)
{
    size_t n = 1;
    for (size_t c : count) {
        n *= c;
    }
    std::vector<double> raw(n, 0.0);
    if (n > 0) {
        ncCheck(nc_get_vara_double(ncid, info.varid, start.data(), count.data(), raw.data()),
                ("nc_get_vara_double(" + info.name + ")").c_str(),
                path);
    }

    const bool packed = info.has_scale || info.has_offset;
    std::vector<float> out(n, kFillValue);
    for (size_t i = 0; i < n; i++) {
        const double r = raw[i];
        if (std::isnan(r)) {
            continue;
        }
        if (info.has_fill && r == info.fill) {
            continue;
        }
        if (info.has_missing && r == info.missing) {
            continue;
        }
        if (!packed && r == (double)kFillValue) {
            continue;
        }
        double v = r;
        if (info.has_scale) {
            v *= info.scale;
        }
        if (info.has_offset) {
            v += info.offset;
        }
        out[i] = (float)v;
    }
    return out;
}
