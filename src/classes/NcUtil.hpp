//  NcUtil.hpp
//  gridtiler
//
//  Thin helpers over the netCDF C API. The library is not safe for
//  concurrent use, so every call site takes ncLibraryMutex() for the
//  duration of one open/read/close or open/write/close sequence.
//
#ifndef NcUtil_hpp
#define NcUtil_hpp

#include <mutex>
#include <string>
#include <vector>

std::mutex &ncLibraryMutex();

std::string ncStrError(int status);

/* Throws ArtifactIOError(what, path, status) unless status == NC_NOERR. */
void ncCheck(int status, const char *what, const std::string &path);

/* Owns one open ncid; closes it on scope exit. */
class NcFile {
public:
    NcFile() = default;
    ~NcFile();

    NcFile(const NcFile &) = delete;
    NcFile &operator=(const NcFile &) = delete;

    void open(const std::string &path, int mode);
    void create(const std::string &path, int cmode);
    /* Close explicitly; a failed close is reported (writes flush here). */
    void close();

    int id() const { return ncid_; }
    const std::string &path() const { return path_; }
    bool isOpen() const { return ncid_ != -1; }

private:
    int ncid_ = -1;
    std::string path_;
};

std::string ncGetAttText(int ncid, int varid, const char *name);
bool ncGetAttDouble(int ncid, int varid, const char *name, double &out_val);
bool ncGetAttLongLong(int ncid, int varid, const char *name, long long &out_val);

/* Layout and packing of one n-D variable. */
struct NcVarInfo {
    std::string name;
    int varid = -1;
    int ndims = 0;
    std::vector<std::string> dim_names;
    std::vector<size_t> dim_lens;

    bool has_scale = false;
    bool has_offset = false;
    double scale = 1.0;
    double offset = 0.0;
    bool has_fill = false;
    bool has_missing = false;
    double fill = 0.0;
    double missing = 0.0;

    int dimPos(const std::string &dim_name) const;
};

/* Throws ArtifactIOError when the variable is absent or unreadable. */
NcVarInfo ncInqVar(int ncid, const std::string &var_name, const std::string &path);
bool ncHasVar(int ncid, const std::string &var_name);

std::vector<double> ncReadCoord1d(int ncid, const std::string &var_name, const std::string &path);

/*
 * Read a hyperslab as float, applying scale_factor/add_offset and mapping
 * _FillValue, missing_value and NaN to kFillValue.
 */
std::vector<float> ncReadUnpacked(int ncid,
                                  const NcVarInfo &info,
                                  const std::vector<size_t> &start,
                                  const std::vector<size_t> &count,
                                  const std::string &path);

#endif /* NcUtil_hpp */
