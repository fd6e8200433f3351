//  GridTypes.hpp
//  gridtiler
//
//  Plain value types shared by the tiling engine: index ranges, extents,
//  tile specs, gridded datasets and reference surfaces.
//
#ifndef GridTypes_hpp
#define GridTypes_hpp

#include <cmath>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

/* netCDF default float fill; the engine-wide missing-value sentinel. */
const float kFillValue = 9.96921e36f;

static inline bool isMissing(float v)
{
    return v == kFillValue || std::isnan(v);
}

struct IndexRange {
    size_t begin = 0;
    size_t end = 0; /* exclusive */

    IndexRange() = default;
    IndexRange(size_t b, size_t e) : begin(b), end(e) {}

    size_t size() const { return end > begin ? end - begin : 0; }
    bool operator==(const IndexRange &o) const { return begin == o.begin && end == o.end; }
    bool operator!=(const IndexRange &o) const { return !(*this == o); }
};

struct GridExtent {
    size_t lat_count = 0;
    size_t lon_count = 0;

    GridExtent() = default;
    GridExtent(size_t nlat, size_t nlon) : lat_count(nlat), lon_count(nlon) {}

    size_t cells() const { return lat_count * lon_count; }
    bool operator==(const GridExtent &o) const { return lat_count == o.lat_count && lon_count == o.lon_count; }
    bool operator!=(const GridExtent &o) const { return !(*this == o); }

    std::string str() const;
};

struct TileSpec {
    std::string name;
    IndexRange lat;
    IndexRange lon;

    size_t cells() const { return lat.size() * lon.size(); }
};

/* One named float array on a (time, lat, lon) frame, row-major. */
struct DataVar {
    std::vector<float> values;
    std::string units;
    std::string long_name;
};

/*
 * A set of variables sharing one (time, lat, lon) frame plus coordinates
 * and global attributes. Chunk inputs, tile results and chunk results are
 * all carried in this shape.
 */
struct GriddedDataset {
    std::vector<double> time;
    std::string time_units;
    std::string calendar = "standard";
    std::vector<double> lat;
    std::vector<double> lon;

    std::map<std::string, DataVar> vars;

    std::map<std::string, std::string> text_attrs;
    std::map<std::string, long long> int_attrs;

    size_t nt() const { return time.size(); }
    size_t nlat() const { return lat.size(); }
    size_t nlon() const { return lon.size(); }
    size_t frameSize() const { return nt() * nlat() * nlon(); }
    GridExtent extent() const { return GridExtent(nlat(), nlon()); }

    size_t index(size_t t, size_t i, size_t j) const { return (t * nlat() + i) * nlon() + j; }

    bool hasVar(const std::string &name) const { return vars.find(name) != vars.end(); }

    /* Copy of the lat/lon window with every time step kept. */
    GriddedDataset slice(const IndexRange &lat_r, const IndexRange &lon_r) const;
};

/*
 * A read-only reference array keyed by (dayofyear, lat, lon). Static
 * surfaces have ndoy == 1 and has_doy == false. lat/lon record which global
 * window the values cover.
 */
struct ReferenceSurface {
    std::string name;
    std::string units;
    bool has_doy = false;
    size_t ndoy = 1;
    IndexRange lat;
    IndexRange lon;
    std::vector<float> values;

    size_t nlat() const { return lat.size(); }
    size_t nlon() const { return lon.size(); }

    /* doy is 1-based; clamped into the surface's calendar. */
    float at(int doy, size_t i, size_t j) const
    {
        size_t d = 0;
        if (has_doy) {
            d = doy < 1 ? 0 : (size_t)(doy - 1);
            if (d >= ndoy) {
                d = ndoy - 1;
            }
        }
        return values[(d * nlat() + i) * nlon() + j];
    }
};

typedef std::map<std::string, ReferenceSurface> SurfaceMap;

#endif /* GridTypes_hpp */
