//  ReferenceCache.hpp
//  gridtiler
//
//  Read-only reference surfaces (day-of-year threshold grids) shared by all
//  tiles of a run. Surfaces are named up front and read lazily, one tile
//  window at a time, from a SurfaceSource.
//
#ifndef ReferenceCache_hpp
#define ReferenceCache_hpp

#include "GridTypes.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

struct SurfaceLayout {
    bool exists = false;
    bool has_doy = false;
    size_t ndoy = 1;
    std::string units;
};

/* Backing store of reference surfaces. read() must be safe to call concurrently. */
class SurfaceSource {
public:
    virtual ~SurfaceSource() = default;

    virtual GridExtent extent() const = 0;
    virtual SurfaceLayout layout(const std::string &name) const = 0;
    virtual ReferenceSurface read(const std::string &name, const IndexRange &lat, const IndexRange &lon) const = 0;

    /* Whole-surface validity scan; used once at load time for diagnostics. */
    virtual bool allMissing(const std::string &name) const = 0;
};

/* Surfaces already held in memory (full extent each). */
class MemorySurfaceSource final : public SurfaceSource {
public:
    explicit MemorySurfaceSource(const GridExtent &extent);

    /* values laid out (ndoy, lat, lon) over the full extent. */
    void add(const ReferenceSurface &full_surface);

    GridExtent extent() const override { return extent_; }
    SurfaceLayout layout(const std::string &name) const override;
    ReferenceSurface read(const std::string &name, const IndexRange &lat, const IndexRange &lon) const override;
    bool allMissing(const std::string &name) const override;

private:
    GridExtent extent_;
    SurfaceMap surfaces_;
};

/*
 * Surfaces in a netCDF file, variables shaped (dayofyear, lat, lon) or
 * (lat, lon). The file stays open; each read is a single hyperslab under
 * the netCDF library lock.
 */
class NetcdfSurfaceSource final : public SurfaceSource {
public:
    NetcdfSurfaceSource(const std::string &path,
                        const std::string &dim_lat,
                        const std::string &dim_lon,
                        const std::string &expected_baseline_period);
    ~NetcdfSurfaceSource() override;

    GridExtent extent() const override;
    SurfaceLayout layout(const std::string &name) const override;
    ReferenceSurface read(const std::string &name, const IndexRange &lat, const IndexRange &lon) const override;
    bool allMissing(const std::string &name) const override;

    const std::string &baselinePeriod() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class ReferenceCache {
public:
    /* Empty cache: subset() returns an empty map. */
    ReferenceCache() = default;

    /*
     * Validate and register the named surfaces. Only metadata is touched.
     * Throws ReferenceDataError for a missing surface unless allow_missing.
     */
    static ReferenceCache load(std::shared_ptr<const SurfaceSource> source,
                               const std::set<std::string> &names,
                               bool allow_missing = false);

    /* Fresh tile-local copies of every registered surface. Never mutates *this. */
    SurfaceMap subset(const TileSpec &tile) const;

    const std::set<std::string> &names() const { return names_; }
    bool empty() const { return names_.empty(); }
    GridExtent extent() const;

private:
    std::shared_ptr<const SurfaceSource> source_;
    std::set<std::string> names_;
};

#endif /* ReferenceCache_hpp */
