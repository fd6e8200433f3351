#include "GridTypes.hpp"

#include <algorithm>
#include <sstream>

std::string GridExtent::str() const
{
    std::ostringstream oss;
    oss << "(lat=" << lat_count << ", lon=" << lon_count << ")";
    return oss.str();
}

GriddedDataset GriddedDataset::slice(const IndexRange &lat_r, const IndexRange &lon_r) const
{
    GriddedDataset out;
    out.time = time;
    out.time_units = time_units;
    out.calendar = calendar;
    out.lat.assign(lat.begin() + (long)lat_r.begin, lat.begin() + (long)lat_r.end);
    out.lon.assign(lon.begin() + (long)lon_r.begin, lon.begin() + (long)lon_r.end);
    out.text_attrs = text_attrs;
    out.int_attrs = int_attrs;

    const size_t nt_ = nt();
    const size_t sl = lat_r.size();
    const size_t sn = lon_r.size();
    for (const auto &it : vars) {
        DataVar v;
        v.units = it.second.units;
        v.long_name = it.second.long_name;
        v.values.resize(nt_ * sl * sn);
        const std::vector<float> &src = it.second.values;
        for (size_t t = 0; t < nt_; t++) {
            for (size_t i = 0; i < sl; i++) {
                const size_t s0 = index(t, lat_r.begin + i, lon_r.begin);
                const size_t d0 = (t * sl + i) * sn;
                std::copy(src.begin() + (long)s0, src.begin() + (long)(s0 + sn), v.values.begin() + (long)d0);
            }
        }
        out.vars[it.first] = std::move(v);
    }
    return out;
}
