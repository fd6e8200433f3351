#include "ClimateIndexCalculator.hpp"

#include "Errors.hpp"
#include "PathUtils.hpp"
#include "TimeContext.hpp"

#include <utility>

namespace {

const float kFrostLimit = 0.0f;
const float kSummerLimit = 25.0f;

/* [first, last) time indices of one calendar year. */
struct YearSpan {
    int year;
    size_t first;
    size_t last;
};

static std::vector<YearSpan> yearSpans(const GriddedDataset &slice, const TimeContext &tc)
{
    std::vector<YearSpan> spans;
    for (size_t t = 0; t < slice.nt(); t++) {
        const int y = tc.year(slice.time[t]);
        if (!spans.empty() && spans.back().year == y) {
            spans.back().last = t + 1;
            continue;
        }
        for (const YearSpan &s : spans) {
            if (s.year == y) {
                throw CalculationError("time", "time axis is not ordered by year (" + std::to_string(y) + " repeats)");
            }
        }
        YearSpan s;
        s.year = y;
        s.first = t;
        s.last = t + 1;
        spans.push_back(s);
    }
    return spans;
}

static std::string stripSuffix(const std::string &s, const std::string &suffix)
{
    if (s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return s.substr(0, s.size() - suffix.size());
    }
    return s;
}

static DataVar annualStat(const GriddedDataset &slice,
                          const std::vector<float> &x,
                          const std::vector<YearSpan> &spans,
                          IndexKind kind)
{
    const size_t frame = slice.nlat() * slice.nlon();
    DataVar out;
    out.values.assign(spans.size() * frame, kFillValue);
    for (size_t k = 0; k < spans.size(); k++) {
        for (size_t c = 0; c < frame; c++) {
            double acc = 0.0;
            size_t n = 0;
            for (size_t t = spans[k].first; t < spans[k].last; t++) {
                const float v = x[t * frame + c];
                if (isMissing(v)) {
                    continue;
                }
                if (n == 0) {
                    acc = v;
                } else if (kind == INDEX_MEAN) {
                    acc += v;
                } else if (kind == INDEX_MAX) {
                    acc = v > acc ? v : acc;
                } else {
                    acc = v < acc ? v : acc;
                }
                n++;
            }
            if (n > 0) {
                out.values[k * frame + c] = (float)(kind == INDEX_MEAN ? acc / (double)n : acc);
            }
        }
    }
    return out;
}

static DataVar fixedCount(const GriddedDataset &slice,
                          const std::vector<float> &x,
                          const std::vector<YearSpan> &spans,
                          IndexKind kind)
{
    const size_t frame = slice.nlat() * slice.nlon();
    DataVar out;
    out.units = "days";
    out.values.assign(spans.size() * frame, kFillValue);
    for (size_t k = 0; k < spans.size(); k++) {
        for (size_t c = 0; c < frame; c++) {
            size_t n = 0;
            size_t hits = 0;
            for (size_t t = spans[k].first; t < spans[k].last; t++) {
                const float v = x[t * frame + c];
                if (isMissing(v)) {
                    continue;
                }
                n++;
                if ((kind == INDEX_FROST_DAYS && v < kFrostLimit) || (kind == INDEX_SUMMER_DAYS && v > kSummerLimit)) {
                    hits++;
                }
            }
            if (n > 0) {
                out.values[k * frame + c] = (float)hits;
            }
        }
    }
    return out;
}

static DataVar thresholdCount(const GriddedDataset &slice,
                              const std::vector<float> &x,
                              const std::vector<YearSpan> &spans,
                              const std::vector<int> &doy,
                              const ReferenceSurface &ref,
                              IndexKind kind)
{
    const size_t nlat = slice.nlat();
    const size_t nlon = slice.nlon();
    const size_t frame = nlat * nlon;
    DataVar out;
    out.units = "days";
    out.values.assign(spans.size() * frame, kFillValue);
    for (size_t k = 0; k < spans.size(); k++) {
        for (size_t i = 0; i < nlat; i++) {
            for (size_t j = 0; j < nlon; j++) {
                const size_t c = i * nlon + j;
                size_t n = 0;
                size_t hits = 0;
                for (size_t t = spans[k].first; t < spans[k].last; t++) {
                    const float v = x[t * frame + c];
                    const float thr = ref.at(doy[t], i, j);
                    if (isMissing(v) || isMissing(thr)) {
                        continue;
                    }
                    n++;
                    if ((kind == INDEX_EXCEED && v > thr) || (kind == INDEX_BELOW && v < thr)) {
                        hits++;
                    }
                }
                if (n > 0) {
                    out.values[k * frame + c] = (float)hits;
                }
            }
        }
    }
    return out;
}

} // namespace

IndexSpec ClimateIndexCalculator::parseIndex(const std::string &entry, const std::string &var_name)
{
    IndexSpec s;
    const std::string e = trim(entry);
    const size_t colon = e.find(':');
    const std::string head = toLower(trim(e.substr(0, colon)));

    if (colon != std::string::npos) {
        s.surface = trim(e.substr(colon + 1));
        if (s.surface.empty()) {
            throw ConfigError("index '" + e + "' names no reference surface");
        }
        if (head == "exceed") {
            s.kind = INDEX_EXCEED;
        } else if (head == "below") {
            s.kind = INDEX_BELOW;
        } else {
            throw ConfigError("unknown threshold index '" + e + "' (expected exceed:<surface> or below:<surface>)");
        }
        s.result_name = stripSuffix(s.surface, "_threshold");
        return s;
    }

    if (head == "mean") {
        s.kind = INDEX_MEAN;
        s.result_name = var_name + "_mean";
    } else if (head == "max") {
        s.kind = INDEX_MAX;
        s.result_name = var_name + "_max";
    } else if (head == "min") {
        s.kind = INDEX_MIN;
        s.result_name = var_name + "_min";
    } else if (head == "frost_days") {
        s.kind = INDEX_FROST_DAYS;
        s.result_name = "frost_days";
    } else if (head == "summer_days") {
        s.kind = INDEX_SUMMER_DAYS;
        s.result_name = "summer_days";
    } else {
        throw ConfigError("unknown index '" + e + "'");
    }
    return s;
}

ClimateIndexCalculator::ClimateIndexCalculator(const std::string &var_name, const std::string &indices)
    : var_name_(var_name)
{
    std::set<std::string> seen;
    for (const std::string &entry : splitList(indices, ',')) {
        IndexSpec s = parseIndex(entry, var_name_);
        if (!seen.insert(s.result_name).second) {
            throw ConfigError("index result '" + s.result_name + "' requested twice");
        }
        specs_.push_back(s);
    }
    if (specs_.empty()) {
        throw ConfigError("INDICES is empty");
    }
}

std::set<std::string> ClimateIndexCalculator::referenceNames() const
{
    std::set<std::string> out;
    for (const IndexSpec &s : specs_) {
        if (s.kind == INDEX_EXCEED || s.kind == INDEX_BELOW) {
            out.insert(s.surface);
        }
    }
    return out;
}

CalculationOutput ClimateIndexCalculator::compute(const GriddedDataset &slice, const SurfaceMap &refs) const
{
    const auto in = slice.vars.find(var_name_);
    if (in == slice.vars.end()) {
        throw CalculationError(var_name_, "input variable not present in slice");
    }
    const std::vector<float> &x = in->second.values;
    if (x.size() != slice.frameSize()) {
        throw CalculationError(var_name_, "input values do not match the (time, lat, lon) frame");
    }

    TimeContext tc;
    tc.setUnits(slice.time_units);
    const std::vector<YearSpan> spans = yearSpans(slice, tc);

    CalculationOutput out;
    for (const YearSpan &s : spans) {
        out.time.push_back(slice.time[s.first]);
    }

    std::vector<int> doy;
    doy.reserve(slice.nt());
    for (double t : slice.time) {
        doy.push_back(tc.dayOfYear(t));
    }

    for (const IndexSpec &s : specs_) {
        try {
            DataVar v;
            switch (s.kind) {
                case INDEX_MEAN:
                case INDEX_MAX:
                case INDEX_MIN:
                    v = annualStat(slice, x, spans, s.kind);
                    v.units = in->second.units;
                    if (s.kind == INDEX_MEAN) {
                        v.long_name = "annual mean of " + var_name_;
                    } else if (s.kind == INDEX_MAX) {
                        v.long_name = "annual maximum of " + var_name_;
                    } else {
                        v.long_name = "annual minimum of " + var_name_;
                    }
                    break;
                case INDEX_FROST_DAYS:
                    v = fixedCount(slice, x, spans, s.kind);
                    v.long_name = "number of days with " + var_name_ + " below 0";
                    break;
                case INDEX_SUMMER_DAYS:
                    v = fixedCount(slice, x, spans, s.kind);
                    v.long_name = "number of days with " + var_name_ + " above 25";
                    break;
                case INDEX_EXCEED:
                case INDEX_BELOW: {
                    const auto ref = refs.find(s.surface);
                    if (ref == refs.end()) {
                        throw CalculationError(s.result_name, "reference surface '" + s.surface + "' not available");
                    }
                    if (ref->second.nlat() != slice.nlat() || ref->second.nlon() != slice.nlon()) {
                        throw CalculationError(s.result_name,
                                               "reference surface '" + s.surface + "' does not cover the tile");
                    }
                    v = thresholdCount(slice, x, spans, doy, ref->second, s.kind);
                    v.long_name = "number of days with " + var_name_ + (s.kind == INDEX_EXCEED ? " above " : " below ") +
                                  s.surface;
                    break;
                }
            }
            out.results[s.result_name] = std::move(v);
        } catch (const CalculationError &e) {
            CalculationFailure f;
            f.name = s.result_name;
            f.cause = e.cause();
            out.failures.push_back(f);
        }
    }
    return out;
}
