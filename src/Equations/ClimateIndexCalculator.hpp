//  ClimateIndexCalculator.hpp
//  gridtiler
//
//  Built-in Calculator: annual statistics and threshold counts over one
//  daily input variable. One output step per calendar year present in the
//  slice, stamped with the first input time of that year.
//
//  INDICES entries:
//    mean | max | min        -> <var>_mean, <var>_max, <var>_min
//    frost_days              -> days with value < 0
//    summer_days             -> days with value > 25
//    exceed:<surface>        -> days with value > surface(dayofyear)
//    below:<surface>         -> days with value < surface(dayofyear)
//  Threshold results are named after the surface with "_threshold" dropped.
//
#ifndef ClimateIndexCalculator_hpp
#define ClimateIndexCalculator_hpp

#include "Calculator.hpp"

#include <string>
#include <vector>

enum IndexKind {
    INDEX_MEAN = 0,
    INDEX_MAX,
    INDEX_MIN,
    INDEX_FROST_DAYS,
    INDEX_SUMMER_DAYS,
    INDEX_EXCEED,
    INDEX_BELOW
};

struct IndexSpec {
    IndexKind kind = INDEX_MEAN;
    std::string result_name;
    std::string surface; /* INDEX_EXCEED / INDEX_BELOW only */
};

class ClimateIndexCalculator final : public Calculator {
public:
    /* indices is the comma-separated INDICES list. Throws ConfigError. */
    ClimateIndexCalculator(const std::string &var_name, const std::string &indices);

    std::string name() const override { return "ClimateIndexCalculator"; }
    std::set<std::string> referenceNames() const override;
    CalculationOutput compute(const GriddedDataset &slice, const SurfaceMap &refs) const override;

    const std::vector<IndexSpec> &indices() const { return specs_; }

    static IndexSpec parseIndex(const std::string &entry, const std::string &var_name);

private:
    std::string var_name_;
    std::vector<IndexSpec> specs_;
};

#endif /* ClimateIndexCalculator_hpp */
