//  Calculator.hpp
//  gridtiler
//
//  Pluggable per-tile computation. A Calculator maps one tile slice of the
//  chunk input, plus that tile's reference surfaces, to a set of named
//  (output_time, lat, lon) results.
//
#ifndef Calculator_hpp
#define Calculator_hpp

#include "GridTypes.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

struct CalculationFailure {
    std::string name;
    std::string cause;
};

struct CalculationOutput {
    std::vector<double> time;                 /* output time axis */
    std::map<std::string, DataVar> results;   /* (time, lat, lon) each */
    std::vector<CalculationFailure> failures; /* per-result, never fatal by themselves */
};

class Calculator {
public:
    virtual ~Calculator() = default;

    virtual std::string name() const = 0;
    /* Reference surfaces compute() expects in its refs argument. */
    virtual std::set<std::string> referenceNames() const = 0;

    /*
     * Called concurrently from several tiles; must not touch shared mutable
     * state. A failure limited to one result goes into failures; anything
     * thrown fails the whole tile.
     */
    virtual CalculationOutput compute(const GriddedDataset &slice, const SurfaceMap &refs) const = 0;
};

#endif /* Calculator_hpp */
