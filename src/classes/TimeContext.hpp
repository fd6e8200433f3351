//  TimeContext.hpp
//  gridtiler
//
//  CF time axis ("<unit> since <date>") to calendar year / day-of-year.
//
#ifndef TimeContext_hpp
#define TimeContext_hpp

#include <string>

class TimeContext {
public:
    TimeContext();

    /* Throws ConfigError when the units string cannot be parsed. */
    void setUnits(const std::string &units_attr);
    const std::string &units() const;
    bool valid() const;

    int year(double t) const;
    int dayOfYear(double t) const;               /* 1-366 */
    std::string formatDate(double t) const;      /* YYYY-MM-DD */

    /* Axis value of 00:00 on the given civil date. */
    double valueOf(int y, unsigned m, unsigned d) const;

    static bool isLeapYear(int year);
    static int dayOfYear(int year, unsigned month, unsigned day);

private:
    std::string units_;
    double factor_to_minutes_;
    long long base_minutes_since_epoch_;

    static int daysInMonth(int year, unsigned month);
    static long long daysFromCivil(int y, unsigned m, unsigned d);
    static void civilFromDays(long long z, int &y, unsigned &m, unsigned &d);
    static bool parseIsoDateTime(const std::string &s, int &y, unsigned &m, unsigned &d, int &hh, int &mm);

    void toCivil(double t, int &y, unsigned &m, unsigned &d) const;
};

#endif /* TimeContext_hpp */
