#include "TimeContext.hpp"

#include "Errors.hpp"
#include "PathUtils.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

TimeContext::TimeContext()
    : factor_to_minutes_(0.0),
      base_minutes_since_epoch_(0) {
}

void TimeContext::setUnits(const std::string &units_attr) {
    const std::string u = toLower(trim(units_attr));
    const size_t since_pos = u.find("since");
    if (since_pos == std::string::npos) {
        throw ConfigError("time units missing 'since': '" + units_attr + "'");
    }
    const std::string unit_part = trim(u.substr(0, since_pos));
    const std::string base_part = trim(u.substr(since_pos + 5));

    double factor = 0.0;
    if (unit_part.find("second") == 0) {
        factor = 1.0 / 60.0;
    } else if (unit_part.find("minute") == 0) {
        factor = 1.0;
    } else if (unit_part.find("hour") == 0) {
        factor = 60.0;
    } else if (unit_part.find("day") == 0) {
        factor = 1440.0;
    } else {
        throw ConfigError("unsupported time unit: '" + units_attr + "'");
    }

    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    int hh = 0;
    int mm = 0;
    if (!parseIsoDateTime(base_part, y, m, d, hh, mm)) {
        throw ConfigError("cannot parse time base date: '" + units_attr + "'");
    }

    units_ = trim(units_attr);
    factor_to_minutes_ = factor;
    base_minutes_since_epoch_ = daysFromCivil(y, m, d) * 1440LL + (long long)hh * 60LL + (long long)mm;
}

const std::string &TimeContext::units() const {
    return units_;
}

bool TimeContext::valid() const {
    return factor_to_minutes_ > 0.0;
}

int TimeContext::year(double t) const {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    toCivil(t, y, m, d);
    return y;
}

int TimeContext::dayOfYear(double t) const {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    toCivil(t, y, m, d);
    if (m == 0 || d == 0) {
        return 0;
    }
    return dayOfYear(y, m, d);
}

std::string TimeContext::formatDate(double t) const {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    toCivil(t, y, m, d);

    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << y << "-"
        << std::setw(2) << std::setfill('0') << m << "-"
        << std::setw(2) << std::setfill('0') << d;
    return oss.str();
}

double TimeContext::valueOf(int y, unsigned m, unsigned d) const {
    if (!valid()) {
        return 0.0;
    }
    const long long minutes = daysFromCivil(y, m, d) * 1440LL - base_minutes_since_epoch_;
    return (double)minutes / factor_to_minutes_;
}

bool TimeContext::isLeapYear(int year) {
    if ((year % 4) != 0) {
        return false;
    }
    if ((year % 100) != 0) {
        return true;
    }
    return (year % 400) == 0;
}

int TimeContext::daysInMonth(int year, unsigned month) {
    static const int dim[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return dim[month - 1];
}

int TimeContext::dayOfYear(int year, unsigned month, unsigned day) {
    static const int cum[12] = {0, 31, 59, 90, 120, 151, 181, 212, 243, 273, 304, 334};
    if (month < 1 || month > 12) {
        return 0;
    }
    int doy = cum[month - 1] + (int)day;
    if (month > 2 && isLeapYear(year)) {
        doy += 1;
    }
    return doy;
}

// Howard Hinnant's civil calendar algorithms (public domain)
long long TimeContext::daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = (unsigned)(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return (long long)era * 146097 + (long long)doe - 719468;
}

void TimeContext::civilFromDays(long long z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = (unsigned)(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = (int)(yoe) + (int)(era * 400);
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp + (mp < 10 ? 3 : -9);
    y += (m <= 2);
}

bool TimeContext::parseIsoDateTime(const std::string &s, int &y, unsigned &m, unsigned &d, int &hh, int &mm) {
    // Accept:
    //  YYYY-M-D
    //  YYYY-MM-DD HH:MM(:SS)
    //  YYYY-MM-DDTHH:MM:SS
    const std::string t = trim(s);
    int n_read = 0;
    if (sscanf(t.c_str(), "%d-%u-%u%n", &y, &m, &d, &n_read) < 3) {
        return false;
    }
    if (m < 1 || m > 12 || d < 1 || (int)d > daysInMonth(y, m)) {
        return false;
    }
    hh = 0;
    mm = 0;

    size_t pos = (size_t)n_read;
    while (pos < t.size() && (t[pos] == ' ' || t[pos] == 'T')) {
        pos++;
    }
    if (pos >= t.size()) {
        return true;
    }
    int h = 0;
    int mi = 0;
    if (sscanf(t.c_str() + pos, "%d:%d", &h, &mi) == 2) {
        hh = h;
        mm = mi;
    }
    // Seconds and zone suffixes ("UTC", "Z") are ignored.
    return true;
}

void TimeContext::toCivil(double t, int &y, unsigned &m, unsigned &d) const {
    if (!valid() || std::isnan(t) || std::isinf(t)) {
        y = 0;
        m = 0;
        d = 0;
        return;
    }
    const double abs_min = (double)base_minutes_since_epoch_ + t * factor_to_minutes_;
    const long long days = (long long)std::floor(abs_min / 1440.0 + 1e-9);
    civilFromDays(days, y, m, d);
}
