#include "cogmem/core/time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace cogmem {

namespace {

// Days from civil date, proleptic Gregorian (Howard Hinnant's algorithm)
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

std::int64_t floor_div(std::int64_t a, std::int64_t b) {
    std::int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // anonymous namespace

Timestamp now_utc() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string to_iso8601(Timestamp ts) {
    std::int64_t day = floor_div(ts, kSecondsPerDay);
    std::int64_t secs = ts - day * kSecondsPerDay;

    std::int64_t y;
    unsigned m, d;
    civil_from_days(day, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<long long>(y), m, d,
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60));
    return buf;
}

Timestamp from_iso8601(const std::string& text) {
    long long y = 0;
    unsigned mo = 0, d = 0, h = 0, mi = 0, s = 0;
    char sep = 0;
    int n = std::sscanf(text.c_str(), "%lld-%u-%u%c%u:%u:%u",
                        &y, &mo, &d, &sep, &h, &mi, &s);
    if (n < 3) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }
    if (n < 7) {
        h = mi = s = 0;
    }
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || s > 60) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }

    return days_from_civil(y, mo, d) * kSecondsPerDay + h * 3600 + mi * 60 + s;
}

double days_between(Timestamp a, Timestamp b) {
    return static_cast<double>(b - a) / static_cast<double>(kSecondsPerDay);
}

int hour_of_day(Timestamp ts) {
    std::int64_t secs = ts - floor_div(ts, kSecondsPerDay) * kSecondsPerDay;
    return static_cast<int>(secs / kSecondsPerHour);
}

Timestamp start_of_day(Timestamp ts) {
    return floor_div(ts, kSecondsPerDay) * kSecondsPerDay;
}

} // namespace cogmem
