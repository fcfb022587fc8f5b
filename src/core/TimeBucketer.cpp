#include "core/TimeBucketer.hpp"

#include <cmath>

#include "core/Constants.hpp"

namespace gitv {

TimeBucketer::TimeBucketer(Clock clk)
    : clock(clk ? std::move(clk) : Clock([] { return std::time(nullptr); })) {}

std::time_t TimeBucketer::now() const {
    return clock();
}

std::tm TimeBucketer::toLocal(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

int64_t TimeBucketer::civilDayNumber(int64_t y, unsigned m, unsigned d) {
    // Howard Hinnant's days_from_civil
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::time_t TimeBucketer::beginningOfDay(std::time_t t) const {
    std::tm tm = toLocal(t);
    tm.tm_hour = 0;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

int TimeBucketer::daysSince(std::time_t t) const {
    // Rounds up: a DST fall-back between the two midnights adds an hour
    const double seconds = std::difftime(beginningOfDay(now()), beginningOfDay(t));
    const double days = std::ceil(seconds / static_cast<double>(Constants::SECONDS_PER_DAY));
    if (days > Constants::DAYS_IN_WINDOW) {
        return Constants::OUT_OF_RANGE;
    }
    return static_cast<int>(days);
}

int TimeBucketer::weekday() const {
    return toLocal(now()).tm_wday;
}

int TimeBucketer::weekOffset() const {
    return Constants::DAYS_PER_WEEK - weekday();
}

}
