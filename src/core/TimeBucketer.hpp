#pragma once

#include <cstdint>
#include <ctime>
#include <functional>

namespace gitv {

/**
 * @brief Day-granular date arithmetic in the local timezone
 *
 * "Now" comes from an injectable clock so that every derived value (today,
 * week offset, window start) can be pinned in tests. All values are
 * computed from local calendar dates; the process timezone is the only
 * timezone considered.
 */
class TimeBucketer {
public:
    using Clock = std::function<std::time_t()>;

    /// @param clock Source of "now"; nullptr uses std::time
    explicit TimeBucketer(Clock clock = nullptr);

    std::time_t now() const;

    /// Local midnight of the day containing t
    std::time_t beginningOfDay(std::time_t t) const;

    /**
     * @brief ceil((today's local midnight - t's local midnight) / 86400s)
     * @return 0 for today, 1..183 for the past window, OUT_OF_RANGE beyond it
     *
     * Dates after today give negative values.
     */
    int daysSince(std::time_t t) const;

    /// 7 - weekday(today), Sunday = 0; always in [1, 7]
    int weekOffset() const;

    /// Weekday of today, Sunday = 0 .. Saturday = 6
    int weekday() const;

    /// Days since 1970-01-01 of a proleptic Gregorian date (month 1..12)
    static int64_t civilDayNumber(int64_t year, unsigned month, unsigned day);

    /// Local broken-down time of t
    static std::tm toLocal(std::time_t t);

private:
    Clock clock;
};

}
