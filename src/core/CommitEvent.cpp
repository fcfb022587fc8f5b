#include "core/CommitEvent.hpp"

#include <regex>
#include <stdexcept>

#include "core/Constants.hpp"
#include "core/TimeBucketer.hpp"

namespace gitv {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool isLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeap(y)) ? 29 : days[m - 1];
}

Error badDate(const std::string& text) {
    return Error{ErrorCode::InvalidTimestamp, "Unparsable commit date: '" + text + "'"};
}

}

Expected<std::time_t> parseCommitDate(const std::string& input) {
    const std::string text = trim(input);
    if (text.empty()) return badDate(input);

    // Raw git form: "<epoch> [+-hhmm]"; the epoch is already absolute
    static const std::regex rawRe(R"(^(-?\d+)(\s+[+-]\d{4})?$)");
    // ISO 8601 date, optional time, optional Z or +hh[:]mm
    static const std::regex isoRe(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2}))?)?\s*(Z|[+-]\d{2}:?\d{2})?$)");

    std::smatch m;
    if (std::regex_match(text, m, rawRe)) {
        try {
            return static_cast<std::time_t>(std::stoll(m[1].str()));
        } catch (const std::out_of_range&) {
            return badDate(input);
        }
    }

    if (!std::regex_match(text, m, isoRe)) return badDate(input);

    int year = std::stoi(m[1].str());
    int month = std::stoi(m[2].str());
    int day = std::stoi(m[3].str());
    int hour = m[4].matched ? std::stoi(m[4].str()) : 0;
    int minute = m[5].matched ? std::stoi(m[5].str()) : 0;
    int second = m[6].matched ? std::stoi(m[6].str()) : 0;
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return badDate(input);
    }

    if (m[7].matched) {
        std::string zone = m[7].str();
        int64_t offsetSeconds = 0;
        if (zone != "Z") {
            std::string digits;
            for (char c : zone) {
                if (c >= '0' && c <= '9') digits += c;
            }
            int oh = std::stoi(digits.substr(0, 2));
            int om = std::stoi(digits.substr(2, 2));
            if (oh > 23 || om > 59) return badDate(input);
            offsetSeconds = (oh * 3600 + om * 60) * (zone[0] == '-' ? -1 : 1);
        }
        int64_t days = TimeBucketer::civilDayNumber(year, static_cast<unsigned>(month),
                                                    static_cast<unsigned>(day));
        int64_t utc = days * Constants::SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
        return static_cast<std::time_t>(utc - offsetSeconds);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    std::time_t local = std::mktime(&tm);
    if (local == static_cast<std::time_t>(-1)) return badDate(input);
    return local;
}

Expected<CommitEvent> normalizeCommitRecord(const RawCommitRecord& raw) {
    auto ts = parseCommitDate(raw.date);
    if (!ts) return ts.error();
    return CommitEvent{raw.authorEmail, ts.value()};
}

}
