#include "core/CalendarGridBuilder.hpp"

#include <algorithm>

#include "core/Constants.hpp"

namespace gitv {

std::vector<int> CalendarGridBuilder::sortKeys(const ContributionMap& map) const {
    std::vector<int> keys;
    keys.reserve(map.size());
    for (const auto& kv : map) keys.push_back(kv.first);
    std::sort(keys.begin(), keys.end());
    return keys;
}

CalendarGrid CalendarGridBuilder::buildColumns(const std::vector<int>& keys, const ContributionMap& map) const {
    CalendarGrid cols;
    WeekColumn col;

    for (int k : keys) {
        int week = k / Constants::DAYS_PER_WEEK;
        int dayInWeek = k % Constants::DAYS_PER_WEEK;

        if (dayInWeek == 0) {
            col.clear();
        }

        auto it = map.find(k);
        col.push_back(it != map.end() ? it->second : 0);

        if (dayInWeek == Constants::DAYS_PER_WEEK - 1) {
            cols[week] = col;
        }
    }
    return cols;
}

CalendarGrid CalendarGridBuilder::build(const ContributionMap& map) const {
    return buildColumns(sortKeys(map), map);
}

}
