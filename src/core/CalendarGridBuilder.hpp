#pragma once

#include <map>
#include <vector>

#include "core/ContributionAggregator.hpp"

namespace gitv {

/// Counts of one week, chronological; never padded
using WeekColumn = std::vector<int>;

/// Week number (day-index / 7) -> column
using CalendarGrid = std::map<int, WeekColumn>;

/**
 * @brief Splits day counts into week columns
 *
 * A column is committed only when the traversal reaches the last day of its
 * week (day-in-week 6). A week entered mid-week keeps only the days
 * traversed from that point; a week that never reaches day 6 is dropped.
 */
class CalendarGridBuilder {
public:
    /// All keys in ascending order
    std::vector<int> sortKeys(const ContributionMap& map) const;

    CalendarGrid buildColumns(const std::vector<int>& keys, const ContributionMap& map) const;

    /// sortKeys + buildColumns
    CalendarGrid build(const ContributionMap& map) const;
};

}
