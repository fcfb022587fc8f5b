#pragma once

#include <ostream>
#include <string>

#include "core/CalendarGridBuilder.hpp"
#include "core/ContributionAggregator.hpp"
#include "core/TimeBucketer.hpp"

namespace gitv {

/// Visual intensity band of a daily count
enum class ContributionLevel { None, Low, Medium, High, Max };

/**
 * @brief Renders a contribution calendar as ANSI-colored text
 *
 * Layout (top to bottom):
 *   month header     "    " then one 3-char slot per week stride
 *   7 grid rows      day index 6 first; columns oldest week first, week 0 last
 *   legend           Less [ - ] [ 1 ] [ 4 ] [ 7 ] [10+] More
 *   total            sum over the whole ContributionMap
 *
 * The cell at week 0, row weekOffset()-1 is today and always uses the
 * highlight style. Rendering only writes to the injected stream.
 */
class GraphRenderer {
public:
    GraphRenderer(const TimeBucketer& time, const CalendarGridBuilder& grid, std::ostream& out);

    /// Full output: title, month header, grid, legend, total
    void render(const ContributionMap& commits) const;

    void printMonthHeaders() const;
    void printGrid(const CalendarGrid& cols) const;
    void printLegend() const;

    static ContributionLevel levelFor(int count);

    /// Fixed 3-char cell text; 1000 and above overflow
    static std::string formatCell(int count);

    /// ANSI style prefix for a level, or the today highlight
    static const char* styleFor(ContributionLevel level, bool isToday = false);

    static long long totalCommits(const ContributionMap& commits);

private:
    void printCell(int count, bool isToday) const;
    void printDayLabel(int day) const;

    const TimeBucketer& time;
    const CalendarGridBuilder& gridBuilder;
    std::ostream& out;
};

}
