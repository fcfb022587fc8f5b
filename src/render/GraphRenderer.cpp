#include "render/GraphRenderer.hpp"

#include <ctime>

#include "core/Constants.hpp"

namespace gitv {

namespace {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* GRAY = "\033[90m";

    // Background + foreground per band; backgrounds follow the hosted palette
    constexpr const char* STYLE_NONE = "\033[40;37m";
    constexpr const char* STYLE_LOW = "\033[48;2;14;68;41;37m";      // #0e4429
    constexpr const char* STYLE_MEDIUM = "\033[48;2;0;109;50;37m";   // #006d32
    constexpr const char* STYLE_HIGH = "\033[48;2;38;166;65;30m";    // #26a641
    constexpr const char* STYLE_MAX = "\033[48;2;57;211;83;30m";     // #39d353
    constexpr const char* STYLE_TODAY = "\033[44;37m";

    // Columns span weeks 0..WEEKS_IN_WINDOW+1; the offset shift can push keys into week 27
    constexpr int OLDEST_COLUMN = Constants::WEEKS_IN_WINDOW + 1;

    std::string gray(const std::string& text) {
        return std::string(GRAY) + text + RESET;
    }
}

GraphRenderer::GraphRenderer(const TimeBucketer& t, const CalendarGridBuilder& grid, std::ostream& o)
    : time(t), gridBuilder(grid), out(o) {}

ContributionLevel GraphRenderer::levelFor(int count) {
    if (count <= Constants::LEVEL_NONE_MAX) return ContributionLevel::None;
    if (count <= Constants::LEVEL_LOW_MAX) return ContributionLevel::Low;
    if (count <= Constants::LEVEL_MEDIUM_MAX) return ContributionLevel::Medium;
    if (count <= Constants::LEVEL_HIGH_MAX) return ContributionLevel::High;
    return ContributionLevel::Max;
}

const char* GraphRenderer::styleFor(ContributionLevel level, bool isToday) {
    if (isToday) return STYLE_TODAY;
    switch (level) {
        case ContributionLevel::None: return STYLE_NONE;
        case ContributionLevel::Low: return STYLE_LOW;
        case ContributionLevel::Medium: return STYLE_MEDIUM;
        case ContributionLevel::High: return STYLE_HIGH;
        case ContributionLevel::Max: return STYLE_MAX;
    }
    return STYLE_NONE;
}

std::string GraphRenderer::formatCell(int count) {
    if (count == 0) return " - ";
    std::string digits = std::to_string(count);
    if (count < 10) return " " + digits + " ";
    if (count < 100) return digits + " ";
    return digits;
}

long long GraphRenderer::totalCommits(const ContributionMap& commits) {
    long long sum = 0;
    for (const auto& kv : commits) sum += kv.second;
    return sum;
}

void GraphRenderer::printCell(int count, bool isToday) const {
    out << styleFor(levelFor(count), isToday) << formatCell(count) << RESET;
}

void GraphRenderer::printDayLabel(int day) const {
    static const char* const labels[] = {"   ", "Mon", "   ", "Wed", "   ", "Fri", "   "};
    const char* label = (day >= 0 && day < Constants::DAYS_PER_WEEK) ? labels[day] : "   ";
    out << gray(std::string(label) + " ");
}

void GraphRenderer::printMonthHeaders() const {
    const std::time_t now = time.now();
    std::tm cursor = TimeBucketer::toLocal(now);
    cursor.tm_mday -= Constants::DAYS_IN_WINDOW;
    cursor.tm_isdst = -1;
    std::time_t week = std::mktime(&cursor);
    int month = cursor.tm_mon;

    std::string line = "    ";
    while (week < now) {
        if (cursor.tm_mon != month) {
            char name[16];
            std::strftime(name, sizeof(name), "%b", &cursor);
            line += gray(std::string(name) + " ");
            month = cursor.tm_mon;
        } else {
            line += "   ";
        }
        cursor.tm_mday += Constants::DAYS_PER_WEEK;
        cursor.tm_isdst = -1;
        week = std::mktime(&cursor);
    }
    out << line << "\n";
}

void GraphRenderer::printGrid(const CalendarGrid& cols) const {
    printMonthHeaders();

    const int todayRow = time.weekOffset() - 1;
    for (int j = Constants::DAYS_PER_WEEK - 1; j >= 0; --j) {
        for (int i = OLDEST_COLUMN; i >= 0; --i) {
            if (i == OLDEST_COLUMN) {
                printDayLabel(j);
            }

            auto it = cols.find(i);
            if (it != cols.end()) {
                const WeekColumn& col = it->second;
                const bool inColumn = static_cast<size_t>(j) < col.size();
                if (i == 0 && j == todayRow) {
                    printCell(inColumn ? col[j] : 0, true);
                    continue;
                }
                if (inColumn) {
                    printCell(col[j], false);
                    continue;
                }
            }
            printCell(0, false);
        }
        out << "\n";
    }
}

void GraphRenderer::printLegend() const {
    out << "\n\n";
    out << gray("    Less ");
    static const struct { int value; const char* text; } swatches[] = {
        {0, " - "}, {1, " 1 "}, {4, " 4 "}, {7, " 7 "}, {10, "10+"}};
    bool first = true;
    for (const auto& s : swatches) {
        if (!first) out << ' ';
        first = false;
        out << styleFor(levelFor(s.value)) << s.text << RESET;
    }
    out << gray(" More") << "\n";
}

void GraphRenderer::render(const ContributionMap& commits) const {
    CalendarGrid cols = gridBuilder.build(commits);

    out << "\nYour Git Contribution Graph:\n\n";
    printGrid(cols);
    printLegend();
    out << "\nTotal commits in the last 6 months: " << totalCommits(commits) << "\n";
}

}
