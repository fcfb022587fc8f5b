#include "core/ContributionAggregator.hpp"

#include <exception>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace gitv {

ContributionAggregator::ContributionAggregator(const TimeBucketer& t) : time(t) {}

void ContributionAggregator::setProgressListener(ProgressListener listener) {
    progress = std::move(listener);
}

ContributionMap ContributionAggregator::emptyWindow() {
    ContributionMap map;
    for (int day = Constants::DAYS_IN_WINDOW; day > 0; --day) {
        map[day] = 0;
    }
    return map;
}

bool ContributionAggregator::addEvent(const std::string& email, const CommitEvent& event,
                                      ContributionMap& map) const {
    if (event.authorEmail != email) return false;
    int daysAgo = time.daysSince(event.timestamp);
    if (daysAgo == Constants::OUT_OF_RANGE) return false;
    ++map[daysAgo + time.weekOffset()];
    return true;
}

ContributionMap ContributionAggregator::aggregate(const std::string& email,
                                                  const std::vector<std::filesystem::path>& repositories,
                                                  ICommitSource& source) {
    ContributionMap map = emptyWindow();
    const size_t total = repositories.size();

    for (size_t i = 0; i < total; ++i) {
        if (stopRequested.load()) {
            Logger::instance().info("Stopped after " + std::to_string(i) + "/" +
                                    std::to_string(total) + " repositories");
            break;
        }
        const auto& repo = repositories[i];
        if (progress) progress(i + 1, total, repo);

        Expected<std::vector<CommitEvent>> events = Error{ErrorCode::InternalError, "not read"};
        try {
            events = source.commits(repo);
        } catch (const std::exception& e) {
            events = Error{ErrorCode::IoError, e.what()};
        }
        if (!events) {
            Logger::instance().debug("Skipping " + repo.string() + ": " + events.error().message);
            continue;
        }

        size_t counted = 0;
        for (const auto& ev : events.value()) {
            if (addEvent(email, ev, map)) ++counted;
        }
        Logger::instance().debug(repo.string() + ": " + std::to_string(counted) + " of " +
                                 std::to_string(events.value().size()) + " commits counted");
    }
    return map;
}

}
