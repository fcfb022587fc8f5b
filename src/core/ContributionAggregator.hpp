#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "core/ICommitSource.hpp"
#include "core/TimeBucketer.hpp"

namespace gitv {

/// Day-index (days ago + week offset) -> number of commits
using ContributionMap = std::map<int, int>;

/**
 * @brief Buckets one author's commits across repositories into day counts
 *
 * Repositories are visited strictly in order, one at a time. A repository
 * that cannot be read contributes nothing and never aborts the run.
 */
class ContributionAggregator {
public:
    /// Called before each repository: (1-based index, total, path)
    using ProgressListener = std::function<void(size_t, size_t, const std::filesystem::path&)>;

    explicit ContributionAggregator(const TimeBucketer& time);

    void setProgressListener(ProgressListener listener);

    /**
     * @brief Aggregate commits of `email` over all repositories
     * @param email Author email, compared exactly
     * @param repositories Paths in processing order
     * @param source History source queried once per repository
     * @return Map seeded with days 1..183 at zero plus every bucketed commit
     */
    ContributionMap aggregate(const std::string& email,
                              const std::vector<std::filesystem::path>& repositories,
                              ICommitSource& source);

    /// Add one event to the map if it matches and falls inside the window
    bool addEvent(const std::string& email, const CommitEvent& event, ContributionMap& map) const;

    /// Stop before the next repository; the one in flight completes
    void requestStop() { stopRequested.store(true); }
    bool stopped() const { return stopRequested.load(); }

    /// Map with days 1..183 present and zero
    static ContributionMap emptyWindow();

private:
    const TimeBucketer& time;
    ProgressListener progress;
    std::atomic<bool> stopRequested{false};
};

}
