#pragma once

#include <ostream>
#include <string>

#include "core/ContributionAggregator.hpp"
#include "core/ICommitSource.hpp"
#include "render/GraphRenderer.hpp"

namespace gitv {

/**
 * @brief Entry point that turns an author email into a rendered calendar
 *
 * Every collaborator is constructed by the caller and passed in; the
 * service owns none of them.
 */
class StatsService {
public:
    StatsService(const IRepositoryLister& lister, ICommitSource& source,
                 ContributionAggregator& aggregator, const GraphRenderer& renderer,
                 std::ostream& out);

    /**
     * @brief Aggregate and render contributions of `email`
     *
     * With no registered repositories (or an empty result) a single
     * informational line is written and nothing is rendered.
     */
    void generate(const std::string& email);

    static constexpr const char* NO_REPOSITORIES_MESSAGE =
        "No repositories found. Run \"gitv add <folder>\" first to scan for repositories.";

private:
    const IRepositoryLister& lister;
    ICommitSource& source;
    ContributionAggregator& aggregator;
    const GraphRenderer& renderer;
    std::ostream& out;
};

}
