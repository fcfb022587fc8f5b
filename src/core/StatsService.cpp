#include "core/StatsService.hpp"

#include "util/Logger.hpp"

namespace gitv {

StatsService::StatsService(const IRepositoryLister& l, ICommitSource& s,
                           ContributionAggregator& a, const GraphRenderer& r, std::ostream& o)
    : lister(l), source(s), aggregator(a), renderer(r), out(o) {}

void StatsService::generate(const std::string& email) {
    auto reposRes = lister.repositories();
    if (!reposRes) {
        Logger::instance().warn("Cannot read repository list: " + reposRes.error().message);
    }
    if (!reposRes || reposRes.value().empty()) {
        out << NO_REPOSITORIES_MESSAGE << "\n";
        return;
    }

    const auto& repos = reposRes.value();
    ContributionMap commits = aggregator.aggregate(email, repos, source);
    Logger::instance().info("Processed " + std::to_string(repos.size()) + " repositories");

    if (commits.empty()) {
        out << NO_REPOSITORIES_MESSAGE << "\n";
        return;
    }
    renderer.render(commits);
}

}
