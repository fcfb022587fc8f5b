#include "cli/commands/StatsCommand.hpp"

#include "core/CalendarGridBuilder.hpp"
#include "core/ContributionAggregator.hpp"
#include "core/StatsService.hpp"
#include "core/TimeBucketer.hpp"
#include "git/GitCommitSource.hpp"
#include "render/GraphRenderer.hpp"
#include "scan/RepositoryRegistry.hpp"
#include "util/Logger.hpp"

namespace gitv {

Expected<void> StatsCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty() || args.front().empty()) {
        return Error{ErrorCode::InvalidArgs, "Email address is required"};
    }
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "stats takes exactly one <email>"};
    }
    const std::string& email = args.front();
    std::ostream& out = ctx.output();

    Logger::instance().info("Analyzing contributions for: " + email);

    TimeBucketer time;
    RepositoryRegistry registry(ctx.config.registryPath);
    GitCommitSource source;
    ContributionAggregator aggregator(time);
    aggregator.setProgressListener([](size_t index, size_t total, const std::filesystem::path& repo) {
        Logger::instance().info("Processing repository " + std::to_string(index) + "/" +
                                std::to_string(total) + ": " + repo.filename().string());
    });
    CalendarGridBuilder grid;
    GraphRenderer renderer(time, grid, out);

    StatsService service(registry, source, aggregator, renderer, out);
    service.generate(email);
    return {};
}

}
