#include "cli/commands/AddCommand.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include "scan/RepositoryRegistry.hpp"
#include "scan/RepositoryScanner.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitv {

/**
 * @brief Execute 'gitv add <folder>'
 *
 * Scans the folder, prints every repository found and merges them into the
 * registry (new ones first, duplicates dropped).
 */
Expected<void> AddCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        return Error{ErrorCode::InvalidArgs, "Folder path is required"};
    }
    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "add takes exactly one <folder>"};
    }

    std::ostream& out = ctx.output();
    RepositoryScanner scanner(PatternMatcher::IgnoreSet(ctx.config.ignorePatterns));
    auto found = scanner.scan(args.front());
    if (!found) return found.error();

    out << "Found folders:\n\n";
    std::vector<std::string> repos;
    repos.reserve(found.value().size());
    for (const auto& p : found.value()) {
        out << p.string() << "\n";
        repos.push_back(p.string());
    }

    RepositoryRegistry registry(ctx.config.registryPath);
    auto merged = registry.merge(repos);
    if (!merged) return merged.error();
    Logger::instance().debug("Registry " + registry.path().string() + " holds " +
                             std::to_string(merged.value().size()) + " repositories");

    out << "\n\nSuccessfully added\n\n";
    return {};
}

}
