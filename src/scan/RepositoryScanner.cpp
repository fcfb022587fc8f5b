#include "scan/RepositoryScanner.hpp"

#include <algorithm>
#include <functional>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitv {

RepositoryScanner::RepositoryScanner(PatternMatcher::IgnoreSet ignoreSet) : ignore(std::move(ignoreSet)) {}

bool RepositoryScanner::isRepository(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(dir / Constants::REPOSITORY_MARKER, ec));
}

Expected<std::vector<fs::path>> RepositoryScanner::scan(const fs::path& root) const {
    std::error_code ec;
    fs::path start = fs::absolute(root, ec);
    if (ec || !fs::is_directory(start, ec)) {
        return Error{ErrorCode::InvalidArgs, "Not a directory: " + root.string()};
    }
    start = start.lexically_normal();
    if (start.has_parent_path() && start.filename().empty()) {
        start = start.parent_path();  // drop trailing separator
    }

    std::vector<fs::path> found;
    std::vector<fs::path> pending{start};

    while (!pending.empty()) {
        fs::path dir = std::move(pending.back());
        pending.pop_back();

        if (isRepository(dir)) {
            found.push_back(dir);
            continue;
        }

        std::vector<fs::path> children;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            Logger::instance().debug("Cannot read " + dir.string() + ": " + ec.message());
            ec.clear();
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const fs::path& child = it->path();
            std::error_code sec;
            if (!it->is_directory(sec) || it->is_symlink(sec)) continue;
            if (ignore.matches(child.filename().string())) continue;
            children.push_back(child);
        }
        if (ec) {
            Logger::instance().debug("Stopped listing " + dir.string() + ": " + ec.message());
            ec.clear();
        }

        // Reverse order on the stack so the smallest name is visited first
        std::sort(children.begin(), children.end(), std::greater<fs::path>());
        for (auto& c : children) pending.push_back(std::move(c));
    }
    return found;
}

}
