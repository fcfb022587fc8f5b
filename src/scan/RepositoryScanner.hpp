#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"
#include "util/PatternMatcher.hpp"

namespace gitv {

/**
 * @brief Finds git repositories below a folder
 *
 * Depth-first walk over directory entries in name order. A directory that
 * contains a `.git` entry (directory, or file for worktrees and submodules)
 * is reported and not descended into. Ignored names, symlinked directories
 * and unreadable directories are skipped.
 */
class RepositoryScanner {
public:
    explicit RepositoryScanner(PatternMatcher::IgnoreSet ignore);

    /// @return Absolute repository paths in discovery order, or InvalidArgs for a bad root
    Expected<std::vector<std::filesystem::path>> scan(const std::filesystem::path& root) const;

    /// True if `dir` directly contains the repository marker
    static bool isRepository(const std::filesystem::path& dir);

private:
    PatternMatcher::IgnoreSet ignore;
};

}
