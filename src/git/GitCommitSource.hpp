#pragma once

#include "core/ICommitSource.hpp"

namespace gitv {

/**
 * @brief Commit history read directly from a repository's object store
 *
 * Lists every commit reachable from HEAD (all parents, each commit once),
 * as `git log` would. Commits that cannot be read (shallow boundaries,
 * corrupt objects) or whose author line is malformed are skipped.
 */
class GitCommitSource : public ICommitSource {
public:
    Expected<std::vector<CommitEvent>> commits(const std::filesystem::path& repo) override;
};

}
