#pragma once

#include <filesystem>
#include <string>

#include "util/Expected.hpp"

namespace gitv {

/**
 * @brief Locates a repository's git directory and resolves HEAD
 *
 * Accepted layouts for `open(path)`:
 *   path/.git/               ordinary work tree
 *   path/.git  (file)        "gitdir: <dir>" (linked worktree, submodule)
 *   path/                    bare repository (HEAD + objects/ directly inside)
 *
 * A linked worktree's git dir may carry a "commondir" file; refs and
 * objects are then shared from that directory while HEAD stays per worktree.
 */
class GitRepository {
public:
    /// Empty handle; use open()
    GitRepository() = default;

    static Expected<GitRepository> open(const std::filesystem::path& path);

    const std::filesystem::path& gitDir() const { return gitDirPath; }
    const std::filesystem::path& commonDir() const { return commonDirPath; }
    std::filesystem::path objectsDir() const { return commonDirPath / "objects"; }

    /**
     * @brief Resolve HEAD to a commit id
     *
     * Follows symbolic refs through loose ref files and packed-refs.
     * An unborn branch (no commits yet) is RefNotFound.
     */
    Expected<std::string> resolveHead() const;

    /// Resolve a full ref name such as "refs/heads/main"
    Expected<std::string> resolveRef(const std::string& refName) const;

private:
    Expected<std::string> lookupPackedRef(const std::string& refName) const;

    std::filesystem::path gitDirPath;
    std::filesystem::path commonDirPath;
};

}
