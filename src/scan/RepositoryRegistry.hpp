#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/ICommitSource.hpp"
#include "util/Expected.hpp"

namespace gitv {

/**
 * @brief Known repositories, persisted as a line-oriented dotfile
 *
 * On-disk format: one absolute repository path per line, no trailing
 * newline. Empty lines are ignored on load.
 */
class RepositoryRegistry : public IRepositoryLister {
public:
    explicit RepositoryRegistry(std::filesystem::path file);

    const std::filesystem::path& path() const { return filePath; }

    /// Read all entries; a missing file is an empty registry
    Expected<std::vector<std::string>> load() const;

    /// Overwrite the file with `repos`
    Expected<void> save(const std::vector<std::string>& repos) const;

    /**
     * @brief Add repositories, keeping each path once
     * @return Merged list: new entries first, then previously stored ones
     */
    Expected<std::vector<std::string>> merge(const std::vector<std::string>& newRepos) const;

    Expected<std::vector<std::filesystem::path>> repositories() const override;

    /// Union preserving first occurrence: `first` then unseen items of `second`
    static std::vector<std::string> joinUnique(const std::vector<std::string>& first,
                                               const std::vector<std::string>& second);

private:
    std::filesystem::path filePath;
};

}
