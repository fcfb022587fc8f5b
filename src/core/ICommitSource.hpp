#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/CommitEvent.hpp"
#include "util/Expected.hpp"

namespace gitv {

/**
 * @brief Yields the commit history of one repository
 *
 * Implementations report retrieval failures as an Error (or throw a
 * std::exception); callers recover per repository.
 */
class ICommitSource {
public:
    virtual ~ICommitSource() = default;
    virtual Expected<std::vector<CommitEvent>> commits(const std::filesystem::path& repo) = 0;
};

/// Ordered list of repository paths to aggregate
class IRepositoryLister {
public:
    virtual ~IRepositoryLister() = default;
    virtual Expected<std::vector<std::filesystem::path>> repositories() const = 0;
};

}
