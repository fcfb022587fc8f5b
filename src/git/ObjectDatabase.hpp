#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "git/CommitObject.hpp"
#include "git/GitObject.hpp"

namespace gitv {

class PackFile;

/**
 * @brief Read-only view of a repository's object store
 *
 * Layout:
 *   objects/<aa>/<38 hex>        loose object, zlib("<type> <size>\0<content>")
 *   objects/pack/pack-*.idx      pack index, paired with pack-*.pack
 *
 * Loose objects are looked up first, then every pack in name order.
 */
class ObjectDatabase {
public:
    /// @param objectsDir The repository's objects/ directory
    explicit ObjectDatabase(const std::filesystem::path& objectsDir);
    ~ObjectDatabase();

    ObjectDatabase(const ObjectDatabase&) = delete;
    ObjectDatabase& operator=(const ObjectDatabase&) = delete;
    ObjectDatabase(ObjectDatabase&&) noexcept;
    ObjectDatabase& operator=(ObjectDatabase&&) noexcept;

    const std::filesystem::path& objectsDir() const { return objects; }
    size_t packCount() const { return packs.size(); }

    /// @throws std::runtime_error if the object is missing or corrupt
    GitObject read(const std::string& hexId);

    /// Read and parse a commit; throws if the object is not a commit
    CommitObject readCommit(const std::string& hexId);

    /// Path a loose object with this id would have
    std::filesystem::path looseObjectPath(const std::string& hexId) const;

private:
    GitObject readLoose(const std::string& hexId, const std::filesystem::path& file) const;

    std::filesystem::path objects;
    std::vector<std::unique_ptr<PackFile>> packs;
};

}
