#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "git/GitObject.hpp"

namespace gitv {

/**
 * @brief Read access to one pack (objects/pack/pack-*.pack + .idx)
 *
 * Index (version 2):
 *   "\377tOc" | version=2 | fanout[256] | names[N*20] | crc32[N] | off32[N] | off64[...]
 *   off32 entries with the high bit set index into the off64 table.
 *
 * Pack (version 2 or 3):
 *   "PACK" | version | count | entries... | trailer
 *   entry: type(3 bits) + size varint, then
 *     OFS_DELTA: negative base offset varint
 *     REF_DELTA: 20-byte base object id
 *   followed by a zlib stream of the object (or delta) data.
 *
 * All multi-byte integers are big-endian.
 */
class PackFile {
public:
    /// Resolves a REF_DELTA base that lives outside this pack
    using BaseResolver = std::function<GitObject(const std::string& hexId)>;

    /**
     * @param idxPath Path to the .idx file; the .pack beside it is opened
     * @throws std::runtime_error if either file is missing or malformed
     */
    explicit PackFile(const std::filesystem::path& idxPath);

    const std::filesystem::path& packPath() const { return pack; }
    uint32_t objectCount() const { return count; }

    /// Offset of an object in the pack, if the index lists it
    std::optional<uint64_t> findOffset(const std::string& hexId) const;

    /**
     * @brief Read and fully resolve the object at `offset`
     * @throws std::runtime_error on corrupt data or an unresolvable delta base
     */
    GitObject readAt(uint64_t offset, const BaseResolver& resolveExternal);

    /// Apply git's copy/insert delta to `base`; throws on malformed deltas
    static std::string applyDelta(const std::string& base, const std::string& delta);

private:
    GitObject readAt(uint64_t offset, const BaseResolver& resolveExternal, int depth);
    uint64_t offsetAt(uint32_t position) const;

    std::filesystem::path pack;
    std::vector<uint8_t> idx;  // whole index file
    uint32_t count{0};
    size_t namesStart{0};
    size_t off32Start{0};
    size_t off64Start{0};
    std::ifstream in;
};

}
