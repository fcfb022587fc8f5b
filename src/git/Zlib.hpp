#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace gitv {

/**
 * @brief zlib helpers for git's object encoding
 *
 * Loose objects are one zlib stream per file; pack entries are zlib streams
 * embedded at arbitrary offsets with no stored compressed length, so the
 * stream variant reads until the zlib end marker.
 * All functions throw std::runtime_error on corrupt input.
 */
namespace Zlib {

/// Inflate a complete zlib stream
std::string decompress(const std::vector<uint8_t>& compressed);

/**
 * @brief Inflate one zlib stream starting at the current position of `in`
 * @param expectedSize Inflated size announced by the pack entry header
 */
std::string decompressFrom(std::istream& in, size_t expectedSize);

/// Deflate (used to write loose objects)
std::vector<uint8_t> compress(const std::string& data);

}

}
