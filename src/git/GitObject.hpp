#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gitv {

/// Object types as numbered in pack files
enum class ObjectType : uint8_t {
    None = 0,
    Commit = 1,
    Tree = 2,
    Blob = 3,
    Tag = 4,
    OfsDelta = 6,
    RefDelta = 7
};

/// Decoded object: type plus content without the "<type> <size>\0" header
struct GitObject {
    ObjectType type{ObjectType::None};
    std::string data;
};

const char* objectTypeName(ObjectType type);

/// "commit" -> Commit, unknown names -> None
ObjectType objectTypeFromName(const std::string& name);

/// True for a 40-char lowercase/uppercase hex SHA-1
bool isHexObjectId(const std::string& text);

std::string toHex(const uint8_t* bytes, size_t len);

/// Hex object id to raw bytes; throws std::invalid_argument on bad input
std::vector<uint8_t> fromHex(const std::string& hex);

}
