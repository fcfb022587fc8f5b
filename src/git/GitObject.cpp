#include "git/GitObject.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "core/Constants.hpp"

namespace gitv {

const char* objectTypeName(ObjectType type) {
    switch (type) {
        case ObjectType::Commit: return "commit";
        case ObjectType::Tree: return "tree";
        case ObjectType::Blob: return "blob";
        case ObjectType::Tag: return "tag";
        case ObjectType::OfsDelta: return "ofs-delta";
        case ObjectType::RefDelta: return "ref-delta";
        case ObjectType::None: break;
    }
    return "none";
}

ObjectType objectTypeFromName(const std::string& name) {
    if (name == "commit") return ObjectType::Commit;
    if (name == "tree") return ObjectType::Tree;
    if (name == "blob") return ObjectType::Blob;
    if (name == "tag") return ObjectType::Tag;
    return ObjectType::None;
}

bool isHexObjectId(const std::string& text) {
    return text.length() == Constants::SHA1_HEX_LENGTH &&
           std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string toHex(const uint8_t* bytes, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0f];
    }
    return out;
}

std::vector<uint8_t> fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("Odd-length hex string: " + hex);
    }
    auto nibble = [&hex](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("Invalid hex string: " + hex);
    };
    std::vector<uint8_t> out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return out;
}

}
