#include "git/PackFile.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <iterator>
#include <stdexcept>

#include "core/Constants.hpp"
#include "git/Zlib.hpp"

namespace fs = std::filesystem;

namespace gitv {

namespace {

constexpr uint8_t IDX_MAGIC[4] = {0xff, 't', 'O', 'c'};
constexpr size_t IDX_HEADER = 8;
constexpr size_t FANOUT_ENTRIES = 256;

uint32_t be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

uint64_t be64(const uint8_t* p) {
    return (static_cast<uint64_t>(be32(p)) << 32) | be32(p + 4);
}

uint8_t nextByte(std::istream& in) {
    char c;
    if (!in.get(c)) throw std::runtime_error("pack entry header truncated");
    return static_cast<uint8_t>(c);
}

/// Little-endian base-128 size used inside delta data
uint64_t deltaVarint(const std::string& delta, size_t& pos) {
    uint64_t value = 0;
    int shift = 0;
    uint8_t c;
    do {
        if (pos >= delta.size() || shift > 63) throw std::runtime_error("delta header truncated");
        c = static_cast<uint8_t>(delta[pos++]);
        value |= static_cast<uint64_t>(c & 0x7f) << shift;
        shift += 7;
    } while (c & 0x80);
    return value;
}

}

PackFile::PackFile(const fs::path& idxPath) : pack(fs::path(idxPath).replace_extension(".pack")) {
    std::ifstream idxIn(idxPath, std::ios::binary);
    if (!idxIn) {
        throw std::runtime_error("Failed to open pack index: " + idxPath.string());
    }
    idx.assign(std::istreambuf_iterator<char>(idxIn), std::istreambuf_iterator<char>());

    const size_t minSize = IDX_HEADER + FANOUT_ENTRIES * 4;
    if (idx.size() < minSize || std::memcmp(idx.data(), IDX_MAGIC, 4) != 0 || be32(idx.data() + 4) != 2) {
        throw std::runtime_error("Unsupported pack index (need version 2): " + idxPath.string());
    }
    const uint8_t* fanout = idx.data() + IDX_HEADER;
    for (size_t i = 1; i < FANOUT_ENTRIES; ++i) {
        if (be32(fanout + i * 4) < be32(fanout + (i - 1) * 4)) {
            throw std::runtime_error("Pack index fanout is not sorted: " + idxPath.string());
        }
    }
    count = be32(fanout + (FANOUT_ENTRIES - 1) * 4);
    namesStart = minSize;
    size_t crcStart = namesStart + static_cast<size_t>(count) * Constants::SHA1_RAW_LENGTH;
    off32Start = crcStart + static_cast<size_t>(count) * 4;
    off64Start = off32Start + static_cast<size_t>(count) * 4;
    if (idx.size() < off64Start) {
        throw std::runtime_error("Pack index truncated: " + idxPath.string());
    }

    in.open(pack, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open pack: " + pack.string());
    }
    char header[12];
    if (!in.read(header, sizeof(header)) || std::memcmp(header, "PACK", 4) != 0) {
        throw std::runtime_error("Not a pack file: " + pack.string());
    }
    uint32_t version = be32(reinterpret_cast<const uint8_t*>(header) + 4);
    if (version != 2 && version != 3) {
        throw std::runtime_error("Unsupported pack version " + std::to_string(version) + ": " + pack.string());
    }
}

std::optional<uint64_t> PackFile::findOffset(const std::string& hexId) const {
    if (!isHexObjectId(hexId)) return std::nullopt;
    std::vector<uint8_t> raw = fromHex(hexId);

    const uint8_t* fanout = idx.data() + IDX_HEADER;
    uint32_t lo = raw[0] == 0 ? 0 : be32(fanout + (raw[0] - 1) * 4);
    uint32_t hi = std::min(be32(fanout + raw[0] * 4), count);
    if (lo > hi) return std::nullopt;

    while (lo < hi) {
        uint32_t mid = lo + (hi - lo) / 2;
        const uint8_t* name = idx.data() + namesStart + static_cast<size_t>(mid) * Constants::SHA1_RAW_LENGTH;
        int cmp = std::memcmp(raw.data(), name, Constants::SHA1_RAW_LENGTH);
        if (cmp == 0) return offsetAt(mid);
        if (cmp < 0) {
            hi = mid;
        } else {
            lo = mid + 1;
        }
    }
    return std::nullopt;
}

uint64_t PackFile::offsetAt(uint32_t position) const {
    uint32_t off = be32(idx.data() + off32Start + static_cast<size_t>(position) * 4);
    if ((off & 0x80000000u) == 0) return off;

    size_t large = off64Start + static_cast<size_t>(off & 0x7fffffffu) * 8;
    if (large + 8 > idx.size()) {
        throw std::runtime_error("Pack index 64-bit offset out of range: " + pack.string());
    }
    return be64(idx.data() + large);
}

GitObject PackFile::readAt(uint64_t offset, const BaseResolver& resolveExternal) {
    return readAt(offset, resolveExternal, 0);
}

GitObject PackFile::readAt(uint64_t offset, const BaseResolver& resolveExternal, int depth) {
    if (depth > Constants::MAX_DELTA_DEPTH) {
        throw std::runtime_error("Delta chain too deep in " + pack.string());
    }

    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) throw std::runtime_error("Invalid pack offset " + std::to_string(offset));

    uint8_t c = nextByte(in);
    auto type = static_cast<ObjectType>((c >> 4) & 0x07);
    uint64_t size = c & 0x0f;
    int shift = 4;
    while (c & 0x80) {
        if (shift > 63) throw std::runtime_error("Pack entry size overflows at offset " + std::to_string(offset));
        c = nextByte(in);
        size |= static_cast<uint64_t>(c & 0x7f) << shift;
        shift += 7;
    }
    if (size > Constants::MAX_OBJECT_SIZE) {
        throw std::runtime_error("Pack entry too large at offset " + std::to_string(offset));
    }

    uint64_t baseOffset = 0;
    std::string baseId;
    if (type == ObjectType::OfsDelta) {
        c = nextByte(in);
        uint64_t rel = c & 0x7f;
        while (c & 0x80) {
            if (rel > (UINT64_MAX >> 8)) throw std::runtime_error("Delta base offset overflows in " + pack.string());
            c = nextByte(in);
            rel = ((rel + 1) << 7) | (c & 0x7f);
        }
        if (rel == 0 || rel > offset) throw std::runtime_error("Invalid delta base offset in " + pack.string());
        baseOffset = offset - rel;
    } else if (type == ObjectType::RefDelta) {
        uint8_t raw[Constants::SHA1_RAW_LENGTH];
        if (!in.read(reinterpret_cast<char*>(raw), sizeof(raw))) {
            throw std::runtime_error("Delta base id truncated in " + pack.string());
        }
        baseId = toHex(raw, sizeof(raw));
    } else if (type == ObjectType::None || type == static_cast<ObjectType>(5)) {
        throw std::runtime_error("Invalid object type at offset " + std::to_string(offset));
    }

    std::string data = Zlib::decompressFrom(in, static_cast<size_t>(size));
    if (type != ObjectType::OfsDelta && type != ObjectType::RefDelta) {
        return GitObject{type, std::move(data)};
    }

    // Delta data is inflated before the base is read: resolving the base seeks the stream
    GitObject base;
    if (type == ObjectType::OfsDelta) {
        base = readAt(baseOffset, resolveExternal, depth + 1);
    } else if (auto local = findOffset(baseId)) {
        base = readAt(*local, resolveExternal, depth + 1);
    } else if (resolveExternal) {
        base = resolveExternal(baseId);
    } else {
        throw std::runtime_error("Delta base not found: " + baseId);
    }
    return GitObject{base.type, applyDelta(base.data, data)};
}

std::string PackFile::applyDelta(const std::string& base, const std::string& delta) {
    size_t pos = 0;
    uint64_t sourceSize = deltaVarint(delta, pos);
    uint64_t targetSize = deltaVarint(delta, pos);
    if (sourceSize != base.size()) {
        throw std::runtime_error("Delta base size mismatch");
    }
    if (targetSize > Constants::MAX_OBJECT_SIZE) {
        throw std::runtime_error("Delta result too large");
    }

    std::string out;
    out.reserve(static_cast<size_t>(targetSize));
    while (pos < delta.size()) {
        uint8_t op = static_cast<uint8_t>(delta[pos++]);
        if (op & 0x80) {
            // Copy from base: bits 0-3 select offset bytes, bits 4-6 size bytes
            uint64_t copyOffset = 0;
            uint64_t copySize = 0;
            for (int i = 0; i < 4; ++i) {
                if (op & (1u << i)) {
                    if (pos >= delta.size()) throw std::runtime_error("Delta copy truncated");
                    copyOffset |= static_cast<uint64_t>(static_cast<uint8_t>(delta[pos++])) << (8 * i);
                }
            }
            for (int i = 0; i < 3; ++i) {
                if (op & (1u << (4 + i))) {
                    if (pos >= delta.size()) throw std::runtime_error("Delta copy truncated");
                    copySize |= static_cast<uint64_t>(static_cast<uint8_t>(delta[pos++])) << (8 * i);
                }
            }
            if (copySize == 0) copySize = 0x10000;
            if (copyOffset + copySize > base.size()) {
                throw std::runtime_error("Delta copy out of range");
            }
            out.append(base, static_cast<size_t>(copyOffset), static_cast<size_t>(copySize));
        } else if (op != 0) {
            // Insert the next `op` literal bytes
            if (pos + op > delta.size()) throw std::runtime_error("Delta insert truncated");
            out.append(delta, pos, op);
            pos += op;
        } else {
            throw std::runtime_error("Reserved delta opcode 0");
        }
    }

    if (out.size() != targetSize) {
        throw std::runtime_error("Delta result size mismatch");
    }
    return out;
}

}
