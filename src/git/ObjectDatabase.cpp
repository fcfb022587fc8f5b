#include "git/ObjectDatabase.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "core/Constants.hpp"
#include "git/PackFile.hpp"
#include "git/Zlib.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gitv {

ObjectDatabase::ObjectDatabase(const fs::path& objectsDir) : objects(objectsDir) {
    std::error_code ec;
    fs::path packDir = objects / "pack";
    if (!fs::is_directory(packDir, ec)) return;

    std::vector<fs::path> indexes;
    for (fs::directory_iterator it(packDir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (it->path().extension() == ".idx") indexes.push_back(it->path());
    }
    std::sort(indexes.begin(), indexes.end());

    for (const auto& idxPath : indexes) {
        try {
            packs.push_back(std::make_unique<PackFile>(idxPath));
        } catch (const std::exception& e) {
            Logger::instance().warn(std::string("Ignoring pack: ") + e.what());
        }
    }
}

ObjectDatabase::~ObjectDatabase() = default;

ObjectDatabase::ObjectDatabase(ObjectDatabase&&) noexcept = default;
ObjectDatabase& ObjectDatabase::operator=(ObjectDatabase&&) noexcept = default;

fs::path ObjectDatabase::looseObjectPath(const std::string& hexId) const {
    if (hexId.length() < Constants::OBJECT_DIR_LENGTH + 1) {
        throw std::runtime_error("Invalid object id: " + hexId);
    }
    return objects / hexId.substr(0, Constants::OBJECT_DIR_LENGTH) / hexId.substr(Constants::OBJECT_DIR_LENGTH);
}

GitObject ObjectDatabase::readLoose(const std::string& hexId, const fs::path& file) const {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open object file for reading: " + hexId);
    }
    std::vector<uint8_t> compressed((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (compressed.empty()) {
        throw std::runtime_error("Object file is empty: " + hexId);
    }

    std::string full = Zlib::decompress(compressed);

    // "<type> <size>\0<content>"
    size_t headerEnd = full.find('\0');
    size_t space = full.find(' ');
    if (headerEnd == std::string::npos || space == std::string::npos || space > headerEnd) {
        throw std::runtime_error("Invalid object header: " + hexId);
    }
    ObjectType type = objectTypeFromName(full.substr(0, space));
    if (type == ObjectType::None) {
        throw std::runtime_error("Unknown object type in " + hexId);
    }
    const std::string sizeText = full.substr(space + 1, headerEnd - space - 1);
    if (sizeText.empty() || sizeText.find_first_not_of("0123456789") != std::string::npos ||
        std::stoull(sizeText) != full.size() - headerEnd - 1) {
        throw std::runtime_error("Object size mismatch: " + hexId);
    }
    return GitObject{type, full.substr(headerEnd + 1)};
}

GitObject ObjectDatabase::read(const std::string& hexId) {
    if (!isHexObjectId(hexId)) {
        throw std::runtime_error("Invalid object id: " + hexId);
    }

    std::error_code ec;
    fs::path loose = looseObjectPath(hexId);
    if (fs::is_regular_file(loose, ec)) {
        return readLoose(hexId, loose);
    }

    for (auto& pack : packs) {
        if (auto offset = pack->findOffset(hexId)) {
            return pack->readAt(*offset, [this](const std::string& base) { return read(base); });
        }
    }
    throw std::runtime_error("Object not found: " + hexId);
}

CommitObject ObjectDatabase::readCommit(const std::string& hexId) {
    GitObject obj = read(hexId);
    if (obj.type != ObjectType::Commit) {
        throw std::runtime_error(hexId + " is a " + objectTypeName(obj.type) + ", not a commit");
    }
    return parseCommit(hexId, obj.data);
}

}
