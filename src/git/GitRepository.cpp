#include "git/GitRepository.hpp"

#include <fstream>

#include "core/Constants.hpp"
#include "git/GitObject.hpp"

namespace fs = std::filesystem;

namespace gitv {

namespace {

Expected<std::string> readFirstLine(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to read " + file.string()};
    }
    std::string line;
    std::getline(in, line);
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read " + file.string()};
    }
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    return line;
}

/// HEAD or ref content: either "ref: <name>" or an object id
Expected<std::string> checkObjectId(const std::string& value, const std::string& where) {
    if (isHexObjectId(value)) return value;
    if (value.size() == 64) {
        return Error{ErrorCode::UnsupportedFormat, "SHA-256 repositories are not supported: " + where};
    }
    return Error{ErrorCode::CorruptObject, "Invalid object id in " + where + ": '" + value + "'"};
}

}

Expected<GitRepository> GitRepository::open(const fs::path& path) {
    std::error_code ec;
    fs::path root = fs::absolute(path, ec);
    if (ec || !fs::is_directory(root, ec)) {
        return Error{ErrorCode::NotARepository, "Not a directory: " + path.string()};
    }

    GitRepository repo;
    fs::path marker = root / Constants::REPOSITORY_MARKER;
    if (fs::is_directory(marker, ec)) {
        repo.gitDirPath = marker;
    } else if (fs::is_regular_file(marker, ec)) {
        auto line = readFirstLine(marker);
        if (!line) return line.error();
        const std::string prefix = "gitdir: ";
        if (line.value().rfind(prefix, 0) != 0) {
            return Error{ErrorCode::NotARepository, "Malformed .git file in " + root.string()};
        }
        fs::path target = line.value().substr(prefix.size());
        repo.gitDirPath = target.is_absolute() ? target : (root / target).lexically_normal();
    } else if (fs::is_regular_file(root / "HEAD", ec) && fs::is_directory(root / "objects", ec)) {
        repo.gitDirPath = root;
    } else {
        return Error{ErrorCode::NotARepository, "Not a git repository: " + root.string()};
    }

    if (!fs::is_regular_file(repo.gitDirPath / "HEAD", ec)) {
        return Error{ErrorCode::NotARepository, "Missing HEAD in " + repo.gitDirPath.string()};
    }

    repo.commonDirPath = repo.gitDirPath;
    fs::path commondirFile = repo.gitDirPath / "commondir";
    if (fs::is_regular_file(commondirFile, ec)) {
        auto line = readFirstLine(commondirFile);
        if (!line) return line.error();
        fs::path common = line.value();
        repo.commonDirPath = common.is_absolute() ? common : (repo.gitDirPath / common).lexically_normal();
    }
    return repo;
}

Expected<std::string> GitRepository::resolveHead() const {
    auto head = readFirstLine(gitDirPath / "HEAD");
    if (!head) return head.error();

    const std::string& content = head.value();
    if (content.rfind("ref: ", 0) == 0) {
        return resolveRef(content.substr(5));
    }
    // Detached HEAD
    return checkObjectId(content, "HEAD");
}

Expected<std::string> GitRepository::resolveRef(const std::string& refName) const {
    std::string name = refName;
    std::error_code ec;
    for (int depth = 0; depth < Constants::MAX_SYMREF_DEPTH; ++depth) {
        // Per-worktree refs live in the git dir, shared ones in the common dir
        fs::path file = gitDirPath / name;
        if (!fs::is_regular_file(file, ec)) file = commonDirPath / name;

        if (fs::is_regular_file(file, ec)) {
            auto line = readFirstLine(file);
            if (!line) return line.error();
            if (line.value().rfind("ref: ", 0) == 0) {
                name = line.value().substr(5);
                continue;
            }
            if (line.value().empty()) break;
            return checkObjectId(line.value(), name);
        }
        return lookupPackedRef(name);
    }
    return Error{ErrorCode::RefNotFound, "Cannot resolve " + refName + " (branch has no commits yet)"};
}

Expected<std::string> GitRepository::lookupPackedRef(const std::string& refName) const {
    fs::path packed = commonDirPath / "packed-refs";
    std::ifstream in(packed, std::ios::binary);
    if (in) {
        // "<id> <refname>" lines; '#' header and '^' peeled lines are skipped
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#' || line[0] == '^') continue;
            size_t space = line.find(' ');
            if (space == std::string::npos) continue;
            if (line.compare(space + 1, std::string::npos, refName) == 0) {
                return checkObjectId(line.substr(0, space), "packed-refs");
            }
        }
    }
    return Error{ErrorCode::RefNotFound, "Cannot resolve " + refName + " (branch has no commits yet)"};
}

}
