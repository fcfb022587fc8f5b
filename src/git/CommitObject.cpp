#include "git/CommitObject.hpp"

#include <sstream>
#include <stdexcept>

#include "core/Constants.hpp"
#include "git/GitObject.hpp"

namespace gitv {

namespace {

std::string trimmed(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

/// "Name <email> 1700000000 +0100" -> name, email, "1700000000 +0100"
bool parseIdent(const std::string& ident, std::string& name, std::string& email, std::string& date) {
    size_t emailStart = ident.find('<');
    size_t emailEnd = ident.find('>', emailStart == std::string::npos ? 0 : emailStart);
    if (emailStart == std::string::npos || emailEnd == std::string::npos) {
        return false;
    }
    name = trimmed(ident.substr(0, emailStart));
    email = ident.substr(emailStart + 1, emailEnd - emailStart - 1);
    date = trimmed(ident.substr(emailEnd + 1));
    return true;
}

}

CommitObject parseCommit(const std::string& hash, const std::string& content) {
    CommitObject commit;
    commit.hash = hash;

    std::istringstream iss(content);
    std::string line;
    bool inMessage = false;
    std::ostringstream messageBuilder;

    while (std::getline(iss, line)) {
        if (inMessage) {
            messageBuilder << line << "\n";
            continue;
        }

        if (line.empty()) {
            inMessage = true;
            continue;
        }

        // Continuation lines of multi-line headers (gpgsig) start with a space
        if (line[0] == ' ') continue;

        if (line.rfind("tree ", 0) == 0) {
            std::string hashPart = trimmed(line.substr(5));
            if (!isHexObjectId(hashPart)) {
                throw std::runtime_error("Invalid tree hash in commit: " + hash);
            }
            commit.treeHash = hashPart;
        } else if (line.rfind("parent ", 0) == 0) {
            std::string hashPart = trimmed(line.substr(7));
            if (!isHexObjectId(hashPart)) {
                throw std::runtime_error("Invalid parent hash in commit: " + hash);
            }
            commit.parentHashes.push_back(hashPart);
        } else if (line.rfind("author ", 0) == 0) {
            commit.hasAuthor = parseIdent(line.substr(7), commit.authorName, commit.authorEmail, commit.authorDate);
        } else if (line.rfind("committer ", 0) == 0) {
            parseIdent(line.substr(10), commit.committerName, commit.committerEmail, commit.committerDate);
        }
    }

    if (commit.treeHash.empty()) {
        throw std::runtime_error("Commit without tree: " + hash);
    }
    commit.message = messageBuilder.str();
    return commit;
}

}
