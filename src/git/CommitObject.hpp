#pragma once

#include <string>
#include <vector>

namespace gitv {

/**
 * @brief Parsed git commit object
 *
 * Commit format (content after the "commit <size>\0" header):
 *   tree <hash>
 *   parent <hash>              (zero or more)
 *   author Name <email> <timestamp> <timezone>
 *   committer Name <email> <timestamp> <timezone>
 *   (other headers: gpgsig, encoding, mergetag ...)
 *
 *   <commit message>
 *
 * Dates are kept as the raw "<timestamp> <timezone>" text; turning them
 * into instants is the job of normalizeCommitRecord().
 */
struct CommitObject {
    std::string hash;
    std::string treeHash;
    std::vector<std::string> parentHashes;  // 0 for root, 2+ for merges
    bool hasAuthor{false};                  // an author line with <email> was found
    std::string authorName;
    std::string authorEmail;
    std::string authorDate;
    std::string committerName;
    std::string committerEmail;
    std::string committerDate;
    std::string message;

    std::string shortHash() const {
        return hash.length() >= 7 ? hash.substr(0, 7) : hash;
    }
};

/**
 * @brief Parse commit content
 * @throws std::runtime_error for a missing tree or malformed parent line
 */
CommitObject parseCommit(const std::string& hash, const std::string& content);

}
