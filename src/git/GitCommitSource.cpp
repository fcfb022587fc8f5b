#include "git/GitCommitSource.hpp"

#include <deque>
#include <exception>
#include <unordered_set>

#include "git/GitRepository.hpp"
#include "git/ObjectDatabase.hpp"
#include "util/Logger.hpp"

namespace gitv {

Expected<std::vector<CommitEvent>> GitCommitSource::commits(const std::filesystem::path& repoPath) {
    auto repoRes = GitRepository::open(repoPath);
    if (!repoRes) return repoRes.error();
    const GitRepository& repo = repoRes.value();

    auto headRes = repo.resolveHead();
    if (!headRes) return headRes.error();

    ObjectDatabase db(repo.objectsDir());
    std::vector<CommitEvent> events;
    std::unordered_set<std::string> seen{headRes.value()};
    std::deque<std::string> pending{headRes.value()};
    size_t skipped = 0;

    while (!pending.empty()) {
        std::string hash = std::move(pending.front());
        pending.pop_front();

        CommitObject commit;
        try {
            commit = db.readCommit(hash);
        } catch (const std::exception& e) {
            if (hash == headRes.value()) {
                return Error{ErrorCode::CorruptObject, std::string("Cannot read HEAD commit: ") + e.what()};
            }
            Logger::instance().debug(repoPath.string() + ": skipping commit " + hash + ": " + e.what());
            ++skipped;
            continue;
        }

        for (const auto& parent : commit.parentHashes) {
            if (seen.insert(parent).second) pending.push_back(parent);
        }

        if (!commit.hasAuthor) {
            Logger::instance().debug(repoPath.string() + ": commit " + commit.shortHash() + " has no author");
            ++skipped;
            continue;
        }
        auto event = normalizeCommitRecord(RawCommitRecord{commit.authorEmail, commit.authorDate});
        if (!event) {
            Logger::instance().debug(repoPath.string() + ": commit " + commit.shortHash() + ": " +
                                     event.error().message);
            ++skipped;
            continue;
        }
        events.push_back(std::move(event.value()));
    }

    if (skipped > 0) {
        Logger::instance().debug(repoPath.string() + ": " + std::to_string(skipped) + " commits skipped");
    }
    return events;
}

}
