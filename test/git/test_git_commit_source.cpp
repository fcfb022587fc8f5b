#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>

#include "test_utils.hpp"
#include "git/GitCommitSource.hpp"

namespace fs = std::filesystem;

using namespace gitv;
using namespace gitv::test::utils;

class GitCommitSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    static std::vector<std::time_t> timestamps(const std::vector<CommitEvent>& events) {
        std::vector<std::time_t> out;
        for (const auto& e : events) out.push_back(e.timestamp);
        std::sort(out.begin(), out.end());
        return out;
    }

    fs::path tempDir;
    GitCommitSource source;
};

TEST_F(GitCommitSourceTest, ListsLinearHistory) {
    GitRepoBuilder repo(tempDir / "r");
    repo.commit("a@x", 1000);
    repo.commit("b@x", 2000);
    repo.commit("a@x", 3000);

    auto res = source.commits(tempDir / "r");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    ASSERT_EQ(res.value().size(), 3u);
    EXPECT_EQ(res.value()[0].authorEmail, "a@x");
    EXPECT_EQ(res.value()[0].timestamp, 3000);
    EXPECT_EQ(res.value()[1].authorEmail, "b@x");
    EXPECT_EQ(timestamps(res.value()), (std::vector<std::time_t>{1000, 2000, 3000}));
}

TEST_F(GitCommitSourceTest, FollowsAllMergeParentsOnce) {
    fs::path gitDir = initGitRepo(tempDir / "r");
    fs::path objects = gitDir / "objects";
    // 4 merges 2 and 3, both children of 1
    writeLooseObject(objects, fakeId(1), "commit", commitContent("me@x", 100));
    writeLooseObject(objects, fakeId(2), "commit", commitContent("me@x", 200, {fakeId(1)}));
    writeLooseObject(objects, fakeId(3), "commit", commitContent("me@x", 300, {fakeId(1)}));
    writeLooseObject(objects, fakeId(4), "commit", commitContent("me@x", 400, {fakeId(2), fakeId(3)}));
    writeRef(gitDir, "refs/heads/main", fakeId(4));

    auto res = source.commits(tempDir / "r");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(timestamps(res.value()), (std::vector<std::time_t>{100, 200, 300, 400}));
}

TEST_F(GitCommitSourceTest, ReadsPackedHistory) {
    fs::path gitDir = initGitRepo(tempDir / "r");
    const std::string c1 = commitContent("me@x", 100);
    const std::string c2 = commitContent("me@x", 200, {fakeId(1)});
    writePack(gitDir / "objects", "hist", {{fakeId(1), 1, c1}, {fakeId(2), 6, makeDelta(c1, c2), 0, ""}});
    createFile(gitDir, "packed-refs", fakeId(2) + " refs/heads/main\n");

    auto res = source.commits(tempDir / "r");
    ASSERT_TRUE(res.has_value()) << res.error().message;
    EXPECT_EQ(timestamps(res.value()), (std::vector<std::time_t>{100, 200}));
}

TEST_F(GitCommitSourceTest, MissingParentEndsWalk) {
    fs::path gitDir = initGitRepo(tempDir / "r");
    // shallow clone: parent object absent
    writeLooseObject(gitDir / "objects", fakeId(2), "commit", commitContent("me@x", 200, {fakeId(1)}));
    writeRef(gitDir, "refs/heads/main", fakeId(2));

    auto res = source.commits(tempDir / "r");
    ASSERT_TRUE(res.has_value());
    ASSERT_EQ(res.value().size(), 1u);
    EXPECT_EQ(res.value()[0].timestamp, 200);
}

TEST_F(GitCommitSourceTest, SkipsCommitsWithUnusableAuthor) {
    fs::path gitDir = initGitRepo(tempDir / "r");
    fs::path objects = gitDir / "objects";
    writeLooseObject(objects, fakeId(1), "commit", commitContent("me@x", 100));
    writeLooseObject(objects, fakeId(2), "commit",
                     "tree " + fakeId(0xfffff) + "\nparent " + fakeId(1) +
                     "\nauthor Someone <me@x> yesterday +0000\n\nbad date\n");
    writeLooseObject(objects, fakeId(3), "commit",
                     "tree " + fakeId(0xfffff) + "\nparent " + fakeId(2) + "\nauthor no email\n\nno author\n");
    writeLooseObject(objects, fakeId(4), "commit", commitContent("me@x", 400, {fakeId(3)}));
    writeRef(gitDir, "refs/heads/main", fakeId(4));

    auto res = source.commits(tempDir / "r");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(timestamps(res.value()), (std::vector<std::time_t>{100, 400}));
}

TEST_F(GitCommitSourceTest, UnbornBranchIsAnError) {
    initGitRepo(tempDir / "r");
    auto res = source.commits(tempDir / "r");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::RefNotFound);
}

TEST_F(GitCommitSourceTest, UnreadableHeadCommitIsCorrupt) {
    fs::path gitDir = initGitRepo(tempDir / "r");
    writeRef(gitDir, "refs/heads/main", fakeId(7));

    auto res = source.commits(tempDir / "r");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::CorruptObject);
}

TEST_F(GitCommitSourceTest, NonRepositoryIsAnError) {
    fs::create_directories(tempDir / "plain");
    auto res = source.commits(tempDir / "plain");
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::NotARepository);
}
