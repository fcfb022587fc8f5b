#include <gtest/gtest.h>

#include <filesystem>

#include "test_utils.hpp"
#include "git/GitRepository.hpp"

namespace fs = std::filesystem;

using namespace gitv;
using namespace gitv::test::utils;

class GitRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
};

TEST_F(GitRepositoryTest, ResolvesBranchThroughHead) {
    fs::path gitDir = initGitRepo(tempDir / "repo");
    writeRef(gitDir, "refs/heads/main", fakeId(1));

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value()) << repo.error().message;
    auto head = repo.value().resolveHead();
    ASSERT_TRUE(head.has_value()) << head.error().message;
    EXPECT_EQ(head.value(), fakeId(1));
    EXPECT_EQ(repo.value().objectsDir().string(), (repo.value().gitDir() / "objects").string());
}

TEST_F(GitRepositoryTest, DetachedHead) {
    fs::path gitDir = initGitRepo(tempDir / "repo");
    createFile(gitDir, "HEAD", fakeId(9) + "\n");

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value());
    auto head = repo.value().resolveHead();
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(head.value(), fakeId(9));
}

TEST_F(GitRepositoryTest, PackedRefsAreConsulted) {
    fs::path gitDir = initGitRepo(tempDir / "repo");
    createFile(gitDir, "packed-refs",
               "# pack-refs with: peeled fully-peeled sorted\n" +
               fakeId(2) + " refs/heads/feature\n" +
               fakeId(3) + " refs/heads/main\n"
               "^" + fakeId(4) + "\n");

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value());
    auto head = repo.value().resolveHead();
    ASSERT_TRUE(head.has_value()) << head.error().message;
    EXPECT_EQ(head.value(), fakeId(3));
}

TEST_F(GitRepositoryTest, LooseRefWinsOverPackedRef) {
    fs::path gitDir = initGitRepo(tempDir / "repo");
    createFile(gitDir, "packed-refs", fakeId(2) + " refs/heads/main\n");
    writeRef(gitDir, "refs/heads/main", fakeId(5));

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value());
    EXPECT_EQ(repo.value().resolveHead().value(), fakeId(5));
}

TEST_F(GitRepositoryTest, UnbornBranchIsRefNotFound) {
    initGitRepo(tempDir / "repo");

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value());
    auto head = repo.value().resolveHead();
    ASSERT_FALSE(head.has_value());
    EXPECT_EQ(head.error().code, ErrorCode::RefNotFound);
}

TEST_F(GitRepositoryTest, SymbolicRefLoopIsRefNotFound) {
    fs::path gitDir = initGitRepo(tempDir / "repo");
    createFile(gitDir, "refs/heads/main", "ref: refs/heads/other\n");
    createFile(gitDir, "refs/heads/other", "ref: refs/heads/main\n");

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value());
    auto head = repo.value().resolveHead();
    ASSERT_FALSE(head.has_value());
    EXPECT_EQ(head.error().code, ErrorCode::RefNotFound);
}

TEST_F(GitRepositoryTest, Sha256IdIsUnsupported) {
    fs::path gitDir = initGitRepo(tempDir / "repo");
    writeRef(gitDir, "refs/heads/main", std::string(64, 'a'));

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value());
    auto head = repo.value().resolveHead();
    ASSERT_FALSE(head.has_value());
    EXPECT_EQ(head.error().code, ErrorCode::UnsupportedFormat);
}

TEST_F(GitRepositoryTest, GarbageRefIsCorrupt) {
    fs::path gitDir = initGitRepo(tempDir / "repo");
    writeRef(gitDir, "refs/heads/main", "not-an-id");

    auto repo = GitRepository::open(tempDir / "repo");
    ASSERT_TRUE(repo.has_value());
    EXPECT_EQ(repo.value().resolveHead().error().code, ErrorCode::CorruptObject);
}

TEST_F(GitRepositoryTest, GitFilePointsToWorktreeDirWithCommondir) {
    fs::path mainGit = initGitRepo(tempDir / "main");
    writeRef(mainGit, "refs/heads/topic", fakeId(6));

    fs::path wtGit = mainGit / "worktrees" / "wt";
    createFile(wtGit, "HEAD", "ref: refs/heads/topic\n");
    createFile(wtGit, "commondir", "../..\n");
    createFile(tempDir / "wt", ".git", "gitdir: " + wtGit.string() + "\n");

    auto repo = GitRepository::open(tempDir / "wt");
    ASSERT_TRUE(repo.has_value()) << repo.error().message;
    EXPECT_EQ(repo.value().gitDir().string(), wtGit.string());
    EXPECT_EQ(repo.value().commonDir().lexically_normal().string(), mainGit.lexically_normal().string());

    auto head = repo.value().resolveHead();
    ASSERT_TRUE(head.has_value()) << head.error().message;
    EXPECT_EQ(head.value(), fakeId(6));
}

TEST_F(GitRepositoryTest, RelativeGitFile) {
    fs::path gitDir = initGitRepo(tempDir / "modules" / "sub");
    fs::remove_all(gitDir);
    fs::path real = tempDir / "store" / "sub.git";
    fs::create_directories(real / "objects");
    createFile(real, "HEAD", fakeId(7) + "\n");
    createFile(tempDir / "modules" / "sub", ".git", "gitdir: ../../store/sub.git\n");

    auto repo = GitRepository::open(tempDir / "modules" / "sub");
    ASSERT_TRUE(repo.has_value()) << repo.error().message;
    EXPECT_EQ(repo.value().resolveHead().value(), fakeId(7));
}

TEST_F(GitRepositoryTest, BareRepository) {
    fs::path bare = tempDir / "bare.git";
    fs::create_directories(bare / "objects");
    createFile(bare, "HEAD", "ref: refs/heads/main\n");
    writeRef(bare, "refs/heads/main", fakeId(8));

    auto repo = GitRepository::open(bare);
    ASSERT_TRUE(repo.has_value());
    EXPECT_EQ(repo.value().resolveHead().value(), fakeId(8));
}

TEST_F(GitRepositoryTest, PlainDirectoryIsNotARepository) {
    fs::create_directories(tempDir / "plain");
    auto repo = GitRepository::open(tempDir / "plain");
    ASSERT_FALSE(repo.has_value());
    EXPECT_EQ(repo.error().code, ErrorCode::NotARepository);

    auto missing = GitRepository::open(tempDir / "missing");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotARepository);
}
