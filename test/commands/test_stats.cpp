#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <sstream>
#include "test_utils.hpp"
#include "cli/commands/StatsCommand.hpp"
#include "core/StatsService.hpp"
#include "scan/RepositoryRegistry.hpp"

namespace fs = std::filesystem;

using namespace gitv;
using namespace gitv::test::utils;

class StatsCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        ctx.config.registryPath = tempDir / "registry";
        ctx.out = &out;
        now = std::time(nullptr);
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    std::ostringstream out;
    AppContext ctx;
    std::time_t now{0};
};

// Test: No registry yet
TEST_F(StatsCommandTest, StatsWithoutRepositories) {
    StatsCommand cmd;
    auto result = cmd.execute(ctx, {"me@example.com"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(out.str(), std::string(StatsService::NO_REPOSITORIES_MESSAGE) + "\n");
}

// Test: Counts the author's commits across repositories
TEST_F(StatsCommandTest, StatsCountsAuthorCommits) {
    GitRepoBuilder one(tempDir / "one");
    one.commit("me@example.com", daysBefore(now, 300));
    one.commit("me@example.com", daysBefore(now, 10));
    one.commit("other@example.com", daysBefore(now, 5));
    one.commit("me@example.com", daysBefore(now, 2));

    GitRepoBuilder two(tempDir / "two");
    two.commit("me@example.com", daysBefore(now, 40));

    RepositoryRegistry registry(ctx.config.registryPath);
    ASSERT_TRUE(registry.save({(tempDir / "one").string(), (tempDir / "missing").string(),
                               (tempDir / "two").string()}).has_value());

    StatsCommand cmd;
    auto result = cmd.execute(ctx, {"me@example.com"});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const std::string text = out.str();
    EXPECT_NE(text.find("Your Git Contribution Graph:"), std::string::npos);
    EXPECT_NE(text.find("Total commits in the last 6 months: 3\n"), std::string::npos);
}

// Test: Email is required
TEST_F(StatsCommandTest, StatsRequiresEmail) {
    StatsCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);

    auto empty = cmd.execute(ctx, {""});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(out.str(), "");
}

// Test: Only one email
TEST_F(StatsCommandTest, StatsRejectsExtraArguments) {
    StatsCommand cmd;
    auto result = cmd.execute(ctx, {"a@x", "b@x"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
}
