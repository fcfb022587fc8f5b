#include <gtest/gtest.h>
#include <filesystem>
#include <sstream>
#include "test_utils.hpp"
#include "cli/commands/AddCommand.hpp"

namespace fs = std::filesystem;

using namespace gitv;
using namespace gitv::test::utils;

class AddCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = fs::absolute(createTempDir()).lexically_normal();
        ctx.config.registryPath = tempDir / "registry";
        ctx.config.ignorePatterns = {"node_modules", "vendor"};
        ctx.out = &out;
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    fs::path tempDir;
    std::ostringstream out;
    AppContext ctx;
};

// Test: Scan registers every repository found
TEST_F(AddCommandTest, AddFolderWithRepositories) {
    fs::create_directories(tempDir / "work" / "alpha" / ".git");
    fs::create_directories(tempDir / "work" / "group" / "beta" / ".git");

    AddCommand cmd;
    auto result = cmd.execute(ctx, {(tempDir / "work").string()});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const std::string alpha = (tempDir / "work" / "alpha").string();
    const std::string beta = (tempDir / "work" / "group" / "beta").string();
    EXPECT_EQ(out.str(), "Found folders:\n\n" + alpha + "\n" + beta + "\n\n\nSuccessfully added\n\n");
    EXPECT_EQ(readFile(ctx.config.registryPath), alpha + "\n" + beta);
}

// Test: Second add puts new repositories before existing ones
TEST_F(AddCommandTest, AddMergesWithExistingRegistry) {
    fs::create_directories(tempDir / "one" / "r1" / ".git");
    fs::create_directories(tempDir / "two" / "r2" / ".git");

    AddCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {(tempDir / "one").string()}).has_value());
    ASSERT_TRUE(cmd.execute(ctx, {(tempDir / "two").string()}).has_value());
    ASSERT_TRUE(cmd.execute(ctx, {(tempDir / "one").string()}).has_value());

    const std::string r1 = (tempDir / "one" / "r1").string();
    const std::string r2 = (tempDir / "two" / "r2").string();
    EXPECT_EQ(readFile(ctx.config.registryPath), r1 + "\n" + r2);
}

// Test: Ignored directories are not scanned
TEST_F(AddCommandTest, AddSkipsIgnoredDirectories) {
    fs::create_directories(tempDir / "w" / "node_modules" / "dep" / ".git");
    fs::create_directories(tempDir / "w" / "app" / ".git");

    AddCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {(tempDir / "w").string()}).has_value());
    EXPECT_EQ(readFile(ctx.config.registryPath), (tempDir / "w" / "app").string());
}

// Test: Folder without repositories still succeeds
TEST_F(AddCommandTest, AddEmptyFolder) {
    fs::create_directories(tempDir / "nothing");

    AddCommand cmd;
    ASSERT_TRUE(cmd.execute(ctx, {(tempDir / "nothing").string()}).has_value());
    EXPECT_EQ(out.str(), "Found folders:\n\n\n\nSuccessfully added\n\n");
    EXPECT_EQ(readFile(ctx.config.registryPath), "");
}

// Test: Missing folder argument
TEST_F(AddCommandTest, AddRequiresFolder) {
    AddCommand cmd;
    auto result = cmd.execute(ctx, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
    EXPECT_FALSE(fs::exists(ctx.config.registryPath));
}

// Test: Extra arguments are rejected
TEST_F(AddCommandTest, AddRejectsExtraArguments) {
    AddCommand cmd;
    auto result = cmd.execute(ctx, {"a", "b"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
}

// Test: Nonexistent folder
TEST_F(AddCommandTest, AddNonexistentFolder) {
    AddCommand cmd;
    auto result = cmd.execute(ctx, {(tempDir / "missing").string()});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(out.str(), "");
}
