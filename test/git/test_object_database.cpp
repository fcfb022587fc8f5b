#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "test_utils.hpp"
#include "git/ObjectDatabase.hpp"
#include "git/Zlib.hpp"

namespace fs = std::filesystem;

using namespace gitv;
using namespace gitv::test::utils;

class ObjectDatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        objects = initGitRepo(tempDir / "repo") / "objects";
    }

    void TearDown() override {
        removeDir(tempDir);
    }

    void writeRawLoose(const std::string& id, const std::string& full) {
        std::vector<uint8_t> z = Zlib::compress(full);
        fs::create_directories(objects / id.substr(0, 2));
        std::ofstream out(objects / id.substr(0, 2) / id.substr(2), std::ios::binary);
        out.write(reinterpret_cast<const char*>(z.data()), static_cast<std::streamsize>(z.size()));
    }

    fs::path tempDir;
    fs::path objects;
};

TEST_F(ObjectDatabaseTest, ReadsLooseObject) {
    writeLooseObject(objects, fakeId(1), "blob", "hello\n");

    ObjectDatabase db(objects);
    GitObject obj = db.read(fakeId(1));

    EXPECT_EQ(obj.type, ObjectType::Blob);
    EXPECT_EQ(obj.data, "hello\n");
    EXPECT_EQ(db.packCount(), 0u);
}

TEST_F(ObjectDatabaseTest, LooseObjectPathSplitsId) {
    ObjectDatabase db(objects);
    fs::path p = db.looseObjectPath(fakeId(1));
    EXPECT_EQ(p.parent_path().filename().string(), fakeId(1).substr(0, 2));
    EXPECT_EQ(p.filename().string(), fakeId(1).substr(2));
}

TEST_F(ObjectDatabaseTest, ReadsCommitFromPack) {
    std::string content = commitContent("me@x", 1718800000);
    writePack(objects, "one", {{fakeId(1), 1, content}, {fakeId(2), 3, "blob data"}});

    ObjectDatabase db(objects);
    EXPECT_EQ(db.packCount(), 1u);

    CommitObject c = db.readCommit(fakeId(1));
    EXPECT_EQ(c.authorEmail, "me@x");
    EXPECT_EQ(db.read(fakeId(2)).data, "blob data");
}

TEST_F(ObjectDatabaseTest, LooseObjectsTakePrecedence) {
    writePack(objects, "one", {{fakeId(1), 3, "packed"}});
    writeLooseObject(objects, fakeId(1), "blob", "loose");

    ObjectDatabase db(objects);
    EXPECT_EQ(db.read(fakeId(1)).data, "loose");
}

TEST_F(ObjectDatabaseTest, RefDeltaBaseMayBeLoose) {
    const std::string base = commitContent("me@x", 1718800000, {}, "first\n");
    const std::string target = commitContent("me@x", 1718800000, {}, "first, amended\n");
    writeLooseObject(objects, fakeId(1), "commit", base);

    PackEntry delta;
    delta.hexId = fakeId(2);
    delta.type = 7;
    delta.data = makeDelta(base, target);
    delta.refBaseId = fakeId(1);
    writePack(objects, "thin", {delta});

    ObjectDatabase db(objects);
    GitObject obj = db.read(fakeId(2));
    EXPECT_EQ(obj.type, ObjectType::Commit);
    EXPECT_EQ(obj.data, target);
}

TEST_F(ObjectDatabaseTest, MissingObjectThrows) {
    ObjectDatabase db(objects);
    EXPECT_THROW(db.read(fakeId(42)), std::runtime_error);
    EXPECT_THROW(db.read("xyz"), std::runtime_error);
}

TEST_F(ObjectDatabaseTest, SizeMismatchIsCorrupt) {
    writeRawLoose(fakeId(3), std::string("blob 10") + '\0' + "short");
    ObjectDatabase db(objects);
    EXPECT_THROW(db.read(fakeId(3)), std::runtime_error);
}

TEST_F(ObjectDatabaseTest, UnknownTypeIsCorrupt) {
    writeRawLoose(fakeId(3), std::string("widget 2") + '\0' + "ab");
    ObjectDatabase db(objects);
    EXPECT_THROW(db.read(fakeId(3)), std::runtime_error);
}

TEST_F(ObjectDatabaseTest, GarbageLooseFileThrows) {
    createFile(objects, fakeId(4).substr(0, 2) + "/" + fakeId(4).substr(2), "not zlib at all");
    ObjectDatabase db(objects);
    EXPECT_THROW(db.read(fakeId(4)), std::runtime_error);
}

TEST_F(ObjectDatabaseTest, ReadCommitRejectsOtherTypes) {
    writeLooseObject(objects, fakeId(5), "blob", "data");
    ObjectDatabase db(objects);
    EXPECT_THROW(db.readCommit(fakeId(5)), std::runtime_error);
}

TEST_F(ObjectDatabaseTest, BrokenPackIsIgnored) {
    createFile(objects / "pack", "pack-bad.idx", "garbage");
    writePack(objects, "good", {{fakeId(6), 3, "ok"}});

    ObjectDatabase db(objects);
    EXPECT_EQ(db.packCount(), 1u);
    EXPECT_EQ(db.read(fakeId(6)).data, "ok");
}
