#include <gtest/gtest.h>
#include <memory>
#include <string>

#include <grp.h>
#include <unistd.h>

#include "fswriter/errors.hpp"
#include "fswriter/local_file_system.hpp"
#include "test_file_system.hpp"

namespace fswriter {
namespace test {

class LocalFileSystemTest : public ::testing::Test {
protected:
    void write_through(const std::string& path, const std::string& data, bool overwrite = true) {
        auto out = local.create(path, 0644, overwrite, 16, 1, LocalFileSystem::DEFAULT_BLOCK_SIZE);
        check_status(out->Write(data.data(), static_cast<int64_t>(data.size())), "write");
        check_status(out->Close(), "close");
    }

    TempDir dir;
    LocalFileSystem local;
};

TEST_F(LocalFileSystemTest, CreateWritesThroughBuffer) {
    std::string path = dir / "file.txt";
    write_through(path, "buffered output larger than the buffer");
    EXPECT_EQ(read_file(path), "buffered output larger than the buffer");

    FileStatus status = local.get_file_status(path);
    EXPECT_EQ(status.length, 38);
    EXPECT_FALSE(status.is_directory);
}

TEST_F(LocalFileSystemTest, CreateOverwriteTruncates) {
    std::string path = dir / "file.txt";
    write_file(path, "previous content");
    write_through(path, "new");
    EXPECT_EQ(read_file(path), "new");
}

TEST_F(LocalFileSystemTest, CreateWithoutOverwriteRejectsExistingFile) {
    std::string path = dir / "file.txt";
    write_file(path, "keep");
    EXPECT_THROW(local.create(path, 0644, false, 0, 1, 0), IOError);
    EXPECT_EQ(read_file(path), "keep");
}

TEST_F(LocalFileSystemTest, CreateFailsWhenParentIsMissing) {
    EXPECT_THROW(local.create(dir / "missing/file.txt", 0644, true, 0, 1, 0), IOError);
}

TEST_F(LocalFileSystemTest, OpenReadsBack) {
    std::string path = dir / "file.txt";
    write_file(path, "contents");
    auto in = local.open(path);
    EXPECT_EQ(read_all(*in), "contents");
    EXPECT_THROW(local.open(dir / "nope"), IOError);
}

TEST_F(LocalFileSystemTest, ExistsAndRemove) {
    std::string path = dir / "file.txt";
    EXPECT_FALSE(local.exists(path));
    write_file(path, "x");
    EXPECT_TRUE(local.exists(path));

    EXPECT_TRUE(local.remove(path, false));
    EXPECT_FALSE(local.exists(path));
    EXPECT_FALSE(local.remove(path, false));
}

TEST_F(LocalFileSystemTest, RemoveRecursive) {
    write_file(dir / "tree/a/b.txt", "x");
    EXPECT_THROW(local.remove(dir / "tree", false), IOError);
    EXPECT_TRUE(local.remove(dir / "tree", true));
    EXPECT_FALSE(local.exists(dir / "tree"));
}

TEST_F(LocalFileSystemTest, MkdirReportsWhetherItCreated) {
    std::string path = dir / "sub";
    EXPECT_TRUE(local.mkdir(path, 0755));
    EXPECT_FALSE(local.mkdir(path, 0755));
    EXPECT_TRUE(local.get_file_status(path).is_directory);

    write_file(dir / "plain", "x");
    EXPECT_THROW(local.mkdir(dir / "plain", 0755), IOError);
}

TEST_F(LocalFileSystemTest, RenameWithOverwriteReplacesDestination) {
    write_file(dir / "src", "new");
    write_file(dir / "dst", "old");
    local.rename(dir / "src", dir / "dst", true);
    EXPECT_FALSE(local.exists(dir / "src"));
    EXPECT_EQ(read_file(dir / "dst"), "new");
}

TEST_F(LocalFileSystemTest, RenameWithoutOverwriteKeepsDestination) {
    write_file(dir / "src", "new");
    write_file(dir / "dst", "old");
    EXPECT_THROW(local.rename(dir / "src", dir / "dst", false), IOError);
    EXPECT_EQ(read_file(dir / "dst"), "old");
    EXPECT_TRUE(local.exists(dir / "src"));

    local.rename(dir / "src", dir / "fresh", false);
    EXPECT_EQ(read_file(dir / "fresh"), "new");
    EXPECT_FALSE(local.exists(dir / "src"));
}

TEST_F(LocalFileSystemTest, RenameOntoDirectoryFails) {
    write_file(dir / "src", "x");
    local.mkdir(dir / "target", 0755);
    EXPECT_THROW(local.rename(dir / "src", dir / "target", true), IOError);
}

TEST_F(LocalFileSystemTest, SetPermissionIgnoresUmask) {
    std::string path = dir / "file.txt";
    write_file(path, "x");
    local.set_permission(path, 0640);
    EXPECT_EQ(local.get_file_status(path).permission, 0640u);
    EXPECT_EQ(mode_of(path), 0640u);
}

TEST_F(LocalFileSystemTest, SetGroupToOwnGroup) {
    std::string path = dir / "file.txt";
    write_file(path, "x");

    struct group* grp = ::getgrgid(::getegid());
    if (grp == nullptr) {
        GTEST_SKIP() << "effective group has no name";
    }
    std::string name = grp->gr_name;

    local.set_group(path, name);
    EXPECT_EQ(local.get_file_status(path).group, name);
    EXPECT_THROW(local.set_group(path, "no-such-group-fswriter"), IOError);
}

TEST_F(LocalFileSystemTest, Defaults) {
    EXPECT_EQ(local.scheme(), "file");
    EXPECT_EQ(local.uri(), "file:///");
    EXPECT_EQ(local.default_replication(dir.path()), 1);
    EXPECT_EQ(local.default_block_size(dir.path()), LocalFileSystem::DEFAULT_BLOCK_SIZE);
    EXPECT_EQ(local.make_qualified("/data/out/../part.txt"), "file:///data/part.txt");
}

}  // namespace test
}  // namespace fswriter
