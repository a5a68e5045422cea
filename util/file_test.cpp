#include "util/file.hpp"

#include <sys/stat.h>

#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::EndsWith;
using ::testing::StartsWith;

using util::File;

std::string ReadAll(const std::string& path) {
  std::ifstream in(path);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

TEST(FileTest, TestJoinPath) {
  EXPECT_EQ(File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(File::JoinPath("a/", "b"), "a/b");
  EXPECT_EQ(File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(File::JoinPath("a", ""), "a");
  EXPECT_EQ(File::JoinPath("", "b"), "b");
}

TEST(FileTest, TestMakeDirs) {
  util::TempDir tmp(::testing::TempDir());
  std::string dir = File::JoinPath(tmp.Path(), "a/b/c");
  File::MakeDirs(dir);
  EXPECT_TRUE(File::IsDirectory(dir));
  EXPECT_NO_THROW(File::MakeDirs(dir));
  EXPECT_FALSE(File::Exists(File::JoinPath(tmp.Path(), "b")));
}

TEST(FileTest, TestRealPath) {
  util::TempDir tmp(::testing::TempDir());
  std::string real = File::RealPath(tmp.Path());
  File::MakeDirs(File::JoinPath(real, "x"));
  EXPECT_EQ(File::RealPath(File::JoinPath(tmp.Path(), "x/../x/.")),
            File::JoinPath(real, "x"));
  EXPECT_THROW(File::RealPath(File::JoinPath(tmp.Path(), "missing")),
               util::file_not_found);
}

TEST(TempFileTest, TestCreateAndRemove) {
  util::TempDir tmp(::testing::TempDir());
  std::string path;
  {
    util::TempFile file(tmp.Path(), ".codebox-", ".py", "print(1)\n");
    path = file.Path();
    std::string name = path.substr(path.rfind('/') + 1);
    EXPECT_THAT(name, StartsWith(".codebox-"));
    EXPECT_THAT(path, EndsWith(".py"));
    EXPECT_EQ(name.size(), strlen(".codebox-XXXXXX.py"));
    EXPECT_EQ(ReadAll(path), "print(1)\n");
    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
  }
  EXPECT_FALSE(File::Exists(path));
}

TEST(TempFileTest, TestMove) {
  util::TempDir tmp(::testing::TempDir());
  util::TempFile file(tmp.Path(), "f", "", "data");
  std::string path = file.Path();
  {
    util::TempFile moved = std::move(file);
    EXPECT_EQ(moved.Path(), path);
    EXPECT_TRUE(File::Exists(path));
  }
  EXPECT_FALSE(File::Exists(path));
}

TEST(TempFileTest, TestMissingDirectory) {
  util::TempDir tmp(::testing::TempDir());
  EXPECT_THROW(util::TempFile(File::JoinPath(tmp.Path(), "missing"), "f", "",
                              "data"),
               std::system_error);
}

TEST(TempDirTest, TestRemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(::testing::TempDir());
    path = tmp.Path();
    File::MakeDirs(File::JoinPath(path, "a/b"));
    EXPECT_TRUE(File::IsDirectory(path));
  }
  EXPECT_FALSE(File::Exists(path));
}

}  // namespace
