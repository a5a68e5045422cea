#include "util/which.hpp"

#include <stdlib.h>

#include "gtest/gtest.h"

namespace {

TEST(WhichTest, TestFindsInPath) {
  std::string sh = util::which("sh");
  ASSERT_FALSE(sh.empty());
  EXPECT_EQ(sh[0], '/');
}

TEST(WhichTest, TestExplicitPath) {
  EXPECT_EQ(util::which("/bin/sh"), "/bin/sh");
  EXPECT_EQ(util::which("/no/such/file"), "");
  // Directories are not executables.
  EXPECT_EQ(util::which("/bin"), "");
}

TEST(WhichTest, TestMissing) {
  EXPECT_EQ(util::which("surely-not-an-installed-command"), "");
  EXPECT_EQ(util::which(""), "");
}

TEST(WhichTest, TestEmptyPath) {
  const char* old_path = getenv("PATH");
  std::string saved = old_path ? old_path : "";
  setenv("PATH", "", 1);
  EXPECT_EQ(util::which("sh", /*use_cache=*/false), "");
  setenv("PATH", saved.c_str(), 1);
}

}  // namespace
