/***
 * Name: test_fs
 * Purpose: Verify EnsureDirectory and that AppendFile accumulates content.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "setalg/support/fs.h"

namespace fs = std::filesystem;

TEST(SupportFs, AppendAccumulates) {
  const fs::path path = fs::temp_directory_path() / "setalg_test_fs_append.txt";
  fs::remove(path);
  std::string err;
  ASSERT_TRUE(setalg::support::AppendFile(path.string(), "a\n", err)) << err;
  ASSERT_TRUE(setalg::support::AppendFile(path.string(), "b\n", err)) << err;
  std::ifstream in(path);
  std::ostringstream contents;
  contents << in.rdbuf();
  EXPECT_EQ(contents.str(), "a\nb\n");
  fs::remove(path);
}

TEST(SupportFs, EnsureDirectoryCreatesParents) {
  const fs::path root = fs::temp_directory_path() / "setalg_test_fs_dirs";
  fs::remove_all(root);
  const fs::path nested = root / "a" / "b";
  std::string err;
  ASSERT_TRUE(setalg::support::EnsureDirectory(nested.string(), err)) << err;
  EXPECT_TRUE(fs::is_directory(nested));
  EXPECT_TRUE(setalg::support::EnsureDirectory(nested.string(), err));
  fs::remove_all(root);
}

TEST(SupportFs, EnsureDirectoryFailsUnderAFile) {
  const fs::path file = fs::temp_directory_path() / "setalg_test_fs_plain_file";
  fs::remove_all(file);
  std::string err;
  ASSERT_TRUE(setalg::support::AppendFile(file.string(), "x", err)) << err;
  EXPECT_FALSE(setalg::support::EnsureDirectory((file / "sub").string(), err));
  EXPECT_NE(err.find("failed to create directory"), std::string::npos);
  fs::remove(file);
}
