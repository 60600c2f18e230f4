#include "core/SizeCalculator.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "support/TempDir.hpp"

using ferry::core::computeTotalSize;
using ferry::test::TempDir;
using ferry::test::writeText;
namespace fs = std::filesystem;

TEST(SizeCalculatorTest, SumsFilesAndDirectoryContents) {
  TempDir td;
  writeText(td.path() / "a.bin", std::string(100, 'a'));
  fs::create_directories(td.path() / "dir" / "nested");
  writeText(td.path() / "dir" / "b.bin", std::string(50, 'b'));
  writeText(td.path() / "dir" / "nested" / "c.bin", std::string(25, 'c'));

  EXPECT_EQ(computeTotalSize({(td.path() / "a.bin").string(), (td.path() / "dir").string()}),
            175u);
}

TEST(SizeCalculatorTest, MissingPathsCountAsZero) {
  TempDir td;
  writeText(td.path() / "a.bin", std::string(10, 'a'));
  EXPECT_EQ(computeTotalSize({(td.path() / "missing").string(), (td.path() / "a.bin").string()}),
            10u);
  EXPECT_EQ(computeTotalSize({}), 0u);
}

TEST(SizeCalculatorTest, UnreadableEntriesAreSkipped) {
  TempDir td;
  fs::create_directory(td.path() / "dir");
  writeText(td.path() / "dir" / "ok.bin", std::string(7, 'x'));
  fs::create_symlink(td.path() / "gone", td.path() / "dir" / "dangling");
  EXPECT_EQ(computeTotalSize({(td.path() / "dir").string()}), 7u);
}

TEST(SizeCalculatorTest, DirectorySymlinksAreNotFollowed) {
  TempDir td;
  fs::create_directory(td.path() / "outside");
  writeText(td.path() / "outside" / "big.bin", std::string(1000, 'x'));
  fs::create_directory(td.path() / "dir");
  writeText(td.path() / "dir" / "small.bin", std::string(3, 'x'));
  fs::create_directory_symlink(td.path() / "outside", td.path() / "dir" / "link");
  EXPECT_EQ(computeTotalSize({(td.path() / "dir").string()}), 3u);
}
