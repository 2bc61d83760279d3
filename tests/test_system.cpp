#include "clip_batch/system.hpp"

#include <gtest/gtest.h>

#include "test_support.hpp"

using namespace clip_batch;

TEST(FindExecutableTest, SearchesPath) {
  EXPECT_FALSE(find_executable("sh").empty());
  EXPECT_EQ(find_executable("/bin/sh"), "/bin/sh");
  EXPECT_TRUE(find_executable("clip-batch-no-such-tool").empty());
  EXPECT_TRUE(find_executable("").empty());
}

TEST(FindExecutableTest, NonExecutableFileIsIgnored) {
  test::TempDir dir;
  auto path = dir / "plain";
  test::write_file(path, "#!/bin/sh\n");
  EXPECT_TRUE(find_executable(path.string()).empty());
}

TEST(CollectMediaFilesTest, TopLevelMp4OnlySortedByName) {
  test::TempDir dir;
  test::write_file(dir / "b.mp4", "x");
  test::write_file(dir / "A.MP4", "x");
  test::write_file(dir / "c.txt", "x");
  test::write_file(dir / "d.mov", "x");
  std::filesystem::create_directories(dir / "Exports_1");
  test::write_file(dir / "Exports_1" / "Export_001.mp4", "x");

  auto files = collect_media_files(dir.path());
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(std::filesystem::path(files[0]).filename().string(), "A.MP4");
  EXPECT_EQ(std::filesystem::path(files[1]).filename().string(), "b.mp4");
}

TEST(CollectMediaFilesTest, MissingDirectoryIsEmpty) {
  EXPECT_TRUE(collect_media_files("/nonexistent/clip-batch-dir").empty());
}

TEST(TimeFormatTest, FormatTime) {
  EXPECT_EQ(format_time(0), "00:00:00");
  EXPECT_EQ(format_time(3661.7), "01:01:01");
}

TEST(TimeFormatTest, RunTimestampShape) {
  std::string ts = make_run_timestamp();
  ASSERT_EQ(ts.size(), 15u);
  EXPECT_EQ(ts[8], '_');
}

TEST(ToLowerTest, Ascii) {
  EXPECT_EQ(to_lower("NoStable.MP4"), "nostable.mp4");
}
