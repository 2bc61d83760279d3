#include "clip_batch/export_grouper.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "test_support.hpp"

using namespace clip_batch;
using clip_batch::test::TempDir;

TEST(GroupArtifactsTest, FiveClipsGiveThreeAndTwo) {
  auto groups = group_artifacts({"A", "B", "C", "D", "E"});
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0], (ExportGroup{"A", "B", "C"}));
  EXPECT_EQ(groups[1], (ExportGroup{"D", "E"}));
}

TEST(GroupArtifactsTest, NoRebalancing) {
  auto groups = group_artifacts({"A", "B", "C", "D"});
  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].size(), 3u);
  EXPECT_EQ(groups[1], (ExportGroup{"D"}));
}

TEST(GroupArtifactsTest, EdgeSizes) {
  EXPECT_TRUE(group_artifacts({}).empty());
  EXPECT_EQ(group_artifacts({"A"}), (std::vector<ExportGroup>{{"A"}}));
  EXPECT_EQ(group_artifacts({"A", "B", "C"}),
            (std::vector<ExportGroup>{{"A", "B", "C"}}));
  EXPECT_EQ(group_artifacts({"A", "B", "C"}, 2),
            (std::vector<ExportGroup>{{"A", "B"}, {"C"}}));
  EXPECT_EQ(group_artifacts({"A", "B"}, 0),
            (std::vector<ExportGroup>{{"A"}, {"B"}}));
}

TEST(BuildManifestTest, OneQuotedLinePerClip) {
  std::string manifest = build_manifest({"/tmp/a.mp4", "/tmp/it's.mp4"});
  EXPECT_EQ(manifest, "file '/tmp/a.mp4'\nfile '/tmp/it'\\''s.mp4'\n");
}

TEST(BuildManifestTest, RelativePathsBecomeAbsolute) {
  std::string manifest = build_manifest({"clip.mp4"});
  EXPECT_EQ(manifest.rfind("file '/", 0), 0u);
}

TEST(ExportPathTest, NumberedInGroupOrder) {
  RunConfig cfg;
  cfg.export_dir = "/out/Exports_x";
  EXPECT_EQ(export_path_for(cfg, 1), "/out/Exports_x/Export_001.mp4");
  EXPECT_EQ(export_path_for(cfg, 12), "/out/Exports_x/Export_012.mp4");
}

TEST(ConcatManifestTest, ReadableThroughProc) {
  const std::string content = "file '/tmp/a.mp4'\n";
  ConcatManifest manifest(content);
  ASSERT_TRUE(manifest.ok());
  EXPECT_EQ(manifest.path().rfind("/proc/", 0), 0u);

  std::ifstream in(manifest.path());
  std::string read((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  EXPECT_EQ(read, content);
}

TEST(ConcatGroupTest, StreamCopiesGroupInOrder) {
  TempDir dir;
  auto ffmpeg = test::write_fake_ffmpeg(dir.path());
  RunConfig cfg = test::make_test_config(dir.path(), ffmpeg.string());
  std::filesystem::create_directories(cfg.export_dir);

  ExportGroup group = {(dir / "001_a.mp4").string(),
                       (dir / "002_b.mp4").string()};
  std::string output = export_path_for(cfg, 1);

  ProcessResult result = concat_group(cfg, group, output);
  ASSERT_TRUE(result.ok()) << result.diagnostic_tail;
  EXPECT_TRUE(std::filesystem::exists(output));

  auto calls = test::read_lines(dir / "calls.log");
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_NE(calls[0].find("-f concat"), std::string::npos);
  EXPECT_NE(calls[0].find("-c copy"), std::string::npos);

  auto manifest = test::read_lines(dir / "manifests.log");
  ASSERT_EQ(manifest.size(), 2u);
  EXPECT_EQ(manifest[0], "file '" + group[0] + "'");
  EXPECT_EQ(manifest[1], "file '" + group[1] + "'");
}

TEST(ConcatGroupTest, FailureRemovesPartialExport) {
  TempDir dir;
  auto ffmpeg = test::write_fake_ffmpeg(dir.path(), "concat");
  RunConfig cfg = test::make_test_config(dir.path(), ffmpeg.string());
  std::filesystem::create_directories(cfg.export_dir);

  std::string output = export_path_for(cfg, 1);
  test::write_file(output, "stale");

  ProcessResult result =
      concat_group(cfg, {(dir / "001_a.mp4").string()}, output);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(result.diagnostic_tail.find("concat rejected"), std::string::npos);
  EXPECT_FALSE(std::filesystem::exists(output));
}

TEST(ConcatGroupTest, FailingGroupDoesNotAffectNext) {
  TempDir dir;
  auto ffmpeg = test::write_fake_ffmpeg(dir.path(), "Export_001");
  RunConfig cfg = test::make_test_config(dir.path(), ffmpeg.string());
  std::filesystem::create_directories(cfg.export_dir);

  auto groups = group_artifacts({(dir / "001_a.mp4").string(),
                                 (dir / "002_b.mp4").string(),
                                 (dir / "003_c.mp4").string(),
                                 (dir / "004_d.mp4").string()});
  ASSERT_EQ(groups.size(), 2u);

  EXPECT_FALSE(concat_group(cfg, groups[0], export_path_for(cfg, 1)).ok());
  EXPECT_TRUE(concat_group(cfg, groups[1], export_path_for(cfg, 2)).ok());
  EXPECT_FALSE(std::filesystem::exists(export_path_for(cfg, 1)));
  EXPECT_TRUE(std::filesystem::exists(export_path_for(cfg, 2)));
}
