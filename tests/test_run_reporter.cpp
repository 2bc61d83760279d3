#include "clip_batch/run_reporter.hpp"

#include <gtest/gtest.h>

#include <filesystem>

#include "test_support.hpp"

using namespace clip_batch;

TEST(RunReporterTest, LogFileCreatedOnFirstFailure) {
  test::TempDir dir;
  auto log = dir / "run.log";
  RunReporter reporter(log);
  EXPECT_FALSE(std::filesystem::exists(log));

  reporter.record_failure(FailureKind::TransformFailure, "a.mp4",
                          "stabilize-encode failed with exit code 1",
                          "line one\nline two");
  reporter.record_failure(FailureKind::ProbeUnreadable, "b.mp4",
                          "could not read duration, skipping");

  auto lines = test::read_lines(log);
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0].front(), '[');
  EXPECT_NE(lines[0].find("] TransformFailure: a.mp4: stabilize-encode"),
            std::string::npos);
  EXPECT_NE(lines[0].find("|| line one | line two"), std::string::npos);
  EXPECT_NE(lines[1].find("ProbeUnreadable: b.mp4"), std::string::npos);
  EXPECT_EQ(reporter.failures().size(), 2u);
}

TEST(RunReporterTest, FormatLine) {
  FailureRecord record{"2026-01-01 12:00:00", FailureKind::ConcatenationFailure,
                       "Export_002.mp4", "concat failed with exit code 1", ""};
  EXPECT_EQ(RunReporter::format_line(record),
            "[2026-01-01 12:00:00] ConcatenationFailure: Export_002.mp4: "
            "concat failed with exit code 1");
}

TEST(RunReporterTest, StatusFromCounters) {
  test::TempDir dir;

  RunReporter clean(dir / "a.log");
  EXPECT_EQ(clean.finish(), RunStatus::NoExportsProduced);
  clean.counters().exports_written = 1;
  EXPECT_EQ(clean.finish(), RunStatus::Completed);

  RunReporter degraded(dir / "b.log");
  degraded.counters().exports_written = 2;
  degraded.record_failure(FailureKind::TransformFailure, "c.mp4", "failed");
  EXPECT_EQ(degraded.finish(), RunStatus::CompletedWithFailures);
}

TEST(RunReporterTest, AbortWins) {
  test::TempDir dir;
  RunReporter reporter(dir / "run.log");
  reporter.counters().exports_written = 1;
  reporter.record_abort(RunStatus::AbortedNoInput, "No .mp4 files.");
  EXPECT_EQ(reporter.finish(), RunStatus::AbortedNoInput);

  auto lines = test::read_lines(dir / "run.log");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_NE(lines[0].find("aborted: no input files"), std::string::npos);
}

TEST(RunStatusTest, AbortsAndExitCodes) {
  EXPECT_TRUE(is_abort(RunStatus::AbortedEngineMissing));
  EXPECT_TRUE(is_abort(RunStatus::AbortedFontMissing));
  EXPECT_TRUE(is_abort(RunStatus::AbortedNoInput));
  EXPECT_TRUE(is_abort(RunStatus::AbortedNothingToProcess));
  EXPECT_FALSE(is_abort(RunStatus::Completed));
  EXPECT_FALSE(is_abort(RunStatus::NoExportsProduced));

  EXPECT_EQ(exit_code_for(RunStatus::Completed), 0);
  EXPECT_EQ(exit_code_for(RunStatus::CompletedWithFailures), 0);
  EXPECT_EQ(exit_code_for(RunStatus::NoExportsProduced), 1);
  EXPECT_EQ(exit_code_for(RunStatus::AbortedNoInput), 1);
}
