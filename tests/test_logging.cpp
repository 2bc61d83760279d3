#include "clip_batch/logging.hpp"

#include <gtest/gtest.h>

using namespace clip_batch;

TEST(TimingCollectorTest, RepeatedPhasesAreFolded) {
  TimingCollector::clear();
  TimingCollector::record("probe", 100);
  TimingCollector::record("transform", 5000);
  TimingCollector::record("probe", 250);

  const auto &phases = TimingCollector::phases();
  ASSERT_EQ(phases.size(), 2u);
  EXPECT_EQ(phases[0].name, "probe");
  EXPECT_EQ(phases[0].calls, 2);
  EXPECT_EQ(phases[0].microseconds, 350);
  EXPECT_EQ(phases[1].name, "transform");
  EXPECT_EQ(phases[1].calls, 1);
  TimingCollector::clear();
}

TEST(TimingCollectorTest, TimerMacrosRecordUnderTheirName) {
  TimingCollector::clear();
  {
    TIMER_START(concat);
    TIMER_END(concat);
  }
  const auto &phases = TimingCollector::phases();
#if ENABLE_TIMING
  ASSERT_EQ(phases.size(), 1u);
  EXPECT_EQ(phases[0].name, "concat");
  EXPECT_GE(phases[0].microseconds, 0);
#else
  EXPECT_TRUE(phases.empty());
#endif
  TimingCollector::clear();
}
