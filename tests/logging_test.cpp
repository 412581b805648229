/**
 * @file logging_test.cpp
 * @brief Stage timing aggregation and log prefixes
 */

#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "reel_cutter/logging.hpp"

namespace reel_cutter {
namespace {

class TimingCollectorTest : public ::testing::Test {
protected:
  void SetUp() override { TimingCollector::clear(); }
  void TearDown() override { TimingCollector::clear(); }
};

TEST_F(TimingCollectorTest, FoldsMeasurementsPerLabel) {
  TimingCollector::record("download", 2000000);
  TimingCollector::record("download", 1000000);
  TimingCollector::record("upload", 500000);

  auto rows = TimingCollector::snapshot();
  ASSERT_EQ(rows.size(), 2u);
  const StageTiming &dl = rows.at("download");
  EXPECT_EQ(dl.count, 2);
  EXPECT_EQ(dl.total_us, 3000000);
  EXPECT_EQ(dl.max_us, 2000000);
  EXPECT_DOUBLE_EQ(dl.mean_seconds(), 1.5);
  EXPECT_EQ(rows.at("upload").count, 1);
}

TEST_F(TimingCollectorTest, ConcurrentRecordsAreAllCounted) {
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([] {
      for (int i = 0; i < 100; ++i)
        TimingCollector::record("clip render", 10);
    });
  }
  for (auto &th : threads)
    th.join();

  const StageTiming t = TimingCollector::snapshot().at("clip render");
  EXPECT_EQ(t.count, 400);
  EXPECT_EQ(t.total_us, 4000);
}

TEST_F(TimingCollectorTest, TimerMacrosRecordUnderLabel) {
  TIMER_START(stage);
  TIMER_END(stage, "macro stage");
  EXPECT_EQ(TimingCollector::snapshot().count("macro stage"), 1u);
}

TEST(JobTagTest, UsesFirstEightCharacters) {
  EXPECT_EQ(job_tag("0f8fad5b-d9cb-469f-a165-70867728950e"), "[Job 0f8fad5b]");
  EXPECT_EQ(job_tag("abc"), "[Job abc]");
}

TEST(StageTimingTest, EmptyMeanIsZero) {
  StageTiming t;
  EXPECT_DOUBLE_EQ(t.mean_seconds(), 0.0);
}

} // anonymous namespace
} // namespace reel_cutter
