// Component: segment planner unit tests

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "video_split/segment_planner.hpp"

namespace video_split {
namespace {

constexpr double kEps = 1e-9;

std::vector<SegmentRange> PlanOrDie(double duration, const SplitIntent &intent) {
  std::vector<SegmentRange> ranges;
  Error error;
  EXPECT_TRUE(plan_segments(duration, intent, ranges, error)) << error.message;
  EXPECT_EQ(error.code, ErrorCode::None);
  return ranges;
}

void ExpectContiguous(const std::vector<SegmentRange> &ranges) {
  ASSERT_FALSE(ranges.empty());
  EXPECT_DOUBLE_EQ(ranges.front().start_seconds, 0.0);
  for (size_t i = 0; i + 1 < ranges.size(); ++i) {
    EXPECT_EQ(ranges[i].index, static_cast<int>(i) + 1);
    EXPECT_LT(ranges[i].start_seconds, ranges[i + 1].start_seconds);
    EXPECT_NEAR(ranges[i].start_seconds + ranges[i].duration_seconds,
                ranges[i + 1].start_seconds, kEps);
  }
  EXPECT_EQ(ranges.back().index, static_cast<int>(ranges.size()));
}

double SumDurations(const std::vector<SegmentRange> &ranges) {
  double sum = 0.0;
  for (const auto &r : ranges)
    sum += r.duration_seconds;
  return sum;
}

// -----------------------------------------------------------------------------
// By count
// -----------------------------------------------------------------------------
TEST(SegmentPlannerTest, CountSplitsEvenly) {
  auto ranges = PlanOrDie(300.0, SplitIntent::by_count(6));
  ASSERT_EQ(ranges.size(), 6u);
  for (size_t i = 0; i < ranges.size(); ++i) {
    EXPECT_EQ(ranges[i].duration_seconds, 50.0);
    EXPECT_EQ(ranges[i].start_seconds, 50.0 * i);
  }
  ExpectContiguous(ranges);
}

TEST(SegmentPlannerTest, CountSumsToDurationForUnevenDivision) {
  const double durations[] = {300.5, 10.0, 1.0 / 3.0, 7200.123, 59.94};
  const int counts[] = {1, 3, 7, 13, 100};

  for (double duration : durations) {
    for (int n : counts) {
      auto ranges = PlanOrDie(duration, SplitIntent::by_count(n));
      ASSERT_EQ(ranges.size(), static_cast<size_t>(n))
          << "duration=" << duration << " n=" << n;
      ExpectContiguous(ranges);
      EXPECT_NEAR(SumDurations(ranges), duration, 1e-6);
      const auto &last = ranges.back();
      EXPECT_DOUBLE_EQ(last.start_seconds + last.duration_seconds, duration);
    }
  }
}

TEST(SegmentPlannerTest, SingleSegmentCoversWholeSource) {
  auto ranges = PlanOrDie(42.5, SplitIntent::by_count(1));
  ASSERT_EQ(ranges.size(), 1u);
  EXPECT_EQ(ranges[0].index, 1);
  EXPECT_EQ(ranges[0].start_seconds, 0.0);
  EXPECT_EQ(ranges[0].duration_seconds, 42.5);
}

// -----------------------------------------------------------------------------
// By duration
// -----------------------------------------------------------------------------
TEST(SegmentPlannerTest, DurationLeavesShortLastSegment) {
  auto ranges = PlanOrDie(300.5, SplitIntent::by_duration(60.0));
  ASSERT_EQ(ranges.size(), 6u);

  const double starts[] = {0.0, 60.0, 120.0, 180.0, 240.0, 300.0};
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(ranges[i].start_seconds, starts[i]);
    EXPECT_EQ(ranges[i].duration_seconds, 60.0);
  }
  EXPECT_EQ(ranges[5].start_seconds, 300.0);
  EXPECT_NEAR(ranges[5].duration_seconds, 0.5, kEps);
  ExpectContiguous(ranges);
}

TEST(SegmentPlannerTest, DurationExactMultiple) {
  auto ranges = PlanOrDie(300.0, SplitIntent::by_duration(60.0));
  ASSERT_EQ(ranges.size(), 5u);
  EXPECT_EQ(ranges.back().duration_seconds, 60.0);
}

TEST(SegmentPlannerTest, DurationLongerThanSource) {
  auto ranges = PlanOrDie(12.0, SplitIntent::by_duration(60.0));
  ASSERT_EQ(ranges.size(), 1u);
  EXPECT_EQ(ranges[0].duration_seconds, 12.0);
}

TEST(SegmentPlannerTest, DurationCountAndLastLengthHold) {
  const double durations[] = {300.5, 61.0, 3600.0, 0.75, 123.456};
  const double seconds[] = {0.25, 1.0, 7.5, 60.0, 599.9};

  for (double duration : durations) {
    for (double d : seconds) {
      auto ranges = PlanOrDie(duration, SplitIntent::by_duration(d));
      const size_t expected = static_cast<size_t>(std::ceil(duration / d));
      ASSERT_EQ(ranges.size(), expected) << "duration=" << duration
                                         << " d=" << d;
      for (size_t i = 0; i + 1 < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].duration_seconds, d);
      }
      const double last = ranges.back().duration_seconds;
      EXPECT_GE(last, 0.0);
      EXPECT_LE(last, d);
      EXPECT_NEAR(last, duration - d * (expected - 1), kEps);
      ExpectContiguous(ranges);
    }
  }
}

TEST(SegmentPlannerTest, NearZeroRemainderIsStillEmitted) {
  /// 180.0005 / 60 -> 4 segments, the last only 0.5 ms long
  auto ranges = PlanOrDie(180.0005, SplitIntent::by_duration(60.0));
  ASSERT_EQ(ranges.size(), 4u);
  EXPECT_LE(ranges.back().duration_seconds, NEAR_ZERO_SEGMENT_SEC);
  EXPECT_GT(ranges.back().duration_seconds, 0.0);
}

TEST(SegmentPlannerTest, DivisionErrorDoesNotAddEmptyTail) {
  /// 0.07 / 0.01 evaluates to 7.000000000000001 in binary floating point
  auto ranges = PlanOrDie(0.07, SplitIntent::by_duration(0.01));
  ASSERT_EQ(ranges.size(), 7u);
  EXPECT_GT(ranges.back().duration_seconds, 0.0);
  EXPECT_LE(ranges.back().duration_seconds, 0.01);
  ExpectContiguous(ranges);
}

// -----------------------------------------------------------------------------
// Invalid input
// -----------------------------------------------------------------------------
TEST(SegmentPlannerTest, RejectsInvalidIntent) {
  const SplitIntent bad[] = {
      SplitIntent::by_count(0), SplitIntent::by_count(-3),
      SplitIntent::by_duration(0.0), SplitIntent::by_duration(-1.0),
      SplitIntent::by_duration(std::nan(""))};

  for (const auto &intent : bad) {
    std::vector<SegmentRange> ranges = {{1, 0.0, 1.0}};
    Error error;
    EXPECT_FALSE(plan_segments(100.0, intent, ranges, error));
    EXPECT_EQ(error.code, ErrorCode::InvalidIntent);
    EXPECT_FALSE(error.message.empty());
    EXPECT_TRUE(ranges.empty());
  }
}

TEST(SegmentPlannerTest, RejectsNonPositiveSourceDuration) {
  for (double duration : {0.0, -5.0}) {
    std::vector<SegmentRange> ranges;
    Error error;
    EXPECT_FALSE(plan_segments(duration, SplitIntent::by_count(2), ranges,
                               error));
    EXPECT_EQ(error.code, ErrorCode::InvalidIntent);
    EXPECT_TRUE(ranges.empty());
  }
}

TEST(SegmentPlannerTest, RejectsExcessiveSegmentCount) {
  std::vector<SegmentRange> ranges;
  Error error;
  EXPECT_FALSE(plan_segments(3600.0, SplitIntent::by_duration(0.001), ranges,
                             error));
  EXPECT_EQ(error.code, ErrorCode::InvalidIntent);
}

TEST(SegmentPlannerTest, ValidateIntentAcceptsWellFormed) {
  Error error;
  EXPECT_TRUE(validate_intent(SplitIntent::by_count(1), error));
  EXPECT_TRUE(validate_intent(SplitIntent::by_duration(0.5), error));
  EXPECT_FALSE(error);
}

TEST(SegmentPlannerTest, NominalDurationIsFirstRange) {
  auto ranges = PlanOrDie(300.5, SplitIntent::by_duration(60.0));
  EXPECT_EQ(nominal_segment_duration(ranges), 60.0);
  EXPECT_EQ(nominal_segment_duration({}), 0.0);
}

} // namespace
} // namespace video_split
