/**
 * @file segment_planner.cpp
 * @brief Segment planning implementation
 */

#include "video_split/segment_planner.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/core.h>

#include "video_split/logging.hpp"

namespace video_split {

namespace {

bool fail(Error &error, std::string message) {
  error.code = ErrorCode::InvalidIntent;
  error.message = std::move(message);
  return false;
}

void plan_by_count(double duration, int count,
                   std::vector<SegmentRange> &ranges) {
  const double step = duration / count;
  ranges.reserve(count);

  for (int i = 0; i < count; ++i) {
    double start = i * step;
    double end = (i + 1 == count) ? duration : (i + 1) * step;
    ranges.push_back({i + 1, start, end - start});
  }
}

/// ceil(duration / seconds), minus one when fp error leaves an empty tail
double duration_segment_count(double duration, double seconds) {
  double count = std::ceil(duration / seconds);
  if (count > 1 && duration - seconds * (count - 1) <= 0.0)
    count -= 1;
  return count;
}

void plan_by_duration(double duration, double seconds,
                      std::vector<SegmentRange> &ranges) {
  const int count =
      static_cast<int>(duration_segment_count(duration, seconds));
  ranges.reserve(count);

  for (int i = 0; i < count; ++i) {
    double start = i * seconds;
    double length = seconds;
    if (i + 1 == count) {
      /// fp error can push the remainder slightly above `seconds`
      length = std::clamp(duration - seconds * (count - 1), 0.0, seconds);
    }
    ranges.push_back({i + 1, start, length});
  }
}

} // anonymous namespace

bool validate_intent(const SplitIntent &intent, Error &error) {
  switch (intent.kind) {
  case SplitIntent::Kind::ByCount:
    if (intent.count < 1)
      return fail(error, fmt::format("segment count must be at least 1, got {}",
                                     intent.count));
    return true;
  case SplitIntent::Kind::ByDuration:
    if (!std::isfinite(intent.seconds) || intent.seconds <= 0.0)
      return fail(error, fmt::format("segment duration must be positive, got {}",
                                     intent.seconds));
    return true;
  }
  return fail(error, "unknown split intent");
}

bool plan_segments(double duration, const SplitIntent &intent,
                   std::vector<SegmentRange> &ranges, Error &error) {
  ranges.clear();

  if (!std::isfinite(duration) || duration <= 0.0)
    return fail(error,
                fmt::format("source duration must be positive, got {}", duration));
  if (!validate_intent(intent, error))
    return false;

  const double planned = (intent.kind == SplitIntent::Kind::ByCount)
                             ? intent.count
                             : duration_segment_count(duration, intent.seconds);
  if (planned > MAX_SEGMENTS)
    return fail(error, fmt::format("{:.0f} segments requested, limit is {}",
                                   planned, MAX_SEGMENTS));

  if (intent.kind == SplitIntent::Kind::ByCount) {
    plan_by_count(duration, intent.count, ranges);
  } else {
    plan_by_duration(duration, intent.seconds, ranges);
  }

  const SegmentRange &last = ranges.back();
  if (ranges.size() > 1 && last.duration_seconds <= NEAR_ZERO_SEGMENT_SEC) {
    LOG_WARN("Last segment ({}) is only {:.3f}s long", last.index,
             last.duration_seconds);
  }
  return true;
}

double nominal_segment_duration(const std::vector<SegmentRange> &ranges) {
  return ranges.empty() ? 0.0 : ranges.front().duration_seconds;
}

} // namespace video_split
