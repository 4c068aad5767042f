/**
 * @file segment_planner.hpp
 * @brief Conversion of a split intent into segment time ranges
 *
 * @details Rounding policy:
 *
 *          - ByCount(n): boundary i sits at i * (duration / n), computed by
 *            multiplication so error does not accumulate. Each range spans
 *            to the next boundary and the last range ends exactly at
 *            `duration`.
 *
 *          - ByDuration(d): ceil(duration / d) ranges starting at i * d.
 *            The last range holds the remainder, clamped to [0, d].
 *
 * @note Boundaries are cut points for the encoder, which lands on the
 *       nearest keyframe; they are not frame-accurate.
 */

#ifndef VIDEO_SPLIT_SEGMENT_PLANNER_HPP
#define VIDEO_SPLIT_SEGMENT_PLANNER_HPP

#include <vector>

#include "types.hpp"

namespace video_split {

/// Remainders at or below this many seconds are flagged as near-empty
constexpr double NEAR_ZERO_SEGMENT_SEC = 1e-3;

/// Upper bound on planned segments (one encoder process each)
constexpr int MAX_SEGMENTS = 100000;

/**
 * @brief Check an intent without planning.
 * @param error Output: InvalidIntent with the reason on failure
 * @return true if the intent is well-formed
 */
bool validate_intent(const SplitIntent &intent, Error &error);

/**
 * @brief Plan the segment ranges for a source of `duration` seconds.
 *
 * @param duration Source duration in seconds (must be > 0)
 * @param intent Split by count or by duration
 * @param ranges Output: ordered, contiguous ranges (cleared first)
 * @param error Output: InvalidIntent on failure
 * @return true on success; on failure `ranges` is left empty
 */
bool plan_segments(double duration, const SplitIntent &intent,
                   std::vector<SegmentRange> &ranges, Error &error);

/**
 * @brief Nominal per-segment length of a plan (the first range's length).
 */
double nominal_segment_duration(const std::vector<SegmentRange> &ranges);

} // namespace video_split

#endif // VIDEO_SPLIT_SEGMENT_PLANNER_HPP
