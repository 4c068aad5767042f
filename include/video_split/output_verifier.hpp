/**
 * @file output_verifier.hpp
 * @brief Advisory check of a produced segment against the plan
 *
 * @details Re-probes one output (by convention the first part) and compares
 *          its frame rate and bit rate to the plan's targets. Results are
 *          only reported: a mismatch never fails a finished run.
 */

#ifndef VIDEO_SPLIT_OUTPUT_VERIFIER_HPP
#define VIDEO_SPLIT_OUTPUT_VERIFIER_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace video_split {

/**
 * @struct VerifyTolerance
 * @brief How far a sampled value may drift and still count as a match.
 */
struct VerifyTolerance {
  double fps = 0.05;         //< Absolute frame rate difference
  double bit_rate_pct = 10.0; //< Relative bit rate difference in percent
};

/**
 * @brief Compare sampled values with the plan's targets.
 * @note A sampled bit rate of 0 (not reported by the container) never
 *       matches.
 */
VerificationResult compare_to_plan(const std::string &sample_path,
                                   double sampled_frame_rate,
                                   int64_t sampled_bit_rate,
                                   const EncoderPlan &plan,
                                   const VerifyTolerance &tolerance);

/**
 * @brief Probe `sample_path` and compare it with `plan`.
 *
 * @param sample_path Produced segment to inspect
 * @param plan Plan the segment was encoded with
 * @param tolerance Match tolerances
 * @param result Output: sampled values and per-field match flags
 * @param error Output: ProbeError if the sample cannot be read
 * @return true if the sample was probed (whether or not it matches)
 */
bool verify_output(const std::string &sample_path, const EncoderPlan &plan,
                   const VerifyTolerance &tolerance, VerificationResult &result,
                   Error &error);

} // namespace video_split

#endif // VIDEO_SPLIT_OUTPUT_VERIFIER_HPP
