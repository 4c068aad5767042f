/**
 * @file output_verifier.cpp
 * @brief Output verification implementation
 */

#include "video_split/output_verifier.hpp"

#include <cmath>

#include "video_split/metadata_probe.hpp"

namespace video_split {

VerificationResult compare_to_plan(const std::string &sample_path,
                                   double sampled_frame_rate,
                                   int64_t sampled_bit_rate,
                                   const EncoderPlan &plan,
                                   const VerifyTolerance &tolerance) {
  VerificationResult r;
  r.sample_path = sample_path;
  r.sampled_frame_rate = sampled_frame_rate;
  r.sampled_bit_rate = sampled_bit_rate;

  r.frame_rate_matches = std::fabs(sampled_frame_rate -
                                   plan.effective_frame_rate()) <= tolerance.fps;

  const double target = static_cast<double>(plan.rate_control.target_bit_rate);
  if (sampled_bit_rate > 0 && target > 0) {
    double deviation_pct =
        std::fabs(static_cast<double>(sampled_bit_rate) - target) / target *
        100.0;
    r.bit_rate_matches = deviation_pct <= tolerance.bit_rate_pct;
  }
  return r;
}

bool verify_output(const std::string &sample_path, const EncoderPlan &plan,
                   const VerifyTolerance &tolerance, VerificationResult &result,
                   Error &error) {
  VideoMetadata sampled;
  if (!probe_video(sample_path, BitRateFallback::StreamOnly, sampled, error))
    return false;

  result = compare_to_plan(sample_path, sampled.frame_rate, sampled.bit_rate,
                           plan, tolerance);
  return true;
}

} // namespace video_split
