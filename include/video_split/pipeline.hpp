/**
 * @file pipeline.hpp
 * @brief Split run orchestration
 *
 * @details The SplitPipeline class drives one run as a linear sequence:
 *
 *          1. Validate the intent and probe source metadata
 *
 *          2. Plan segment ranges
 *
 *          3. Detect the hardware encoder
 *
 *          4. Select the encoder plan
 *
 *          5. Create the output directory
 *
 *          6. Encode every segment in order
 *
 *          7. Verify the first output and print the job summary
 *
 * @note Steps 1-4 launch no encoder, so bad input fails before anything is
 *       written.
 */

#ifndef VIDEO_SPLIT_PIPELINE_HPP
#define VIDEO_SPLIT_PIPELINE_HPP

#include <atomic>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace video_split {

/// Exit status of a run stopped by SIGINT/SIGTERM (128 + SIGINT)
constexpr int EXIT_CANCELLED = 130;

/**
 * @struct RunRequest
 * @brief What the caller asked for, before anything was probed.
 */
struct RunRequest {
  std::string input_path;
  SplitIntent intent;
  RateControlMode mode = RateControlMode::CBR;
  std::optional<double> target_frame_rate; //< nullopt = keep source
};

/**
 * @struct RunContext
 * @brief Every input of a run, fixed once probing and detection are done.
 * @note Built once and handed around as const; never mutated mid-run.
 */
struct RunContext {
  std::string input_path;
  std::string output_dir;
  VideoMetadata metadata;
  SplitIntent intent;
  RateControlMode mode;
  std::optional<double> target_frame_rate;
  bool hardware_available;
};

/**
 * @class SplitPipeline
 * @brief Runs probe, plan, encode and verify for one source file.
 */
class SplitPipeline {
  RunRequest request_;
  const std::atomic<bool> *cancel_;

  /**
   * @brief Print input, output and verification details.
   */
  void print_job_summary(const RunContext &ctx, const EncoderPlan &plan,
                         const std::vector<SegmentRange> &ranges,
                         const std::vector<std::string> &outputs,
                         const std::optional<VerificationResult> &verification);

public:
  /**
   * @brief Construct a pipeline.
   * @param request Input path and split settings
   * @param cancel Flag checked between segments (nullptr = not cancellable)
   */
  explicit SplitPipeline(RunRequest request,
                         const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Run the complete pipeline.
   * @return 0 on success, EXIT_CANCELLED if cancelled, 1 on any other error
   */
  int run();
};

} // namespace video_split

#endif // VIDEO_SPLIT_PIPELINE_HPP
