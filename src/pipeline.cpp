/**
 * @file pipeline.cpp
 * @brief Split run orchestration implementation
 */

#include "video_split/pipeline.hpp"

#include <cstdio>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "video_split/config.hpp"
#include "video_split/encoder_selector.hpp"
#include "video_split/ffmpeg_executor.hpp"
#include "video_split/hardware_detector.hpp"
#include "video_split/logging.hpp"
#include "video_split/metadata_probe.hpp"
#include "video_split/output_verifier.hpp"
#include "video_split/segment_executor.hpp"
#include "video_split/segment_planner.hpp"
#include "video_split/system.hpp"

namespace video_split {

namespace {

int fail_run(const Error &error) {
  if (error.segment_index > 0) {
    LOG_ERROR("{} at segment {}: {}", error_code_name(error.code),
              error.segment_index, error.message);
  } else {
    LOG_ERROR("{}: {}", error_code_name(error.code), error.message);
  }
  return error.code == ErrorCode::Cancelled ? EXIT_CANCELLED : 1;
}

} // anonymous namespace

// **---- Constructor ----**

SplitPipeline::SplitPipeline(RunRequest request,
                             const std::atomic<bool> *cancel)
    : request_(std::move(request)), cancel_(cancel) {}

// **---- Main Processing ----**

int SplitPipeline::run() {
  TimingCollector::clear();
  TIMER_START(total_run);
  Error error;

  /// Malformed intent fails before the source is even opened
  if (!validate_intent(request_.intent, error))
    return fail_run(error);

  // **----- PHASE 0: PROBE SOURCE -----**

  LOG_PHASE("Analyzing video: {}", request_.input_path);
  VideoMetadata metadata;
  {
    TIMER_START(probe);
    if (!probe_video(request_.input_path, BitRateFallback::ContainerThenDefault,
                     metadata, error)) {
      return fail_run(error);
    }
    TIMER_END(probe);
  }

  LOG_INFO("Frame rate: {:.2f} fps", metadata.frame_rate);
  LOG_INFO("Bit rate: {}", format_mbps(metadata.bit_rate));
  LOG_INFO("Resolution: {}x{}", metadata.width, metadata.height);
  LOG_INFO("Duration: {:.2f} seconds ({})", metadata.duration_seconds,
           format_time(metadata.duration_seconds));

  // **----- PHASE 1: PLAN -----**

  std::vector<SegmentRange> ranges;
  if (!plan_segments(metadata.duration_seconds, request_.intent, ranges,
                     error)) {
    return fail_run(error);
  }

  HardwareCapabilityDetector detector(Config::ffmpeg_bin(),
                                      Config::hw_encoder(),
                                      Config::force_software());

  const RunContext ctx{request_.input_path,
                       output_dir_for(request_.input_path),
                       metadata,
                       request_.intent,
                       request_.mode,
                       request_.target_frame_rate,
                       detector.available()};

  EncoderPlan plan;
  if (!select_encoder_plan(ctx.mode, ctx.metadata.bit_rate,
                           ctx.hardware_available, ctx.target_frame_rate,
                           ctx.metadata, plan, error)) {
    return fail_run(error);
  }

  LOG_INFO("Splitting into {} segments of {:.2f} seconds each", ranges.size(),
           nominal_segment_duration(ranges));
  LOG_INFO("Rate control: {} at {}", rate_control_name(plan.mode),
           format_mbps(plan.rate_control.target_bit_rate));
  LOG_INFO("Using encoder: {} ({}) - Status: {}", plan.codec,
           plan.use_hardware ? "Hardware accelerated" : "Software",
           hardware_status(plan, ctx.hardware_available));

  // **----- PHASE 2: ENCODE -----**

  std::string dir_error;
  if (!ensure_directory(ctx.output_dir, dir_error)) {
    LOG_ERROR("Cannot create output directory {}: {}", ctx.output_dir,
              dir_error);
    return 1;
  }

  LOG_PHASE("Encoding...");
  FFmpegEncodeBackend backend(
      Config::ffmpeg_bin(), Config::encode_timeout_sec(),
      static_cast<size_t>(Config::diagnostic_tail_bytes()));
  SegmentExecutor executor(backend, cancel_);

  std::vector<std::string> outputs;
  TIMER_START(encode);
  bool encoded = executor.execute(ranges, plan, ctx.input_path, ctx.output_dir,
                                  outputs, error);
  TIMER_END(encode);

  if (!encoded) {
    if (!outputs.empty()) {
      LOG_WARN("{} of {} segments were written to {} before the failure",
               outputs.size(), ranges.size(), ctx.output_dir);
    }
    TimingCollector::print_summary();
    return fail_run(error);
  }

  LOG_SUCCESS("Video splitting complete. Output files in: {}", ctx.output_dir);

  // **----- PHASE 3: VERIFY -----**

  std::optional<VerificationResult> verification;
  if (!outputs.empty()) {
    VerifyTolerance tolerance;
    tolerance.fps = Config::verify_fps_tolerance();
    tolerance.bit_rate_pct = Config::verify_bitrate_tolerance_pct();

    VerificationResult result;
    Error verify_error;
    if (verify_output(outputs.front(), plan, tolerance, result, verify_error)) {
      verification = result;
    } else {
      LOG_WARN("Could not verify output file parameters: {}",
               verify_error.message);
    }
  }

  TIMER_END(total_run);
  TimingCollector::print_summary();
  print_job_summary(ctx, plan, ranges, outputs, verification);

  return 0;
}

// **---- Job Summary ----**

void SplitPipeline::print_job_summary(
    const RunContext &ctx, const EncoderPlan &plan,
    const std::vector<SegmentRange> &ranges,
    const std::vector<std::string> &outputs,
    const std::optional<VerificationResult> &verification) {
  const VideoMetadata &m = ctx.metadata;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "==================== JOB SUMMARY ===================\n");

  fmt::print("\nINPUT VIDEO DETAILS:\n");
  fmt::print("  {:<24} {}\n", "File:", ctx.input_path);
  fmt::print("  {:<24} {:.2f} fps\n", "Frame rate:", m.frame_rate);
  fmt::print("  {:<24} {}\n", "Bit rate:", format_mbps(m.bit_rate));
  fmt::print("  {:<24} {}x{}\n", "Resolution:", m.width, m.height);
  fmt::print("  {:<24} {:.2f} seconds\n", "Duration:", m.duration_seconds);

  fmt::print("\nOUTPUT DETAILS:\n");
  fmt::print("  {:<24} {}\n", "Output directory:", ctx.output_dir);
  fmt::print("  {:<24} {}\n", "Number of segments:", outputs.size());
  fmt::print("  {:<24} {:.2f} seconds\n",
             "Segment duration:", nominal_segment_duration(ranges));
  fmt::print("  {:<24} {:.2f} fps{}\n",
             "Target frame rate:", plan.effective_frame_rate(),
             plan.target_frame_rate ? "" : " (source)");
  fmt::print("  {:<24} {}\n", "Bit rate control:",
             plan.mode == RateControlMode::CBR ? "Constant (CBR)"
                                               : "Variable (VBR)");
  fmt::print("  {:<24} {}\n", "Encoder:", plan.codec);
  fmt::print("  {:<24} {}\n", "Hardware acceleration:",
             plan.use_hardware ? "Used" : "Not used");

  fmt::print("\nOUTPUT VERIFICATION:\n");
  if (verification) {
    const VerificationResult &v = *verification;
    fmt::print("  {:<24} {}\n", "Sample file:", v.sample_path);
    fmt::print("  {:<24} {:.2f} fps\n", "Actual frame rate:",
               v.sampled_frame_rate);
    fmt::print("  {:<24} {}\n", "Actual bit rate:",
               format_mbps(v.sampled_bit_rate));
    if (!v.frame_rate_matches) {
      fmt::print(fg(fmt::color::yellow),
                 "  Warning: frame rate differs from target {:.2f} fps\n",
                 plan.effective_frame_rate());
    }
    if (!v.bit_rate_matches) {
      fmt::print(fg(fmt::color::yellow),
                 "  Warning: bit rate differs from target {}\n",
                 format_mbps(plan.rate_control.target_bit_rate));
    }
  } else {
    fmt::print(fg(fmt::color::yellow),
               "  Warning: Could not verify output file parameters\n");
  }

  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace video_split
