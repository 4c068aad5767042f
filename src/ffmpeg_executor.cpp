/**
 * @file ffmpeg_executor.cpp
 * @brief ffmpeg invocation implementation
 */

#include "video_split/ffmpeg_executor.hpp"

#include <utility>

#include <fmt/core.h>

#include "video_split/logging.hpp"
#include "video_split/process.hpp"

namespace video_split {

namespace {

/// Rate-control flags for the plan's mode and encoder
void append_rate_control(const EncoderPlan &plan,
                         std::vector<std::string> &args) {
  const RateControlParams &rc = plan.rate_control;

  args.insert(args.end(), {"-b:v", std::to_string(rc.target_bit_rate)});
  if (rc.max_rate)
    args.insert(args.end(), {"-maxrate", std::to_string(*rc.max_rate)});
  if (rc.min_rate)
    args.insert(args.end(), {"-minrate", std::to_string(*rc.min_rate)});
  if (rc.buffer_size)
    args.insert(args.end(), {"-bufsize", std::to_string(*rc.buffer_size)});

  /// x264-private options; hardware encoders reject them
  if (!plan.use_hardware && (rc.strict_hrd || rc.constant_frame_rate)) {
    std::string params;
    if (rc.strict_hrd)
      params += "nal-hrd=cbr:";
    if (rc.constant_frame_rate)
      params += "force-cfr=1:";
    params += fmt::format("bitrate={}", rc.target_bit_rate / 1000);
    args.insert(args.end(), {"-x264-params", params});
  }

  if (rc.preset)
    args.insert(args.end(), {"-preset", *rc.preset});
}

} // anonymous namespace

std::string format_seconds(double value) {
  /// ffmpeg's time parser rejects exponent notation; microseconds is its
  /// resolution
  std::string out = fmt::format("{:.6f}", value);
  size_t last = out.find_last_not_of('0');
  if (out[last] == '.')
    --last;
  out.erase(last + 1);
  return out;
}

std::vector<std::string> build_encode_args(const std::string &ffmpeg_bin,
                                           const EncodeJob &job) {
  const EncoderPlan &plan = *job.plan;

  std::vector<std::string> args = {ffmpeg_bin, "-y", "-hide_banner",
                                   "-loglevel", "error"};

  /// -ss/-t after -i: decode-and-discard seeking, slower but closer cuts
  args.insert(args.end(),
              {"-i", job.input_path, "-ss",
               format_seconds(job.range.start_seconds), "-t",
               format_seconds(job.range.duration_seconds)});

  args.insert(args.end(), {"-c:v", plan.codec});

  if (plan.target_frame_rate)
    args.insert(args.end(), {"-r", format_seconds(*plan.target_frame_rate)});

  if (plan.width > 0 && plan.height > 0)
    args.insert(args.end(),
                {"-vf", fmt::format("scale={}:{}", plan.width, plan.height)});

  append_rate_control(plan, args);

  /// Audio is never re-encoded
  args.insert(args.end(), {"-c:a", "copy", "-avoid_negative_ts", "make_zero",
                           job.output_path});
  return args;
}

FFmpegEncodeBackend::FFmpegEncodeBackend(std::string ffmpeg_bin,
                                         double timeout_sec,
                                         size_t diagnostic_bytes)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), timeout_sec_(timeout_sec),
      diagnostic_bytes_(diagnostic_bytes) {}

EncodeResult FFmpegEncodeBackend::encode(const EncodeJob &job) {
  std::vector<std::string> args = build_encode_args(ffmpeg_bin_, job);

  EncodeResult out;
  out.command_line = format_command_line(args);

  ProcessOptions opts;
  opts.timeout_sec = timeout_sec_;
  opts.max_output_bytes = diagnostic_bytes_;

  ProcessResult result;
  std::string error;
  if (!run_process(args, opts, result, error)) {
    out.status = fmt::format("could not start {}: {}", ffmpeg_bin_, error);
    return out;
  }

  out.success = result.succeeded();
  out.status = describe_status(result);
  out.diagnostics = std::move(result.output);

  if (out.success && !out.diagnostics.empty()) {
    /// -loglevel error: anything printed on success is still worth seeing
    LOG_WARN("ffmpeg reported for segment {}: {}", job.range.index,
             out.diagnostics);
  }
  return out;
}

} // namespace video_split
