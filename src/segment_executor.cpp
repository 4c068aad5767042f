/**
 * @file segment_executor.cpp
 * @brief Sequential per-segment encoding implementation
 */

#include "video_split/segment_executor.hpp"

#include <chrono>
#include <filesystem>

#include <fmt/core.h>

#include "video_split/logging.hpp"

namespace video_split {

std::string part_output_path(const std::string &source_path,
                             const std::string &output_dir, int index) {
  std::filesystem::path src(source_path);
  std::string name =
      fmt::format("{}_part{:0{}d}{}", src.stem().string(), index,
                  PART_NUMBER_WIDTH, src.extension().string());
  return (std::filesystem::path(output_dir) / name).string();
}

SegmentExecutor::SegmentExecutor(EncodeBackend &backend,
                                 const std::atomic<bool> *cancel)
    : backend_(backend), cancel_(cancel) {}

bool SegmentExecutor::execute(const std::vector<SegmentRange> &ranges,
                              const EncoderPlan &plan,
                              const std::string &source_path,
                              const std::string &output_dir,
                              std::vector<std::string> &outputs, Error &error) {
  outputs.clear();
  if (ranges.empty()) {
    LOG_WARN("No segments to encode");
    return true;
  }
  outputs.reserve(ranges.size());

  const size_t total = ranges.size();
  for (const auto &range : ranges) {
    if (cancelled()) {
      error.code = ErrorCode::Cancelled;
      error.segment_index = range.index;
      error.message = fmt::format("cancelled before segment {}/{}", range.index,
                                  total);
      return false;
    }

    EncodeJob job{source_path,
                  part_output_path(source_path, output_dir, range.index), range,
                  &plan};

    LOG_INFO("Creating segment {}/{}: {} (start {:.2f}s, length {:.2f}s)",
             range.index, total,
             std::filesystem::path(job.output_path).filename().string(),
             range.start_seconds, range.duration_seconds);

    auto start = std::chrono::steady_clock::now();
    EncodeResult result = backend_.encode(job);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  std::chrono::steady_clock::now() - start)
                  .count();
    TimingCollector::record(fmt::format("  segment {:0{}d}", range.index,
                                        PART_NUMBER_WIDTH),
                            us);

    if (!result.success) {
      /// An interrupted encoder fails too; report the interruption instead
      error.code = cancelled() ? ErrorCode::Cancelled : ErrorCode::EncodeFailure;
      error.segment_index = range.index;
      error.message = fmt::format(
          "segment {}/{} [{:.3f}s +{:.3f}s, {} {} @ {} bps] failed: {}\n"
          "  command: {}\n{}",
          range.index, total, range.start_seconds, range.duration_seconds,
          plan.codec, rate_control_name(plan.mode),
          plan.rate_control.target_bit_rate, result.status,
          result.command_line, result.diagnostics);
      return false;
    }

    outputs.push_back(job.output_path);
  }
  return true;
}

} // namespace video_split
