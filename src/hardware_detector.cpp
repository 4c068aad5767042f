/**
 * @file hardware_detector.cpp
 * @brief Hardware encoder detection implementation
 */

#include "video_split/hardware_detector.hpp"

#include <sstream>
#include <utility>
#include <vector>

#include "video_split/logging.hpp"
#include "video_split/process.hpp"

namespace video_split {

/// Seconds allowed for `ffmpeg -encoders`; it never encodes anything
constexpr double ENCODER_QUERY_TIMEOUT_SEC = 15.0;

bool encoder_listed(const std::string &encoders_output,
                    const std::string &encoder) {
  if (encoder.empty())
    return false;

  /// Encoder lines look like " V....D h264_videotoolbox    VideoToolbox ..."
  std::istringstream in(encoders_output);
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string flags, name;
    if (!(fields >> flags >> name))
      continue;
    if (name == encoder)
      return true;
  }
  return false;
}

HardwareCapabilityDetector::HardwareCapabilityDetector(std::string ffmpeg_bin,
                                                       std::string encoder,
                                                       bool force_software)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), encoder_(std::move(encoder)),
      force_software_(force_software) {}

bool HardwareCapabilityDetector::available() {
  if (!cached_) {
    cached_ = force_software_ ? false : probe();
  }
  return *cached_;
}

bool HardwareCapabilityDetector::probe() const {
  std::vector<std::string> argv = {ffmpeg_bin_, "-hide_banner", "-encoders"};

  ProcessOptions opts;
  opts.timeout_sec = ENCODER_QUERY_TIMEOUT_SEC;
  opts.max_output_bytes = 0; /// Keep the full encoder list

  ProcessResult result;
  std::string error;
  if (!run_process(argv, opts, result, error)) {
    LOG_WARN("Could not query encoders from {}: {}", ffmpeg_bin_, error);
    return false;
  }
  if (!result.succeeded()) {
    LOG_WARN("{} -encoders failed ({})", ffmpeg_bin_, describe_status(result));
    return false;
  }
  return encoder_listed(result.output, encoder_);
}

} // namespace video_split
