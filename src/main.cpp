/**
 * @file main.cpp
 * @brief Entry point for Video Split
 *
 * @details Parses the command line, installs the cancellation handlers and
 *          runs one SplitPipeline.
 *
 * @note Tunables (ffmpeg path, encoders, presets, timeout, verification
 *       tolerances) come from environment variables; see
 *       config/video_split.env.
 */

#include <cstdio>
#include <exception>
#include <string>
#include <utility>

#include "video_split/cli.hpp"
#include "video_split/logging.hpp"
#include "video_split/pipeline.hpp"
#include "video_split/system.hpp"

using namespace video_split;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  RunRequest request;
  std::string error;
  if (!parse_arguments(argc, argv, request, error)) {
    LOG_ERROR("{}", error);
    LOG_WARN("{}", usage());
    return 1;
  }

  if (!install_cancel_handlers()) {
    LOG_WARN("Could not install signal handlers; Ctrl-C will not stop "
             "between segments");
  }

  LOG_INFO("Video Split");
  LOG_INFO("Input: {}", request.input_path);

  try {
    SplitPipeline pipeline(std::move(request), &cancel_flag());
    return pipeline.run();
  } catch (const std::exception &e) {
    /// Config accessors throw std::invalid_argument on malformed variables
    LOG_ERROR("{}", e.what());
    return 1;
  }
}
