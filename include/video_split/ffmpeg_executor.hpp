/**
 * @file ffmpeg_executor.hpp
 * @brief ffmpeg invocation for segment encodes
 *
 * @details The only place that knows ffmpeg's flag syntax:
 *
 *          - build_encode_args() turns an EncodeJob into an argument vector
 *
 *          - FFmpegEncodeBackend runs that vector with run_process()
 */

#ifndef VIDEO_SPLIT_FFMPEG_EXECUTOR_HPP
#define VIDEO_SPLIT_FFMPEG_EXECUTOR_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "segment_executor.hpp"
#include "types.hpp"

namespace video_split {

/**
 * @brief Seconds in plain decimal notation for -ss/-t/-r.
 * @note Rounded to microseconds, trailing zeros dropped: 120 -> "120",
 *       5e-05 -> "0.00005".
 */
std::string format_seconds(double value);

/**
 * @brief Argument vector for encoding one segment.
 *
 * @param ffmpeg_bin Executable placed in argv[0]
 * @param job Source, output, range and plan
 * @return Full argv, ready for run_process()
 */
std::vector<std::string> build_encode_args(const std::string &ffmpeg_bin,
                                           const EncodeJob &job);

/**
 * @class FFmpegEncodeBackend
 * @brief EncodeBackend that runs the ffmpeg executable.
 */
class FFmpegEncodeBackend : public EncodeBackend {
public:
  /**
   * @param ffmpeg_bin Executable to run
   * @param timeout_sec Per-segment timeout (0 = none)
   * @param diagnostic_bytes Bytes of encoder output kept on failure
   */
  FFmpegEncodeBackend(std::string ffmpeg_bin, double timeout_sec,
                      size_t diagnostic_bytes);

  EncodeResult encode(const EncodeJob &job) override;

private:
  std::string ffmpeg_bin_;
  double timeout_sec_;
  size_t diagnostic_bytes_;
};

} // namespace video_split

#endif // VIDEO_SPLIT_FFMPEG_EXECUTOR_HPP
