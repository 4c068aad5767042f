/**
 * @file hardware_detector.hpp
 * @brief Detection of the hardware video encoder
 *
 * @details Asks the external encoder which encoders it was built with
 *          (`ffmpeg -hide_banner -encoders`) and looks for the configured
 *          hardware encoder name. The answer is computed once and cached for
 *          the lifetime of the detector, which is one run.
 *
 * @note Absence of hardware is a normal outcome. Launch failures and
 *       non-zero exits are logged and reported as "not available"; they never
 *       fail the run.
 */

#ifndef VIDEO_SPLIT_HARDWARE_DETECTOR_HPP
#define VIDEO_SPLIT_HARDWARE_DETECTOR_HPP

#include <optional>
#include <string>

namespace video_split {

/**
 * @brief True if `encoder` appears as an encoder name in the output of
 *        `ffmpeg -encoders`.
 * @note Matches the name column only, so "h264_videotoolbox" does not match
 *       "hevc_videotoolbox" or a description mentioning it.
 */
bool encoder_listed(const std::string &encoders_output,
                    const std::string &encoder);

class HardwareCapabilityDetector {
public:
  /**
   * @param ffmpeg_bin Encoder executable to query
   * @param encoder Hardware encoder name to look for
   * @param force_software Skip the probe and report "not available"
   */
  HardwareCapabilityDetector(std::string ffmpeg_bin, std::string encoder,
                             bool force_software = false);

  /**
   * @brief Whether the hardware encoder can be used.
   * @note First call runs the probe; later calls return the cached answer.
   */
  bool available();

  const std::string &encoder() const { return encoder_; }

private:
  std::string ffmpeg_bin_;
  std::string encoder_;
  bool force_software_;
  std::optional<bool> cached_;

  bool probe() const;
};

} // namespace video_split

#endif // VIDEO_SPLIT_HARDWARE_DETECTOR_HPP
