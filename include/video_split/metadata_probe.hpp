/**
 * @file metadata_probe.hpp
 * @brief Video metadata extraction with libavformat
 *
 * @details The MetadataProbe class opens a media file, selects the best video
 *          stream and reads frame rate, bit rate, resolution and duration.
 *          It is used both for the source file and for re-probing a produced
 *          segment during verification.
 *
 */

#ifndef VIDEO_SPLIT_METADATA_PROBE_HPP
#define VIDEO_SPLIT_METADATA_PROBE_HPP

extern "C" {
#include <libavformat/avformat.h>
}

#include <cstdint>
#include <string>

#include "types.hpp"

namespace video_split {

/**
 * @brief Where the probe may look when the stream carries no bit rate.
 */
enum class BitRateFallback {
  /// Stream bit rate, then BPS tag, then container, then the configured
  /// default. Used for the source file.
  ContainerThenDefault,
  /// Stream bit rate, then BPS tag, else 0. Used for verification so a
  /// missing value is reported rather than papered over.
  StreamOnly
};

/**
 * @class MetadataProbe
 * @brief Reads stream properties from a media file.
 *
 * @attention
 * `MANAGEMENT`:
 *
 *            - Owns the AVFormatContext for its lifetime
 *
 *            - Destructor handles partial initialization failures
 *
 *            - No decoder is opened; only container and codec parameters
 *              are read
 */
class MetadataProbe {
  AVFormatContext *fmt_ctx = nullptr;
  int video_stream_idx = -1;
  std::string path_;

public:
  explicit MetadataProbe(std::string path);
  ~MetadataProbe();

  /// Disable copy (FFmpeg contexts are not copyable)
  MetadataProbe(const MetadataProbe &) = delete;
  MetadataProbe &operator=(const MetadataProbe &) = delete;

  /**
   * @brief Open the file and locate the best video stream.
   * @param error Output: reason on failure
   * @return true on success, false on failure
   */
  bool initialize(std::string &error);

  /**
   * @brief Container duration in seconds (0 if unknown).
   */
  double get_duration() const;

  /**
   * @brief Frame rate: avg_frame_rate, else r_frame_rate, else 30.
   */
  double get_fps() const;

  /**
   * @brief Video bit rate in bits/second following `fallback`.
   * @param used_default Output: true if the configured default was applied
   */
  int64_t get_bit_rate(BitRateFallback fallback, bool &used_default) const;

  int get_width() const;
  int get_height() const;
};

/**
 * @brief Probe a file and fill `out`.
 *
 * @param path Media file to probe
 * @param fallback Bit rate lookup policy
 * @param out Output: probed metadata
 * @param error Output: ProbeError with the reason on failure
 * @return true on success, false on failure
 */
bool probe_video(const std::string &path, BitRateFallback fallback,
                 VideoMetadata &out, Error &error);

} // namespace video_split

#endif // VIDEO_SPLIT_METADATA_PROBE_HPP
