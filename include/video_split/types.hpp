/**
 * @file types.hpp
 * @brief Core data types for Video Split
 *
 * @details Contains the value types passed between the planning and
 *          execution stages:
 *
 *          - VideoMetadata probed from a source or output file
 *
 *          - SplitIntent (by count or by duration)
 *
 *          - SegmentRange for planned time ranges
 *
 *          - RateControlMode, RateControlParams and EncoderPlan
 *
 *          - VerificationResult
 *
 *          - Error for failure reporting
 */

#ifndef VIDEO_SPLIT_TYPES_HPP
#define VIDEO_SPLIT_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace video_split {

// **----- CONSTANTS -----**

/// Width of the zero-padded part number in output file names
constexpr int PART_NUMBER_WIDTH = 3;

/// Frame rate assumed when a stream reports neither avg nor real frame rate
constexpr double FALLBACK_FRAME_RATE = 30.0;

// **----- SOURCE METADATA -----**

/**
 * @struct VideoMetadata
 * @brief Properties of the best video stream of a media file.
 * @note Produced once by the probe and never mutated afterwards.
 */
struct VideoMetadata {
  double frame_rate = 0.0;       //< Frames per second
  int64_t bit_rate = 0;          //< Video bit rate in bits/second
  int width = 0;                 //< Frame width in pixels
  int height = 0;                //< Frame height in pixels
  double duration_seconds = 0.0; //< Container duration in seconds
};

// **----- SPLIT INTENT -----**

/**
 * @struct SplitIntent
 * @brief How the caller wants the source divided.
 * @note Exactly one of `count` / `seconds` is meaningful, selected by `kind`.
 *       Build with by_count() or by_duration().
 */
struct SplitIntent {
  enum class Kind { ByCount, ByDuration };

  Kind kind = Kind::ByCount;
  int count = 0;        //< Number of segments (ByCount)
  double seconds = 0.0; //< Seconds per segment (ByDuration)

  static SplitIntent by_count(int segments) {
    SplitIntent intent;
    intent.kind = Kind::ByCount;
    intent.count = segments;
    return intent;
  }

  static SplitIntent by_duration(double seconds) {
    SplitIntent intent;
    intent.kind = Kind::ByDuration;
    intent.seconds = seconds;
    return intent;
  }
};

/**
 * @struct SegmentRange
 * @brief One planned output segment.
 */
struct SegmentRange {
  int index;               //< 1-based segment number
  double start_seconds;    //< Offset into the source
  double duration_seconds; //< Length of the segment
};

// **----- ENCODER PLAN -----**

/// Output bit-rate policy, applied uniformly to every segment of a run
enum class RateControlMode { CBR, VBR };

/**
 * @struct RateControlParams
 * @brief Mode-specific rate-control settings.
 * @note Absent optionals are simply not passed to the encoder.
 */
struct RateControlParams {
  int64_t target_bit_rate = 0;        //< -b:v (average or constant target)
  std::optional<int64_t> min_rate;    //< -minrate
  std::optional<int64_t> max_rate;    //< -maxrate
  std::optional<int64_t> buffer_size; //< -bufsize (VBV buffer in bits)
  bool strict_hrd = false;            //< x264 nal-hrd=cbr
  bool constant_frame_rate = false;   //< x264 force-cfr=1
  std::optional<std::string> preset;  //< -preset
};

/**
 * @struct EncoderPlan
 * @brief Complete encoder configuration shared by all segments of a run.
 * @note Only the time range differs per segment. Audio is always
 *       stream-copied, so it has no settings here.
 */
struct EncoderPlan {
  RateControlMode mode = RateControlMode::CBR;
  std::string codec;        //< Encoder name passed to -c:v
  bool use_hardware = false; //< True when codec is the hardware encoder
  RateControlParams rate_control;
  std::optional<double> target_frame_rate; //< Absent = preserve source
  double source_frame_rate = 0.0;
  int width = 0;  //< Output width (source resolution is preserved)
  int height = 0; //< Output height

  /// Frame rate the output is expected to have
  double effective_frame_rate() const {
    return target_frame_rate ? *target_frame_rate : source_frame_rate;
  }
};

/**
 * @struct VerificationResult
 * @brief Measured properties of a produced segment vs. the plan targets.
 */
struct VerificationResult {
  std::string sample_path;
  double sampled_frame_rate = 0.0;
  int64_t sampled_bit_rate = 0;
  bool frame_rate_matches = false;
  bool bit_rate_matches = false;

  bool matches() const { return frame_rate_matches && bit_rate_matches; }
};

// **----- ERRORS -----**

enum class ErrorCode {
  None,
  ProbeError,      //< File unreadable or not a recognized container
  InvalidIntent,   //< Malformed segment count/duration or source duration
  UnsupportedMode, //< Unknown rate-control mode
  EncodeFailure,   //< External encoder failed for a segment
  Cancelled        //< Run stopped between segments on request
};

/**
 * @struct Error
 * @brief Failure description filled by operations that return false.
 */
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;
  int segment_index = 0; //< 1-based segment, 0 when not segment-specific

  explicit operator bool() const { return code != ErrorCode::None; }
};

/// Short name of an error code for log lines
const char *error_code_name(ErrorCode code);

/// "CBR" / "VBR"
const char *rate_control_name(RateControlMode mode);

} // namespace video_split

#endif // VIDEO_SPLIT_TYPES_HPP
