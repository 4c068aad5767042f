/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/video_split.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef VIDEO_SPLIT_CONFIG_HPP
#define VIDEO_SPLIT_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

namespace video_split {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a 64-bit integer value from environment variable.
 */
inline int64_t get_env_int64(const char *name, int64_t default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoll(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @note An empty variable counts as unset.
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- EXTERNAL TOOLS ----**

/// ffmpeg executable (resolved through PATH when not absolute)
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Hardware encoder looked up in `ffmpeg -encoders` and used for VBR
inline const std::string &hw_encoder() {
  static std::string val = get_env_string("HW_ENCODER", "h264_videotoolbox");
  return val;
}

/// Software encoder used for CBR and for VBR without hardware
inline const std::string &sw_encoder() {
  static std::string val = get_env_string("SW_ENCODER", "libx264");
  return val;
}

/**
 * @brief Skip hardware detection and always encode in software
 * @note Useful on hosts where the hardware encoder is listed but unusable
 */
inline bool force_software() {
  static bool val = (get_env_int("FORCE_SOFTWARE", 0) != 0);
  return val;
}

// **---- RATE CONTROL ----**

/// x264 preset for strict CBR (slowest = most accurate rate adherence)
inline const std::string &cbr_preset() {
  static std::string val = get_env_string("CBR_PRESET", "veryslow");
  return val;
}

/// x264 preset for software VBR (average bit rate mode)
inline const std::string &vbr_preset() {
  static std::string val = get_env_string("VBR_PRESET", "medium");
  return val;
}

/**
 * @brief Bit rate assumed when the source reports none (bits/second)
 * @note Applied only to the source probe, never to verification
 */
inline int64_t default_bit_rate() {
  static int64_t val = get_env_int64("DEFAULT_BIT_RATE", 2000000);
  return val;
}

// **---- EXECUTION ----**

/**
 * @brief Per-segment encode timeout in seconds (0 = wait forever)
 * @note A timed-out encoder is killed and the run stops at that segment
 */
inline double encode_timeout_sec() {
  static double val = get_env_double("ENCODE_TIMEOUT_SEC", 0.0);
  return val;
}

/// Bytes of encoder diagnostics kept for error reports
inline int diagnostic_tail_bytes() {
  static int val = get_env_int("DIAGNOSTIC_TAIL_BYTES", 2048);
  return val;
}

// **---- VERIFICATION ----**

/// Allowed absolute difference between sampled and target frame rate
inline double verify_fps_tolerance() {
  static double val = get_env_double("VERIFY_FPS_TOLERANCE", 0.05);
  return val;
}

/// Allowed relative difference between sampled and target bit rate (%)
inline double verify_bitrate_tolerance_pct() {
  static double val = get_env_double("VERIFY_BITRATE_TOLERANCE_PCT", 10.0);
  return val;
}

} // namespace Config
} // namespace video_split

#endif // VIDEO_SPLIT_CONFIG_HPP
