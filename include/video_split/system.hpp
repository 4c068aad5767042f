/**
 * @file system.hpp
 * @brief Process-level utilities and formatting helpers
 *
 * @details Provides:
 *
 *          - SIGINT/SIGTERM handling that raises a cancellation flag
 *
 *          - Output directory derivation and creation
 *
 *          - Time and bit rate formatting utilities
 *
 * @note Signal handling uses sigaction which is POSIX-specific.
 */

#ifndef VIDEO_SPLIT_SYSTEM_HPP
#define VIDEO_SPLIT_SYSTEM_HPP

#include <atomic>
#include <cstdint>
#include <string>

namespace video_split {

// **---- Cancellation ----**

/**
 * @brief Flag raised by the SIGINT/SIGTERM handler.
 * @note The executor checks it between segments; a running encode is
 *       never interrupted by the flag itself.
 */
std::atomic<bool> &cancel_flag();

/**
 * @brief Install SIGINT and SIGTERM handlers that set cancel_flag().
 * @return true if both handlers were installed
 */
bool install_cancel_handlers();

// **---- Output Layout ----**

/**
 * @brief Directory that receives the parts of `input_path`.
 * @return `<dir of input>/<stem>_parts` with the input made absolute
 */
std::string output_dir_for(const std::string &input_path);

/**
 * @brief Create `dir` and any missing parents.
 * @param error Output: reason on failure
 * @return true if the directory exists afterwards
 */
bool ensure_directory(const std::string &dir, std::string &error);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a bit rate as megabits per second, e.g. "8.50 Mbps".
 */
std::string format_mbps(int64_t bits_per_second);

} // namespace video_split

#endif // VIDEO_SPLIT_SYSTEM_HPP
