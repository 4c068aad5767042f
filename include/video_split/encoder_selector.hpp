/**
 * @file encoder_selector.hpp
 * @brief Encoder and rate-control selection
 *
 * @details Decision table:
 *
 *          | mode | hardware | encoder  | rate control                    |
 *          |------|----------|----------|---------------------------------|
 *          | CBR  | any      | software | b=min=max=src, buf=src/8,       |
 *          |      |          |          | nal-hrd=cbr, force-cfr, veryslow|
 *          | VBR  | yes      | hardware | average = src, no ceiling       |
 *          | VBR  | no       | software | average = src, buf=2*src, medium|
 *
 * @attention CBR never uses the hardware encoder. It cannot hold a strict
 *            constant rate, so hardware availability is ignored for CBR.
 *
 * @note Pure function of its inputs: no process is launched here, so the
 *       table is testable on any host.
 */

#ifndef VIDEO_SPLIT_ENCODER_SELECTOR_HPP
#define VIDEO_SPLIT_ENCODER_SELECTOR_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"

namespace video_split {

/**
 * @brief Build the encoder plan shared by every segment of a run.
 *
 * @param mode CBR or VBR
 * @param source_bit_rate Source video bit rate in bits/second (> 0)
 * @param hardware_available Result of hardware detection
 * @param target_frame_rate Requested output fps (nullopt = keep source)
 * @param source Probed source metadata (frame rate and resolution)
 * @param plan Output: the encoder plan
 * @param error Output: UnsupportedMode or InvalidIntent on failure
 * @return true on success, false on failure
 */
bool select_encoder_plan(RateControlMode mode, int64_t source_bit_rate,
                         bool hardware_available,
                         std::optional<double> target_frame_rate,
                         const VideoMetadata &source, EncoderPlan &plan,
                         Error &error);

/**
 * @brief Why the chosen encoder path was taken, for the job summary.
 * @return e.g. "Available (Forced Software for CBR)"
 */
const char *hardware_status(const EncoderPlan &plan, bool hardware_available);

} // namespace video_split

#endif // VIDEO_SPLIT_ENCODER_SELECTOR_HPP
