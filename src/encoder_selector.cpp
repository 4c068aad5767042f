/**
 * @file encoder_selector.cpp
 * @brief Encoder and rate-control selection implementation
 */

#include "video_split/encoder_selector.hpp"

#include <utility>

#include <fmt/core.h>

#include "video_split/config.hpp"

namespace video_split {

namespace {

/// Strict constant rate: hold the source rate with a tight VBV buffer
RateControlParams cbr_params(int64_t bit_rate) {
  RateControlParams rc;
  rc.target_bit_rate = bit_rate;
  rc.min_rate = bit_rate;
  rc.max_rate = bit_rate;
  rc.buffer_size = bit_rate / 8;
  rc.strict_hrd = true;
  rc.constant_frame_rate = true;
  rc.preset = Config::cbr_preset();
  return rc;
}

/// Hardware average bit rate: target only, the encoder may exceed it
RateControlParams hw_vbr_params(int64_t bit_rate) {
  RateControlParams rc;
  rc.target_bit_rate = bit_rate;
  return rc;
}

/// Software ABR: same target-average semantics as the hardware path
RateControlParams sw_vbr_params(int64_t bit_rate) {
  RateControlParams rc;
  rc.target_bit_rate = bit_rate;
  rc.buffer_size = bit_rate * 2;
  rc.preset = Config::vbr_preset();
  return rc;
}

} // anonymous namespace

bool select_encoder_plan(RateControlMode mode, int64_t source_bit_rate,
                         bool hardware_available,
                         std::optional<double> target_frame_rate,
                         const VideoMetadata &source, EncoderPlan &plan,
                         Error &error) {
  if (source_bit_rate <= 0) {
    error.code = ErrorCode::InvalidIntent;
    error.message =
        fmt::format("source bit rate must be positive, got {}", source_bit_rate);
    return false;
  }

  EncoderPlan p;
  p.mode = mode;
  p.target_frame_rate = target_frame_rate;
  p.source_frame_rate = source.frame_rate;
  p.width = source.width;
  p.height = source.height;

  switch (mode) {
  case RateControlMode::CBR:
    p.codec = Config::sw_encoder();
    p.use_hardware = false;
    p.rate_control = cbr_params(source_bit_rate);
    break;

  case RateControlMode::VBR:
    if (hardware_available) {
      p.codec = Config::hw_encoder();
      p.use_hardware = true;
      p.rate_control = hw_vbr_params(source_bit_rate);
    } else {
      p.codec = Config::sw_encoder();
      p.use_hardware = false;
      p.rate_control = sw_vbr_params(source_bit_rate);
    }
    break;

  default:
    error.code = ErrorCode::UnsupportedMode;
    error.message = fmt::format("unsupported rate control mode {}",
                                static_cast<int>(mode));
    return false;
  }

  plan = std::move(p);
  return true;
}

const char *hardware_status(const EncoderPlan &plan, bool hardware_available) {
  if (!hardware_available)
    return "Not available";
  if (plan.use_hardware)
    return "Available (Used for VBR)";
  return "Available (Forced Software for CBR)";
}

} // namespace video_split
