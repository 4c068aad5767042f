/**
 * @file types.cpp
 * @brief Name lookups for enums in types.hpp
 */

#include "video_split/types.hpp"

namespace video_split {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::ProbeError:
    return "ProbeError";
  case ErrorCode::InvalidIntent:
    return "InvalidIntent";
  case ErrorCode::UnsupportedMode:
    return "UnsupportedMode";
  case ErrorCode::EncodeFailure:
    return "EncodeFailure";
  case ErrorCode::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

const char *rate_control_name(RateControlMode mode) {
  switch (mode) {
  case RateControlMode::CBR:
    return "CBR";
  case RateControlMode::VBR:
    return "VBR";
  }
  return "Unknown";
}

} // namespace video_split
