/**
 * @file cli.cpp
 * @brief Command-line argument parsing implementation
 */

#include "video_split/cli.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace video_split {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Whole-string strtod; rejects trailing junk and non-finite values
bool parse_double(const std::string &s, double &out) {
  if (s.empty())
    return false;
  char *end = nullptr;
  out = std::strtod(s.c_str(), &end);
  return end == s.c_str() + s.size() && std::isfinite(out);
}

/// Whole-string strtol into an int
bool parse_int(const std::string &s, int &out) {
  if (s.empty())
    return false;
  char *end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (end != s.c_str() + s.size() || v < 1 || v > 1000000)
    return false;
  out = static_cast<int>(v);
  return true;
}

} // anonymous namespace

const char *usage() {
  return "Usage: video_split <input> (count <N> | duration <seconds>) "
         "[cbr|vbr] [fps]";
}

bool parse_arguments(int argc, const char *const argv[], RunRequest &request,
                     std::string &error) {
  if (argc < 4 || argc > 6) {
    error = "wrong number of arguments";
    return false;
  }

  RunRequest req;
  req.input_path = argv[1];

  const std::string by = lower(argv[2]);
  const std::string value = argv[3];
  if (by == "count") {
    int n = 0;
    if (!parse_int(value, n)) {
      error = fmt::format("segment count must be a positive integer, got '{}'",
                          value);
      return false;
    }
    req.intent = SplitIntent::by_count(n);
  } else if (by == "duration") {
    double d = 0.0;
    if (!parse_double(value, d) || d <= 0.0) {
      error = fmt::format("segment duration must be a positive number, got '{}'",
                          value);
      return false;
    }
    req.intent = SplitIntent::by_duration(d);
  } else {
    error = fmt::format("expected 'count' or 'duration', got '{}'", argv[2]);
    return false;
  }

  if (argc >= 5) {
    const std::string mode = lower(argv[4]);
    if (mode == "cbr") {
      req.mode = RateControlMode::CBR;
    } else if (mode == "vbr") {
      req.mode = RateControlMode::VBR;
    } else {
      error = fmt::format("rate control must be 'cbr' or 'vbr', got '{}'",
                          argv[4]);
      return false;
    }
  }

  if (argc == 6) {
    double fps = 0.0;
    if (!parse_double(argv[5], fps) || fps <= 0.0) {
      error = fmt::format("frame rate must be a positive number, got '{}'",
                          argv[5]);
      return false;
    }
    req.target_frame_rate = fps;
  }

  request = std::move(req);
  return true;
}

} // namespace video_split
