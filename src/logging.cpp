/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 */

#include "video_split/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace video_split {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Per-segment rows are indented under the phase that contains them
  long segment_us = 0;
  int segments = 0;
  for (const auto &e : entries) {
    if (e.name.rfind("  ", 0) == 0) {
      segment_us += e.microseconds;
      ++segments;
    }
  }

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds,
               e.microseconds / 1000000.0);
  }
  if (segments > 0) {
    long avg_us = segment_us / segments;
    fmt::print("{:-<30} {:-<20}\n", "", "");
    fmt::print("{:<30} {:>10} [{:.2f}s]\n",
               fmt::format("avg of {} segments", segments), avg_us,
               avg_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace video_split
