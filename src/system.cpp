/**
 * @file system.cpp
 * @brief Process-level utilities implementation
 */

#include "video_split/system.hpp"

#include <csignal>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

namespace video_split {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

std::atomic<bool> g_cancel{false};

/// Async-signal-safe: only touches a lock-free atomic
extern "C" void on_cancel_signal(int) { g_cancel.store(true); }

} // anonymous namespace

// **---- Cancellation ----**

std::atomic<bool> &cancel_flag() { return g_cancel; }

bool install_cancel_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_cancel_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  bool ok = (sigaction(SIGINT, &sa, nullptr) == 0);
  ok = (sigaction(SIGTERM, &sa, nullptr) == 0) && ok;
  return ok;
}

// **---- Output Layout ----**

std::string output_dir_for(const std::string &input_path) {
  fs::path abs = fs::absolute(input_path);
  fs::path parent = abs.parent_path();
  return (parent / (abs.stem().string() + "_parts")).string();
}

bool ensure_directory(const std::string &dir, std::string &error) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    error = ec.message();
    return false;
  }
  if (!fs::is_directory(dir, ec)) {
    error = "path exists and is not a directory";
    return false;
  }
  return true;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_mbps(int64_t bits_per_second) {
  return fmt::format("{:.2f} Mbps", bits_per_second / 1000000.0);
}

} // namespace video_split
