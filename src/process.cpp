/**
 * @file process.cpp
 * @brief External tool execution implementation
 *
 * @details fork/execvp with a single CLOEXEC pipe carrying the child's
 *          stdout and stderr. The parent drains the pipe with poll() so a
 *          chatty child never blocks on a full pipe, and enforces the
 *          timeout from the same loop.
 */

#include "video_split/process.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace video_split {

namespace {

/// Append `data` keeping at most `limit` trailing bytes
void append_tail(std::string &out, const char *data, size_t n, size_t limit) {
  out.append(data, n);
  if (limit > 0 && out.size() > limit) {
    out.erase(0, out.size() - limit);
  }
}

/// Child side of the fork: never returns
[[noreturn]] void exec_child(const std::vector<std::string> &argv,
                             int write_fd) {
  int devnull = open("/dev/null", O_RDONLY);
  if (devnull >= 0) {
    dup2(devnull, STDIN_FILENO);
    close(devnull);
  }
  dup2(write_fd, STDOUT_FILENO);
  dup2(write_fd, STDERR_FILENO);
  close(write_fd);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    args.push_back(const_cast<char *>(a.c_str()));
  }
  args.push_back(nullptr);

  execvp(args[0], args.data());

  /// Only reached on failure; report through the captured pipe
  const char *msg = std::strerror(errno);
  ssize_t ignored = write(STDERR_FILENO, "exec failed: ", 13);
  ignored = write(STDERR_FILENO, msg, std::strlen(msg));
  ignored = write(STDERR_FILENO, "\n", 1);
  (void)ignored;
  _exit(EXEC_FAILED_STATUS);
}

/// waitpid that retries on EINTR
pid_t wait_child(pid_t pid, int &status) {
  pid_t r;
  do {
    r = waitpid(pid, &status, 0);
  } while (r == -1 && errno == EINTR);
  return r;
}

/// Poll interval while waiting for a child that closed its output early
constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(20);

/// Reap `pid`, killing it if it is still running at `deadline`
template <typename TimePoint>
pid_t wait_child_until(pid_t pid, int &status, const TimePoint &deadline,
                       bool &timed_out) {
  for (;;) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r != 0) {
      if (r == -1 && errno == EINTR)
        continue;
      return r;
    }
    if (TimePoint::clock::now() >= deadline) {
      timed_out = true;
      kill(pid, SIGKILL);
      return wait_child(pid, status);
    }
    std::this_thread::sleep_for(REAP_POLL_INTERVAL);
  }
}

} // anonymous namespace

bool run_process(const std::vector<std::string> &argv,
                 const ProcessOptions &options, ProcessResult &result,
                 std::string &error) {
  result = ProcessResult{};

  if (argv.empty()) {
    error = "empty command";
    return false;
  }

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    error = fmt::format("pipe failed: {}", std::strerror(errno));
    return false;
  }

  pid_t pid = fork();
  if (pid == -1) {
    error = fmt::format("fork failed: {}", std::strerror(errno));
    close(fds[0]);
    close(fds[1]);
    return false;
  }

  if (pid == 0) {
    close(fds[0]);
    exec_child(argv, fds[1]);
  }

  close(fds[1]);

  using clock = std::chrono::steady_clock;
  const auto started = clock::now();
  const bool has_timeout = options.timeout_sec > 0.0;
  const auto deadline =
      started + std::chrono::duration_cast<clock::duration>(
                    std::chrono::duration<double>(options.timeout_sec));

  std::string poll_error;
  char buf[4096];
  struct pollfd pfd {};
  pfd.fd = fds[0];
  pfd.events = POLLIN;

  for (;;) {
    int wait_ms = -1;
    if (has_timeout) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                      deadline - clock::now())
                      .count();
      if (left <= 0) {
        result.timed_out = true;
        kill(pid, SIGKILL);
        break;
      }
      wait_ms = static_cast<int>(std::min<long long>(left, 1000));
    }

    int r = poll(&pfd, 1, wait_ms);
    if (r == -1) {
      if (errno == EINTR)
        continue;
      poll_error = fmt::format("poll failed: {}", std::strerror(errno));
      kill(pid, SIGKILL);
      break;
    }
    if (r == 0)
      continue;

    ssize_t n = read(fds[0], buf, sizeof(buf));
    if (n > 0) {
      append_tail(result.output, buf, static_cast<size_t>(n),
                  options.max_output_bytes);
    } else if (n == 0) {
      break; /// EOF: child closed its end (normally by exiting)
    } else if (errno != EINTR && errno != EAGAIN) {
      poll_error = fmt::format("read failed: {}", std::strerror(errno));
      kill(pid, SIGKILL);
      break;
    }
  }

  close(fds[0]);

  /// EOF only means the output was closed; the deadline still applies
  int status = 0;
  pid_t reaped = (has_timeout && !result.timed_out)
                     ? wait_child_until(pid, status, deadline, result.timed_out)
                     : wait_child(pid, status);
  if (reaped == -1) {
    error = fmt::format("waitpid failed: {}", std::strerror(errno));
    return false;
  }
  if (!poll_error.empty()) {
    error = poll_error;
    return false;
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }
  return true;
}

std::string format_command_line(const std::vector<std::string> &argv) {
  std::string line;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      line += ' ';
    const std::string &a = argv[i];
    if (a.empty() || a.find_first_of(" \t'\"\\$") != std::string::npos) {
      line += '\'';
      for (char c : a) {
        if (c == '\'')
          line += "'\\''";
        else
          line += c;
      }
      line += '\'';
    } else {
      line += a;
    }
  }
  return line;
}

std::string describe_status(const ProcessResult &result) {
  if (result.timed_out)
    return "timed out";
  if (result.term_signal != 0)
    return fmt::format("killed by signal {}", result.term_signal);
  if (result.exit_code == EXEC_FAILED_STATUS)
    return fmt::format("exit code {} (could not execute)", result.exit_code);
  return fmt::format("exit code {}", result.exit_code);
}

} // namespace video_split
