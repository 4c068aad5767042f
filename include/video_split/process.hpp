/**
 * @file process.hpp
 * @brief Blocking execution of an external tool
 *
 * @details Runs a program from an argument vector with fork/execvp (no shell,
 *          so paths need no quoting), merges its stdout and stderr into one
 *          captured buffer, and optionally kills it after a timeout.
 *
 * @note Linux/POSIX only. The child is owned by the caller until it has been
 *       reaped; no handle outlives run_process().
 */

#ifndef VIDEO_SPLIT_PROCESS_HPP
#define VIDEO_SPLIT_PROCESS_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace video_split {

/// Exit status used by the child when execvp itself fails
constexpr int EXEC_FAILED_STATUS = 127;

/**
 * @struct ProcessOptions
 * @brief Limits applied to one invocation.
 */
struct ProcessOptions {
  double timeout_sec = 0.0;         //< Kill after this long (0 = never)
  size_t max_output_bytes = 65536;  //< Keep only the tail of the output
};

/**
 * @struct ProcessResult
 * @brief Outcome of one invocation.
 */
struct ProcessResult {
  int exit_code = -1;      //< Exit status if the child exited normally
  int term_signal = 0;     //< Signal number if the child was killed
  bool timed_out = false;  //< True if the timeout fired
  std::string output;      //< Tail of combined stdout/stderr

  bool succeeded() const {
    return exit_code == 0 && term_signal == 0 && !timed_out;
  }
};

/**
 * @brief Run `argv` to completion.
 *
 * @param argv Program and arguments; argv[0] is resolved through PATH
 * @param options Timeout and output limits
 * @param result Output: exit status and captured output
 * @param error Output: reason if the process could not be started or its
 *        output could not be read
 * @return true if the child was started, supervised and reaped (whatever its
 *         status), false otherwise. A child that outlives the timeout after
 *         closing its output is still killed and reported as timed out.
 */
bool run_process(const std::vector<std::string> &argv,
                 const ProcessOptions &options, ProcessResult &result,
                 std::string &error);

/**
 * @brief Render an argument vector as a shell-like line for logs.
 * @note Arguments containing spaces or quotes are single-quoted.
 */
std::string format_command_line(const std::vector<std::string> &argv);

/**
 * @brief Describe a finished process, e.g. "exit code 1" or "killed by
 *        signal 9".
 */
std::string describe_status(const ProcessResult &result);

} // namespace video_split

#endif // VIDEO_SPLIT_PROCESS_HPP
