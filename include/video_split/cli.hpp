/**
 * @file cli.hpp
 * @brief Command-line argument parsing
 *
 * @details Positional syntax:
 *
 *          video_split <input> count <N>    [cbr|vbr] [fps]
 *
 *          video_split <input> duration <S> [cbr|vbr] [fps]
 */

#ifndef VIDEO_SPLIT_CLI_HPP
#define VIDEO_SPLIT_CLI_HPP

#include <string>

#include "pipeline.hpp"

namespace video_split {

/// One-line usage text
const char *usage();

/**
 * @brief Parse argv into a RunRequest.
 *
 * @param argc Argument count from main()
 * @param argv Argument vector from main()
 * @param request Output: parsed request
 * @param error Output: reason on failure
 * @return true on success, false on malformed arguments
 */
bool parse_arguments(int argc, const char *const argv[], RunRequest &request,
                     std::string &error);

} // namespace video_split

#endif // VIDEO_SPLIT_CLI_HPP
