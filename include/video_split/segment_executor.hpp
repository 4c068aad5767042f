/**
 * @file segment_executor.hpp
 * @brief Sequential per-segment encoding
 *
 * @details SegmentExecutor walks the planned ranges in index order and asks
 *          an EncodeBackend to produce one output file per range:
 *
 *          - Output names are `<basename>_part<NNN><ext>` inside the output
 *            directory, NNN being the 1-based index padded to 3 digits
 *
 *          - Exactly one encode runs at a time; the next starts only after
 *            the previous one returned
 *
 *          - The first failed segment stops the run. Parts already written
 *            stay on disk and nothing is retried
 *
 *          - A cancellation flag is checked before every segment
 */

#ifndef VIDEO_SPLIT_SEGMENT_EXECUTOR_HPP
#define VIDEO_SPLIT_SEGMENT_EXECUTOR_HPP

#include <atomic>
#include <string>
#include <vector>

#include "types.hpp"

namespace video_split {

/**
 * @struct EncodeJob
 * @brief Everything needed to produce one segment.
 */
struct EncodeJob {
  std::string input_path;  //< Source video
  std::string output_path; //< File to create
  SegmentRange range;      //< Time range within the source
  const EncoderPlan *plan; //< Shared plan (not owned)
};

/**
 * @struct EncodeResult
 * @brief Outcome of one encode, with enough context to reproduce it.
 */
struct EncodeResult {
  bool success = false;
  std::string command_line; //< Invocation used
  std::string status;       //< e.g. "exit code 1", "timed out"
  std::string diagnostics;  //< Tail of the encoder's output
};

/**
 * @class EncodeBackend
 * @brief Produces exactly one output file for one EncodeJob.
 * @note Implementations block until the file is written or the encode
 *       failed.
 */
class EncodeBackend {
public:
  virtual ~EncodeBackend() = default;

  virtual EncodeResult encode(const EncodeJob &job) = 0;
};

/**
 * @brief Path of part `index` for `source_path` inside `output_dir`.
 * @return `<output_dir>/<stem>_part<NNN><ext>`
 */
std::string part_output_path(const std::string &source_path,
                             const std::string &output_dir, int index);

class SegmentExecutor {
public:
  /**
   * @param backend Encoder used for every segment (not owned)
   * @param cancel Optional flag checked between segments (not owned)
   */
  explicit SegmentExecutor(EncodeBackend &backend,
                           const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Encode every range in order.
   *
   * @param ranges Planned ranges, in index order
   * @param plan Encoder plan shared by all segments
   * @param source_path Source video
   * @param output_dir Existing output directory
   * @param outputs Output: paths written so far, in order (cleared first).
   *        On failure it holds the parts completed before the failing one.
   * @param error Output: EncodeFailure (with segment index) or Cancelled
   * @return true if every range was encoded
   */
  bool execute(const std::vector<SegmentRange> &ranges,
               const EncoderPlan &plan, const std::string &source_path,
               const std::string &output_dir, std::vector<std::string> &outputs,
               Error &error);

private:
  EncodeBackend &backend_;
  const std::atomic<bool> *cancel_;

  bool cancelled() const { return cancel_ && cancel_->load(); }
};

} // namespace video_split

#endif // VIDEO_SPLIT_SEGMENT_EXECUTOR_HPP
