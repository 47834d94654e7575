/**
 * @file ffmpeg_executor.hpp
 * @brief Lossless clip extraction through an external ffmpeg process
 *
 * @details Separate module so that the job model never launches processes
 *          itself:
 *
 *          - ClipExtractor is the seam Video::run_clips() talks to
 *
 *          - FFmpegExtractor implements it with a stream-copying ffmpeg run
 */

#ifndef CLIP_JOB_FFMPEG_EXECUTOR_HPP
#define CLIP_JOB_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace clip_job {

/**
 * @class ClipExtractor
 * @brief Produces one clip file per request.
 */
class ClipExtractor {
public:
  virtual ~ClipExtractor() = default;

  /**
   * @brief Write the requested clip.
   * @note A destination that already exists counts as done.
   * @throws ExecutionFailure if the clip could not be produced
   */
  virtual void extract(const ExtractionRequest &request) = 0;
};

/**
 * @class FFmpegExtractor
 * @brief ClipExtractor that stream-copies with ffmpeg (no re-encoding).
 */
class FFmpegExtractor : public ClipExtractor {
public:
  /**
   * @param binary ffmpeg executable (name on PATH or absolute path)
   */
  explicit FFmpegExtractor(std::string binary);

  void extract(const ExtractionRequest &request) override;

private:
  std::string binary_;
};

/**
 * @brief Build the ffmpeg argument list for one extraction.
 * @note Seeks before -i for fast input seeking, copies audio and video
 *       streams, and passes -n so an existing output is never overwritten.
 */
std::vector<std::string> build_ffmpeg_args(const std::string &binary,
                                           const ExtractionRequest &request);

/**
 * @brief Quote one argument for /bin/sh.
 */
std::string shell_quote(const std::string &arg);

/**
 * @brief Execute ffmpeg for one extraction.
 *
 * @param binary ffmpeg executable
 * @param request Extraction to perform
 * @return 0 on success (or existing destination), exit status on failure,
 *         -1 if the process could not be started
 */
int execute_ffmpeg_clip(const std::string &binary,
                        const ExtractionRequest &request);

} // namespace clip_job

#endif // CLIP_JOB_FFMPEG_EXECUTOR_HPP
