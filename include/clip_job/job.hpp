/**
 * @file job.hpp
 * @brief The full batch of videos and clips described by a job file
 *
 * @details A job file looks like:
 *
 *     video-dir: "/captures"          # optional, default from config
 *     output-dir: "/clips"            # optional, default from config
 *     videos:
 *       - date: "2020-01-01T00:00:00" # recording start
 *         epoch: "0"                  # optional display offset
 *         title: "video 1"
 *         clips:
 *           - time: "0 - 5:00"
 *             title: "first five minutes"
 *
 * @note Videos and clips run strictly in declared order, one at a time.
 */

#ifndef CLIP_JOB_JOB_HPP
#define CLIP_JOB_JOB_HPP

#include <filesystem>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "config.hpp"
#include "ffmpeg_executor.hpp"
#include "types.hpp"
#include "video.hpp"

namespace clip_job {

/**
 * @class Job
 * @brief Output directory, source directory and ordered videos.
 */
class Job {
public:
  Job(std::filesystem::path output_dir, std::filesystem::path video_dir,
      std::vector<Video> videos);

  /**
   * @brief Decode a job document.
   *
   * @param config Supplies output-dir and video-dir when the document omits
   *        them
   * @param node Root of the job document
   * @throws ValidationError when the document is not a mapping, `videos` is
   *         missing or not a list of mappings, or any video is invalid
   */
  static Job from_untyped(const ResolvedConfig &config, const YAML::Node &node);

  /**
   * @brief Load and decode a job file.
   * @throws MissingFile if the file cannot be opened
   * @throws ValidationError if it is not a valid job document
   */
  static Job from_yaml_file(const ResolvedConfig &config,
                            const std::filesystem::path &path);

  /**
   * @brief Write a starter job file with no videos.
   * @return true if written, false if a file already exists at path
   * @throws Error if the file cannot be written
   */
  static bool write_template(const ResolvedConfig &config,
                             const std::filesystem::path &path);

  const std::filesystem::path &output_dir() const { return output_dir_; }
  const std::filesystem::path &video_dir() const { return video_dir_; }
  const std::vector<Video> &videos() const { return videos_; }

  /**
   * @brief Every extraction the job would perform, in order.
   */
  std::vector<ExtractionRequest> plan(const ResolvedConfig &config) const;

  /**
   * @brief Run every video's clips in declared order.
   * @note Creates the output directory if missing. Fails fast.
   * @return Written and skipped counts over the whole job
   */
  RunTally run(const ResolvedConfig &config, ClipExtractor &extractor) const;

private:
  std::filesystem::path output_dir_;
  std::filesystem::path video_dir_;
  std::vector<Video> videos_;
};

} // namespace clip_job

#endif // CLIP_JOB_JOB_HPP
