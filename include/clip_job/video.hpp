/**
 * @file video.hpp
 * @brief One source recording and the clips to cut from it
 */

#ifndef CLIP_JOB_VIDEO_HPP
#define CLIP_JOB_VIDEO_HPP

#include <filesystem>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "clip.hpp"
#include "config.hpp"
#include "ffmpeg_executor.hpp"
#include "types.hpp"

namespace clip_job {

/**
 * @class Video
 * @brief A recording identified by its start time, with ordered clips.
 *
 * @note The epoch only shifts the times shown in clip filenames; clip
 *       offsets are always relative to the start of the recording.
 */
class Video {
public:
  Video(DateTime date, std::string title, std::vector<Clip> clips,
        Duration epoch = Duration::zero());

  /**
   * @brief Decode a video from its job document entry.
   *
   * @note Requires `date` and `title`; `clips` (list of clip entries) and
   *       `epoch` (duration, default "0") are optional.
   * @throws ValidationError for missing or malformed fields, or any invalid
   *         clip
   */
  static Video from_untyped(const YAML::Node &node);

  DateTime date() const { return date_; }
  const std::string &title() const { return title_; }
  const std::vector<Clip> &clips() const { return clips_; }
  Duration epoch() const { return epoch_; }

  /**
   * @brief Expected filename of the source recording.
   * @note The replacement map rewrites the format string, not the resulting
   *       name, so locale-specific format tokens can be swapped.
   */
  std::string source_filename(const ResolvedConfig &config) const;

  /**
   * @brief Locate the source recording.
   * @param config Resolved configuration
   * @param source_dir Directory holding the recordings
   * @return Path of the recording
   * @throws MissingFile if the path is not a regular file
   */
  std::filesystem::path source_path(const ResolvedConfig &config,
                                    const std::filesystem::path &source_dir)
      const;

  /**
   * @brief Derive every extraction for this video without touching disk.
   */
  std::vector<ExtractionRequest>
  plan_clips(const ResolvedConfig &config,
             const std::filesystem::path &source_dir,
             const std::filesystem::path &dest_dir) const;

  /**
   * @brief Extract every clip in declared order.
   *
   * @note Destinations that already exist are skipped. The first failure
   *       aborts the remaining clips.
   *
   * @param config Resolved configuration
   * @param source_dir Directory holding the recordings
   * @param dest_dir Directory clips are written to
   * @param extractor Collaborator producing the clip files
   * @return Written and skipped counts
   * @throws MissingFile if the recording is absent
   * @throws ExecutionFailure if the extractor fails
   */
  RunTally run_clips(const ResolvedConfig &config,
                     const std::filesystem::path &source_dir,
                     const std::filesystem::path &dest_dir,
                     ClipExtractor &extractor) const;

private:
  DateTime date_;
  std::string title_;
  std::vector<Clip> clips_;
  Duration epoch_;
};

} // namespace clip_job

#endif // CLIP_JOB_VIDEO_HPP
