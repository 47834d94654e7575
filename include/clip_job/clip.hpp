/**
 * @file clip.hpp
 * @brief A single requested extraction from a source recording
 */

#ifndef CLIP_JOB_CLIP_HPP
#define CLIP_JOB_CLIP_HPP

#include <string>

#include <yaml-cpp/yaml.h>

#include "config.hpp"
#include "types.hpp"

namespace clip_job {

/**
 * @class Clip
 * @brief Start and end offsets into a source recording plus a title.
 *
 * @note Offsets are relative to the start of the recording. A Clip always
 *       satisfies end > start and has a non-empty title.
 */
class Clip {
public:
  /**
   * @brief Construct a validated clip.
   * @param start Offset of the first second to keep
   * @param end Offset where the clip stops
   * @param title Clip title, trimmed before storing
   * @throws ValidationError if end <= start or the title is blank
   */
  Clip(Duration start, Duration end, std::string title);

  /**
   * @brief Decode a clip from its job document entry.
   *
   * @note Expects `time: "<start> - <end>"` (split on the first '-') and a
   *       `title`.
   * @throws ValidationError when a field is missing or malformed or the
   *         clip is empty
   */
  static Clip from_untyped(const YAML::Node &node);

  Duration start() const { return start_; }
  Duration end() const { return end_; }
  Duration length() const { return end_ - start_; }
  const std::string &title() const { return title_; }

  /**
   * @brief Build the output filename for this clip.
   *
   * @attention ORDER:
   *
   *   1. Join "<date+epoch> - T+<start-epoch> - <video title> - <title>"
   *
   *   2. Lower-case the whole string
   *
   *   3. Replace each of " * / : ? \ | < > with '-'
   *
   *   4. Apply the configured replacement map
   *
   *   5. Append the configured output extension
   *
   * @param config Resolved configuration (replacements, output extension)
   * @param video_date Recording start of the owning video
   * @param video_epoch Display epoch of the owning video
   * @param video_title Title of the owning video
   * @return Filename without directory
   */
  std::string destination_filename(const ResolvedConfig &config,
                                   DateTime video_date, Duration video_epoch,
                                   const std::string &video_title) const;

private:
  Duration start_;
  Duration end_;
  std::string title_;
};

/// Characters never allowed in generated filenames
constexpr const char FORBIDDEN_FILENAME_CHARS[] = "\"*/:?\\|<>";

/**
 * @brief Append an extension to a filename, adding the '.' if needed.
 */
std::string with_extension(const std::string &name, const std::string &ext);

} // namespace clip_job

#endif // CLIP_JOB_CLIP_HPP
