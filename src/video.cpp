/**
 * @file video.cpp
 * @brief Video decoding, source lookup and clip execution
 */

#include "clip_job/video.hpp"

#include <utility>

#include <fmt/core.h>

#include "clip_job/document.hpp"
#include "clip_job/errors.hpp"
#include "clip_job/logging.hpp"
#include "clip_job/time_grammar.hpp"

namespace clip_job {

namespace fs = std::filesystem;

Video::Video(DateTime date, std::string title, std::vector<Clip> clips,
             Duration epoch)
    : date_(date), title_(std::move(title)), clips_(std::move(clips)),
      epoch_(epoch) {}

Video Video::from_untyped(const YAML::Node &node) {
  require_map(node, "video");

  /// Shape of the clip list is checked before any clip is decoded
  const YAML::Node clips_node = node["clips"];
  if (clips_node && !clips_node.IsSequence()) {
    throw ValidationError(
        fmt::format("invalid clips: {}", describe(clips_node)));
  }
  if (clips_node) {
    for (const auto &clip : clips_node) {
      if (!clip.IsMap()) {
        throw ValidationError(
            fmt::format("invalid clips entry: {}", describe(clip)));
      }
    }
  }

  std::string date_text = require_string(node, "date", "video");
  std::string title = require_string(node, "title", "video");
  std::string epoch_text =
      optional_string(node, "epoch", "video").value_or("0");

  DateTime date;
  Duration epoch;
  try {
    date = parse_timestamp(date_text);
    epoch = parse_duration(epoch_text);
    shift_timestamp(date, epoch);
  } catch (const ParseError &e) {
    throw ValidationError(
        fmt::format("bad video data: {}: {}", e.what(), describe(node)));
  }

  std::vector<Clip> clips;
  if (clips_node) {
    clips.reserve(clips_node.size());
    for (const auto &clip : clips_node) {
      clips.push_back(Clip::from_untyped(clip));
    }
  }

  return Video(date, std::move(title), std::move(clips), epoch);
}

std::string Video::source_filename(const ResolvedConfig &config) const {
  std::string format =
      config.filename_replace.apply(config.video_filename_format);
  return with_extension(format_timestamp(date_, format), config.video_ext);
}

fs::path Video::source_path(const ResolvedConfig &config,
                            const fs::path &source_dir) const {
  fs::path path = source_dir / source_filename(config);
  if (!fs::is_regular_file(path)) {
    throw MissingFile("video file", path);
  }
  return path;
}

std::vector<ExtractionRequest>
Video::plan_clips(const ResolvedConfig &config, const fs::path &source_dir,
                  const fs::path &dest_dir) const {
  fs::path source = source_dir / source_filename(config);

  std::vector<ExtractionRequest> requests;
  requests.reserve(clips_.size());
  for (const auto &clip : clips_) {
    requests.push_back(
        {source, clip.start(), clip.length(),
         dest_dir / clip.destination_filename(config, date_, epoch_, title_)});
  }
  return requests;
}

RunTally Video::run_clips(const ResolvedConfig &config,
                          const fs::path &source_dir, const fs::path &dest_dir,
                          ClipExtractor &extractor) const {
  fs::path source = fs::absolute(source_path(config, source_dir));

  RunTally tally;
  for (const auto &clip : clips_) {
    std::string filename =
        clip.destination_filename(config, date_, epoch_, title_);
    fs::path destination = fs::absolute(dest_dir / filename);

    if (fs::exists(destination)) {
      LOG_INFO("Skipping existing output: {}", filename);
      ++tally.skipped;
      continue;
    }

    TIMER_START(extract);
    extractor.extract({source, clip.start(), clip.length(), destination});
    TIMER_END_AS(extract, filename);
    ++tally.written;
  }
  return tally;
}

} // namespace clip_job
