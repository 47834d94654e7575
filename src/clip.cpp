/**
 * @file clip.cpp
 * @brief Clip decoding and output filename derivation
 */

#include "clip_job/clip.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <fmt/core.h>

#include "clip_job/document.hpp"
#include "clip_job/errors.hpp"
#include "clip_job/text.hpp"
#include "clip_job/time_grammar.hpp"

namespace clip_job {

namespace {

/// strftime format of the date segment in clip filenames
constexpr const char *CLIP_DATE_FORMAT = "%Y-%m-%d %H:%M:%S";

} // anonymous namespace

Clip::Clip(Duration start, Duration end, std::string title)
    : start_(start), end_(end), title_(trim(title)) {
  if (end_ <= start_) {
    throw ValidationError(fmt::format(
        "bad clip start/end: {} - {} ('{}')", format_duration_for_path(start_),
        format_duration_for_path(end_), title_));
  }
  if (title_.empty()) {
    throw ValidationError("bad clip title: title cannot be empty");
  }
}

Clip Clip::from_untyped(const YAML::Node &node) {
  require_map(node, "clip");
  std::string time = require_string(node, "time", "clip");
  std::string title = require_string(node, "title", "clip");

  size_t dash = time.find('-');
  if (dash == std::string::npos) {
    throw ValidationError(fmt::format(
        "bad clip time '{}': expected '<start> - <end>'", time));
  }

  Duration start, end;
  try {
    start = parse_duration(time.substr(0, dash));
    end = parse_duration(time.substr(dash + 1));
  } catch (const ParseError &e) {
    throw ValidationError(
        fmt::format("bad clip time '{}': {}", time, e.what()));
  }

  try {
    return Clip(start, end, std::move(title));
  } catch (const ValidationError &e) {
    throw ValidationError(fmt::format("{}: {}", e.what(), describe(node)));
  }
}

std::string Clip::destination_filename(const ResolvedConfig &config,
                                       DateTime video_date,
                                       Duration video_epoch,
                                       const std::string &video_title) const {
  std::string name = fmt::format(
      "{} - T+{} - {} - {}",
      format_timestamp(shift_timestamp(video_date, video_epoch),
                       CLIP_DATE_FORMAT),
      format_duration_for_path(start_ - video_epoch), video_title, title_);

  /// Built-in sanitization first, user rules second
  name = to_lower(name);
  std::replace_if(
      name.begin(), name.end(),
      [](char c) {
        return c != '\0' && std::strchr(FORBIDDEN_FILENAME_CHARS, c);
      },
      '-');
  name = config.filename_replace.apply(std::move(name));

  return with_extension(name, config.output_ext);
}

std::string with_extension(const std::string &name, const std::string &ext) {
  if (ext.empty() || ext[0] == '.')
    return name + ext;
  return name + "." + ext;
}

} // namespace clip_job
