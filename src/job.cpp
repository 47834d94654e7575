/**
 * @file job.cpp
 * @brief Job decoding and sequential execution
 */

#include "clip_job/job.hpp"

#include <fstream>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "clip_job/document.hpp"
#include "clip_job/errors.hpp"
#include "clip_job/logging.hpp"
#include "clip_job/time_grammar.hpp"

namespace clip_job {

namespace fs = std::filesystem;

namespace {

/// Directory override from the job document, or the configured default
fs::path read_dir(const YAML::Node &node, const char *key,
                  const fs::path &fallback) {
  auto value = optional_string(node, key, "job");
  if (!value)
    return fallback;
  if (value->empty()) {
    throw ValidationError(fmt::format("bad job: '{}' cannot be empty", key));
  }
  return fs::path(*value);
}

} // anonymous namespace

Job::Job(fs::path output_dir, fs::path video_dir, std::vector<Video> videos)
    : output_dir_(std::move(output_dir)), video_dir_(std::move(video_dir)),
      videos_(std::move(videos)) {}

Job Job::from_untyped(const ResolvedConfig &config, const YAML::Node &node) {
  require_map(node, "job");

  const YAML::Node videos_node = node["videos"];
  if (!videos_node) {
    throw ValidationError("bad job: missing 'videos'");
  }
  if (!videos_node.IsSequence()) {
    throw ValidationError(
        fmt::format("invalid videos: {}", describe(videos_node)));
  }
  for (const auto &video : videos_node) {
    if (!video.IsMap()) {
      throw ValidationError(
          fmt::format("invalid video entry: {}", describe(video)));
    }
  }

  fs::path output_dir = read_dir(node, "output-dir", config.output_dir);
  fs::path video_dir = read_dir(node, "video-dir", config.video_dir);

  std::vector<Video> videos;
  videos.reserve(videos_node.size());
  for (const auto &video : videos_node) {
    videos.push_back(Video::from_untyped(video));
  }

  return Job(std::move(output_dir), std::move(video_dir), std::move(videos));
}

Job Job::from_yaml_file(const ResolvedConfig &config, const fs::path &path) {
  YAML::Node root = load_document(path, "job file");
  try {
    return from_untyped(config, root);
  } catch (const ValidationError &e) {
    throw ValidationError(fmt::format("{}: {}", path.string(), e.what()));
  }
}

bool Job::write_template(const ResolvedConfig &config, const fs::path &path) {
  if (fs::exists(path))
    return false;

  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "video-dir" << YAML::Value << config.video_dir.string();
  out << YAML::Key << "output-dir" << YAML::Value
      << config.output_dir.string();
  out << YAML::Key << "videos" << YAML::Value << YAML::Flow
      << YAML::BeginSeq << YAML::EndSeq;
  out << YAML::EndMap;

  std::ofstream file(path);
  if (!file) {
    throw Error(fmt::format("cannot write job file: {}", path.string()));
  }
  file << out.c_str() << "\n";
  if (!file) {
    throw Error(fmt::format("failed writing job file: {}", path.string()));
  }
  return true;
}

std::vector<ExtractionRequest> Job::plan(const ResolvedConfig &config) const {
  std::vector<ExtractionRequest> requests;
  for (const auto &video : videos_) {
    auto video_requests = video.plan_clips(config, video_dir_, output_dir_);
    requests.insert(requests.end(), video_requests.begin(),
                    video_requests.end());
  }
  return requests;
}

RunTally Job::run(const ResolvedConfig &config,
                  ClipExtractor &extractor) const {
  if (!fs::exists(output_dir_)) {
    LOG_INFO("Creating output directory: {}", output_dir_.string());
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
      throw Error(fmt::format("cannot create output directory {}: {}",
                              output_dir_.string(), ec.message()));
    }
  }

  RunTally total;
  size_t index = 0;
  for (const auto &video : videos_) {
    ++index;
    LOG_PHASE("[{}/{}] {} ({}, {} clips)", index, videos_.size(),
              video.title(), format_timestamp(video.date(), "%Y-%m-%d %H:%M:%S"),
              video.clips().size());
    total += video.run_clips(config, video_dir_, output_dir_, extractor);
  }
  return total;
}

} // namespace clip_job
