/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "clip_job/ffmpeg_executor.hpp"

#include <cstdlib>
#include <filesystem>
#include <utility>

#include <sys/wait.h>

#include <fmt/core.h>

#include "clip_job/errors.hpp"
#include "clip_job/logging.hpp"

namespace clip_job {

namespace fs = std::filesystem;

std::vector<std::string> build_ffmpeg_args(const std::string &binary,
                                           const ExtractionRequest &request) {
  return {
      binary,
      "-hide_banner",
      "-loglevel",
      "error",
      "-n",
      "-ss",
      std::to_string(request.start.count()),
      "-i",
      request.source.string(),
      "-c:a",
      "copy",
      "-c:v",
      "copy",
      "-map",
      "0:v",
      "-map",
      "0:a",
      "-t",
      std::to_string(request.duration.count()),
      request.destination.string(),
  };
}

std::string shell_quote(const std::string &arg) {
  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

int execute_ffmpeg_clip(const std::string &binary,
                        const ExtractionRequest &request) {
  if (fs::exists(request.destination)) {
    LOG_INFO("Skipping existing output: {}", request.destination.string());
    return 0;
  }

  /// Build the command line with every argument quoted
  std::string cmd;
  for (const auto &arg : build_ffmpeg_args(binary, request)) {
    if (!cmd.empty())
      cmd += ' ';
    cmd += shell_quote(arg);
  }

  LOG_INFO("Extracting {}s from {}s: {}", request.duration.count(),
           request.start.count(), request.destination.filename().string());

  int status = std::system(cmd.c_str());
  if (status == -1) {
    LOG_ERROR("Failed to start {}", binary);
    return -1;
  }
  if (!WIFEXITED(status)) {
    LOG_ERROR("FFmpeg terminated abnormally (status {})", status);
    return status;
  }

  int exit_code = WEXITSTATUS(status);
  if (exit_code != 0) {
    LOG_ERROR("FFmpeg failed with status {}", exit_code);
  }
  return exit_code;
}

FFmpegExtractor::FFmpegExtractor(std::string binary)
    : binary_(std::move(binary)) {}

void FFmpegExtractor::extract(const ExtractionRequest &request) {
  int status = execute_ffmpeg_clip(binary_, request);
  if (status != 0) {
    throw ExecutionFailure(status, request.destination);
  }
}

} // namespace clip_job
