/**
 * @file main.cpp
 * @brief Entry point for the clip_job application
 *
 * @details Main entry point that handles:
 *
 *          - Loading user preferences and resolving the command line
 *
 *          - help: print usage
 *
 *          - run: extract every clip of the job file with ffmpeg
 *
 *          - clip: create the job file if needed and print the clip plan
 *
 * @note Exit status is 0 on success, 1 when the job fails and 2 for
 *       command-line errors.
 */

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "clip_job/config.hpp"
#include "clip_job/env.hpp"
#include "clip_job/errors.hpp"
#include "clip_job/ffmpeg_executor.hpp"
#include "clip_job/job.hpp"
#include "clip_job/logging.hpp"
#include "clip_job/time_grammar.hpp"

using namespace clip_job;

namespace {

void print_usage(const std::string &program) {
  fmt::print(
      "Usage: {} [options] [clip|help|run]\n"
      "\n"
      "Subcommands:\n"
      "  clip   Create the job file if missing and print the clip plan\n"
      "  help   Show this message (default)\n"
      "  run    Extract every clip listed in the job file\n"
      "\n"
      "Options:\n"
      "  -h, --help                     Show this message\n"
      "  -i, --video-dir <path>         Directory holding source videos\n"
      "  -j, --job-path <path>          Job file (default clip.yaml)\n"
      "  -o, --output-dir <path>        Directory clips are written to\n"
      "  -r, --filename-replace <k=v>   Add a filename replacement; an empty\n"
      "                                 value resets to the preferences map,\n"
      "                                 ==value replaces '='\n"
      "      --output-ext <ext>         Output clip extension (default mkv)\n"
      "      --video-ext <ext>          Source video extension (default mkv)\n"
      "      --video-filename-format <fmt>\n"
      "                                 strftime format of source filenames\n"
      "\n"
      "Environment:\n"
      "  CLIP_JOB_PREFS    Preferences file ({})\n"
      "  CLIP_JOB_FFMPEG   ffmpeg executable ({})\n",
      program, Env::prefs_path().string(), Env::ffmpeg_binary());
}

// **---- SUBCOMMANDS ----**

int run_job(const ResolvedConfig &config) {
  LOG_INFO("clip_job - Run");
  LOG_INFO("Job file: {}", config.job_path.string());

  Job job = Job::from_yaml_file(config, config.job_path);
  LOG_INFO("Video directory: {}", job.video_dir().string());
  LOG_INFO("Output directory: {}", job.output_dir().string());
  LOG_INFO("Videos: {}", job.videos().size());

  FFmpegExtractor extractor(Env::ffmpeg_binary());
  RunTally tally = job.run(config, extractor);

  TimingCollector::print_summary();
  LOG_SUCCESS("Done: {} clips written, {} already present", tally.written,
              tally.skipped);
  return 0;
}

int add_clip(const ResolvedConfig &config) {
  if (Job::write_template(config, config.job_path)) {
    LOG_SUCCESS("Created job file: {}", config.job_path.string());
  }

  Job job = Job::from_yaml_file(config, config.job_path);
  auto plan = job.plan(config);

  LOG_PHASE("Job file: {} ({} videos, {} clips)", config.job_path.string(),
            job.videos().size(), plan.size());
  for (const auto &request : plan) {
    fmt::print("  {} [{} +{}s]\n    -> {}\n",
               request.source.filename().string(),
               format_duration_for_path(request.start),
               request.duration.count(), request.destination.string());
  }
  LOG_INFO("Add new clips under a video's 'clips' list in {}",
           config.job_path.string());
  return 0;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering so progress interleaves with ffmpeg output
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::vector<std::string> args(argv, argv + argc);
  std::string program = args.empty() ? "clip_job" : args[0];

  try {
    Preferences prefs = Preferences::load();

    ResolvedConfig config;
    try {
      config = ResolvedConfig::from_argv(args, prefs);
    } catch (const ValidationError &e) {
      LOG_ERROR("{}", e.what());
      LOG_WARN("Run '{} help' for usage", program);
      return 2;
    }

    switch (config.subcommand) {
    case Subcommand::ShowHelp:
      print_usage(program);
      return 0;
    case Subcommand::AddClip:
      return add_clip(config);
    case Subcommand::RunJob:
      return run_job(config);
    }
    return 0;
  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR("Unexpected failure: {}", e.what());
    return 1;
  }
}
