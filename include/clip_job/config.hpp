/**
 * @file config.hpp
 * @brief User preferences and the resolved per-run configuration
 *
 * @details Settings are layered, highest precedence first:
 *
 *          1. Job document fields (output-dir, video-dir only, see job.hpp)
 *
 *          2. Command-line flags
 *
 *          3. Preferences file (see Env::prefs_path())
 *
 *          4. Built-in defaults
 *
 *          Preferences holds layers 3 and 4, ResolvedConfig adds layer 2 and
 *          the selected subcommand. Both are built once and only read
 *          afterwards.
 */

#ifndef CLIP_JOB_CONFIG_HPP
#define CLIP_JOB_CONFIG_HPP

#include <filesystem>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "replacement_map.hpp"
#include "types.hpp"

namespace clip_job {

/**
 * @struct Preferences
 * @brief User preferences choosing default behavior.
 */
struct Preferences {
  /// String replacement map for input and output filenames
  ReplacementMap filename_replace;
  /// Default path to the job file
  std::filesystem::path job_path = "clip.yaml";
  /// Default directory clips are written to
  std::filesystem::path output_dir = ".";
  /// Default output clip file extension
  std::string output_ext = "mkv";
  /// Default directory holding the source recordings
  std::filesystem::path video_dir = ".";
  /// Default source recording file extension
  std::string video_ext = "mkv";
  /// strftime format of source recording filenames
  std::string video_filename_format = "%Y-%m-%d %H-%M-%S";

  /**
   * @brief Decode preferences from a YAML mapping.
   * @note Absent keys keep their defaults. A Null node yields defaults.
   * @throws ValidationError for unknown keys, non-string values, empty
   *         paths, extensions or formats, and bad replacement maps
   */
  static Preferences from_untyped(const YAML::Node &node);

  /**
   * @brief Load preferences from a YAML file.
   * @throws MissingFile if the file cannot be opened
   * @throws ValidationError if it is not valid preferences YAML
   */
  static Preferences from_yaml_file(const std::filesystem::path &path);

  /**
   * @brief Load the user's preferences file if there is one.
   * @note A missing file at the default location yields defaults; a missing
   *       file named by CLIP_JOB_PREFS is an error.
   */
  static Preferences load();

  bool operator==(const Preferences &other) const;
  bool operator!=(const Preferences &other) const { return !(*this == other); }
};

/**
 * @struct ResolvedConfig
 * @brief Final settings for one invocation.
 */
struct ResolvedConfig {
  std::filesystem::path job_path;
  ReplacementMap filename_replace;
  std::filesystem::path output_dir;
  std::string output_ext;
  std::filesystem::path video_dir;
  std::string video_ext;
  std::string video_filename_format;
  Subcommand subcommand = Subcommand::ShowHelp;

  /**
   * @brief Configuration with no command-line overrides.
   * @param prefs Preferences to copy settings from
   */
  static ResolvedConfig defaults(const Preferences &prefs = Preferences());

  /**
   * @brief Resolve the configuration from program arguments.
   *
   * @param argv Program arguments, argv[0] being the program name
   * @param prefs Preferences supplying every value not given on the
   *        command line
   * @return Resolved configuration
   * @throws ValidationError for unknown flags, missing or empty flag values,
   *         malformed replacements, and bad or extra positional arguments
   */
  static ResolvedConfig from_argv(const std::vector<std::string> &argv,
                                  const Preferences &prefs = Preferences());
};

/**
 * @brief Parse a subcommand token (case-insensitive).
 * @throws ValidationError for anything but clip, help or run
 */
Subcommand parse_subcommand(const std::string &token);

} // namespace clip_job

#endif // CLIP_JOB_CONFIG_HPP
