/**
 * @file env.hpp
 * @brief Process environment lookups
 *
 * @details Provides an Env namespace with lazy-initialized, memoized
 *          settings loaded from environment variables. These cover what the
 *          preferences file cannot: where the preferences file itself lives
 *          and which ffmpeg executable to launch.
 *
 */

#ifndef CLIP_JOB_ENV_HPP
#define CLIP_JOB_ENV_HPP

#include <cstdlib>
#include <filesystem>
#include <string>

namespace clip_job {
namespace Env {

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// ffmpeg executable, resolved on PATH unless absolute
inline const std::string &ffmpeg_binary() {
  static std::string val = get_env_string("CLIP_JOB_FFMPEG", "ffmpeg");
  return val;
}

/**
 * @brief True when CLIP_JOB_PREFS names the preferences file explicitly.
 * @note An explicitly named file must exist; the default location may not.
 */
inline bool prefs_path_is_explicit() {
  static bool val = !get_env_string("CLIP_JOB_PREFS", "").empty();
  return val;
}

/**
 * @brief Location of the user preferences file.
 * @note Order: CLIP_JOB_PREFS, $XDG_CONFIG_HOME/clip_job/prefs.yaml,
 *       $HOME/.config/clip_job/prefs.yaml, then ./clip_job_prefs.yaml.
 */
inline const std::filesystem::path &prefs_path() {
  static std::filesystem::path val = [] {
    std::string explicit_path = get_env_string("CLIP_JOB_PREFS", "");
    if (!explicit_path.empty())
      return std::filesystem::path(explicit_path);

    std::string config_home = get_env_string("XDG_CONFIG_HOME", "");
    if (!config_home.empty())
      return std::filesystem::path(config_home) / "clip_job" / "prefs.yaml";

    std::string home = get_env_string("HOME", "");
    if (!home.empty())
      return std::filesystem::path(home) / ".config" / "clip_job" /
             "prefs.yaml";

    return std::filesystem::path("clip_job_prefs.yaml");
  }();
  return val;
}

} // namespace Env
} // namespace clip_job

#endif // CLIP_JOB_ENV_HPP
