/**
 * @file config.cpp
 * @brief Preferences decoding and command-line resolution
 *
 * @details Command-line lexing is delegated to getopt_long; this file only
 *          interprets the resulting option/value pairs. Option scanning stops
 *          at the first non-option argument, which selects the subcommand.
 */

#include "clip_job/config.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

#include <getopt.h>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "clip_job/document.hpp"
#include "clip_job/env.hpp"
#include "clip_job/errors.hpp"
#include "clip_job/logging.hpp"

namespace clip_job {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

constexpr const char *KEY_FILENAME_REPLACE = "filename-replace";
constexpr const char *KEY_JOB_PATH = "job-path";
constexpr const char *KEY_OUTPUT_DIR = "output-dir";
constexpr const char *KEY_OUTPUT_EXT = "output-ext";
constexpr const char *KEY_VIDEO_DIR = "video-dir";
constexpr const char *KEY_VIDEO_EXT = "video-ext";
constexpr const char *KEY_VIDEO_FILENAME_FORMAT = "video-filename-format";

const char *const PREFERENCE_KEYS[] = {
    KEY_FILENAME_REPLACE, KEY_JOB_PATH,  KEY_OUTPUT_DIR,
    KEY_OUTPUT_EXT,       KEY_VIDEO_DIR, KEY_VIDEO_EXT,
    KEY_VIDEO_FILENAME_FORMAT,
};

/// Long-only option codes, outside the range of short option characters
enum LongOnlyOption {
  OPT_OUTPUT_EXT = 256,
  OPT_VIDEO_EXT,
  OPT_VIDEO_FILENAME_FORMAT,
};

const struct option LONG_OPTIONS[] = {
    {"filename-replace", required_argument, nullptr, 'r'},
    {"help", no_argument, nullptr, 'h'},
    {"job-path", required_argument, nullptr, 'j'},
    {"output-dir", required_argument, nullptr, 'o'},
    {"output-ext", required_argument, nullptr, OPT_OUTPUT_EXT},
    {"video-dir", required_argument, nullptr, 'i'},
    {"video-ext", required_argument, nullptr, OPT_VIDEO_EXT},
    {"video-filename-format", required_argument, nullptr,
     OPT_VIDEO_FILENAME_FORMAT},
    {nullptr, 0, nullptr, 0},
};

/// '+' stops at the first non-option, ':' reports missing arguments as ':'
constexpr const char *SHORT_OPTIONS = "+:hi:j:o:r:";

/// Read an optional preference string that must not be empty when present
void read_non_empty(const YAML::Node &node, const char *key,
                    std::string &out) {
  auto value = optional_string(node, key, "preferences");
  if (!value)
    return;
  if (value->empty()) {
    throw ValidationError(fmt::format("preference '{}' cannot be empty", key));
  }
  out = *value;
}

void read_non_empty(const YAML::Node &node, const char *key, fs::path &out) {
  std::string value;
  read_non_empty(node, key, value);
  if (!value.empty())
    out = value;
}

/// Name of the option getopt_long just rejected
std::string option_name(const std::vector<char *> &args, int argc) {
  if (optind > 0 && optind <= argc) {
    std::string last = args[optind - 1];
    if (last.compare(0, 2, "--") == 0)
      return last.substr(0, last.find('='));
  }
  return fmt::format("-{}", static_cast<char>(optopt));
}

/// Reject an empty flag value with a message naming the setting
const std::string &non_empty(const std::string &value, const char *what) {
  if (value.empty()) {
    throw ValidationError(fmt::format("{} cannot be empty", what));
  }
  return value;
}

/// Apply one -r/--filename-replace argument
void apply_replacement_arg(const std::string &arg, const Preferences &prefs,
                           ReplacementMap &map) {
  if (arg.empty()) {
    /// Reset to the preferences map
    map = prefs.filename_replace;
  } else if (arg.compare(0, 2, "==") == 0) {
    map.set("=", arg.substr(2));
  } else if (arg[0] == '=') {
    throw ValidationError(fmt::format("invalid replacement: {}", arg));
  } else {
    size_t eq = arg.find('=');
    if (eq == std::string::npos) {
      throw ValidationError(fmt::format("invalid replacement: {}", arg));
    }
    map.set(arg.substr(0, eq), arg.substr(eq + 1));
  }
}

} // anonymous namespace

// **---- Preferences ----**

Preferences Preferences::from_untyped(const YAML::Node &node) {
  Preferences prefs;
  if (node.IsNull())
    return prefs;
  require_map(node, "preferences");

  std::vector<std::string> unknown;
  for (const auto &pair : node) {
    std::string key = pair.first.IsScalar() ? pair.first.Scalar()
                                            : describe(pair.first);
    bool known = std::any_of(std::begin(PREFERENCE_KEYS),
                             std::end(PREFERENCE_KEYS),
                             [&key](const char *k) { return key == k; });
    if (!known)
      unknown.push_back(key);
  }
  if (!unknown.empty()) {
    throw ValidationError(
        fmt::format("unknown preferences: {}", fmt::join(unknown, ", ")));
  }

  if (const YAML::Node replace = node[KEY_FILENAME_REPLACE]) {
    prefs.filename_replace = ReplacementMap::from_untyped(replace);
  }
  read_non_empty(node, KEY_JOB_PATH, prefs.job_path);
  read_non_empty(node, KEY_OUTPUT_DIR, prefs.output_dir);
  read_non_empty(node, KEY_OUTPUT_EXT, prefs.output_ext);
  read_non_empty(node, KEY_VIDEO_DIR, prefs.video_dir);
  read_non_empty(node, KEY_VIDEO_EXT, prefs.video_ext);
  read_non_empty(node, KEY_VIDEO_FILENAME_FORMAT, prefs.video_filename_format);
  return prefs;
}

Preferences Preferences::from_yaml_file(const fs::path &path) {
  return from_untyped(load_document(path, "preferences file"));
}

Preferences Preferences::load() {
  const fs::path &path = Env::prefs_path();
  if (!Env::prefs_path_is_explicit() && !fs::exists(path)) {
    return Preferences();
  }
  LOG_INFO("Preferences: {}", path.string());
  return from_yaml_file(path);
}

bool Preferences::operator==(const Preferences &other) const {
  return filename_replace == other.filename_replace &&
         job_path == other.job_path && output_dir == other.output_dir &&
         output_ext == other.output_ext && video_dir == other.video_dir &&
         video_ext == other.video_ext &&
         video_filename_format == other.video_filename_format;
}

// **---- Subcommands ----**

Subcommand parse_subcommand(const std::string &token) {
  std::string lowered = token;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "clip")
    return Subcommand::AddClip;
  if (lowered == "help")
    return Subcommand::ShowHelp;
  if (lowered == "run")
    return Subcommand::RunJob;
  throw ValidationError(fmt::format("invalid subcommand: '{}'", token));
}

// **---- ResolvedConfig ----**

ResolvedConfig ResolvedConfig::defaults(const Preferences &prefs) {
  ResolvedConfig config;
  config.job_path = prefs.job_path;
  config.filename_replace = prefs.filename_replace;
  config.output_dir = prefs.output_dir;
  config.output_ext = prefs.output_ext;
  config.video_dir = prefs.video_dir;
  config.video_ext = prefs.video_ext;
  config.video_filename_format = prefs.video_filename_format;
  config.subcommand = Subcommand::ShowHelp;
  return config;
}

ResolvedConfig ResolvedConfig::from_argv(const std::vector<std::string> &argv,
                                         const Preferences &prefs) {
  ResolvedConfig config = defaults(prefs);

  /// getopt_long wants mutable C strings; keep them alive in storage
  std::vector<std::string> storage(argv);
  if (storage.empty())
    storage.emplace_back("clip_job");
  std::vector<char *> args;
  args.reserve(storage.size() + 1);
  for (auto &arg : storage)
    args.push_back(&arg[0]);
  args.push_back(nullptr);
  int argc = static_cast<int>(storage.size());

  // **----- LEX OPTIONS -----**

  std::vector<std::pair<int, std::string>> opts;
  opterr = 0;
  optind = 0; //< 0 forces glibc to reinitialize between calls
  int opt;
  while ((opt = getopt_long(argc, args.data(), SHORT_OPTIONS, LONG_OPTIONS,
                            nullptr)) != -1) {
    if (opt == '?') {
      throw ValidationError(
          fmt::format("unknown option: {}", option_name(args, argc)));
    }
    if (opt == ':') {
      throw ValidationError(fmt::format("option requires an argument: {}",
                                        option_name(args, argc)));
    }
    opts.emplace_back(opt, optarg ? std::string(optarg) : std::string());
  }

  // **----- SUBCOMMAND -----**

  if (optind < argc) {
    config.subcommand = parse_subcommand(storage[optind]);
    if (optind + 1 < argc) {
      throw ValidationError(
          fmt::format("unexpected argument: '{}'", storage[optind + 1]));
    }
  }

  // **----- APPLY OPTIONS IN ORDER -----**

  for (const auto &entry : opts) {
    const std::string &arg = entry.second;
    switch (entry.first) {
    case 'h':
      config.subcommand = Subcommand::ShowHelp;
      break;
    case 'i':
      config.video_dir = non_empty(arg, "video directory path");
      break;
    case 'j':
      config.job_path = non_empty(arg, "job path");
      break;
    case 'o':
      config.output_dir = non_empty(arg, "output clip directory");
      break;
    case 'r':
      apply_replacement_arg(arg, prefs, config.filename_replace);
      break;
    case OPT_OUTPUT_EXT:
      config.output_ext = non_empty(arg, "output extension");
      break;
    case OPT_VIDEO_EXT:
      config.video_ext = non_empty(arg, "video extension");
      break;
    case OPT_VIDEO_FILENAME_FORMAT:
      config.video_filename_format = non_empty(arg, "video filename format");
      break;
    default:
      throw ValidationError(fmt::format("unhandled option code: {}",
                                        entry.first));
    }
  }

  return config;
}

} // namespace clip_job
