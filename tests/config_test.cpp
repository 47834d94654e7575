#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "clip_job/config.hpp"
#include "clip_job/errors.hpp"
#include "test_support.hpp"

using namespace clip_job;
using clip_job::testing_support::TempDir;
using clip_job::testing_support::write_file;

namespace {

Preferences custom_prefs() {
  Preferences prefs;
  prefs.filename_replace = ReplacementMap{{" ", "_"}};
  prefs.job_path = "/dev/null";
  prefs.output_dir = "/dev/null";
  prefs.video_dir = "/dev/null";
  prefs.video_ext = "rm";
  prefs.video_filename_format = "%s";
  return prefs;
}

ResolvedConfig parse(const std::vector<std::string> &args,
                     const Preferences &prefs = Preferences()) {
  std::vector<std::string> argv{"clip_job"};
  argv.insert(argv.end(), args.begin(), args.end());
  return ResolvedConfig::from_argv(argv, prefs);
}

/// Repeat one flag for each argument: -r a -r b ...
std::vector<std::string> repeat(const std::string &flag,
                                const std::vector<std::string> &args) {
  std::vector<std::string> out;
  for (const auto &arg : args) {
    out.push_back(flag);
    out.push_back(arg);
  }
  return out;
}

} // namespace

// **---- Defaults and precedence ----**

TEST(ResolvedConfigTest, DefaultsWithoutPreferences) {
  ResolvedConfig config = parse({});
  Preferences defaults;
  EXPECT_EQ(config.job_path, defaults.job_path);
  EXPECT_EQ(config.job_path, "clip.yaml");
  EXPECT_TRUE(config.filename_replace.empty());
  EXPECT_EQ(config.output_dir, ".");
  EXPECT_EQ(config.output_ext, "mkv");
  EXPECT_EQ(config.video_dir, ".");
  EXPECT_EQ(config.video_ext, "mkv");
  EXPECT_EQ(config.video_filename_format, "%Y-%m-%d %H-%M-%S");
  EXPECT_EQ(config.subcommand, Subcommand::ShowHelp);
}

TEST(ResolvedConfigTest, DefaultsFollowPreferences) {
  Preferences prefs = custom_prefs();
  ResolvedConfig config = parse({}, prefs);
  EXPECT_EQ(config.job_path, prefs.job_path);
  EXPECT_EQ(config.filename_replace, prefs.filename_replace);
  EXPECT_EQ(config.output_dir, prefs.output_dir);
  EXPECT_EQ(config.video_dir, prefs.video_dir);
  EXPECT_EQ(config.video_ext, "rm");
  EXPECT_EQ(config.video_filename_format, "%s");
  EXPECT_EQ(config.subcommand, Subcommand::ShowHelp);
}

TEST(ResolvedConfigTest, DefaultsMatchFromArgvWithoutArguments) {
  Preferences prefs = custom_prefs();
  ResolvedConfig a = ResolvedConfig::defaults(prefs);
  ResolvedConfig b = ResolvedConfig::from_argv({}, prefs);
  EXPECT_EQ(a.job_path, b.job_path);
  EXPECT_EQ(a.filename_replace, b.filename_replace);
  EXPECT_EQ(a.subcommand, b.subcommand);
}

TEST(ResolvedConfigTest, CommandLineOverridesPreferences) {
  Preferences prefs;
  prefs.video_ext = "rm";
  EXPECT_EQ(parse({}, prefs).video_ext, "rm");
  EXPECT_EQ(parse({"--video-ext", "mkv"}, prefs).video_ext, "mkv");
}

TEST(ResolvedConfigTest, UnrelatedFlagsKeepPreferenceValues) {
  Preferences prefs = custom_prefs();
  ResolvedConfig config = parse({"--output-ext", "mp4"}, prefs);
  EXPECT_EQ(config.output_ext, "mp4");
  EXPECT_EQ(config.video_ext, "rm");
  EXPECT_EQ(config.video_dir, "/dev/null");
}

// **---- Path, extension and format flags ----**

TEST(ResolvedConfigTest, JobPath) {
  for (const char *opt : {"-j", "--job-path"}) {
    EXPECT_EQ(parse({opt, "/dev/null"}).job_path, "/dev/null") << opt;
  }
  EXPECT_EQ(parse({"--job-path=/tmp/job.yaml"}).job_path, "/tmp/job.yaml");
}

TEST(ResolvedConfigTest, OutputDir) {
  for (const char *opt : {"-o", "--output-dir"}) {
    EXPECT_EQ(parse({opt, "/dev/null"}).output_dir, "/dev/null") << opt;
  }
}

TEST(ResolvedConfigTest, VideoDir) {
  for (const char *opt : {"-i", "--video-dir"}) {
    EXPECT_EQ(parse({opt, "/dev/null"}).video_dir, "/dev/null") << opt;
  }
}

TEST(ResolvedConfigTest, Extensions) {
  EXPECT_EQ(parse({"--output-ext", "rm"}).output_ext, "rm");
  EXPECT_EQ(parse({"--video-ext", "rm"}).video_ext, "rm");
}

TEST(ResolvedConfigTest, VideoFilenameFormat) {
  EXPECT_EQ(parse({"--video-filename-format", "%s"}).video_filename_format,
            "%s");
}

TEST(ResolvedConfigTest, EmptyValuesAreRejected) {
  for (const char *opt :
       {"-i", "--video-dir", "-j", "--job-path", "-o", "--output-dir",
        "--output-ext", "--video-ext", "--video-filename-format"}) {
    EXPECT_THROW(parse({opt, ""}), ValidationError) << opt;
  }
}

TEST(ResolvedConfigTest, LaterFlagWins) {
  EXPECT_EQ(parse({"-o", "a", "--output-dir", "b"}).output_dir, "b");
}

// **---- Filename replacement flag ----**

TEST(ResolvedConfigTest, FilenameReplaceKeyValue) {
  for (const char *opt : {"-r", "--filename-replace"}) {
    EXPECT_EQ(parse(repeat(opt, {" =_"})).filename_replace,
              (ReplacementMap{{" ", "_"}}));
    EXPECT_EQ(parse(repeat(opt, {" =...", "+=", "equals=="}))
                  .filename_replace,
              (ReplacementMap{{" ", "..."}, {"+", ""}, {"equals", "="}}));
  }
}

TEST(ResolvedConfigTest, FilenameReplaceEqualsKey) {
  for (const char *opt : {"-r", "--filename-replace"}) {
    EXPECT_EQ(parse(repeat(opt, {"==equals"})).filename_replace,
              (ReplacementMap{{"=", "equals"}}));
  }
}

TEST(ResolvedConfigTest, FilenameReplaceEmptyArgumentResets) {
  for (const char *opt : {"-r", "--filename-replace"}) {
    EXPECT_EQ(parse(repeat(opt, {" =_", "+=", ""})).filename_replace,
              ReplacementMap());
  }
}

TEST(ResolvedConfigTest, FilenameReplaceResetRestoresPreferences) {
  Preferences prefs = custom_prefs();
  ResolvedConfig config = parse({"-r", "x=y", "-r", ""}, prefs);
  EXPECT_EQ(config.filename_replace, prefs.filename_replace);
}

TEST(ResolvedConfigTest, FilenameReplaceExtendsPreferences) {
  Preferences prefs = custom_prefs();
  ResolvedConfig config = parse({"-r", "x=y"}, prefs);
  EXPECT_EQ(config.filename_replace, (ReplacementMap{{" ", "_"}, {"x", "y"}}));
  /// Preferences are copied, never edited
  EXPECT_EQ(prefs.filename_replace, (ReplacementMap{{" ", "_"}}));
}

TEST(ResolvedConfigTest, FilenameReplaceInvalid) {
  for (const char *opt : {"-r", "--filename-replace"}) {
    for (const char *arg : {"=", "=anything", "not-a-mapping"}) {
      EXPECT_THROW(parse({opt, arg}), ValidationError) << opt << " " << arg;
    }
  }
}

// **---- Subcommands ----**

TEST(ResolvedConfigTest, Subcommands) {
  EXPECT_EQ(parse({"clip"}).subcommand, Subcommand::AddClip);
  EXPECT_EQ(parse({"help"}).subcommand, Subcommand::ShowHelp);
  EXPECT_EQ(parse({"run"}).subcommand, Subcommand::RunJob);
}

TEST(ResolvedConfigTest, SubcommandIsCaseInsensitive) {
  EXPECT_EQ(parse({"RUN"}).subcommand, Subcommand::RunJob);
  EXPECT_EQ(parse({"Clip"}).subcommand, Subcommand::AddClip);
}

TEST(ResolvedConfigTest, SubcommandAfterOptions) {
  ResolvedConfig config = parse({"-j", "job.yaml", "run"});
  EXPECT_EQ(config.subcommand, Subcommand::RunJob);
  EXPECT_EQ(config.job_path, "job.yaml");
}

TEST(ResolvedConfigTest, InvalidSubcommands) {
  EXPECT_THROW(parse({""}), ValidationError);
  EXPECT_THROW(parse({"bogus"}), ValidationError);
}

TEST(ResolvedConfigTest, ExtraPositionalIsRejected) {
  EXPECT_THROW(parse({"run", "now"}), ValidationError);
  EXPECT_THROW(parse({"run", "-h"}), ValidationError);
}

TEST(ResolvedConfigTest, HelpFlagWinsOverSubcommand) {
  for (const char *opt : {"-h", "--help"}) {
    EXPECT_EQ(parse({opt, "run"}).subcommand, Subcommand::ShowHelp) << opt;
  }
}

// **---- Lexer errors ----**

TEST(ResolvedConfigTest, UnknownFlagsAreRejected) {
  EXPECT_THROW(parse({"--not-a-flag"}), ValidationError);
  EXPECT_THROW(parse({"-x"}), ValidationError);
}

TEST(ResolvedConfigTest, UnknownFlagIsNamed) {
  try {
    parse({"--not-a-flag=1"});
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_NE(std::string(e.what()).find("--not-a-flag"), std::string::npos);
  }
}

TEST(ResolvedConfigTest, MissingFlagArgumentIsRejected) {
  EXPECT_THROW(parse({"--job-path"}), ValidationError);
  EXPECT_THROW(parse({"-o"}), ValidationError);
}

TEST(ResolvedConfigTest, RepeatedParsingIsIndependent) {
  EXPECT_EQ(parse({"-o", "first", "run"}).output_dir, "first");
  ResolvedConfig second = parse({"clip"});
  EXPECT_EQ(second.output_dir, ".");
  EXPECT_EQ(second.subcommand, Subcommand::AddClip);
}

// **---- Preferences ----**

TEST(PreferencesTest, EmptyMappingGivesDefaults) {
  EXPECT_EQ(Preferences::from_untyped(YAML::Load("{}")), Preferences());
  EXPECT_EQ(Preferences::from_untyped(YAML::Node()), Preferences());
}

TEST(PreferencesTest, ValuesOverrideDefaults) {
  YAML::Node node = YAML::Load(R"(
filename-replace: {" ": "_"}
job-path: /dev/null
output-dir: /dev/null
output-ext: rm
video-dir: /dev/null
video-ext: rm
video-filename-format: "%s"
)");
  Preferences prefs = Preferences::from_untyped(node);
  Preferences expected = custom_prefs();
  expected.output_ext = "rm";
  EXPECT_EQ(prefs, expected);
}

TEST(PreferencesTest, UnknownKeysAreRejected) {
  try {
    Preferences::from_untyped(YAML::Load("{not-a-real-pref: test}"));
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_NE(std::string(e.what()).find("not-a-real-pref"),
              std::string::npos);
  }
}

TEST(PreferencesTest, EveryUnknownKeyIsListed) {
  try {
    Preferences::from_untyped(YAML::Load("{first-bad: 1, second-bad: 2}"));
    FAIL() << "expected ValidationError";
  } catch (const ValidationError &e) {
    EXPECT_NE(std::string(e.what()).find("first-bad, second-bad"),
              std::string::npos);
  }
}

TEST(PreferencesTest, InvalidValuesAreRejected) {
  EXPECT_THROW(Preferences::from_untyped(YAML::Load("[1, 2]")),
               ValidationError);
  EXPECT_THROW(Preferences::from_untyped(YAML::Load("{job-path: ''}")),
               ValidationError);
  EXPECT_THROW(Preferences::from_untyped(YAML::Load("{video-ext: [a]}")),
               ValidationError);
  EXPECT_THROW(
      Preferences::from_untyped(YAML::Load("{filename-replace: [a]}")),
      ValidationError);
  EXPECT_THROW(
      Preferences::from_untyped(YAML::Load("{filename-replace: {'': a}}")),
      ValidationError);
}

TEST(PreferencesTest, FromYamlFile) {
  TempDir dir;
  auto path = dir.path() / "prefs.yaml";
  write_file(path, "video-ext: rm\nfilename-replace:\n  ' ': _\n  _: '-'\n");
  Preferences prefs = Preferences::from_yaml_file(path);
  EXPECT_EQ(prefs.video_ext, "rm");
  EXPECT_EQ(prefs.filename_replace, (ReplacementMap{{" ", "_"}, {"_", "-"}}));
  EXPECT_EQ(prefs.output_ext, "mkv");
}

TEST(PreferencesTest, EmptyFileGivesDefaults) {
  TempDir dir;
  auto path = dir.path() / "prefs.yaml";
  write_file(path, "");
  EXPECT_EQ(Preferences::from_yaml_file(path), Preferences());
}

TEST(PreferencesTest, MissingFile) {
  TempDir dir;
  EXPECT_THROW(Preferences::from_yaml_file(dir.path() / "absent.yaml"),
               MissingFile);
}

TEST(PreferencesTest, MalformedFile) {
  TempDir dir;
  auto path = dir.path() / "prefs.yaml";
  write_file(path, "video-ext: [unclosed\n");
  EXPECT_THROW(Preferences::from_yaml_file(path), ValidationError);
}
