#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "clip_job/errors.hpp"
#include "clip_job/ffmpeg_executor.hpp"
#include "test_support.hpp"

using namespace clip_job;
using clip_job::testing_support::TempDir;
using clip_job::testing_support::write_file;

namespace {

ExtractionRequest request_in(const TempDir &dir) {
  return {dir.path() / "2020-01-01 00-00-00.mkv", Duration(90), Duration(30),
          dir.path() / "out's clip.mkv"};
}

} // namespace

TEST(FFmpegArgsTest, StreamCopiesTheRequestedRange) {
  ExtractionRequest request{"/in/src.mkv", Duration(5400), Duration(1),
                            "/out/dst.mkv"};
  std::vector<std::string> expected{
      "ffmpeg", "-hide_banner", "-loglevel", "error", "-n",
      "-ss",    "5400",         "-i",        "/in/src.mkv",
      "-c:a",   "copy",         "-c:v",      "copy",
      "-map",   "0:v",          "-map",      "0:a",
      "-t",     "1",            "/out/dst.mkv"};
  EXPECT_EQ(build_ffmpeg_args("ffmpeg", request), expected);
}

TEST(ShellQuoteTest, QuotesEverything) {
  EXPECT_EQ(shell_quote("plain"), "'plain'");
  EXPECT_EQ(shell_quote("a b"), "'a b'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(shell_quote("$(x)"), "'$(x)'");
}

TEST(FFmpegExecutorTest, ExistingDestinationIsANoOp) {
  TempDir dir;
  ExtractionRequest request = request_in(dir);
  write_file(request.destination, "done");
  EXPECT_EQ(execute_ffmpeg_clip("/nonexistent/ffmpeg", request), 0);
}

TEST(FFmpegExecutorTest, SuccessfulToolRun) {
  TempDir dir;
  FFmpegExtractor extractor("true");
  EXPECT_NO_THROW(extractor.extract(request_in(dir)));
}

TEST(FFmpegExecutorTest, NonZeroExitIsAnExecutionFailure) {
  TempDir dir;
  ExtractionRequest request = request_in(dir);
  FFmpegExtractor extractor("false");
  try {
    extractor.extract(request);
    FAIL() << "expected ExecutionFailure";
  } catch (const ExecutionFailure &e) {
    EXPECT_EQ(e.status(), 1);
    EXPECT_EQ(e.destination(), request.destination);
  }
}

TEST(FFmpegExecutorTest, MissingToolIsAnExecutionFailure) {
  TempDir dir;
  FFmpegExtractor extractor("/nonexistent/ffmpeg");
  EXPECT_THROW(extractor.extract(request_in(dir)), ExecutionFailure);
}
