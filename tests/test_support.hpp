/**
 * @file test_support.hpp
 * @brief Shared fixtures for the clip_job unit tests
 */

#ifndef CLIP_JOB_TEST_SUPPORT_HPP
#define CLIP_JOB_TEST_SUPPORT_HPP

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "clip_job/errors.hpp"
#include "clip_job/ffmpeg_executor.hpp"
#include "clip_job/types.hpp"

namespace clip_job {
namespace testing_support {

/// Scratch directory removed when the test ends
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            ("clip_job_test_" + std::to_string(::getpid()) + "_" +
             std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

/// Create (or truncate) a file with the given contents
inline void write_file(const std::filesystem::path &path,
                       const std::string &contents = "") {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

/// Extractor that records requests; optionally fails on the Nth call
class RecordingExtractor : public ClipExtractor {
public:
  explicit RecordingExtractor(int fail_on_call = -1)
      : fail_on_call_(fail_on_call) {}

  void extract(const ExtractionRequest &request) override {
    int call = static_cast<int>(requests.size());
    requests.push_back(request);
    if (call == fail_on_call_)
      throw ExecutionFailure(1, request.destination);
  }

  std::vector<ExtractionRequest> requests;

private:
  int fail_on_call_;
};

} // namespace testing_support
} // namespace clip_job

#endif // CLIP_JOB_TEST_SUPPORT_HPP
