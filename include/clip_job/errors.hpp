/**
 * @file errors.hpp
 * @brief Exception types reported to the operator
 *
 * @details Every failure that aborts a run derives from clip_job::Error:
 *
 *          - ValidationError: malformed document field, invalid argument,
 *            unknown key or flag, violated invariant
 *
 *          - ParseError: a time or timestamp that does not match the grammar
 *
 *          - MissingFile: an expected file is absent
 *
 *          - ExecutionFailure: the external transcoder reported failure
 *
 * @note Messages are complete sentences for the operator and always name the
 *       offending field, value or path.
 */

#ifndef CLIP_JOB_ERRORS_HPP
#define CLIP_JOB_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace clip_job {

/// Base class for every error clip_job reports.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Bad input detected before any file I/O for the affected entity.
class ValidationError : public Error {
public:
  using Error::Error;
};

/// Text that does not match the duration or timestamp grammar.
class ParseError : public ValidationError {
public:
  using ValidationError::ValidationError;
};

/**
 * @class MissingFile
 * @brief An expected file (source recording, preferences file) is absent.
 */
class MissingFile : public Error {
public:
  MissingFile(const std::string &what, std::filesystem::path path);

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

/**
 * @class ExecutionFailure
 * @brief The external transcoder could not produce a clip.
 */
class ExecutionFailure : public Error {
public:
  /**
   * @param status Exit status reported by the tool (-1 = could not launch)
   * @param destination Clip that was being written
   */
  ExecutionFailure(int status, std::filesystem::path destination);

  int status() const { return status_; }
  const std::filesystem::path &destination() const { return destination_; }

private:
  int status_;
  std::filesystem::path destination_;
};

} // namespace clip_job

#endif // CLIP_JOB_ERRORS_HPP
