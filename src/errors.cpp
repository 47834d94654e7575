/**
 * @file errors.cpp
 * @brief Message formatting for error types carrying extra context
 */

#include "clip_job/errors.hpp"

#include <utility>

#include <fmt/core.h>

namespace clip_job {

MissingFile::MissingFile(const std::string &what, std::filesystem::path path)
    : Error(fmt::format("missing {}: {}", what, path.string())),
      path_(std::move(path)) {}

ExecutionFailure::ExecutionFailure(int status,
                                   std::filesystem::path destination)
    : Error(status < 0
                ? fmt::format("could not launch transcoder for {}",
                              destination.string())
                : fmt::format("transcoder failed with status {} for {}",
                              status, destination.string())),
      status_(status), destination_(std::move(destination)) {}

} // namespace clip_job
