/**
 * @file document.cpp
 * @brief YAML decoding helpers implementation
 */

#include "clip_job/document.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/core.h>

#include "clip_job/errors.hpp"

namespace clip_job {

namespace {

const char *const PLAIN_BOOLEANS[] = {
    "true", "True", "TRUE", "false", "False", "FALSE", "yes", "Yes", "YES",
    "no",   "No",   "NO",   "on",    "On",    "ON",    "off", "Off", "OFF",
};

} // anonymous namespace

YAML::Node load_document(const std::filesystem::path &path, const char *what) {
  try {
    return YAML::LoadFile(path.string());
  } catch (const YAML::BadFile &) {
    throw MissingFile(what, path);
  } catch (const YAML::Exception &e) {
    throw ValidationError(fmt::format("failed to parse {} '{}': {}", what,
                                      path.string(), e.what()));
  }
}

std::string describe(const YAML::Node &node) {
  if (!node.IsDefined())
    return "<undefined>";
  YAML::Emitter out;
  out.SetMapFormat(YAML::Flow);
  out.SetSeqFormat(YAML::Flow);
  out << node;
  return out.good() ? std::string(out.c_str()) : std::string("<unprintable>");
}

bool is_string_scalar(const YAML::Node &node) {
  if (!node.IsScalar())
    return false;
  /// Non-specific tag "?" marks a plain scalar still open to resolution
  if (node.Tag() != "?")
    return true;

  long long as_int;
  double as_float;
  if (YAML::convert<long long>::decode(node, as_int) ||
      YAML::convert<double>::decode(node, as_float))
    return false;

  /// YAML 1.1 booleans; single-letter y/n stay strings
  const std::string &text = node.Scalar();
  return std::none_of(std::begin(PLAIN_BOOLEANS), std::end(PLAIN_BOOLEANS),
                      [&text](const char *b) { return text == b; });
}

void require_map(const YAML::Node &node, const std::string &what) {
  if (!node.IsMap()) {
    throw ValidationError(
        fmt::format("invalid {}: expected a mapping, got {}", what,
                    describe(node)));
  }
}

std::string require_string(const YAML::Node &map, const char *key,
                           const std::string &what) {
  std::optional<std::string> value = optional_string(map, key, what);
  if (!value) {
    throw ValidationError(
        fmt::format("bad {}: missing '{}': {}", what, key, describe(map)));
  }
  return *value;
}

std::optional<std::string> optional_string(const YAML::Node &map,
                                           const char *key,
                                           const std::string &what) {
  const YAML::Node value = map[key];
  if (!value)
    return std::nullopt;
  if (!value.IsScalar()) {
    throw ValidationError(fmt::format("bad {}: '{}' must be a string, got {}",
                                      what, key, describe(value)));
  }
  return value.Scalar();
}

} // namespace clip_job
