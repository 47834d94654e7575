/**
 * @file replacement_map.cpp
 * @brief ReplacementMap implementation
 */

#include "clip_job/replacement_map.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "clip_job/document.hpp"
#include "clip_job/errors.hpp"
#include "clip_job/text.hpp"

namespace clip_job {

ReplacementMap::ReplacementMap(std::initializer_list<Entry> entries) {
  for (const auto &entry : entries) {
    set(entry.first, entry.second);
  }
}

ReplacementMap ReplacementMap::from_untyped(const YAML::Node &node) {
  require_map(node, "replacement map");

  ReplacementMap map;
  for (const auto &pair : node) {
    if (!is_string_scalar(pair.first) || !is_string_scalar(pair.second)) {
      throw ValidationError(fmt::format("bad mapping: {}: {}",
                                        describe(pair.first),
                                        describe(pair.second)));
    }
    const std::string &key = pair.first.Scalar();
    if (key.empty()) {
      throw ValidationError(fmt::format(
          "mapping key cannot be empty: '': {}", describe(pair.second)));
    }
    map.set(key, pair.second.Scalar());
  }
  return map;
}

void ReplacementMap::set(const std::string &key, const std::string &value) {
  if (key.empty()) {
    throw ValidationError(
        fmt::format("mapping key cannot be empty: '': '{}'", value));
  }

  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&key](const Entry &e) { return e.first == key; });
  if (it != entries_.end()) {
    it->second = value;
  } else {
    entries_.emplace_back(key, value);
  }
}

std::string ReplacementMap::apply(std::string target) const {
  for (const auto &entry : entries_) {
    target = replace_all(std::move(target), entry.first, entry.second);
  }
  return target;
}

} // namespace clip_job
