/**
 * @file replacement_map.hpp
 * @brief Ordered string substitution table for filenames
 *
 * @details Rules are applied one after another in insertion order, each
 *          replacing every occurrence of its key in the text produced by the
 *          rules before it. A later rule can therefore rewrite text that an
 *          earlier rule inserted:
 *
 *            {" " -> "_", "_" -> "-"} applied to "a b" yields "a-b"
 */

#ifndef CLIP_JOB_REPLACEMENT_MAP_HPP
#define CLIP_JOB_REPLACEMENT_MAP_HPP

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace clip_job {

/**
 * @class ReplacementMap
 * @brief Insertion-ordered mapping from non-empty key to replacement text.
 */
class ReplacementMap {
public:
  using Entry = std::pair<std::string, std::string>;

  ReplacementMap() = default;

  /**
   * @brief Build a map from literal rules, in order.
   * @throws ValidationError if any key is empty
   */
  ReplacementMap(std::initializer_list<Entry> entries);

  /**
   * @brief Decode a map from a YAML mapping of strings to strings.
   * @throws ValidationError naming the offending pair when a key or value is
   *         not a string, or a key is empty
   */
  static ReplacementMap from_untyped(const YAML::Node &node);

  /**
   * @brief Add a rule, or overwrite an existing key in place.
   * @note Overwriting keeps the key's original position.
   * @throws ValidationError if key is empty
   */
  void set(const std::string &key, const std::string &value);

  /**
   * @brief Apply every rule in insertion order.
   * @param target Text to rewrite
   * @return Rewritten text
   */
  std::string apply(std::string target) const;

  bool empty() const { return entries_.empty(); }
  size_t size() const { return entries_.size(); }
  const std::vector<Entry> &entries() const { return entries_; }

  bool operator==(const ReplacementMap &other) const {
    return entries_ == other.entries_;
  }
  bool operator!=(const ReplacementMap &other) const {
    return !(*this == other);
  }

private:
  std::vector<Entry> entries_;
};

} // namespace clip_job

#endif // CLIP_JOB_REPLACEMENT_MAP_HPP
