/**
 * @file document.hpp
 * @brief Helpers for decoding untyped YAML documents into typed records
 *
 * @details Every entity (preferences, job, video, clip) decodes its own
 *          fields with these helpers so that each field is checked
 *          independently and reported with the entity and key it came from.
 *          yaml-cpp exceptions never escape this layer: they are translated
 *          into ValidationError or MissingFile.
 */

#ifndef CLIP_JOB_DOCUMENT_HPP
#define CLIP_JOB_DOCUMENT_HPP

#include <filesystem>
#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

namespace clip_job {

/**
 * @brief Load and parse a YAML file.
 * @param path File to read
 * @param what Human-readable document kind for error messages
 * @return Root node (Null for an empty document)
 * @throws MissingFile when the file cannot be opened
 * @throws ValidationError when the file is not valid YAML
 */
YAML::Node load_document(const std::filesystem::path &path, const char *what);

/**
 * @brief Render a node on one line for error messages.
 */
std::string describe(const YAML::Node &node);

/**
 * @brief Require a map node.
 * @throws ValidationError naming `what` when the node is not a map
 */
void require_map(const YAML::Node &node, const std::string &what);

/**
 * @brief Whether a node is a scalar that YAML resolves to a string.
 * @note Quoted scalars always are. Plain scalars are not when they read as
 *       an integer, a float or a boolean (`1`, `2.5`, `true`).
 */
bool is_string_scalar(const YAML::Node &node);

/**
 * @brief Read a required scalar field from a map node.
 * @throws ValidationError when the key is absent or not a scalar
 */
std::string require_string(const YAML::Node &map, const char *key,
                           const std::string &what);

/**
 * @brief Read an optional scalar field from a map node.
 * @return The value, or std::nullopt when the key is absent
 * @throws ValidationError when the key is present but not a scalar
 */
std::optional<std::string> optional_string(const YAML::Node &map,
                                           const char *key,
                                           const std::string &what);

} // namespace clip_job

#endif // CLIP_JOB_DOCUMENT_HPP
