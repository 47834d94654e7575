/**
 * @file text.hpp
 * @brief String helpers shared by the document decoders and filename logic
 */

#ifndef CLIP_JOB_TEXT_HPP
#define CLIP_JOB_TEXT_HPP

#include <string>

namespace clip_job {

/// Strip leading and trailing ASCII whitespace.
std::string trim(const std::string &text);

/**
 * @brief Lower-case UTF-8 text using the Unicode simple case mapping.
 * @note Bytes that are not valid UTF-8 are passed through unchanged.
 */
std::string to_lower(const std::string &text);

/// Replace every occurrence of `from` in `text` with `to`. `from` must not be
/// empty.
std::string replace_all(std::string text, const std::string &from,
                        const std::string &to);

} // namespace clip_job

#endif // CLIP_JOB_TEXT_HPP
