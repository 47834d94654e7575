/**
 * @file time_grammar.hpp
 * @brief Parsing and formatting of hand-written times
 *
 * @details Provides:
 *
 *          - Duration parsing for `[[H:]MM:]SS` spans and bare seconds
 *
 *          - Filename-safe duration formatting (`H-MM-SS`)
 *
 *          - Timestamp parsing for `YYYY-MM-DDTHH:MM:SS`
 *
 *          - strftime-style timestamp formatting
 *
 * @note All parse failures throw ParseError carrying the rejected text.
 */

#ifndef CLIP_JOB_TIME_GRAMMAR_HPP
#define CLIP_JOB_TIME_GRAMMAR_HPP

#include <string>

#include "types.hpp"

namespace clip_job {

// **---- Durations ----**

/**
 * @brief Parse a time span such as "90", "5:00" or "1:30:00".
 *
 * @note Up to three `:`-separated components (hours, minutes, seconds),
 *       each an unsigned decimal integer. Components are not range-limited,
 *       so "0:90" is ninety seconds. Surrounding whitespace is ignored.
 *
 * @param text Time span to parse
 * @return Parsed duration
 * @throws ParseError on empty input, empty or non-numeric components, more
 *         than three components, or overflow
 */
Duration parse_duration(const std::string &text);

/**
 * @brief Format a duration for use inside a filename.
 *
 * @note Hours are unpadded, minutes and seconds are two digits, components
 *       are joined with '-' ("0-05-00", "12-00-01"). Negative durations get
 *       a leading '-'.
 *
 * @param duration Duration to format
 * @return Filename-safe text
 */
std::string format_duration_for_path(Duration duration);

// **---- Timestamps ----**

/**
 * @brief Parse a timestamp in the fixed `YYYY-MM-DDTHH:MM:SS` form.
 * @param text Timestamp to parse (surrounding whitespace is ignored)
 * @return Parsed point in time
 * @throws ParseError when the text does not match or names an invalid
 *         calendar date or time of day
 */
DateTime parse_timestamp(const std::string &text);

/**
 * @brief Move a timestamp by a duration.
 * @return timestamp + offset
 * @throws ParseError when the result overflows or falls outside the
 *         calendar range gmtime can render
 */
DateTime shift_timestamp(DateTime timestamp, Duration offset);

/**
 * @brief Render a timestamp with a strftime-style format string.
 * @param timestamp Point in time to render
 * @param format strftime format, e.g. "%Y-%m-%d %H-%M-%S"
 * @return Formatted text
 * @throws ValidationError when the timestamp is outside the calendar range
 *         or the format produces no output
 */
std::string format_timestamp(DateTime timestamp, const std::string &format);

} // namespace clip_job

#endif // CLIP_JOB_TIME_GRAMMAR_HPP
