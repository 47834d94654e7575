/**
 * @file types.hpp
 * @brief Core data types shared across clip_job
 *
 * @details Contains the fundamental value types used throughout the
 * application:
 *          - Duration and DateTime time representations
 *
 *          - Subcommand selection
 *
 *          - ExtractionRequest handed to the transcoding collaborator
 *
 *          - RunTally for per-run counters
 */

#ifndef CLIP_JOB_TYPES_HPP
#define CLIP_JOB_TYPES_HPP

#include <chrono>
#include <filesystem>

namespace clip_job {

// **----- TIME TYPES -----**

/**
 * @brief Signed span of time with whole-second resolution.
 * @note Clip offsets, clip lengths and video epochs all use this type.
 *       Negative values only arise from subtraction (start before epoch).
 */
using Duration = std::chrono::seconds;

/**
 * @brief Wall-clock point in time with whole-second resolution.
 * @note Treated as a naive local time: it is never shifted between time
 *       zones, only formatted back into the same calendar fields it was
 *       parsed from.
 */
using DateTime =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

// **----- COMMAND SELECTION -----**

/**
 * @enum Subcommand
 * @brief Program execution type chosen by the first positional argument.
 */
enum class Subcommand {
  AddClip,  //< Prepare the job file for a new clip and print the plan
  ShowHelp, //< Show program usage and exit
  RunJob,   //< Run the job file to produce clips
};

// **----- DATA STRUCTURES -----**

/**
 * @struct ExtractionRequest
 * @brief A single lossless extraction to be executed.
 */
struct ExtractionRequest {
  std::filesystem::path source;      //< Path to the source recording
  Duration start;                    //< Offset into the source recording
  Duration duration;                 //< Length of the extracted clip
  std::filesystem::path destination; //< Path of the clip to write
};

/**
 * @struct RunTally
 * @brief Counts of clips produced and skipped during a run.
 */
struct RunTally {
  int written = 0; //< Clips handed to the extractor
  int skipped = 0; //< Clips whose destination already existed

  RunTally &operator+=(const RunTally &other) {
    written += other.written;
    skipped += other.skipped;
    return *this;
  }
};

} // namespace clip_job

#endif // CLIP_JOB_TYPES_HPP
