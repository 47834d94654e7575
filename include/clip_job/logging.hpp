/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END_AS)
 *
 *          - TimingCollector for the end-of-run extraction summary
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so progress stays visible while ffmpeg runs. Warnings and
 *       errors go to stderr, everything else to stdout.
 *
 */

#ifndef CLIP_JOB_LOGGING_HPP
#define CLIP_JOB_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace clip_job {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by CLIP_JOB_ENABLE_LOGGING at compile time.
 */
#ifndef CLIP_JOB_ENABLE_LOGGING
#define CLIP_JOB_ENABLE_LOGGING 1
#endif

#ifndef CLIP_JOB_ENABLE_TIMING
#define CLIP_JOB_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if CLIP_JOB_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_job::log_mutex);                     \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_job::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::yellow), "[WARN] " format_str "\n",      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_job::log_mutex);                     \
    fmt::print(stderr, fg(fmt::color::red), "[ERROR] " format_str "\n",        \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_job::log_mutex);                     \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clip_job::log_mutex);                     \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores a label (phase name or clip filename) and its duration in
 *       microseconds.
 */
struct TimingEntry {
  std::string name;  //< Phase name or clip filename
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Process-wide collector for timing measurements.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Phase name or clip filename
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   *        Called after a job run.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();

  /**
   * @brief Number of collected entries.
   */
  static size_t size();
};

// **----- TIMING MACROS -----**

#if CLIP_JOB_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END_AS(name, label)                                              \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    clip_job::TimingCollector::record(label, timer_duration_##name);           \
  } while (0)

#else
#define TIMER_START(name) ((void)0)
#define TIMER_END_AS(name, label) ((void)0)
#endif

} // namespace clip_job

#endif // CLIP_JOB_LOGGING_HPP
