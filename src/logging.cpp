/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "clip_job/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace clip_job {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  long total_us = 0;
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<50} {:>12}\n", "Step", "Time [sec]");
  fmt::print("{:-<50} {:-<12}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    total_us += e.microseconds;
    /// Clip filenames are long; keep the tail, which holds the titles
    std::string name = e.name;
    if (name.size() > 50)
      name = "..." + name.substr(name.size() - 47);
    fmt::print("{:<50} {:>11.2f}s\n", name, seconds);
  }
  fmt::print("{:-<50} {:-<12}\n", "", "");
  fmt::print("{:<50} {:>11.2f}s\n", "Total", total_us / 1000000.0);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

size_t TimingCollector::size() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

} // namespace clip_job
