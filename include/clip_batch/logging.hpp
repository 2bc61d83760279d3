/**
 * @file logging.hpp
 * @brief Console logging macros and per-phase timing
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector, which folds repeated phases (one per clip or
 *            export group) into a total and a call count
 *
 * @note The run is single-threaded, so lines are written without locking.
 *       Warnings and errors go to stderr, everything else to stdout; both
 *       are flushed per line so progress stays visible while ffmpeg runs.
 *       Durable failure records go through RunReporter, not these macros.
 */

#ifndef CLIP_BATCH_LOGGING_HPP
#define CLIP_BATCH_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace clip_batch {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

namespace log_detail {

/// Write tag + message + newline to stream in the given style, then flush
void emit(std::FILE *stream, const fmt::text_style &style, const char *tag,
          const std::string &message);

} // namespace log_detail

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  clip_batch::log_detail::emit(stdout, fmt::text_style(), "[INFO] ",           \
                               fmt::format(format_str, ##__VA_ARGS__))

#define LOG_WARN(format_str, ...)                                              \
  clip_batch::log_detail::emit(stderr, fg(fmt::color::yellow), "[WARN] ",      \
                               fmt::format(format_str, ##__VA_ARGS__))

#define LOG_ERROR(format_str, ...)                                             \
  clip_batch::log_detail::emit(stderr, fg(fmt::color::red), "[ERROR] ",        \
                               fmt::format(format_str, ##__VA_ARGS__))

#define LOG_PHASE(format_str, ...)                                             \
  clip_batch::log_detail::emit(stdout, fg(fmt::color::cyan), "",               \
                               fmt::format(format_str, ##__VA_ARGS__))

#define LOG_SUCCESS(format_str, ...)                                           \
  clip_batch::log_detail::emit(stdout, fg(fmt::color::green), "",              \
                               fmt::format(format_str, ##__VA_ARGS__))
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief Accumulated time of one phase.
 */
struct TimingEntry {
  std::string name;  //< Phase name, the TIMER_START identifier
  int calls;         //< Number of TIMER_END hits
  long microseconds; //< Sum over all calls
};

/**
 * @class TimingCollector
 * @brief Per-phase totals for the end-of-run table.
 * @note Phases keep the order in which they were first recorded.
 */
class TimingCollector {
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Add one measurement to its phase.
   * @param name Phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /// Totals recorded so far, in first-seen order
  static const std::vector<TimingEntry> &phases();

  /**
   * @brief Print the phase table. Called at the end of a run.
   */
  static void print_summary();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            std::chrono::steady_clock::now() - timer_start_##name)             \
            .count();                                                          \
    clip_batch::TimingCollector::record(                                       \
        #name, static_cast<long>(timer_duration_##name));                      \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace clip_batch

#endif // CLIP_BATCH_LOGGING_HPP
