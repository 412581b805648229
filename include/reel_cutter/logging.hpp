/**
 * @file logging.hpp
 * @brief Leveled console logging and per-stage timing statistics
 *
 * @details Provides:
 *          - LOG_INFO / LOG_WARN / LOG_ERROR / LOG_PHASE / LOG_SUCCESS, each
 *            taking an fmt format string checked at compile time
 *
 *          - TIMER_START / TIMER_END feeding the TimingCollector
 *
 *          - job_tag() for the "[Job xxxxxxxx]" message prefix
 *
 * @note Every line carries a wall-clock stamp and the level, and is flushed
 *       immediately so interleaved worker output stays readable in container
 *       logs.
 */

#ifndef REEL_CUTTER_LOGGING_HPP
#define REEL_CUTTER_LOGGING_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <string>

#include <fmt/core.h>

namespace reel_cutter {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

enum class LogLevel { Info, Warn, Error, Phase, Success };

/**
 * @brief Write one formatted line under the global log mutex.
 * @param level Selects the colour and the "[INFO]" style prefix
 * @param message Already formatted text, without trailing newline
 */
void write_log(LogLevel level, const std::string &message);

/**
 * @brief Short log prefix for a job.
 * @return "[Job <first 8 chars of id>]"
 */
std::string job_tag(const std::string &job_id);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define REEL_CUTTER_LOG(level, format_str, ...)                                \
  reel_cutter::write_log(level, fmt::format(format_str, ##__VA_ARGS__))

#define LOG_INFO(format_str, ...)                                              \
  REEL_CUTTER_LOG(reel_cutter::LogLevel::Info, format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  REEL_CUTTER_LOG(reel_cutter::LogLevel::Warn, format_str, ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  REEL_CUTTER_LOG(reel_cutter::LogLevel::Error, format_str, ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  REEL_CUTTER_LOG(reel_cutter::LogLevel::Phase, format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  REEL_CUTTER_LOG(reel_cutter::LogLevel::Success, format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @struct StageTiming
 * @brief Aggregate of every measurement recorded under one label.
 */
struct StageTiming {
  long count = 0;
  long total_us = 0;
  long max_us = 0;

  double mean_seconds() const {
    return count > 0 ? total_us / 1e6 / count : 0.0;
  }
};

/**
 * @class TimingCollector
 * @brief Process-wide stage timing statistics.
 *
 * @details A long-running service renders many jobs, so measurements are
 *          folded into one row per label instead of kept individually.
 *          Labels containing a per-job or per-clip suffix should be avoided
 *          to keep the table bounded.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, StageTiming> stages;

public:
  static void record(const std::string &label, long us);

  /// Copy of the current statistics, ordered by label
  static std::map<std::string, StageTiming> snapshot();

  /// Print the statistics table (used by the CLI at exit)
  static void print_summary();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name, label)                                                 \
  reel_cutter::TimingCollector::record(                                        \
      label, static_cast<long>(                                                \
                 std::chrono::duration_cast<std::chrono::microseconds>(        \
                     std::chrono::steady_clock::now() - timer_start_##name)    \
                     .count()))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name, label) ((void)0)
#endif

} // namespace reel_cutter

#endif // REEL_CUTTER_LOGGING_HPP
