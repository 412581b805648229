/**
 * @file logging.cpp
 * @brief Log line output and stage timing statistics
 */

#include "reel_cutter/logging.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>

#include <fmt/color.h>

namespace reel_cutter {

namespace {

std::mutex log_mutex;

struct LevelStyle {
  const char *prefix;
  fmt::text_style style;
};

LevelStyle style_of(LogLevel level) {
  switch (level) {
  case LogLevel::Warn:
    return {"[WARN] ", fg(fmt::color::yellow)};
  case LogLevel::Error:
    return {"[ERROR] ", fg(fmt::color::red)};
  case LogLevel::Phase:
    return {"", fg(fmt::color::cyan)};
  case LogLevel::Success:
    return {"", fg(fmt::color::green)};
  case LogLevel::Info:
    break;
  }
  return {"[INFO] ", fmt::text_style()};
}

/// "HH:MM:SS" in local time
std::string clock_stamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
  return buf;
}

} // anonymous namespace

// **----- LOG OUTPUT -----**

void write_log(LogLevel level, const std::string &message) {
  const LevelStyle ls = style_of(level);
  const std::string stamp = clock_stamp();

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(ls.style, "{} {}{}\n", stamp, ls.prefix, message);
  std::fflush(stdout);
}

std::string job_tag(const std::string &job_id) {
  return fmt::format("[Job {}]", job_id.substr(0, 8));
}

// **----- TIMING COLLECTOR -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, StageTiming> TimingCollector::stages;

void TimingCollector::record(const std::string &label, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  StageTiming &t = stages[label];
  ++t.count;
  t.total_us += us;
  t.max_us = std::max(t.max_us, us);
}

std::map<std::string, StageTiming> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return stages;
}

void TimingCollector::print_summary() {
  const auto rows = snapshot();
  if (rows.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(fg(fmt::color::cyan),
             "\n===================== STAGE TIMINGS =====================\n");
  fmt::print("{:<18} {:>6} {:>11} {:>9} {:>9}\n", "Stage", "Runs", "Total",
             "Mean", "Max");
  for (const auto &row : rows) {
    const StageTiming &t = row.second;
    fmt::print("{:<18} {:>6} {:>10.2f}s {:>8.2f}s {:>8.2f}s\n", row.first,
               t.count, t.total_us / 1e6, t.mean_seconds(), t.max_us / 1e6);
  }
  fmt::print(fg(fmt::color::cyan),
             "=========================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  stages.clear();
}

} // namespace reel_cutter
