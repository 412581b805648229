/**
 * @file render_plan.cpp
 * @brief Render Plan Compiler implementation
 */

#include "reel_cutter/render_plan.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

#include <fmt/core.h>

#include "reel_cutter/config.hpp"
#include "reel_cutter/errors.hpp"
#include "reel_cutter/logging.hpp"

namespace reel_cutter {

// **---- PlanLimits ----**

PlanLimits PlanLimits::from_config() {
  PlanLimits limits;
  limits.max_clip_duration = Config::max_clip_duration_sec();
  limits.shorts_max_duration = Config::shorts_max_duration_sec();
  limits.long_form_max_duration = Config::long_form_max_duration_sec();
  limits.multi_clip_min_duration = Config::multi_clip_min_duration_sec();
  return limits;
}

double PlanLimits::cap_for(Platform platform) const {
  switch (platform) {
  case Platform::YoutubeShorts:
    return shorts_max_duration;
  case Platform::TiktokInstagram:
    return long_form_max_duration;
  case Platform::Universal:
    break;
  }
  return max_clip_duration;
}

// **---- Timestamp Parsing ----**

namespace {

std::string trim_copy(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

/// Parse "12" or "12.5"; rejects signs, exponents and empty fields
double parse_field(const std::string &field, bool allow_fraction,
                   const std::string &original) {
  bool seen_dot = false;
  bool seen_digit = false;
  for (char c : field) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      seen_digit = true;
    } else if (c == '.' && allow_fraction && !seen_dot) {
      seen_dot = true;
    } else {
      throw ValidationError(fmt::format("invalid timestamp '{}'", original));
    }
  }
  if (!seen_digit)
    throw ValidationError(fmt::format("invalid timestamp '{}'", original));
  return std::strtod(field.c_str(), nullptr);
}

double parse_clock(const std::string &raw) {
  const std::string text = trim_copy(raw);
  if (text.empty())
    throw ValidationError("empty timestamp");
  if (text[0] == '-')
    throw ValidationError(fmt::format("negative timestamp '{}'", raw));

  std::vector<std::string> parts;
  size_t pos = 0;
  while (true) {
    size_t colon = text.find(':', pos);
    parts.push_back(text.substr(pos, colon - pos));
    if (colon == std::string::npos)
      break;
    pos = colon + 1;
  }

  switch (parts.size()) {
  case 1:
    return parse_field(parts[0], true, raw);
  case 2: {
    double m = parse_field(parts[0], false, raw);
    double s = parse_field(parts[1], true, raw);
    if (s >= 60.0)
      throw ValidationError(fmt::format("seconds out of range in '{}'", raw));
    return m * 60.0 + s;
  }
  case 3: {
    double h = parse_field(parts[0], false, raw);
    double m = parse_field(parts[1], false, raw);
    double s = parse_field(parts[2], true, raw);
    if (m >= 60.0 || s >= 60.0)
      throw ValidationError(fmt::format("field out of range in '{}'", raw));
    return h * 3600.0 + m * 60.0 + s;
  }
  default:
    throw ValidationError(fmt::format("invalid timestamp '{}'", raw));
  }
}

} // anonymous namespace

double parse_time(const TimeValue &value) {
  if (const double *seconds = std::get_if<double>(&value)) {
    if (!std::isfinite(*seconds) || *seconds < 0.0)
      throw ValidationError(fmt::format("invalid timestamp {}", *seconds));
    return *seconds;
  }
  return parse_clock(std::get<std::string>(value));
}

// **---- Validation ----**

namespace {

template <typename T>
void check_bounds(const char *name, T value, T lo, T hi) {
  if (!(value >= lo && value <= hi)) {
    throw ValidationError(
        fmt::format("{} must be within [{}, {}], got {}", name, lo, hi, value));
  }
}

void check_range_count(size_t count, const char *what) {
  if (count < 1 || count > static_cast<size_t>(kMaxRangesPerRequest)) {
    throw ValidationError(fmt::format("{} must contain 1 to {} entries", what,
                                      kMaxRangesPerRequest));
  }
}

void check_segment(const Segment &seg, double source_duration) {
  if (seg.end <= seg.start) {
    throw ValidationError(fmt::format(
        "segment end {:.3f} must be after start {:.3f}", seg.end, seg.start));
  }
  if (source_duration > 0.0 &&
      (seg.start >= source_duration || seg.end > source_duration)) {
    throw ValidationError(
        fmt::format("segment {:.3f}-{:.3f} exceeds source duration {:.3f}",
                    seg.start, seg.end, source_duration));
  }
}

} // anonymous namespace

void validate_options(const RenderOptions &options) {
  check_bounds("max_clips", options.max_clips, 1, 10);
  check_bounds("zoom_level", options.zoom_level, 500, 3000);
  check_bounds("fade_duration", options.fade_duration, 0.0, 5.0);
  check_bounds("width", options.width, 360, 3840);
  check_bounds("height", options.height, 360, 3840);
  check_bounds("speed", options.speed, 0.9, 1.2);
  check_bounds("pitch_shift", options.pitch_shift, 0.9, 1.1);
  check_bounds("background_noise", options.background_noise, 0.0, 1.0);
}

Segment resolve_range(const TimeRange &range, double source_duration) {
  Segment seg;
  seg.start = parse_time(range.start);
  seg.end = parse_time(range.end);
  seg.title = range.title;
  check_segment(seg, source_duration);
  return seg;
}

// **---- Planning Arithmetic ----**

int eligible_clip_count(int requested, double source_duration,
                        const PlanLimits &limits) {
  if (source_duration <= 0.0 ||
      source_duration < limits.multi_clip_min_duration)
    return 1;
  return std::max(1, requested);
}

double effective_fade(double first_duration, double second_duration,
                      double fade) {
  if (fade <= 0.0)
    return 0.0;
  if (fade >= std::min(first_duration, second_duration))
    return 0.0;
  return fade;
}

double planned_duration(const std::vector<Segment> &segments,
                        const RenderOptions &options) {
  double total = 0.0;
  double prev = 0.0;
  for (size_t i = 0; i < segments.size(); ++i) {
    double len = segments[i].duration() / options.speed;
    total += len;
    if (i > 0)
      total -= effective_fade(prev, len, options.fade_duration);
    prev = len;
  }
  return total;
}

void apply_duration_cap(RenderTarget &target, const PlanLimits &limits) {
  const double cap = limits.cap_for(target.platform);
  const double speed = target.options.speed;
  const double fade = target.options.fade_duration;

  double before = planned_duration(target.segments, target.options);
  if (before <= cap)
    return;

  std::vector<Segment> kept;
  double acc = 0.0;  //< Output seconds covered so far
  double prev = 0.0; //< Output length of the last kept segment

  for (const auto &seg : target.segments) {
    double len = seg.duration() / speed;
    double overlap = kept.empty() ? 0.0 : effective_fade(prev, len, fade);

    if (acc + len - overlap <= cap) {
      kept.push_back(seg);
      acc += len - overlap;
      prev = len;
      continue;
    }

    /// This segment crosses the cap: keep only the part that fits
    double room = cap - acc;
    double cut_len = room + overlap;
    if (!kept.empty() && effective_fade(prev, cut_len, fade) != overlap)
      cut_len = room;

    /// room is the new output time the piece adds beyond the fade
    if (room >= limits.min_trimmed_remainder) {
      Segment shortened = seg;
      shortened.end = seg.start + cut_len * speed;
      kept.push_back(shortened);
    }
    break;
  }

  target.segments = std::move(kept);
  target.trimmed = true;
  LOG_WARN("Target {} '{}' trimmed from {:.1f}s to {:.1f}s ({} cap {:.0f}s)",
           target.index, target.title, before,
           planned_duration(target.segments, target.options),
           to_string(target.platform), cap);
}

// **---- Compilation ----**

RenderPlan compile_manual_cut(const std::vector<TimeRange> &clips,
                              const RenderOptions &options,
                              const SourceMedia &source,
                              const PlanLimits &limits) {
  validate_options(options);
  check_range_count(clips.size(), "clips");

  RenderPlan plan;
  for (size_t i = 0; i < clips.size(); ++i) {
    RenderTarget target;
    target.index = static_cast<int>(i) + 1;
    target.segments.push_back(resolve_range(clips[i], source.duration));
    target.title = clips[i].title.value_or(fmt::format("Clip {}", i + 1));
    target.platform = Platform::Universal;
    target.options = options;
    apply_duration_cap(target, limits);
    plan.targets.push_back(std::move(target));
  }
  return plan;
}

RenderPlan compile_manual_edit(const std::vector<TimeRange> &segments,
                               const std::optional<std::string> &title,
                               const RenderOptions &options,
                               const SourceMedia &source,
                               const PlanLimits &limits) {
  validate_options(options);
  check_range_count(segments.size(), "segments");

  RenderTarget target;
  target.index = 1;
  target.title = title.value_or("Edit");
  target.platform = Platform::Universal;
  target.options = options;
  for (const auto &range : segments) {
    target.segments.push_back(resolve_range(range, source.duration));
  }
  apply_duration_cap(target, limits);

  RenderPlan plan;
  plan.targets.push_back(std::move(target));
  return plan;
}

RenderPlan compile_discovered(const std::vector<DiscoveredClip> &clips,
                              const RenderOptions &options,
                              const SourceMedia &source,
                              const PlanLimits &limits) {
  validate_options(options);
  if (clips.empty())
    throw AnalysisError("no viable segments");

  const size_t count = std::min(
      clips.size(), static_cast<size_t>(eligible_clip_count(
                        options.max_clips, source.duration, limits)));

  RenderPlan plan;
  for (size_t i = 0; i < count; ++i) {
    const auto &clip = clips[i];
    if (clip.segments.empty())
      throw AnalysisError(fmt::format("clip {} has no segments", i + 1));

    RenderTarget target;
    target.index = static_cast<int>(i) + 1;
    target.title = clip.title.value_or(fmt::format("Clip {}", i + 1));
    if (count == 1)
      target.platform = Platform::Universal;
    else
      target.platform =
          (i == 0) ? Platform::YoutubeShorts : Platform::TiktokInstagram;
    target.options = options;
    for (const auto &seg : clip.segments) {
      check_segment(seg, source.duration);
      target.segments.push_back(seg);
    }
    apply_duration_cap(target, limits);
    plan.targets.push_back(std::move(target));
  }
  return plan;
}

} // namespace reel_cutter
