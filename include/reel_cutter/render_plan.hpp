/**
 * @file render_plan.hpp
 * @brief Render Plan Compiler
 *
 * @details Pure functions turning resolved request input into a RenderPlan:
 *
 *          - Timestamp parsing ("M:SS", "H:MM:SS", numbers)
 *
 *          - Option bounds and segment validation
 *
 *          - Multi-clip eligibility and platform tagging
 *
 *          - Uniform duration cap (trim) per platform
 *
 * @note No I/O, no clock, no randomness. Identical input always yields an
 *       identical plan.
 */

#ifndef REEL_CUTTER_RENDER_PLAN_HPP
#define REEL_CUTTER_RENDER_PLAN_HPP

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace reel_cutter {

/// A request timestamp: raw seconds or a clock string
using TimeValue = std::variant<double, std::string>;

/**
 * @struct TimeRange
 * @brief Unparsed start/end pair as received in a request.
 */
struct TimeRange {
  TimeValue start;
  TimeValue end;
  std::optional<std::string> title;
};

/**
 * @struct DiscoveredClip
 * @brief One clip proposed by the analysis provider.
 */
struct DiscoveredClip {
  std::optional<std::string> title;
  std::vector<Segment> segments;
};

/**
 * @struct PlanLimits
 * @brief Duration caps and thresholds used by the compiler.
 */
struct PlanLimits {
  double max_clip_duration = 80.0;       //< universal cap
  double shorts_max_duration = 70.0;     //< youtube_shorts cap
  double long_form_max_duration = 160.0; //< tiktok_instagram cap
  double multi_clip_min_duration = 600.0;
  double min_trimmed_remainder = 1.0; //< Shorter trim remainders are dropped

  static PlanLimits from_config();

  /// Cap for a target with the given platform tag
  double cap_for(Platform platform) const;
};

/// Upper bound on clips / segments per request
constexpr int kMaxRangesPerRequest = 20;

// **---- Parsing & Validation ----**

/**
 * @brief Parse a timestamp to seconds.
 * @throws ValidationError on malformed or negative values
 */
double parse_time(const TimeValue &value);

/**
 * @brief Check option bounds.
 * @throws ValidationError naming the first offending option
 */
void validate_options(const RenderOptions &options);

/**
 * @brief Parse and check one range against the source.
 * @param source_duration <= 0 when unknown
 * @throws ValidationError if end <= start or the range leaves the source
 */
Segment resolve_range(const TimeRange &range, double source_duration);

// **---- Planning Arithmetic ----**

/**
 * @brief Number of clips a request may produce.
 * @return requested (clamped to >= 1), or 1 when the source is shorter than
 *         the multi-clip threshold or its duration is unknown
 */
int eligible_clip_count(int requested, double source_duration,
                        const PlanLimits &limits);

/**
 * @brief Crossfade actually used between two adjacent pieces.
 * @return fade, or 0 (hard cut) when fade <= 0 or fade is not strictly less
 *         than the shorter of the two durations
 */
double effective_fade(double first_duration, double second_duration,
                      double fade);

/**
 * @brief Output duration of a segment list: sum(dur / speed) minus the
 *        effective crossfade overlaps.
 */
double planned_duration(const std::vector<Segment> &segments,
                        const RenderOptions &options);

/**
 * @brief Shorten a target so its planned duration fits its platform cap.
 * @note Sets target.trimmed when anything was cut.
 */
void apply_duration_cap(RenderTarget &target, const PlanLimits &limits);

// **---- Compilation ----**

/// One independent clip per range.
RenderPlan compile_manual_cut(const std::vector<TimeRange> &clips,
                              const RenderOptions &options,
                              const SourceMedia &source,
                              const PlanLimits &limits);

/// One combined target from all ranges, joined in request order.
RenderPlan compile_manual_edit(const std::vector<TimeRange> &segments,
                               const std::optional<std::string> &title,
                               const RenderOptions &options,
                               const SourceMedia &source,
                               const PlanLimits &limits);

/**
 * @brief One target per discovered clip, up to the eligible clip count.
 * @note With a single target the clip's highlights are stitched together.
 *       With several, the first is tagged youtube_shorts and the rest
 *       tiktok_instagram.
 */
RenderPlan compile_discovered(const std::vector<DiscoveredClip> &clips,
                              const RenderOptions &options,
                              const SourceMedia &source,
                              const PlanLimits &limits);

} // namespace reel_cutter

#endif // REEL_CUTTER_RENDER_PLAN_HPP
