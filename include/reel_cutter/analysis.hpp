/**
 * @file analysis.hpp
 * @brief Analysis provider response parsing and artifact bookkeeping
 */

#ifndef REEL_CUTTER_ANALYSIS_HPP
#define REEL_CUTTER_ANALYSIS_HPP

#include <mutex>
#include <string>
#include <vector>

#include "render_plan.hpp"

namespace reel_cutter {

/**
 * @brief Parse the provider's clip list.
 *
 * @details Accepts a JSON array of {title?, segments:[{start, end,
 *          description?}]}, optionally wrapped in a markdown code fence.
 *          Segments that are inverted, shorter than one second or outside
 *          the source are dropped; the rest are sorted by start. Clips left
 *          without segments are dropped.
 *
 * @param source_duration <= 0 when unknown
 * @throws AnalysisError on malformed JSON or when nothing survives
 */
std::vector<DiscoveredClip> parse_discovered_clips(const std::string &raw,
                                                   double source_duration);

/// Remove a surrounding ```json ... ``` fence, if any
std::string strip_code_fence(const std::string &raw);

/**
 * @class ArtifactRegistry
 * @brief Names of files registered with the analysis provider for a job.
 * @note Drained during `finishing`, whatever the outcome.
 */
class ArtifactRegistry {
public:
  void add(const std::string &name);

  /// Return and forget every recorded artifact
  std::vector<std::string> drain();

  size_t size() const;

private:
  mutable std::mutex mutex_;
  std::vector<std::string> names_;
};

} // namespace reel_cutter

#endif // REEL_CUTTER_ANALYSIS_HPP
