/**
 * @file caption_planner.hpp
 * @brief Transcript to caption cue grouping
 *
 * @details Words are grouped into short cues: a new cue starts after a pause
 *          or when the current cue would exceed its word, character or
 *          duration limit. Planning fails soft; an empty transcript gives an
 *          empty cue list.
 */

#ifndef REEL_CUTTER_CAPTION_PLANNER_HPP
#define REEL_CUTTER_CAPTION_PLANNER_HPP

#include <string>
#include <vector>

#include "retry_policy.hpp"
#include "types.hpp"

namespace reel_cutter {

class TranscriptionProvider;

/**
 * @struct TranscriptWord
 * @brief One recognised word with its timing in seconds.
 */
struct TranscriptWord {
  double start = 0.0;
  double end = 0.0;
  std::string text;
};

struct Transcript {
  std::vector<TranscriptWord> words;

  bool empty() const { return words.empty(); }
};

/**
 * @struct CaptionCue
 * @brief A timed caption line, in segment-local seconds.
 */
struct CaptionCue {
  double start = 0.0;
  double end = 0.0;
  std::string text;
};

struct CaptionLimits {
  double pause = 0.6;        //< Gap that forces a new cue
  size_t max_chars = 24;     //< Characters per cue, spaces included
  size_t max_words = 4;
  double max_duration = 2.5; //< Seconds per cue
  double min_display = 0.3;  //< Shorter cues are stretched

  static CaptionLimits from_config();
};

/**
 * @brief Group transcript words into caption cues.
 * @note Words are ordered by start time first; blank words are skipped.
 */
std::vector<CaptionCue> plan_captions(const Transcript &transcript,
                                      const CaptionLimits &limits);

/**
 * @brief Shift words into segment-local time, dropping words outside the
 *        segment and clipping those that straddle its edges.
 */
Transcript localize(const Transcript &transcript, const Segment &segment);

/**
 * @brief Ask each provider in order until one produces a transcript.
 *
 * @param providers Primary first; null entries are skipped
 * @param policy Applied to each provider individually
 * @return The first successful transcript, or an empty one when every
 *         provider failed (failures are logged, never thrown)
 */
Transcript resolve_transcript(const std::vector<TranscriptionProvider *> &providers,
                              const std::string &media_path,
                              const Segment &segment, const RetryPolicy &policy,
                              const Sleeper &sleep);

} // namespace reel_cutter

#endif // REEL_CUTTER_CAPTION_PLANNER_HPP
