/**
 * @file caption_planner.cpp
 * @brief Caption cue grouping and transcript resolution
 */

#include "reel_cutter/caption_planner.hpp"

#include <algorithm>

#include "reel_cutter/config.hpp"
#include "reel_cutter/logging.hpp"
#include "reel_cutter/providers.hpp"

namespace reel_cutter {

CaptionLimits CaptionLimits::from_config() {
  CaptionLimits limits;
  limits.pause = Config::caption_pause_sec();
  limits.max_chars = static_cast<size_t>(std::max(1, Config::caption_max_chars()));
  limits.max_words = static_cast<size_t>(std::max(1, Config::caption_max_words()));
  limits.max_duration = Config::caption_max_duration_sec();
  return limits;
}

// **---- Grouping ----**

namespace {

struct CueBuilder {
  std::vector<CaptionCue> &out;
  const CaptionLimits &limits;
  CaptionCue current;
  size_t words = 0;

  void flush() {
    if (words == 0)
      return;
    if (current.end - current.start < limits.min_display)
      current.end = current.start + limits.min_display;
    out.push_back(current);
    current = CaptionCue{};
    words = 0;
  }

  bool fits(const TranscriptWord &w) const {
    if (words == 0)
      return true;
    if (w.start - current.end > limits.pause)
      return false;
    if (words + 1 > limits.max_words)
      return false;
    if (current.text.size() + 1 + w.text.size() > limits.max_chars)
      return false;
    if (w.end - current.start > limits.max_duration)
      return false;
    return true;
  }

  void add(const TranscriptWord &w) {
    if (!fits(w))
      flush();
    if (words == 0) {
      current.start = w.start;
      current.text = w.text;
    } else {
      current.text += ' ';
      current.text += w.text;
    }
    current.end = std::max(current.end, w.end);
    ++words;
  }
};

std::string strip(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // anonymous namespace

std::vector<CaptionCue> plan_captions(const Transcript &transcript,
                                      const CaptionLimits &limits) {
  std::vector<CaptionCue> cues;
  if (transcript.empty())
    return cues;

  std::vector<TranscriptWord> words;
  words.reserve(transcript.words.size());
  for (const auto &w : transcript.words) {
    TranscriptWord clean{w.start, std::max(w.start, w.end), strip(w.text)};
    if (!clean.text.empty())
      words.push_back(std::move(clean));
  }
  std::stable_sort(words.begin(), words.end(),
                   [](const TranscriptWord &a, const TranscriptWord &b) {
                     return a.start < b.start;
                   });

  CueBuilder builder{cues, limits, CaptionCue{}, 0};
  for (const auto &w : words)
    builder.add(w);
  builder.flush();

  /// Stretched cues must not run into the next one
  for (size_t i = 0; i + 1 < cues.size(); ++i) {
    if (cues[i].end > cues[i + 1].start)
      cues[i].end = cues[i + 1].start;
  }
  return cues;
}

Transcript localize(const Transcript &transcript, const Segment &segment) {
  Transcript local;
  const double length = segment.duration();
  for (const auto &w : transcript.words) {
    if (w.end <= segment.start || w.start >= segment.end)
      continue;
    TranscriptWord shifted;
    shifted.start = std::max(0.0, w.start - segment.start);
    shifted.end = std::min(length, w.end - segment.start);
    shifted.text = w.text;
    local.words.push_back(std::move(shifted));
  }
  return local;
}

// **---- Provider Resolution ----**

Transcript resolve_transcript(const std::vector<TranscriptionProvider *> &providers,
                              const std::string &media_path,
                              const Segment &segment, const RetryPolicy &policy,
                              const Sleeper &sleep) {
  for (size_t i = 0; i < providers.size(); ++i) {
    TranscriptionProvider *provider = providers[i];
    if (!provider)
      continue;
    try {
      Transcript t = run_with_retry(
          policy, [&] { return provider->transcribe(media_path, segment); },
          sleep);
      if (i > 0) {
        LOG_INFO("Fallback transcription provider '{}' succeeded",
                 provider->name());
      }
      return t;
    } catch (const std::exception &e) {
      LOG_WARN("Transcription provider '{}' failed: {}", provider->name(),
               e.what());
    }
  }
  LOG_WARN("No transcript for segment {:.2f}-{:.2f}, captions skipped",
           segment.start, segment.end);
  return Transcript{};
}

} // namespace reel_cutter
