/**
 * @file analysis.cpp
 * @brief Analysis response parsing
 */

#include "reel_cutter/analysis.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "reel_cutter/errors.hpp"
#include "reel_cutter/logging.hpp"

namespace reel_cutter {

using nlohmann::json;

namespace {

/// Minimum usable highlight length in seconds
constexpr double kMinSegmentSeconds = 1.0;

std::optional<double> read_time(const json &value) {
  try {
    if (value.is_number())
      return parse_time(TimeValue{value.get<double>()});
    if (value.is_string())
      return parse_time(TimeValue{value.get<std::string>()});
  } catch (const ValidationError &) {
    /// Unparseable time: the caller drops the segment
  }
  return std::nullopt;
}

std::optional<std::string> read_text(const json &obj, const char *key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string())
    return std::nullopt;
  std::string s = it->get<std::string>();
  if (s.empty())
    return std::nullopt;
  return s;
}

} // anonymous namespace

std::string strip_code_fence(const std::string &raw) {
  size_t b = raw.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  std::string text = raw.substr(b);
  if (text.rfind("```", 0) != 0)
    return text;

  size_t body = text.find('\n');
  if (body == std::string::npos)
    return "";
  size_t close = text.rfind("```");
  if (close == std::string::npos || close <= body)
    return text.substr(body + 1);
  return text.substr(body + 1, close - body - 1);
}

std::vector<DiscoveredClip> parse_discovered_clips(const std::string &raw,
                                                   double source_duration) {
  json doc;
  try {
    doc = json::parse(strip_code_fence(raw));
  } catch (const json::parse_error &e) {
    throw AnalysisError(fmt::format("malformed analysis response: {}", e.what()));
  }
  if (!doc.is_array())
    throw AnalysisError("analysis response is not a JSON array");

  std::vector<DiscoveredClip> clips;
  int dropped = 0;
  for (const auto &entry : doc) {
    if (!entry.is_object())
      continue;
    auto segs = entry.find("segments");
    if (segs == entry.end() || !segs->is_array())
      continue;

    DiscoveredClip clip;
    clip.title = read_text(entry, "title");
    for (const auto &s : *segs) {
      if (!s.is_object() || !s.contains("start") || !s.contains("end")) {
        ++dropped;
        continue;
      }
      auto start = read_time(s["start"]);
      auto end = read_time(s["end"]);
      if (!start || !end || *end - *start < kMinSegmentSeconds ||
          (source_duration > 0.0 &&
           (*start >= source_duration || *end > source_duration))) {
        ++dropped;
        continue;
      }
      Segment seg;
      seg.start = *start;
      seg.end = *end;
      seg.description = read_text(s, "description");
      clip.segments.push_back(std::move(seg));
    }
    if (clip.segments.empty())
      continue;

    std::stable_sort(clip.segments.begin(), clip.segments.end(),
                     [](const Segment &a, const Segment &b) {
                       return a.start < b.start;
                     });
    clips.push_back(std::move(clip));
  }

  if (dropped > 0)
    LOG_WARN("Discarded {} invalid segment(s) from analysis response", dropped);
  if (clips.empty())
    throw AnalysisError("no viable segments");
  return clips;
}

// **---- ArtifactRegistry ----**

void ArtifactRegistry::add(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  names_.push_back(name);
}

std::vector<std::string> ArtifactRegistry::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.swap(names_);
  return out;
}

size_t ArtifactRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return names_.size();
}

} // namespace reel_cutter
