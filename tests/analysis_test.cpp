/**
 * @file analysis_test.cpp
 * @brief Analysis response parsing and artifact bookkeeping
 */

#include <gtest/gtest.h>

#include "reel_cutter/analysis.hpp"
#include "reel_cutter/errors.hpp"

namespace reel_cutter {
namespace {

TEST(AnalysisTest, StripsCodeFence) {
  EXPECT_EQ(strip_code_fence("```json\n[1]\n```"), "[1]\n");
  EXPECT_EQ(strip_code_fence("  [2]"), "[2]");
  EXPECT_EQ(strip_code_fence("```\n[3]"), "[3]");
  EXPECT_EQ(strip_code_fence("   "), "");
}

TEST(AnalysisTest, ParsesClipsWithTimesAndDescriptions) {
  const std::string raw = R"(```json
[
  {"title": "The punchline",
   "segments": [
     {"start": "2:10", "end": "2:40", "description": "laughs"},
     {"start": 30, "end": 45}
   ]},
  {"segments": [{"start": "10:00", "end": "10:20"}]}
]
```)";
  auto clips = parse_discovered_clips(raw, 1200.0);
  ASSERT_EQ(clips.size(), 2u);

  EXPECT_EQ(clips[0].title, std::optional<std::string>("The punchline"));
  ASSERT_EQ(clips[0].segments.size(), 2u);
  /// Sorted by start
  EXPECT_DOUBLE_EQ(clips[0].segments[0].start, 30.0);
  EXPECT_DOUBLE_EQ(clips[0].segments[1].start, 130.0);
  EXPECT_EQ(clips[0].segments[1].description,
            std::optional<std::string>("laughs"));

  EXPECT_FALSE(clips[1].title.has_value());
  EXPECT_DOUBLE_EQ(clips[1].segments[0].end, 620.0);
}

TEST(AnalysisTest, DropsInvalidSegmentsAndEmptyClips) {
  const std::string raw = R"([
    {"title": "bad", "segments": [
      {"start": 50, "end": 40},
      {"start": 10, "end": 10.5},
      {"start": "x", "end": 20},
      {"start": 290, "end": 320}
    ]},
    {"title": "good", "segments": [{"start": 5, "end": 15}, {"end": 3}]}
  ])";
  auto clips = parse_discovered_clips(raw, 300.0);
  ASSERT_EQ(clips.size(), 1u);
  EXPECT_EQ(clips[0].title, std::optional<std::string>("good"));
  ASSERT_EQ(clips[0].segments.size(), 1u);
}

TEST(AnalysisTest, UnknownDurationSkipsBoundsCheck) {
  auto clips = parse_discovered_clips(R"([{"segments":[{"start":5000,"end":5010}]}])", 0.0);
  ASSERT_EQ(clips.size(), 1u);
}

TEST(AnalysisTest, FailsWhenNothingSurvives) {
  EXPECT_THROW(parse_discovered_clips("not json at all", 100.0), AnalysisError);
  EXPECT_THROW(parse_discovered_clips(R"({"clips": []})", 100.0), AnalysisError);
  EXPECT_THROW(parse_discovered_clips("[]", 100.0), AnalysisError);
  EXPECT_THROW(
      parse_discovered_clips(R"([{"segments":[{"start":1,"end":1.2}]}])", 100.0),
      AnalysisError);
}

TEST(ArtifactRegistryTest, DrainEmptiesRegistry) {
  ArtifactRegistry registry;
  registry.add("files/abc");
  registry.add("files/def");
  EXPECT_EQ(registry.size(), 2u);

  auto names = registry.drain();
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "files/abc");
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_TRUE(registry.drain().empty());
}

} // anonymous namespace
} // namespace reel_cutter
