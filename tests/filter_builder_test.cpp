/**
 * @file filter_builder_test.cpp
 * @brief Graph shape produced for layouts, joins and audio effects
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "reel_cutter/errors.hpp"
#include "reel_cutter/filter_builder.hpp"
#include "reel_cutter/render_plan.hpp"

namespace reel_cutter {
namespace {

Segment seg(double start, double end) {
  Segment s;
  s.start = start;
  s.end = end;
  return s;
}

SourceMedia landscape() {
  SourceMedia media;
  media.duration = 300.0;
  media.width = 1920;
  media.height = 1080;
  media.fps = 30.0;
  return media;
}

RenderTarget target_of(std::vector<Segment> segments, RenderOptions options = {}) {
  RenderTarget target;
  target.title = "Test";
  target.segments = std::move(segments);
  target.options = options;
  return target;
}

EngineInvocation build(const RenderTarget &target,
                       const std::vector<SegmentAssets> &assets = {},
                       const SourceMedia &source = landscape()) {
  return build_invocation(target, source, assets, "/in/source.mp4",
                          "/out/clip.mp4", BuildSettings{});
}

/// Value of the first arg named key on the first node using filter
std::string arg_of(const FilterGraph &g, const std::string &filter,
                   const std::string &key) {
  for (const auto &n : g.nodes()) {
    if (n.filter != filter)
      continue;
    for (const auto &kv : n.args) {
      if (kv.first == key)
        return kv.second;
    }
  }
  return "";
}

std::vector<const FilterNode *> nodes_of(const FilterGraph &g,
                                         const std::string &filter) {
  std::vector<const FilterNode *> out;
  for (const auto &n : g.nodes()) {
    if (n.filter == filter)
      out.push_back(&n);
  }
  return out;
}

// **---- Joins ----**

TEST(FilterBuilderTest, SingleSegmentHasNoJoin) {
  auto inv = build(target_of({seg(10, 30)}));
  EXPECT_EQ(inv.graph.count("xfade"), 0);
  EXPECT_EQ(inv.graph.count("concat"), 0);
  EXPECT_TRUE(inv.transitions.empty());
  EXPECT_DOUBLE_EQ(inv.expected_duration, 20.0);
  EXPECT_EQ(inv.graph.outputs().size(), 2u);
  EXPECT_EQ(inv.input_path, "/in/source.mp4");
  EXPECT_EQ(inv.output_path, "/out/clip.mp4");
}

TEST(FilterBuilderTest, CrossfadesThreeSegments) {
  RenderOptions options;
  options.fade_duration = 1.0;
  auto inv = build(target_of({seg(10, 30), seg(40, 60), seg(100, 120)}, options));

  EXPECT_EQ(inv.graph.count("xfade"), 2);
  EXPECT_EQ(inv.graph.count("acrossfade"), 2);
  EXPECT_EQ(inv.graph.count("concat"), 0);
  ASSERT_EQ(inv.transitions.size(), 2u);
  EXPECT_TRUE(inv.transitions[0].crossfade);
  EXPECT_DOUBLE_EQ(inv.transitions[0].offset, 19.0);
  EXPECT_DOUBLE_EQ(inv.transitions[1].offset, 38.0);
  EXPECT_DOUBLE_EQ(inv.expected_duration, 58.0);

  auto xfades = nodes_of(inv.graph, "xfade");
  EXPECT_EQ(arg_of(inv.graph, "xfade", "offset"), "19.000");
  EXPECT_EQ(xfades[1]->args[2].second, "38.000");
}

TEST(FilterBuilderTest, FadeLongerThanSegmentFallsBackToConcat) {
  RenderOptions options;
  options.fade_duration = 2.0;
  auto inv = build(target_of({seg(10, 30), seg(50, 52)}, options));
  EXPECT_EQ(inv.graph.count("xfade"), 0);
  EXPECT_EQ(inv.graph.count("concat"), 1);
  ASSERT_EQ(inv.transitions.size(), 1u);
  EXPECT_FALSE(inv.transitions[0].crossfade);
  EXPECT_DOUBLE_EQ(inv.expected_duration, 22.0);
}

TEST(FilterBuilderTest, ZeroFadeConcatenates) {
  RenderOptions options;
  options.fade_duration = 0.0;
  auto inv = build(target_of({seg(0, 10), seg(20, 30)}, options));
  EXPECT_EQ(inv.graph.count("concat"), 1);
  EXPECT_DOUBLE_EQ(inv.expected_duration, 20.0);
}

TEST(FilterBuilderTest, ExpectedDurationMatchesPlannedDuration) {
  RenderOptions options;
  options.fade_duration = 1.5;
  options.speed = 1.1;
  RenderTarget target = target_of({seg(0, 12), seg(30, 50), seg(60, 61)}, options);
  auto inv = build(target);
  EXPECT_NEAR(inv.expected_duration,
              planned_duration(target.segments, target.options), 1e-9);
}

// **---- Layouts ----**

TEST(FilterBuilderTest, BlurZoomSplitsIntoBackgroundAndForeground) {
  auto inv = build(target_of({seg(0, 10)}));
  EXPECT_EQ(inv.graph.count("split"), 1);
  EXPECT_EQ(inv.graph.count("boxblur"), 1);
  EXPECT_EQ(inv.graph.count("overlay"), 1);
  EXPECT_EQ(arg_of(inv.graph, "crop", "w"), "270");
  EXPECT_EQ(arg_of(inv.graph, "boxblur", "luma_radius"), "20");
  EXPECT_EQ(arg_of(inv.graph, "boxblur", "chroma_radius"), "20");

  bool centred_fg = false;
  for (const auto *n : nodes_of(inv.graph, "crop")) {
    for (const auto &kv : n->args) {
      if (kv.first == "x" && kv.second == "(iw-1080)/2")
        centred_fg = true;
    }
  }
  EXPECT_TRUE(centred_fg);
}

TEST(FilterBuilderTest, HorizontalOnlyNormalisesAspect) {
  RenderOptions options;
  options.layout = Layout::Horizontal;
  options.dynamic_zoom = true;
  auto inv = build(target_of({seg(0, 10)}, options));
  EXPECT_EQ(inv.graph.count("split"), 0);
  EXPECT_EQ(inv.graph.count("crop"), 0);
  EXPECT_EQ(inv.graph.count("zoompan"), 0);
}

TEST(FilterBuilderTest, VerticalCropFollowsTrajectory) {
  RenderOptions options;
  options.layout = Layout::Vertical;
  SegmentAssets assets;
  CropTrajectory crop;
  crop.crop_width = 1080;
  crop.keyframes = {{0.0, 0.3}, {5.0, 0.7}};
  assets.crop = crop;

  auto inv = build(target_of({seg(0, 10)}, options), {assets});
  EXPECT_EQ(arg_of(inv.graph, "crop", "x"), crop.x_expression());
}

// **---- Effects ----**

TEST(FilterBuilderTest, EffectsAppearOnlyWhenEnabled) {
  auto plain = build(target_of({seg(0, 10)}));
  EXPECT_EQ(plain.graph.count("hflip"), 0);
  EXPECT_EQ(plain.graph.count("eq"), 0);
  EXPECT_EQ(plain.graph.count("zoompan"), 0);
  EXPECT_EQ(plain.graph.count("atempo"), 0);
  EXPECT_EQ(plain.graph.count("anoisesrc"), 0);

  RenderOptions options;
  options.mirror = true;
  options.color_filter = true;
  options.ghost_effect = true;
  options.dynamic_zoom = true;
  auto fx = build(target_of({seg(0, 10)}, options));
  EXPECT_EQ(fx.graph.count("hflip"), 1);
  EXPECT_EQ(fx.graph.count("eq"), 2);
  EXPECT_EQ(fx.graph.count("zoompan"), 1);
}

TEST(FilterBuilderTest, SpeedChangesVideoAndAudioTempo) {
  RenderOptions options;
  options.speed = 1.1;
  auto inv = build(target_of({seg(0, 11)}, options));
  EXPECT_EQ(arg_of(inv.graph, "atempo", ""), "1.1000");
  EXPECT_NEAR(inv.expected_duration, 10.0, 1e-9);

  bool found = false;
  for (const auto *n : nodes_of(inv.graph, "setpts")) {
    if (n->args[0].second == "PTS/1.1000")
      found = true;
  }
  EXPECT_TRUE(found);
}

TEST(FilterBuilderTest, PitchShiftResamplesJoinedAudio) {
  RenderOptions options;
  options.pitch_shift = 1.05;
  auto inv = build(target_of({seg(0, 10), seg(20, 30)}, options));
  EXPECT_EQ(inv.graph.count("asetrate"), 1);
  EXPECT_EQ(arg_of(inv.graph, "asetrate", ""), "46305");
  EXPECT_EQ(arg_of(inv.graph, "aresample", ""), "44100");
}

TEST(FilterBuilderTest, BackgroundNoiseIsMixedIn) {
  RenderOptions options;
  options.background_noise = 0.1;
  auto inv = build(target_of({seg(0, 10)}, options));
  EXPECT_EQ(inv.graph.count("anoisesrc"), 1);
  EXPECT_EQ(inv.graph.count("amix"), 1);
  EXPECT_EQ(arg_of(inv.graph, "anoisesrc", "a"), "0.1000");
  EXPECT_EQ(arg_of(inv.graph, "anoisesrc", "d"), "11.000");
  EXPECT_EQ(inv.graph.nodes().back().filter, "volume");
}

TEST(FilterBuilderTest, SilentSourceGetsGeneratedAudio) {
  SourceMedia silent = landscape();
  silent.has_audio = false;
  auto inv = build(target_of({seg(0, 10), seg(20, 30)}), {}, silent);
  EXPECT_EQ(inv.graph.count("anullsrc"), 2);
  EXPECT_NO_THROW(inv.graph.validate());
}

// **---- Captions ----**

TEST(FilterBuilderTest, CaptionsNeedOptionAndCues) {
  SegmentAssets assets;
  assets.captions = {{0.5, 1.5, "hello there"}, {2.0, 3.0, "friend"}};

  auto off = build(target_of({seg(0, 10)}), {assets});
  EXPECT_EQ(off.graph.count("drawtext"), 0);

  RenderOptions options;
  options.captions = true;
  options.caption_style = CaptionStyle::Bold;
  auto on = build(target_of({seg(0, 10)}, options), {assets});
  ASSERT_EQ(on.graph.count("drawtext"), 2);
  EXPECT_EQ(arg_of(on.graph, "drawtext", "text"), "HELLO THERE");
  EXPECT_EQ(arg_of(on.graph, "drawtext", "enable"), "between(t,0.500,1.500)");
  EXPECT_EQ(arg_of(on.graph, "drawtext", "font"), "Sans:style=Bold");

  auto none = build(target_of({seg(0, 10)}, options), {SegmentAssets{}});
  EXPECT_EQ(none.graph.count("drawtext"), 0);
}

TEST(FilterBuilderTest, CaptionStyleScalesWithHeight) {
  CaptionStyleSpec full = caption_style_spec(CaptionStyle::Classic, 1920);
  EXPECT_EQ(full.font_size, 64);
  EXPECT_EQ(full.bottom_margin, 320);
  CaptionStyleSpec half = caption_style_spec(CaptionStyle::Box, 960);
  EXPECT_EQ(half.font_size, 30);
  EXPECT_TRUE(half.box);
  EXPECT_EQ(half.box_border, 9);
}

// **---- Errors & Determinism ----**

TEST(FilterBuilderTest, RejectsMismatchedAssetsAndEmptyTargets) {
  EXPECT_THROW(build(target_of({seg(0, 10), seg(20, 30)}), {SegmentAssets{}}),
               RenderError);
  EXPECT_THROW(build(target_of({})), RenderError);
}

TEST(FilterBuilderTest, SameTargetSameGraph) {
  RenderOptions options;
  options.mirror = true;
  options.pitch_shift = 0.95;
  RenderTarget target = target_of({seg(0, 10), seg(20, 35)}, options);
  auto a = build(target);
  auto b = build(target);
  EXPECT_TRUE(a.graph == b.graph);
  EXPECT_EQ(a.graph.serialize(), b.graph.serialize());
  EXPECT_EQ(a.output_args, b.output_args);
}

TEST(FilterBuilderTest, OutputArgsMapFinalPads) {
  auto inv = build(target_of({seg(0, 10)}));
  ASSERT_GE(inv.output_args.size(), 4u);
  EXPECT_EQ(inv.output_args[0], "-map");
  EXPECT_EQ(inv.output_args[1], "[" + inv.video_out + "]");
  EXPECT_EQ(inv.output_args[3], "[" + inv.audio_out + "]");
}

} // anonymous namespace
} // namespace reel_cutter
