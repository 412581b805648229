/**
 * @file filter_builder.hpp
 * @brief RenderTarget to Media Engine invocation
 *
 * @details Compiles one RenderTarget into a FilterGraph plus ffmpeg output
 *          arguments. Each segment is filtered independently:
 *
 *          - trim / timestamp reset / fps normalisation
 *
 *          - layout (blur_zoom, vertical, horizontal, blur) with an optional
 *            face-tracking crop offset
 *
 *          - dynamic zoom, mirror, color filter, ghost pulse
 *
 *          - caption overlays
 *
 *          - speed change
 *
 *          Segments are then joined with xfade/acrossfade, or concat where a
 *          crossfade would be invalid, and the joined audio gets pitch shift
 *          and background noise.
 */

#ifndef REEL_CUTTER_FILTER_BUILDER_HPP
#define REEL_CUTTER_FILTER_BUILDER_HPP

#include <optional>
#include <string>
#include <vector>

#include "caption_planner.hpp"
#include "face_tracking.hpp"
#include "filter_graph.hpp"
#include "types.hpp"

namespace reel_cutter {

/// Sample rate every audio chain is normalised to
constexpr int kAudioSampleRate = 44100;

/**
 * @struct BuildSettings
 * @brief Encoder and caption settings shared by every invocation.
 */
struct BuildSettings {
  int fps = 30;
  std::string video_bitrate = "5M";
  std::string audio_bitrate = "192k";
  std::string preset = "medium";
  int crf = 23;
  std::string caption_font = "Sans";

  static BuildSettings from_config();
};

/**
 * @struct CaptionStyleSpec
 * @brief drawtext settings for one caption style.
 */
struct CaptionStyleSpec {
  bool bold = false;
  bool uppercase = false;
  int font_size = 0;
  int border_width = 0;
  bool box = false;
  int box_border = 0;
  int bottom_margin = 0;
};

/**
 * @brief Style lookup, sizes scaled to the output height (1920 = 1.0).
 */
CaptionStyleSpec caption_style_spec(CaptionStyle style, int height);

/**
 * @struct SegmentAssets
 * @brief Per-segment inputs produced before the build.
 */
struct SegmentAssets {
  std::vector<CaptionCue> captions;   //< Segment-local cue times
  std::optional<CropTrajectory> crop; //< Face-tracking crop, if usable
};

/**
 * @struct Transition
 * @brief How two adjacent segments were joined.
 */
struct Transition {
  int boundary = 0;      //< Index of the left segment
  bool crossfade = false;
  double duration = 0.0; //< Crossfade length, 0 for a hard cut
  double offset = 0.0;   //< xfade offset on the joined timeline
};

/**
 * @struct EngineInvocation
 * @brief Everything the Media Engine needs to render one target.
 */
struct EngineInvocation {
  std::string input_path;
  std::string output_path;
  FilterGraph graph;
  std::string video_out; //< Final video pad
  std::string audio_out; //< Final audio pad
  std::vector<std::string> output_args;
  double expected_duration = 0.0;
  std::vector<Transition> transitions;
};

/**
 * @brief Compile one target.
 *
 * @param assets Empty, or one entry per segment
 * @throws RenderError if the graph fails validation
 */
EngineInvocation build_invocation(const RenderTarget &target,
                                  const SourceMedia &source,
                                  const std::vector<SegmentAssets> &assets,
                                  const std::string &input_path,
                                  const std::string &output_path,
                                  const BuildSettings &settings);

} // namespace reel_cutter

#endif // REEL_CUTTER_FILTER_BUILDER_HPP
