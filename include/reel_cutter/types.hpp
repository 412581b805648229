/**
 * @file types.hpp
 * @brief Core data types shared across reel_cutter
 *
 * @details Contains the value types that flow through the pipeline:
 *          - Segment for source time ranges
 *
 *          - RenderOptions for layout and effect switches
 *
 *          - RenderTarget and RenderPlan produced by the compiler
 *
 *          - SourceMedia metadata probed from the downloaded file
 */

#ifndef REEL_CUTTER_TYPES_HPP
#define REEL_CUTTER_TYPES_HPP

#include <optional>
#include <string>
#include <vector>

namespace reel_cutter {

// **----- ENUMERATIONS -----**

/// Visual layout of an output clip.
enum class Layout { BlurZoom, Vertical, Horizontal, Blur };

/// Caption look, mapped to drawtext settings by a lookup table.
enum class CaptionStyle { Classic, Bold, Box };

/// Distribution bracket of a generated clip.
enum class Platform { Universal, YoutubeShorts, TiktokInstagram };

const char *to_string(Layout layout);
const char *to_string(CaptionStyle style);
const char *to_string(Platform platform);

/// @return parsed value, or std::nullopt for an unknown name
std::optional<Layout> parse_layout(const std::string &name);
std::optional<CaptionStyle> parse_caption_style(const std::string &name);

// **----- DATA STRUCTURES -----**

/**
 * @struct Segment
 * @brief A time range [start, end) in seconds on the source timeline.
 * @note Used both for independent clips and for pieces of a combined edit.
 */
struct Segment {
  double start = 0.0;                     //< Start time in seconds
  double end = 0.0;                       //< End time in seconds
  std::optional<std::string> title;       //< Optional clip title
  std::optional<std::string> description; //< Optional AI rationale

  double duration() const { return end - start; }
};

/**
 * @struct RenderOptions
 * @brief Layout and effect switches for one request.
 * @note Defaults match an options-less request.
 */
struct RenderOptions {
  Layout layout = Layout::BlurZoom;
  int max_clips = 1;
  int zoom_level = 1400;      //< Foreground width in pixels (blur_zoom)
  double fade_duration = 1.0; //< Crossfade length between segments
  int width = 1080;
  int height = 1920;
  bool mirror = false;
  double speed = 1.0;
  double pitch_shift = 1.0;
  double background_noise = 0.0; //< Pink noise amplitude, 0 = off
  bool color_filter = false;
  bool ghost_effect = false;
  bool dynamic_zoom = false;
  bool face_tracking = false;
  bool captions = false;
  CaptionStyle caption_style = CaptionStyle::Classic;
};

/**
 * @struct RenderTarget
 * @brief One desired output video.
 */
struct RenderTarget {
  int index = 1;                 //< 1-based position in the plan
  std::string title;             //< Output title
  Platform platform = Platform::Universal;
  std::vector<Segment> segments; //< Ordered pieces of the output
  RenderOptions options;
  bool trimmed = false;          //< Set when the duration cap shortened it
};

/**
 * @struct RenderPlan
 * @brief Ordered list of targets derived from one request.
 */
struct RenderPlan {
  std::vector<RenderTarget> targets;
};

/**
 * @struct SourceMedia
 * @brief Metadata probed from the downloaded source.
 * @note duration <= 0 means unknown.
 */
struct SourceMedia {
  double duration = 0.0;
  int width = 0;
  int height = 0;
  double fps = 0.0;
  bool has_audio = true;
};

} // namespace reel_cutter

#endif // REEL_CUTTER_TYPES_HPP
