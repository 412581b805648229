/**
 * @file types.cpp
 * @brief Name tables for the core enumerations
 */

#include "reel_cutter/types.hpp"

namespace reel_cutter {

const char *to_string(Layout layout) {
  switch (layout) {
  case Layout::BlurZoom:
    return "blur_zoom";
  case Layout::Vertical:
    return "vertical";
  case Layout::Horizontal:
    return "horizontal";
  case Layout::Blur:
    return "blur";
  }
  return "blur_zoom";
}

const char *to_string(CaptionStyle style) {
  switch (style) {
  case CaptionStyle::Classic:
    return "classic";
  case CaptionStyle::Bold:
    return "bold";
  case CaptionStyle::Box:
    return "box";
  }
  return "classic";
}

const char *to_string(Platform platform) {
  switch (platform) {
  case Platform::Universal:
    return "universal";
  case Platform::YoutubeShorts:
    return "youtube_shorts";
  case Platform::TiktokInstagram:
    return "tiktok_instagram";
  }
  return "universal";
}

std::optional<Layout> parse_layout(const std::string &name) {
  if (name == "blur_zoom")
    return Layout::BlurZoom;
  if (name == "vertical")
    return Layout::Vertical;
  if (name == "horizontal")
    return Layout::Horizontal;
  if (name == "blur")
    return Layout::Blur;
  return std::nullopt;
}

std::optional<CaptionStyle> parse_caption_style(const std::string &name) {
  if (name == "classic")
    return CaptionStyle::Classic;
  if (name == "bold")
    return CaptionStyle::Bold;
  if (name == "box")
    return CaptionStyle::Box;
  return std::nullopt;
}

} // namespace reel_cutter
