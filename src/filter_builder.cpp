/**
 * @file filter_builder.cpp
 * @brief Filter graph construction for one RenderTarget
 */

#include "reel_cutter/filter_builder.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "reel_cutter/config.hpp"
#include "reel_cutter/errors.hpp"
#include "reel_cutter/render_plan.hpp"

namespace reel_cutter {

BuildSettings BuildSettings::from_config() {
  BuildSettings s;
  s.fps = Config::output_fps();
  s.video_bitrate = Config::video_bitrate();
  s.audio_bitrate = Config::audio_bitrate();
  s.caption_font = Config::caption_font();
  return s;
}

CaptionStyleSpec caption_style_spec(CaptionStyle style, int height) {
  const double scale = height / 1920.0;
  const auto px = [scale](double v) {
    return std::max(1, static_cast<int>(std::lround(v * scale)));
  };

  CaptionStyleSpec spec;
  spec.bottom_margin = px(320);
  switch (style) {
  case CaptionStyle::Classic:
    spec.font_size = px(64);
    spec.border_width = px(4);
    break;
  case CaptionStyle::Bold:
    spec.bold = true;
    spec.uppercase = true;
    spec.font_size = px(76);
    spec.border_width = px(6);
    break;
  case CaptionStyle::Box:
    spec.font_size = px(60);
    spec.box = true;
    spec.box_border = px(18);
    break;
  }
  return spec;
}

namespace {

std::string num(double v) { return fmt::format("{:.3f}", v); }

/**
 * @class Chain
 * @brief Linear run of single-input, single-output filters with generated
 *        pad names.
 */
class Chain {
public:
  Chain(FilterGraph &graph, std::string prefix, std::string label)
      : graph_(graph), prefix_(std::move(prefix)), label_(std::move(label)) {}

  Chain &then(const std::string &filter, FilterArgs args = {}) {
    std::string out = fmt::format("{}{}", prefix_, ++step_);
    graph_.add({filter, std::move(args), {label_}, {out}});
    label_ = out;
    return *this;
  }

  const std::string &label() const { return label_; }

  /// Continue from a pad produced outside the chain
  void reset(std::string label) { label_ = std::move(label); }

  std::string next_label() { return fmt::format("{}{}", prefix_, ++step_); }

private:
  FilterGraph &graph_;
  std::string prefix_;
  std::string label_;
  int step_ = 0;
};

std::string to_upper_ascii(std::string s) {
  for (auto &c : s) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u < 0x80)
      c = static_cast<char>(std::toupper(u));
  }
  return s;
}

// **---- Layouts ----**

/// Blurred, cover-scaled background branch
void blurred_background(Chain &bg, int w, int h) {
  const int sw = std::max(2, w / 4);
  const int sh = std::max(2, h / 4);
  bg.then("scale", {{"w", std::to_string(sw)},
                    {"h", std::to_string(sh)},
                    {"force_original_aspect_ratio", "increase"}})
      .then("crop", {{"w", std::to_string(sw)}, {"h", std::to_string(sh)}})
      .then("boxblur", {{"luma_radius", "20"},
                        {"luma_power", "2"},
                        {"chroma_radius", "20"},
                        {"chroma_power", "2"}})
      .then("scale", {{"w", std::to_string(w)}, {"h", std::to_string(h)}});
}

void apply_layout(FilterGraph &graph, Chain &v, const std::string &prefix,
                  const RenderOptions &opt, const SegmentAssets *assets) {
  const int w = opt.width;
  const int h = opt.height;
  const CropTrajectory *crop = (assets && assets->crop) ? &*assets->crop
                                                        : nullptr;

  switch (opt.layout) {
  case Layout::Horizontal:
    v.then("setsar", {{"", "1"}});
    return;

  case Layout::Vertical: {
    FilterArgs crop_args{{"w", std::to_string(w)}, {"h", std::to_string(h)}};
    if (crop)
      crop_args.push_back({"x", crop->x_expression()});
    v.then("scale", {{"w", std::to_string(w)},
                     {"h", std::to_string(h)},
                     {"force_original_aspect_ratio", "increase"}})
        .then("crop", std::move(crop_args))
        .then("setsar", {{"", "1"}});
    return;
  }

  case Layout::BlurZoom:
  case Layout::Blur: {
    std::string bg_src = prefix + "bgsrc";
    std::string fg_src = prefix + "fgsrc";
    graph.add({"split", {}, {v.label()}, {bg_src, fg_src}});

    Chain bg(graph, prefix + "bg", bg_src);
    blurred_background(bg, w, h);

    Chain fg(graph, prefix + "fg", fg_src);
    if (opt.layout == Layout::BlurZoom) {
      const int fg_w = std::min(w, opt.zoom_level);
      FilterArgs crop_args{{"w", std::to_string(fg_w)}, {"h", "ih"}};
      crop_args.push_back(
          {"x", crop ? crop->x_expression() : fmt::format("(iw-{})/2", fg_w)});
      crop_args.push_back({"y", "0"});
      fg.then("scale", {{"w", std::to_string(opt.zoom_level)}, {"h", "-2"}})
          .then("crop", std::move(crop_args));
    } else {
      fg.then("scale", {{"w", std::to_string(w)}, {"h", "-2"}});
    }

    std::string merged = v.next_label();
    graph.add({"overlay",
               {{"x", "(W-w)/2"}, {"y", "(H-h)/2"}},
               {bg.label(), fg.label()},
               {merged}});
    v.reset(merged);
    v.then("scale", {{"w", std::to_string(w)}, {"h", std::to_string(h)}})
        .then("setsar", {{"", "1"}});
    return;
  }
  }
}

// **---- Effects ----**

void apply_video_effects(Chain &v, const RenderOptions &opt, int fps) {
  if (opt.dynamic_zoom && opt.layout != Layout::Horizontal) {
    v.then("zoompan", {{"z", "1.02+0.01*sin(2*PI*it/5)"},
                       {"x", "iw/2-(iw/zoom/2)"},
                       {"y", "ih/2-(ih/zoom/2)"},
                       {"d", "1"},
                       {"s", fmt::format("{}x{}", opt.width, opt.height)},
                       {"fps", std::to_string(fps)}});
  }
  if (opt.mirror)
    v.then("hflip");
  if (opt.color_filter) {
    v.then("eq", {{"brightness", "0.04"},
                  {"contrast", "1.06"},
                  {"saturation", "1.12"}});
  }
  if (opt.ghost_effect) {
    v.then("eq",
           {{"brightness", "0.06"}, {"enable", "lt(mod(t,11),0.067)"}});
  }
}

void apply_captions(Chain &v, const std::vector<CaptionCue> &cues,
                    const RenderOptions &opt, const BuildSettings &settings) {
  if (!opt.captions || cues.empty())
    return;

  const CaptionStyleSpec style = caption_style_spec(opt.caption_style, opt.height);
  const std::string font =
      style.bold ? settings.caption_font + ":style=Bold" : settings.caption_font;

  for (const auto &cue : cues) {
    FilterArgs args{
        {"font", font},
        {"expansion", "none"},
        {"text", style.uppercase ? to_upper_ascii(cue.text) : cue.text},
        {"fontsize", std::to_string(style.font_size)},
        {"fontcolor", "white"},
    };
    if (style.border_width > 0) {
      args.push_back({"borderw", std::to_string(style.border_width)});
      args.push_back({"bordercolor", "black"});
    }
    if (style.box) {
      args.push_back({"box", "1"});
      args.push_back({"boxcolor", "black@0.6"});
      args.push_back({"boxborderw", std::to_string(style.box_border)});
    }
    args.push_back({"x", "(w-text_w)/2"});
    args.push_back({"y", fmt::format("h-text_h-{}", style.bottom_margin)});
    args.push_back(
        {"enable", fmt::format("between(t,{},{})", num(cue.start), num(cue.end))});
    v.then("drawtext", std::move(args));
  }
}

FilterArgs stereo_format() {
  return {{"sample_fmts", "fltp"},
          {"sample_rates", std::to_string(kAudioSampleRate)},
          {"channel_layouts", "stereo"}};
}

} // anonymous namespace

// **---- Invocation ----**

EngineInvocation build_invocation(const RenderTarget &target,
                                  const SourceMedia &source,
                                  const std::vector<SegmentAssets> &assets,
                                  const std::string &input_path,
                                  const std::string &output_path,
                                  const BuildSettings &settings) {
  const RenderOptions &opt = target.options;
  const auto &segments = target.segments;
  if (segments.empty())
    throw RenderError(fmt::format("target {} has no segments", target.index));
  if (!assets.empty() && assets.size() != segments.size())
    throw RenderError("segment assets do not match the segment list");

  EngineInvocation inv;
  inv.input_path = input_path;
  inv.output_path = output_path;
  FilterGraph &graph = inv.graph;
  graph.declare_input("0:v");
  if (source.has_audio)
    graph.declare_input("0:a");

  struct Piece {
    std::string video;
    std::string audio;
    double length; //< Output seconds, after speed
  };
  std::vector<Piece> pieces;

  try {
    for (size_t i = 0; i < segments.size(); ++i) {
      const Segment &seg = segments[i];
      const SegmentAssets *seg_assets = assets.empty() ? nullptr : &assets[i];
      const std::string vp = fmt::format("s{}v", i);
      const std::string ap = fmt::format("s{}a", i);

      /// Video
      Chain v(graph, vp, "0:v");
      v.then("trim", {{"start", num(seg.start)}, {"end", num(seg.end)}})
          .then("setpts", {{"", "PTS-STARTPTS"}})
          .then("fps", {{"", std::to_string(settings.fps)}});
      apply_layout(graph, v, vp, opt, seg_assets);
      apply_video_effects(v, opt, settings.fps);
      if (seg_assets)
        apply_captions(v, seg_assets->captions, opt, settings);
      if (opt.speed != 1.0)
        v.then("setpts", {{"", fmt::format("PTS/{:.4f}", opt.speed)}});
      v.then("format", {{"pix_fmts", "yuv420p"}}).then("setsar", {{"", "1"}});

      /// Audio
      std::string audio_src = "0:a";
      if (!source.has_audio) {
        audio_src = ap + "src";
        graph.add({"anullsrc",
                   {{"channel_layout", "stereo"},
                    {"sample_rate", std::to_string(kAudioSampleRate)}},
                   {},
                   {audio_src}});
      }
      Chain a(graph, ap, audio_src);
      if (source.has_audio) {
        a.then("atrim", {{"start", num(seg.start)}, {"end", num(seg.end)}});
      } else {
        a.then("atrim", {{"duration", num(seg.duration())}});
      }
      a.then("asetpts", {{"", "PTS-STARTPTS"}}).then("aformat", stereo_format());
      if (opt.speed != 1.0)
        a.then("atempo", {{"", fmt::format("{:.4f}", opt.speed)}});

      pieces.push_back({v.label(), a.label(), seg.duration() / opt.speed});
    }

    /// Join: running label/length of everything joined so far
    std::string cur_v = pieces[0].video;
    std::string cur_a = pieces[0].audio;
    double cur_len = pieces[0].length;
    for (size_t k = 1; k < pieces.size(); ++k) {
      const Piece &next = pieces[k];
      const double fade =
          effective_fade(pieces[k - 1].length, next.length, opt.fade_duration);
      const double offset = cur_len - fade;
      const std::string jv = fmt::format("j{}v", k);
      const std::string ja = fmt::format("j{}a", k);

      Transition tr;
      tr.boundary = static_cast<int>(k) - 1;
      if (fade > 0.0 && offset >= 0.0 && offset <= cur_len) {
        graph.add({"xfade",
                   {{"transition", "fade"},
                    {"duration", num(fade)},
                    {"offset", num(offset)}},
                   {cur_v, next.video},
                   {jv}});
        graph.add({"acrossfade",
                   {{"d", num(fade)}, {"c1", "tri"}, {"c2", "tri"}},
                   {cur_a, next.audio},
                   {ja}});
        tr.crossfade = true;
        tr.duration = fade;
        tr.offset = offset;
        cur_len += next.length - fade;
      } else {
        graph.add({"concat",
                   {{"n", "2"}, {"v", "1"}, {"a", "1"}},
                   {cur_v, cur_a, next.video, next.audio},
                   {jv, ja}});
        tr.offset = cur_len;
        cur_len += next.length;
      }
      inv.transitions.push_back(tr);
      cur_v = jv;
      cur_a = ja;
    }

    /// Joined audio: pitch, then noise
    Chain a(graph, "out_a", cur_a);
    if (opt.pitch_shift != 1.0) {
      const int rate =
          static_cast<int>(std::lround(kAudioSampleRate * opt.pitch_shift));
      a.then("asetrate", {{"", std::to_string(rate)}})
          .then("atempo", {{"", fmt::format("{:.6f}", 1.0 / opt.pitch_shift)}})
          .then("aresample", {{"", std::to_string(kAudioSampleRate)}});
    }
    if (opt.background_noise > 0.0) {
      graph.add({"anoisesrc",
                 {{"color", "pink"},
                  {"r", std::to_string(kAudioSampleRate)},
                  {"a", fmt::format("{:.4f}", opt.background_noise)},
                  {"d", num(std::ceil(cur_len) + 1.0)}},
                 {},
                 {"noise_src"}});
      Chain noise(graph, "noise", "noise_src");
      noise.then("aformat", stereo_format());

      std::string mixed = a.next_label();
      graph.add({"amix",
                 {{"inputs", "2"}, {"duration", "first"}},
                 {a.label(), noise.label()},
                 {mixed}});
      a.reset(mixed);
      a.then("volume", {{"", "2"}});
    }

    inv.video_out = cur_v;
    inv.audio_out = a.label();
    inv.expected_duration = cur_len;
    graph.mark_output(inv.video_out);
    graph.mark_output(inv.audio_out);
    graph.validate();
  } catch (const std::logic_error &e) {
    throw RenderError(fmt::format("invalid filter graph for target {}: {}",
                                  target.index, e.what()));
  }

  inv.output_args = {"-map",
                     fmt::format("[{}]", inv.video_out),
                     "-map",
                     fmt::format("[{}]", inv.audio_out),
                     "-c:v",
                     "libx264",
                     "-preset",
                     settings.preset,
                     "-crf",
                     std::to_string(settings.crf),
                     "-b:v",
                     settings.video_bitrate,
                     "-c:a",
                     "aac",
                     "-b:a",
                     settings.audio_bitrate,
                     "-r",
                     std::to_string(settings.fps),
                     "-pix_fmt",
                     "yuv420p",
                     "-movflags",
                     "+faststart"};
  return inv;
}

} // namespace reel_cutter
