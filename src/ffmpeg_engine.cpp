/**
 * @file ffmpeg_engine.cpp
 * @brief libavformat probing and ffmpeg process execution
 */

#include "reel_cutter/ffmpeg_engine.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <system_error>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "reel_cutter/errors.hpp"
#include "reel_cutter/logging.hpp"
#include "reel_cutter/system.hpp"

namespace reel_cutter {

// **---- Probing ----**

namespace {

/// Closes the format context on every exit path
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

SourceMedia probe_media(const std::string &path) {
  TIMER_START(probe);

  FormatContextGuard guard;
  if (avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr) < 0) {
    throw SourceError(fmt::format("cannot open media file {}", path));
  }
  if (avformat_find_stream_info(guard.ctx, nullptr) < 0) {
    throw SourceError(fmt::format("cannot read stream info of {}", path));
  }

  int video_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    throw SourceError(fmt::format("no video stream in {}", path));
  }
  int audio_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);

  SourceMedia media;
  media.duration = (guard.ctx->duration != AV_NOPTS_VALUE)
                       ? guard.ctx->duration / static_cast<double>(AV_TIME_BASE)
                       : 0.0;

  const AVStream *vs = guard.ctx->streams[video_idx];
  media.width = vs->codecpar->width;
  media.height = vs->codecpar->height;
  AVRational r = vs->avg_frame_rate;
  media.fps = (r.den > 0 && r.num > 0) ? av_q2d(r) : 25.0;
  media.has_audio = audio_idx >= 0;

  TIMER_END(probe, "probe");
  return media;
}

// **---- FfmpegEngine ----**

FfmpegEngine::FfmpegEngine(std::string ffmpeg_path, int timeout_sec)
    : ffmpeg_(std::move(ffmpeg_path)), timeout_sec_(timeout_sec) {}

SourceMedia FfmpegEngine::probe(const std::string &path) {
  return probe_media(path);
}

std::string FfmpegEngine::build_command(const EngineInvocation &invocation,
                                        const std::string &script_path) const {
  std::string cmd = fmt::format(
      "{} -y -hide_banner -loglevel error -i {} -filter_complex_script {}",
      shell_quote(ffmpeg_), shell_quote(invocation.input_path),
      shell_quote(script_path));
  for (const auto &arg : invocation.output_args) {
    cmd += ' ';
    cmd += shell_quote(arg);
  }
  cmd += ' ';
  cmd += shell_quote(invocation.output_path);

  return with_timeout(cmd, timeout_sec_);
}

void FfmpegEngine::render(const EngineInvocation &invocation) {
  TIMER_START(ffmpeg);

  std::unique_ptr<MemFile> script;
  try {
    script = std::make_unique<MemFile>("filter_script",
                                       invocation.graph.serialize());
  } catch (const std::system_error &e) {
    throw RenderError(e.what());
  }

  const std::string cmd = build_command(invocation, script->path());
  LOG_INFO("Running FFmpeg -> {}", invocation.output_path);

  int status = std::system(cmd.c_str());
  int exit_code = exit_code_of(status);

  TIMER_END(ffmpeg, "ffmpeg");

  if (exit_code == kTimeoutExitCode) {
    throw TimeoutError(fmt::format("ffmpeg exceeded {}s rendering {}",
                                   timeout_sec_, invocation.output_path));
  }
  if (exit_code != 0) {
    throw RenderError(fmt::format("ffmpeg exited with error code: {}",
                                  exit_code));
  }

  std::error_code ec;
  if (!std::filesystem::exists(invocation.output_path, ec) ||
      std::filesystem::file_size(invocation.output_path, ec) == 0) {
    throw RenderError(
        fmt::format("ffmpeg produced no output at {}", invocation.output_path));
  }
  LOG_SUCCESS("Output saved to: {}", invocation.output_path);
}

} // namespace reel_cutter
