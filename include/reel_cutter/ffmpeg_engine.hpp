/**
 * @file ffmpeg_engine.hpp
 * @brief Media Engine backed by libavformat probing and the ffmpeg binary
 *
 * @details Separate module for everything that touches real media:
 *
 *          - probe_media(): duration, dimensions, frame rate and audio
 *            presence via libavformat
 *
 *          - FfmpegEngine::render(): writes the serialized graph to a memory
 *            file and runs ffmpeg with -filter_complex_script, bounded by
 *            `timeout`
 */

#ifndef REEL_CUTTER_FFMPEG_ENGINE_HPP
#define REEL_CUTTER_FFMPEG_ENGINE_HPP

#include <string>

#include "providers.hpp"

namespace reel_cutter {

/**
 * @brief Probe a media file with libavformat.
 * @throws SourceError if the file cannot be opened or has no video stream
 */
SourceMedia probe_media(const std::string &path);

/**
 * @class FfmpegEngine
 * @brief MediaEngine running one ffmpeg process per invocation.
 */
class FfmpegEngine : public MediaEngine {
public:
  /**
   * @param ffmpeg_path Binary to run
   * @param timeout_sec Per-invocation ceiling (0 = none)
   */
  FfmpegEngine(std::string ffmpeg_path, int timeout_sec);

  SourceMedia probe(const std::string &path) override;
  void render(const EngineInvocation &invocation) override;

  /**
   * @brief Full shell command for an invocation.
   * @param script_path Where ffmpeg reads the filter graph from
   */
  std::string build_command(const EngineInvocation &invocation,
                            const std::string &script_path) const;

private:
  std::string ffmpeg_;
  int timeout_sec_;
};

} // namespace reel_cutter

#endif // REEL_CUTTER_FFMPEG_ENGINE_HPP
