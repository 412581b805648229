/**
 * @file providers.hpp
 * @brief Interfaces of the external collaborators
 *
 * @details The orchestrator only talks to these abstractions:
 *
 *          - SourceProvider: fetch the source, publish outputs
 *
 *          - AnalysisProvider: AI highlight discovery
 *
 *          - TranscriptionProvider: word-level transcripts
 *
 *          - FaceDetector: sampled face-centre positions
 *
 *          - MediaEngine: probe media, execute a compiled invocation
 *
 *          - Notifier: terminal webhook delivery
 *
 *          Implementations report failures with the matching PipelineError
 *          subclass.
 */

#ifndef REEL_CUTTER_PROVIDERS_HPP
#define REEL_CUTTER_PROVIDERS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis.hpp"
#include "caption_planner.hpp"
#include "face_tracking.hpp"
#include "filter_builder.hpp"
#include "types.hpp"

namespace reel_cutter {

/**
 * @struct UploadedFile
 * @brief Where a published output ended up.
 */
struct UploadedFile {
  std::string id;
  std::string name;
  std::string link;
};

class SourceProvider {
public:
  virtual ~SourceProvider() = default;

  /**
   * @brief Copy the source into dest.
   * @throws SourceError on not-found or transfer failure
   */
  virtual void download(const std::string &source_id,
                        const std::string &dest_path) = 0;

  /**
   * @brief Publish a rendered file.
   * @param folder Destination folder, empty for the default
   * @throws SourceError
   */
  virtual UploadedFile upload(const std::string &path, const std::string &name,
                              const std::string &folder) = 0;
};

class AnalysisProvider {
public:
  virtual ~AnalysisProvider() = default;

  /**
   * @brief Ask for highlight clips.
   * @param registry Receives every artifact the provider keeps for this call
   * @return Raw provider response text
   * @throws AnalysisError, TimeoutError
   */
  virtual std::string analyze(const std::string &media_path,
                              const std::optional<std::string> &instruction,
                              int clip_count, std::chrono::seconds timeout,
                              ArtifactRegistry &registry) = 0;

  /// Release one artifact recorded during analyze()
  virtual void release(const std::string &artifact) = 0;
};

class TranscriptionProvider {
public:
  virtual ~TranscriptionProvider() = default;

  virtual std::string name() const = 0;

  /**
   * @brief Transcribe a source range.
   * @return Words on the source timeline
   * @throws TranscriptionError
   */
  virtual Transcript transcribe(const std::string &media_path,
                                const Segment &segment) = 0;
};

class FaceDetector {
public:
  virtual ~FaceDetector() = default;

  /// Face-centre samples for a source range at sample_fps
  virtual std::vector<FaceSample> detect(const std::string &media_path,
                                         const Segment &segment,
                                         double sample_fps) = 0;
};

class MediaEngine {
public:
  virtual ~MediaEngine() = default;

  /**
   * @brief Read duration, dimensions, frame rate and audio presence.
   * @throws SourceError if the file is not readable media
   */
  virtual SourceMedia probe(const std::string &path) = 0;

  /**
   * @brief Execute one compiled invocation; blocks until the output exists.
   * @throws RenderError, TimeoutError
   */
  virtual void render(const EngineInvocation &invocation) = 0;
};

class Notifier {
public:
  virtual ~Notifier() = default;

  /**
   * @brief Deliver a terminal payload.
   * @throws NotifyError once delivery is given up
   */
  virtual void notify(const std::string &url, const nlohmann::json &payload) = 0;
};

} // namespace reel_cutter

#endif // REEL_CUTTER_PROVIDERS_HPP
