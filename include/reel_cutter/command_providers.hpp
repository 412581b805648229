/**
 * @file command_providers.hpp
 * @brief Collaborators backed by the local filesystem and external commands
 *
 * @details Used by the CLI. Each command provider runs a configured program
 *          through the shell and reads JSON from its standard output:
 *
 *          - analysis: `<cmd> <video> <clip_count> [<instruction>]`, released
 *            with `<cmd> --release <artifact>`
 *
 *          - transcription: `<cmd> <media> <start> <end>`
 *
 *          - face detection: `<cmd> <media> <start> <end> <sample_fps>`
 */

#ifndef REEL_CUTTER_COMMAND_PROVIDERS_HPP
#define REEL_CUTTER_COMMAND_PROVIDERS_HPP

#include <filesystem>
#include <string>

#include "providers.hpp"

namespace reel_cutter {

/**
 * @class LocalSourceProvider
 * @brief Sources are files under a directory; uploads are copies into
 *        another one.
 */
class LocalSourceProvider : public SourceProvider {
public:
  LocalSourceProvider(std::filesystem::path source_dir,
                      std::filesystem::path output_dir);

  void download(const std::string &source_id,
                const std::string &dest_path) override;
  UploadedFile upload(const std::string &path, const std::string &name,
                      const std::string &folder) override;

private:
  std::filesystem::path source_dir_;
  std::filesystem::path output_dir_;
};

class CommandAnalysisProvider : public AnalysisProvider {
public:
  explicit CommandAnalysisProvider(std::string command)
      : command_(std::move(command)) {}

  std::string analyze(const std::string &media_path,
                      const std::optional<std::string> &instruction,
                      int clip_count, std::chrono::seconds timeout,
                      ArtifactRegistry &registry) override;
  void release(const std::string &artifact) override;

private:
  std::string command_;
};

class CommandTranscriptionProvider : public TranscriptionProvider {
public:
  CommandTranscriptionProvider(std::string name, std::string command)
      : name_(std::move(name)), command_(std::move(command)) {}

  std::string name() const override { return name_; }
  Transcript transcribe(const std::string &media_path,
                        const Segment &segment) override;

private:
  std::string name_;
  std::string command_;
};

class CommandFaceDetector : public FaceDetector {
public:
  explicit CommandFaceDetector(std::string command)
      : command_(std::move(command)) {}

  std::vector<FaceSample> detect(const std::string &media_path,
                                 const Segment &segment,
                                 double sample_fps) override;

private:
  std::string command_;
};

/// Parse `{"words":[{"start","end","text"}]}`; throws TranscriptionError
Transcript parse_transcript_json(const std::string &text);

/// Parse `[{"t": s, "x": 0..1 | null}]`; throws RenderError
std::vector<FaceSample> parse_face_samples_json(const std::string &text);

} // namespace reel_cutter

#endif // REEL_CUTTER_COMMAND_PROVIDERS_HPP
