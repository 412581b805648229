/**
 * @file command_providers.cpp
 * @brief Filesystem and external-command collaborators
 */

#include "reel_cutter/command_providers.hpp"

#include <optional>
#include <system_error>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "reel_cutter/errors.hpp"
#include "reel_cutter/logging.hpp"
#include "reel_cutter/system.hpp"

namespace reel_cutter {

namespace fs = std::filesystem;
using nlohmann::json;

// **---- LocalSourceProvider ----**

namespace {

/**
 * @brief Resolve a request-supplied relative path under a root directory.
 * @return Normalised path, or nullopt when the path is absolute or resolves
 *         (through ".." or symlinks) outside the root
 */
std::optional<fs::path> contained_path(const fs::path &root,
                                       const std::string &relative) {
  if (fs::path(relative).is_absolute())
    return std::nullopt;

  std::error_code ec;
  fs::path base = fs::weakly_canonical(fs::absolute(root, ec), ec);
  if (ec)
    return std::nullopt;
  fs::path candidate = fs::weakly_canonical(base / relative, ec);
  if (ec)
    return std::nullopt;

  auto b = base.begin();
  auto c = candidate.begin();
  for (; b != base.end(); ++b, ++c) {
    /// weakly_canonical may leave a trailing empty element on the root
    if (b->empty())
      continue;
    if (c == candidate.end() || *b != *c)
      return std::nullopt;
  }
  return candidate;
}

} // anonymous namespace

LocalSourceProvider::LocalSourceProvider(fs::path source_dir,
                                         fs::path output_dir)
    : source_dir_(std::move(source_dir)), output_dir_(std::move(output_dir)) {}

void LocalSourceProvider::download(const std::string &source_id,
                                   const std::string &dest_path) {
  std::optional<fs::path> src = contained_path(source_dir_, source_id);
  if (!src) {
    throw SourceError(
        fmt::format("source '{}' is outside the source directory", source_id));
  }
  std::error_code ec;
  if (!fs::is_regular_file(*src, ec)) {
    throw SourceError(fmt::format("source '{}' not found", source_id));
  }
  fs::copy_file(*src, dest_path, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw SourceError(
        fmt::format("failed to fetch '{}': {}", source_id, ec.message()));
  }
}

UploadedFile LocalSourceProvider::upload(const std::string &path,
                                         const std::string &name,
                                         const std::string &folder) {
  const std::string relative =
      folder.empty() ? name : (fs::path(folder) / name).string();
  std::optional<fs::path> dest = contained_path(output_dir_, relative);
  if (!dest) {
    throw SourceError(fmt::format(
        "destination '{}' is outside the output directory", relative));
  }

  std::error_code ec;
  fs::create_directories(dest->parent_path(), ec);
  if (!ec)
    fs::copy_file(path, *dest, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    throw SourceError(
        fmt::format("failed to publish {}: {}", name, ec.message()));
  }

  UploadedFile file;
  file.id = fs::path(relative).lexically_normal().string();
  file.name = name;
  file.link = "file://" + dest->string();
  return file;
}

// **---- CommandAnalysisProvider ----**

std::string CommandAnalysisProvider::analyze(
    const std::string &media_path,
    const std::optional<std::string> &instruction, int clip_count,
    std::chrono::seconds timeout, ArtifactRegistry &registry) {
  if (command_.empty())
    throw AnalysisError("no analysis command configured");

  std::string cmd = fmt::format("{} {} {}", command_, shell_quote(media_path),
                                clip_count);
  if (instruction)
    cmd += " " + shell_quote(*instruction);

  CommandResult res;
  try {
    res = run_capture(with_timeout(cmd, static_cast<int>(timeout.count())));
  } catch (const std::system_error &e) {
    throw AnalysisError(e.what());
  }
  if (res.exit_code == kTimeoutExitCode) {
    throw TimeoutError(
        fmt::format("analysis exceeded {}s", static_cast<long>(timeout.count())));
  }
  if (res.exit_code != 0) {
    throw AnalysisError(
        fmt::format("analysis command exited with code {}", res.exit_code));
  }

  /// Envelope form: {"artifacts": [...], "response": ...}
  json doc = json::parse(res.output, nullptr, false);
  if (doc.is_object() && doc.contains("response")) {
    if (doc.contains("artifacts") && doc["artifacts"].is_array()) {
      for (const auto &a : doc["artifacts"]) {
        if (a.is_string())
          registry.add(a.get<std::string>());
      }
    }
    const json &response = doc["response"];
    return response.is_string() ? response.get<std::string>() : response.dump();
  }
  return res.output;
}

void CommandAnalysisProvider::release(const std::string &artifact) {
  std::string cmd =
      fmt::format("{} --release {}", command_, shell_quote(artifact));
  CommandResult res;
  try {
    res = run_capture(cmd);
  } catch (const std::system_error &e) {
    throw AnalysisError(e.what());
  }
  if (res.exit_code != 0) {
    throw AnalysisError(fmt::format("release of '{}' exited with code {}",
                                    artifact, res.exit_code));
  }
}

// **---- CommandTranscriptionProvider ----**

Transcript parse_transcript_json(const std::string &text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object() || !doc.contains("words") ||
      !doc["words"].is_array()) {
    throw TranscriptionError("transcription output is not {\"words\": [...]}");
  }

  Transcript t;
  for (const auto &w : doc["words"]) {
    if (!w.is_object() || !w.contains("start") || !w.contains("end") ||
        !w.contains("text") || !w["start"].is_number() ||
        !w["end"].is_number() || !w["text"].is_string())
      continue;
    t.words.push_back({w["start"].get<double>(), w["end"].get<double>(),
                       w["text"].get<std::string>()});
  }
  return t;
}

Transcript CommandTranscriptionProvider::transcribe(const std::string &media_path,
                                                    const Segment &segment) {
  if (command_.empty())
    throw TranscriptionError(fmt::format("{}: no command configured", name_));

  std::string cmd =
      fmt::format("{} {} {:.3f} {:.3f}", command_, shell_quote(media_path),
                  segment.start, segment.end);
  CommandResult res;
  try {
    res = run_capture(cmd);
  } catch (const std::system_error &e) {
    throw TranscriptionError(e.what());
  }
  if (res.exit_code != 0) {
    throw TranscriptionError(
        fmt::format("{} exited with code {}", name_, res.exit_code));
  }
  return parse_transcript_json(res.output);
}

// **---- CommandFaceDetector ----**

std::vector<FaceSample> parse_face_samples_json(const std::string &text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_array())
    throw RenderError("face detection output is not a JSON array");

  std::vector<FaceSample> samples;
  for (const auto &s : doc) {
    if (!s.is_object() || !s.contains("t") || !s["t"].is_number())
      continue;
    FaceSample sample;
    sample.t = s["t"].get<double>();
    if (s.contains("x") && s["x"].is_number())
      sample.x = s["x"].get<double>();
    samples.push_back(sample);
  }
  return samples;
}

std::vector<FaceSample> CommandFaceDetector::detect(const std::string &media_path,
                                                    const Segment &segment,
                                                    double sample_fps) {
  if (command_.empty())
    throw RenderError("no face detection command configured");

  std::string cmd =
      fmt::format("{} {} {:.3f} {:.3f} {}", command_, shell_quote(media_path),
                  segment.start, segment.end, sample_fps);
  CommandResult res;
  try {
    res = run_capture(cmd);
  } catch (const std::system_error &e) {
    throw RenderError(e.what());
  }
  if (res.exit_code != 0) {
    throw RenderError(
        fmt::format("face detection exited with code {}", res.exit_code));
  }
  return parse_face_samples_json(res.output);
}

} // namespace reel_cutter
