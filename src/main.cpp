/**
 * @file main.cpp
 * @brief Entry point for the Reel Cutter CLI
 *
 * @details Runs one job end to end:
 *
 *          - Reads a request document from the given JSON file
 *
 *          - Wires the configured collaborators (local source directory,
 *            command-based analysis, transcription and face detection,
 *            ffmpeg, curl webhooks) into a JobService
 *
 *          - Polls the job, printing progress; Ctrl+C requests cancellation
 *
 *          - Prints the final status document and the timing table
 *
 * @note Exit code is 0 only when the job completed.
 */

#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <thread>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "reel_cutter/command_providers.hpp"
#include "reel_cutter/config.hpp"
#include "reel_cutter/errors.hpp"
#include "reel_cutter/ffmpeg_engine.hpp"
#include "reel_cutter/job_service.hpp"
#include "reel_cutter/logging.hpp"
#include "reel_cutter/notifier.hpp"

using namespace reel_cutter;
using nlohmann::json;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) { g_interrupted = 1; }

Collaborators configured_collaborators() {
  Collaborators io;
  io.source = std::make_shared<LocalSourceProvider>(Config::source_dir(),
                                                    Config::output_dir());
  io.analysis =
      std::make_shared<CommandAnalysisProvider>(Config::analysis_command());
  io.transcription = std::make_shared<CommandTranscriptionProvider>(
      "transcribe", Config::transcribe_command());
  if (!Config::transcribe_fallback_command().empty()) {
    io.transcription_fallback = std::make_shared<CommandTranscriptionProvider>(
        "transcribe-fallback", Config::transcribe_fallback_command());
  }
  if (!Config::face_detect_command().empty()) {
    io.faces =
        std::make_shared<CommandFaceDetector>(Config::face_detect_command());
  }
  io.engine = std::make_shared<FfmpegEngine>(Config::ffmpeg_path(),
                                             Config::render_timeout_sec());
  io.notifier = std::make_shared<WebhookNotifier>(
      std::make_shared<CurlTransport>(Config::curl_path()),
      RetryPolicy::webhook_default(),
      std::chrono::seconds(Config::webhook_timeout_sec()));
  return io;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    LOG_WARN("Usage: ./reel_cutter <request.json>");
    return 1;
  }

  std::ifstream in(argv[1]);
  if (!in) {
    LOG_ERROR("Cannot open {}", argv[1]);
    return 1;
  }
  json request = json::parse(in, nullptr, false);
  if (request.is_discarded()) {
    LOG_ERROR("{} is not valid JSON", argv[1]);
    return 1;
  }

  LOG_INFO("Reel Cutter - Single Job Mode");
  LOG_INFO("Sources: {}", Config::source_dir());
  LOG_INFO("Outputs: {}", Config::output_dir());

  JobService service(configured_collaborators(),
                     OrchestratorSettings::from_config(),
                     ServiceSettings::from_config());
  service.start();

  std::string job_id;
  try {
    job_id = service.submit(request).at("job_id").get<std::string>();
  } catch (const ValidationError &e) {
    LOG_ERROR("Invalid request: {}", e.what());
    return 2;
  }

  std::signal(SIGINT, on_interrupt);

  // **----- POLL UNTIL TERMINAL -----**

  json status;
  std::string last_line;
  bool cancel_sent = false;
  while (true) {
    if (g_interrupted && !cancel_sent) {
      cancel_sent = true;
      try {
        service.cancel(job_id);
      } catch (const InvalidStateError &e) {
        LOG_WARN("Cannot cancel: {}", e.what());
      }
    }

    status = service.status(job_id);
    const std::string state = status["status"].get<std::string>();
    const std::string line = fmt::format(
        "[{}] {}", state, status["progress_message"].get<std::string>());
    if (line != last_line) {
      LOG_INFO("{}", line);
      last_line = line;
    }
    if (state == "completed" || state == "error" || state == "cancelled")
      break;

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
  }

  /// Waits for the webhook delivery still running on the worker
  service.shutdown();
  status = service.status(job_id);

  fmt::print("{}\n", status.dump(2));
  TimingCollector::print_summary();

  return status["status"] == "completed" ? 0 : 1;
}
