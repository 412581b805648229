/**
 * @file orchestrator.hpp
 * @brief Job pipeline orchestration
 *
 * @details The Orchestrator drives one job through its stages:
 *
 *          1. downloading: fetch the source into a job work area, probe it
 *
 *          2. analyzing: AI discovery (analyze requests only)
 *
 *          3. processing: compile the plan, resolve captions and face
 *             tracking per segment, render every target
 *
 *          4. uploading: publish every rendered output
 *
 *          5. finishing: remove the work area, release analysis artifacts
 *
 *          Cancellation is checked at each stage boundary and before each
 *          target render. Whatever happens, finishing runs, the job reaches
 *          exactly one terminal status and at most one notification is sent.
 */

#ifndef REEL_CUTTER_ORCHESTRATOR_HPP
#define REEL_CUTTER_ORCHESTRATOR_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "caption_planner.hpp"
#include "face_tracking.hpp"
#include "filter_builder.hpp"
#include "job_store.hpp"
#include "providers.hpp"
#include "render_plan.hpp"
#include "request.hpp"
#include "retry_policy.hpp"
#include "system.hpp"

namespace reel_cutter {

/**
 * @struct Collaborators
 * @brief External services used by the pipeline.
 * @note transcription_fallback and faces may be null.
 */
struct Collaborators {
  std::shared_ptr<SourceProvider> source;
  std::shared_ptr<AnalysisProvider> analysis;
  std::shared_ptr<TranscriptionProvider> transcription;
  std::shared_ptr<TranscriptionProvider> transcription_fallback;
  std::shared_ptr<FaceDetector> faces;
  std::shared_ptr<MediaEngine> engine;
  std::shared_ptr<Notifier> notifier;
  Sleeper sleep = thread_sleeper(); //< Used by transcription retries
};

/**
 * @struct OrchestratorSettings
 * @brief Limits and encoder settings for every job.
 */
struct OrchestratorSettings {
  std::filesystem::path temp_root = "/tmp/reel-cutter";
  double max_source_size_mb = 2000.0;
  std::chrono::seconds analysis_timeout{600};
  PlanLimits plan;
  BuildSettings build;
  CaptionLimits captions;
  TrackingLimits tracking;
  RetryPolicy transcription_retry = RetryPolicy::once();

  static OrchestratorSettings from_config();
};

/**
 * @class Orchestrator
 * @brief Runs accepted jobs to a terminal status.
 *
 * @attention One job per call to run(); several workers may call run()
 *            concurrently for different job ids.
 */
class Orchestrator {
public:
  Orchestrator(JobStore &store, Collaborators collaborators,
               OrchestratorSettings settings);

  /**
   * @brief Run a queued job to completion, error or cancellation.
   * @note Never throws; every failure ends up on the job record.
   */
  void run(const std::string &job_id);

  /// Output file name for a target, e.g. "clip-1a2b3c4d-2.mp4"
  static std::string output_name(RequestMode mode, const std::string &job_id,
                                 int index);

private:
  /// A rendered file waiting for upload
  struct RenderedOutput {
    const RenderTarget *target;
    std::filesystem::path path;
    double duration;
  };

  /// State of one run, torn down in finishing
  struct JobContext {
    std::string id;
    std::string tag;
    JobRequest request;
    CancellationToken token;
    std::unique_ptr<WorkArea> work_area;
    ArtifactRegistry artifacts;
    std::filesystem::path source_path;
    SourceMedia media;
    std::vector<DiscoveredClip> discovered;
    RenderPlan plan;
    std::vector<RenderedOutput> rendered;
  };

  void checkpoint(const JobContext &ctx) const;

  void download(JobContext &ctx);
  void analyze(JobContext &ctx);
  void process(JobContext &ctx);
  nlohmann::json upload(JobContext &ctx);
  void finish(JobContext &ctx) noexcept;

  RenderPlan compile(const JobContext &ctx) const;
  std::vector<SegmentAssets> prepare_assets(const JobContext &ctx,
                                            const RenderTarget &target);
  void deliver(const JobContext &ctx, const nlohmann::json &payload) noexcept;

  JobStore &store_;
  Collaborators io_;
  OrchestratorSettings settings_;
};

} // namespace reel_cutter

#endif // REEL_CUTTER_ORCHESTRATOR_HPP
