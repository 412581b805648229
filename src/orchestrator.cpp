/**
 * @file orchestrator.cpp
 * @brief Job pipeline implementation
 *
 * @details Stages run in order on the calling worker thread:
 *
 *          downloading -> analyzing* -> processing -> uploading -> finishing
 *
 *          Any exception leaving a stage skips the remaining ones. finishing
 *          always runs, then the terminal status is written and the webhook
 *          is sent once.
 */

#include "reel_cutter/orchestrator.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "reel_cutter/analysis.hpp"
#include "reel_cutter/config.hpp"
#include "reel_cutter/errors.hpp"
#include "reel_cutter/logging.hpp"
#include "reel_cutter/notifier.hpp"

namespace reel_cutter {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

} // anonymous namespace

// **---- Settings ----**

OrchestratorSettings OrchestratorSettings::from_config() {
  OrchestratorSettings s;
  s.temp_root = Config::temp_dir();
  s.max_source_size_mb = Config::max_source_size_mb();
  s.analysis_timeout = std::chrono::seconds(Config::analysis_timeout_sec());
  s.plan = PlanLimits::from_config();
  s.build = BuildSettings::from_config();
  s.captions = CaptionLimits::from_config();
  s.tracking = TrackingLimits::from_config();
  return s;
}

// **---- Constructor ----**

Orchestrator::Orchestrator(JobStore &store, Collaborators collaborators,
                           OrchestratorSettings settings)
    : store_(store), io_(std::move(collaborators)),
      settings_(std::move(settings)) {}

std::string Orchestrator::output_name(RequestMode mode,
                                      const std::string &job_id, int index) {
  const std::string id8 = job_id.substr(0, 8);
  switch (mode) {
  case RequestMode::Analyze:
    return fmt::format("viral-{}-corte{}.mp4", id8, index);
  case RequestMode::ManualCut:
    return fmt::format("clip-{}-{}.mp4", id8, index);
  case RequestMode::ManualEdit:
    return fmt::format("edit-{}.mp4", id8);
  }
  return fmt::format("output-{}-{}.mp4", id8, index);
}

// **---- Main Processing ----**

void Orchestrator::run(const std::string &job_id) {
  JobContext ctx;
  ctx.id = job_id;
  ctx.tag = job_tag(job_id);

  try {
    JobSnapshot snapshot = store_.get(job_id);
    ctx.token = store_.token(job_id);
    ctx.request = parse_request(snapshot.request);
  } catch (const JobNotFoundError &e) {
    LOG_ERROR("{} Cannot start: {}", ctx.tag, e.what());
    return;
  } catch (const std::exception &e) {
    LOG_ERROR("{} Stored request is unusable: {}", ctx.tag, e.what());
    try {
      store_.fail(job_id, JobError{"validation", e.what()});
    } catch (const std::exception &inner) {
      LOG_ERROR("{} Could not record failure: {}", ctx.tag, inner.what());
    }
    return;
  }

  TIMER_START(job);
  LOG_PHASE("{} Starting {} job for source {}", ctx.tag,
            to_string(ctx.request.mode), ctx.request.source_id);

  std::optional<json> result;
  std::optional<JobError> error;
  bool cancelled = false;

  try {
    download(ctx);
    if (ctx.request.mode == RequestMode::Analyze)
      analyze(ctx);
    process(ctx);
    result = upload(ctx);
  } catch (const CancelledError &) {
    cancelled = true;
  } catch (const PipelineError &e) {
    error = JobError{e.kind(), e.what()};
  } catch (const std::exception &e) {
    error = JobError{"internal", e.what()};
  }

  finish(ctx);

  // **----- TERMINAL STATUS -----**

  json payload;
  try {
    if (cancelled) {
      store_.mark_cancelled(ctx.id);
      LOG_WARN("{} Cancelled", ctx.tag);
      payload = cancelled_payload(ctx.id, ctx.request.source_id);
    } else if (error) {
      LOG_ERROR("{} Failed ({}): {}", ctx.tag, error->kind, error->message);
      store_.fail(ctx.id, *error);
      payload = error_payload(ctx.id, ctx.request.source_id, *error);
    } else {
      store_.complete(ctx.id, *result);
      LOG_SUCCESS("{} Completed with {} clip(s)", ctx.tag,
                  ctx.rendered.size());
      payload = completed_payload(ctx.id, ctx.request.source_id, *result);
    }
  } catch (const std::exception &e) {
    LOG_ERROR("{} Could not record outcome: {}", ctx.tag, e.what());
    return;
  }

  TIMER_END(job, "job total");

  deliver(ctx, payload);
}

void Orchestrator::checkpoint(const JobContext &ctx) const {
  if (ctx.token.is_cancelled()) {
    LOG_WARN("{} Cancellation requested, skipping remaining stages", ctx.tag);
    throw CancelledError("cancelled by request");
  }
}

// **---- Stages ----**

void Orchestrator::download(JobContext &ctx) {
  checkpoint(ctx);
  store_.advance(ctx.id, JobStatus::Downloading, "Downloading source...");
  LOG_PHASE("{} Downloading {}", ctx.tag, ctx.request.source_id);

  TIMER_START(download);

  try {
    ctx.work_area = std::make_unique<WorkArea>(settings_.temp_root, ctx.id);
  } catch (const fs::filesystem_error &e) {
    throw SourceError(fmt::format("cannot create work area: {}", e.what()));
  }
  ctx.source_path = ctx.work_area->path() / "source.mp4";

  io_.source->download(ctx.request.source_id, ctx.source_path.string());

  std::error_code ec;
  auto bytes = fs::file_size(ctx.source_path, ec);
  if (ec)
    throw SourceError("downloaded source is missing");
  if (bytes == 0)
    throw SourceError("downloaded source is empty");

  double size_mb = bytes / kBytesPerMb;
  if (size_mb > settings_.max_source_size_mb) {
    throw SourceError(fmt::format("source is {:.1f} MB, limit is {:.0f} MB",
                                  size_mb, settings_.max_source_size_mb));
  }

  TIMER_END(download, "download");
  store_.update_message(ctx.id,
                        fmt::format("Download complete ({:.1f} MB)", size_mb));

  ctx.media = io_.engine->probe(ctx.source_path.string());
  LOG_INFO("{} Source: {} ({}x{} @ {:.1f}fps{})", ctx.tag,
           format_time(ctx.media.duration), ctx.media.width, ctx.media.height,
           ctx.media.fps, ctx.media.has_audio ? "" : ", no audio");
}

void Orchestrator::analyze(JobContext &ctx) {
  checkpoint(ctx);
  store_.advance(ctx.id, JobStatus::Analyzing, "Analyzing video...");

  const int requested = ctx.request.options.max_clips;
  const int count =
      eligible_clip_count(requested, ctx.media.duration, settings_.plan);
  if (count < requested) {
    LOG_INFO("{} Source shorter than {:.0f}s, asking for a single clip",
             ctx.tag, settings_.plan.multi_clip_min_duration);
  }
  LOG_PHASE("{} Analyzing for {} clip(s)", ctx.tag, count);

  TIMER_START(analysis);
  auto started = std::chrono::steady_clock::now();

  std::string raw =
      io_.analysis->analyze(ctx.source_path.string(), ctx.request.instruction,
                            count, settings_.analysis_timeout, ctx.artifacts);

  auto waited = std::chrono::steady_clock::now() - started;
  TIMER_END(analysis, "analysis");
  if (waited > settings_.analysis_timeout) {
    throw TimeoutError(
        fmt::format("analysis exceeded {}s",
                    static_cast<long>(settings_.analysis_timeout.count())));
  }

  ctx.discovered = parse_discovered_clips(raw, ctx.media.duration);
  store_.update_message(
      ctx.id, fmt::format("Analysis found {} clip(s)", ctx.discovered.size()));
}

RenderPlan Orchestrator::compile(const JobContext &ctx) const {
  const JobRequest &req = ctx.request;
  switch (req.mode) {
  case RequestMode::Analyze:
    return compile_discovered(ctx.discovered, req.options, ctx.media,
                              settings_.plan);
  case RequestMode::ManualCut:
    return compile_manual_cut(req.ranges, req.options, ctx.media,
                              settings_.plan);
  case RequestMode::ManualEdit:
    return compile_manual_edit(req.ranges, req.title, req.options, ctx.media,
                               settings_.plan);
  }
  throw ValidationError("unknown request mode");
}

void Orchestrator::process(JobContext &ctx) {
  checkpoint(ctx);
  ctx.plan = compile(ctx);

  const size_t total = ctx.plan.targets.size();
  store_.advance(ctx.id, JobStatus::Processing,
                 fmt::format("Rendering {} clip(s)...", total));
  LOG_PHASE("{} Rendering {} clip(s)", ctx.tag, total);

  for (const auto &target : ctx.plan.targets) {
    checkpoint(ctx);
    store_.update_message(ctx.id, fmt::format("Rendering clip {}/{}: {}",
                                              target.index, total,
                                              target.title));

    std::vector<SegmentAssets> assets = prepare_assets(ctx, target);
    fs::path out = ctx.work_area->path() /
                   output_name(ctx.request.mode, ctx.id, target.index);

    TIMER_START(render);
    EngineInvocation invocation =
        build_invocation(target, ctx.media, assets, ctx.source_path.string(),
                         out.string(), settings_.build);
    LOG_INFO("{} Clip {} [{}]: {} segment(s), {:.1f}s, {} crossfade(s)",
             ctx.tag, target.index, to_string(target.platform),
             target.segments.size(), invocation.expected_duration,
             invocation.graph.count("xfade"));

    io_.engine->render(invocation);
    TIMER_END(render, "clip render");

    ctx.rendered.push_back({&target, out, invocation.expected_duration});
  }
}

std::vector<SegmentAssets>
Orchestrator::prepare_assets(const JobContext &ctx,
                             const RenderTarget &target) {
  const RenderOptions &opt = target.options;
  std::vector<SegmentAssets> assets(target.segments.size());
  const std::string media_path = ctx.source_path.string();

  // **----- CAPTIONS -----**

  if (opt.captions) {
    std::vector<TranscriptionProvider *> providers{
        io_.transcription.get(), io_.transcription_fallback.get()};
    size_t cues = 0;
    for (size_t i = 0; i < target.segments.size(); ++i) {
      const Segment &seg = target.segments[i];
      Transcript transcript =
          resolve_transcript(providers, media_path, seg,
                             settings_.transcription_retry, io_.sleep);
      assets[i].captions =
          plan_captions(localize(transcript, seg), settings_.captions);
      cues += assets[i].captions.size();
    }
    if (cues == 0)
      LOG_WARN("{} Clip {}: no captions produced", ctx.tag, target.index);
    else
      LOG_INFO("{} Clip {}: {} caption cue(s)", ctx.tag, target.index, cues);
  }

  // **----- FACE TRACKING -----**

  if (opt.face_tracking && io_.faces) {
    for (size_t i = 0; i < target.segments.size(); ++i) {
      const Segment &seg = target.segments[i];
      if (!tracking_applicable(opt, ctx.media, seg, settings_.tracking))
        continue;
      try {
        auto samples =
            io_.faces->detect(media_path, seg, settings_.tracking.sample_fps);
        assets[i].crop = build_trajectory(samples, seg, tracking_crop_width(opt),
                                          settings_.tracking);
      } catch (const std::exception &e) {
        LOG_WARN("{} Face detection failed on segment {}: {}", ctx.tag, i + 1,
                 e.what());
      }
      if (!assets[i].crop)
        LOG_INFO("{} Segment {}: centred crop", ctx.tag, i + 1);
    }
  }
  return assets;
}

json Orchestrator::upload(JobContext &ctx) {
  checkpoint(ctx);
  store_.advance(ctx.id, JobStatus::Uploading,
                 fmt::format("Uploading {} clip(s)...", ctx.rendered.size()));
  LOG_PHASE("{} Uploading", ctx.tag);

  TIMER_START(upload);

  std::vector<GeneratedClip> clips;
  for (const auto &out : ctx.rendered) {
    const RenderTarget &target = *out.target;

    std::error_code ec;
    auto bytes = fs::file_size(out.path, ec);
    if (ec) {
      throw RenderError(
          fmt::format("rendered output {} is missing", out.path.string()));
    }

    GeneratedClip clip;
    clip.file = io_.source->upload(out.path.string(),
                                   out.path.filename().string(),
                                   ctx.request.destination_folder);
    clip.index = target.index;
    clip.title = target.title;
    clip.platform = target.platform;
    clip.segments = target.segments;
    clip.output_size_mb = bytes / kBytesPerMb;
    clip.total_duration = out.duration;
    LOG_INFO("{} Published {} ({:.1f} MB)", ctx.tag, clip.file.name,
             clip.output_size_mb);
    clips.push_back(std::move(clip));
  }

  TIMER_END(upload, "upload");
  return result_json(clips);
}

void Orchestrator::finish(JobContext &ctx) noexcept {
  try {
    store_.advance(ctx.id, JobStatus::Finishing, "Cleaning up...");
  } catch (const std::exception &e) {
    LOG_WARN("{} {}", ctx.tag, e.what());
  }

  if (ctx.work_area) {
    ctx.work_area->release();
    ctx.work_area.reset();
  }

  for (const auto &artifact : ctx.artifacts.drain()) {
    try {
      io_.analysis->release(artifact);
      LOG_INFO("{} Released analysis artifact {}", ctx.tag, artifact);
    } catch (const std::exception &e) {
      LOG_WARN("{} Could not release artifact {}: {}", ctx.tag, artifact,
               e.what());
    }
  }
}

// **---- Notification ----**

void Orchestrator::deliver(const JobContext &ctx, const json &payload) noexcept {
  try {
    if (!store_.claim_notification(ctx.id))
      return;
    io_.notifier->notify(ctx.request.webhook_url, payload);
  } catch (const std::exception &e) {
    LOG_ERROR("{} Webhook delivery failed: {}", ctx.tag, e.what());
  }
}

} // namespace reel_cutter
