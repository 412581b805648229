/**
 * @file job_service.cpp
 * @brief Worker pool, sweeper and lifecycle responses
 */

#include "reel_cutter/job_service.hpp"

#include <algorithm>
#include <cmath>

#include "reel_cutter/config.hpp"
#include "reel_cutter/errors.hpp"
#include "reel_cutter/logging.hpp"
#include "reel_cutter/request.hpp"
#include "reel_cutter/system.hpp"

namespace reel_cutter {

using nlohmann::json;

ServiceSettings ServiceSettings::from_config() {
  ServiceSettings s;
  s.worker_count = std::max(1, Config::worker_count());
  s.job_ttl = std::chrono::seconds(Config::job_ttl_sec());
  s.sweep_interval = std::chrono::seconds(std::max(1, Config::sweep_interval_sec()));
  return s;
}

JobService::JobService(Collaborators collaborators,
                       OrchestratorSettings orchestrator,
                       ServiceSettings settings)
    : orchestrator_settings_(orchestrator),
      orchestrator_(store_, std::move(collaborators), std::move(orchestrator)),
      settings_(settings) {}

JobService::~JobService() { shutdown(); }

// **---- Lifecycle ----**

void JobService::start() {
  if (started_.exchange(true))
    return;

  int removed = sweep_orphaned_work_areas(orchestrator_settings_.temp_root);
  if (removed > 0)
    LOG_INFO("Removed {} leftover work area(s) from {}", removed,
             orchestrator_settings_.temp_root.string());

  const int count = std::max(1, settings_.worker_count);
  for (int i = 0; i < count; ++i) {
    workers_.emplace_back(&JobService::worker_loop, this, i);
  }
  sweeper_ = std::thread(&JobService::sweeper_loop, this);
  LOG_INFO("Job service started ({} worker(s))", count);
}

void JobService::shutdown() {
  queue_.close();
  {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    stopping_ = true;
  }
  stop_cv_.notify_all();

  for (auto &w : workers_) {
    if (w.joinable())
      w.join();
  }
  workers_.clear();
  if (sweeper_.joinable())
    sweeper_.join();
}

void JobService::worker_loop(int worker_id) {
  LOG_INFO("[Worker {}] Started", worker_id);
  std::string job_id;
  int jobs_run = 0;
  while (queue_.pop(job_id)) {
    LOG_INFO("[Worker {}] Picked up {}", worker_id, job_tag(job_id));
    orchestrator_.run(job_id);
    ++jobs_run;
  }
  LOG_INFO("[Worker {}] Finished ({} jobs)", worker_id, jobs_run);
}

void JobService::sweeper_loop() {
  std::unique_lock<std::mutex> lock(stop_mutex_);
  while (!stop_cv_.wait_for(lock, settings_.sweep_interval,
                            [this] { return stopping_; })) {
    lock.unlock();
    size_t removed = sweep();
    if (removed > 0)
      LOG_INFO("[Sweeper] Removed {} expired job(s)", removed);
    lock.lock();
  }
}

size_t JobService::sweep(Clock::time_point now) {
  return store_.sweep_expired(now, settings_.job_ttl);
}

// **---- Requests ----**

json JobService::submit(const json &request) {
  JobRequest parsed = parse_request(request);
  std::string id = store_.create(to_json(parsed));

  if (!queue_.push(id)) {
    store_.fail(id, JobError{"internal", "service is shutting down"});
    throw InvalidStateError("service is shutting down");
  }
  LOG_INFO("{} Accepted {} request for {}", job_tag(id),
           to_string(parsed.mode), parsed.source_id);
  return {{"job_id", id}, {"status", "accepted"}};
}

json JobService::status(const std::string &job_id) const {
  JobSnapshot snap = store_.get(job_id);
  json doc = {{"job_id", snap.id},
              {"status", to_string(snap.status)},
              {"progress_message", snap.message},
              {"elapsed_seconds",
               std::round(snap.elapsed_seconds() * 10.0) / 10.0}};
  if (snap.result)
    doc["result"] = *snap.result;
  if (snap.error)
    doc["error"] = {{"message", snap.error->message}, {"kind", snap.error->kind}};
  return doc;
}

json JobService::cancel(const std::string &job_id) {
  store_.request_cancel(job_id);
  LOG_WARN("{} Cancellation requested", job_tag(job_id));
  return {{"job_id", job_id}, {"status", "cancellation_requested"}};
}

} // namespace reel_cutter
