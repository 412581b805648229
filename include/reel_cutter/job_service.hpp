/**
 * @file job_service.hpp
 * @brief Job lifecycle service: accept, query, cancel
 *
 * @details The JobService owns everything a long-running process needs:
 *
 *          - the Job Store
 *
 *          - a JobQueue feeding WORKER_COUNT worker threads, each running the
 *            Orchestrator on one job at a time
 *
 *          - a sweeper thread dropping terminal records older than JOB_TTL_SEC
 *
 *          start() also removes work areas left behind by a previous crash.
 */

#ifndef REEL_CUTTER_JOB_SERVICE_HPP
#define REEL_CUTTER_JOB_SERVICE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "job_queue.hpp"
#include "job_store.hpp"
#include "orchestrator.hpp"

namespace reel_cutter {

/**
 * @struct ServiceSettings
 * @brief Thread and retention settings.
 */
struct ServiceSettings {
  int worker_count = 1;
  std::chrono::seconds job_ttl{3 * 24 * 60 * 60};
  std::chrono::seconds sweep_interval{3600};

  static ServiceSettings from_config();
};

/**
 * @class JobService
 * @brief Request-facing boundary over the store, queue and workers.
 *
 * @attention USAGE:
 *
 *   - call start() once before submitting
 *
 *   - submit(), status() and cancel() are safe from any thread
 *
 *   - shutdown() (or the destructor) lets queued jobs drain, then joins
 */
class JobService {
public:
  JobService(Collaborators collaborators, OrchestratorSettings orchestrator,
             ServiceSettings settings);
  ~JobService();

  JobService(const JobService &) = delete;
  JobService &operator=(const JobService &) = delete;

  /// Sweep orphaned work areas, launch workers and the sweeper
  void start();

  /**
   * @brief Validate and enqueue a request.
   * @return {job_id, status: "accepted"}
   * @throws ValidationError before any job is created
   */
  nlohmann::json submit(const nlohmann::json &request);

  /**
   * @return {job_id, status, progress_message, elapsed_seconds} plus result
   *         or error once terminal
   * @throws JobNotFoundError
   */
  nlohmann::json status(const std::string &job_id) const;

  /**
   * @return {job_id, status: "cancellation_requested"}
   * @throws JobNotFoundError, InvalidStateError if already terminal
   */
  nlohmann::json cancel(const std::string &job_id);

  /// Drop expired terminal records now
  size_t sweep(Clock::time_point now = Clock::now());

  /// Stop accepting work, finish queued jobs and join every thread
  void shutdown();

  JobStore &store() { return store_; }

private:
  void worker_loop(int worker_id);
  void sweeper_loop();

  JobStore store_;
  OrchestratorSettings orchestrator_settings_;
  Orchestrator orchestrator_;
  ServiceSettings settings_;
  JobQueue queue_;

  std::vector<std::thread> workers_;
  std::thread sweeper_;
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  bool stopping_ = false;
  std::atomic<bool> started_{false};
};

} // namespace reel_cutter

#endif // REEL_CUTTER_JOB_SERVICE_HPP
