/**
 * @file job_store.hpp
 * @brief Concurrent job records and the job state machine
 *
 * @details The JobStore only holds state. It enforces:
 *
 *          - strictly forward status transitions
 *
 *          - exactly one of result / error once terminal
 *
 *          - at most one terminal notification per job
 *
 *          The map is guarded by a shared_mutex; each record has its own
 *          mutex, so writers on one job never block readers of another.
 */

#ifndef REEL_CUTTER_JOB_STORE_HPP
#define REEL_CUTTER_JOB_STORE_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace reel_cutter {

/// Job lifecycle, declared in transition order
enum class JobStatus {
  Queued,
  Downloading,
  Analyzing,
  Processing,
  Uploading,
  Finishing,
  Completed,
  Error,
  Cancelled
};

const char *to_string(JobStatus status);
bool is_terminal(JobStatus status);

using Clock = std::chrono::system_clock;

/**
 * @struct JobError
 * @brief Classified failure stored on an errored job.
 */
struct JobError {
  std::string kind;
  std::string message;
};

/**
 * @class CancellationToken
 * @brief Shared cancel flag handed down the pipeline call chain.
 */
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  bool is_cancelled() const { return flag_->load(); }
  void cancel() { flag_->store(true); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @struct JobSnapshot
 * @brief Consistent copy of a job record for readers.
 */
struct JobSnapshot {
  std::string id;
  JobStatus status = JobStatus::Queued;
  std::string message;
  Clock::time_point created_at;
  Clock::time_point updated_at;
  bool cancel_requested = false;
  std::optional<nlohmann::json> result;
  std::optional<JobError> error;
  nlohmann::json request;

  double elapsed_seconds(Clock::time_point now = Clock::now()) const;
};

/**
 * @class JobStore
 * @brief Registry of jobs keyed by id.
 */
class JobStore {
public:
  /**
   * @brief Create a queued job.
   * @param request Immutable snapshot of the original request
   * @return New job id (UUID v4)
   */
  std::string create(nlohmann::json request);

  /**
   * @brief Copy of the current record.
   * @throws JobNotFoundError
   */
  JobSnapshot get(const std::string &id) const;

  bool contains(const std::string &id) const;
  size_t size() const;

  /**
   * @brief Move a job to a later non-terminal status.
   * @throws InvalidStateError if next is terminal or not after the current
   *         status
   */
  void advance(const std::string &id, JobStatus next,
               const std::string &message);

  void update_message(const std::string &id, const std::string &message);

  /**
   * @brief Flag a running job for cooperative cancellation.
   * @throws JobNotFoundError, InvalidStateError if already terminal
   */
  void request_cancel(const std::string &id);

  /// Token observing this job's cancel flag
  CancellationToken token(const std::string &id) const;

  /// Terminal transitions; each throws InvalidStateError if already terminal
  void complete(const std::string &id, nlohmann::json result);
  void fail(const std::string &id, JobError error);
  void mark_cancelled(const std::string &id);

  /**
   * @brief Reserve the single terminal notification.
   * @return true exactly once per terminal job
   */
  bool claim_notification(const std::string &id);

  /**
   * @brief Drop terminal jobs last updated before now - ttl.
   * @return Number of removed records
   */
  size_t sweep_expired(Clock::time_point now, std::chrono::seconds ttl);

private:
  struct Entry {
    mutable std::mutex mutex;
    JobSnapshot data;
    CancellationToken cancel;
    bool notified = false;
  };

  std::shared_ptr<Entry> find(const std::string &id) const;
  void finish(const std::string &id, JobStatus status,
              const std::string &message,
              std::optional<nlohmann::json> result,
              std::optional<JobError> error);

  mutable std::shared_mutex map_mutex_;
  std::map<std::string, std::shared_ptr<Entry>> jobs_;
};

/// Random UUID v4 string
std::string generate_job_id();

} // namespace reel_cutter

#endif // REEL_CUTTER_JOB_STORE_HPP
