/**
 * @file job_store.cpp
 * @brief JobStore implementation
 */

#include "reel_cutter/job_store.hpp"

#include <cstdint>
#include <random>

#include <fmt/core.h>

#include "reel_cutter/errors.hpp"

namespace reel_cutter {

const char *to_string(JobStatus status) {
  switch (status) {
  case JobStatus::Queued:
    return "queued";
  case JobStatus::Downloading:
    return "downloading";
  case JobStatus::Analyzing:
    return "analyzing";
  case JobStatus::Processing:
    return "processing";
  case JobStatus::Uploading:
    return "uploading";
  case JobStatus::Finishing:
    return "finishing";
  case JobStatus::Completed:
    return "completed";
  case JobStatus::Error:
    return "error";
  case JobStatus::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

bool is_terminal(JobStatus status) {
  return status == JobStatus::Completed || status == JobStatus::Error ||
         status == JobStatus::Cancelled;
}

double JobSnapshot::elapsed_seconds(Clock::time_point now) const {
  auto end = is_terminal(status) ? updated_at : now;
  return std::chrono::duration<double>(end - created_at).count();
}

std::string generate_job_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<uint64_t> dist;
  uint64_t hi = dist(rng);
  uint64_t lo = dist(rng);

  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; //< version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; //< variant 10

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32,
                     (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48,
                     lo & 0xFFFFFFFFFFFFULL);
}

// **---- Lookup ----**

std::shared_ptr<JobStore::Entry> JobStore::find(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end())
    throw JobNotFoundError(fmt::format("job {} not found", id));
  return it->second;
}

std::string JobStore::create(nlohmann::json request) {
  auto entry = std::make_shared<Entry>();
  auto now = Clock::now();
  entry->data.status = JobStatus::Queued;
  entry->data.message = "Queued";
  entry->data.created_at = now;
  entry->data.updated_at = now;
  entry->data.request = std::move(request);

  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  std::string id;
  do {
    id = generate_job_id();
  } while (jobs_.count(id));
  entry->data.id = id;
  jobs_.emplace(id, std::move(entry));
  return id;
}

JobSnapshot JobStore::get(const std::string &id) const {
  auto entry = find(id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  JobSnapshot copy = entry->data;
  copy.cancel_requested = entry->cancel.is_cancelled();
  return copy;
}

bool JobStore::contains(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  return jobs_.count(id) > 0;
}

size_t JobStore::size() const {
  std::shared_lock<std::shared_mutex> lock(map_mutex_);
  return jobs_.size();
}

// **---- Transitions ----**

void JobStore::advance(const std::string &id, JobStatus next,
                       const std::string &message) {
  auto entry = find(id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  JobStatus current = entry->data.status;
  if (is_terminal(next) || is_terminal(current) || next <= current) {
    throw InvalidStateError(fmt::format("job {}: cannot move from {} to {}", id,
                                        to_string(current), to_string(next)));
  }
  entry->data.status = next;
  entry->data.message = message;
  entry->data.updated_at = Clock::now();
}

void JobStore::update_message(const std::string &id,
                              const std::string &message) {
  auto entry = find(id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->data.message = message;
  entry->data.updated_at = Clock::now();
}

void JobStore::request_cancel(const std::string &id) {
  auto entry = find(id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (is_terminal(entry->data.status)) {
    throw InvalidStateError(fmt::format("job {} is already {}", id,
                                        to_string(entry->data.status)));
  }
  entry->cancel.cancel();
}

CancellationToken JobStore::token(const std::string &id) const {
  auto entry = find(id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  return entry->cancel;
}

void JobStore::finish(const std::string &id, JobStatus status,
                      const std::string &message,
                      std::optional<nlohmann::json> result,
                      std::optional<JobError> error) {
  auto entry = find(id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (is_terminal(entry->data.status)) {
    throw InvalidStateError(fmt::format("job {} is already {}", id,
                                        to_string(entry->data.status)));
  }
  entry->data.status = status;
  entry->data.message = message;
  entry->data.result = std::move(result);
  entry->data.error = std::move(error);
  entry->data.updated_at = Clock::now();
}

void JobStore::complete(const std::string &id, nlohmann::json result) {
  finish(id, JobStatus::Completed, "Completed", std::move(result),
         std::nullopt);
}

void JobStore::fail(const std::string &id, JobError error) {
  std::string message = "Error: " + error.message;
  finish(id, JobStatus::Error, message, std::nullopt, std::move(error));
}

void JobStore::mark_cancelled(const std::string &id) {
  finish(id, JobStatus::Cancelled, "Cancelled", std::nullopt, std::nullopt);
}

bool JobStore::claim_notification(const std::string &id) {
  auto entry = find(id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (!is_terminal(entry->data.status) || entry->notified)
    return false;
  entry->notified = true;
  return true;
}

size_t JobStore::sweep_expired(Clock::time_point now,
                               std::chrono::seconds ttl) {
  std::unique_lock<std::shared_mutex> lock(map_mutex_);
  size_t removed = 0;
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    bool expired;
    {
      std::lock_guard<std::mutex> entry_lock(it->second->mutex);
      expired = is_terminal(it->second->data.status) &&
                it->second->data.updated_at + ttl < now;
    }
    if (expired) {
      it = jobs_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

} // namespace reel_cutter
