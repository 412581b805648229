/**
 * @file job_queue.cpp
 * @brief Job id queue implementation
 */

#include "reel_cutter/job_queue.hpp"

namespace reel_cutter {

bool JobQueue::push(std::string job_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.load())
      return false;
    ids_.push(std::move(job_id));
  }
  cv_.notify_one();
  return true;
}

bool JobQueue::pop(std::string &job_id) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !ids_.empty() || closed_.load(); });

  if (ids_.empty()) {
    return false;
  }

  job_id = std::move(ids_.front());
  ids_.pop();
  return true;
}

void JobQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_.store(true);
  }
  cv_.notify_all();
}

} // namespace reel_cutter
