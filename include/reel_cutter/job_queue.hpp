/**
 * @file job_queue.hpp
 * @brief Thread-safe queue of accepted job ids
 *
 * @details Decouples request acceptance from execution:
 *
 *          - submit() pushes the id of a freshly created job
 *
 *          - worker threads pop() ids in a loop and run them
 *
 *          - close() releases every blocked worker at shutdown
 */

#ifndef REEL_CUTTER_JOB_QUEUE_HPP
#define REEL_CUTTER_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

namespace reel_cutter {

/**
 * @class JobQueue
 * @brief Blocking FIFO of job ids (producer-consumer pattern).
 */
class JobQueue {
public:
  /**
   * @brief Push a job id.
   * @return false if the queue is already closed
   */
  bool push(std::string job_id);

  /**
   * @brief Pop a job id (blocking).
   * @param job_id Output: the next job to run
   * @return true if an id was retrieved, false once closed and drained
   */
  bool pop(std::string &job_id);

  /// Signal that no more ids will be pushed
  void close();

  bool is_closed() const { return closed_.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ids_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> ids_;
  std::atomic<bool> closed_{false};
};

} // namespace reel_cutter

#endif // REEL_CUTTER_JOB_QUEUE_HPP
