/**
 * @file retry_policy.hpp
 * @brief Explicit retry policy objects
 *
 * @details A RetryPolicy states how many attempts an operation gets, how long
 *          to wait before each retry, and which failures are worth retrying.
 *          run_with_retry() executes an operation under a policy; the sleeper
 *          is injectable so tests never block.
 */

#ifndef REEL_CUTTER_RETRY_POLICY_HPP
#define REEL_CUTTER_RETRY_POLICY_HPP

#include <chrono>
#include <exception>
#include <functional>
#include <vector>

namespace reel_cutter {

/// Blocks the caller for the given delay
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Default sleeper: std::this_thread::sleep_for
Sleeper thread_sleeper();

/**
 * @struct RetryPolicy
 * @brief Attempt budget, backoff schedule and retryable-error predicate.
 */
struct RetryPolicy {
  int max_attempts = 1;
  std::vector<std::chrono::milliseconds> backoff; //< Delay before retry i+1
  std::function<bool(const std::exception &)> retryable;

  /// Single attempt, nothing retried
  static RetryPolicy once();

  /**
   * @brief Webhook delivery: 1 + WEBHOOK_MAX_RETRIES attempts, delays
   *        doubling from WEBHOOK_RETRY_BASE_DELAY_SEC (2s, 4s, 8s).
   * @note The predicate is left empty; the notifier installs its own.
   */
  static RetryPolicy webhook_default();

  /// Delay before the given retry (1-based); the last entry repeats
  std::chrono::milliseconds delay_before_retry(int retry) const;

  bool should_retry(const std::exception &e) const {
    return retryable ? retryable(e) : false;
  }
};

/**
 * @brief Run op under policy, sleeping between attempts.
 * @return op()'s value from the first successful attempt
 * @throws The last failure once attempts are exhausted, or the first
 *         non-retryable failure
 */
template <typename Op>
auto run_with_retry(const RetryPolicy &policy, Op &&op, const Sleeper &sleep)
    -> decltype(op()) {
  const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
  for (int attempt = 1;; ++attempt) {
    try {
      return op();
    } catch (const std::exception &e) {
      if (attempt >= attempts || !policy.should_retry(e))
        throw;
    }
    sleep(policy.delay_before_retry(attempt));
  }
}

} // namespace reel_cutter

#endif // REEL_CUTTER_RETRY_POLICY_HPP
