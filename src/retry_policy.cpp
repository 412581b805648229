/**
 * @file retry_policy.cpp
 * @brief Retry policy factories
 */

#include "reel_cutter/retry_policy.hpp"

#include <thread>

#include "reel_cutter/config.hpp"

namespace reel_cutter {

Sleeper thread_sleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

RetryPolicy RetryPolicy::once() { return RetryPolicy{}; }

RetryPolicy RetryPolicy::webhook_default() {
  RetryPolicy policy;
  const int retries = Config::webhook_max_retries();
  policy.max_attempts = 1 + (retries > 0 ? retries : 0);

  auto base = std::chrono::milliseconds(
      static_cast<long>(Config::webhook_retry_base_delay_sec() * 1000.0));
  for (int i = 0; i < retries; ++i) {
    policy.backoff.push_back(base * (1 << i));
  }
  return policy;
}

std::chrono::milliseconds RetryPolicy::delay_before_retry(int retry) const {
  if (backoff.empty() || retry < 1)
    return std::chrono::milliseconds(0);
  size_t idx = static_cast<size_t>(retry - 1);
  return idx < backoff.size() ? backoff[idx] : backoff.back();
}

} // namespace reel_cutter
