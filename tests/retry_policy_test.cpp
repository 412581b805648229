/**
 * @file retry_policy_test.cpp
 * @brief Attempt budget, backoff schedule and retry predicate
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "reel_cutter/retry_policy.hpp"

namespace reel_cutter {
namespace {

using std::chrono::milliseconds;

struct SleepLog {
  std::vector<milliseconds> delays;
  Sleeper sleeper() {
    return [this](milliseconds d) { delays.push_back(d); };
  }
};

RetryPolicy retry_all(int attempts, std::vector<milliseconds> backoff) {
  RetryPolicy p;
  p.max_attempts = attempts;
  p.backoff = std::move(backoff);
  p.retryable = [](const std::exception &) { return true; };
  return p;
}

TEST(RetryPolicyTest, OnceMakesSingleAttempt) {
  SleepLog log;
  int calls = 0;
  EXPECT_THROW(run_with_retry(
                   RetryPolicy::once(),
                   [&]() -> int {
                     ++calls;
                     throw std::runtime_error("boom");
                   },
                   log.sleeper()),
               std::runtime_error);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(log.delays.empty());
}

TEST(RetryPolicyTest, RetriesUntilSuccessWithBackoff) {
  SleepLog log;
  int calls = 0;
  int value = run_with_retry(
      retry_all(4, {milliseconds(2000), milliseconds(4000), milliseconds(8000)}),
      [&] {
        if (++calls < 3)
          throw std::runtime_error("flaky");
        return 42;
      },
      log.sleeper());
  EXPECT_EQ(value, 42);
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(log.delays.size(), 2u);
  EXPECT_EQ(log.delays[0], milliseconds(2000));
  EXPECT_EQ(log.delays[1], milliseconds(4000));
}

TEST(RetryPolicyTest, GivesUpAfterBudget) {
  SleepLog log;
  int calls = 0;
  EXPECT_THROW(run_with_retry(
                   retry_all(3, {milliseconds(10)}),
                   [&] {
                     ++calls;
                     throw std::runtime_error("down");
                   },
                   log.sleeper()),
               std::runtime_error);
  EXPECT_EQ(calls, 3);
  /// The last delay repeats once the schedule runs out
  ASSERT_EQ(log.delays.size(), 2u);
  EXPECT_EQ(log.delays[1], milliseconds(10));
}

TEST(RetryPolicyTest, PredicateStopsEarly) {
  SleepLog log;
  RetryPolicy p = retry_all(5, {});
  p.retryable = [](const std::exception &e) {
    return dynamic_cast<const std::logic_error *>(&e) == nullptr;
  };
  int calls = 0;
  EXPECT_THROW(run_with_retry(
                   p,
                   [&] {
                     ++calls;
                     throw std::invalid_argument("bad input");
                   },
                   log.sleeper()),
               std::invalid_argument);
  EXPECT_EQ(calls, 1);
}

TEST(RetryPolicyTest, DelayLookup) {
  RetryPolicy p = retry_all(4, {milliseconds(1), milliseconds(2)});
  EXPECT_EQ(p.delay_before_retry(0), milliseconds(0));
  EXPECT_EQ(p.delay_before_retry(1), milliseconds(1));
  EXPECT_EQ(p.delay_before_retry(2), milliseconds(2));
  EXPECT_EQ(p.delay_before_retry(5), milliseconds(2));
  EXPECT_EQ(RetryPolicy::once().delay_before_retry(1), milliseconds(0));
}

} // anonymous namespace
} // namespace reel_cutter
