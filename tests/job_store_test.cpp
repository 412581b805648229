/**
 * @file job_store_test.cpp
 * @brief Job state machine, cancellation, notification claim and sweeping
 */

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

#include "reel_cutter/errors.hpp"
#include "reel_cutter/job_store.hpp"

namespace reel_cutter {
namespace {

using nlohmann::json;

TEST(JobStoreTest, CreatesQueuedJobWithUuid) {
  JobStore store;
  std::string id = store.create({{"mode", "analyze"}});
  ASSERT_EQ(id.size(), 36u);
  EXPECT_EQ(id[14], '4');
  EXPECT_EQ(id[8], '-');

  JobSnapshot snap = store.get(id);
  EXPECT_EQ(snap.status, JobStatus::Queued);
  EXPECT_EQ(snap.request["mode"].get<std::string>(), "analyze");
  EXPECT_FALSE(snap.result.has_value());
  EXPECT_FALSE(snap.error.has_value());
  EXPECT_TRUE(store.contains(id));
  EXPECT_EQ(store.size(), 1u);
}

TEST(JobStoreTest, UnknownJobThrows) {
  JobStore store;
  EXPECT_THROW(store.get("nope"), JobNotFoundError);
  EXPECT_THROW(store.request_cancel("nope"), JobNotFoundError);
  EXPECT_FALSE(store.contains("nope"));
}

TEST(JobStoreTest, StatusOnlyMovesForward) {
  JobStore store;
  std::string id = store.create(json::object());
  store.advance(id, JobStatus::Downloading, "Downloading");
  store.advance(id, JobStatus::Processing, "Rendering");
  EXPECT_THROW(store.advance(id, JobStatus::Analyzing, "back"), InvalidStateError);
  EXPECT_THROW(store.advance(id, JobStatus::Processing, "same"), InvalidStateError);
  EXPECT_THROW(store.advance(id, JobStatus::Completed, "skip"), InvalidStateError);

  store.update_message(id, "Rendering clip 1/2");
  EXPECT_EQ(store.get(id).message, "Rendering clip 1/2");
  EXPECT_EQ(store.get(id).status, JobStatus::Processing);
}

TEST(JobStoreTest, TerminalStatusIsFinal) {
  JobStore store;
  std::string id = store.create(json::object());
  store.complete(id, {{"total_clips", 1}});

  JobSnapshot snap = store.get(id);
  EXPECT_EQ(snap.status, JobStatus::Completed);
  ASSERT_TRUE(snap.result.has_value());
  EXPECT_EQ((*snap.result)["total_clips"].get<int>(), 1);
  EXPECT_FALSE(snap.error.has_value());

  EXPECT_THROW(store.fail(id, JobError{"render", "late"}), InvalidStateError);
  EXPECT_THROW(store.mark_cancelled(id), InvalidStateError);
  EXPECT_THROW(store.advance(id, JobStatus::Finishing, "x"), InvalidStateError);
  EXPECT_THROW(store.request_cancel(id), InvalidStateError);
}

TEST(JobStoreTest, FailureKeepsClassifiedError) {
  JobStore store;
  std::string id = store.create(json::object());
  store.fail(id, JobError{"source", "source 'x' not found"});
  JobSnapshot snap = store.get(id);
  EXPECT_EQ(snap.status, JobStatus::Error);
  ASSERT_TRUE(snap.error.has_value());
  EXPECT_EQ(snap.error->kind, "source");
  EXPECT_EQ(snap.message, "Error: source 'x' not found");
  EXPECT_FALSE(snap.result.has_value());
}

TEST(JobStoreTest, CancelFlagReachesExistingTokens) {
  JobStore store;
  std::string id = store.create(json::object());
  CancellationToken token = store.token(id);
  EXPECT_FALSE(token.is_cancelled());

  store.request_cancel(id);
  EXPECT_TRUE(token.is_cancelled());
  EXPECT_TRUE(store.get(id).cancel_requested);
  /// Status changes only when the pipeline acknowledges
  EXPECT_EQ(store.get(id).status, JobStatus::Queued);
}

TEST(JobStoreTest, NotificationClaimedOnceAfterTerminal) {
  JobStore store;
  std::string id = store.create(json::object());
  EXPECT_FALSE(store.claim_notification(id));
  store.mark_cancelled(id);
  EXPECT_TRUE(store.claim_notification(id));
  EXPECT_FALSE(store.claim_notification(id));
}

TEST(JobStoreTest, ElapsedFreezesOnceTerminal) {
  JobStore store;
  std::string id = store.create(json::object());
  store.complete(id, json::object());
  JobSnapshot snap = store.get(id);
  double frozen = snap.elapsed_seconds(snap.updated_at + std::chrono::hours(1));
  EXPECT_LT(frozen, 1.0);
}

TEST(JobStoreTest, SweepDropsOnlyExpiredTerminalJobs) {
  JobStore store;
  std::string done = store.create(json::object());
  std::string running = store.create(json::object());
  store.complete(done, json::object());
  store.advance(running, JobStatus::Processing, "busy");

  const auto ttl = std::chrono::hours(72);
  EXPECT_EQ(store.sweep_expired(Clock::now(), ttl), 0u);

  auto later = Clock::now() + ttl + std::chrono::minutes(1);
  EXPECT_EQ(store.sweep_expired(later, ttl), 1u);
  EXPECT_FALSE(store.contains(done));
  EXPECT_TRUE(store.contains(running));
}

TEST(JobStoreTest, ConcurrentCreatesGiveDistinctIds) {
  JobStore store;
  std::vector<std::thread> threads;
  std::vector<std::vector<std::string>> ids(4);
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&store, &ids, t] {
      for (int i = 0; i < 50; ++i)
        ids[t].push_back(store.create(json::object()));
    });
  }
  for (auto &th : threads)
    th.join();

  std::set<std::string> unique;
  for (const auto &list : ids)
    unique.insert(list.begin(), list.end());
  EXPECT_EQ(unique.size(), 200u);
  EXPECT_EQ(store.size(), 200u);
}

} // anonymous namespace
} // namespace reel_cutter
