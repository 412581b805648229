/**
 * @file notifier_test.cpp
 * @brief Webhook payloads and retrying delivery
 */

#include <gtest/gtest.h>

#include <memory>

#include "fakes.hpp"
#include "reel_cutter/notifier.hpp"

namespace reel_cutter {
namespace {

using nlohmann::json;
using std::chrono::milliseconds;

RetryPolicy three_retries() {
  RetryPolicy p;
  p.max_attempts = 4;
  p.backoff = {milliseconds(2000), milliseconds(4000), milliseconds(8000)};
  return p;
}

struct Delivery {
  std::shared_ptr<fakes::ScriptedTransport> transport;
  std::vector<milliseconds> sleeps;
  std::unique_ptr<WebhookNotifier> notifier;

  explicit Delivery(std::deque<int> statuses)
      : transport(std::make_shared<fakes::ScriptedTransport>(std::move(statuses))) {
    notifier = std::make_unique<WebhookNotifier>(
        transport, three_retries(), std::chrono::seconds(30),
        [this](milliseconds d) { sleeps.push_back(d); });
  }
};

// **---- Payloads ----**

TEST(PayloadTest, CompletedCarriesResult) {
  GeneratedClip clip;
  clip.index = 1;
  clip.title = "Opening";
  clip.platform = Platform::YoutubeShorts;
  clip.file = UploadedFile{"f1", "viral-1a2b3c4d-corte1.mp4", "https://x/f1"};
  Segment s;
  s.start = 12.34567;
  s.end = 40.0;
  s.description = "setup";
  clip.segments = {s};
  clip.output_size_mb = 12.3456;
  clip.total_duration = 27.65;

  json result = result_json({clip});
  EXPECT_EQ(result["total_clips"].get<int>(), 1);
  const json &c = result["generated_clips"][0];
  EXPECT_EQ(c["platform"].get<std::string>(), "youtube_shorts");
  EXPECT_EQ(c["file_id"].get<std::string>(), "f1");
  EXPECT_EQ(c["link"].get<std::string>(), "https://x/f1");
  EXPECT_DOUBLE_EQ(c["segments"][0]["start"].get<double>(), 12.346);
  EXPECT_EQ(c["segments"][0]["description"].get<std::string>(), "setup");
  EXPECT_DOUBLE_EQ(c["output_size_mb"].get<double>(), 12.35);

  json payload = completed_payload("job-1", "src-9", result);
  EXPECT_EQ(payload["status"].get<std::string>(), "completed");
  EXPECT_EQ(payload["original_source_id"].get<std::string>(), "src-9");
  EXPECT_EQ(payload["result"], result);
}

TEST(PayloadTest, ErrorAndCancelledShapes) {
  json err = error_payload("job-1", "src-9", JobError{"render", "ffmpeg died"});
  EXPECT_EQ(err["status"].get<std::string>(), "error");
  EXPECT_EQ(err["error"]["kind"].get<std::string>(), "render");
  EXPECT_EQ(err["error"]["message"].get<std::string>(), "ffmpeg died");
  EXPECT_FALSE(err.contains("result"));

  json cancelled = cancelled_payload("job-1", "src-9");
  EXPECT_EQ(cancelled["status"].get<std::string>(), "cancelled");
  EXPECT_FALSE(cancelled.contains("error"));
}

// **---- Delivery ----**

TEST(WebhookNotifierTest, DeliversOnFirstSuccess) {
  Delivery d({204});
  d.notifier->notify("https://hooks.example/x", {{"status", "completed"}});
  ASSERT_EQ(d.transport->bodies.size(), 1u);
  EXPECT_EQ(json::parse(d.transport->bodies[0])["status"].get<std::string>(),
            "completed");
  EXPECT_TRUE(d.sleeps.empty());
}

TEST(WebhookNotifierTest, RetriesServerErrorsAndNetworkFailures) {
  Delivery d({503, 0, 429, 200});
  EXPECT_NO_THROW(d.notifier->notify("https://hooks.example/x", json::object()));
  EXPECT_EQ(d.transport->bodies.size(), 4u);
  ASSERT_EQ(d.sleeps.size(), 3u);
  EXPECT_EQ(d.sleeps[0], milliseconds(2000));
  EXPECT_EQ(d.sleeps[2], milliseconds(8000));
}

TEST(WebhookNotifierTest, ClientErrorIsNotRetried) {
  Delivery d({404, 200});
  EXPECT_THROW(d.notifier->notify("https://hooks.example/x", json::object()),
               NotifyError);
  EXPECT_EQ(d.transport->bodies.size(), 1u);
  EXPECT_TRUE(d.sleeps.empty());
}

TEST(WebhookNotifierTest, GivesUpAfterFourAttempts) {
  Delivery d({500, 500, 500, 500, 200});
  EXPECT_THROW(d.notifier->notify("https://hooks.example/x", json::object()),
               NotifyError);
  EXPECT_EQ(d.transport->bodies.size(), 4u);
}

TEST(WebhookNotifierTest, RetryableStatuses) {
  EXPECT_TRUE(WebhookNotifier::retryable_status(500));
  EXPECT_TRUE(WebhookNotifier::retryable_status(502));
  EXPECT_TRUE(WebhookNotifier::retryable_status(429));
  EXPECT_FALSE(WebhookNotifier::retryable_status(400));
  EXPECT_FALSE(WebhookNotifier::retryable_status(410));
}

} // anonymous namespace
} // namespace reel_cutter
