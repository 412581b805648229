/**
 * @file notifier.cpp
 * @brief Webhook payloads, curl transport and retrying delivery
 */

#include "reel_cutter/notifier.hpp"

#include <cmath>
#include <system_error>

#include <fmt/core.h>

#include "reel_cutter/logging.hpp"
#include "reel_cutter/system.hpp"

namespace reel_cutter {

using nlohmann::json;

// **---- Payloads ----**

namespace {

double round_to(double v, int digits) {
  double scale = std::pow(10.0, digits);
  return std::round(v * scale) / scale;
}

} // anonymous namespace

json result_json(const std::vector<GeneratedClip> &clips) {
  json list = json::array();
  for (const auto &clip : clips) {
    json segments = json::array();
    for (const auto &s : clip.segments) {
      json seg = {{"start", round_to(s.start, 3)}, {"end", round_to(s.end, 3)}};
      if (s.description)
        seg["description"] = *s.description;
      segments.push_back(std::move(seg));
    }
    list.push_back({{"index", clip.index},
                    {"title", clip.title},
                    {"platform", to_string(clip.platform)},
                    {"file_id", clip.file.id},
                    {"file_name", clip.file.name},
                    {"link", clip.file.link},
                    {"segments", std::move(segments)},
                    {"output_size_mb", round_to(clip.output_size_mb, 2)},
                    {"total_duration", round_to(clip.total_duration, 1)}});
  }
  return {{"total_clips", clips.size()}, {"generated_clips", std::move(list)}};
}

json completed_payload(const std::string &job_id, const std::string &source_id,
                       const json &result) {
  return {{"job_id", job_id},
          {"status", "completed"},
          {"original_source_id", source_id},
          {"result", result}};
}

json error_payload(const std::string &job_id, const std::string &source_id,
                   const JobError &error) {
  return {{"job_id", job_id},
          {"status", "error"},
          {"original_source_id", source_id},
          {"error", {{"message", error.message}, {"kind", error.kind}}}};
}

json cancelled_payload(const std::string &job_id,
                       const std::string &source_id) {
  return {{"job_id", job_id},
          {"status", "cancelled"},
          {"original_source_id", source_id}};
}

// **---- CurlTransport ----**

HttpResponse CurlTransport::post_json(const std::string &url,
                                      const std::string &body,
                                      std::chrono::seconds timeout) {
  std::unique_ptr<MemFile> payload;
  try {
    payload = std::make_unique<MemFile>("webhook_body", body);
  } catch (const std::system_error &e) {
    throw TransportError(e.what());
  }

  /// Response body, then the status code on its own last line
  std::string cmd = fmt::format(
      "{} -s -X POST -H 'Content-Type: application/json' "
      "--data-binary @{} --max-time {} -w '\\n%{{http_code}}' {}",
      shell_quote(curl_), shell_quote(payload->path()), timeout.count(),
      shell_quote(url));

  CommandResult res;
  try {
    res = run_capture(cmd);
  } catch (const std::system_error &e) {
    throw TransportError(e.what());
  }
  if (res.exit_code != 0) {
    throw TransportError(
        fmt::format("curl exited with code {} for {}", res.exit_code, url));
  }

  size_t nl = res.output.rfind('\n');
  std::string code =
      (nl == std::string::npos) ? res.output : res.output.substr(nl + 1);
  HttpResponse response;
  try {
    response.status = std::stoi(code);
  } catch (const std::exception &) {
    throw TransportError(fmt::format("unreadable HTTP status '{}'", code));
  }
  if (response.status == 0)
    throw TransportError(fmt::format("no HTTP response from {}", url));
  if (nl != std::string::npos)
    response.body = res.output.substr(0, nl);
  return response;
}

// **---- WebhookNotifier ----**

namespace {

/// Non-2xx answer; retryable or not depending on the status
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status, const std::string &body)
      : std::runtime_error(fmt::format("webhook status {}: {}", status,
                                       body.substr(0, 200))),
        status_(status) {}

  int status() const { return status_; }

private:
  int status_;
};

} // anonymous namespace

WebhookNotifier::WebhookNotifier(std::shared_ptr<HttpTransport> transport,
                                 RetryPolicy policy,
                                 std::chrono::seconds timeout, Sleeper sleep)
    : transport_(std::move(transport)), policy_(std::move(policy)),
      timeout_(timeout), sleep_(std::move(sleep)) {
  policy_.retryable = [](const std::exception &e) {
    if (dynamic_cast<const TransportError *>(&e))
      return true;
    if (auto *status = dynamic_cast<const HttpStatusError *>(&e))
      return retryable_status(status->status());
    return false;
  };
}

bool WebhookNotifier::retryable_status(int status) {
  return status == 429 || status >= 500;
}

void WebhookNotifier::notify(const std::string &url, const json &payload) {
  const std::string body = payload.dump();
  int attempt = 0;

  try {
    run_with_retry(
        policy_,
        [&] {
          ++attempt;
          LOG_INFO("Webhook POST to {} (attempt {}/{})", url, attempt,
                   policy_.max_attempts);
          try {
            HttpResponse res = transport_->post_json(url, body, timeout_);
            if (res.status < 200 || res.status >= 300)
              throw HttpStatusError(res.status, res.body);
            LOG_INFO("Webhook delivered: {}", res.status);
          } catch (const TransportError &e) {
            LOG_WARN("Webhook network error: {}", e.what());
            throw;
          } catch (const HttpStatusError &e) {
            if (retryable_status(e.status()))
              LOG_WARN("Webhook returned {}, will retry", e.status());
            else
              LOG_ERROR("Webhook client error {}. Not retrying.", e.status());
            throw;
          }
        },
        sleep_);
  } catch (const std::exception &e) {
    throw NotifyError(fmt::format("webhook delivery to {} failed after {} "
                                  "attempt(s): {}",
                                  url, attempt, e.what()));
  }
}

} // namespace reel_cutter
