/**
 * @file notifier.hpp
 * @brief Webhook payloads and delivery
 *
 * @details Provides:
 *
 *          - Payload builders for completed / error / cancelled jobs
 *
 *          - HttpTransport abstraction and the curl-based implementation
 *
 *          - WebhookNotifier: retry on transport errors, 5xx and 429; any
 *            other non-2xx answer is final
 */

#ifndef REEL_CUTTER_NOTIFIER_HPP
#define REEL_CUTTER_NOTIFIER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "job_store.hpp"
#include "providers.hpp"
#include "retry_policy.hpp"

namespace reel_cutter {

// **---- Payloads ----**

/**
 * @struct GeneratedClip
 * @brief One published output, as reported to the caller.
 */
struct GeneratedClip {
  int index = 0;
  std::string title;
  Platform platform = Platform::Universal;
  UploadedFile file;
  std::vector<Segment> segments;
  double output_size_mb = 0.0;
  double total_duration = 0.0;
};

/// {total_clips, generated_clips:[...]}
nlohmann::json result_json(const std::vector<GeneratedClip> &clips);

nlohmann::json completed_payload(const std::string &job_id,
                                 const std::string &source_id,
                                 const nlohmann::json &result);
nlohmann::json error_payload(const std::string &job_id,
                             const std::string &source_id,
                             const JobError &error);
nlohmann::json cancelled_payload(const std::string &job_id,
                                 const std::string &source_id);

// **---- Transport ----**

/// Network-level failure: no HTTP status was received
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct HttpResponse {
  int status = 0;
  std::string body;
};

class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  /**
   * @brief POST a JSON body.
   * @throws TransportError when no response was received
   */
  virtual HttpResponse post_json(const std::string &url,
                                 const std::string &body,
                                 std::chrono::seconds timeout) = 0;
};

/**
 * @class CurlTransport
 * @brief Runs the curl binary; the body is passed through a memory file.
 */
class CurlTransport : public HttpTransport {
public:
  explicit CurlTransport(std::string curl_path) : curl_(std::move(curl_path)) {}

  HttpResponse post_json(const std::string &url, const std::string &body,
                         std::chrono::seconds timeout) override;

private:
  std::string curl_;
};

// **---- Notifier ----**

/**
 * @class WebhookNotifier
 * @brief Notifier delivering JSON payloads over an HttpTransport.
 */
class WebhookNotifier : public Notifier {
public:
  WebhookNotifier(std::shared_ptr<HttpTransport> transport, RetryPolicy policy,
                  std::chrono::seconds timeout, Sleeper sleep = thread_sleeper());

  /// @throws NotifyError after a final rejection or exhausted retries
  void notify(const std::string &url, const nlohmann::json &payload) override;

  /// 5xx and 429 are worth another attempt
  static bool retryable_status(int status);

private:
  std::shared_ptr<HttpTransport> transport_;
  RetryPolicy policy_;
  std::chrono::seconds timeout_;
  Sleeper sleep_;
};

} // namespace reel_cutter

#endif // REEL_CUTTER_NOTIFIER_HPP
