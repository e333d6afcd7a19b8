#ifndef CONVERTHUB_CLIENT_WEBHOOK_RECEIVER_H
#define CONVERTHUB_CLIENT_WEBHOOK_RECEIVER_H

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../../client/src/api_types.h"
#include "../../client/src/job_status.h"
#include "../../client/src/job_tracker.h"
#include "../../common/persistence/dedup_store.h"

namespace converthub::webhook {

// Credentials a delivery must carry. At least one must be set; a delivery passing
// any configured check is accepted.
struct WebhookAuth {
  // X-Webhook-Signature: hex HMAC-SHA256 of the raw body.
  std::string hmac_secret;
  // Authorization: Bearer <token>.
  std::string bearer_token;
};

// What the receiver answers when the application handler throws.
enum class FailurePolicy {
  // 200, the delivery is considered handled.
  kAcknowledge,
  // 500 and the dedup key is released, so the service redelivers.
  kRequestRetry,
};

std::optional<FailurePolicy> ParseFailurePolicy(std::string_view value);
std::string ToString(FailurePolicy policy);

struct WebhookEvent {
  std::string event;
  std::string job_id;
  client::JobStatus status = client::JobStatus::kQueued;
  std::string event_id;
  std::string timestamp;
  std::optional<client::JobResult> result;
  std::optional<client::ApiErrorBody> error;
  nlohmann::json progress = nlohmann::json::object();
  std::string session_id;
  nlohmann::json raw;
};

using EventHandler = std::function<void(const WebhookEvent &)>;

struct WebhookOptions {
  // The failure policy has no default and must be chosen.
  WebhookOptions(WebhookAuth auth_in, FailurePolicy policy) : auth(std::move(auth_in)), failure_policy(policy) {}

  WebhookAuth auth;
  FailurePolicy failure_policy;
  // Terminal reports are fed into this book so waiting trackers finish early.
  std::shared_ptr<client::JobStateBook> state_book;
  // Receives non-terminal events; these are not deduplicated.
  EventHandler progress_handler;
  std::string service_name = "webhook";
};

struct WebhookRequest {
  std::string body;
  httplib::Headers headers;

  std::string HeaderValue(const std::string &name) const;
};

struct WebhookResponse {
  int status = 200;
  nlohmann::json body = nlohmann::json::object();
};

class WebhookReceiver {
 public:
  WebhookReceiver(WebhookOptions options, std::shared_ptr<persistence::DedupStore> dedup_store,
                  EventHandler handler);

  WebhookResponse Handle(const WebhookRequest &request);

  // Registers POST `path` on the server.
  void Mount(httplib::Server &server, const std::string &path = "/webhook");

 private:
  bool Authenticate(const WebhookRequest &request) const;
  WebhookResponse Respond(std::string_view outcome, int status, nlohmann::json body) const;
  WebhookResponse Conflict(const WebhookEvent &event, const std::string &settled) const;
  WebhookResponse HandleTerminal(const WebhookEvent &event);
  WebhookResponse HandleProgress(const WebhookEvent &event);

  WebhookOptions options_;
  std::shared_ptr<persistence::DedupStore> dedup_store_;
  EventHandler handler_;
};

// Decodes a delivery body. std::nullopt with `error` set when the payload is unusable.
std::optional<WebhookEvent> ParseWebhookEvent(std::string_view body, std::string &error);

// Dedup key for a terminal report: "<job_id>:<status>".
std::string DedupKey(const WebhookEvent &event);

// Key held by whichever terminal report for `job_id` was accepted first.
std::string TerminalClaimKey(const std::string &job_id);

}  // namespace converthub::webhook

#endif  // CONVERTHUB_CLIENT_WEBHOOK_RECEIVER_H
