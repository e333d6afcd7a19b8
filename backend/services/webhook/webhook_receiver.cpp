#include "webhook_receiver.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include "../../common/logger.h"
#include "../../common/security.h"

namespace converthub::webhook {
namespace {

using json = nlohmann::json;
using client::JobStatus;

std::string StringField(const json &payload, const char *key) {
  if (const auto it = payload.find(key); it != payload.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

std::optional<JobStatus> StatusForEvent(std::string_view event) {
  if (event == "conversion.completed") {
    return JobStatus::kCompleted;
  }
  if (event == "conversion.failed") {
    return JobStatus::kFailed;
  }
  if (event == "conversion.cancelled") {
    return JobStatus::kCancelled;
  }
  if (event == "conversion.progress" || event == "conversion.processing" || event == "upload.completed") {
    return JobStatus::kProcessing;
  }
  if (event == "conversion.queued") {
    return JobStatus::kQueued;
  }
  return std::nullopt;
}

std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

}  // namespace

std::optional<FailurePolicy> ParseFailurePolicy(std::string_view value) {
  if (value == "acknowledge") {
    return FailurePolicy::kAcknowledge;
  }
  if (value == "retry") {
    return FailurePolicy::kRequestRetry;
  }
  return std::nullopt;
}

std::string ToString(FailurePolicy policy) {
  return policy == FailurePolicy::kAcknowledge ? "acknowledge" : "retry";
}

std::string WebhookRequest::HeaderValue(const std::string &name) const {
  if (const auto it = headers.find(name); it != headers.end()) {
    return it->second;
  }
  return {};
}

std::optional<WebhookEvent> ParseWebhookEvent(std::string_view body, std::string &error) {
  const auto payload = json::parse(body.begin(), body.end(), nullptr, false);
  if (payload.is_discarded() || !payload.is_object()) {
    error = "invalid_json";
    return std::nullopt;
  }
  WebhookEvent event;
  event.event = StringField(payload, "event");
  event.job_id = StringField(payload, "job_id");
  if (event.job_id.empty()) {
    error = "missing_job_id";
    return std::nullopt;
  }
  std::optional<JobStatus> status;
  if (const auto declared = StringField(payload, "status"); !declared.empty()) {
    status = client::ParseJobStatus(declared);
  } else {
    status = StatusForEvent(event.event);
  }
  if (!status) {
    error = "unknown_status";
    return std::nullopt;
  }
  event.status = *status;
  event.event_id = StringField(payload, "event_id");
  event.timestamp = StringField(payload, "timestamp");
  event.session_id = StringField(payload, "session_id");
  if (const auto it = payload.find("result"); it != payload.end() && it->is_object()) {
    client::JobResult result;
    result.download_url = StringField(*it, "download_url");
    result.format = StringField(*it, "format");
    result.expires_at = StringField(*it, "expires_at");
    if (const auto size = it->find("file_size"); size != it->end() && size->is_number_unsigned()) {
      result.file_size = size->get<std::uint64_t>();
    }
    event.result = std::move(result);
  }
  if (const auto it = payload.find("error"); it != payload.end() && it->is_object()) {
    client::ApiErrorBody failure;
    failure.code = StringField(*it, "code");
    failure.message = StringField(*it, "message");
    event.error = std::move(failure);
  }
  if (const auto it = payload.find("progress"); it != payload.end() && it->is_object()) {
    event.progress = *it;
  }
  event.raw = payload;
  return event;
}

std::string DedupKey(const WebhookEvent &event) {
  return event.job_id + ":" + client::ToString(event.status);
}

std::string TerminalClaimKey(const std::string &job_id) {
  return job_id + ":terminal";
}

WebhookReceiver::WebhookReceiver(WebhookOptions options, std::shared_ptr<persistence::DedupStore> dedup_store,
                                 EventHandler handler)
    : options_(std::move(options)), dedup_store_(std::move(dedup_store)), handler_(std::move(handler)) {
  if (options_.auth.hmac_secret.empty() && options_.auth.bearer_token.empty()) {
    throw std::invalid_argument("webhook receiver needs a shared secret or a bearer token");
  }
  if (!dedup_store_) {
    throw std::invalid_argument("webhook receiver needs a dedup store");
  }
  if (!handler_) {
    throw std::invalid_argument("webhook receiver needs an event handler");
  }
}

bool WebhookReceiver::Authenticate(const WebhookRequest &request) const {
  if (!options_.auth.hmac_secret.empty()) {
    auto provided = request.HeaderValue("X-Webhook-Signature");
    if (provided.rfind("sha256=", 0) == 0) {
      provided.erase(0, 7);
    }
    const auto expected = security::HmacSha256Hex(options_.auth.hmac_secret, request.body);
    if (!provided.empty() && security::ConstantTimeEquals(Lowercase(provided), expected)) {
      return true;
    }
  }
  if (!options_.auth.bearer_token.empty()) {
    const auto header = request.HeaderValue("Authorization");
    constexpr std::string_view kPrefix = "Bearer ";
    if (header.size() > kPrefix.size() && header.compare(0, kPrefix.size(), kPrefix) == 0 &&
        security::ConstantTimeEquals(std::string_view(header).substr(kPrefix.size()), options_.auth.bearer_token)) {
      return true;
    }
  }
  return false;
}

WebhookResponse WebhookReceiver::Respond(std::string_view outcome, int status, nlohmann::json body) const {
  security::MetricsRegistry::Instance().RecordWebhookOutcome(options_.service_name, outcome);
  WebhookResponse response;
  response.status = status;
  response.body = std::move(body);
  return response;
}

WebhookResponse WebhookReceiver::Handle(const WebhookRequest &request) {
  auto &logger = logging::ServiceLogger::Instance(options_.service_name);
  // Nothing in the body is looked at before the credentials check out.
  if (!Authenticate(request)) {
    logger.Warn("webhook_unauthorized", "signature or bearer token rejected");
    security::MetricsRegistry::Instance().RecordAuthFailure(options_.service_name, "webhook_credentials");
    return Respond("unauthorized", 401, json{{"error", "unauthorized"}});
  }

  std::string parse_error;
  const auto event = ParseWebhookEvent(request.body, parse_error);
  if (!event) {
    logger.Warn("webhook_rejected", parse_error);
    return Respond("bad_request", 400, json{{"error", parse_error}});
  }
  logger.Info("webhook_received", "event=" + event->event + " job=" + event->job_id +
                                      " status=" + client::ToString(event->status));
  if (client::IsTerminal(event->status)) {
    return HandleTerminal(*event);
  }
  return HandleProgress(*event);
}

WebhookResponse WebhookReceiver::Conflict(const WebhookEvent &event, const std::string &settled) const {
  logging::ServiceLogger::Instance(options_.service_name)
      .Warn("webhook_conflict",
            "job=" + event.job_id + " settled=" + settled + " reported=" + client::ToString(event.status));
  return Respond("conflict", 200, json{{"status", "conflict"}, {"job_id", event.job_id}});
}

WebhookResponse WebhookReceiver::HandleTerminal(const WebhookEvent &event) {
  auto &logger = logging::ServiceLogger::Instance(options_.service_name);
  if (options_.state_book) {
    if (const auto known = options_.state_book->Get(event.job_id);
        known && client::IsTerminal(*known) && *known != event.status) {
      return Conflict(event, client::ToString(*known));
    }
  }

  const auto key = DedupKey(event);
  if (!dedup_store_->InsertIfAbsent(key)) {
    logger.Info("webhook_duplicate", key);
    return Respond("duplicate", 200, json{{"status", "duplicate"}, {"job_id", event.job_id}});
  }
  // One terminal status per job reaches the handler, whichever claims it first. The
  // claim lives in the dedup store so receivers sharing a store agree on it.
  const auto claim = TerminalClaimKey(event.job_id);
  if (!dedup_store_->InsertIfAbsent(claim)) {
    dedup_store_->Erase(key);
    return Conflict(event, "claimed");
  }
  if (options_.state_book) {
    const auto settled = options_.state_book->Observe(event.job_id, event.status);
    if (settled != event.status) {
      // Polling settled the job first; a report agreeing with it may still be delivered.
      dedup_store_->Erase(claim);
      dedup_store_->Erase(key);
      return Conflict(event, client::ToString(settled));
    }
  }

  std::optional<std::string> failure;
  try {
    handler_(event);
  } catch (const std::exception &ex) {
    failure = ex.what();
  } catch (...) {
    failure = "unknown exception";
  }
  if (failure) {
    logger.Error("webhook_handler_failed", key + ": " + *failure);
    if (options_.failure_policy == FailurePolicy::kRequestRetry) {
      dedup_store_->Erase(claim);
      dedup_store_->Erase(key);
      return Respond("handler_failed", 500, json{{"error", "handler_failed"}, {"job_id", event.job_id}});
    }
    return Respond("handler_failed", 200, json{{"status", "handler_failed"}, {"job_id", event.job_id}});
  }
  return Respond("accepted", 200, json{{"status", "accepted"}, {"job_id", event.job_id}});
}

WebhookResponse WebhookReceiver::HandleProgress(const WebhookEvent &event) {
  if (options_.state_book) {
    options_.state_book->Observe(event.job_id, event.status);
  }
  if (options_.progress_handler) {
    try {
      options_.progress_handler(event);
    } catch (const std::exception &ex) {
      logging::ServiceLogger::Instance(options_.service_name)
          .Error("webhook_progress_handler_failed", event.job_id + ": " + ex.what());
    } catch (...) {
      logging::ServiceLogger::Instance(options_.service_name)
          .Error("webhook_progress_handler_failed", event.job_id + ": unknown exception");
    }
  }
  return Respond("progress", 200, json{{"status", "progress"}, {"job_id", event.job_id}});
}

void WebhookReceiver::Mount(httplib::Server &server, const std::string &path) {
  server.Post(path, [this](const httplib::Request &req, httplib::Response &res) {
    WebhookRequest request;
    request.body = req.body;
    request.headers = req.headers;
    const auto response = Handle(request);
    res.status = response.status;
    res.set_content(response.body.dump(), "application/json");
  });
}

}  // namespace converthub::webhook
