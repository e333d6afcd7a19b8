#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../../client/src/cancellation.h"
#include "../../common/config.h"
#include "../../common/logger.h"
#include "../../common/persistence/dedup_store.h"
#include "../../common/persistence/postgres.h"
#include "../../common/security.h"
#include "webhook_receiver.h"

using json = nlohmann::json;

namespace {

using converthub::client::JobStatus;

converthub::logging::ServiceLogger &DaemonLogger() {
  static auto &logger = converthub::logging::ServiceLogger::Instance("webhookd");
  return logger;
}

void SendJson(httplib::Response &res, const json &payload, int status = 200) {
  res.status = status;
  res.set_header("Content-Type", "application/json");
  res.body = payload.dump();
}

void LogConversionEvent(const converthub::webhook::WebhookEvent &event) {
  auto &logger = DaemonLogger();
  if (event.status == JobStatus::kCompleted) {
    json context{{"job_id", event.job_id}};
    if (event.result) {
      context["format"] = event.result->format;
      context["file_size"] = event.result->file_size;
      context["download_url"] = event.result->download_url;
    }
    logger.Info("conversion_completed", context.dump());
  } else if (event.status == JobStatus::kFailed) {
    json context{{"job_id", event.job_id}};
    if (event.error) {
      context["code"] = event.error->code;
      context["message"] = event.error->message;
    }
    logger.Error("conversion_failed", context.dump());
  } else {
    logger.Info("conversion_cancelled", json{{"job_id", event.job_id}}.dump());
  }
}

void LogProgressEvent(const converthub::webhook::WebhookEvent &event) {
  json context{{"job_id", event.job_id}, {"event", event.event}};
  if (!event.session_id.empty()) {
    context["session_id"] = event.session_id;
  }
  if (event.progress.contains("percentage")) {
    context["percentage"] = event.progress["percentage"];
  }
  DaemonLogger().Info("conversion_progress", context.dump());
}

}  // namespace

int main() {
  converthub::config::WebhookConfig config;
  try {
    config = converthub::config::LoadWebhookConfigFromEnv();
  } catch (const std::exception &ex) {
    DaemonLogger().Error("invalid_configuration", ex.what());
    std::cerr << "converthub-webhookd: " << ex.what() << std::endl;
    return 2;
  }
  const auto policy = converthub::webhook::ParseFailurePolicy(config.failure_policy);

  std::shared_ptr<converthub::persistence::DedupStore> dedup_store;
  std::shared_ptr<converthub::persistence::PostgresDedupStore> postgres_store;
  try {
    if (config.dedup_database_url) {
      postgres_store = std::make_shared<converthub::persistence::PostgresDedupStore>(
          std::make_shared<converthub::persistence::PostgresConfig>(*config.dedup_database_url,
                                                                 "converthub-webhookd"));
      postgres_store->EnsureSchema();
      dedup_store = postgres_store;
    } else {
      dedup_store = std::make_shared<converthub::persistence::InMemoryDedupStore>(
          config.dedup_capacity, std::chrono::duration_cast<std::chrono::milliseconds>(config.dedup_ttl));
    }
  } catch (const std::exception &ex) {
    DaemonLogger().Error("dedup_store_unavailable", ex.what());
    return 1;
  }

  converthub::webhook::WebhookOptions options(
      converthub::webhook::WebhookAuth{config.hmac_secret, config.bearer_token}, *policy);
  options.progress_handler = LogProgressEvent;
  converthub::webhook::WebhookReceiver receiver(std::move(options), dedup_store, LogConversionEvent);

  httplib::Server server;
  converthub::security::AttachStandardHandlers(server, "webhook");
  converthub::security::ExposeMetrics(server, "webhook", config.metrics_api_key);

  server.Get("/health", [](const httplib::Request &, httplib::Response &res) {
    SendJson(res, json{{"status", "healthy"},
                       {"timestamp", converthub::logging::detail::TimestampNow()},
                       {"service", "converthub-webhookd"}});
  });
  receiver.Mount(server, config.path);

  // Shared dedup tables are trimmed here; the in-memory store expires keys itself.
  converthub::client::CancellationToken stop;
  std::thread evictor;
  if (postgres_store) {
    evictor = std::thread([&stop, postgres_store, ttl = config.dedup_ttl]() {
      while (!stop.WaitFor(std::chrono::minutes(15))) {
        try {
          const auto removed = postgres_store->Evict(ttl);
          DaemonLogger().Debug("dedup_evicted", std::to_string(removed));
        } catch (const std::exception &ex) {
          DaemonLogger().Warn("dedup_evict_failed", ex.what());
        }
      }
    });
  }

  DaemonLogger().Info("starting_webhook_receiver",
                      json{{"port", config.port},
                           {"path", config.path},
                           {"failure_policy", config.failure_policy},
                           {"dedup", postgres_store ? "postgres" : "memory"}}
                          .dump());
  const bool listened = server.listen("0.0.0.0", config.port);
  stop.Cancel();
  if (evictor.joinable()) {
    evictor.join();
  }
  if (!listened) {
    DaemonLogger().Error("listen_failed", "port " + std::to_string(config.port));
    return 1;
  }
  return 0;
}
