#ifndef CONVERTHUB_CLIENT_CONFIG_H
#define CONVERTHUB_CLIENT_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "../client/src/job_tracker.h"
#include "../client/src/retry_policy.h"
#include "../client/src/transport.h"
#include "../client/src/upload_session.h"
#include "env_loader.h"

namespace converthub::config {

struct ClientConfig {
  std::string api_base_url = "https://api.converthub.com/v2";
  std::string api_key;
  client::HttplibTimeouts timeouts;
  client::RetryPolicy retry;
  client::UploadOptions upload;
  client::WaitOptions wait;
  std::string resume_directory = ".converthub/uploads";

  client::TransportOptions ToTransportOptions() const {
    client::TransportOptions options;
    options.base_url = api_base_url;
    options.api_key = api_key;
    options.retry = retry;
    return options;
  }
};

struct WebhookConfig {
  int port = 8080;
  std::string path = "/webhook";
  std::string hmac_secret;
  std::string bearer_token;
  // "acknowledge" or "retry"; there is no default.
  std::string failure_policy;
  std::size_t dedup_capacity = 10000;
  std::chrono::seconds dedup_ttl{std::chrono::hours(24)};
  std::optional<std::string> dedup_database_url;
  std::string metrics_api_key;
};

namespace detail {

inline std::int64_t PositiveIntOrDefault(const std::string &key, std::int64_t fallback) {
  const auto value = env::GetIntOrDefault(key, fallback);
  if (value <= 0) {
    throw std::runtime_error(key + " must be a positive integer");
  }
  return value;
}

}  // namespace detail

inline ClientConfig LoadClientConfigFromEnv() {
  env::LoadEnvironment();
  ClientConfig config;
  config.api_base_url = env::GetOrDefault("CONVERTHUB_API_BASE_URL", config.api_base_url);
  config.api_key = env::GetOrDefault("CONVERTHUB_API_KEY", "");
  config.timeouts.connect =
      std::chrono::seconds(detail::PositiveIntOrDefault("CONVERTHUB_CONNECT_TIMEOUT_SECONDS", 10));
  config.timeouts.read = std::chrono::seconds(detail::PositiveIntOrDefault("CONVERTHUB_READ_TIMEOUT_SECONDS", 60));
  config.timeouts.write = config.timeouts.read;
  config.retry.max_attempts = static_cast<int>(detail::PositiveIntOrDefault("CONVERTHUB_MAX_ATTEMPTS", 4));
  config.upload.chunk_size =
      static_cast<std::uint64_t>(detail::PositiveIntOrDefault("CONVERTHUB_CHUNK_SIZE_MB", 5)) * 1024 * 1024;
  config.upload.part_attempts = static_cast<int>(detail::PositiveIntOrDefault("CONVERTHUB_PART_ATTEMPTS", 3));
  config.wait.poll_interval =
      std::chrono::milliseconds(detail::PositiveIntOrDefault("CONVERTHUB_POLL_INTERVAL_MS", 2000));
  config.wait.timeout = std::chrono::seconds(detail::PositiveIntOrDefault("CONVERTHUB_WAIT_TIMEOUT_SECONDS", 600));
  config.resume_directory = env::GetOrDefault("CONVERTHUB_RESUME_DIRECTORY", config.resume_directory);
  return config;
}

inline WebhookConfig LoadWebhookConfigFromEnv() {
  env::LoadEnvironment();
  WebhookConfig config;
  config.port = static_cast<int>(detail::PositiveIntOrDefault("WEBHOOK_PORT", 8080));
  config.path = env::GetOrDefault("WEBHOOK_PATH", config.path);
  config.hmac_secret = env::GetOrDefault("WEBHOOK_SECRET", "");
  config.bearer_token = env::GetOrDefault("WEBHOOK_BEARER_TOKEN", "");
  if (config.hmac_secret.empty() && config.bearer_token.empty()) {
    throw std::runtime_error("WEBHOOK_SECRET or WEBHOOK_BEARER_TOKEN must be set");
  }
  config.failure_policy = env::GetOrDefault("WEBHOOK_FAILURE_POLICY", "");
  if (config.failure_policy != "acknowledge" && config.failure_policy != "retry") {
    throw std::runtime_error("WEBHOOK_FAILURE_POLICY must be 'acknowledge' or 'retry'");
  }
  config.dedup_capacity =
      static_cast<std::size_t>(detail::PositiveIntOrDefault("WEBHOOK_DEDUP_CAPACITY", 10000));
  config.dedup_ttl = std::chrono::seconds(detail::PositiveIntOrDefault("WEBHOOK_DEDUP_TTL_SECONDS", 86400));
  config.dedup_database_url = env::Get("WEBHOOK_DEDUP_DATABASE_URL");
  config.metrics_api_key = env::GetOrDefault("CONVERTHUB_METRICS_API_KEY", "");
  return config;
}

}  // namespace converthub::config

#endif  // CONVERTHUB_CLIENT_CONFIG_H
