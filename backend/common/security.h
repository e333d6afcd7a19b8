#ifndef CONVERTHUB_CLIENT_SECURITY_H
#define CONVERTHUB_CLIENT_SECURITY_H

#include <array>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include <httplib.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "logger.h"

namespace converthub::security {

class MetricsRegistry {
 public:
  static MetricsRegistry &Instance() {
    static MetricsRegistry instance;
    return instance;
  }

  void RecordRequest(std::string_view service, std::string_view method, int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto &service_bucket = request_totals_[std::string(service)];
    service_bucket[{std::string(method), status}] += 1;
  }

  void RecordAuthFailure(std::string_view service, std::string_view category) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_failures_[std::string(service)][std::string(category)] += 1;
  }

  void RecordWebhookOutcome(std::string_view service, std::string_view outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    webhook_outcomes_[std::string(service)][std::string(outcome)] += 1;
  }

  long long WebhookOutcomeCount(std::string_view service, std::string_view outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto service_it = webhook_outcomes_.find(std::string(service));
    if (service_it == webhook_outcomes_.end()) {
      return 0;
    }
    const auto it = service_it->second.find(std::string(outcome));
    return it == service_it->second.end() ? 0 : it->second;
  }

  std::string Render(std::string_view service) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto service_key = std::string(service);
    std::ostringstream oss;
    oss << "# HELP service_request_total Total HTTP requests handled by the service" << '\n';
    oss << "# TYPE service_request_total counter" << '\n';
    if (auto it = request_totals_.find(service_key); it != request_totals_.end()) {
      for (const auto &entry : it->second) {
        const auto &method = std::get<0>(entry.first);
        const auto status = std::get<1>(entry.first);
        oss << "service_request_total{service=\"" << service_key << "\",method=\"" << method
            << "\",status=\"" << status << "\"} " << entry.second << '\n';
      }
    }
    oss << "# HELP service_auth_failures_total Rejected webhook and metrics credentials" << '\n';
    oss << "# TYPE service_auth_failures_total counter" << '\n';
    if (auto it = auth_failures_.find(service_key); it != auth_failures_.end()) {
      for (const auto &entry : it->second) {
        oss << "service_auth_failures_total{service=\"" << service_key << "\",category=\""
            << entry.first << "\"} " << entry.second << '\n';
      }
    }
    oss << "# HELP webhook_events_total Webhook deliveries by outcome" << '\n';
    oss << "# TYPE webhook_events_total counter" << '\n';
    if (auto it = webhook_outcomes_.find(service_key); it != webhook_outcomes_.end()) {
      for (const auto &entry : it->second) {
        oss << "webhook_events_total{service=\"" << service_key << "\",outcome=\"" << entry.first
            << "\"} " << entry.second << '\n';
      }
    }
    return oss.str();
  }

 private:
  using RequestKey = std::tuple<std::string, int>;

  MetricsRegistry() = default;

  std::mutex mutex_;
  std::map<std::string, std::map<RequestKey, long long>> request_totals_;
  std::map<std::string, std::map<std::string, long long>> auth_failures_;
  std::map<std::string, std::map<std::string, long long>> webhook_outcomes_;
};

inline void LogEvent(std::string_view service, std::string_view category, std::string_view message,
                     std::string_view context = {}) {
  logging::ServiceLogger::Instance(service).Log(category, message, context);
}

inline std::string HexEncode(const unsigned char *data, std::size_t len) {
  static const char *kHex = "0123456789abcdef";
  std::string output;
  output.reserve(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    const unsigned char value = data[i];
    output.push_back(kHex[value >> 4]);
    output.push_back(kHex[value & 0x0F]);
  }
  return output;
}

// Lowercase hex HMAC-SHA256 of `data` under `key`.
inline std::string HmacSha256Hex(std::string_view key, std::string_view data) {
  unsigned int len = 0;
  std::array<unsigned char, EVP_MAX_MD_SIZE> buffer{};
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
           reinterpret_cast<const unsigned char *>(data.data()), data.size(), buffer.data(), &len) == nullptr) {
    throw std::runtime_error("hmac_failed");
  }
  return HexEncode(buffer.data(), len);
}

inline bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

inline std::string RequestId(const httplib::Request &req) {
  if (auto value = req.get_header_value("X-Request-Id"); !value.empty()) {
    return value;
  }
  std::ostringstream oss;
  oss << "generated-" << std::hex
      << std::hash<std::string>{}(req.method + req.path + req.remote_addr + std::to_string(req.remote_port));
  return oss.str();
}

// Checks X-API-Key against `expected_key`; an empty expected key refuses everyone.
inline bool Authorize(const httplib::Request &req, httplib::Response &res, std::string_view service_name,
                      std::string_view expected_key) {
  const auto provided_key = req.get_header_value("X-API-Key");
  if (expected_key.empty() || provided_key.empty() || !ConstantTimeEquals(provided_key, expected_key)) {
    res.status = 401;
    res.set_content(R"({"error":"unauthorized"})", "application/json");
    std::ostringstream oss;
    oss << "Denied " << req.method << ' ' << req.path << " from " << req.remote_addr
        << " missing or invalid API key";
    LogEvent(service_name, "security", oss.str(), RequestId(req));
    MetricsRegistry::Instance().RecordAuthFailure(service_name, "api_key");
    return false;
  }
  return true;
}

inline void ConfigureServer(httplib::Server &server, std::string_view service_name) {
  server.set_logger([service_name](const auto &req, const auto &res) {
    std::ostringstream oss;
    oss << req.method << ' ' << req.path << " -> " << res.status;
    LogEvent(service_name, "http", oss.str(), RequestId(req));
    MetricsRegistry::Instance().RecordRequest(service_name, req.method, res.status);
    if (res.status >= 500) {
      std::ostringstream error_oss;
      error_oss << "HTTP error " << req.method << ' ' << req.path << " -> " << res.status;
      LogEvent(service_name, "error", error_oss.str(), RequestId(req));
    }
  });

  server.set_exception_handler([service_name](const auto &req, auto &res, std::exception_ptr ep) {
    std::string message = "unknown";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception &ex) {
        message = ex.what();
      }
    }
    std::ostringstream oss;
    oss << "Exception handling " << req.method << ' ' << req.path << ": " << message;
    LogEvent(service_name, "error", oss.str(), RequestId(req));
    res.status = 500;
    res.set_content(R"({"error":"internal_server_error"})", "application/json");
  });
}

inline void AttachStandardHandlers(httplib::Server &server, std::string_view service_name) {
  ConfigureServer(server, service_name);
  server.set_error_handler([service_name](const auto &req, auto &res) {
    std::ostringstream oss;
    oss << "Error handler invoked for " << req.method << ' ' << req.path << " -> " << res.status;
    LogEvent(service_name, "error", oss.str(), RequestId(req));
  });
}

inline void ExposeMetrics(httplib::Server &server, std::string_view service_name, std::string api_key) {
  server.Get("/metrics", [service_name, api_key](const httplib::Request &req, httplib::Response &res) {
    if (!Authorize(req, res, service_name, api_key)) {
      return;
    }
    res.set_content(MetricsRegistry::Instance().Render(service_name),
                    "text/plain; version=0.0.4; charset=utf-8");
  });
}

}  // namespace converthub::security

#endif  // CONVERTHUB_CLIENT_SECURITY_H
