#ifndef CONVERTHUB_CLIENT_TRANSPORT_H
#define CONVERTHUB_CLIENT_TRANSPORT_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <httplib.h>

#include "http_message.h"
#include "retry_policy.h"

namespace converthub::client {

// Receives a download body piece by piece; returning false aborts the transfer.
using ContentSink = std::function<bool(const char *data, std::size_t length)>;

// One blocking HTTP exchange. Network-level failures raise TransportError; every
// HTTP status, including errors, comes back as a response.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Send(const HttpRequest &request) = 0;

  // Success bodies go to `sink`; error bodies are buffered in the returned response.
  virtual HttpResponse Stream(const HttpRequest &request, const ContentSink &sink) = 0;
};

struct ParsedUrl {
  std::string scheme;
  std::string host;
  int port = 0;
  std::string path;
  bool secure = false;

  std::string Origin() const;
};

ParsedUrl ParseUrl(const std::string &url);

struct HttplibTimeouts {
  std::chrono::seconds connect{10};
  std::chrono::seconds read{60};
  std::chrono::seconds write{60};
};

// Opens a fresh cpp-httplib client per exchange, so one instance can be shared
// by any number of threads.
class HttplibTransport : public HttpTransport {
 public:
  explicit HttplibTransport(HttplibTimeouts timeouts = {});

  HttpResponse Send(const HttpRequest &request) override;
  HttpResponse Stream(const HttpRequest &request, const ContentSink &sink) override;

 private:
  std::unique_ptr<httplib::Client> MakeClient(const ParsedUrl &url) const;

  HttplibTimeouts timeouts_;
};

// Rate ceilings the service enforces per endpoint class.
enum class RequestClass { kSubmission, kStatus, kFormats, kChunk, kOther };

struct RateCeilings {
  int submission_per_minute = 60;
  int status_per_minute = 100;
  int formats_per_minute = 200;
  int chunk_per_minute = 500;

  int For(RequestClass request_class) const;
};

// Token bucket per request class: bursts up to the per-minute ceiling, then paces.
class RequestThrottle {
 public:
  explicit RequestThrottle(RateCeilings ceilings);

  // Blocks until a token for `request_class` is available.
  void Acquire(RequestClass request_class);

 private:
  struct Bucket {
    double tokens = 0;
    std::chrono::steady_clock::time_point refilled_at;
  };

  RateCeilings ceilings_;
  std::mutex mutex_;
  std::map<RequestClass, Bucket> buckets_;
};

struct ApiRequest {
  std::string method;
  // Relative to the API base URL, or an absolute URL (download links).
  std::string path;
  std::string body;
  std::string content_type;
  httplib::Headers headers;
  // Only idempotent requests are retried on transient failures.
  bool idempotent = false;
  RequestClass request_class = RequestClass::kOther;
};

struct TransportOptions {
  std::string base_url = "https://api.converthub.com/v2";
  std::string api_key;
  RetryPolicy retry;
  bool throttle = true;
  RateCeilings ceilings;
  std::string user_agent = "converthub-client/1.0";
};

class TransportClient {
 public:
  TransportClient(std::shared_ptr<HttpTransport> transport, TransportOptions options);

  // Raises AuthenticationFailedError on 401 and RateLimitedError on 429 / RATE_LIMITED.
  // Other statuses are returned; callers map them with ThrowForError.
  HttpResponse Send(const ApiRequest &request);

  // Streaming GET. Retried only while nothing has reached the sink.
  HttpResponse Stream(const ApiRequest &request, const ContentSink &sink);

  std::string ResolveUrl(const std::string &path) const;
  const TransportOptions &options() const { return options_; }

 private:
  HttpRequest BuildRequest(const ApiRequest &request) const;
  bool CarriesCredentials(const std::string &url) const;
  void CheckFatal(const HttpResponse &response, const ApiRequest &request) const;
  void Backoff(const ApiRequest &request, int attempt, const std::string &reason) const;

  std::shared_ptr<HttpTransport> transport_;
  TransportOptions options_;
  ParsedUrl base_;
  std::unique_ptr<RequestThrottle> throttle_;
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_TRANSPORT_H
