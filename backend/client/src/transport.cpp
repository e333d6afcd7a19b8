#include "transport.h"

#include <algorithm>
#include <ctime>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "../../common/logger.h"
#include "api_types.h"
#include "errors.h"

namespace converthub::client {
namespace {

logging::ServiceLogger &TransportLogger() {
  static auto &logger = logging::ServiceLogger::Instance("transport");
  return logger;
}

bool IsTransientStatus(int status) {
  return status == 408 || status == 500 || status == 502 || status == 503 || status == 504;
}

HttpResponse ToResponse(const httplib::Result &result, const std::string &url) {
  if (!result) {
    throw TransportError(url + ": " + httplib::to_string(result.error()));
  }
  HttpResponse response;
  response.status = result->status;
  response.headers = result->headers;
  response.body = result->body;
  return response;
}

std::string DefaultContentType(const HttpRequest &request) {
  return request.content_type.empty() ? std::string("application/json") : request.content_type;
}

}  // namespace

std::string ParsedUrl::Origin() const {
  std::ostringstream oss;
  oss << scheme << "://" << host;
  if (port != (secure ? 443 : 80)) {
    oss << ':' << port;
  }
  return oss.str();
}

ParsedUrl ParseUrl(const std::string &url) {
  static const std::regex kRegex(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/ :?#]+)(:([0-9]+))?([^ ]*)$)");
  std::smatch matches;
  if (!std::regex_match(url, matches, kRegex)) {
    throw std::invalid_argument("invalid_url: " + url);
  }
  ParsedUrl parsed;
  parsed.scheme = matches[1];
  parsed.host = matches[2];
  parsed.path = matches[5].str().empty() ? std::string{"/"} : matches[5].str();
  parsed.secure = parsed.scheme == "https";
  parsed.port = parsed.secure ? 443 : 80;
  if (matches[4].matched) {
    try {
      parsed.port = std::stoi(matches[4]);
    } catch (const std::exception &) {
      throw std::invalid_argument("invalid_url_port: " + url);
    }
  }
  return parsed;
}

HttplibTransport::HttplibTransport(HttplibTimeouts timeouts) : timeouts_(timeouts) {}

std::unique_ptr<httplib::Client> HttplibTransport::MakeClient(const ParsedUrl &url) const {
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
  if (url.secure) {
    throw TransportError("ssl_not_supported: " + url.Origin());
  }
#endif
  auto client = std::make_unique<httplib::Client>(url.Origin());
  if (!client->is_valid()) {
    throw TransportError("client_init_failed: " + url.Origin());
  }
  client->set_connection_timeout(static_cast<time_t>(timeouts_.connect.count()), 0);
  client->set_read_timeout(static_cast<time_t>(timeouts_.read.count()), 0);
  client->set_write_timeout(static_cast<time_t>(timeouts_.write.count()), 0);
  client->set_follow_location(true);
  return client;
}

HttpResponse HttplibTransport::Send(const HttpRequest &request) {
  const ParsedUrl url = ParseUrl(request.url);
  auto client = MakeClient(url);
  if (request.method == "GET") {
    return ToResponse(client->Get(url.path, request.headers), request.url);
  }
  if (request.method == "POST") {
    return ToResponse(client->Post(url.path, request.headers, request.body, DefaultContentType(request)),
                      request.url);
  }
  if (request.method == "PUT") {
    return ToResponse(client->Put(url.path, request.headers, request.body, DefaultContentType(request)),
                      request.url);
  }
  if (request.method == "DELETE") {
    return ToResponse(client->Delete(url.path, request.headers), request.url);
  }
  throw std::invalid_argument("unsupported_method: " + request.method);
}

HttpResponse HttplibTransport::Stream(const HttpRequest &request, const ContentSink &sink) {
  const ParsedUrl url = ParseUrl(request.url);
  auto client = MakeClient(url);
  HttpResponse response;
  bool sink_aborted = false;
  auto result = client->Get(
      url.path, request.headers,
      [&response](const httplib::Response &head) {
        response.status = head.status;
        response.headers = head.headers;
        return true;
      },
      [&](const char *data, std::size_t length) {
        if (!response.ok()) {
          response.body.append(data, length);
          return true;
        }
        if (!sink(data, length)) {
          sink_aborted = true;
          return false;
        }
        return true;
      });
  if (!result) {
    if (sink_aborted) {
      throw TransportError(request.url + ": download aborted by sink");
    }
    throw TransportError(request.url + ": " + httplib::to_string(result.error()));
  }
  return response;
}

int RateCeilings::For(RequestClass request_class) const {
  switch (request_class) {
    case RequestClass::kSubmission:
      return submission_per_minute;
    case RequestClass::kStatus:
      return status_per_minute;
    case RequestClass::kFormats:
      return formats_per_minute;
    case RequestClass::kChunk:
      return chunk_per_minute;
    case RequestClass::kOther:
      return 0;
  }
  return 0;
}

RequestThrottle::RequestThrottle(RateCeilings ceilings) : ceilings_(ceilings) {}

void RequestThrottle::Acquire(RequestClass request_class) {
  const int per_minute = ceilings_.For(request_class);
  if (per_minute <= 0) {
    return;
  }
  const double rate_per_second = per_minute / 60.0;
  while (true) {
    std::chrono::duration<double> wait{0};
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto now = std::chrono::steady_clock::now();
      auto [it, inserted] = buckets_.try_emplace(request_class);
      Bucket &bucket = it->second;
      if (inserted) {
        bucket.tokens = per_minute;
        bucket.refilled_at = now;
      }
      const std::chrono::duration<double> elapsed = now - bucket.refilled_at;
      bucket.tokens = std::min<double>(per_minute, bucket.tokens + elapsed.count() * rate_per_second);
      bucket.refilled_at = now;
      if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return;
      }
      wait = std::chrono::duration<double>((1.0 - bucket.tokens) / rate_per_second);
    }
    std::this_thread::sleep_for(wait);
  }
}

TransportClient::TransportClient(std::shared_ptr<HttpTransport> transport, TransportOptions options)
    : transport_(std::move(transport)), options_(std::move(options)), base_(ParseUrl(options_.base_url)) {
  if (!transport_) {
    throw std::invalid_argument("transport must not be null");
  }
  while (base_.path.size() > 1 && base_.path.back() == '/') {
    base_.path.pop_back();
  }
  if (base_.path == "/") {
    base_.path.clear();
  }
  if (options_.retry.max_attempts < 1) {
    options_.retry.max_attempts = 1;
  }
  if (options_.throttle) {
    throttle_ = std::make_unique<RequestThrottle>(options_.ceilings);
  }
}

std::string TransportClient::ResolveUrl(const std::string &path) const {
  if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) {
    return path;
  }
  std::string url = base_.Origin() + base_.path;
  if (path.empty() || path.front() != '/') {
    url.push_back('/');
  }
  url += path;
  return url;
}

bool TransportClient::CarriesCredentials(const std::string &url) const {
  try {
    return ParseUrl(url).Origin() == base_.Origin();
  } catch (const std::invalid_argument &) {
    return false;
  }
}

HttpRequest TransportClient::BuildRequest(const ApiRequest &request) const {
  HttpRequest http;
  http.method = request.method;
  http.url = ResolveUrl(request.path);
  http.headers = request.headers;
  http.body = request.body;
  http.content_type = request.content_type;
  // Signed download links live on storage hosts that must never see the API key.
  if (!options_.api_key.empty() && CarriesCredentials(http.url)) {
    http.headers.emplace("Authorization", "Bearer " + options_.api_key);
  }
  if (http.headers.find("Accept") == http.headers.end()) {
    http.headers.emplace("Accept", "application/json");
  }
  http.headers.emplace("User-Agent", options_.user_agent);
  return http;
}

void TransportClient::CheckFatal(const HttpResponse &response, const ApiRequest &request) const {
  if (response.status == 401) {
    TransportLogger().Error("authentication_failed", request.method + " " + request.path);
    ThrowForError(response, "authentication failed");
  }
  if (IsRateLimited(response)) {
    TransportLogger().Warn("rate_limited", request.method + " " + request.path);
    ThrowForError(response, "rate limited");
  }
}

void TransportClient::Backoff(const ApiRequest &request, int attempt, const std::string &reason) const {
  const auto delay = options_.retry.BackoffFor(attempt);
  std::ostringstream context;
  context << request.method << ' ' << request.path << " attempt=" << attempt << " delay_ms=" << delay.count()
          << " reason=" << reason;
  TransportLogger().Warn("retrying_request", context.str());
  std::this_thread::sleep_for(delay);
}

HttpResponse TransportClient::Send(const ApiRequest &request) {
  const HttpRequest http = BuildRequest(request);
  const int max_attempts = request.idempotent ? options_.retry.max_attempts : 1;
  for (int attempt = 1;; ++attempt) {
    if (throttle_) {
      throttle_->Acquire(request.request_class);
    }
    HttpResponse response;
    try {
      response = transport_->Send(http);
    } catch (const TransportError &ex) {
      if (attempt >= max_attempts) {
        TransportLogger().Error("request_failed", request.method + " " + request.path + ": " + ex.what());
        throw;
      }
      Backoff(request, attempt, ex.what());
      continue;
    }
    CheckFatal(response, request);
    if (IsTransientStatus(response.status) && attempt < max_attempts) {
      Backoff(request, attempt, "http_" + std::to_string(response.status));
      continue;
    }
    return response;
  }
}

HttpResponse TransportClient::Stream(const ApiRequest &request, const ContentSink &sink) {
  const HttpRequest http = BuildRequest(request);
  const int max_attempts = request.idempotent ? options_.retry.max_attempts : 1;
  bool delivered = false;
  const ContentSink tracking_sink = [&delivered, &sink](const char *data, std::size_t length) {
    delivered = true;
    return sink(data, length);
  };
  for (int attempt = 1;; ++attempt) {
    if (throttle_) {
      throttle_->Acquire(request.request_class);
    }
    HttpResponse response;
    try {
      response = transport_->Stream(http, tracking_sink);
    } catch (const TransportError &ex) {
      if (delivered || attempt >= max_attempts) {
        TransportLogger().Error("stream_failed", request.path + ": " + ex.what());
        throw;
      }
      Backoff(request, attempt, ex.what());
      continue;
    }
    CheckFatal(response, request);
    if (IsTransientStatus(response.status) && !delivered && attempt < max_attempts) {
      Backoff(request, attempt, "http_" + std::to_string(response.status));
      continue;
    }
    return response;
  }
}

}  // namespace converthub::client
