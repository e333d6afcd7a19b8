#ifndef CONVERTHUB_CLIENT_HTTP_MESSAGE_H
#define CONVERTHUB_CLIENT_HTTP_MESSAGE_H

#include <string>
#include <utility>

#include <httplib.h>

namespace converthub::client {

struct HttpRequest {
  std::string method;
  // Absolute ("https://host/path") or relative to the API base URL ("/jobs/abc").
  std::string url;
  httplib::Headers headers;
  std::string body;
  std::string content_type;
};

struct HttpResponse {
  int status = 0;
  httplib::Headers headers;
  std::string body;

  std::string HeaderValue(const std::string &name) const {
    if (const auto it = headers.find(name); it != headers.end()) {
      return it->second;
    }
    return {};
  }

  bool ok() const { return status >= 200 && status < 300; }
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_HTTP_MESSAGE_H
