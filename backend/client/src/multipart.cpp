#include "multipart.h"

#include <stdexcept>
#include <utility>

namespace converthub::client {
namespace {

std::string EscapeFilename(const std::string &filename) {
  std::string escaped;
  escaped.reserve(filename.size());
  for (const char ch : filename) {
    switch (ch) {
      case '"':
        escaped += "%22";
        break;
      case '\r':
        escaped += "%0D";
        break;
      case '\n':
        escaped += "%0A";
        break;
      default:
        escaped.push_back(ch);
    }
  }
  return escaped;
}

}  // namespace

MultipartBody EncodeMultipart(httplib::MultipartFormDataItems items) {
  for (auto &item : items) {
    if (item.name.empty() || item.name.find_first_of("\"\r\n") != std::string::npos) {
      throw std::invalid_argument("invalid multipart field name: " + item.name);
    }
    if (item.content_type.find_first_of("\r\n") != std::string::npos) {
      throw std::invalid_argument("invalid content type for multipart field " + item.name);
    }
    item.filename = EscapeFilename(item.filename);
  }
  const auto boundary = httplib::detail::make_multipart_data_boundary();
  MultipartBody encoded;
  encoded.content_type = httplib::detail::serialize_multipart_formdata_get_content_type(boundary);
  encoded.body = httplib::detail::serialize_multipart_formdata(items, boundary);
  return encoded;
}

}  // namespace converthub::client
