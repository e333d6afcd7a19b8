#include "format_catalog.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "errors.h"

namespace converthub::client {
namespace {

std::string NormalizeExtension(std::string value) {
  if (!value.empty() && value.front() == '.') {
    value.erase(value.begin());
  }
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

}  // namespace

std::map<std::string, std::vector<FormatInfo>> FormatCatalog::ListFormats() {
  ApiRequest request;
  request.method = "GET";
  request.path = "/formats";
  request.idempotent = true;
  request.request_class = RequestClass::kFormats;
  const auto response = transport_.Send(request);
  if (!response.ok()) {
    ThrowForError(response, "format listing failed");
  }
  return ParseFormatCatalog(ParseBody(response));
}

std::vector<std::string> FormatCatalog::SupportedConversions(const std::string &source_format) {
  const auto format = NormalizeExtension(source_format);
  if (format.empty()) {
    throw std::invalid_argument("source format must not be empty");
  }
  ApiRequest request;
  request.method = "GET";
  request.path = "/formats/" + format + "/conversions";
  request.idempotent = true;
  request.request_class = RequestClass::kFormats;
  const auto response = transport_.Send(request);
  if (!response.ok()) {
    ThrowForError(response, "conversion listing failed");
  }
  return ParseConversionTargets(ParseBody(response));
}

bool FormatCatalog::IsSupported(const std::string &source_format, const std::string &target_format) {
  const auto wanted = NormalizeExtension(target_format);
  std::vector<std::string> targets;
  try {
    targets = SupportedConversions(source_format);
  } catch (const UnsupportedFormatError &) {
    return false;
  } catch (const RemoteError &ex) {
    if (ex.http_status() == 404) {
      return false;
    }
    throw;
  }
  return std::any_of(targets.begin(), targets.end(),
                     [&wanted](const std::string &target) { return NormalizeExtension(target) == wanted; });
}

}  // namespace converthub::client
