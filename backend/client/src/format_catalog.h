#ifndef CONVERTHUB_CLIENT_FORMAT_CATALOG_H
#define CONVERTHUB_CLIENT_FORMAT_CATALOG_H

#include <map>
#include <string>
#include <vector>

#include "api_types.h"
#include "transport.h"

namespace converthub::client {

class FormatCatalog {
 public:
  explicit FormatCatalog(TransportClient &transport) : transport_(transport) {}

  // category -> formats in that category.
  std::map<std::string, std::vector<FormatInfo>> ListFormats();

  // Target extensions reachable from `source_format`.
  std::vector<std::string> SupportedConversions(const std::string &source_format);

  bool IsSupported(const std::string &source_format, const std::string &target_format);

 private:
  TransportClient &transport_;
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_FORMAT_CATALOG_H
