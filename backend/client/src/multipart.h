#ifndef CONVERTHUB_CLIENT_MULTIPART_H
#define CONVERTHUB_CLIENT_MULTIPART_H

#include <string>

#include <httplib.h>

namespace converthub::client {

struct MultipartBody {
  std::string content_type;
  std::string body;
};

// Serializes `items` with cpp-httplib's form-data writer. Field names must be plain
// tokens; filenames have quotes and line breaks percent-encoded as browsers do.
MultipartBody EncodeMultipart(httplib::MultipartFormDataItems items);

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_MULTIPART_H
