#ifndef CONVERTHUB_CLIENT_CONVERSION_CLIENT_H
#define CONVERTHUB_CLIENT_CONVERSION_CLIENT_H

#include "api_types.h"
#include "transport.h"

namespace converthub::client {

// Submits conversions. Submissions create remote jobs and are never retried.
class ConversionClient {
 public:
  explicit ConversionClient(TransportClient &transport) : transport_(transport) {}

  JobSubmission Submit(const ConversionRequest &request);

 private:
  JobSubmission SubmitLocal(const LocalFileSource &source, const ConversionRequest &request);
  JobSubmission SubmitUrl(const RemoteUrlSource &source, const ConversionRequest &request);
  JobSubmission SubmitSession(const UploadSessionSource &source);
  JobSubmission Post(ApiRequest request, const char *context);

  TransportClient &transport_;
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_CONVERSION_CLIENT_H
