#include "conversion_client.h"

#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

#include "../../common/logger.h"
#include "errors.h"
#include "multipart.h"

namespace converthub::client {
namespace {

using json = nlohmann::json;

logging::ServiceLogger &ConversionLogger() {
  static auto &logger = logging::ServiceLogger::Instance("conversion");
  return logger;
}

}  // namespace

JobSubmission ConversionClient::Submit(const ConversionRequest &request) {
  if (request.target_format.empty()) {
    throw std::invalid_argument("target format must not be empty");
  }
  return std::visit(
      [this, &request](const auto &source) -> JobSubmission {
        using Source = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<Source, LocalFileSource>) {
          return SubmitLocal(source, request);
        } else if constexpr (std::is_same_v<Source, RemoteUrlSource>) {
          return SubmitUrl(source, request);
        } else {
          return SubmitSession(source);
        }
      },
      request.source);
}

JobSubmission ConversionClient::SubmitLocal(const LocalFileSource &source, const ConversionRequest &request) {
  if (source.bytes.empty()) {
    throw std::invalid_argument("file is empty: " + source.filename);
  }
  if (source.bytes.size() > kMaxDirectUploadBytes) {
    throw SizeExceededError(source.filename + " is " + std::to_string(source.bytes.size()) +
                            " bytes; files above " + std::to_string(kMaxDirectUploadBytes) +
                            " bytes must go through a chunked upload session");
  }
  httplib::MultipartFormDataItems fields;
  fields.push_back({"file", source.bytes, source.filename.empty() ? std::string("upload") : source.filename,
                    "application/octet-stream"});
  fields.push_back({"target_format", request.target_format, {}, {}});
  if (!request.options.empty()) {
    fields.push_back({"options", request.options.ToJson().dump(), {}, {}});
  }
  if (request.webhook_url) {
    fields.push_back({"webhook_url", *request.webhook_url, {}, {}});
  }
  if (request.output_filename) {
    fields.push_back({"output_filename", *request.output_filename, {}, {}});
  }
  const auto multipart = EncodeMultipart(fields);

  ApiRequest api;
  api.method = "POST";
  api.path = "/convert";
  api.body = multipart.body;
  api.content_type = multipart.content_type;
  api.request_class = RequestClass::kSubmission;
  return Post(std::move(api), "convert failed");
}

JobSubmission ConversionClient::SubmitUrl(const RemoteUrlSource &source, const ConversionRequest &request) {
  if (source.url.empty()) {
    throw std::invalid_argument("file url must not be empty");
  }
  json payload{{"file_url", source.url}, {"target_format", request.target_format}};
  if (request.output_filename) {
    payload["output_filename"] = *request.output_filename;
  }
  if (request.webhook_url) {
    payload["webhook_url"] = *request.webhook_url;
  }
  if (!request.options.empty()) {
    payload["options"] = request.options.ToJson();
  }

  ApiRequest api;
  api.method = "POST";
  api.path = "/convert-url";
  api.body = payload.dump();
  api.content_type = "application/json";
  api.request_class = RequestClass::kSubmission;
  return Post(std::move(api), "convert-url failed");
}

JobSubmission ConversionClient::SubmitSession(const UploadSessionSource &source) {
  if (source.session_id.empty()) {
    throw std::invalid_argument("upload session id must not be empty");
  }
  ApiRequest api;
  api.method = "POST";
  api.path = "/upload/" + source.session_id + "/complete";
  api.body = "{}";
  api.content_type = "application/json";
  api.request_class = RequestClass::kSubmission;
  return Post(std::move(api), "upload complete failed");
}

JobSubmission ConversionClient::Post(ApiRequest request, const char *context) {
  request.idempotent = false;
  const auto response = transport_.Send(request);
  if (!response.ok()) {
    ConversionLogger().Warn("submission_rejected", request.path + " status=" + std::to_string(response.status));
    ThrowForError(response, context);
  }
  auto submission = ParseJobSubmission(ParseBody(response));
  ConversionLogger().Info("job_submitted", "job=" + submission.job_id + " status=" + ToString(submission.status) +
                                               (submission.cached ? " cached=true" : ""));
  return submission;
}

}  // namespace converthub::client
