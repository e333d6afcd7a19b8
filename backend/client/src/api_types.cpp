#include "api_types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <string>

#include "errors.h"

namespace converthub::client {
namespace {

using json = nlohmann::json;

[[noreturn]] void InvalidResponse(const std::string &what) {
  throw RemoteError(0, "INVALID_RESPONSE", what);
}

std::string StringField(const json &payload, const char *key) {
  if (const auto it = payload.find(key); it != payload.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

std::uint64_t SizeField(const json &payload, const char *key) {
  const auto it = payload.find(key);
  if (it == payload.end()) {
    return 0;
  }
  if (it->is_number_unsigned() || it->is_number_integer()) {
    const auto value = it->get<std::int64_t>();
    return value < 0 ? 0 : static_cast<std::uint64_t>(value);
  }
  if (it->is_string()) {
    try {
      return std::stoull(it->get<std::string>());
    } catch (const std::exception &) {
      return 0;
    }
  }
  return 0;
}

// The service reports processing_time either as "12.5s" or as a number of seconds.
std::string ProcessingTimeField(const json &payload) {
  const auto it = payload.find("processing_time");
  if (it == payload.end() || it->is_null()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

std::string TargetName(const json &entry) {
  if (entry.is_string()) {
    return entry.get<std::string>();
  }
  if (!entry.is_object()) {
    return {};
  }
  for (const char *key : {"target_format", "extension", "format"}) {
    if (auto value = StringField(entry, key); !value.empty()) {
      return value;
    }
  }
  return {};
}

std::optional<std::chrono::milliseconds> ParseRetryAfter(const HttpResponse &response,
                                                         const std::optional<ApiErrorBody> &error) {
  const auto header = response.HeaderValue("Retry-After");
  if (!header.empty() && std::all_of(header.begin(), header.end(),
                                     [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    try {
      return std::chrono::seconds(std::stoll(header));
    } catch (const std::exception &) {
    }
  }
  if (error && error->details.is_object()) {
    if (const auto it = error->details.find("retry_after"); it != error->details.end() && it->is_number()) {
      return std::chrono::milliseconds(static_cast<std::int64_t>(it->get<double>() * 1000.0));
    }
  }
  return std::nullopt;
}

}  // namespace

bool ConversionOptions::empty() const {
  return !quality && !resolution && !bitrate && !sample_rate && extra.empty();
}

nlohmann::json ConversionOptions::ToJson() const {
  json payload = json::object();
  if (quality) {
    payload["quality"] = *quality;
  }
  if (resolution) {
    payload["resolution"] = *resolution;
  }
  if (bitrate) {
    payload["bitrate"] = *bitrate;
  }
  if (sample_rate) {
    payload["sample_rate"] = *sample_rate;
  }
  for (const auto &[key, value] : extra) {
    payload[key] = value;
  }
  return payload;
}

nlohmann::json ParseBody(const HttpResponse &response) {
  if (response.body.empty()) {
    return json::object();
  }
  try {
    return json::parse(response.body);
  } catch (const json::parse_error &ex) {
    throw RemoteError(response.status, "INVALID_RESPONSE", ex.what());
  }
}

std::optional<ApiErrorBody> ParseErrorBody(std::string_view body) {
  const auto payload = json::parse(body.begin(), body.end(), nullptr, false);
  if (payload.is_discarded() || !payload.is_object()) {
    return std::nullopt;
  }
  const auto it = payload.find("error");
  if (it == payload.end()) {
    return std::nullopt;
  }
  ApiErrorBody error;
  if (it->is_string()) {
    error.message = it->get<std::string>();
    return error;
  }
  if (!it->is_object()) {
    return std::nullopt;
  }
  error.code = StringField(*it, "code");
  error.message = StringField(*it, "message");
  if (const auto details = it->find("details"); details != it->end() && details->is_object()) {
    error.details = *details;
  }
  return error;
}

bool IsRateLimited(const HttpResponse &response) {
  if (response.status == 429) {
    return true;
  }
  if (response.ok()) {
    return false;
  }
  const auto error = ParseErrorBody(response.body);
  return error && error->code == "RATE_LIMITED";
}

bool IsJobNotFound(const HttpResponse &response) {
  if (response.status == 404) {
    return true;
  }
  if (response.ok()) {
    return false;
  }
  const auto error = ParseErrorBody(response.body);
  return error && error->code == "JOB_NOT_FOUND";
}

void ThrowForError(const HttpResponse &response, std::string_view context) {
  const auto error = ParseErrorBody(response.body);
  const std::string code = error ? error->code : std::string{};
  std::string message = error && !error->message.empty() ? error->message : std::string(context);
  if (message.empty()) {
    message = "HTTP " + std::to_string(response.status);
  }

  if (response.status == 401 || code == "AUTHENTICATION_REQUIRED") {
    throw AuthenticationFailedError(message);
  }
  if (response.status == 429 || code == "RATE_LIMITED") {
    throw RateLimitedError(message, ParseRetryAfter(response, error));
  }
  if (response.status == 413 || code == "FILE_TOO_LARGE") {
    throw SizeExceededError(message);
  }
  if (code == "UNSUPPORTED_FORMAT") {
    throw UnsupportedFormatError(message);
  }
  throw RemoteError(response.status, code.empty() ? "HTTP_" + std::to_string(response.status) : code, message);
}

JobInfo ParseJobInfo(const nlohmann::json &payload) {
  if (!payload.is_object()) {
    InvalidResponse("job payload is not an object");
  }
  JobInfo info;
  info.job_id = StringField(payload, "job_id");
  if (info.job_id.empty()) {
    info.job_id = StringField(payload, "id");
  }
  if (info.job_id.empty()) {
    InvalidResponse("job payload has no job_id");
  }
  const auto status_text = StringField(payload, "status");
  const auto status = ParseJobStatus(status_text);
  if (!status) {
    InvalidResponse("unknown job status '" + status_text + "'");
  }
  info.status = *status;

  if (const auto it = payload.find("result"); it != payload.end() && it->is_object() && !it->empty()) {
    JobResult result;
    result.download_url = StringField(*it, "download_url");
    result.format = StringField(*it, "format");
    result.file_size = SizeField(*it, "file_size");
    result.expires_at = StringField(*it, "expires_at");
    info.result = std::move(result);
  }
  if (const auto it = payload.find("error"); it != payload.end() && it->is_object()) {
    ApiErrorBody error;
    error.code = StringField(*it, "code");
    error.message = StringField(*it, "message");
    info.error = std::move(error);
  }
  info.source_format = StringField(payload, "source_format");
  info.target_format = StringField(payload, "target_format");
  info.created_at = StringField(payload, "created_at");
  info.updated_at = StringField(payload, "updated_at");
  info.processing_time = ProcessingTimeField(payload);
  if (const auto it = payload.find("metadata"); it != payload.end() && it->is_object()) {
    info.metadata = *it;
  }
  return info;
}

JobSubmission ParseJobSubmission(const nlohmann::json &payload) {
  if (!payload.is_object()) {
    InvalidResponse("submission payload is not an object");
  }
  JobSubmission submission;
  submission.job_id = StringField(payload, "job_id");
  if (submission.job_id.empty()) {
    InvalidResponse("submission payload has no job_id");
  }
  // A submission without a status is still being worked on.
  const auto status_text = StringField(payload, "status");
  const auto status = status_text.empty() ? std::optional<JobStatus>(JobStatus::kProcessing)
                                          : ParseJobStatus(status_text);
  if (!status) {
    InvalidResponse("unknown job status '" + status_text + "'");
  }
  submission.status = *status;
  if (submission.status == JobStatus::kCompleted && payload.contains("result")) {
    submission.cached = ParseJobInfo(payload);
  }
  return submission;
}

UploadInitResponse ParseUploadInit(const nlohmann::json &payload) {
  if (!payload.is_object()) {
    InvalidResponse("upload init payload is not an object");
  }
  UploadInitResponse response;
  response.session_id = StringField(payload, "session_id");
  if (response.session_id.empty()) {
    InvalidResponse("upload init payload has no session_id");
  }
  response.expires_at = StringField(payload, "expires_at");
  return response;
}

PartAck ParsePartAck(const nlohmann::json &payload, std::uint64_t expected_index) {
  PartAck ack;
  ack.part_index = expected_index;
  if (!payload.is_object()) {
    return ack;
  }
  for (const char *key : {"chunk_index", "part_index"}) {
    if (const auto it = payload.find(key); it != payload.end() && it->is_number_integer()) {
      const auto index = it->get<std::int64_t>();
      if (index < 0 || static_cast<std::uint64_t>(index) != expected_index) {
        InvalidResponse("part ack for index " + std::to_string(index) + ", expected " +
                        std::to_string(expected_index));
      }
    }
  }
  if (payload.contains("received_bytes")) {
    ack.received_bytes = SizeField(payload, "received_bytes");
  }
  return ack;
}

std::map<std::string, std::vector<FormatInfo>> ParseFormatCatalog(const nlohmann::json &payload) {
  std::map<std::string, std::vector<FormatInfo>> catalog;
  const json *formats = &payload;
  if (payload.is_object() && payload.contains("formats")) {
    formats = &payload["formats"];
  }
  auto append = [&catalog](const std::string &category, const json &entry) {
    FormatInfo info;
    info.category = category;
    if (entry.is_string()) {
      info.extension = entry.get<std::string>();
    } else if (entry.is_object()) {
      info.extension = TargetName(entry);
      info.mime_type = StringField(entry, "mime_type");
      if (auto declared = StringField(entry, "category"); !declared.empty()) {
        info.category = declared;
      }
    }
    if (!info.extension.empty()) {
      catalog[info.category].push_back(std::move(info));
    }
  };
  if (formats->is_object()) {
    for (const auto &item : formats->items()) {
      if (item.value().is_array()) {
        for (const auto &entry : item.value()) {
          append(item.key(), entry);
        }
      } else {
        append("other", item.value().is_object() ? item.value() : json(item.key()));
      }
    }
  } else if (formats->is_array()) {
    for (const auto &entry : *formats) {
      append("other", entry);
    }
  } else {
    InvalidResponse("format catalog has no formats");
  }
  return catalog;
}

std::vector<std::string> ParseConversionTargets(const nlohmann::json &payload) {
  const json *conversions = &payload;
  if (payload.is_object()) {
    for (const char *key : {"available_conversions", "conversions", "supported_conversions"}) {
      if (payload.contains(key)) {
        conversions = &payload[key];
        break;
      }
    }
  }
  std::vector<std::string> targets;
  auto append = [&targets](const json &entry) {
    if (auto name = TargetName(entry); !name.empty()) {
      targets.push_back(std::move(name));
    }
  };
  if (conversions->is_array()) {
    for (const auto &entry : *conversions) {
      append(entry);
    }
  } else if (conversions->is_object()) {
    for (const auto &item : conversions->items()) {
      if (!item.value().is_array()) {
        continue;
      }
      for (const auto &entry : item.value()) {
        append(entry);
      }
    }
  }
  return targets;
}

}  // namespace converthub::client
