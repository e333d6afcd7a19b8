#ifndef CONVERTHUB_CLIENT_API_TYPES_H
#define CONVERTHUB_CLIENT_API_TYPES_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "http_message.h"
#include "job_status.h"

namespace converthub::client {

inline constexpr std::uint64_t kMaxUploadBytes = 2147483648ULL;
inline constexpr std::uint64_t kMaxDirectUploadBytes = 50ULL * 1024 * 1024;
inline constexpr std::uint64_t kDefaultChunkBytes = 5ULL * 1024 * 1024;

struct ConversionOptions {
  std::optional<int> quality;
  std::optional<std::string> resolution;
  std::optional<std::string> bitrate;
  std::optional<int> sample_rate;
  // Service-specific extras such as the OCR "language".
  std::map<std::string, std::string> extra;

  bool empty() const;
  nlohmann::json ToJson() const;
};

struct LocalFileSource {
  std::string filename;
  std::string bytes;
};

struct RemoteUrlSource {
  std::string url;
};

struct UploadSessionSource {
  std::string session_id;
};

using ConversionSource = std::variant<LocalFileSource, RemoteUrlSource, UploadSessionSource>;

struct ConversionRequest {
  ConversionSource source;
  std::string target_format;
  ConversionOptions options;
  std::optional<std::string> webhook_url;
  std::optional<std::string> output_filename;
};

struct ApiErrorBody {
  std::string code;
  std::string message;
  nlohmann::json details = nlohmann::json::object();
};

struct JobResult {
  std::string download_url;
  std::string format;
  std::uint64_t file_size = 0;
  std::string expires_at;
};

struct JobInfo {
  std::string job_id;
  JobStatus status = JobStatus::kQueued;
  std::optional<JobResult> result;
  std::optional<ApiErrorBody> error;
  std::string source_format;
  std::string target_format;
  std::string created_at;
  std::string updated_at;
  std::string processing_time;
  nlohmann::json metadata = nlohmann::json::object();
};

struct JobSubmission {
  std::string job_id;
  JobStatus status = JobStatus::kQueued;
  // Set when the service answered from cache with a finished job.
  std::optional<JobInfo> cached;
};

struct UploadInitResponse {
  std::string session_id;
  std::string expires_at;
};

struct PartAck {
  std::uint64_t part_index = 0;
  std::optional<std::uint64_t> received_bytes;
};

struct FormatInfo {
  std::string extension;
  std::string mime_type;
  std::string category;
};

// Parses a JSON body, raising RemoteError("INVALID_RESPONSE") on garbage.
nlohmann::json ParseBody(const HttpResponse &response);

std::optional<ApiErrorBody> ParseErrorBody(std::string_view body);

bool IsRateLimited(const HttpResponse &response);

// 404 or an explicit JOB_NOT_FOUND code on a /jobs endpoint.
bool IsJobNotFound(const HttpResponse &response);

// Turns a non-2xx response into the matching typed ClientError.
[[noreturn]] void ThrowForError(const HttpResponse &response, std::string_view context);

JobInfo ParseJobInfo(const nlohmann::json &payload);
JobSubmission ParseJobSubmission(const nlohmann::json &payload);
UploadInitResponse ParseUploadInit(const nlohmann::json &payload);
PartAck ParsePartAck(const nlohmann::json &payload, std::uint64_t expected_index);

std::map<std::string, std::vector<FormatInfo>> ParseFormatCatalog(const nlohmann::json &payload);
std::vector<std::string> ParseConversionTargets(const nlohmann::json &payload);

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_API_TYPES_H
