#include "fake_conversion_service.h"

#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "../client/src/checksum.h"
#include "../client/src/errors.h"

namespace converthub::testing {
namespace {

using json = nlohmann::json;
using client::HttpRequest;
using client::HttpResponse;
using client::JobStatus;

HttpResponse Json(int status, const json &payload) {
  HttpResponse response;
  response.status = status;
  response.headers.emplace("Content-Type", "application/json");
  response.body = payload.dump();
  return response;
}

HttpResponse Error(int status, const std::string &code, const std::string &message) {
  return Json(status, json{{"error", {{"code", code}, {"message", message}}}});
}

std::vector<std::string> Segments(const std::string &path) {
  std::vector<std::string> segments;
  std::stringstream stream(path);
  std::string segment;
  while (std::getline(stream, segment, '/')) {
    if (!segment.empty()) {
      segments.push_back(segment);
    }
  }
  return segments;
}

std::string HeaderOf(const HttpRequest &request, const std::string &name) {
  if (const auto it = request.headers.find(name); it != request.headers.end()) {
    return it->second;
  }
  return {};
}

}  // namespace

std::string MultipartFieldValue(const std::string &content_type, const std::string &body, const std::string &name) {
  const auto marker = content_type.find("boundary=");
  if (marker == std::string::npos) {
    return {};
  }
  const std::string delimiter = "\r\n--" + content_type.substr(marker + 9);
  const auto field = body.find("name=\"" + name + "\"");
  if (field == std::string::npos) {
    return {};
  }
  const auto start = body.find("\r\n\r\n", field);
  if (start == std::string::npos) {
    return {};
  }
  const auto end = body.find(delimiter, start + 4);
  if (end == std::string::npos) {
    return {};
  }
  return body.substr(start + 4, end - start - 4);
}

client::TransportOptions TestTransportOptions() {
  client::TransportOptions options;
  options.base_url = kTestBaseUrl;
  options.api_key = kTestApiKey;
  options.retry.max_attempts = 3;
  options.retry.initial_backoff = std::chrono::milliseconds(1);
  options.retry.max_backoff = std::chrono::milliseconds(4);
  options.retry.jitter = false;
  options.throttle = false;
  return options;
}

std::string PatternBytes(std::size_t size) {
  std::string bytes(size, '\0');
  for (std::size_t i = 0; i < size; ++i) {
    bytes[i] = static_cast<char>((i * 131 + 7) % 251);
  }
  return bytes;
}

void FakeConversionService::FailNext(const std::string &method, const std::string &path_fragment, int status,
                                     const std::string &body, const httplib::Headers &headers) {
  std::lock_guard<std::mutex> lock(mutex_);
  Fault fault;
  fault.method = method;
  fault.path_fragment = path_fragment;
  fault.response.status = status;
  fault.response.body = body;
  fault.response.headers = headers;
  faults_.push_back(std::move(fault));
}

void FakeConversionService::DropNext(const std::string &method, const std::string &path_fragment) {
  std::lock_guard<std::mutex> lock(mutex_);
  Fault fault;
  fault.method = method;
  fault.path_fragment = path_fragment;
  fault.kind = Fault::Kind::kDrop;
  faults_.push_back(std::move(fault));
}

void FakeConversionService::LoseResponseNext(const std::string &method, const std::string &path_fragment) {
  std::lock_guard<std::mutex> lock(mutex_);
  Fault fault;
  fault.method = method;
  fault.path_fragment = path_fragment;
  fault.kind = Fault::Kind::kLoseResponse;
  faults_.push_back(std::move(fault));
}

std::string FakeConversionService::AddJob(JobStatus status, const std::string &content,
                                          const std::string &target_format) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto id = CreateJobLocked(target_format, content);
  jobs_[id].status = status;
  return id;
}

void FakeConversionService::SetJobStatus(const std::string &job_id, JobStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_[job_id].status = status;
  jobs_[job_id].scripted.clear();
}

void FakeConversionService::ScriptJobStatuses(const std::string &job_id, std::vector<JobStatus> statuses) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &job = jobs_[job_id];
  job.scripted.assign(statuses.begin(), statuses.end());
}

FakeConversionService::Session FakeConversionService::session(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  return it == sessions_.end() ? Session{} : it->second;
}

std::string FakeConversionService::AssembledUpload(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string assembled;
  if (const auto it = sessions_.find(session_id); it != sessions_.end()) {
    for (const auto &[index, data] : it->second.chunks) {
      assembled += data;
    }
  }
  return assembled;
}

FakeConversionService::Job FakeConversionService::job(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = jobs_.find(job_id);
  return it == jobs_.end() ? Job{} : it->second;
}

int FakeConversionService::CountRequests(const std::string &method, const std::string &path_fragment) const {
  std::lock_guard<std::mutex> lock(mutex_);
  int count = 0;
  for (const auto &request : requests_) {
    if (request.method == method && request.url.find(path_fragment) != std::string::npos) {
      ++count;
    }
  }
  return count;
}

std::vector<HttpRequest> FakeConversionService::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

int FakeConversionService::running_checksum_mismatches() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_checksum_mismatches_;
}

std::string FakeConversionService::last_session_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_session_id_;
}

std::string FakeConversionService::CreateJobLocked(const std::string &target_format, const std::string &content) {
  const std::string id = "job-" + std::to_string(next_id_++);
  Job job;
  job.target_format = target_format;
  job.content = content;
  jobs_[id] = std::move(job);
  return id;
}

std::string FakeConversionService::DownloadUrl(const std::string &job_id) const {
  return "https://files.test/results/" + job_id;
}

HttpResponse FakeConversionService::Send(const HttpRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(request);
  const auto url = client::ParseUrl(request.url);
  std::string path = url.path;
  if (path.rfind("/v2", 0) == 0) {
    path.erase(0, 3);
  }

  bool lose_response = false;
  for (auto it = faults_.begin(); it != faults_.end(); ++it) {
    if (it->method == request.method && request.url.find(it->path_fragment) != std::string::npos) {
      const Fault fault = *it;
      faults_.erase(it);
      if (fault.kind == Fault::Kind::kDrop) {
        throw client::TransportError("connection reset (injected)");
      }
      if (fault.kind == Fault::Kind::kStatus) {
        return fault.response;
      }
      lose_response = true;
      break;
    }
  }

  if (url.host == "api.test" && HeaderOf(request, "Authorization") != std::string("Bearer ") + kTestApiKey) {
    return Error(401, "AUTHENTICATION_REQUIRED", "missing or invalid API key");
  }
  auto response = Route(request, path);
  if (lose_response) {
    throw client::TransportError("response lost (injected)");
  }
  return response;
}

HttpResponse FakeConversionService::Stream(const HttpRequest &request, const client::ContentSink &sink) {
  std::string content;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    for (auto it = faults_.begin(); it != faults_.end(); ++it) {
      if (it->method == request.method && request.url.find(it->path_fragment) != std::string::npos) {
        const Fault fault = *it;
        faults_.erase(it);
        if (fault.kind != Fault::Kind::kStatus) {
          throw client::TransportError("connection reset (injected)");
        }
        return fault.response;
      }
    }
    const auto segments = Segments(client::ParseUrl(request.url).path);
    if (segments.size() != 2 || segments[0] != "results") {
      return Error(404, "NOT_FOUND", "no such file");
    }
    const auto it = jobs_.find(segments[1]);
    if (it == jobs_.end() || it->second.deleted || it->second.status != JobStatus::kCompleted) {
      return Error(404, "NOT_FOUND", "no such file");
    }
    content = it->second.content;
  }
  for (std::size_t offset = 0; offset < content.size(); offset += 4) {
    const auto piece = content.substr(offset, 4);
    if (!sink(piece.data(), piece.size())) {
      throw client::TransportError("download aborted by sink");
    }
  }
  HttpResponse response;
  response.status = 200;
  response.headers.emplace("Content-Type", "application/octet-stream");
  return response;
}

HttpResponse FakeConversionService::Route(const HttpRequest &request, const std::string &path) {
  const auto segments = Segments(path);
  if (segments.empty()) {
    return Error(404, "NOT_FOUND", path);
  }
  const auto &root = segments[0];
  if (root == "upload" && request.method == "POST") {
    if (segments.size() == 2 && segments[1] == "init") {
      return HandleInit(request);
    }
    if (segments.size() == 4 && segments[2] == "chunks") {
      return HandleChunk(request, segments[1], std::stoull(segments[3]));
    }
    if (segments.size() == 3 && segments[2] == "complete") {
      return HandleComplete(segments[1]);
    }
  }
  if (root == "convert" && request.method == "POST") {
    return HandleConvert(request);
  }
  if (root == "convert-url" && request.method == "POST") {
    return HandleConvertUrl(request);
  }
  if (root == "jobs" && segments.size() == 2) {
    if (request.method == "GET") {
      return HandleJobStatus(segments[1]);
    }
    if (request.method == "DELETE") {
      return HandleCancel(segments[1]);
    }
  }
  if (root == "jobs" && segments.size() == 3 && segments[2] == "destroy" && request.method == "DELETE") {
    return HandleDestroy(segments[1]);
  }
  if (root == "formats" && request.method == "GET") {
    if (segments.size() == 1) {
      return Json(200, json{{"formats",
                             {{"document",
                               json::array({{{"extension", "pdf"}, {"mime_type", "application/pdf"}},
                                            {{"extension", "docx"}, {"mime_type", "application/msword"}}})},
                              {"image", json::array({"png", "jpg"})}}}});
    }
    if (segments.size() == 3 && segments[2] == "conversions") {
      return HandleConversions(segments[1]);
    }
  }
  return Error(404, "NOT_FOUND", request.method + " " + path);
}

HttpResponse FakeConversionService::HandleInit(const HttpRequest &request) {
  const auto payload = json::parse(request.body, nullptr, false);
  if (payload.is_discarded() || !payload.contains("file_size") || !payload.contains("total_chunks")) {
    return Error(400, "VALIDATION_ERROR", "file_size and total_chunks are required");
  }
  Session session;
  session.filename = payload.value("filename", std::string{});
  session.target_format = payload.value("target_format", std::string{});
  session.file_size = payload["file_size"].get<std::uint64_t>();
  session.total_chunks = payload["total_chunks"].get<std::uint64_t>();
  const std::string id = "sess-" + std::to_string(next_id_++);
  sessions_[id] = std::move(session);
  last_session_id_ = id;
  return Json(200, json{{"session_id", id}, {"expires_at", "2030-01-01T00:00:00Z"}});
}

HttpResponse FakeConversionService::HandleChunk(const HttpRequest &request, const std::string &session_id,
                                                std::uint64_t index) {
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return Error(404, "SESSION_NOT_FOUND", session_id);
  }
  auto &session = it->second;
  if (index >= session.total_chunks) {
    return Error(400, "INVALID_CHUNK", "chunk index out of range");
  }
  const auto data = MultipartFieldValue(request.content_type, request.body, "chunk");
  if (HeaderOf(request, "X-Chunk-Index") != std::to_string(index) ||
      HeaderOf(request, "X-Chunk-Checksum") != client::Sha256::Hex(data)) {
    return Error(400, "CHECKSUM_MISMATCH", "chunk does not match its checksum");
  }
  session.chunks[index] = data;

  client::Sha256 prefix;
  bool contiguous = true;
  for (std::uint64_t i = 0; i <= index; ++i) {
    const auto chunk = session.chunks.find(i);
    if (chunk == session.chunks.end()) {
      contiguous = false;
      break;
    }
    prefix.Update(chunk->second);
  }
  if (contiguous && prefix.HexDigest() != HeaderOf(request, "X-Running-Checksum")) {
    ++running_checksum_mismatches_;
  }
  return Json(200, json{{"chunk_index", index}, {"received_bytes", data.size()}});
}

HttpResponse FakeConversionService::HandleComplete(const std::string &session_id) {
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return Error(404, "SESSION_NOT_FOUND", session_id);
  }
  auto &session = it->second;
  ++session.complete_calls;
  if (!session.job_id.empty()) {
    return Json(200, json{{"job_id", session.job_id}, {"status", "processing"}});
  }
  std::string assembled;
  for (const auto &[index, data] : session.chunks) {
    assembled += data;
  }
  if (session.chunks.size() != session.total_chunks || assembled.size() != session.file_size) {
    return Error(400, "INCOMPLETE_UPLOAD", "not every chunk has arrived");
  }
  session.job_id = CreateJobLocked(session.target_format, assembled);
  return Json(200, json{{"job_id", session.job_id}, {"status", "queued"}});
}

HttpResponse FakeConversionService::HandleConvert(const HttpRequest &request) {
  const auto file = MultipartFieldValue(request.content_type, request.body, "file");
  const auto target = MultipartFieldValue(request.content_type, request.body, "target_format");
  if (file.empty() || target.empty()) {
    return Error(400, "VALIDATION_ERROR", "file and target_format are required");
  }
  if (target == "xyz") {
    return Error(400, "UNSUPPORTED_FORMAT", "cannot convert to xyz");
  }
  const auto id = CreateJobLocked(target, "converted:" + file);
  if (file == "cached") {
    auto &job = jobs_[id];
    job.status = JobStatus::kCompleted;
    return Json(200, json{{"job_id", id},
                          {"status", "completed"},
                          {"result", {{"download_url", DownloadUrl(id)}, {"format", target}, {"file_size", 10}}}});
  }
  jobs_[id].status = JobStatus::kProcessing;
  return Json(200, json{{"job_id", id}, {"status", "processing"}});
}

HttpResponse FakeConversionService::HandleConvertUrl(const HttpRequest &request) {
  const auto payload = json::parse(request.body, nullptr, false);
  if (payload.is_discarded() || !payload.contains("file_url") || !payload.contains("target_format")) {
    return Error(400, "VALIDATION_ERROR", "file_url and target_format are required");
  }
  const auto id = CreateJobLocked(payload["target_format"].get<std::string>(), "fetched");
  return Json(200, json{{"job_id", id}, {"status", "queued"}});
}

HttpResponse FakeConversionService::HandleJobStatus(const std::string &job_id) {
  const auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return Error(404, "JOB_NOT_FOUND", "no job " + job_id);
  }
  auto &job = it->second;
  if (!job.scripted.empty()) {
    job.status = job.scripted.front();
    if (job.scripted.size() > 1) {
      job.scripted.pop_front();
    }
  }
  json payload{{"job_id", job_id},
               {"status", client::ToString(job.status)},
               {"source_format", "docx"},
               {"target_format", job.target_format},
               {"created_at", "2030-01-01T00:00:00Z"}};
  if (job.status == JobStatus::kCompleted) {
    payload["result"] = {{"download_url", DownloadUrl(job_id)},
                         {"format", job.target_format},
                         {"file_size", job.content.size()},
                         {"expires_at", "2030-01-02T00:00:00Z"}};
    payload["processing_time"] = "1.5s";
  }
  if (job.status == JobStatus::kFailed) {
    payload["error"] = {{"code", "CONVERSION_FAILED"}, {"message", "converter crashed"}};
  }
  return Json(200, payload);
}

HttpResponse FakeConversionService::HandleCancel(const std::string &job_id) {
  const auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return Error(404, "JOB_NOT_FOUND", "no job " + job_id);
  }
  auto &job = it->second;
  if (client::IsTerminal(job.status)) {
    return Error(409, "JOB_ALREADY_COMPLETED", "job already finished");
  }
  job.status = JobStatus::kCancelled;
  job.scripted.clear();
  return Json(200, json{{"job_id", job_id}, {"status", "cancelled"}});
}

HttpResponse FakeConversionService::HandleDestroy(const std::string &job_id) {
  const auto it = jobs_.find(job_id);
  if (it == jobs_.end() || it->second.deleted) {
    return Error(404, "JOB_NOT_FOUND", "no job " + job_id);
  }
  it->second.deleted = true;
  return Json(200, json{{"message", "deleted"}});
}

HttpResponse FakeConversionService::HandleConversions(const std::string &format) const {
  static const std::map<std::string, std::vector<std::string>> kConversions{
      {"pdf", {"docx", "txt", "png"}},
      {"png", {"jpg", "webp", "pdf"}},
  };
  const auto it = kConversions.find(format);
  if (it == kConversions.end()) {
    return Error(400, "UNSUPPORTED_FORMAT", "unknown source format " + format);
  }
  json targets = json::array();
  for (const auto &target : it->second) {
    targets.push_back({{"target_format", target}});
  }
  return Json(200, json{{"source_format", format}, {"available_conversions", targets}});
}

}  // namespace converthub::testing
