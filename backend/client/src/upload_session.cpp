#include "upload_session.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "../../common/logger.h"
#include "errors.h"
#include "multipart.h"

namespace converthub::client {
namespace {

using json = nlohmann::json;

logging::ServiceLogger &UploadLogger() {
  static auto &logger = logging::ServiceLogger::Instance("upload");
  return logger;
}

bool IsRetryableStatus(int status) {
  return status == 408 || status >= 500;
}

std::string PartContext(const std::string &session_id, std::uint64_t index) {
  std::ostringstream oss;
  oss << "session=" << session_id << " part=" << index;
  return oss.str();
}

}  // namespace

FileChunkSource::FileChunkSource(std::filesystem::path path)
    : path_(std::move(path)), stream_(path_, std::ios::binary) {
  if (!stream_.is_open()) {
    throw std::runtime_error("cannot open upload source " + path_.string());
  }
  std::error_code ec;
  size_ = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw std::runtime_error("cannot stat upload source " + path_.string() + ": " + ec.message());
  }
}

std::string FileChunkSource::Read(std::uint64_t offset, std::uint64_t length) {
  if (offset >= size_) {
    return {};
  }
  length = std::min(length, size_ - offset);
  std::string buffer(static_cast<std::size_t>(length), '\0');
  stream_.clear();
  stream_.seekg(static_cast<std::streamoff>(offset));
  stream_.read(buffer.data(), static_cast<std::streamsize>(length));
  if (static_cast<std::uint64_t>(stream_.gcount()) != length) {
    throw std::runtime_error("short read on upload source " + path_.string());
  }
  return buffer;
}

MemoryChunkSource::MemoryChunkSource(std::string name, std::string bytes)
    : name_(std::move(name)), bytes_(std::move(bytes)) {}

std::string MemoryChunkSource::Read(std::uint64_t offset, std::uint64_t length) {
  if (offset >= bytes_.size()) {
    return {};
  }
  return bytes_.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
}

UploadSession::UploadSession(TransportClient &transport, std::shared_ptr<ResumeStore> store,
                             std::shared_ptr<ChunkSource> source, ResumeRecord record,
                             std::unique_ptr<ResumeLease> lease, UploadOptions options)
    : transport_(transport),
      store_(std::move(store)),
      source_(std::move(source)),
      record_(std::move(record)),
      lease_(std::move(lease)),
      options_(std::move(options)) {}

std::unique_ptr<UploadSession> UploadSession::Start(TransportClient &transport, std::shared_ptr<ResumeStore> store,
                                                    std::shared_ptr<ChunkSource> source,
                                                    const std::string &target_format, UploadOptions options) {
  if (!store || !source) {
    throw std::invalid_argument("upload session needs a resume store and a source");
  }
  if (target_format.empty()) {
    throw std::invalid_argument("target format must not be empty");
  }
  if (options.chunk_size == 0) {
    throw std::invalid_argument("chunk size must be positive");
  }
  const std::uint64_t size = source->size();
  if (size == 0) {
    throw std::invalid_argument("upload source is empty: " + source->name());
  }
  if (size > kMaxUploadBytes) {
    throw SizeExceededError(source->name() + " is " + std::to_string(size) + " bytes, limit is " +
                            std::to_string(kMaxUploadBytes));
  }

  ResumeRecord record;
  record.filename = source->name();
  record.target_format = target_format;
  record.total_size = size;
  record.chunk_size = options.chunk_size;

  json payload{{"filename", record.filename},
               {"file_size", size},
               {"total_chunks", record.TotalParts()},
               {"target_format", target_format},
               {"metadata",
                {{"original_size", size},
                 {"chunk_size", options.chunk_size},
                 {"upload_time", logging::detail::TimestampNow()}}}};
  if (options.webhook_url) {
    payload["webhook_url"] = *options.webhook_url;
  }
  if (!options.conversion_options.empty()) {
    payload["options"] = options.conversion_options.ToJson();
  }

  ApiRequest request;
  request.method = "POST";
  request.path = "/upload/init";
  request.body = payload.dump();
  request.content_type = "application/json";
  request.request_class = RequestClass::kSubmission;
  const auto response = transport.Send(request);
  if (!response.ok()) {
    ThrowForError(response, "upload init failed");
  }
  const auto init = ParseUploadInit(ParseBody(response));
  record.session_id = init.session_id;
  record.expires_at = init.expires_at;

  auto lease = store->AcquireLease(record.session_id);
  store->Save(record);

  std::ostringstream context;
  context << "session=" << record.session_id << " file=" << record.filename << " bytes=" << size
          << " parts=" << record.TotalParts();
  UploadLogger().Info("upload_session_started", context.str());
  return std::unique_ptr<UploadSession>(new UploadSession(transport, std::move(store), std::move(source),
                                                          std::move(record), std::move(lease),
                                                          std::move(options)));
}

std::unique_ptr<UploadSession> UploadSession::Resume(TransportClient &transport, std::shared_ptr<ResumeStore> store,
                                                     std::shared_ptr<ChunkSource> source,
                                                     const std::string &session_id, UploadOptions options) {
  if (!store || !source) {
    throw std::invalid_argument("upload session needs a resume store and a source");
  }
  auto lease = store->AcquireLease(session_id);
  auto record = store->Load(session_id);
  if (!record) {
    throw InvalidResumeRecordError("no resume record for session " + session_id);
  }
  if (record->total_size != source->size()) {
    throw InvalidResumeRecordError("session " + session_id + " was opened for " +
                                   std::to_string(record->total_size) + " bytes, source has " +
                                   std::to_string(source->size()));
  }
  // Part boundaries were fixed at init.
  options.chunk_size = record->chunk_size;

  std::ostringstream context;
  context << "session=" << session_id << " acknowledged=" << record->acknowledged_parts.size() << '/'
          << record->TotalParts();
  UploadLogger().Info("upload_session_resumed", context.str());
  return std::unique_ptr<UploadSession>(new UploadSession(transport, std::move(store), std::move(source),
                                                          std::move(*record), std::move(lease),
                                                          std::move(options)));
}

std::vector<std::uint64_t> UploadSession::PendingParts() const {
  std::vector<std::uint64_t> pending;
  const auto total = record_.TotalParts();
  for (std::uint64_t index = 0; index < total; ++index) {
    if (record_.acknowledged_parts.count(index) == 0) {
      pending.push_back(index);
    }
  }
  return pending;
}

std::optional<std::uint64_t> UploadSession::NextPendingPart() const {
  const auto total = record_.TotalParts();
  for (std::uint64_t index = 0; index < total; ++index) {
    if (record_.acknowledged_parts.count(index) == 0) {
      return index;
    }
  }
  return std::nullopt;
}

void UploadSession::AdvancePrefixTo(std::uint64_t offset) {
  if (prefix_offset_ > offset) {
    prefix_ = Sha256();
    prefix_offset_ = 0;
  }
  // Parts already on the server are re-read locally, never re-sent.
  while (prefix_offset_ < offset) {
    const auto length = std::min(record_.chunk_size, offset - prefix_offset_);
    const auto bytes = source_->Read(prefix_offset_, length);
    if (bytes.size() != length) {
      throw std::runtime_error("upload source shrank while hashing " + source_->name());
    }
    prefix_.Update(bytes);
    prefix_offset_ += length;
  }
}

UploadProgress UploadSession::Progress(std::uint64_t part_index) const {
  UploadProgress progress;
  progress.bytes_transferred = record_.AcknowledgedBytes();
  progress.total_bytes = record_.total_size;
  progress.part_index = part_index;
  progress.parts_acknowledged = record_.acknowledged_parts.size();
  progress.total_parts = record_.TotalParts();
  return progress;
}

std::optional<UploadProgress> UploadSession::TransferNextPart() {
  const auto next = NextPendingPart();
  if (!next) {
    return std::nullopt;
  }
  const std::uint64_t index = *next;
  const std::uint64_t offset = index * record_.chunk_size;
  const std::uint64_t length = record_.PartLength(index);

  AdvancePrefixTo(offset);
  const auto data = source_->Read(offset, length);
  if (data.size() != length) {
    throw std::runtime_error("upload source shrank while reading " + source_->name());
  }
  const auto part_checksum = Sha256::Hex(data);
  prefix_.Update(data);
  prefix_offset_ = offset + length;
  const auto running_checksum = prefix_.HexDigest();

  UploadPart(index, data, part_checksum, running_checksum);

  record_.acknowledged_parts.insert(index);
  store_->Save(record_);
  UploadLogger().Debug("part_acknowledged", PartContext(record_.session_id, index));
  return Progress(index);
}

void UploadSession::UploadPart(std::uint64_t index, const std::string &data, const std::string &part_checksum,
                               const std::string &running_checksum) {
  const auto multipart =
      EncodeMultipart({{"chunk", data, record_.filename, "application/octet-stream"}});
  ApiRequest request;
  request.method = "POST";
  request.path = "/upload/" + record_.session_id + "/chunks/" + std::to_string(index);
  request.body = multipart.body;
  request.content_type = multipart.content_type;
  request.headers.emplace("X-Chunk-Index", std::to_string(index));
  request.headers.emplace("X-Chunk-Checksum", part_checksum);
  request.headers.emplace("X-Running-Checksum", running_checksum);
  // Retries are counted here, per part, rather than in the transport.
  request.idempotent = false;
  request.request_class = RequestClass::kChunk;

  const int max_attempts = std::max(1, options_.part_attempts);
  int rate_limit_waits = 0;
  for (int attempt = 1;; ++attempt) {
    std::string failure;
    try {
      const auto response = transport_.Send(request);
      if (response.ok()) {
        const auto ack = ParsePartAck(ParseBody(response), index);
        if (!ack.received_bytes || *ack.received_bytes == data.size()) {
          return;
        }
        failure = "server received " + std::to_string(*ack.received_bytes) + " of " +
                  std::to_string(data.size()) + " bytes";
      } else if (IsRetryableStatus(response.status)) {
        failure = "http_" + std::to_string(response.status);
      } else {
        ThrowForError(response, "chunk upload failed");
      }
    } catch (const RateLimitedError &ex) {
      if (++rate_limit_waits > options_.max_rate_limit_waits) {
        throw;
      }
      const auto delay = ex.retry_after().value_or(options_.part_backoff.BackoffFor(rate_limit_waits));
      UploadLogger().Warn("part_rate_limited", PartContext(record_.session_id, index) +
                                                   " delay_ms=" + std::to_string(delay.count()));
      std::this_thread::sleep_for(delay);
      --attempt;
      continue;
    } catch (const TransportError &ex) {
      failure = ex.what();
    }

    if (attempt >= max_attempts) {
      UploadLogger().Error("part_failed", PartContext(record_.session_id, index) + ": " + failure);
      throw TransportError("part " + std::to_string(index) + " of session " + record_.session_id +
                           " failed after " + std::to_string(attempt) + " attempts: " + failure);
    }
    const auto delay = options_.part_backoff.BackoffFor(attempt);
    UploadLogger().Warn("part_retry", PartContext(record_.session_id, index) + " attempt=" +
                                          std::to_string(attempt) + " reason=" + failure);
    std::this_thread::sleep_for(delay);
  }
}

void UploadSession::TransferAll(const ProgressCallback &callback) {
  while (const auto progress = TransferNextPart()) {
    if (callback) {
      callback(*progress);
    }
  }
}

JobSubmission UploadSession::Finalize() {
  if (record_.finalize_state == FinalizeState::kDone) {
    JobSubmission submission;
    submission.job_id = record_.job_id;
    submission.status = JobStatus::kProcessing;
    return submission;
  }
  if (!record_.AllAcknowledged()) {
    throw std::logic_error("session " + record_.session_id + " has " + std::to_string(PendingParts().size()) +
                           " unacknowledged parts");
  }
  if (record_.finalize_state == FinalizeState::kInFlight && !options_.finalize_is_idempotent) {
    throw InvalidResumeRecordError("outcome of the earlier complete call for session " + record_.session_id +
                                   " is unknown");
  }

  record_.finalize_state = FinalizeState::kInFlight;
  store_->Save(record_);

  ApiRequest request;
  request.method = "POST";
  request.path = "/upload/" + record_.session_id + "/complete";
  request.body = "{}";
  request.content_type = "application/json";
  request.request_class = RequestClass::kSubmission;

  const int max_attempts = options_.finalize_is_idempotent ? std::max(1, options_.finalize_attempts) : 1;
  int rate_limit_waits = 0;
  for (int attempt = 1;; ++attempt) {
    std::string failure;
    try {
      const auto response = transport_.Send(request);
      if (response.ok()) {
        auto submission = ParseJobSubmission(ParseBody(response));
        record_.job_id = submission.job_id;
        record_.finalize_state = FinalizeState::kDone;
        store_->Save(record_);
        UploadLogger().Info("upload_finalized", "session=" + record_.session_id + " job=" + submission.job_id);
        return submission;
      }
      if (!IsRetryableStatus(response.status)) {
        // A definite rejection: nothing was created, so a later call may start over.
        ResetFinalize();
        ThrowForError(response, "upload complete failed");
      }
      failure = "http_" + std::to_string(response.status);
    } catch (const AuthenticationFailedError &) {
      ResetFinalize();
      throw;
    } catch (const RateLimitedError &ex) {
      if (++rate_limit_waits > options_.max_rate_limit_waits) {
        ResetFinalize();
        throw;
      }
      std::this_thread::sleep_for(ex.retry_after().value_or(options_.part_backoff.BackoffFor(rate_limit_waits)));
      --attempt;
      continue;
    } catch (const TransportError &ex) {
      failure = ex.what();
    }

    if (attempt >= max_attempts) {
      UploadLogger().Error("finalize_failed", "session=" + record_.session_id + ": " + failure);
      throw TransportError("complete for session " + record_.session_id + " failed: " + failure);
    }
    UploadLogger().Warn("finalize_retry", "session=" + record_.session_id + " attempt=" + std::to_string(attempt) +
                                              " reason=" + failure);
    std::this_thread::sleep_for(options_.part_backoff.BackoffFor(attempt));
  }
}

void UploadSession::ResetFinalize() {
  record_.finalize_state = FinalizeState::kNotStarted;
  store_->Save(record_);
}

JobSubmission UploadSession::Run(const ProgressCallback &callback) {
  TransferAll(callback);
  return Finalize();
}

}  // namespace converthub::client
