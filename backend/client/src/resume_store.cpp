#include "resume_store.h"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "../../common/logger.h"
#include "errors.h"

namespace converthub::client {
namespace {

using json = nlohmann::json;

logging::ServiceLogger &UploadLogger() {
  static auto &logger = logging::ServiceLogger::Instance("upload");
  return logger;
}

std::string FinalizeStateName(FinalizeState state) {
  switch (state) {
    case FinalizeState::kNotStarted:
      return "not_started";
    case FinalizeState::kInFlight:
      return "in_flight";
    case FinalizeState::kDone:
      return "done";
  }
  return "not_started";
}

FinalizeState ParseFinalizeState(const std::string &value) {
  if (value.empty() || value == "not_started") {
    return FinalizeState::kNotStarted;
  }
  if (value == "in_flight") {
    return FinalizeState::kInFlight;
  }
  if (value == "done") {
    return FinalizeState::kDone;
  }
  throw InvalidResumeRecordError("unknown finalizeState '" + value + "'");
}

// Session ids become file names; anything outside [A-Za-z0-9_-.] is refused.
void CheckSessionIdForPath(const std::string &session_id) {
  const bool safe = !session_id.empty() && session_id != "." && session_id != ".." &&
                    std::all_of(session_id.begin(), session_id.end(), [](unsigned char ch) {
                      return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.';
                    });
  if (!safe) {
    throw InvalidResumeRecordError("session id not usable as a file name: " + session_id);
  }
}

// Flushes `path` to stable storage. Directories are opened read-only.
void SyncToDisk(const std::filesystem::path &path, int flags) {
  const int fd = ::open(path.c_str(), flags | O_CLOEXEC);
  if (fd < 0) {
    throw std::runtime_error("cannot open " + path.string() + " for sync: " + std::strerror(errno));
  }
  const int rc = ::fsync(fd);
  const int error = errno;
  ::close(fd);
  if (rc != 0) {
    throw std::runtime_error("cannot sync " + path.string() + ": " + std::strerror(error));
  }
}

}  // namespace

std::uint64_t ResumeRecord::TotalParts() const {
  if (chunk_size == 0) {
    return 0;
  }
  return (total_size + chunk_size - 1) / chunk_size;
}

std::uint64_t ResumeRecord::PartLength(std::uint64_t index) const {
  const std::uint64_t offset = index * chunk_size;
  if (offset >= total_size) {
    return 0;
  }
  return std::min<std::uint64_t>(chunk_size, total_size - offset);
}

std::uint64_t ResumeRecord::AcknowledgedBytes() const {
  std::uint64_t bytes = 0;
  for (const auto index : acknowledged_parts) {
    bytes += PartLength(index);
  }
  return bytes;
}

bool ResumeRecord::AllAcknowledged() const {
  return acknowledged_parts.size() == TotalParts();
}

nlohmann::json ResumeRecord::ToJson() const {
  json parts = json::array();
  for (const auto index : acknowledged_parts) {
    parts.push_back(index);
  }
  return {{"sessionId", session_id},
          {"filename", filename},
          {"targetFormat", target_format},
          {"totalSize", total_size},
          {"chunkSize", chunk_size},
          {"acknowledgedParts", parts},
          {"finalizeState", FinalizeStateName(finalize_state)},
          {"jobId", job_id},
          {"expiresAt", expires_at}};
}

ResumeRecord ResumeRecord::FromJson(const nlohmann::json &payload) {
  if (!payload.is_object()) {
    throw InvalidResumeRecordError("resume record is not an object");
  }
  ResumeRecord record;
  try {
    record.session_id = payload.at("sessionId").get<std::string>();
    record.total_size = payload.at("totalSize").get<std::uint64_t>();
    record.chunk_size = payload.at("chunkSize").get<std::uint64_t>();
    record.filename = payload.value("filename", std::string{});
    record.target_format = payload.value("targetFormat", std::string{});
    record.job_id = payload.value("jobId", std::string{});
    record.expires_at = payload.value("expiresAt", std::string{});
    record.finalize_state = ParseFinalizeState(payload.value("finalizeState", std::string{}));
    for (const auto &index : payload.value("acknowledgedParts", json::array())) {
      record.acknowledged_parts.insert(index.get<std::uint64_t>());
    }
  } catch (const json::exception &ex) {
    throw InvalidResumeRecordError(std::string("malformed resume record: ") + ex.what());
  }
  if (record.session_id.empty() || record.total_size == 0 || record.chunk_size == 0) {
    throw InvalidResumeRecordError("resume record lacks session id, size or chunk size");
  }
  const auto total_parts = record.TotalParts();
  if (!record.acknowledged_parts.empty() && *record.acknowledged_parts.rbegin() >= total_parts) {
    throw InvalidResumeRecordError("acknowledged part beyond the declared part count");
  }
  if (record.finalize_state == FinalizeState::kDone && record.job_id.empty()) {
    throw InvalidResumeRecordError("finalized record without a job id");
  }
  return record;
}

class MemoryResumeStore::Lease : public ResumeLease {
 public:
  Lease(MemoryResumeStore *store, std::string session_id) : store_(store), session_id_(std::move(session_id)) {}
  ~Lease() override { store_->Release(session_id_); }

 private:
  MemoryResumeStore *store_;
  std::string session_id_;
};

std::optional<ResumeRecord> MemoryResumeStore::Load(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = records_.find(session_id); it != records_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void MemoryResumeStore::Save(const ResumeRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[record.session_id] = record;
}

void MemoryResumeStore::Remove(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.erase(session_id);
}

std::unique_ptr<ResumeLease> MemoryResumeStore::AcquireLease(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!leased_.insert(session_id).second) {
    throw SessionBusyError(session_id);
  }
  return std::make_unique<Lease>(this, session_id);
}

void MemoryResumeStore::Release(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  leased_.erase(session_id);
}

class FileResumeStore::Lease : public ResumeLease {
 public:
  explicit Lease(int fd) : fd_(fd) {}
  Lease(const Lease &) = delete;
  Lease &operator=(const Lease &) = delete;

  ~Lease() override {
    if (fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }

 private:
  int fd_ = -1;
};

FileResumeStore::FileResumeStore(std::filesystem::path directory) : directory_(std::move(directory)) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw std::runtime_error("cannot create resume directory " + directory_.string() + ": " + ec.message());
  }
}

std::filesystem::path FileResumeStore::RecordPath(const std::string &session_id) const {
  CheckSessionIdForPath(session_id);
  return directory_ / (session_id + ".json");
}

std::mutex &FileResumeStore::SessionMutex(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto &slot = session_mutexes_[session_id];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

std::optional<ResumeRecord> FileResumeStore::Load(const std::string &session_id) {
  const auto path = RecordPath(session_id);
  std::lock_guard<std::mutex> lock(SessionMutex(session_id));
  std::ifstream stream(path);
  if (!stream.is_open()) {
    return std::nullopt;
  }
  const auto payload = json::parse(stream, nullptr, false);
  if (payload.is_discarded()) {
    throw InvalidResumeRecordError("resume record is not valid JSON: " + path.string());
  }
  auto record = ResumeRecord::FromJson(payload);
  if (record.session_id != session_id) {
    throw InvalidResumeRecordError("resume record " + path.string() + " belongs to " + record.session_id);
  }
  return record;
}

void FileResumeStore::Save(const ResumeRecord &record) {
  const auto path = RecordPath(record.session_id);
  std::lock_guard<std::mutex> lock(SessionMutex(record.session_id));
  auto temp = path;
  temp += ".tmp";
  {
    std::ofstream stream(temp, std::ios::trunc);
    if (!stream.is_open()) {
      throw std::runtime_error("cannot write resume record " + temp.string());
    }
    stream << record.ToJson().dump();
    stream.flush();
    if (!stream) {
      throw std::runtime_error("short write on resume record " + temp.string());
    }
  }
  // The rename must never publish a record whose bytes are still only in the page cache.
  SyncToDisk(temp, O_WRONLY);
  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    throw std::runtime_error("cannot commit resume record " + path.string() + ": " + ec.message());
  }
  SyncToDisk(path.has_parent_path() ? path.parent_path() : std::filesystem::path("."), O_RDONLY | O_DIRECTORY);
}

void FileResumeStore::Remove(const std::string &session_id) {
  const auto path = RecordPath(session_id);
  std::lock_guard<std::mutex> lock(SessionMutex(session_id));
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    UploadLogger().Warn("resume_record_remove_failed", path.string() + ": " + ec.message());
  }
}

std::unique_ptr<ResumeLease> FileResumeStore::AcquireLease(const std::string &session_id) {
  CheckSessionIdForPath(session_id);
  const auto path = directory_ / (session_id + ".lock");
  const int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
  if (fd < 0) {
    throw std::runtime_error("cannot open lock file " + path.string() + ": " + std::strerror(errno));
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int error = errno;
    ::close(fd);
    if (error == EWOULDBLOCK) {
      throw SessionBusyError(session_id);
    }
    throw std::runtime_error("cannot lock " + path.string() + ": " + std::strerror(error));
  }
  return std::make_unique<Lease>(fd);
}

}  // namespace converthub::client
