#ifndef CONVERTHUB_CLIENT_RESUME_STORE_H
#define CONVERTHUB_CLIENT_RESUME_STORE_H

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace converthub::client {

enum class FinalizeState { kNotStarted, kInFlight, kDone };

// Everything needed to re-attach to an open upload session after a restart.
struct ResumeRecord {
  std::string session_id;
  std::string filename;
  std::string target_format;
  std::uint64_t total_size = 0;
  std::uint64_t chunk_size = 0;
  std::set<std::uint64_t> acknowledged_parts;
  FinalizeState finalize_state = FinalizeState::kNotStarted;
  std::string job_id;
  std::string expires_at;

  std::uint64_t TotalParts() const;
  std::uint64_t PartLength(std::uint64_t index) const;
  std::uint64_t AcknowledgedBytes() const;
  bool AllAcknowledged() const;

  nlohmann::json ToJson() const;
  // Raises InvalidResumeRecordError when the document is inconsistent.
  static ResumeRecord FromJson(const nlohmann::json &payload);
};

// Exclusive ownership of one session; released on destruction.
class ResumeLease {
 public:
  virtual ~ResumeLease() = default;
};

class ResumeStore {
 public:
  virtual ~ResumeStore() = default;

  virtual std::optional<ResumeRecord> Load(const std::string &session_id) = 0;
  virtual void Save(const ResumeRecord &record) = 0;
  virtual void Remove(const std::string &session_id) = 0;

  // Raises SessionBusyError if another uploader holds the session.
  virtual std::unique_ptr<ResumeLease> AcquireLease(const std::string &session_id) = 0;
};

class MemoryResumeStore : public ResumeStore {
 public:
  std::optional<ResumeRecord> Load(const std::string &session_id) override;
  void Save(const ResumeRecord &record) override;
  void Remove(const std::string &session_id) override;
  std::unique_ptr<ResumeLease> AcquireLease(const std::string &session_id) override;

 private:
  class Lease;

  void Release(const std::string &session_id);

  std::mutex mutex_;
  std::map<std::string, ResumeRecord> records_;
  std::set<std::string> leased_;
};

// One "<session>.json" per session. Writes go through a temp file and rename(2);
// leases are flock(2) locks on "<session>.lock", so they also exclude other processes.
class FileResumeStore : public ResumeStore {
 public:
  explicit FileResumeStore(std::filesystem::path directory);

  std::optional<ResumeRecord> Load(const std::string &session_id) override;
  void Save(const ResumeRecord &record) override;
  void Remove(const std::string &session_id) override;
  std::unique_ptr<ResumeLease> AcquireLease(const std::string &session_id) override;

  const std::filesystem::path &directory() const { return directory_; }

 private:
  class Lease;

  std::filesystem::path RecordPath(const std::string &session_id) const;
  std::mutex &SessionMutex(const std::string &session_id);

  std::filesystem::path directory_;
  std::mutex registry_mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>> session_mutexes_;
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_RESUME_STORE_H
