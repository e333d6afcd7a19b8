#ifndef CONVERTHUB_CLIENT_UPLOAD_SESSION_H
#define CONVERTHUB_CLIENT_UPLOAD_SESSION_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api_types.h"
#include "checksum.h"
#include "resume_store.h"
#include "retry_policy.h"
#include "transport.h"

namespace converthub::client {

// Random-access reader over the bytes being uploaded.
class ChunkSource {
 public:
  virtual ~ChunkSource() = default;

  virtual std::uint64_t size() const = 0;
  virtual std::string name() const = 0;
  virtual std::string Read(std::uint64_t offset, std::uint64_t length) = 0;
};

class FileChunkSource : public ChunkSource {
 public:
  explicit FileChunkSource(std::filesystem::path path);

  std::uint64_t size() const override { return size_; }
  std::string name() const override { return path_.filename().string(); }
  std::string Read(std::uint64_t offset, std::uint64_t length) override;

 private:
  std::filesystem::path path_;
  std::ifstream stream_;
  std::uint64_t size_ = 0;
};

class MemoryChunkSource : public ChunkSource {
 public:
  MemoryChunkSource(std::string name, std::string bytes);

  std::uint64_t size() const override { return bytes_.size(); }
  std::string name() const override { return name_; }
  std::string Read(std::uint64_t offset, std::uint64_t length) override;

 private:
  std::string name_;
  std::string bytes_;
};

struct UploadOptions {
  std::uint64_t chunk_size = kDefaultChunkBytes;
  // Attempts per part before the part (not the session) is given up.
  int part_attempts = 3;
  RetryPolicy part_backoff;
  // Rate-limited answers do not consume part attempts, but are bounded separately.
  int max_rate_limit_waits = 10;
  int finalize_attempts = 3;
  // Re-sending complete on an assembled upload is assumed to be a no-op remotely.
  bool finalize_is_idempotent = true;
  std::optional<std::string> webhook_url;
  ConversionOptions conversion_options;
};

struct UploadProgress {
  std::uint64_t bytes_transferred = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t part_index = 0;
  std::uint64_t parts_acknowledged = 0;
  std::uint64_t total_parts = 0;
};

using ProgressCallback = std::function<void(const UploadProgress &)>;

// Drives init -> parts -> complete for one source. Single owner: the session holds
// the store's lease for its whole lifetime.
class UploadSession {
 public:
  // Validates the source, declares it to the service and persists the first record.
  static std::unique_ptr<UploadSession> Start(TransportClient &transport, std::shared_ptr<ResumeStore> store,
                                              std::shared_ptr<ChunkSource> source,
                                              const std::string &target_format, UploadOptions options = {});

  // Re-attaches to a stored session without re-issuing init.
  static std::unique_ptr<UploadSession> Resume(TransportClient &transport, std::shared_ptr<ResumeStore> store,
                                               std::shared_ptr<ChunkSource> source, const std::string &session_id,
                                               UploadOptions options = {});

  UploadSession(const UploadSession &) = delete;
  UploadSession &operator=(const UploadSession &) = delete;

  // Uploads the lowest unacknowledged part; std::nullopt once every part is acknowledged.
  std::optional<UploadProgress> TransferNextPart();

  void TransferAll(const ProgressCallback &callback = {});

  // Requires every part to be acknowledged (std::logic_error otherwise).
  JobSubmission Finalize();

  JobSubmission Run(const ProgressCallback &callback = {});

  const ResumeRecord &record() const { return record_; }
  const std::string &session_id() const { return record_.session_id; }
  std::vector<std::uint64_t> PendingParts() const;
  bool finalized() const { return record_.finalize_state == FinalizeState::kDone; }

 private:
  UploadSession(TransportClient &transport, std::shared_ptr<ResumeStore> store, std::shared_ptr<ChunkSource> source,
                ResumeRecord record, std::unique_ptr<ResumeLease> lease, UploadOptions options);

  std::optional<std::uint64_t> NextPendingPart() const;
  void AdvancePrefixTo(std::uint64_t offset);
  void UploadPart(std::uint64_t index, const std::string &data, const std::string &part_checksum,
                  const std::string &running_checksum);
  UploadProgress Progress(std::uint64_t part_index) const;
  // Marks a refused complete call as never sent and persists that.
  void ResetFinalize();

  TransportClient &transport_;
  std::shared_ptr<ResumeStore> store_;
  std::shared_ptr<ChunkSource> source_;
  ResumeRecord record_;
  std::unique_ptr<ResumeLease> lease_;
  UploadOptions options_;
  // SHA-256 over [0, prefix_offset_) of the source, for the running checksum.
  Sha256 prefix_;
  std::uint64_t prefix_offset_ = 0;
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_UPLOAD_SESSION_H
