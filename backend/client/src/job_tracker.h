#ifndef CONVERTHUB_CLIENT_JOB_TRACKER_H
#define CONVERTHUB_CLIENT_JOB_TRACKER_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "api_types.h"
#include "cancellation.h"
#include "job_status.h"
#include "transport.h"

namespace converthub::client {

// Highest status seen per job, fed by polling and by webhooks alike. Observations
// never move a job backwards, and the first terminal status reported wins.
class JobStateBook {
 public:
  // Records `status` and returns the reconciled status for the job.
  JobStatus Observe(const std::string &job_id, JobStatus status);
  std::optional<JobStatus> Get(const std::string &job_id) const;

  void AddWatcher(CancellationToken *token);
  void RemoveWatcher(CancellationToken *token);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, JobStatus> statuses_;
  std::vector<CancellationToken *> watchers_;
};

struct WaitOptions {
  std::chrono::milliseconds poll_interval{2000};
  std::chrono::milliseconds timeout{std::chrono::minutes(10)};
  // Ceiling for the delay between polls while the service reports rate limiting.
  std::chrono::milliseconds max_rate_limit_delay{30000};
};

struct TrackerOptions {
  WaitOptions wait;
  bool throw_on_already_deleted = false;
};

enum class CancelOutcome { kCancelled, kAlreadyTerminal };
enum class DeleteOutcome { kDeleted, kAlreadyDeleted };

class JobTracker {
 public:
  // A tracker without a shared book keeps a private one.
  explicit JobTracker(TransportClient &transport, std::shared_ptr<JobStateBook> book = nullptr,
                      TrackerOptions options = {});

  JobStatus Status(const std::string &job_id);
  JobInfo Describe(const std::string &job_id);

  JobStatus Wait(const std::string &job_id, CancellationToken *token = nullptr);
  JobStatus Wait(const std::string &job_id, const WaitOptions &options, CancellationToken *token = nullptr);

  CancelOutcome Cancel(const std::string &job_id);

  // Streams the converted file into `sink`; returns the byte count.
  std::uint64_t Download(const std::string &job_id, const ContentSink &sink);
  std::uint64_t DownloadToFile(const std::string &job_id, const std::filesystem::path &path);

  DeleteOutcome Delete(const std::string &job_id);

  const std::shared_ptr<JobStateBook> &book() const { return book_; }

 private:
  DeleteOutcome AlreadyDeleted(const std::string &job_id) const;

  TransportClient &transport_;
  std::shared_ptr<JobStateBook> book_;
  TrackerOptions options_;
};

// A job id bound to the tracker that follows it.
class JobHandle {
 public:
  JobHandle(JobTracker &tracker, std::string job_id) : tracker_(&tracker), job_id_(std::move(job_id)) {}

  const std::string &job_id() const { return job_id_; }

  JobStatus Status() { return tracker_->Status(job_id_); }
  JobInfo Describe() { return tracker_->Describe(job_id_); }
  JobStatus Wait(CancellationToken *token = nullptr) { return tracker_->Wait(job_id_, token); }
  JobStatus Wait(const WaitOptions &options, CancellationToken *token = nullptr) {
    return tracker_->Wait(job_id_, options, token);
  }
  CancelOutcome Cancel() { return tracker_->Cancel(job_id_); }
  std::uint64_t Download(const ContentSink &sink) { return tracker_->Download(job_id_, sink); }
  std::uint64_t DownloadToFile(const std::filesystem::path &path) { return tracker_->DownloadToFile(job_id_, path); }
  DeleteOutcome Delete() { return tracker_->Delete(job_id_); }

 private:
  JobTracker *tracker_;
  std::string job_id_;
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_JOB_TRACKER_H
