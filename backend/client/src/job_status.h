#ifndef CONVERTHUB_CLIENT_JOB_STATUS_H
#define CONVERTHUB_CLIENT_JOB_STATUS_H

#include <optional>
#include <string>
#include <string_view>

namespace converthub::client {

enum class JobStatus { kQueued, kProcessing, kCompleted, kFailed, kCancelled };

inline bool IsTerminal(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kFailed ||
         status == JobStatus::kCancelled;
}

// Position in queued -> processing -> terminal; all terminal states share the last rank.
inline int StatusRank(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued:
      return 0;
    case JobStatus::kProcessing:
      return 1;
    default:
      return 2;
  }
}

inline std::string ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued:
      return "queued";
    case JobStatus::kProcessing:
      return "processing";
    case JobStatus::kCompleted:
      return "completed";
    case JobStatus::kFailed:
      return "failed";
    case JobStatus::kCancelled:
      return "cancelled";
  }
  return "queued";
}

// Accepts the spellings the service has been seen to use ("pending", "canceled").
inline std::optional<JobStatus> ParseJobStatus(std::string_view value) {
  if (value == "queued" || value == "pending") {
    return JobStatus::kQueued;
  }
  if (value == "processing" || value == "uploading" || value == "converting") {
    return JobStatus::kProcessing;
  }
  if (value == "completed") {
    return JobStatus::kCompleted;
  }
  if (value == "failed") {
    return JobStatus::kFailed;
  }
  if (value == "cancelled" || value == "canceled") {
    return JobStatus::kCancelled;
  }
  return std::nullopt;
}

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_JOB_STATUS_H
