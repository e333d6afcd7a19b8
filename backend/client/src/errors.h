#ifndef CONVERTHUB_CLIENT_ERRORS_H
#define CONVERTHUB_CLIENT_ERRORS_H

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "job_status.h"

namespace converthub::client {

enum class ErrorKind {
  kTransport,
  kAuthenticationFailed,
  kRateLimited,
  kRemote,
  kSizeExceeded,
  kUnsupportedFormat,
  kJobNotFound,
  kAlreadyDeleted,
  kNotReady,
  kTimeout,
  kWaitCancelled,
  kSessionBusy,
  kInvalidResumeRecord,
};

class ClientError : public std::runtime_error {
 public:
  ClientError(ErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

// Network failure, timeout or exhausted retries on a transient HTTP status.
class TransportError : public ClientError {
 public:
  explicit TransportError(const std::string &message) : ClientError(ErrorKind::kTransport, message) {}
};

class AuthenticationFailedError : public ClientError {
 public:
  explicit AuthenticationFailedError(const std::string &message)
      : ClientError(ErrorKind::kAuthenticationFailed, message) {}
};

class RateLimitedError : public ClientError {
 public:
  RateLimitedError(const std::string &message, std::optional<std::chrono::milliseconds> retry_after)
      : ClientError(ErrorKind::kRateLimited, message), retry_after_(retry_after) {}

  const std::optional<std::chrono::milliseconds> &retry_after() const noexcept { return retry_after_; }

 private:
  std::optional<std::chrono::milliseconds> retry_after_;
};

// An {error:{code,message}} payload the client has no more specific type for.
class RemoteError : public ClientError {
 public:
  RemoteError(int http_status, std::string code, std::string message)
      : ClientError(ErrorKind::kRemote, code.empty() ? message : code + ": " + message),
        http_status_(http_status),
        code_(std::move(code)),
        remote_message_(std::move(message)) {}

  int http_status() const noexcept { return http_status_; }
  const std::string &code() const noexcept { return code_; }
  const std::string &remote_message() const noexcept { return remote_message_; }

 private:
  int http_status_;
  std::string code_;
  std::string remote_message_;
};

class SizeExceededError : public ClientError {
 public:
  explicit SizeExceededError(const std::string &message) : ClientError(ErrorKind::kSizeExceeded, message) {}
};

class UnsupportedFormatError : public ClientError {
 public:
  explicit UnsupportedFormatError(const std::string &message)
      : ClientError(ErrorKind::kUnsupportedFormat, message) {}
};

class JobNotFoundError : public ClientError {
 public:
  explicit JobNotFoundError(const std::string &job_id)
      : ClientError(ErrorKind::kJobNotFound, "job not found: " + job_id), job_id_(job_id) {}

  const std::string &job_id() const noexcept { return job_id_; }

 private:
  std::string job_id_;
};

class AlreadyDeletedError : public ClientError {
 public:
  explicit AlreadyDeletedError(const std::string &job_id)
      : ClientError(ErrorKind::kAlreadyDeleted, "artifact already deleted: " + job_id) {}
};

class NotReadyError : public ClientError {
 public:
  NotReadyError(const std::string &job_id, JobStatus current)
      : ClientError(ErrorKind::kNotReady, "job " + job_id + " is " + ToString(current)), current_(current) {}

  JobStatus current_status() const noexcept { return current_; }

 private:
  JobStatus current_;
};

class TimeoutError : public ClientError {
 public:
  TimeoutError(const std::string &job_id, std::optional<JobStatus> last_observed)
      : ClientError(ErrorKind::kTimeout, "timed out waiting for job " + job_id), last_observed_(last_observed) {}

  const std::optional<JobStatus> &last_observed() const noexcept { return last_observed_; }

 private:
  std::optional<JobStatus> last_observed_;
};

class WaitCancelledError : public ClientError {
 public:
  explicit WaitCancelledError(const std::string &job_id)
      : ClientError(ErrorKind::kWaitCancelled, "wait abandoned for job " + job_id) {}
};

class SessionBusyError : public ClientError {
 public:
  explicit SessionBusyError(const std::string &session_id)
      : ClientError(ErrorKind::kSessionBusy, "upload session already owned: " + session_id) {}
};

class InvalidResumeRecordError : public ClientError {
 public:
  explicit InvalidResumeRecordError(const std::string &message)
      : ClientError(ErrorKind::kInvalidResumeRecord, message) {}
};

}  // namespace converthub::client

#endif  // CONVERTHUB_CLIENT_ERRORS_H
