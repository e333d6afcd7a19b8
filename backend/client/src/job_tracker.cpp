#include "job_tracker.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "../../common/logger.h"
#include "errors.h"

namespace converthub::client {
namespace {

logging::ServiceLogger &JobsLogger() {
  static auto &logger = logging::ServiceLogger::Instance("jobs");
  return logger;
}

void CheckJobId(const std::string &job_id) {
  if (job_id.empty()) {
    throw std::invalid_argument("job id must not be empty");
  }
}

// Keeps a token registered with the book for the duration of one wait.
class WatchGuard {
 public:
  WatchGuard(JobStateBook &book, CancellationToken &token) : book_(book), token_(token) { book_.AddWatcher(&token_); }
  ~WatchGuard() { book_.RemoveWatcher(&token_); }
  WatchGuard(const WatchGuard &) = delete;
  WatchGuard &operator=(const WatchGuard &) = delete;

 private:
  JobStateBook &book_;
  CancellationToken &token_;
};

bool IsAlreadyTerminalAnswer(const HttpResponse &response) {
  if (response.status == 409) {
    return true;
  }
  const auto error = ParseErrorBody(response.body);
  return error && error->code.rfind("JOB_ALREADY_", 0) == 0;
}

}  // namespace

JobStatus JobStateBook::Observe(const std::string &job_id, JobStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = statuses_.try_emplace(job_id, status);
  if (!inserted) {
    const JobStatus current = it->second;
    if (IsTerminal(current) || StatusRank(status) <= StatusRank(current)) {
      return current;
    }
    it->second = status;
  }
  for (auto *watcher : watchers_) {
    watcher->Notify();
  }
  return it->second;
}

std::optional<JobStatus> JobStateBook::Get(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = statuses_.find(job_id); it != statuses_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void JobStateBook::AddWatcher(CancellationToken *token) {
  std::lock_guard<std::mutex> lock(mutex_);
  watchers_.push_back(token);
}

void JobStateBook::RemoveWatcher(CancellationToken *token) {
  std::lock_guard<std::mutex> lock(mutex_);
  watchers_.erase(std::remove(watchers_.begin(), watchers_.end(), token), watchers_.end());
}

JobTracker::JobTracker(TransportClient &transport, std::shared_ptr<JobStateBook> book, TrackerOptions options)
    : transport_(transport),
      book_(book ? std::move(book) : std::make_shared<JobStateBook>()),
      options_(std::move(options)) {}

JobInfo JobTracker::Describe(const std::string &job_id) {
  CheckJobId(job_id);
  ApiRequest request;
  request.method = "GET";
  request.path = "/jobs/" + job_id;
  request.idempotent = true;
  request.request_class = RequestClass::kStatus;
  const auto response = transport_.Send(request);
  if (IsJobNotFound(response)) {
    throw JobNotFoundError(job_id);
  }
  if (!response.ok()) {
    ThrowForError(response, "job status failed");
  }
  auto info = ParseJobInfo(ParseBody(response));
  const JobStatus reported = info.status;
  info.status = book_->Observe(job_id, reported);
  if (info.status != reported) {
    JobsLogger().Debug("status_reconciled",
                       "job=" + job_id + " reported=" + ToString(reported) + " kept=" + ToString(info.status));
  }
  return info;
}

JobStatus JobTracker::Status(const std::string &job_id) {
  return Describe(job_id).status;
}

JobStatus JobTracker::Wait(const std::string &job_id, CancellationToken *token) {
  return Wait(job_id, options_.wait, token);
}

JobStatus JobTracker::Wait(const std::string &job_id, const WaitOptions &options, CancellationToken *token) {
  CheckJobId(job_id);
  CancellationToken local_token;
  CancellationToken &active = token ? *token : local_token;
  WatchGuard guard(*book_, active);

  const auto deadline = std::chrono::steady_clock::now() + options.timeout;
  std::optional<JobStatus> last_observed;
  int rate_limited_polls = 0;
  while (true) {
    if (active.cancelled()) {
      JobsLogger().Info("wait_cancelled", "job=" + job_id);
      throw WaitCancelledError(job_id);
    }
    // A webhook may already have settled the job.
    if (const auto known = book_->Get(job_id); known && IsTerminal(*known)) {
      return *known;
    }

    std::chrono::milliseconds delay = options.poll_interval;
    try {
      last_observed = Status(job_id);
      rate_limited_polls = 0;
      if (IsTerminal(*last_observed)) {
        return *last_observed;
      }
    } catch (const RateLimitedError &ex) {
      ++rate_limited_polls;
      auto backoff = options.poll_interval;
      for (int i = 0; i < rate_limited_polls && backoff < options.max_rate_limit_delay; ++i) {
        backoff *= 2;
      }
      delay = std::min(std::max(backoff, ex.retry_after().value_or(backoff)), options.max_rate_limit_delay);
      JobsLogger().Warn("wait_rate_limited", "job=" + job_id + " delay_ms=" + std::to_string(delay.count()));
    } catch (const TransportError &ex) {
      JobsLogger().Warn("wait_poll_failed", "job=" + job_id + ": " + ex.what());
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      JobsLogger().Warn("wait_timed_out",
                        "job=" + job_id + " last=" + (last_observed ? ToString(*last_observed) : "unknown"));
      throw TimeoutError(job_id, last_observed);
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    // Observations made after this point wake the sleep below.
    const auto generation = active.generation();
    if (const auto known = book_->Get(job_id); known && IsTerminal(*known)) {
      return *known;
    }
    if (active.WaitFor(std::min(delay, remaining), generation)) {
      JobsLogger().Info("wait_cancelled", "job=" + job_id);
      throw WaitCancelledError(job_id);
    }
  }
}

CancelOutcome JobTracker::Cancel(const std::string &job_id) {
  CheckJobId(job_id);
  if (const auto known = book_->Get(job_id); known && IsTerminal(*known)) {
    return CancelOutcome::kAlreadyTerminal;
  }
  if (IsTerminal(Status(job_id))) {
    return CancelOutcome::kAlreadyTerminal;
  }

  ApiRequest request;
  request.method = "DELETE";
  request.path = "/jobs/" + job_id;
  request.idempotent = true;
  const auto response = transport_.Send(request);
  if (response.ok()) {
    // A terminal report that raced the cancel keeps precedence.
    if (book_->Observe(job_id, JobStatus::kCancelled) != JobStatus::kCancelled) {
      return CancelOutcome::kAlreadyTerminal;
    }
    JobsLogger().Info("job_cancelled", "job=" + job_id);
    return CancelOutcome::kCancelled;
  }
  if (IsAlreadyTerminalAnswer(response)) {
    return CancelOutcome::kAlreadyTerminal;
  }
  if (IsJobNotFound(response)) {
    throw JobNotFoundError(job_id);
  }
  ThrowForError(response, "job cancel failed");
}

std::uint64_t JobTracker::Download(const std::string &job_id, const ContentSink &sink) {
  const auto info = Describe(job_id);
  if (info.status != JobStatus::kCompleted) {
    throw NotReadyError(job_id, info.status);
  }
  if (!info.result || info.result->download_url.empty()) {
    throw RemoteError(0, "INVALID_RESPONSE", "completed job " + job_id + " has no download_url");
  }

  ApiRequest request;
  request.method = "GET";
  request.path = info.result->download_url;
  request.headers.emplace("Accept", "*/*");
  request.idempotent = true;
  std::uint64_t received = 0;
  const auto response = transport_.Stream(request, [&received, &sink](const char *data, std::size_t length) {
    received += length;
    return sink(data, length);
  });
  if (!response.ok()) {
    ThrowForError(response, "download failed");
  }
  JobsLogger().Info("job_downloaded", "job=" + job_id + " bytes=" + std::to_string(received));
  return received;
}

std::uint64_t JobTracker::DownloadToFile(const std::string &job_id, const std::filesystem::path &path) {
  auto partial = path;
  partial += ".part";
  std::uint64_t received = 0;
  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("cannot open " + partial.string());
    }
    try {
      received = Download(job_id, [&out](const char *data, std::size_t length) {
        out.write(data, static_cast<std::streamsize>(length));
        return static_cast<bool>(out);
      });
      out.flush();
      if (!out) {
        throw std::runtime_error("write failed on " + partial.string());
      }
    } catch (const std::exception &) {
      out.close();
      std::error_code ignored;
      std::filesystem::remove(partial, ignored);
      throw;
    }
  }
  std::error_code ec;
  std::filesystem::rename(partial, path, ec);
  if (ec) {
    throw std::runtime_error("cannot move download into " + path.string() + ": " + ec.message());
  }
  return received;
}

DeleteOutcome JobTracker::AlreadyDeleted(const std::string &job_id) const {
  if (options_.throw_on_already_deleted) {
    throw AlreadyDeletedError(job_id);
  }
  JobsLogger().Debug("job_already_deleted", "job=" + job_id);
  return DeleteOutcome::kAlreadyDeleted;
}

// The service is the only record of deletions, so concurrent or repeated calls from
// any number of clients resolve to one kDeleted.
DeleteOutcome JobTracker::Delete(const std::string &job_id) {
  CheckJobId(job_id);
  ApiRequest request;
  request.method = "DELETE";
  request.path = "/jobs/" + job_id + "/destroy";
  request.idempotent = true;
  const auto response = transport_.Send(request);
  if (IsJobNotFound(response)) {
    return AlreadyDeleted(job_id);
  }
  if (!response.ok()) {
    ThrowForError(response, "job delete failed");
  }
  JobsLogger().Info("job_deleted", "job=" + job_id);
  return DeleteOutcome::kDeleted;
}

}  // namespace converthub::client
