#include <gtest/gtest.h>

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "../client/src/job_tracker.h"
#include "../common/persistence/dedup_store.h"
#include "../common/security.h"
#include "../services/webhook/webhook_receiver.h"

using namespace converthub::webhook;
using converthub::client::JobStateBook;
using converthub::client::JobStatus;
using converthub::persistence::InMemoryDedupStore;
using json = nlohmann::json;

namespace {

constexpr const char *kSecret = "whsec_test";

WebhookRequest Signed(const json &payload, const std::string &secret = kSecret) {
  WebhookRequest request;
  request.body = payload.dump();
  request.headers.emplace("X-Webhook-Signature",
                          "sha256=" + converthub::security::HmacSha256Hex(secret, request.body));
  return request;
}

json Completed(const std::string &job_id) {
  return json{{"event", "conversion.completed"},
              {"job_id", job_id},
              {"event_id", "evt-" + job_id},
              {"result", {{"download_url", "https://files.test/" + job_id}, {"format", "pdf"}, {"file_size", 512}}}};
}

class WebhookReceiverTest : public ::testing::Test {
 protected:
  std::unique_ptr<WebhookReceiver> MakeReceiver(FailurePolicy policy, WebhookAuth auth = {kSecret, ""},
                                                bool with_book = true) {
    WebhookOptions options(std::move(auth), policy);
    if (with_book) {
      options.state_book = book_;
    }
    options.service_name = "webhook_test";
    options.progress_handler = [this](const WebhookEvent &event) { progress_.push_back(event); };
    return std::make_unique<WebhookReceiver>(std::move(options), store_, [this](const WebhookEvent &event) {
      if (throw_non_standard_) {
        throw 42;
      }
      if (fail_handler_) {
        throw std::runtime_error("downstream unavailable");
      }
      delivered_.push_back(event);
    });
  }

  std::shared_ptr<InMemoryDedupStore> store_ = std::make_shared<InMemoryDedupStore>();
  std::shared_ptr<JobStateBook> book_ = std::make_shared<JobStateBook>();
  std::vector<WebhookEvent> delivered_;
  std::vector<WebhookEvent> progress_;
  bool fail_handler_ = false;
  bool throw_non_standard_ = false;
};

// Holds every per-status insert until `parties` deliveries have made one, so
// conflicting reports race for the per-job claim.
class RendezvousDedupStore : public converthub::persistence::DedupStore {
 public:
  explicit RendezvousDedupStore(int parties) : parties_(parties) {}

  bool InsertIfAbsent(const std::string &key) override {
    const bool inserted = inner_.InsertIfAbsent(key);
    if (key.size() < 9 || key.compare(key.size() - 9, 9, ":terminal") != 0) {
      std::unique_lock<std::mutex> lock(mutex_);
      ++arrived_;
      cv_.notify_all();
      cv_.wait_for(lock, std::chrono::seconds(2), [this]() { return arrived_ >= parties_; });
    }
    return inserted;
  }

  void Erase(const std::string &key) override { inner_.Erase(key); }

 private:
  InMemoryDedupStore inner_;
  int parties_;
  int arrived_ = 0;
  std::mutex mutex_;
  std::condition_variable cv_;
};

json Failed(const std::string &job_id) {
  return json{{"event", "conversion.failed"},
              {"job_id", job_id},
              {"error", {{"code", "CONVERSION_FAILED"}, {"message", "corrupt input"}}}};
}

}  // namespace

TEST(WebhookEventTest, MapsEventNamesToStatuses) {
  std::string error;
  auto event = ParseWebhookEvent(R"({"event":"conversion.failed","job_id":"j1",
                                     "error":{"code":"CONVERSION_FAILED","message":"corrupt"}})",
                                 error);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->status, JobStatus::kFailed);
  ASSERT_TRUE(event->error.has_value());
  EXPECT_EQ(event->error->message, "corrupt");

  event = ParseWebhookEvent(R"({"event":"conversion.progress","job_id":"j1","progress":{"percentage":40}})", error);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->status, JobStatus::kProcessing);
  EXPECT_EQ(event->progress["percentage"], 40);

  // An explicit status wins over the event name.
  event = ParseWebhookEvent(R"({"event":"conversion.progress","job_id":"j1","status":"canceled"})", error);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->status, JobStatus::kCancelled);
}

TEST(WebhookEventTest, ReportsUnusablePayloads) {
  std::string error;
  EXPECT_FALSE(ParseWebhookEvent("{", error).has_value());
  EXPECT_EQ(error, "invalid_json");
  EXPECT_FALSE(ParseWebhookEvent(R"({"event":"conversion.completed"})", error).has_value());
  EXPECT_EQ(error, "missing_job_id");
  EXPECT_FALSE(ParseWebhookEvent(R"({"event":"conversion.teleported","job_id":"j"})", error).has_value());
  EXPECT_EQ(error, "unknown_status");
}

TEST(WebhookEventTest, ParsesFailurePolicies) {
  EXPECT_EQ(ParseFailurePolicy("acknowledge"), FailurePolicy::kAcknowledge);
  EXPECT_EQ(ParseFailurePolicy("retry"), FailurePolicy::kRequestRetry);
  EXPECT_FALSE(ParseFailurePolicy("ignore").has_value());
  EXPECT_EQ(ToString(FailurePolicy::kRequestRetry), "retry");
}

TEST_F(WebhookReceiverTest, RequiresCredentialsStoreAndHandler) {
  WebhookOptions no_auth(WebhookAuth{}, FailurePolicy::kAcknowledge);
  EXPECT_THROW(WebhookReceiver(no_auth, store_, [](const WebhookEvent &) {}), std::invalid_argument);
  WebhookOptions options(WebhookAuth{kSecret, ""}, FailurePolicy::kAcknowledge);
  EXPECT_THROW(WebhookReceiver(options, nullptr, [](const WebhookEvent &) {}), std::invalid_argument);
  EXPECT_THROW(WebhookReceiver(options, store_, EventHandler{}), std::invalid_argument);
}

TEST_F(WebhookReceiverTest, DeliversASignedTerminalEvent) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  const auto response = receiver->Handle(Signed(Completed("job-1")));
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.body["status"], "accepted");
  ASSERT_EQ(delivered_.size(), 1u);
  EXPECT_EQ(delivered_[0].job_id, "job-1");
  ASSERT_TRUE(delivered_[0].result.has_value());
  EXPECT_EQ(delivered_[0].result->file_size, 512u);
  EXPECT_EQ(book_->Get("job-1"), JobStatus::kCompleted);
}

TEST_F(WebhookReceiverTest, RejectsBadSignaturesBeforeParsing) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  const auto forged = Signed(Completed("job-1"), "wrong-secret");
  EXPECT_EQ(receiver->Handle(forged).status, 401);

  WebhookRequest unsigned_request;
  unsigned_request.body = "not even json";
  const auto response = receiver->Handle(unsigned_request);
  EXPECT_EQ(response.status, 401);
  EXPECT_EQ(response.body["error"], "unauthorized");
  EXPECT_TRUE(delivered_.empty());
  EXPECT_FALSE(book_->Get("job-1").has_value());
  EXPECT_EQ(store_->size(), 0u);
}

TEST_F(WebhookReceiverTest, AcceptsUppercaseSignatureWithoutPrefix) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  WebhookRequest request;
  request.body = Completed("job-2").dump();
  auto signature = converthub::security::HmacSha256Hex(kSecret, request.body);
  for (auto &ch : signature) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }
  request.headers.emplace("X-Webhook-Signature", signature);
  EXPECT_EQ(receiver->Handle(request).status, 200);
}

TEST_F(WebhookReceiverTest, AcceptsABearerTokenWhenConfigured) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge, WebhookAuth{"", "hook-token"});
  WebhookRequest request;
  request.body = Completed("job-3").dump();
  request.headers.emplace("Authorization", "Bearer hook-token");
  EXPECT_EQ(receiver->Handle(request).status, 200);

  WebhookRequest wrong;
  wrong.body = request.body;
  wrong.headers.emplace("Authorization", "Bearer nope");
  EXPECT_EQ(receiver->Handle(wrong).status, 401);
}

TEST_F(WebhookReceiverTest, MalformedAuthenticatedBodiesAreBadRequests) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  WebhookRequest request;
  request.body = R"({"event":"conversion.completed"})";
  request.headers.emplace("X-Webhook-Signature", converthub::security::HmacSha256Hex(kSecret, request.body));
  const auto response = receiver->Handle(request);
  EXPECT_EQ(response.status, 400);
  EXPECT_EQ(response.body["error"], "missing_job_id");
}

TEST_F(WebhookReceiverTest, DuplicateDeliveriesReachTheHandlerOnce) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  const auto first = receiver->Handle(Signed(Completed("job-4")));
  const auto second = receiver->Handle(Signed(Completed("job-4")));
  EXPECT_EQ(first.body["status"], "accepted");
  EXPECT_EQ(second.status, 200);
  EXPECT_EQ(second.body["status"], "duplicate");
  EXPECT_EQ(delivered_.size(), 1u);
  EXPECT_GE(converthub::security::MetricsRegistry::Instance().WebhookOutcomeCount("webhook_test", "duplicate"), 1);
}

TEST_F(WebhookReceiverTest, ConflictingTerminalReportIsIgnored) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  book_->Observe("job-5", JobStatus::kCancelled);
  const auto response = receiver->Handle(Signed(Completed("job-5")));
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.body["status"], "conflict");
  EXPECT_TRUE(delivered_.empty());
  EXPECT_EQ(book_->Get("job-5"), JobStatus::kCancelled);
}

TEST_F(WebhookReceiverTest, HandlerFailureCanRequestRedelivery) {
  auto receiver = MakeReceiver(FailurePolicy::kRequestRetry);
  fail_handler_ = true;
  const auto failed = receiver->Handle(Signed(Completed("job-6")));
  EXPECT_EQ(failed.status, 500);
  EXPECT_EQ(failed.body["error"], "handler_failed");

  fail_handler_ = false;
  const auto redelivered = receiver->Handle(Signed(Completed("job-6")));
  EXPECT_EQ(redelivered.status, 200);
  EXPECT_EQ(redelivered.body["status"], "accepted");
  EXPECT_EQ(delivered_.size(), 1u);
}

TEST_F(WebhookReceiverTest, HandlerFailureCanBeAcknowledged) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  fail_handler_ = true;
  const auto failed = receiver->Handle(Signed(Completed("job-7")));
  EXPECT_EQ(failed.status, 200);
  EXPECT_EQ(failed.body["status"], "handler_failed");

  fail_handler_ = false;
  EXPECT_EQ(receiver->Handle(Signed(Completed("job-7"))).body["status"], "duplicate");
  EXPECT_TRUE(delivered_.empty());
}

TEST_F(WebhookReceiverTest, ProgressEventsAreForwardedWithoutDedup) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  const json progress{{"event", "conversion.progress"}, {"job_id", "job-8"}, {"progress", {{"percentage", 50}}}};
  EXPECT_EQ(receiver->Handle(Signed(progress)).body["status"], "progress");
  EXPECT_EQ(receiver->Handle(Signed(progress)).body["status"], "progress");
  EXPECT_EQ(progress_.size(), 2u);
  EXPECT_TRUE(delivered_.empty());
  EXPECT_EQ(store_->size(), 0u);
  EXPECT_EQ(book_->Get("job-8"), JobStatus::kProcessing);
}

TEST_F(WebhookReceiverTest, WakesATrackerWaitingOnTheSameBook) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge);
  converthub::client::CancellationToken token;
  book_->AddWatcher(&token);
  const auto before = token.generation();
  receiver->Handle(Signed(Completed("job-9")));
  EXPECT_NE(token.generation(), before);
  book_->RemoveWatcher(&token);
}

TEST_F(WebhookReceiverTest, FirstTerminalReportWinsWithoutAStateBook) {
  auto receiver = MakeReceiver(FailurePolicy::kAcknowledge, WebhookAuth{kSecret, ""}, false);
  EXPECT_EQ(receiver->Handle(Signed(Completed("job-10"))).body["status"], "accepted");
  const auto second = receiver->Handle(Signed(Failed("job-10")));
  EXPECT_EQ(second.status, 200);
  EXPECT_EQ(second.body["status"], "conflict");
  ASSERT_EQ(delivered_.size(), 1u);
  EXPECT_EQ(delivered_[0].status, JobStatus::kCompleted);
  // A redelivery of the losing report stays a no-op.
  EXPECT_EQ(receiver->Handle(Signed(Failed("job-10"))).body["status"], "conflict");
  EXPECT_EQ(delivered_.size(), 1u);
}

TEST(WebhookReceiverConcurrencyTest, ConcurrentConflictingReportsDeliverOnce) {
  auto store = std::make_shared<RendezvousDedupStore>(2);
  auto book = std::make_shared<JobStateBook>();
  WebhookOptions options(WebhookAuth{kSecret, ""}, FailurePolicy::kAcknowledge);
  options.state_book = book;
  options.service_name = "webhook_test";
  std::mutex delivered_mutex;
  std::vector<JobStatus> delivered;
  WebhookReceiver receiver(std::move(options), store, [&](const WebhookEvent &event) {
    std::lock_guard<std::mutex> lock(delivered_mutex);
    delivered.push_back(event.status);
  });

  json cancelled = Completed("job-11");
  cancelled["event"] = "conversion.cancelled";
  cancelled.erase("result");
  const auto first = Signed(Completed("job-11"));
  const auto second = Signed(cancelled);
  std::atomic<int> conflicts{0};
  std::thread a([&]() {
    if (receiver.Handle(first).body["status"] == "conflict") {
      ++conflicts;
    }
  });
  std::thread b([&]() {
    if (receiver.Handle(second).body["status"] == "conflict") {
      ++conflicts;
    }
  });
  a.join();
  b.join();

  ASSERT_EQ(delivered.size(), 1u);
  EXPECT_EQ(conflicts.load(), 1);
  EXPECT_EQ(book->Get("job-11"), delivered[0]);
}

TEST_F(WebhookReceiverTest, NonStandardHandlerFailuresFollowThePolicy) {
  auto receiver = MakeReceiver(FailurePolicy::kRequestRetry);
  throw_non_standard_ = true;
  WebhookResponse failed;
  EXPECT_NO_THROW(failed = receiver->Handle(Signed(Completed("job-12"))));
  EXPECT_EQ(failed.status, 500);
  EXPECT_EQ(failed.body["error"], "handler_failed");

  throw_non_standard_ = false;
  const auto redelivered = receiver->Handle(Signed(Completed("job-12")));
  EXPECT_EQ(redelivered.body["status"], "accepted");
  EXPECT_EQ(delivered_.size(), 1u);
}
