#ifndef CONVERTHUB_CLIENT_PERSISTENCE_DEDUP_STORE_H
#define CONVERTHUB_CLIENT_PERSISTENCE_DEDUP_STORE_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "postgres.h"

namespace converthub::persistence {

// Record of webhook deliveries already handed to the application.
class DedupStore {
 public:
  virtual ~DedupStore() = default;

  // Atomically records `key`. Returns false when the key was already present.
  virtual bool InsertIfAbsent(const std::string &key) = 0;

  // Forgets `key`, so a redelivery is treated as new.
  virtual void Erase(const std::string &key) = 0;
};

// Bounded in-process record. Oldest keys go first once `capacity` is reached, and
// keys older than `ttl` are forgotten.
class InMemoryDedupStore : public DedupStore {
 public:
  explicit InMemoryDedupStore(std::size_t capacity = 10000,
                              std::chrono::milliseconds ttl = std::chrono::hours(24));

  bool InsertIfAbsent(const std::string &key) override;
  void Erase(const std::string &key) override;

  std::size_t size() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::string key;
    std::uint64_t sequence = 0;
    Clock::time_point inserted_at;
  };

  void PurgeLocked(Clock::time_point now);
  void DropFrontLocked();

  std::size_t capacity_;
  std::chrono::milliseconds ttl_;
  mutable std::mutex mutex_;
  std::deque<Entry> order_;
  std::unordered_map<std::string, std::uint64_t> keys_;
  std::uint64_t next_sequence_ = 0;
};

// Shared record in the webhook_deliveries table, for receivers running as several processes.
class PostgresDedupStore : public DedupStore {
 public:
  explicit PostgresDedupStore(std::shared_ptr<PostgresConfig> config);

  void EnsureSchema() const;

  bool InsertIfAbsent(const std::string &key) override;
  void Erase(const std::string &key) override;

  // Deletes deliveries received more than `older_than` ago; returns how many went.
  std::size_t Evict(std::chrono::seconds older_than) const;

 private:
  std::shared_ptr<PostgresConfig> config_;
};

}  // namespace converthub::persistence

#endif  // CONVERTHUB_CLIENT_PERSISTENCE_DEDUP_STORE_H
