#include "dedup_store.h"

#include <stdexcept>
#include <utility>

namespace converthub::persistence {

InMemoryDedupStore::InMemoryDedupStore(std::size_t capacity, std::chrono::milliseconds ttl)
    : capacity_(capacity), ttl_(ttl) {
  if (capacity_ == 0) {
    throw std::invalid_argument("dedup capacity must be positive");
  }
}

void InMemoryDedupStore::DropFrontLocked() {
  const Entry &front = order_.front();
  // Erased or re-inserted keys leave stale entries behind; only the live one counts.
  if (const auto it = keys_.find(front.key); it != keys_.end() && it->second == front.sequence) {
    keys_.erase(it);
  }
  order_.pop_front();
}

void InMemoryDedupStore::PurgeLocked(Clock::time_point now) {
  while (!order_.empty() && now - order_.front().inserted_at >= ttl_) {
    DropFrontLocked();
  }
}

bool InMemoryDedupStore::InsertIfAbsent(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = Clock::now();
  PurgeLocked(now);
  if (keys_.count(key) != 0) {
    return false;
  }
  const auto sequence = next_sequence_++;
  keys_.emplace(key, sequence);
  order_.push_back(Entry{key, sequence, now});
  while (keys_.size() > capacity_ && !order_.empty()) {
    DropFrontLocked();
  }
  return true;
}

void InMemoryDedupStore::Erase(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_.erase(key);
}

std::size_t InMemoryDedupStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return keys_.size();
}

PostgresDedupStore::PostgresDedupStore(std::shared_ptr<PostgresConfig> config) : config_(std::move(config)) {
  if (!config_) {
    throw std::invalid_argument("postgres config must not be null");
  }
}

void PostgresDedupStore::EnsureSchema() const {
  config_->InTransaction([](pqxx::work &txn) {
    txn.exec(
        "create table if not exists webhook_deliveries ("
        " dedup_key text primary key,"
        " received_at timestamptz not null default now())");
    return txn.exec("create index if not exists webhook_deliveries_received_at on webhook_deliveries(received_at)");
  });
}

bool PostgresDedupStore::InsertIfAbsent(const std::string &key) {
  // A lost connection may have committed the insert before failing; the retry then sees a
  // conflict and the delivery counts as a duplicate, which is the safe side.
  const auto result = config_->InTransaction([&key](pqxx::work &txn) {
    return txn.exec_params("insert into webhook_deliveries(dedup_key) values ($1) on conflict do nothing", key);
  });
  return result.affected_rows() == 1;
}

void PostgresDedupStore::Erase(const std::string &key) {
  config_->InTransaction([&key](pqxx::work &txn) {
    return txn.exec_params("delete from webhook_deliveries where dedup_key = $1", key);
  });
}

std::size_t PostgresDedupStore::Evict(std::chrono::seconds older_than) const {
  const auto result = config_->InTransaction([older_than](pqxx::work &txn) {
    return txn.exec_params(
        "delete from webhook_deliveries where received_at < now() - ($1::bigint * interval '1 second')",
        static_cast<long long>(older_than.count()));
  });
  return static_cast<std::size_t>(result.affected_rows());
}

}  // namespace converthub::persistence
