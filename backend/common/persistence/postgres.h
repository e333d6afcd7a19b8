#ifndef CONVERTHUB_CLIENT_PERSISTENCE_POSTGRES_H
#define CONVERTHUB_CLIENT_PERSISTENCE_POSTGRES_H

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include <pqxx/pqxx>

namespace converthub::persistence {

// Connection settings for the shared delivery record. Every connection carries the
// service name as application_name and a bounded connect timeout.
class PostgresConfig {
 public:
  explicit PostgresConfig(std::string conninfo, std::string application_name = "converthub",
                          std::chrono::seconds connect_timeout = std::chrono::seconds(5));

  const std::string &ConnInfo() const;
  pqxx::connection Connect() const;

  // Runs `fn` inside one transaction and commits it. A connection lost before the
  // commit is retried once on a fresh connection; statements must be idempotent.
  template <typename Fn>
  auto InTransaction(Fn &&fn) const {
    for (int attempt = 0;; ++attempt) {
      try {
        pqxx::connection conn = Connect();
        pqxx::work txn(conn);
        auto result = fn(txn);
        txn.commit();
        return result;
      } catch (const pqxx::broken_connection &) {
        if (attempt > 0) {
          throw;
        }
      }
    }
  }

 private:
  std::string conninfo_;
};

// Reads the connection string from `env_var`; an unset or empty variable falls back to `default_url`.
std::shared_ptr<PostgresConfig> MakePostgresConfigFromEnv(const std::string &env_var,
                                                          const std::string &default_url,
                                                          const std::string &application_name = "converthub");

}  // namespace converthub::persistence

#endif  // CONVERTHUB_CLIENT_PERSISTENCE_POSTGRES_H
